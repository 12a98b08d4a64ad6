// Copyright 2025-2026 NVIDIA Corporation
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "sgx/core/scene/Image.hpp"
// std
#include <cstddef>
#include <string>

namespace sgx::io {

// Turns encoded image bytes (PNG, JPEG, ...) into pixels
struct ImageDecoder
{
  virtual ~ImageDecoder() = default;

  // Returns nullptr if the data cannot be decoded
  virtual core::ImagePtr decode(const std::byte *data,
      size_t size,
      const std::string &mimeType) const = 0;
};

// Decoder backed by stb_image, decodes to 8 bits per channel
struct StbImageDecoder : public ImageDecoder
{
  core::ImagePtr decode(const std::byte *data,
      size_t size,
      const std::string &mimeType) const override;
};

} // namespace sgx::io
