// Copyright 2025-2026 NVIDIA Corporation
// SPDX-License-Identifier: Apache-2.0

#include "sgx/io/ImageDecoder.hpp"
#include "sgx/core/Logging.hpp"
// stb_image
#define STB_IMAGE_IMPLEMENTATION
#include "stb_image.h"
// std
#include <cstring>
#include <limits>
#include <memory>

namespace sgx::io {

using namespace sgx::core;

core::ImagePtr StbImageDecoder::decode(
    const std::byte *data, size_t size, const std::string &mimeType) const
{
  if (data == nullptr || size == 0
      || size > size_t(std::numeric_limits<int>::max())) {
    logError("[StbImageDecoder] invalid image buffer (%zu bytes)", size);
    return {};
  }

  int width = 0, height = 0, n = 0;
  stbi_uc *pixels = stbi_load_from_memory(
      reinterpret_cast<const stbi_uc *>(data),
      int(size),
      &width,
      &height,
      &n,
      0);

  if (!pixels || n < 1 || n > 4) {
    if (!pixels) {
      logError("[StbImageDecoder] failed to decode '%s' image: %s",
          mimeType.c_str(),
          stbi_failure_reason());
    } else {
      logWarning("[StbImageDecoder] image with %i channels not decoded", n);
      stbi_image_free(pixels);
    }
    return {};
  }

  auto image = std::make_shared<Image>(width, height, n);
  image->mimeType = mimeType;
  std::memcpy(image->pixels().data(), pixels, image->pixels().size());

  stbi_image_free(pixels);

  logDebug("[StbImageDecoder] decoded %ix%i image with %i channel(s)",
      width,
      height,
      n);

  return image;
}

} // namespace sgx::io
