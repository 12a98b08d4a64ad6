// Copyright 2024-2026 NVIDIA Corporation
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "sgx/core/Math.hpp"
// std
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace sgx::core {

// 8-bit per channel image with 1 (grey), 2 (grey+alpha), 3 (RGB) or
// 4 (RGBA) interleaved channels, rows stored top to bottom
struct Image
{
  Image() = default;
  Image(int width, int height, int channels);

  int width() const;
  int height() const;
  int channels() const;
  bool isEmpty() const;

  std::vector<uint8_t> &pixels();
  const std::vector<uint8_t> &pixels() const;

  // Pixel (x, y) expanded to RGBA
  math::ubyte4 pixel(int x, int y) const;

  // Nearest texel for texture coordinate (u, v), origin at the lower-left
  // corner of the image, wrapping outside of [0, 1]
  math::ubyte4 texel(float u, float v) const;

  std::string name;
  std::string mimeType;

 private:
  int m_width{0};
  int m_height{0};
  int m_channels{0};
  std::vector<uint8_t> m_pixels;
};

using ImagePtr = std::shared_ptr<Image>;

} // namespace sgx::core
