// Copyright 2024-2026 NVIDIA Corporation
// SPDX-License-Identifier: Apache-2.0

#include "sgx/core/scene/Image.hpp"
// fmt
#include <fmt/format.h>
// std
#include <cmath>
#include <stdexcept>

namespace sgx::core {

static int wrapIndex(long i, int size)
{
  const long m = i % size;
  return int(m < 0 ? m + size : m);
}

Image::Image(int width, int height, int channels)
    : m_width(width), m_height(height), m_channels(channels)
{
  if (width < 0 || height < 0 || channels < 1 || channels > 4) {
    throw std::invalid_argument(fmt::format(
        "invalid image shape {}x{}x{}", width, height, channels));
  }
  m_pixels.resize(size_t(width) * size_t(height) * size_t(channels), 0);
}

int Image::width() const
{
  return m_width;
}

int Image::height() const
{
  return m_height;
}

int Image::channels() const
{
  return m_channels;
}

bool Image::isEmpty() const
{
  return m_width == 0 || m_height == 0;
}

std::vector<uint8_t> &Image::pixels()
{
  return m_pixels;
}

const std::vector<uint8_t> &Image::pixels() const
{
  return m_pixels;
}

math::ubyte4 Image::pixel(int x, int y) const
{
  const auto *p =
      m_pixels.data() + (size_t(y) * size_t(m_width) + size_t(x)) * m_channels;

  switch (m_channels) {
  case 1:
    return math::ubyte4(p[0], p[0], p[0], 255);
  case 2:
    return math::ubyte4(p[0], p[0], p[0], p[1]);
  case 3:
    return math::ubyte4(p[0], p[1], p[2], 255);
  default:
    break;
  }

  return math::ubyte4(p[0], p[1], p[2], p[3]);
}

math::ubyte4 Image::texel(float u, float v) const
{
  if (isEmpty())
    return math::ubyte4(0, 0, 0, 0);

  const long x = std::lround(double(u) * (m_width - 1));
  const long y = std::lround((1.0 - double(v)) * (m_height - 1));
  return pixel(wrapIndex(x, m_width), wrapIndex(y, m_height));
}

} // namespace sgx::core
