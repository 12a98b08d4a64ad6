// Copyright 2024-2026 NVIDIA Corporation
// SPDX-License-Identifier: Apache-2.0

#include "sgx/core/scene/Material.hpp"
// std
#include <algorithm>
#include <cmath>

namespace sgx::core {

bool PBRMaterial::hasTextures() const
{
  return baseColorTexture || metallicRoughnessTexture || normalTexture
      || occlusionTexture || emissiveTexture;
}

math::ubyte4 PBRMaterial::mainColor() const
{
  return toColor8(baseColorFactor);
}

math::ubyte4 toColor8(const math::float4 &c)
{
  auto channel = [](float v) {
    return uint8_t(std::lround(std::clamp(v, 0.f, 1.f) * 255.f));
  };
  return math::ubyte4(channel(c.x), channel(c.y), channel(c.z), channel(c.w));
}

math::float4 toColorF(const math::ubyte4 &c)
{
  return math::float4(c.x / 255.f, c.y / 255.f, c.z / 255.f, c.w / 255.f);
}

} // namespace sgx::core
