// Copyright 2024-2026 NVIDIA Corporation
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "sgx/core/scene/Image.hpp"
// std
#include <memory>
#include <string>

namespace sgx::core {

// Metallic-roughness PBR material, field names follow GLTF
struct PBRMaterial
{
  std::string name;

  math::float4 baseColorFactor{1.f, 1.f, 1.f, 1.f};
  float metallicFactor{1.f};
  float roughnessFactor{1.f};
  math::float3 emissiveFactor{0.f, 0.f, 0.f};
  std::string alphaMode{"OPAQUE"};
  float alphaCutoff{0.5f};
  bool doubleSided{false};

  ImagePtr baseColorTexture;
  ImagePtr metallicRoughnessTexture;
  ImagePtr normalTexture;
  ImagePtr occlusionTexture;
  ImagePtr emissiveTexture;

  bool hasTextures() const;

  // Base color as 8-bit RGBA
  math::ubyte4 mainColor() const;
};

using PBRMaterialPtr = std::shared_ptr<PBRMaterial>;

// Convert a normalized color to 8-bit, clamping to [0, 1]
math::ubyte4 toColor8(const math::float4 &c);
math::float4 toColorF(const math::ubyte4 &c);

} // namespace sgx::core
