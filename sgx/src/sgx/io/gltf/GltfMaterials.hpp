// Copyright 2025-2026 NVIDIA Corporation
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "sgx/core/scene/Material.hpp"
#include "sgx/io/ImageDecoder.hpp"
#include "sgx/io/gltf/GltfOptions.hpp"
#include "sgx/io/gltf/GltfTypes.hpp"
// nlohmann
#include <nlohmann/json.hpp>
// std
#include <optional>
#include <vector>

namespace sgx::io::gltf {

// A GLTF material split into plain values and resolved texture images
struct MaterialFields
{
  nlohmann::json scalars = nlohmann::json::object();
  core::FlatMap<std::string, core::ImagePtr> textures;
};

// Hoist the members of 'pbrMetallicRoughness' to the top level
nlohmann::json flattenMaterial(const nlohmann::json &material);

// Sort flattened fields into scalars and texture references; texture
// references resolve textures[index].source to a decoded image. Object
// valued fields without an 'index' are dropped.
MaterialFields splitMaterialFields(const nlohmann::json &flattened,
    const nlohmann::json &document,
    const std::vector<core::ImagePtr> &images);

core::PBRMaterialPtr makeMaterial(const MaterialFields &fields);

// Decode every entry of 'images' once; slots which fail stay null. Images
// are read from a bufferView or, for directory exports, from 'files' by uri.
std::vector<core::ImagePtr> decodeImages(const nlohmann::json &document,
    const std::vector<core::ByteBuffer> &views,
    const ImageDecoder &decoder,
    const FileMap *files = nullptr);

// All materials of 'document' in index order; std::nullopt when no decoder
// is available and materials have to be skipped
std::optional<std::vector<core::PBRMaterialPtr>> parseMaterials(
    const nlohmann::json &document,
    const std::vector<core::ByteBuffer> &views,
    const ImageDecoder *decoder,
    const FileMap *files = nullptr);

// Export direction //

nlohmann::json materialToGLTF(const core::PBRMaterial &material);
// Flat material of a single color, metallic and roughness set to zero
nlohmann::json colorToGLTF(const math::ubyte4 &color);
// Material assigned to line primitives
nlohmann::json defaultMaterial();

} // namespace sgx::io::gltf
