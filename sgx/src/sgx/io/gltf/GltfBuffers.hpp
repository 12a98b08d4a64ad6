// Copyright 2025-2026 NVIDIA Corporation
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "sgx/core/Array.hpp"
#include "sgx/core/scene/Scene.hpp"
#include "sgx/io/gltf/GltfOptions.hpp"
#include "sgx/io/gltf/GltfTypes.hpp"
// nlohmann
#include <nlohmann/json.hpp>
// std
#include <optional>
#include <string>
#include <vector>

namespace sgx::io::gltf {

// Byte slice of every bufferView, in index order
std::vector<core::ByteBuffer> resolveBufferViews(
    const nlohmann::json &document,
    const std::vector<core::ByteBuffer> &buffers);

// Typed array of every accessor, in index order. Interleaved bufferViews
// (byteStride larger than the element) are compacted.
std::vector<core::Array> resolveAccessors(
    const nlohmann::json &document, const std::vector<core::ByteBuffer> &views);

struct MeshAssembly
{
  core::FlatMap<std::string, core::TriangleMeshPtr> geometry;
  // GLTF mesh index -> names of the geometry generated from its primitives
  std::vector<std::vector<std::string>> meshGeometry;
};

// Build one triangle mesh per triangle primitive. 'materials' is
// std::nullopt when materials were skipped.
MeshAssembly assembleMeshes(const nlohmann::json &document,
    const std::vector<core::Array> &accessors,
    const std::optional<std::vector<core::PBRMaterialPtr>> &materials,
    const ImportOptions &options);

} // namespace sgx::io::gltf
