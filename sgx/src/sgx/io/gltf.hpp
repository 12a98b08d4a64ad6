// Copyright 2025-2026 NVIDIA Corporation
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "sgx/core/scene/Scene.hpp"
#include "sgx/io/ImageDecoder.hpp"
#include "sgx/io/gltf/GltfOptions.hpp"
#include "sgx/io/gltf/GltfTypes.hpp"
// std
#include <string>

namespace sgx::io {

// Export //

// Binary GLB container holding the document and a single buffer
core::ByteBuffer export_GLB(
    const core::Scene &scene, const ExportOptions &options = {});

// '<options.gltfFileName>' (JSON text) plus one '<prefix><geometry>.bin'
// buffer file per exported geometry
FileMap export_GLTF(
    const core::Scene &scene, const ExportOptions &options = {});

// Import //

// All functions throw FormatError on malformed input
core::SceneDescription load_GLB(
    const core::ByteBuffer &bytes, const ImportOptions &options = {});

core::SceneDescription load_GLTF(const FileMap &files,
    const ImportOptions &options = {},
    const std::string &rootFile = "model.gltf");

// Read a .glb or .gltf (+ sibling files) from disk
core::SceneDescription import_GLTF(
    const char *filename, const ImportOptions &options = {});

} // namespace sgx::io
