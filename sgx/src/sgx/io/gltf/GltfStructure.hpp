// Copyright 2025-2026 NVIDIA Corporation
// SPDX-License-Identifier: Apache-2.0

#pragma once

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

// A 4-byte aligned blob destined for its own bufferView
struct BufferItem
{
  core::ByteBuffer bytes;
  size_t byteLength{0}; // unpadded length
  std::string owner; // name of the geometry which produced it
};

// Incrementally builds the GLTF document tree for an export. Every append
// returns the index it assigned, so references between sections are always
// taken from the builder rather than computed by the caller.
struct DocumentBuilder
{
  explicit DocumentBuilder(ExportOptions options = {});

  size_t appendBufferItem(core::ByteBuffer bytes, const std::string &owner);
  size_t appendAccessor(nlohmann::json accessor);
  size_t appendMesh(nlohmann::json mesh);
  // Identical materials share one index
  size_t appendMaterial(const nlohmann::json &material);

  // Append a triangle mesh or path, returns the mesh index or std::nullopt
  // if the geometry has nothing to export
  std::optional<size_t> appendGeometry(
      const std::string &name, const core::Geometry &geometry);
  std::optional<size_t> appendTriangleMesh(
      const std::string &name, const core::TriangleMesh &mesh);
  std::optional<size_t> appendPath(
      const std::string &name, const core::Path &path);

  void setNodes(nlohmann::json nodes);

  // Finish as a single buffer for GLB; returns the concatenated payload
  core::ByteBuffer finalizeGLB();
  // Finish as one external buffer per geometry; returns the .bin files
  FileMap finalizeDirectory();

  const nlohmann::json &document() const;
  const std::vector<BufferItem> &bufferItems() const;

 private:
  size_t appendFloats(
      const float *data, size_t count, const std::string &owner);
  void finalizeCommon();

  // Data //

  ExportOptions m_options;
  nlohmann::json m_tree;
  std::vector<BufferItem> m_items;
};

} // namespace sgx::io::gltf
