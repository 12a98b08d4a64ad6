// Copyright 2025-2026 NVIDIA Corporation
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "sgx/core/scene/SceneGraph.hpp"
#include "sgx/io/gltf/GltfOptions.hpp"
#include "sgx/io/gltf/GltfTypes.hpp"
// nlohmann
#include <nlohmann/json.hpp>
// std
#include <string>
#include <unordered_set>
#include <vector>

namespace sgx::io::gltf {

// Deterministic generator of short uppercase suffixes. The same seed
// always yields the same sequence; suffixes already issued (or reserved)
// are never returned again.
struct UniqueNameGenerator
{
  explicit UniqueNameGenerator(uint64_t seed = 0);

  void reserve(const std::string &name);
  bool isTaken(const std::string &name) const;

  // "<prefix>_<6 chars of [0-9A-Z]>"
  std::string next(const std::string &prefix);
  // Decimal string of up to 10 digits
  std::string nextNumeric();

 private:
  uint64_t nextValue();

  // Data //

  uint64_t m_seed{0};
  uint64_t m_counter{0};
  std::unordered_set<std::string> m_taken;
};

// Node array for 'graph', breadth first from the base frame (node 0).
// Edges whose geometry is in 'meshIndex' get a 'mesh' reference.
nlohmann::json flattenGraph(const core::SceneGraph &graph,
    const core::FlatMap<std::string, size_t> &meshIndex);

struct GraphReconstruction
{
  std::vector<core::GraphEdge> edges;
  std::string baseFrame;
};

// Rebuild the transform edge list from the node hierarchy of the default
// scene. 'meshGeometry' maps each GLTF mesh index to the geometry names it
// produced; every such geometry gets its own uniquely named frame.
GraphReconstruction reconstructGraph(const nlohmann::json &document,
    const std::vector<std::vector<std::string>> &meshGeometry,
    const ImportOptions &options);

} // namespace sgx::io::gltf
