// Copyright 2024-2026 NVIDIA Corporation
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "sgx/core/scene/Geometry.hpp"
#include "sgx/core/scene/SceneGraph.hpp"

namespace sgx::core {

// Everything needed to construct a Scene: named geometry, the transform
// edges which instance it, and the name of the root frame
struct SceneDescription
{
  FlatMap<std::string, TriangleMeshPtr> geometry;
  std::vector<GraphEdge> graph;
  std::string baseFrame{"world"};
};

struct Scene
{
  Scene() = default;
  explicit Scene(const SceneDescription &description);

  // Add geometry instanced by a new frame under 'parent' (the base frame if
  // empty). Returns the name the geometry was stored under, made unique by
  // suffixing '_<n>' when 'name' is taken.
  std::string addGeometry(GeometryPtr geometry,
      std::string name = {},
      const math::mat4 &transform = math::IDENTITY_MAT4,
      const std::string &parent = {});

  FlatMap<std::string, GeometryPtr> &geometry();
  const FlatMap<std::string, GeometryPtr> &geometry() const;

  SceneGraph &graph();
  const SceneGraph &graph() const;

 private:
  std::string uniqueGeometryName(const std::string &name) const;
  std::string uniqueFrameName(const std::string &name) const;

  // Data //

  FlatMap<std::string, GeometryPtr> m_geometry;
  SceneGraph m_graph;
};

} // namespace sgx::core
