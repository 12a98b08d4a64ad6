// Copyright 2024-2026 NVIDIA Corporation
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "sgx/core/Math.hpp"
// std
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace sgx::core {

// Parent -> child transform, optionally instancing a named geometry
struct GraphEdge
{
  std::string frameFrom;
  std::string frameTo;
  math::mat4 matrix{math::IDENTITY_MAT4};
  std::optional<std::string> geometry;
};

// Transform tree of named frames rooted at a base frame. Every frame other
// than the base frame is the 'frameTo' of exactly one edge.
struct SceneGraph
{
  explicit SceneGraph(std::string baseFrame = "world");

  const std::string &baseFrame() const;
  void setBaseFrame(std::string name);

  // Insert the edge, replacing any existing edge ending at edge.frameTo
  void update(GraphEdge edge);
  void clear();

  bool contains(const std::string &frame) const;
  size_t size() const;

  const std::vector<GraphEdge> &edges() const;
  const GraphEdge *edgeTo(const std::string &frame) const;
  std::vector<const GraphEdge *> children(const std::string &frame) const;
  std::optional<std::string> parent(const std::string &frame) const;

  // Frames whose incoming edge references a geometry
  std::vector<std::string> nodesWithGeometry() const;

  // Transform from the base frame to 'frame'
  math::mat4 worldTransform(const std::string &frame) const;

 private:
  // Data //

  std::string m_baseFrame;
  std::vector<GraphEdge> m_edges;
  std::unordered_map<std::string, size_t> m_edgeIndex; // frameTo -> edge
};

} // namespace sgx::core
