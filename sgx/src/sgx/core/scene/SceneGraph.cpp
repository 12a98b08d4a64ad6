// Copyright 2024-2026 NVIDIA Corporation
// SPDX-License-Identifier: Apache-2.0

#include "sgx/core/scene/SceneGraph.hpp"
// fmt
#include <fmt/format.h>
// std
#include <stdexcept>
#include <utility>

namespace sgx::core {

SceneGraph::SceneGraph(std::string baseFrame)
    : m_baseFrame(std::move(baseFrame))
{}

const std::string &SceneGraph::baseFrame() const
{
  return m_baseFrame;
}

void SceneGraph::setBaseFrame(std::string name)
{
  if (m_edgeIndex.count(name) != 0) {
    throw std::invalid_argument(
        fmt::format("'{}' is already the child of another frame", name));
  }
  m_baseFrame = std::move(name);
}

void SceneGraph::update(GraphEdge edge)
{
  if (edge.frameFrom == edge.frameTo) {
    throw std::invalid_argument(
        fmt::format("self referencing edge on frame '{}'", edge.frameTo));
  }

  if (edge.frameTo == m_baseFrame) {
    throw std::invalid_argument(
        fmt::format("base frame '{}' cannot have a parent", m_baseFrame));
  }

  auto itr = m_edgeIndex.find(edge.frameTo);
  if (itr != m_edgeIndex.end()) {
    m_edges[itr->second] = std::move(edge);
    return;
  }

  m_edgeIndex[edge.frameTo] = m_edges.size();
  m_edges.push_back(std::move(edge));
}

void SceneGraph::clear()
{
  m_edges.clear();
  m_edgeIndex.clear();
}

bool SceneGraph::contains(const std::string &frame) const
{
  return frame == m_baseFrame || m_edgeIndex.count(frame) != 0;
}

size_t SceneGraph::size() const
{
  return m_edges.size();
}

const std::vector<GraphEdge> &SceneGraph::edges() const
{
  return m_edges;
}

const GraphEdge *SceneGraph::edgeTo(const std::string &frame) const
{
  auto itr = m_edgeIndex.find(frame);
  return itr == m_edgeIndex.end() ? nullptr : &m_edges[itr->second];
}

std::vector<const GraphEdge *> SceneGraph::children(
    const std::string &frame) const
{
  std::vector<const GraphEdge *> retval;
  for (const auto &e : m_edges) {
    if (e.frameFrom == frame)
      retval.push_back(&e);
  }
  return retval;
}

std::optional<std::string> SceneGraph::parent(const std::string &frame) const
{
  const auto *e = edgeTo(frame);
  if (!e)
    return std::nullopt;
  return e->frameFrom;
}

std::vector<std::string> SceneGraph::nodesWithGeometry() const
{
  std::vector<std::string> retval;
  for (const auto &e : m_edges) {
    if (e.geometry)
      retval.push_back(e.frameTo);
  }
  return retval;
}

math::mat4 SceneGraph::worldTransform(const std::string &frame) const
{
  math::mat4 retval = math::IDENTITY_MAT4;
  std::string current = frame;

  // a tree has at most size() edges between any frame and the root
  for (size_t steps = 0; current != m_baseFrame; steps++) {
    const auto *e = edgeTo(current);
    if (!e) {
      throw std::out_of_range(fmt::format(
          "frame '{}' is not connected to '{}'", frame, m_baseFrame));
    }
    if (steps > m_edges.size())
      throw std::logic_error("cycle detected in scene graph");
    retval = math::mul(e->matrix, retval);
    current = e->frameFrom;
  }

  return retval;
}

} // namespace sgx::core
