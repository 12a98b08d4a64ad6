// Copyright 2024-2026 NVIDIA Corporation
// SPDX-License-Identifier: Apache-2.0

#include "sgx/core/scene/Scene.hpp"
#include "sgx/core/Logging.hpp"
// std
#include <stdexcept>
#include <utility>

namespace sgx::core {

Scene::Scene(const SceneDescription &d)
{
  m_graph.setBaseFrame(d.baseFrame);

  for (const auto &g : d.geometry) {
    if (!g.second)
      continue;
    m_geometry[g.first] = g.second;
  }

  for (const auto &e : d.graph) {
    if (e.geometry && !m_geometry.contains(*e.geometry)) {
      logWarning("[Scene] edge '%s' -> '%s' references unknown geometry '%s'",
          e.frameFrom.c_str(),
          e.frameTo.c_str(),
          e.geometry->c_str());
    }
    m_graph.update(e);
  }
}

std::string Scene::addGeometry(GeometryPtr geometry,
    std::string name,
    const math::mat4 &transform,
    const std::string &parent)
{
  if (!geometry)
    throw std::invalid_argument("cannot add null geometry to scene");

  if (name.empty())
    name = geometry->name.empty() ? "geometry" : geometry->name;
  name = uniqueGeometryName(name);
  geometry->name = name;

  const std::string &from = parent.empty() ? m_graph.baseFrame() : parent;
  if (!m_graph.contains(from)) {
    throw std::invalid_argument(
        "parent frame '" + from + "' does not exist in the scene graph");
  }

  GraphEdge edge;
  edge.frameFrom = from;
  edge.frameTo = uniqueFrameName(name);
  edge.matrix = transform;
  edge.geometry = name;

  m_geometry[name] = std::move(geometry);
  m_graph.update(std::move(edge));

  return name;
}

FlatMap<std::string, GeometryPtr> &Scene::geometry()
{
  return m_geometry;
}

const FlatMap<std::string, GeometryPtr> &Scene::geometry() const
{
  return m_geometry;
}

SceneGraph &Scene::graph()
{
  return m_graph;
}

const SceneGraph &Scene::graph() const
{
  return m_graph;
}

std::string Scene::uniqueGeometryName(const std::string &name) const
{
  if (!m_geometry.contains(name))
    return name;
  for (size_t i = 1;; i++) {
    auto candidate = name + "_" + std::to_string(i);
    if (!m_geometry.contains(candidate))
      return candidate;
  }
}

std::string Scene::uniqueFrameName(const std::string &name) const
{
  if (!m_graph.contains(name))
    return name;
  for (size_t i = 1;; i++) {
    auto candidate = name + "_" + std::to_string(i);
    if (!m_graph.contains(candidate))
      return candidate;
  }
}

} // namespace sgx::core
