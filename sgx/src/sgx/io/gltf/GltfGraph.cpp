// Copyright 2025-2026 NVIDIA Corporation
// SPDX-License-Identifier: Apache-2.0

#include "sgx/io/gltf/GltfGraph.hpp"
#include "sgx/core/Logging.hpp"
// fmt
#include <fmt/format.h>
// std
#include <deque>
#include <unordered_map>
#include <utility>

namespace sgx::io::gltf {

using namespace sgx::core;
using namespace sgx::math;

static uint64_t splitmix64(uint64_t x)
{
  x += 0x9E3779B97F4A7C15ull;
  x = (x ^ (x >> 30)) * 0xBF58476D1CE4E5B9ull;
  x = (x ^ (x >> 27)) * 0x94D049BB133111EBull;
  return x ^ (x >> 31);
}

// UniqueNameGenerator definitions ////////////////////////////////////////////

UniqueNameGenerator::UniqueNameGenerator(uint64_t seed) : m_seed(seed) {}

void UniqueNameGenerator::reserve(const std::string &name)
{
  m_taken.insert(name);
}

bool UniqueNameGenerator::isTaken(const std::string &name) const
{
  return m_taken.count(name) != 0;
}

std::string UniqueNameGenerator::next(const std::string &prefix)
{
  static const char DIGITS[] = "0123456789ABCDEFGHIJKLMNOPQRSTUVWXYZ";

  while (true) {
    uint64_t v = nextValue();
    std::string suffix(6, '0');
    for (auto &c : suffix) {
      c = DIGITS[v % 36];
      v /= 36;
    }

    auto name = prefix + "_" + suffix;
    if (!isTaken(name)) {
      reserve(name);
      return name;
    }
  }
}

std::string UniqueNameGenerator::nextNumeric()
{
  while (true) {
    auto name = std::to_string(nextValue() % 10000000000ull);
    if (!isTaken(name)) {
      reserve(name);
      return name;
    }
  }
}

uint64_t UniqueNameGenerator::nextValue()
{
  return splitmix64(m_seed + 0x9E3779B97F4A7C15ull * ++m_counter);
}

///////////////////////////////////////////////////////////////////////////////
// Export /////////////////////////////////////////////////////////////////////
///////////////////////////////////////////////////////////////////////////////

nlohmann::json flattenGraph(
    const SceneGraph &graph, const FlatMap<std::string, size_t> &meshIndex)
{
  std::unordered_map<std::string, std::vector<const GraphEdge *>> children;
  for (const auto &e : graph.edges())
    children[e.frameFrom].push_back(&e);

  auto nodes = nlohmann::json::array();
  nodes.push_back({{"name", graph.baseFrame()}});

  std::deque<std::pair<size_t, std::string>> queue;
  queue.emplace_back(0, graph.baseFrame());

  while (!queue.empty()) {
    const auto [parentIndex, frame] = queue.front();
    queue.pop_front();

    auto itr = children.find(frame);
    if (itr == children.end())
      continue;

    for (const auto *edge : itr->second) {
      const size_t index = nodes.size();

      nlohmann::json node = {{"name", edge->frameTo}};

      if (!isIdentity(edge->matrix)) {
        auto matrix = nlohmann::json::array();
        for (int c = 0; c < 4; c++) {
          for (int r = 0; r < 4; r++)
            matrix.push_back(edge->matrix[c][r]);
        }
        node["matrix"] = std::move(matrix);
      }

      if (edge->geometry) {
        if (const auto *mesh = meshIndex.find(*edge->geometry); mesh)
          node["mesh"] = *mesh;
      }

      nodes.push_back(std::move(node));
      nodes[parentIndex]["children"].push_back(index);
      queue.emplace_back(index, edge->frameTo);
    }
  }

  if (nodes.size() != graph.size() + 1) {
    logWarning("[export_GLTF] %zu frame(s) not connected to '%s' were dropped",
        graph.size() + 1 - nodes.size(),
        graph.baseFrame().c_str());
  }

  return nodes;
}

///////////////////////////////////////////////////////////////////////////////
// Import /////////////////////////////////////////////////////////////////////
///////////////////////////////////////////////////////////////////////////////

static size_t nodeIndex(const nlohmann::json &value, const char *what)
{
  if (!value.is_number_integer() || value.get<int64_t>() < 0)
    throw FormatError(fmt::format("{} must be a non-negative integer", what));
  return value.get<size_t>();
}

static mat4 nodeTransform(const nlohmann::json &node, bool composeTRS)
{
  auto numbers = [&](const char *key, size_t n) -> const nlohmann::json * {
    if (!node.contains(key))
      return nullptr;
    const auto &v = node[key];
    if (!v.is_array() || v.size() != n)
      throw FormatError(fmt::format("node '{}' must have {} numbers", key, n));
    for (const auto &x : v) {
      if (!x.is_number())
        throw FormatError(
            fmt::format("node '{}' must have {} numbers", key, n));
    }
    return &v;
  };

  if (const auto *m = numbers("matrix", 16); m) {
    // column-major storage matches mat4 column order
    mat4 transform;
    for (int c = 0; c < 4; c++) {
      for (int r = 0; r < 4; r++)
        transform[c][r] = (*m)[c * 4 + r].get<float>();
    }
    return transform;
  }

  if (!composeTRS)
    return IDENTITY_MAT4;

  mat4 translation = IDENTITY_MAT4;
  mat4 rotation = IDENTITY_MAT4;
  mat4 scale = IDENTITY_MAT4;

  if (const auto *t = numbers("translation", 3); t) {
    translation = translation_matrix(float3((*t)[0].get<float>(),
        (*t)[1].get<float>(),
        (*t)[2].get<float>()));
  }

  if (const auto *q = numbers("rotation", 4); q) {
    // Quaternion (x, y, z, w) to matrix conversion
    rotation = rotation_matrix(float4((*q)[0].get<float>(),
        (*q)[1].get<float>(),
        (*q)[2].get<float>(),
        (*q)[3].get<float>()));
  }

  if (const auto *s = numbers("scale", 3); s) {
    scale = scaling_matrix(float3((*s)[0].get<float>(),
        (*s)[1].get<float>(),
        (*s)[2].get<float>()));
  }

  return mul(translation, mul(rotation, scale));
}

GraphReconstruction reconstructGraph(const nlohmann::json &document,
    const std::vector<std::vector<std::string>> &meshGeometry,
    const ImportOptions &options)
{
  GraphReconstruction retval;
  UniqueNameGenerator names(options.nameSeed);

  static const nlohmann::json EMPTY = nlohmann::json::array();
  const auto &nodes = document.contains("nodes") ? document["nodes"] : EMPTY;
  if (!nodes.is_array())
    throw FormatError("'nodes' must be an array");

  // node index -> frame name //

  std::vector<std::string> frameNames(nodes.size());
  for (size_t i = 0; i < nodes.size(); i++) {
    if (!nodes[i].is_object())
      throw FormatError(fmt::format("node {} is not an object", i));

    auto name = nodes[i].contains("name") && nodes[i]["name"].is_string()
        ? nodes[i]["name"].get<std::string>()
        : std::to_string(i);

    if (names.isTaken(name)) {
      auto renamed = name + "_" + std::to_string(i);
      for (size_t n = 1; names.isTaken(renamed); n++)
        renamed = name + "_" + std::to_string(i) + "_" + std::to_string(n);
      logWarning("[load_GLTF] duplicate node name '%s' renamed to '%s'",
          name.c_str(),
          renamed.c_str());
      name = renamed;
    }

    names.reserve(name);
    frameNames[i] = std::move(name);
  }

  // base frame //

  retval.baseFrame = "world";
  if (names.isTaken(retval.baseFrame))
    retval.baseFrame = names.nextNumeric();
  else
    names.reserve(retval.baseFrame);

  // default scene roots //

  if (!document.contains("scenes") || !document["scenes"].is_array()
      || document["scenes"].empty()) {
    if (!nodes.empty())
      logWarning("[load_GLTF] no scenes found, node hierarchy ignored");
    return retval;
  }

  const auto &scenes = document["scenes"];
  const size_t sceneIndex =
      document.contains("scene") ? nodeIndex(document["scene"], "scene") : 0;
  if (sceneIndex >= scenes.size())
    throw FormatError(
        fmt::format("default scene {} does not exist", sceneIndex));

  // (parent frame, child node) pairs, processed last in first out
  std::vector<std::pair<std::string, size_t>> stack;

  const auto &scene = scenes[sceneIndex];
  if (scene.contains("nodes")) {
    for (const auto &root : scene["nodes"])
      stack.emplace_back(retval.baseFrame, nodeIndex(root, "scene node"));
  }

  std::vector<bool> visited(nodes.size(), false);

  while (!stack.empty()) {
    auto [parent, b] = std::move(stack.back());
    stack.pop_back();

    if (b >= nodes.size())
      throw FormatError(fmt::format("node {} does not exist", b));
    if (visited[b]) {
      throw FormatError(
          fmt::format("node {} has more than one parent or forms a cycle", b));
    }
    visited[b] = true;

    const auto &child = nodes[b];
    if (child.contains("children")) {
      if (!child["children"].is_array())
        throw FormatError(fmt::format("node {} children must be an array", b));
      for (const auto &c : child["children"])
        stack.emplace_back(frameNames[b], nodeIndex(c, "child node"));
    }

    GraphEdge edge;
    edge.frameFrom = parent;
    edge.frameTo = frameNames[b];
    edge.matrix = nodeTransform(child, options.composeTRS);
    retval.edges.push_back(edge);

    if (child.contains("mesh")) {
      const auto mesh = nodeIndex(child["mesh"], "node mesh");
      if (mesh >= meshGeometry.size()) {
        throw FormatError(
            fmt::format("node {} references missing mesh {}", b, mesh));
      }

      for (const auto &geometryName : meshGeometry[mesh]) {
        GraphEdge instance = edge;
        instance.geometry = geometryName;
        instance.frameTo = names.next(geometryName);
        retval.edges.push_back(std::move(instance));
      }
    }
  }

  logDebug("[load_GLTF] reconstructed %zu edge(s) under '%s'",
      retval.edges.size(),
      retval.baseFrame.c_str());

  return retval;
}

} // namespace sgx::io::gltf
