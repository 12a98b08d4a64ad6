// Copyright 2024-2026 NVIDIA Corporation
// SPDX-License-Identifier: Apache-2.0

#include "sgx/core/scene/Geometry.hpp"
// fmt
#include <fmt/format.h>
// std
#include <algorithm>
#include <array>
#include <limits>
#include <map>
#include <stdexcept>

namespace sgx::core {

// TriangleMesh definitions ///////////////////////////////////////////////////

Geometry::Kind TriangleMesh::kind() const
{
  return Kind::TRIANGLE_MESH;
}

size_t TriangleMesh::numVertices() const
{
  return vertices.size();
}

size_t TriangleMesh::numFaces() const
{
  return faces.size();
}

bool TriangleMesh::hasVertexColors() const
{
  return !vertexColors.empty();
}

bool TriangleMesh::hasTexture() const
{
  return material && material->baseColorTexture && !uv.empty();
}

math::ubyte4 TriangleMesh::mainColor() const
{
  if (hasVertexColors()) {
    // ties resolve to the lexicographically smallest color
    std::map<std::array<uint8_t, 4>, size_t> counts;
    for (const auto &c : vertexColors)
      counts[{c.x, c.y, c.z, c.w}]++;

    auto best = counts.begin();
    for (auto itr = counts.begin(); itr != counts.end(); ++itr) {
      if (itr->second > best->second)
        best = itr;
    }

    const auto &c = best->first;
    return math::ubyte4(c[0], c[1], c[2], c[3]);
  }

  if (material)
    return material->mainColor();

  return DEFAULT_COLOR;
}

std::vector<math::float3> TriangleMesh::vertexNormals() const
{
  if (normals.size() == vertices.size())
    return normals;

  std::vector<math::float3> retval(vertices.size(), math::float3(0.f));

  for (const auto &f : faces) {
    if (f.x >= vertices.size() || f.y >= vertices.size()
        || f.z >= vertices.size()) {
      throw std::out_of_range(
          fmt::format("face index out of range in mesh '{}'", name));
    }

    const auto &a = vertices[f.x];
    const auto &b = vertices[f.y];
    const auto &c = vertices[f.z];
    // cross product magnitude is twice the face area
    const auto n = linalg::cross(b - a, c - a);
    retval[f.x] += n;
    retval[f.y] += n;
    retval[f.z] += n;
  }

  for (auto &n : retval) {
    const float l = linalg::length(n);
    n = l > 0.f ? n / l : math::float3(0.f, 0.f, 1.f);
  }

  return retval;
}

std::vector<math::ubyte4> TriangleMesh::textureColors() const
{
  std::vector<math::ubyte4> retval(vertices.size(), mainColor());

  if (!hasTexture())
    return retval;

  const auto &image = *material->baseColorTexture;
  const auto factor = material->baseColorFactor;
  const size_t n = std::min(uv.size(), vertices.size());

  for (size_t i = 0; i < n; i++) {
    const auto t = toColorF(image.texel(uv[i].x, uv[i].y));
    retval[i] = toColor8(t * factor);
  }

  return retval;
}

void TriangleMesh::toColor()
{
  if (!hasTexture())
    return;
  vertexColors = textureColors();
  uv.clear();
  material.reset();
}

std::pair<math::float3, math::float3> TriangleMesh::bounds() const
{
  if (vertices.empty())
    return {math::float3(0.f), math::float3(0.f)};

  math::float3 lo(std::numeric_limits<float>::max());
  math::float3 hi(std::numeric_limits<float>::lowest());
  for (const auto &v : vertices) {
    lo = linalg::min(lo, v);
    hi = linalg::max(hi, v);
  }
  return {lo, hi};
}

uint32_t TriangleMesh::maxIndex() const
{
  uint32_t retval = 0;
  for (const auto &f : faces)
    retval = std::max({retval, f.x, f.y, f.z});
  return retval;
}

// Path definitions ///////////////////////////////////////////////////////////

Geometry::Kind Path::kind() const
{
  return Kind::PATH;
}

std::vector<math::float3> Path::toLineList() const
{
  std::vector<math::float3> retval;

  for (const auto &entity : entities) {
    for (size_t i = 1; i < entity.size(); i++) {
      const auto a = entity[i - 1];
      const auto b = entity[i];
      if (a >= vertices.size() || b >= vertices.size()) {
        throw std::out_of_range(
            fmt::format("path '{}' references vertex {} of {}",
                name,
                std::max(a, b),
                vertices.size()));
      }
      retval.push_back(vertices[a]);
      retval.push_back(vertices[b]);
    }
  }

  return retval;
}

const char *toString(Geometry::Kind kind)
{
  switch (kind) {
  case Geometry::Kind::TRIANGLE_MESH:
    return "triangle mesh";
  case Geometry::Kind::PATH:
    return "path";
  default:
    break;
  }
  return "unknown";
}

} // namespace sgx::core
