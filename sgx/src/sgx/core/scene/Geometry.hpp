// Copyright 2024-2026 NVIDIA Corporation
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "sgx/core/FlatMap.hpp"
#include "sgx/core/scene/Material.hpp"
// std
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace sgx::core {

struct Geometry
{
  enum class Kind
  {
    TRIANGLE_MESH,
    PATH
  };

  virtual ~Geometry() = default;
  virtual Kind kind() const = 0;

  std::string name;
  std::optional<std::string> units;
  FlatMap<std::string, std::string> metadata;
};

using GeometryPtr = std::shared_ptr<Geometry>;

///////////////////////////////////////////////////////////////////////////////
// TriangleMesh ///////////////////////////////////////////////////////////////
///////////////////////////////////////////////////////////////////////////////

struct TriangleMesh : public Geometry
{
  static constexpr math::ubyte4 DEFAULT_COLOR{102, 102, 102, 255};

  Kind kind() const override;

  size_t numVertices() const;
  size_t numFaces() const;

  bool hasVertexColors() const;
  bool hasTexture() const;

  // Most frequent vertex color, the material base color, or DEFAULT_COLOR
  math::ubyte4 mainColor() const;

  // Explicit normals if set, otherwise area weighted face normals
  std::vector<math::float3> vertexNormals() const;

  // Per-vertex colors sampled from the base color texture
  std::vector<math::ubyte4> textureColors() const;
  // Replace texture visuals with per-vertex colors
  void toColor();

  // Per-axis (min, max) of the vertex positions
  std::pair<math::float3, math::float3> bounds() const;
  uint32_t maxIndex() const;

  // Data //

  std::vector<math::float3> vertices;
  std::vector<math::uint3> faces;
  std::vector<math::ubyte4> vertexColors;
  std::vector<math::float3> normals;
  std::vector<math::float2> uv;
  PBRMaterialPtr material;
};

using TriangleMeshPtr = std::shared_ptr<TriangleMesh>;

///////////////////////////////////////////////////////////////////////////////
// Path ///////////////////////////////////////////////////////////////////////
///////////////////////////////////////////////////////////////////////////////

// Polylines over a shared vertex list
struct Path : public Geometry
{
  Kind kind() const override;

  // Segment endpoints suitable for GL_LINES, two vertices per segment
  std::vector<math::float3> toLineList() const;

  // Data //

  std::vector<math::float3> vertices;
  std::vector<std::vector<uint32_t>> entities;
};

using PathPtr = std::shared_ptr<Path>;

const char *toString(Geometry::Kind kind);

} // namespace sgx::core
