// Copyright 2025-2026 NVIDIA Corporation
// SPDX-License-Identifier: Apache-2.0

#include "sgx/io/gltf/GltfBuffers.hpp"
#include "sgx/core/Logging.hpp"
// fmt
#include <fmt/format.h>
// std
#include <cstring>
#include <limits>
#include <utility>

namespace sgx::io::gltf {

using namespace sgx::core;
using namespace sgx::math;

static size_t indexValue(const nlohmann::json &object, const char *key)
{
  if (!object.contains(key))
    throw FormatError(fmt::format("missing required property '{}'", key));

  const auto &v = object[key];
  if (!v.is_number_integer() || v.get<int64_t>() < 0) {
    throw FormatError(
        fmt::format("'{}' must be a non-negative integer", key));
  }

  return v.get<size_t>();
}

static const nlohmann::json &arrayOf(
    const nlohmann::json &document, const char *key)
{
  static const nlohmann::json EMPTY = nlohmann::json::array();
  if (!document.contains(key))
    return EMPTY;

  const auto &a = document[key];
  if (!a.is_array())
    throw FormatError(fmt::format("'{}' must be an array", key));
  return a;
}

static const Array &accessorAt(const std::vector<Array> &accessors,
    const nlohmann::json &object,
    const char *key)
{
  const auto i = indexValue(object, key);
  if (i >= accessors.size()) {
    throw FormatError(
        fmt::format("'{}' references missing accessor {}", key, i));
  }
  return accessors[i];
}

///////////////////////////////////////////////////////////////////////////////
// Attribute conversion ///////////////////////////////////////////////////////
///////////////////////////////////////////////////////////////////////////////

template <typename T>
static std::vector<T> copyAs(const Array &a)
{
  std::vector<T> retval(a.size());
  if (!retval.empty())
    std::memcpy(retval.data(), a.data(), retval.size() * sizeof(T));
  return retval;
}

static std::vector<uint3> facesFrom(const Array &indices)
{
  const auto &layout = layoutOf(indices.elementType());
  if (layout.components != 1 || layout.normalized
      || (layout.componentType != UNSIGNED_BYTE
          && layout.componentType != UNSIGNED_SHORT
          && layout.componentType != UNSIGNED_INT)) {
    throw FormatError(fmt::format(
        "unsupported index type {}", anari::toString(indices.elementType())));
  }

  if (indices.size() % 3 != 0) {
    throw FormatError(fmt::format(
        "index count {} is not a multiple of 3", indices.size()));
  }

  std::vector<uint3> faces(indices.size() / 3);
  for (size_t i = 0; i < faces.size(); i++) {
    for (int c = 0; c < 3; c++) {
      const auto *e =
          static_cast<const std::byte *>(indices.elementAt(i * 3 + c));
      faces[i][c] = uint32_t(decodeComponent(e, layout, 0));
    }
  }

  return faces;
}

static std::optional<std::vector<float2>> texcoordsFrom(const Array &a)
{
  const auto &layout = layoutOf(a.elementType());
  if (layout.components != 2
      || (layout.componentType != FLOAT && !layout.normalized)) {
    logWarning("[load_GLTF] ignoring TEXCOORD_0 of type %s",
        anari::toString(a.elementType()));
    return std::nullopt;
  }

  std::vector<float2> uv(a.size());
  for (size_t i = 0; i < uv.size(); i++) {
    const auto *e = static_cast<const std::byte *>(a.elementAt(i));
    // move the origin to the lower-left corner
    uv[i] = float2(float(decodeComponent(e, layout, 0)),
        1.f - float(decodeComponent(e, layout, 1)));
  }

  return uv;
}

static std::optional<std::vector<ubyte4>> colorsFrom(const Array &a)
{
  const auto &layout = layoutOf(a.elementType());
  if ((layout.components != 3 && layout.components != 4)
      || (layout.componentType != FLOAT && !layout.normalized)) {
    logWarning("[load_GLTF] ignoring COLOR_0 of type %s",
        anari::toString(a.elementType()));
    return std::nullopt;
  }

  std::vector<ubyte4> colors(a.size());
  for (size_t i = 0; i < colors.size(); i++) {
    const auto *e = static_cast<const std::byte *>(a.elementAt(i));
    float4 c(1.f);
    for (size_t k = 0; k < layout.components; k++)
      c[int(k)] = float(decodeComponent(e, layout, k));
    colors[i] = toColor8(c);
  }

  return colors;
}

///////////////////////////////////////////////////////////////////////////////
// Buffer views + accessors ///////////////////////////////////////////////////
///////////////////////////////////////////////////////////////////////////////

std::vector<ByteBuffer> resolveBufferViews(
    const nlohmann::json &document, const std::vector<ByteBuffer> &buffers)
{
  std::vector<ByteBuffer> views;

  const auto &entries = arrayOf(document, "bufferViews");
  for (size_t i = 0; i < entries.size(); i++) {
    const auto &view = entries[i];
    if (!view.is_object())
      throw FormatError(fmt::format("bufferView {} is not an object", i));

    const auto b = indexValue(view, "buffer");
    if (b >= buffers.size()) {
      throw FormatError(
          fmt::format("bufferView {} references missing buffer {}", i, b));
    }

    const size_t offset = view.value("byteOffset", size_t(0));
    const size_t length = indexValue(view, "byteLength");
    const auto &buffer = buffers[b];

    if (offset > buffer.size() || length > buffer.size() - offset) {
      throw FormatError(fmt::format(
          "bufferView {} ({} bytes at offset {}) exceeds buffer {} ({} bytes)",
          i,
          length,
          offset,
          b,
          buffer.size()));
    }

    views.emplace_back(
        buffer.begin() + offset, buffer.begin() + offset + length);
  }

  return views;
}

std::vector<Array> resolveAccessors(
    const nlohmann::json &document, const std::vector<ByteBuffer> &views)
{
  std::vector<Array> accessors;

  const auto &viewEntries = arrayOf(document, "bufferViews");
  const auto &entries = arrayOf(document, "accessors");

  for (size_t i = 0; i < entries.size(); i++) {
    const auto &accessor = entries[i];
    if (!accessor.is_object())
      throw FormatError(fmt::format("accessor {} is not an object", i));
    if (!accessor.contains("type") || !accessor["type"].is_string())
      throw FormatError(fmt::format("accessor {} has no type", i));

    const auto componentType = int(indexValue(accessor, "componentType"));
    const auto type = accessor["type"].get<std::string>();
    const bool normalized = accessor.value("normalized", false);
    const size_t count = indexValue(accessor, "count");

    const auto &layout = layoutOf(componentType, type, normalized);
    const size_t elementSize =
        componentSizeOf(componentType) * layout.components;

    if (count > std::numeric_limits<size_t>::max() / elementSize) {
      throw FormatError(
          fmt::format("accessor {} count {} is out of range", i, count));
    }

    if (accessor.contains("sparse"))
      logWarning("[load_GLTF] sparse accessor %zu loaded without overrides", i);

    if (!accessor.contains("bufferView")) {
      logDebug("[load_GLTF] accessor %zu has no bufferView, zero filled", i);
      accessors.emplace_back(layout.dataType, count);
      continue;
    }

    const auto v = indexValue(accessor, "bufferView");
    if (v >= views.size()) {
      throw FormatError(
          fmt::format("accessor {} references missing bufferView {}", i, v));
    }

    const auto &view = views[v];
    const size_t offset = accessor.value("byteOffset", size_t(0));
    const size_t stride = viewEntries[v].value("byteStride", size_t(0));

    if (count == 0) {
      accessors.emplace_back(layout.dataType, count);
      continue;
    }

    if (offset > view.size()) {
      throw FormatError(fmt::format(
          "accessor {} byteOffset {} is past the end of bufferView {} "
          "({} bytes)",
          i,
          offset,
          v,
          view.size()));
    }

    // elements available after the offset, checked before allocating
    const size_t available = view.size() - offset;

    if (stride == 0 || stride == elementSize) {
      const size_t span = elementSize * count;
      if (count > available / elementSize) {
        throw FormatError(fmt::format(
            "accessor {} needs {} elements ({} bytes) but bufferView {} only "
            "holds {} bytes after offset {}",
            i,
            count,
            span,
            v,
            view.size(),
            offset));
      }
      Array array(layout.dataType, count);
      std::memcpy(array.map(), view.data() + offset, span);
      accessors.push_back(std::move(array));
    } else if (stride < elementSize) {
      throw FormatError(fmt::format(
          "bufferView {} byteStride {} is smaller than the {} byte elements "
          "of accessor {}",
          v,
          stride,
          elementSize,
          i));
    } else {
      if (available < elementSize
          || count - 1 > (available - elementSize) / stride) {
        throw FormatError(fmt::format(
            "strided accessor {} needs {} elements but bufferView {} only "
            "holds {} bytes after offset {}",
            i,
            count,
            v,
            view.size(),
            offset));
      }
      Array array(layout.dataType, count);
      auto *out = static_cast<std::byte *>(array.map());
      for (size_t e = 0; e < count; e++) {
        std::memcpy(out + e * elementSize,
            view.data() + offset + e * stride,
            elementSize);
      }
      accessors.push_back(std::move(array));
    }
  }

  return accessors;
}

///////////////////////////////////////////////////////////////////////////////
// Mesh assembly //////////////////////////////////////////////////////////////
///////////////////////////////////////////////////////////////////////////////

MeshAssembly assembleMeshes(const nlohmann::json &document,
    const std::vector<Array> &accessors,
    const std::optional<std::vector<PBRMaterialPtr>> &materials,
    const ImportOptions &options)
{
  MeshAssembly retval;

  const auto &meshes = arrayOf(document, "meshes");
  retval.meshGeometry.resize(meshes.size());

  for (size_t m = 0; m < meshes.size(); m++) {
    const auto &mesh = meshes[m];
    if (!mesh.is_object() || !mesh.contains("primitives")
        || !mesh["primitives"].is_array()) {
      throw FormatError(fmt::format("mesh {} has no primitives array", m));
    }

    std::optional<std::string> units;
    if (mesh.contains("extras") && mesh["extras"].is_object()
        && mesh["extras"].contains("units")) {
      const auto &u = mesh["extras"]["units"];
      units = u.is_string() ? u.get<std::string>() : u.dump();
    }

    const bool hasName = mesh.contains("name") && mesh["name"].is_string();
    const std::string meshName = hasName ? mesh["name"].get<std::string>()
                                         : options.defaultGeometryName;

    const auto &primitives = mesh["primitives"];
    for (size_t j = 0; j < primitives.size(); j++) {
      const auto &p = primitives[j];
      if (!p.is_object())
        throw FormatError(fmt::format("mesh {} primitive {} is invalid", m, j));

      const int mode = p.value("mode", int(MODE_TRIANGLES));
      if (mode != MODE_TRIANGLES) {
        logDebug("[load_GLTF] skipping mesh %zu primitive %zu (mode %i)",
            m,
            j,
            mode);
        continue;
      }

      if (!p.contains("attributes") || !p["attributes"].is_object())
        throw FormatError(
            fmt::format("mesh {} primitive {} has no attributes", m, j));
      const auto &attributes = p["attributes"];

      auto tm = std::make_shared<TriangleMesh>();
      tm->units = units;

      const auto &positions = accessorAt(accessors, attributes, "POSITION");
      if (positions.elementType() != ANARI_FLOAT32_VEC3) {
        throw FormatError(fmt::format("unsupported POSITION type {}",
            anari::toString(positions.elementType())));
      }
      tm->vertices = copyAs<float3>(positions);

      if (p.contains("indices")) {
        tm->faces = facesFrom(accessorAt(accessors, p, "indices"));
      } else {
        if (tm->vertices.size() % 3 != 0) {
          throw FormatError(fmt::format(
              "non-indexed primitive with {} vertices", tm->vertices.size()));
        }
        tm->faces.resize(tm->vertices.size() / 3);
        for (uint32_t f = 0; f < tm->faces.size(); f++)
          tm->faces[f] = uint3(3 * f, 3 * f + 1, 3 * f + 2);
      }

      for (const auto &f : tm->faces) {
        if (f.x >= tm->vertices.size() || f.y >= tm->vertices.size()
            || f.z >= tm->vertices.size()) {
          throw FormatError(fmt::format(
              "mesh {} primitive {} indexes past {} vertices",
              m,
              j,
              tm->vertices.size()));
        }
      }

      PBRMaterialPtr material;
      if (p.contains("material") && materials) {
        const auto mi = indexValue(p, "material");
        if (mi >= materials->size())
          throw FormatError(
              fmt::format("primitive references missing material {}", mi));
        material = (*materials)[mi];
      }

      if (attributes.contains("TEXCOORD_0")) {
        if (!p.contains("material")) {
          logWarning("[load_GLTF] texcoord without material in mesh %zu", m);
        } else if (material) {
          auto uv =
              texcoordsFrom(accessorAt(accessors, attributes, "TEXCOORD_0"));
          if (uv && uv->size() == tm->vertices.size())
            tm->uv = std::move(*uv);
          else if (uv)
            logWarning("[load_GLTF] TEXCOORD_0 count mismatch in mesh %zu", m);
        }
      }

      tm->material = material;

      if (attributes.contains("COLOR_0")) {
        auto colors = colorsFrom(accessorAt(accessors, attributes, "COLOR_0"));
        if (colors && colors->size() == tm->vertices.size())
          tm->vertexColors = std::move(*colors);
        else if (colors)
          logWarning("[load_GLTF] COLOR_0 count mismatch in mesh %zu", m);
      }

      if (attributes.contains("NORMAL")) {
        const auto &normals = accessorAt(accessors, attributes, "NORMAL");
        if (normals.elementType() == ANARI_FLOAT32_VEC3
            && normals.size() == tm->vertices.size()) {
          tm->normals = copyAs<float3>(normals);
        } else {
          logWarning("[load_GLTF] ignoring NORMAL attribute of mesh %zu", m);
        }
      }

      std::string name = meshName;
      if (primitives.size() > 1)
        name += "_" + std::to_string(j);
      if (retval.geometry.contains(name)) {
        std::string unique;
        size_t n = 1;
        do {
          unique = name + "_" + std::to_string(n++);
        } while (retval.geometry.contains(unique));
        logDebug("[load_GLTF] renamed duplicate geometry '%s' to '%s'",
            name.c_str(),
            unique.c_str());
        name = unique;
      }

      tm->name = name;
      retval.geometry[name] = tm;
      retval.meshGeometry[m].push_back(name);
    }
  }

  return retval;
}

} // namespace sgx::io::gltf
