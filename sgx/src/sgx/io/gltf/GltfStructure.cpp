// Copyright 2025-2026 NVIDIA Corporation
// SPDX-License-Identifier: Apache-2.0

#include "sgx/io/gltf/GltfStructure.hpp"
#include "sgx/core/Logging.hpp"
#include "sgx/io/gltf/GltfMaterials.hpp"
// fmt
#include <fmt/format.h>
// std
#include <cstring>
#include <stdexcept>
#include <utility>

namespace sgx::io::gltf {

using namespace sgx::core;
using namespace sgx::math;

static nlohmann::json accessorFor(
    ANARIDataType type, size_t bufferView, size_t count)
{
  const auto &layout = layoutOf(type);

  nlohmann::json accessor = {{"bufferView", bufferView},
      {"componentType", layout.componentType},
      {"type", layout.type},
      {"count", count},
      {"byteOffset", 0}};

  if (layout.normalized)
    accessor["normalized"] = true;

  return accessor;
}

static nlohmann::json toJSON(const float3 &v)
{
  return nlohmann::json::array({v.x, v.y, v.z});
}

// DocumentBuilder definitions ////////////////////////////////////////////////

DocumentBuilder::DocumentBuilder(ExportOptions options)
    : m_options(std::move(options))
{
  m_tree["asset"] = {{"version", "2.0"}, {"generator", m_options.generator}};
  m_tree["scene"] = 0;
  m_tree["scenes"] = nlohmann::json::array();
  m_tree["nodes"] = nlohmann::json::array();
  m_tree["meshes"] = nlohmann::json::array();
  m_tree["materials"] = nlohmann::json::array();
  m_tree["accessors"] = nlohmann::json::array();
  m_tree["bufferViews"] = nlohmann::json::array();
  m_tree["buffers"] = nlohmann::json::array();
}

size_t DocumentBuilder::appendBufferItem(
    core::ByteBuffer bytes, const std::string &owner)
{
  BufferItem item;
  item.byteLength = bytes.size();
  item.owner = owner;
  item.bytes = std::move(bytes);
  item.bytes.insert(
      item.bytes.end(), paddingFor(item.byteLength), std::byte{0});

  m_items.push_back(std::move(item));
  return m_items.size() - 1;
}

size_t DocumentBuilder::appendAccessor(nlohmann::json accessor)
{
  if (accessor.contains("bufferView")
      && accessor["bufferView"].get<size_t>() >= m_items.size()) {
    throw std::logic_error("accessor references a bufferView not yet appended");
  }

  auto &accessors = m_tree["accessors"];
  accessors.push_back(std::move(accessor));
  return accessors.size() - 1;
}

size_t DocumentBuilder::appendMesh(nlohmann::json mesh)
{
  auto &meshes = m_tree["meshes"];
  meshes.push_back(std::move(mesh));
  return meshes.size() - 1;
}

size_t DocumentBuilder::appendMaterial(const nlohmann::json &material)
{
  auto &materials = m_tree["materials"];
  for (size_t i = 0; i < materials.size(); i++) {
    if (materials[i] == material)
      return i;
  }

  materials.push_back(material);
  return materials.size() - 1;
}

std::optional<size_t> DocumentBuilder::appendGeometry(
    const std::string &name, const core::Geometry &geometry)
{
  switch (geometry.kind()) {
  case Geometry::Kind::TRIANGLE_MESH:
    return appendTriangleMesh(
        name, static_cast<const TriangleMesh &>(geometry));
  case Geometry::Kind::PATH:
    return appendPath(name, static_cast<const Path &>(geometry));
  default:
    break;
  }

  logWarning("[export_GLTF] geometry '%s' of kind '%s' not exported",
      name.c_str(),
      toString(geometry.kind()));
  return std::nullopt;
}

std::optional<size_t> DocumentBuilder::appendTriangleMesh(
    const std::string &name, const core::TriangleMesh &mesh)
{
  if (mesh.vertices.empty() || mesh.faces.empty()) {
    logWarning("[export_GLTF] skipping empty mesh '%s'", name.c_str());
    return std::nullopt;
  }

  // indices //

  BufferWriter indexData(mesh.faces.size() * sizeof(uint3));
  for (const auto &f : mesh.faces) {
    indexData.writeU32LE(f.x);
    indexData.writeU32LE(f.y);
    indexData.writeU32LE(f.z);
  }

  auto indices = accessorFor(ANARI_UINT32,
      appendBufferItem(indexData.take(), name),
      mesh.faces.size() * 3);
  indices.erase("byteOffset");
  indices["min"] = nlohmann::json::array({0});
  indices["max"] = nlohmann::json::array({mesh.maxIndex()});
  const size_t indicesAccessor = appendAccessor(std::move(indices));

  // positions //

  const auto bounds = mesh.bounds();
  auto positions = accessorFor(ANARI_FLOAT32_VEC3,
      appendFloats(&mesh.vertices[0].x, mesh.vertices.size() * 3, name),
      mesh.vertices.size());
  positions["min"] = toJSON(bounds.first);
  positions["max"] = toJSON(bounds.second);
  const size_t positionAccessor = appendAccessor(std::move(positions));

  nlohmann::json primitive = {
      {"attributes", {{"POSITION", positionAccessor}}},
      {"indices", indicesAccessor},
      {"mode", MODE_TRIANGLES}};

  // colors or material //

  std::vector<ubyte4> colors;
  if (mesh.hasTexture())
    colors = mesh.textureColors();
  else if (mesh.hasVertexColors())
    colors = mesh.vertexColors;

  if (!colors.empty()) {
    if (colors.size() != mesh.vertices.size()) {
      throw std::logic_error(fmt::format(
          "mesh '{}' has {} vertex colors for {} vertices",
          name,
          colors.size(),
          mesh.vertices.size()));
    }

    core::ByteBuffer colorData(colors.size() * sizeof(ubyte4));
    std::memcpy(colorData.data(), colors.data(), colorData.size());
    primitive["attributes"]["COLOR_0"] = appendAccessor(accessorFor(
        ANARI_UFIXED8_VEC4,
        appendBufferItem(std::move(colorData), name),
        colors.size()));
  } else {
    primitive["material"] = appendMaterial(mesh.material
            ? materialToGLTF(*mesh.material)
            : colorToGLTF(mesh.mainColor()));
  }

  // normals //

  if (m_options.includeNormals) {
    const auto normals = mesh.vertexNormals();
    primitive["attributes"]["NORMAL"] = appendAccessor(accessorFor(
        ANARI_FLOAT32_VEC3,
        appendFloats(&normals[0].x, normals.size() * 3, name),
        normals.size()));
  }

  nlohmann::json gltfMesh = {{"name", name},
      {"primitives", nlohmann::json::array({std::move(primitive)})}};
  if (mesh.units)
    gltfMesh["extras"] = {{"units", *mesh.units}};

  return appendMesh(std::move(gltfMesh));
}

std::optional<size_t> DocumentBuilder::appendPath(
    const std::string &name, const core::Path &path)
{
  const auto lines = path.toLineList();
  if (lines.empty()) {
    logWarning("[export_GLTF] skipping path '%s' without segments",
        name.c_str());
    return std::nullopt;
  }

  float3 lo = lines[0];
  float3 hi = lines[0];
  for (const auto &v : lines) {
    lo = linalg::min(lo, v);
    hi = linalg::max(hi, v);
  }

  auto positions = accessorFor(ANARI_FLOAT32_VEC3,
      appendFloats(&lines[0].x, lines.size() * 3, name),
      lines.size());
  positions["min"] = toJSON(lo);
  positions["max"] = toJSON(hi);

  nlohmann::json primitive = {
      {"attributes", {{"POSITION", appendAccessor(std::move(positions))}}},
      {"mode", MODE_LINES},
      {"material", appendMaterial(defaultMaterial())}};

  nlohmann::json gltfMesh = {{"name", name},
      {"primitives", nlohmann::json::array({std::move(primitive)})}};
  if (path.units)
    gltfMesh["extras"] = {{"units", *path.units}};

  return appendMesh(std::move(gltfMesh));
}

void DocumentBuilder::setNodes(nlohmann::json nodes)
{
  m_tree["scenes"] = nlohmann::json::array();
  if (!nodes.empty()) {
    m_tree["scenes"].push_back(
        {{"nodes", nlohmann::json::array({0})}});
  } else {
    m_tree["scenes"].push_back(nlohmann::json::object());
  }
  m_tree["nodes"] = std::move(nodes);
}

core::ByteBuffer DocumentBuilder::finalizeGLB()
{
  BufferWriter writer;
  auto &views = m_tree["bufferViews"];
  views = nlohmann::json::array();

  for (const auto &item : m_items) {
    views.push_back({{"buffer", 0},
        {"byteOffset", writer.size()},
        {"byteLength", item.byteLength}});
    writer.write(item.bytes);
  }

  m_tree["buffers"] = nlohmann::json::array();
  if (writer.size() > 0)
    m_tree["buffers"].push_back({{"byteLength", writer.size()}});

  finalizeCommon();
  return writer.take();
}

FileMap DocumentBuilder::finalizeDirectory()
{
  FlatMap<std::string, size_t> bufferOf;
  std::vector<BufferWriter> writers;

  auto &views = m_tree["bufferViews"];
  views = nlohmann::json::array();

  for (const auto &item : m_items) {
    if (!bufferOf.contains(item.owner)) {
      bufferOf[item.owner] = writers.size();
      writers.emplace_back();
    }

    const size_t b = bufferOf[item.owner];
    views.push_back({{"buffer", b},
        {"byteOffset", writers[b].size()},
        {"byteLength", item.byteLength}});
    writers[b].write(item.bytes);
  }

  FileMap files;
  m_tree["buffers"] = nlohmann::json::array();
  for (auto &owner : bufferOf) {
    auto &writer = writers[owner.second];
    const auto uri = m_options.bufferPrefix + owner.first + ".bin";
    m_tree["buffers"].push_back(
        {{"uri", uri}, {"byteLength", writer.size()}});
    files[uri] = writer.take();
  }

  finalizeCommon();
  return files;
}

const nlohmann::json &DocumentBuilder::document() const
{
  return m_tree;
}

const std::vector<BufferItem> &DocumentBuilder::bufferItems() const
{
  return m_items;
}

size_t DocumentBuilder::appendFloats(
    const float *data, size_t count, const std::string &owner)
{
  BufferWriter writer(count * sizeof(float));
  for (size_t i = 0; i < count; i++) {
    uint32_t bits = 0;
    std::memcpy(&bits, data + i, sizeof(bits));
    writer.writeU32LE(bits);
  }
  return appendBufferItem(writer.take(), owner);
}

void DocumentBuilder::finalizeCommon()
{
  // empty top level arrays are not valid GLTF
  for (const char *key : {"materials",
           "meshes",
           "accessors",
           "bufferViews",
           "buffers",
           "nodes"}) {
    if (m_tree.contains(key) && m_tree[key].empty())
      m_tree.erase(key);
  }
}

} // namespace sgx::io::gltf
