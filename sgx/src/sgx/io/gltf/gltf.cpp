// Copyright 2025-2026 NVIDIA Corporation
// SPDX-License-Identifier: Apache-2.0

#include "sgx/io/gltf.hpp"
#include "sgx/core/Logging.hpp"
#include "sgx/io/gltf/GlbContainer.hpp"
#include "sgx/io/gltf/GltfBuffers.hpp"
#include "sgx/io/gltf/GltfGraph.hpp"
#include "sgx/io/gltf/GltfMaterials.hpp"
#include "sgx/io/gltf/GltfStructure.hpp"
// fmt
#include <fmt/format.h>
// std
#include <cstring>
#include <utility>

namespace sgx::io {

using namespace sgx::core;
using namespace sgx::io::gltf;

#ifdef _WIN32
constexpr char path_sep = '\\';
#else
constexpr char path_sep = '/';
#endif

static std::string pathOf(const std::string &filepath)
{
  size_t pos = filepath.find_last_of(path_sep);
  if (pos == std::string::npos)
    return "";
  return filepath.substr(0, pos + 1);
}

static std::string fileOf(const std::string &filepath)
{
  size_t pos = filepath.find_last_of(path_sep);
  if (pos == std::string::npos)
    return filepath;
  return filepath.substr(pos + 1, filepath.size());
}

static std::string extensionOf(const std::string &filepath)
{
  size_t pos = filepath.rfind('.');
  if (pos == filepath.npos)
    return "";
  return filepath.substr(pos);
}

static ByteBuffer toBytes(const std::string &text)
{
  ByteBuffer bytes(text.size());
  std::memcpy(bytes.data(), text.data(), text.size());
  return bytes;
}

static nlohmann::json parseDocument(const ByteBuffer &bytes, const char *what)
{
  nlohmann::json document;
  try {
    const auto *text = reinterpret_cast<const char *>(bytes.data());
    document = nlohmann::json::parse(text, text + bytes.size());
  } catch (const nlohmann::json::parse_error &e) {
    throw FormatError(fmt::format("{}: {}", what, e.what()));
  }

  if (!document.is_object())
    throw FormatError(fmt::format("{} is not a JSON object", what));

  return document;
}

static void checkBufferLength(
    const nlohmann::json &buffer, size_t i, size_t available)
{
  const size_t byteLength = buffer.value("byteLength", size_t(0));
  if (byteLength > available) {
    throw FormatError(fmt::format(
        "buffer {} declares {} bytes but only {} are available",
        i,
        byteLength,
        available));
  }
}

///////////////////////////////////////////////////////////////////////////////
// Export /////////////////////////////////////////////////////////////////////
///////////////////////////////////////////////////////////////////////////////

static DocumentBuilder buildDocument(
    const Scene &scene, const ExportOptions &options)
{
  DocumentBuilder builder(options);
  FlatMap<std::string, size_t> meshIndex;

  for (const auto &g : scene.geometry()) {
    if (!g.second)
      continue;
    if (auto mesh = builder.appendGeometry(g.first, *g.second); mesh)
      meshIndex[g.first] = *mesh;
  }

  builder.setNodes(flattenGraph(scene.graph(), meshIndex));

  return builder;
}

ByteBuffer export_GLB(const Scene &scene, const ExportOptions &options)
{
  auto builder = buildDocument(scene, options);
  auto binary = builder.finalizeGLB();
  auto glb = packGLB(builder.document().dump(), binary);

  logStatus("[export_GLB] %zu mesh(es), %zu byte container",
      builder.document().value("meshes", nlohmann::json::array()).size(),
      glb.size());

  return glb;
}

FileMap export_GLTF(const Scene &scene, const ExportOptions &options)
{
  auto builder = buildDocument(scene, options);
  auto buffers = builder.finalizeDirectory();

  FileMap files;
  files[options.gltfFileName] = toBytes(builder.document().dump(2));
  for (auto &f : buffers)
    files[f.first] = std::move(f.second);

  logStatus("[export_GLTF] wrote '%s' + %zu buffer file(s)",
      options.gltfFileName.c_str(),
      buffers.size());

  return files;
}

///////////////////////////////////////////////////////////////////////////////
// Import /////////////////////////////////////////////////////////////////////
///////////////////////////////////////////////////////////////////////////////

static SceneDescription loadDocument(const nlohmann::json &document,
    const std::vector<ByteBuffer> &buffers,
    const FileMap *files,
    const ImportOptions &options)
{
  try {
    const auto views = resolveBufferViews(document, buffers);
    const auto accessors = resolveAccessors(document, views);
    const auto materials =
        parseMaterials(document, views, options.imageDecoder, files);
    auto meshes = assembleMeshes(document, accessors, materials, options);
    auto graph = reconstructGraph(document, meshes.meshGeometry, options);

    SceneDescription retval;
    retval.geometry = std::move(meshes.geometry);
    retval.graph = std::move(graph.edges);
    retval.baseFrame = std::move(graph.baseFrame);

    logInfo("[load_GLTF] loaded %zu geometry, %zu graph edge(s)",
        retval.geometry.size(),
        retval.graph.size());

    return retval;
  } catch (const nlohmann::json::exception &e) {
    throw FormatError(fmt::format("malformed GLTF document: {}", e.what()));
  }
}

SceneDescription load_GLB(const ByteBuffer &bytes, const ImportOptions &options)
{
  auto contents = unpackGLB(bytes);
  const auto &document = contents.document;

  std::vector<ByteBuffer> buffers;
  size_t chunk = 0;

  if (document.contains("buffers")) {
    const auto &entries = document["buffers"];
    if (!entries.is_array())
      throw FormatError("'buffers' must be an array");

    for (size_t i = 0; i < entries.size(); i++) {
      if (!entries[i].is_object())
        throw FormatError(fmt::format("buffer {} is not an object", i));
      if (entries[i].contains("uri")) {
        throw FormatError(
            fmt::format("GLB buffer {} references an external uri", i));
      }
      if (chunk >= contents.buffers.size()) {
        throw FormatError(
            fmt::format("GLB buffer {} has no matching BIN chunk", i));
      }
      checkBufferLength(entries[i], i, contents.buffers[chunk].size());
      buffers.push_back(std::move(contents.buffers[chunk++]));
    }
  }

  return loadDocument(document, buffers, nullptr, options);
}

SceneDescription load_GLTF(const FileMap &files,
    const ImportOptions &options,
    const std::string &rootFile)
{
  const auto *root = files.find(rootFile);
  if (!root)
    throw FormatError(fmt::format("'{}' not found", rootFile));

  const auto document = parseDocument(*root, rootFile.c_str());

  std::vector<ByteBuffer> buffers;
  if (document.contains("buffers")) {
    const auto &entries = document["buffers"];
    if (!entries.is_array())
      throw FormatError("'buffers' must be an array");

    for (size_t i = 0; i < entries.size(); i++) {
      const auto &entry = entries[i];
      if (!entry.is_object() || !entry.contains("uri")
          || !entry["uri"].is_string()) {
        throw FormatError(fmt::format("buffer {} has no uri", i));
      }

      const auto uri = entry["uri"].get<std::string>();
      if (uri.rfind("data:", 0) == 0) {
        throw FormatError(
            fmt::format("buffer {} uses an unsupported data URI", i));
      }

      const auto *bytes = files.find(uri);
      if (!bytes)
        throw FormatError(fmt::format("buffer file '{}' not found", uri));

      checkBufferLength(entry, i, bytes->size());
      buffers.push_back(*bytes);
    }
  }

  return loadDocument(document, buffers, &files, options);
}

SceneDescription import_GLTF(const char *filename, const ImportOptions &options)
{
  const std::string ext = extensionOf(filename);
  if (ext != ".glb" && ext != ".gltf") {
    logError("[import_GLTF] unsupported file extension: %s", ext.c_str());
    return {};
  }

  FileReader reader(filename);
  if (!reader) {
    logError("[import_GLTF] unable to open '%s'", filename);
    return {};
  }

  auto bytes = reader.readAll();

  if (ext == ".glb")
    return load_GLB(bytes, options);

  // gather the files referenced by the document from beside it
  const auto document = parseDocument(bytes, filename);
  const auto root = fileOf(filename);
  const auto dir = pathOf(filename);

  FileMap files;
  files[root] = std::move(bytes);

  for (const char *key : {"buffers", "images"}) {
    if (!document.contains(key) || !document[key].is_array())
      continue;
    for (const auto &entry : document[key]) {
      if (!entry.is_object() || !entry.contains("uri")
          || !entry["uri"].is_string())
        continue;
      const auto uri = entry["uri"].get<std::string>();
      if (uri.rfind("data:", 0) == 0 || files.contains(uri))
        continue;
      FileReader sibling((dir + uri).c_str());
      if (!sibling) {
        logError("[import_GLTF] unable to open '%s'", (dir + uri).c_str());
        continue;
      }
      files[uri] = sibling.readAll();
    }
  }

  return load_GLTF(files, options, root);
}

} // namespace sgx::io
