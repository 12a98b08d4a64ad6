// Copyright 2025-2026 NVIDIA Corporation
// SPDX-License-Identifier: Apache-2.0

// sgx
#include "sgx/core/DataStream.hpp"
#include "sgx/core/Logging.hpp"
#include "sgx/io/gltf.hpp"
// fmt
#include <fmt/format.h>
// std
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

static void printUsage(std::string_view progName)
{
  fmt::print("usage: {} [options] <input.glb|input.gltf>\n", progName);
  fmt::print("\n");
  fmt::print("Options:\n");
  fmt::print("  --help, -h              Show this help message\n");
  fmt::print("  --verbose, -v           Print debug messages\n");
  fmt::print("  --glb <file>            Re-export the scene as a GLB file\n");
  fmt::print(
      "  --gltf <dir>            Re-export the scene as .gltf + .bin files\n");
  fmt::print("  --normals, -n           Include vertex normals on export\n");
  fmt::print("  --seed <n>              Seed for generated instance names\n");
  fmt::print("\n");
  fmt::print("Examples:\n");
  fmt::print("  {} model.glb\n", progName);
  fmt::print("  {} --gltf out/ model.glb\n", progName);
  fmt::print("  {} --normals --glb copy.glb model.gltf\n", progName);
}

static bool writeFile(
    const std::string &filename, const sgx::core::ByteBuffer &b)
{
  sgx::core::FileWriter writer(filename.c_str());
  if (!writer) {
    sgx::core::logError("unable to open '%s' for writing", filename.c_str());
    return false;
  }
  if (writer.write(b.data(), 1, b.size()) != b.size()) {
    sgx::core::logError("failed writing '%s'", filename.c_str());
    return false;
  }
  return true;
}

static void printSummary(const sgx::core::SceneDescription &d)
{
  fmt::print("base frame: '{}'\n", d.baseFrame);
  fmt::print("geometry ({}):\n", d.geometry.size());
  for (const auto &g : d.geometry) {
    const auto &m = *g.second;
    fmt::print("  {:<32} {:>8} vertices {:>8} faces{}{}{}\n",
        g.first,
        m.vertices.size(),
        m.faces.size(),
        m.hasVertexColors() ? " [colors]" : "",
        m.material ? " [material]" : "",
        m.units ? " [" + *m.units + "]" : "");
  }
  fmt::print("graph edges ({}):\n", d.graph.size());
  for (const auto &e : d.graph) {
    fmt::print("  {} -> {}{}\n",
        e.frameFrom,
        e.frameTo,
        e.geometry ? " (" + *e.geometry + ")" : "");
  }
}

int main(int argc, const char *argv[])
{
  if (argc < 2) {
    printUsage(argv[0]);
    return 1;
  }

  std::optional<std::string> inputFile;
  std::optional<std::string> glbFile;
  std::optional<std::string> gltfDir;
  sgx::io::ExportOptions exportOptions;
  sgx::io::ImportOptions importOptions;
  sgx::io::StbImageDecoder decoder;
  importOptions.imageDecoder = &decoder;

  for (int i = 1; i < argc; ++i) {
    const std::string_view arg{argv[i]};

    if (arg == "--help" || arg == "-h") {
      printUsage(argv[0]);
      return 0;
    } else if (arg == "--verbose" || arg == "-v") {
      sgx::core::setLogVerbose(true);
    } else if (arg == "--normals" || arg == "-n") {
      exportOptions.includeNormals = true;
    } else if (arg == "--glb" || arg == "--gltf" || arg == "--seed") {
      if (i + 1 >= argc) {
        fmt::print(stderr, "Option {} requires a value\n", arg);
        printUsage(argv[0]);
        return 1;
      }
      const std::string value = argv[++i];
      if (arg == "--glb") {
        glbFile = value;
      } else if (arg == "--gltf") {
        gltfDir = value;
      } else {
        try {
          importOptions.nameSeed = std::stoull(value);
        } catch (const std::exception &) {
          fmt::print(stderr, "Invalid seed: {}\n", value);
          return 1;
        }
      }
    } else if (argv[i][0] != '-' && !inputFile) {
      inputFile = std::string(arg);
    } else {
      fmt::print(stderr, "Unknown argument: {}\n", arg);
      printUsage(argv[0]);
      return 1;
    }
  }

  if (!inputFile) {
    fmt::print(stderr, "Missing input file\n");
    printUsage(argv[0]);
    return 1;
  }

  sgx::core::setLogToStdout();

  sgx::core::SceneDescription description;
  try {
    description = sgx::io::import_GLTF(inputFile->c_str(), importOptions);
  } catch (const sgx::io::FormatError &e) {
    sgx::core::logError(
        "failed to load '%s': %s", inputFile->c_str(), e.what());
    return 1;
  }

  printSummary(description);

  if (!glbFile && !gltfDir)
    return 0;

  const sgx::core::Scene scene(description);

  if (glbFile) {
    if (!writeFile(*glbFile, sgx::io::export_GLB(scene, exportOptions)))
      return 1;
    sgx::core::logStatus("wrote '%s'", glbFile->c_str());
  }

  if (gltfDir) {
    std::string dir = *gltfDir;
    if (!dir.empty() && dir.back() != '/')
      dir += '/';
    for (const auto &f : sgx::io::export_GLTF(scene, exportOptions)) {
      if (!writeFile(dir + f.first, f.second))
        return 1;
    }
    sgx::core::logStatus("wrote directory export to '%s'", dir.c_str());
  }

  return 0;
}
