// Copyright 2025-2026 NVIDIA Corporation
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "sgx/core/DataStream.hpp"
#include "sgx/core/FlatMap.hpp"
// std
#include <cstdint>
#include <string>

namespace sgx::io {

struct ImageDecoder;

// File name -> file contents, used for directory style (.gltf) exports
using FileMap = core::FlatMap<std::string, core::ByteBuffer>;

struct ExportOptions
{
  bool includeNormals{false};
  std::string generator{"sgx"};
  std::string bufferPrefix{"mesh_"}; // directory export: <prefix><name>.bin
  std::string gltfFileName{"model.gltf"};
};

struct ImportOptions
{
  // Materials are skipped if no decoder is provided
  const ImageDecoder *imageDecoder{nullptr};
  // Seed for the suffixes of generated instance frame names
  uint64_t nameSeed{0};
  std::string defaultGeometryName{"GLTF_geometry"};
  // Compose node translation/rotation/scale when a node has no matrix
  bool composeTRS{true};
};

} // namespace sgx::io
