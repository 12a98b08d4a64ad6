// Copyright 2025-2026 NVIDIA Corporation
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "sgx/core/DataStream.hpp"
#include "sgx/io/gltf/GltfTypes.hpp"
// nlohmann
#include <nlohmann/json.hpp>
// std
#include <string>
#include <vector>

namespace sgx::io::gltf {

struct GlbContents
{
  nlohmann::json document;
  std::vector<core::ByteBuffer> buffers; // BIN chunk payloads, in file order
};

// Wrap a JSON document and an aligned binary payload into a GLB container.
// The JSON text is space padded to a 4-byte boundary; a BIN chunk is always
// written, with a zero length when 'binary' is empty.
core::ByteBuffer packGLB(std::string jsonText, const core::ByteBuffer &binary);

// Split a GLB container into its parsed JSON document and binary chunks.
// Throws FormatError on a bad header, a non-JSON first chunk, unparsable
// JSON, a non-BIN trailing chunk, or truncated chunk payloads.
GlbContents unpackGLB(const core::ByteBuffer &bytes);

} // namespace sgx::io::gltf
