// Copyright 2025-2026 NVIDIA Corporation
// SPDX-License-Identifier: Apache-2.0

#include "sgx/io/gltf/GlbContainer.hpp"
#include "sgx/core/Logging.hpp"
// fmt
#include <fmt/format.h>
// std
#include <limits>
#include <utility>

namespace sgx::io::gltf {

using namespace sgx::core;

static uint32_t readWord(BufferReader &reader)
{
  uint32_t v = 0;
  if (!reader.readU32LE(v))
    throw FormatError("unexpected end of GLB data");
  return v;
}

core::ByteBuffer packGLB(std::string jsonText, const core::ByteBuffer &binary)
{
  jsonText.append(paddingFor(jsonText.size()), ' ');

  if (jsonText.size() % GLTF_ALIGNMENT != 0)
    throw std::logic_error("GLB JSON chunk is not 4-byte aligned");
  if (binary.size() % GLTF_ALIGNMENT != 0)
    throw std::logic_error("GLB BIN chunk is not 4-byte aligned");

  const size_t total = GLB_HEADER_SIZE + 2 * GLB_CHUNK_HEADER
      + jsonText.size() + binary.size();

  if (total > std::numeric_limits<uint32_t>::max()) {
    throw std::length_error(
        fmt::format("GLB container too large ({} bytes)", total));
  }

  BufferWriter writer(total);

  writer.writeU32LE(GLB_MAGIC);
  writer.writeU32LE(GLB_VERSION);
  writer.writeU32LE(uint32_t(total));

  writer.writeU32LE(uint32_t(jsonText.size()));
  writer.writeU32LE(GLB_CHUNK_JSON);
  writer.write(jsonText.data(), 1, jsonText.size());

  // the BIN chunk header is written even for an empty payload
  writer.writeU32LE(uint32_t(binary.size()));
  writer.writeU32LE(GLB_CHUNK_BIN);
  if (!binary.empty())
    writer.write(binary);

  if (writer.size() != total)
    throw std::logic_error("GLB container length mismatch");

  return writer.take();
}

GlbContents unpackGLB(const core::ByteBuffer &bytes)
{
  if (bytes.size() < GLB_HEADER_SIZE + GLB_CHUNK_HEADER) {
    throw FormatError(
        fmt::format("GLB data too short ({} bytes)", bytes.size()));
  }

  BufferReader reader(bytes);

  const uint32_t magic = readWord(reader);
  const uint32_t version = readWord(reader);
  const uint32_t totalLength = readWord(reader);

  if (magic != GLB_MAGIC)
    throw FormatError(fmt::format("bad GLB magic 0x{:08X}", magic));
  if (version != GLB_VERSION)
    throw FormatError(fmt::format("unsupported GLB version {}", version));

  const uint32_t jsonLength = readWord(reader);
  const uint32_t jsonType = readWord(reader);

  if (jsonType != GLB_CHUNK_JSON) {
    throw FormatError(
        fmt::format("first GLB chunk is not JSON (type 0x{:08X})", jsonType));
  }

  if (reader.remaining() < jsonLength) {
    throw FormatError(fmt::format(
        "GLB JSON chunk truncated ({} of {} bytes)",
        reader.remaining(),
        jsonLength));
  }

  std::string jsonText(jsonLength, ' ');
  reader.read(jsonText.data(), 1, jsonLength);

  GlbContents retval;

  try {
    retval.document = nlohmann::json::parse(jsonText);
  } catch (const nlohmann::json::parse_error &e) {
    throw FormatError(fmt::format("GLB JSON chunk: {}", e.what()));
  }

  if (!retval.document.is_object())
    throw FormatError("GLB JSON chunk is not a JSON object");

  if (totalLength > bytes.size()) {
    logWarning("[unpackGLB] header length %u exceeds data size %zu",
        totalLength,
        bytes.size());
  }

  while (reader.position() < totalLength) {
    if (reader.remaining() < GLB_CHUNK_HEADER)
      break;

    const uint32_t chunkLength = readWord(reader);
    const uint32_t chunkType = readWord(reader);

    if (chunkType != GLB_CHUNK_BIN) {
      throw FormatError(
          fmt::format("unexpected GLB chunk type 0x{:08X}", chunkType));
    }

    if (reader.remaining() < chunkLength) {
      throw FormatError(fmt::format("GLB BIN chunk truncated ({} of {} bytes)",
          reader.remaining(),
          chunkLength));
    }

    core::ByteBuffer chunk(chunkLength);
    reader.read(chunk.data(), 1, chunkLength);
    retval.buffers.push_back(std::move(chunk));
  }

  logDebug("[unpackGLB] %zu byte JSON chunk, %zu BIN chunk(s)",
      jsonText.size(),
      retval.buffers.size());

  return retval;
}

} // namespace sgx::io::gltf
