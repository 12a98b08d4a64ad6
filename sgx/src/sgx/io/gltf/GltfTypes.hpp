// Copyright 2025-2026 NVIDIA Corporation
// SPDX-License-Identifier: Apache-2.0

#pragma once

// anari
#include <anari/frontend/anari_enums.h>
// std
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace sgx::io {

// Raised for any malformed or unsupported GLTF/GLB input
struct FormatError : public std::runtime_error
{
  using std::runtime_error::runtime_error;
};

} // namespace sgx::io

namespace sgx::io::gltf {

// clang-format off
constexpr uint32_t GLB_MAGIC         = 0x46546C67; // "glTF"
constexpr uint32_t GLB_VERSION       = 2;
constexpr uint32_t GLB_CHUNK_JSON    = 0x4E4F534A; // "JSON"
constexpr uint32_t GLB_CHUNK_BIN     = 0x004E4942; // "BIN\0"
constexpr size_t   GLB_HEADER_SIZE   = 12;
constexpr size_t   GLB_CHUNK_HEADER  = 8;
constexpr size_t   GLTF_ALIGNMENT    = 4;

enum ComponentType : int
{
  BYTE           = 5120,
  UNSIGNED_BYTE  = 5121,
  SHORT          = 5122,
  UNSIGNED_SHORT = 5123,
  UNSIGNED_INT   = 5125,
  FLOAT          = 5126
};

enum PrimitiveMode : int
{
  MODE_POINTS         = 0,
  MODE_LINES          = 1,
  MODE_LINE_LOOP      = 2,
  MODE_LINE_STRIP     = 3,
  MODE_TRIANGLES      = 4,
  MODE_TRIANGLE_STRIP = 5,
  MODE_TRIANGLE_FAN   = 6
};
// clang-format on

// One row of the accessor layout table
struct AccessorLayout
{
  ANARIDataType dataType{ANARI_UNKNOWN};
  int componentType{0};
  const char *type{nullptr}; // "SCALAR", "VEC3", ...
  size_t components{0};
  bool normalized{false};
};

// Size in bytes of a single component, throws FormatError if unknown
size_t componentSizeOf(int componentType);
// Number of components of an accessor type string, throws FormatError
size_t componentCountOf(std::string_view type);

// Resolve (componentType, type, normalized) to an element type, throws
// FormatError for codes or combinations with no element type
const AccessorLayout &layoutOf(
    int componentType, std::string_view type, bool normalized = false);
// Reverse lookup used when writing accessors, throws std::logic_error
const AccessorLayout &layoutOf(ANARIDataType dataType);

// Decode component 'c' of the element at 'src' as a double; normalized
// integer components are mapped into [0, 1] (unsigned) or [-1, 1] (signed)
double decodeComponent(
    const std::byte *src, const AccessorLayout &layout, size_t c);

// Number of padding bytes needed to round 'size' up to GLTF_ALIGNMENT
constexpr size_t paddingFor(size_t size)
{
  return (GLTF_ALIGNMENT - size % GLTF_ALIGNMENT) % GLTF_ALIGNMENT;
}

} // namespace sgx::io::gltf
