// Copyright 2025-2026 NVIDIA Corporation
// SPDX-License-Identifier: Apache-2.0

#include "sgx/io/gltf/GltfTypes.hpp"
// fmt
#include <fmt/format.h>
// std
#include <algorithm>
#include <cstring>
#include <vector>

namespace sgx::io::gltf {

static const char *VEC_TYPES[] = {"SCALAR", "VEC2", "VEC3", "VEC4"};

static std::vector<AccessorLayout> makeLayoutTable()
{
  struct ScalarType
  {
    ANARIDataType base;
    int componentType;
    bool normalized;
  };

  // clang-format off
  const ScalarType scalars[] = {
    {ANARI_INT8,     BYTE,           false},
    {ANARI_UINT8,    UNSIGNED_BYTE,  false},
    {ANARI_INT16,    SHORT,          false},
    {ANARI_UINT16,   UNSIGNED_SHORT, false},
    {ANARI_UINT32,   UNSIGNED_INT,   false},
    {ANARI_FLOAT32,  FLOAT,          false},
    {ANARI_FIXED8,   BYTE,           true},
    {ANARI_UFIXED8,  UNSIGNED_BYTE,  true},
    {ANARI_FIXED16,  SHORT,          true},
    {ANARI_UFIXED16, UNSIGNED_SHORT, true}
  };
  // clang-format on

  std::vector<AccessorLayout> table;

  // ANARI vector types directly follow their scalar type
  for (const auto &s : scalars) {
    for (size_t c = 1; c <= 4; c++) {
      AccessorLayout l;
      l.dataType = ANARIDataType(s.base + int(c - 1));
      l.componentType = s.componentType;
      l.type = VEC_TYPES[c - 1];
      l.components = c;
      l.normalized = s.normalized;
      table.push_back(l);
    }
  }

  table.push_back({ANARI_FLOAT32_MAT2, FLOAT, "MAT2", 4, false});
  table.push_back({ANARI_FLOAT32_MAT3, FLOAT, "MAT3", 9, false});
  table.push_back({ANARI_FLOAT32_MAT4, FLOAT, "MAT4", 16, false});

  return table;
}

static const std::vector<AccessorLayout> &layoutTable()
{
  static const std::vector<AccessorLayout> table = makeLayoutTable();
  return table;
}

///////////////////////////////////////////////////////////////////////////////
// Table lookups //////////////////////////////////////////////////////////////
///////////////////////////////////////////////////////////////////////////////

size_t componentSizeOf(int componentType)
{
  switch (componentType) {
  case BYTE:
  case UNSIGNED_BYTE:
    return 1;
  case SHORT:
  case UNSIGNED_SHORT:
    return 2;
  case UNSIGNED_INT:
  case FLOAT:
    return 4;
  default:
    break;
  }

  throw FormatError(
      fmt::format("unknown accessor componentType {}", componentType));
}

size_t componentCountOf(std::string_view type)
{
  if (type == "SCALAR")
    return 1;
  else if (type == "VEC2")
    return 2;
  else if (type == "VEC3")
    return 3;
  else if (type == "VEC4" || type == "MAT2")
    return 4;
  else if (type == "MAT3")
    return 9;
  else if (type == "MAT4")
    return 16;

  throw FormatError(fmt::format("unknown accessor type '{}'", type));
}

const AccessorLayout &layoutOf(
    int componentType, std::string_view type, bool normalized)
{
  // validate both codes first so the error names the bad one
  componentSizeOf(componentType);
  componentCountOf(type);

  // normalization is meaningless for 32-bit components
  if (componentType == FLOAT || componentType == UNSIGNED_INT)
    normalized = false;

  const auto &table = layoutTable();
  auto itr = std::find_if(table.begin(), table.end(), [&](const auto &l) {
    return l.componentType == componentType && type == l.type
        && l.normalized == normalized;
  });

  if (itr == table.end()) {
    throw FormatError(fmt::format(
        "unsupported accessor layout (componentType {}, type '{}')",
        componentType,
        type));
  }

  return *itr;
}

const AccessorLayout &layoutOf(ANARIDataType dataType)
{
  const auto &table = layoutTable();
  auto itr = std::find_if(table.begin(), table.end(), [&](const auto &l) {
    return l.dataType == dataType;
  });

  if (itr == table.end())
    throw std::logic_error("no GLTF accessor layout for element type");

  return *itr;
}

template <typename T>
static T loadAs(const std::byte *src)
{
  T v;
  std::memcpy(&v, src, sizeof(T));
  return v;
}

double decodeComponent(
    const std::byte *src, const AccessorLayout &layout, size_t c)
{
  const std::byte *p = src + c * componentSizeOf(layout.componentType);
  const bool n = layout.normalized;

  switch (layout.componentType) {
  case BYTE: {
    const double v = loadAs<int8_t>(p);
    return n ? std::max(v / 127.0, -1.0) : v;
  }
  case UNSIGNED_BYTE: {
    const double v = loadAs<uint8_t>(p);
    return n ? v / 255.0 : v;
  }
  case SHORT: {
    const double v = loadAs<int16_t>(p);
    return n ? std::max(v / 32767.0, -1.0) : v;
  }
  case UNSIGNED_SHORT: {
    const double v = loadAs<uint16_t>(p);
    return n ? v / 65535.0 : v;
  }
  case UNSIGNED_INT:
    return loadAs<uint32_t>(p);
  case FLOAT:
    return loadAs<float>(p);
  default:
    break;
  }

  throw FormatError(
      fmt::format("unknown accessor componentType {}", layout.componentType));
}

} // namespace sgx::io::gltf
