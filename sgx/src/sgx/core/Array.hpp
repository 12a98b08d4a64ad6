// Copyright 2024-2026 NVIDIA Corporation
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "sgx/core/DataStream.hpp"
// anari
#include <anari/frontend/anari_enums.h>
#include <anari/frontend/type_utility.h>
// std
#include <cassert>
#include <cstddef>
#include <cstring>
#include <vector>

namespace sgx::core {

// Host-side 1D array of ANARI-typed elements (decoded accessor payloads)
struct Array
{
  Array(ANARIDataType type, size_t items);

  Array() = default;
  ~Array() = default;

  size_t size() const;
  size_t elementSize() const;
  size_t sizeInBytes() const;
  ANARIDataType elementType() const;
  bool isEmpty() const;

  void *map();
  template <typename T>
  T *mapAs();

  const void *data() const;
  template <typename T>
  const T *dataAs() const;

  const void *elementAt(size_t i) const;

  template <typename T>
  void setData(const T *data, size_t size, size_t startOffset = 0);
  template <typename T>
  void setData(const std::vector<T> &data, size_t startOffset = 0);
  void setData(const void *data, size_t byteOffset = 0);

  // Movable, not copyable
  Array(const Array &) = delete;
  Array &operator=(const Array &) = delete;
  Array(Array &&) = default;
  Array &operator=(Array &&) = default;

 private:
  ByteBuffer m_data;
  ANARIDataType m_elementType{ANARI_UNKNOWN};
  size_t m_size{0};
};

// Inlined definitions ////////////////////////////////////////////////////////

template <typename T>
inline T *Array::mapAs()
{
  assert(sizeof(T) == anari::sizeOf(elementType()));
  return reinterpret_cast<T *>(map());
}

template <typename T>
inline const T *Array::dataAs() const
{
  assert(sizeof(T) == anari::sizeOf(elementType()));
  return reinterpret_cast<const T *>(data());
}

template <typename T>
inline void Array::setData(const T *data, size_t size, size_t startOffset)
{
  auto *d = mapAs<T>();
  std::memcpy(d + startOffset, data, size * sizeof(T));
}

template <typename T>
inline void Array::setData(const std::vector<T> &data, size_t startOffset)
{
  setData(data.data(), data.size(), startOffset);
}

} // namespace sgx::core
