// Copyright 2024-2026 NVIDIA Corporation
// SPDX-License-Identifier: Apache-2.0

#include "sgx/core/Array.hpp"

namespace sgx::core {

Array::Array(ANARIDataType type, size_t items)
    : m_elementType(type), m_size(items)
{
  m_data.resize(anari::sizeOf(type) * items, std::byte{0});
}

size_t Array::size() const
{
  return m_size;
}

size_t Array::elementSize() const
{
  return anari::sizeOf(elementType());
}

size_t Array::sizeInBytes() const
{
  return m_data.size();
}

ANARIDataType Array::elementType() const
{
  return m_elementType;
}

bool Array::isEmpty() const
{
  return size() == 0;
}

void *Array::map()
{
  return m_data.empty() ? nullptr : m_data.data();
}

const void *Array::data() const
{
  return m_data.empty() ? nullptr : m_data.data();
}

const void *Array::elementAt(size_t i) const
{
  if (i >= size())
    return nullptr;
  return m_data.data() + i * elementSize();
}

void Array::setData(const void *data, size_t byteOffset)
{
  if (data == nullptr || byteOffset >= m_data.size())
    return;
  std::memcpy(
      m_data.data() + byteOffset, data, m_data.size() - byteOffset);
}

} // namespace sgx::core
