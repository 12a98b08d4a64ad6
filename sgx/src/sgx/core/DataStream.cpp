// Copyright 2026 NVIDIA Corporation
// SPDX-License-Identifier: Apache-2.0

#include "DataStream.hpp"
// std
#include <utility>

namespace sgx::core {

// DataWriter definitions /////////////////////////////////////////////////////

bool DataWriter::writeU32LE(uint32_t v)
{
  const std::byte bytes[4] = {std::byte(v & 0xFF),
      std::byte((v >> 8) & 0xFF),
      std::byte((v >> 16) & 0xFF),
      std::byte((v >> 24) & 0xFF)};
  return write(bytes, 1, 4) == 4;
}

size_t DataWriter::fill(std::byte value, size_t count)
{
  size_t written = 0;
  for (size_t i = 0; i < count; i++)
    written += write(&value, 1, 1);
  return written;
}

// BufferWriter definitions ///////////////////////////////////////////////////

BufferWriter::BufferWriter(size_t initial_size)
{
  m_buffer.reserve(initial_size);
}

size_t BufferWriter::write(const void *ptr, size_t size, size_t count)
{
  if (ptr == nullptr || size == 0 || count == 0)
    return 0;

  const size_t total_bytes = size * count;
  const auto *data = static_cast<const std::byte *>(ptr);

  m_buffer.resize(m_buffer.size() + total_bytes);
  std::memcpy(
      m_buffer.data() + m_buffer.size() - total_bytes, data, total_bytes);

  return count;
}

size_t BufferWriter::write(const ByteBuffer &bytes)
{
  return write(bytes.data(), 1, bytes.size());
}

size_t BufferWriter::align(size_t alignment, std::byte value)
{
  if (alignment == 0)
    return 0;
  const size_t pad = (alignment - m_buffer.size() % alignment) % alignment;
  m_buffer.insert(m_buffer.end(), pad, value);
  return pad;
}

size_t BufferWriter::size() const
{
  return m_buffer.size();
}

const ByteBuffer &BufferWriter::buffer() const
{
  return m_buffer;
}

ByteBuffer BufferWriter::take()
{
  return std::move(m_buffer);
}

void BufferWriter::clear()
{
  m_buffer.clear();
}

// FileWriter definitions /////////////////////////////////////////////////////

FileWriter::FileWriter(const char *filename, const char *mode)
{
  m_file = std::fopen(filename, mode);
}

FileWriter::~FileWriter()
{
  if (m_file != nullptr)
    std::fclose(m_file);
}

size_t FileWriter::write(const void *ptr, size_t size, size_t count)
{
  if (ptr == nullptr || size == 0 || count == 0 || m_file == nullptr)
    return 0;

  return std::fwrite(ptr, size, count, m_file);
}

bool FileWriter::valid() const
{
  return m_file != nullptr;
}

FileWriter::operator bool() const
{
  return valid();
}

// DataReader definitions /////////////////////////////////////////////////////

bool DataReader::readU32LE(uint32_t &v)
{
  uint8_t bytes[4] = {0, 0, 0, 0};
  if (read(bytes, 1, 4) != 4)
    return false;
  v = uint32_t(bytes[0]) | (uint32_t(bytes[1]) << 8)
      | (uint32_t(bytes[2]) << 16) | (uint32_t(bytes[3]) << 24);
  return true;
}

// BufferReader definitions ///////////////////////////////////////////////////

BufferReader::BufferReader(const ByteBuffer &buffer, size_t offset)
    : m_buffer(buffer), m_offset(offset)
{}

size_t BufferReader::read(void *ptr, size_t size, size_t count)
{
  if (ptr == nullptr || size == 0 || count == 0
      || m_offset >= m_buffer.size()) {
    return 0;
  }

  size_t total_bytes = size * count;
  size_t remaining_bytes = m_buffer.size() - m_offset;

  if (total_bytes > remaining_bytes)
    total_bytes = remaining_bytes;

  std::memcpy(ptr, m_buffer.data() + m_offset, total_bytes);
  m_offset += total_bytes;

  return total_bytes / size; // Return number of elements read
}

size_t BufferReader::position() const
{
  return m_offset;
}

size_t BufferReader::remaining() const
{
  return m_offset >= m_buffer.size() ? 0 : m_buffer.size() - m_offset;
}

void BufferReader::reset(size_t offset)
{
  m_offset = offset;
}

// FileReader definitions /////////////////////////////////////////////////////

FileReader::FileReader(const char *filename, const char *mode)
{
  m_file = std::fopen(filename, mode);
}

FileReader::~FileReader()
{
  if (m_file != nullptr)
    std::fclose(m_file);
}

size_t FileReader::read(void *ptr, size_t size, size_t count)
{
  if (ptr == nullptr || size == 0 || count == 0 || m_file == nullptr) {
    return 0;
  }

  return std::fread(ptr, size, count, m_file);
}

ByteBuffer FileReader::readAll()
{
  ByteBuffer retval;
  std::byte chunk[4096];
  size_t n = 0;
  while ((n = read(chunk, 1, sizeof(chunk))) > 0)
    retval.insert(retval.end(), chunk, chunk + n);
  return retval;
}

bool FileReader::valid() const
{
  return m_file != nullptr;
}

FileReader::operator bool() const
{
  return valid();
}

} // namespace sgx::core
