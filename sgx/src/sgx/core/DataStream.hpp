// Copyright 2026 NVIDIA Corporation
// SPDX-License-Identifier: Apache-2.0

#pragma once

// std
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <vector>

namespace sgx::core {

using ByteBuffer = std::vector<std::byte>;

///////////////////////////////////////////////////////////////////////////////
// Data writers ///////////////////////////////////////////////////////////////
///////////////////////////////////////////////////////////////////////////////

struct DataWriter
{
  virtual ~DataWriter() = default;

  // Write data to the writer (like std::fwrite)
  virtual size_t write(const void *ptr, size_t size, size_t count) = 0;

  // Write a 32-bit unsigned integer in little-endian byte order
  bool writeU32LE(uint32_t v);
  // Write 'count' copies of 'value'
  size_t fill(std::byte value, size_t count);
};

struct BufferWriter : public DataWriter
{
  explicit BufferWriter(size_t initial_size = 0);

  size_t write(const void *ptr, size_t size, size_t count) override;
  size_t write(const ByteBuffer &bytes);

  // Pad with 'value' until the buffer size is a multiple of 'alignment'
  size_t align(size_t alignment, std::byte value = std::byte{0});

  size_t size() const;
  const ByteBuffer &buffer() const;
  ByteBuffer take();
  void clear();

 private:
  ByteBuffer m_buffer;
};

struct FileWriter : public DataWriter
{
  explicit FileWriter(const char *filename, const char *mode = "wb");
  ~FileWriter();

  size_t write(const void *ptr, size_t size, size_t count) override;

  bool valid() const;
  operator bool() const;

 private:
  std::FILE *m_file{nullptr};
};

///////////////////////////////////////////////////////////////////////////////
// Data readers ///////////////////////////////////////////////////////////////
///////////////////////////////////////////////////////////////////////////////

struct DataReader
{
  virtual ~DataReader() = default;

  // Read data from the reader (like std::fread)
  virtual size_t read(void *ptr, size_t size, size_t count) = 0;

  // Read a little-endian 32-bit unsigned integer, false if short
  bool readU32LE(uint32_t &v);
};

struct BufferReader : public DataReader
{
  explicit BufferReader(const ByteBuffer &buffer, size_t offset = 0);

  size_t read(void *ptr, size_t size, size_t count) override;

  size_t position() const;
  size_t remaining() const;
  void reset(size_t offset = 0);

 private:
  const ByteBuffer &m_buffer;
  size_t m_offset{0};
};

struct FileReader : public DataReader
{
  explicit FileReader(const char *filename, const char *mode = "rb");
  ~FileReader();

  size_t read(void *ptr, size_t size, size_t count) override;

  // Read everything from the current position to the end of the file
  ByteBuffer readAll();

  bool valid() const;
  operator bool() const;

 private:
  std::FILE *m_file{nullptr};
};

} // namespace sgx::core
