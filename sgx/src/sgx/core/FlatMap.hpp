// Copyright 2024-2026 NVIDIA Corporation
// SPDX-License-Identifier: Apache-2.0

#pragma once

// std
#include <algorithm>
#include <initializer_list>
#include <stdexcept>
#include <utility>
#include <vector>

namespace sgx::core {

// Insertion-ordered associative container backed by a std::vector
template <typename KEY, typename VALUE>
struct FlatMap
{
  using value_type = std::pair<KEY, VALUE>;
  using storage_type = std::vector<value_type>;
  using iterator = typename storage_type::iterator;
  using const_iterator = typename storage_type::const_iterator;

  FlatMap() = default;
  FlatMap(std::initializer_list<value_type> values);

  VALUE &operator[](const KEY &key);
  VALUE &at(const KEY &key);
  const VALUE &at(const KEY &key) const;

  VALUE *find(const KEY &key);
  const VALUE *find(const KEY &key) const;

  bool contains(const KEY &key) const;
  bool erase(const KEY &key);

  value_type &at_index(size_t i);
  const value_type &at_index(size_t i) const;

  size_t size() const;
  bool empty() const;
  void clear();

  iterator begin();
  iterator end();
  const_iterator begin() const;
  const_iterator end() const;

 private:
  storage_type m_values;
};

// Inlined definitions ////////////////////////////////////////////////////////

template <typename KEY, typename VALUE>
inline FlatMap<KEY, VALUE>::FlatMap(std::initializer_list<value_type> values)
{
  for (const auto &v : values)
    (*this)[v.first] = v.second;
}

template <typename KEY, typename VALUE>
inline VALUE &FlatMap<KEY, VALUE>::operator[](const KEY &key)
{
  if (auto *v = find(key); v != nullptr)
    return *v;
  m_values.emplace_back(key, VALUE{});
  return m_values.back().second;
}

template <typename KEY, typename VALUE>
inline VALUE &FlatMap<KEY, VALUE>::at(const KEY &key)
{
  auto *v = find(key);
  if (!v)
    throw std::out_of_range("FlatMap::at() key not found");
  return *v;
}

template <typename KEY, typename VALUE>
inline const VALUE &FlatMap<KEY, VALUE>::at(const KEY &key) const
{
  const auto *v = find(key);
  if (!v)
    throw std::out_of_range("FlatMap::at() key not found");
  return *v;
}

template <typename KEY, typename VALUE>
inline VALUE *FlatMap<KEY, VALUE>::find(const KEY &key)
{
  auto itr = std::find_if(m_values.begin(),
      m_values.end(),
      [&](const value_type &v) { return v.first == key; });
  return itr == m_values.end() ? nullptr : &itr->second;
}

template <typename KEY, typename VALUE>
inline const VALUE *FlatMap<KEY, VALUE>::find(const KEY &key) const
{
  auto itr = std::find_if(m_values.begin(),
      m_values.end(),
      [&](const value_type &v) { return v.first == key; });
  return itr == m_values.end() ? nullptr : &itr->second;
}

template <typename KEY, typename VALUE>
inline bool FlatMap<KEY, VALUE>::contains(const KEY &key) const
{
  return find(key) != nullptr;
}

template <typename KEY, typename VALUE>
inline bool FlatMap<KEY, VALUE>::erase(const KEY &key)
{
  auto itr = std::find_if(m_values.begin(),
      m_values.end(),
      [&](const value_type &v) { return v.first == key; });
  if (itr == m_values.end())
    return false;
  m_values.erase(itr);
  return true;
}

template <typename KEY, typename VALUE>
inline typename FlatMap<KEY, VALUE>::value_type &FlatMap<KEY, VALUE>::at_index(
    size_t i)
{
  return m_values.at(i);
}

template <typename KEY, typename VALUE>
inline const typename FlatMap<KEY, VALUE>::value_type &
FlatMap<KEY, VALUE>::at_index(size_t i) const
{
  return m_values.at(i);
}

template <typename KEY, typename VALUE>
inline size_t FlatMap<KEY, VALUE>::size() const
{
  return m_values.size();
}

template <typename KEY, typename VALUE>
inline bool FlatMap<KEY, VALUE>::empty() const
{
  return m_values.empty();
}

template <typename KEY, typename VALUE>
inline void FlatMap<KEY, VALUE>::clear()
{
  m_values.clear();
}

template <typename KEY, typename VALUE>
inline typename FlatMap<KEY, VALUE>::iterator FlatMap<KEY, VALUE>::begin()
{
  return m_values.begin();
}

template <typename KEY, typename VALUE>
inline typename FlatMap<KEY, VALUE>::iterator FlatMap<KEY, VALUE>::end()
{
  return m_values.end();
}

template <typename KEY, typename VALUE>
inline typename FlatMap<KEY, VALUE>::const_iterator FlatMap<KEY, VALUE>::begin()
    const
{
  return m_values.begin();
}

template <typename KEY, typename VALUE>
inline typename FlatMap<KEY, VALUE>::const_iterator FlatMap<KEY, VALUE>::end()
    const
{
  return m_values.end();
}

} // namespace sgx::core
