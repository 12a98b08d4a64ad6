// Copyright 2024-2026 NVIDIA Corporation
// SPDX-License-Identifier: Apache-2.0

// catch
#include "catch.hpp"
// sgx_core
#include "sgx/core/Array.hpp"
#include "sgx/core/FlatMap.hpp"
#include "sgx/core/Math.hpp"
// std
#include <numeric>
#include <string>
#include <utility>
#include <vector>

SCENARIO("sgx::core::Array interface", "[Array]")
{
  GIVEN("A default constructed Array")
  {
    sgx::core::Array arr;

    THEN("The array is empty")
    {
      REQUIRE(arr.size() == 0);
      REQUIRE(arr.isEmpty());
    }

    THEN("The array element type is unknown")
    {
      REQUIRE(arr.elementType() == ANARI_UNKNOWN);
    }

    THEN("The array has no storage")
    {
      REQUIRE(arr.data() == nullptr);
      REQUIRE(arr.sizeInBytes() == 0);
    }
  }

  GIVEN("A constructed float3 Array")
  {
    auto arr = sgx::core::Array(ANARI_FLOAT32_VEC3, 4);

    THEN("The array is not empty")
    {
      REQUIRE(arr.size() == 4);
    }

    THEN("The array element type and size are correct")
    {
      REQUIRE(arr.elementType() == ANARI_FLOAT32_VEC3);
      REQUIRE(arr.elementSize() == 12);
      REQUIRE(arr.sizeInBytes() == 48);
    }

    THEN("The array starts zero filled")
    {
      const auto *v = arr.dataAs<sgx::math::float3>();
      for (size_t i = 0; i < arr.size(); i++)
        REQUIRE(v[i] == sgx::math::float3(0.f));
    }

    WHEN("The array is filled with setData()")
    {
      std::vector<sgx::math::float3> values = {
          {0.f, 1.f, 2.f}, {3.f, 4.f, 5.f}, {6.f, 7.f, 8.f}, {9.f, 10.f, 11.f}};
      arr.setData(values);

      THEN("Elements are accessible by index")
      {
        const auto *e =
            static_cast<const sgx::math::float3 *>(arr.elementAt(2));
        REQUIRE(*e == sgx::math::float3(6.f, 7.f, 8.f));
      }

      THEN("Out of range elements are null")
      {
        REQUIRE(arr.elementAt(4) == nullptr);
      }
    }

    WHEN("The array is moved")
    {
      auto moved = std::move(arr);

      THEN("The new array owns the elements")
      {
        REQUIRE(moved.size() == 4);
        REQUIRE(moved.elementType() == ANARI_FLOAT32_VEC3);
      }
    }
  }

  GIVEN("An int Array filled with a sequence")
  {
    auto arr = sgx::core::Array(ANARI_INT32, 16);
    auto *begin = arr.mapAs<int>();
    std::iota(begin, begin + 16, 0);

    THEN("The values are retained")
    {
      const auto *v = arr.dataAs<int>();
      REQUIRE(v[0] == 0);
      REQUIRE(v[15] == 15);
    }
  }
}

SCENARIO("sgx::core::FlatMap<> interface", "[FlatMap]")
{
  GIVEN("A FlatMap with a few entries")
  {
    sgx::core::FlatMap<std::string, int> m = {{"b", 2}, {"a", 1}, {"c", 3}};

    THEN("Insertion order is preserved")
    {
      REQUIRE(m.size() == 3);
      REQUIRE(m.at_index(0).first == "b");
      REQUIRE(m.at_index(1).first == "a");
      REQUIRE(m.at_index(2).first == "c");
    }

    THEN("Lookups find existing keys")
    {
      REQUIRE(m.contains("a"));
      REQUIRE(*m.find("c") == 3);
      REQUIRE(m.find("d") == nullptr);
    }

    THEN("at() on a missing key throws")
    {
      REQUIRE_THROWS_AS(m.at("d"), std::out_of_range);
    }

    WHEN("An existing key is assigned")
    {
      m["a"] = 10;

      THEN("The value is replaced in place")
      {
        REQUIRE(m.size() == 3);
        REQUIRE(m.at_index(1).second == 10);
      }
    }

    WHEN("A key is erased")
    {
      REQUIRE(m.erase("b"));

      THEN("The remaining entries keep their order")
      {
        REQUIRE(m.size() == 2);
        REQUIRE(m.at_index(0).first == "a");
        REQUIRE(!m.erase("b"));
      }
    }
  }
}
