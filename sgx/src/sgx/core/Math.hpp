// Copyright 2024-2026 NVIDIA Corporation
// SPDX-License-Identifier: Apache-2.0

#pragma once

// anari
#include <anari/anari_cpp/ext/linalg.h>
// std
#include <cstdint>

namespace sgx::math {

using namespace linalg::aliases;
using linalg::identity;
using linalg::inverse;
using linalg::mul;
using linalg::rotation_matrix;
using linalg::scaling_matrix;
using linalg::translation_matrix;

using ubyte4 = linalg::vec<uint8_t, 4>;
using mat4 = float4x4;

// clang-format off
constexpr mat4 IDENTITY_MAT4 = {
  {1.f, 0.f, 0.f, 0.f},
  {0.f, 1.f, 0.f, 0.f},
  {0.f, 0.f, 1.f, 0.f},
  {0.f, 0.f, 0.f, 1.f}
};
// clang-format on

inline bool isIdentity(const mat4 &m)
{
  for (int c = 0; c < 4; c++) {
    for (int r = 0; r < 4; r++) {
      if (m[c][r] != IDENTITY_MAT4[c][r])
        return false;
    }
  }
  return true;
}

} // namespace sgx::math
