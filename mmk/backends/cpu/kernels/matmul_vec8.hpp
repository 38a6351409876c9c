// Copyright (c) MMK Team.
// Licensed under the MIT License.
#pragma once

#include <cstddef>

#include "mmk/core/DataTypes.hpp"

namespace mmk::cpu {

// dst += A * B   (row-major, FP32)
// A : MxN   B : NxP   dst : MxP, dst must be zero filled.
//
// For every row of A, a[i, k] is broadcast and multiply-accumulated against B[k, j:j+8].
// The last column chunk of a row only touches the P % 8 valid columns.
void matmul_vec8_fp32(mmk_fp32_t* __restrict__ dst, const mmk_fp32_t* __restrict__ A, const mmk_fp32_t* __restrict__ B,
                      size_t M, size_t N, size_t P);

// Row partitioned matmul_vec8_fp32. dst must be zero filled.
void matmul_vec8_partitioned_fp32(mmk_fp32_t* __restrict__ dst, const mmk_fp32_t* __restrict__ A,
                                  const mmk_fp32_t* __restrict__ B, size_t M, size_t N, size_t P, int thread_count);

}  // namespace mmk::cpu
