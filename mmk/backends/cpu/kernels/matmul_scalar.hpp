// Copyright (c) MMK Team.
// Licensed under the MIT License.
#pragma once

#include <cstddef>

#include "mmk/core/DataTypes.hpp"

namespace mmk::cpu {

// dst = A * B   (row-major, FP32)
// A : MxN   B : NxP   dst : MxP
//
// Each dst element is a dot product accumulated from 0.f with k ascending.
void matmul_scalar_fp32(mmk_fp32_t* __restrict__ dst, const mmk_fp32_t* __restrict__ A, const mmk_fp32_t* __restrict__ B,
                        size_t M, size_t N, size_t P);

// Same result as matmul_scalar_fp32. Rows of dst are independent units of work spread over
// `thread_count` workers. Returns after every row is written.
void matmul_partitioned_fp32(mmk_fp32_t* __restrict__ dst, const mmk_fp32_t* __restrict__ A,
                             const mmk_fp32_t* __restrict__ B, size_t M, size_t N, size_t P, int thread_count);

}  // namespace mmk::cpu
