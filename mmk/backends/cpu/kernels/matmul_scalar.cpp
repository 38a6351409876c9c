// Copyright (c) MMK Team.
// Licensed under the MIT License.

#include "mmk/backends/cpu/kernels/matmul_scalar.hpp"
#include "mmk/core/Parallel.hpp"
#include "mmk/utils/Common.hpp"

namespace mmk::cpu {

namespace {

// dst_row[j] = sum_k a_row[k] * B[k, j]
MMK_FORCE_INLINE void matmul_scalar_row_fp32(mmk_fp32_t* __restrict__ dst_row, const mmk_fp32_t* __restrict__ a_row,
                                             const mmk_fp32_t* __restrict__ B, size_t N, size_t P) {
  for (size_t j = 0; j < P; ++j) {
    mmk_fp32_t sum = 0.f;
    for (size_t k = 0; k < N; ++k) { sum += a_row[k] * B[k * P + j]; }
    dst_row[j] = sum;
  }
}

}  // namespace

void matmul_scalar_fp32(mmk_fp32_t* __restrict__ dst, const mmk_fp32_t* __restrict__ A, const mmk_fp32_t* __restrict__ B,
                        size_t M, size_t N, size_t P) {
  for (size_t i = 0; i < M; ++i) { matmul_scalar_row_fp32(dst + i * P, A + i * N, B, N, P); }
}

void matmul_partitioned_fp32(mmk_fp32_t* __restrict__ dst, const mmk_fp32_t* __restrict__ A,
                             const mmk_fp32_t* __restrict__ B, size_t M, size_t N, size_t P, int thread_count) {
  const auto rows = static_cast<long long>(M);

  // One row per job. Jobs never share a dst row, so no synchronization is needed on dst.
  MMK_CONDITIONAL_PARALLEL_FOR(thread_count > 1, thread_count, i, 0, rows, 1, {
    const auto row = static_cast<size_t>(i);
    matmul_scalar_row_fp32(dst + row * P, A + row * N, B, N, P);
  });
}

}  // namespace mmk::cpu
