// Copyright (c) MMK Team.
// Licensed under the MIT License.

#include "mmk/backends/cpu/kernels/matmul_vec8.hpp"
#include "mmk/backends/cpu/kernels/simd.hpp"
#include "mmk/core/Parallel.hpp"
#include "mmk/utils/Common.hpp"

namespace mmk::cpu {

namespace {

MMK_FORCE_INLINE void matmul_vec8_row_fp32(mmk_fp32_t* HWY_RESTRICT dst_row, const mmk_fp32_t* HWY_RESTRICT a_row,
                                           const mmk_fp32_t* HWY_RESTRICT B, size_t N, size_t P) {
  const F32x8Tag d;
  const size_t lanes = hn::Lanes(d);
  const size_t chunk_end = P / kF32ChunkSize * kF32ChunkSize;

  // k must stay ascending. Every dst element then sees the same sequence of additions as the
  // scalar dot product. Mul and Add stay separate so nothing is fused.
  for (size_t k = 0; k < N; ++k) {
    const f32x8 a_vec = hn::Set(d, a_row[k]);
    const mmk_fp32_t* HWY_RESTRICT b_row = B + k * P;

    size_t j = 0;
    for (; j < chunk_end; j += lanes) {
      const f32x8 b_vec = hn::LoadU(d, b_row + j);
      const f32x8 acc = hn::LoadU(d, dst_row + j);
      hn::StoreU(hn::Add(acc, hn::Mul(a_vec, b_vec)), d, dst_row + j);
    }

    // Handle remaining columns
    for (; j < P; j += lanes) {
      const size_t remaining = P - j;
      const f32x8 b_vec = hn::LoadN(d, b_row + j, remaining);
      const f32x8 acc = hn::LoadN(d, dst_row + j, remaining);
      hn::StoreN(hn::Add(acc, hn::Mul(a_vec, b_vec)), d, dst_row + j, remaining);
    }
  }
}

}  // namespace

void matmul_vec8_fp32(mmk_fp32_t* __restrict__ dst, const mmk_fp32_t* __restrict__ A, const mmk_fp32_t* __restrict__ B,
                      size_t M, size_t N, size_t P) {
  for (size_t i = 0; i < M; ++i) { matmul_vec8_row_fp32(dst + i * P, A + i * N, B, N, P); }
}

void matmul_vec8_partitioned_fp32(mmk_fp32_t* __restrict__ dst, const mmk_fp32_t* __restrict__ A,
                                  const mmk_fp32_t* __restrict__ B, size_t M, size_t N, size_t P, int thread_count) {
  const auto rows = static_cast<long long>(M);
  MMK_CONDITIONAL_PARALLEL_FOR(thread_count > 1, thread_count, i, 0, rows, 1, {
    const auto row = static_cast<size_t>(i);
    matmul_vec8_row_fp32(dst + row * P, A + row * N, B, N, P);
  });
}

}  // namespace mmk::cpu
