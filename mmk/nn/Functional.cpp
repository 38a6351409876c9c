// Copyright (c) MMK Team.
// Licensed under the MIT License.

#include "mmk/nn/Functional.hpp"
#include "mmk/backends/cpu/kernels/Kernels.hpp"
#include "mmk/utils/Common.hpp"

namespace mmk::nn::functional {

namespace {

// Element count of a rows x cols matrix. Traps instead of wrapping around.
size_t elementCount(size_t rows, size_t cols) {
  size_t count = 0;
  MMK_RT_ASSERT(!__builtin_mul_overflow(rows, cols, &count));
  return count;
}

void checkShapes(const std::vector<float>& a, const std::vector<float>& b, size_t m, size_t n, size_t p) {
  MMK_RT_ASSERT_EQ(a.size(), elementCount(m, n));
  MMK_RT_ASSERT_EQ(b.size(), elementCount(n, p));
  elementCount(m, p);
}

}  // namespace

std::vector<float> matmul_scalar(const std::vector<float>& a, const std::vector<float>& b, size_t m, size_t n, size_t p) {
  checkShapes(a, b, m, n, p);
  std::vector<float> result(m * p, 0.f);
  cpu::matmul_scalar_fp32(result.data(), a.data(), b.data(), m, n, p);
  return result;
}

std::vector<float> matmul_partitioned(const std::vector<float>& a, const std::vector<float>& b, size_t m, size_t n,
                                      size_t p, int thread_count) {
  checkShapes(a, b, m, n, p);
  std::vector<float> result(m * p, 0.f);
  cpu::matmul_partitioned_fp32(result.data(), a.data(), b.data(), m, n, p, thread_count);
  return result;
}

std::vector<float> matmul_vectorized(const std::vector<float>& a, const std::vector<float>& b, size_t m, size_t n,
                                     size_t p) {
  checkShapes(a, b, m, n, p);
  std::vector<float> result(m * p, 0.f);
  cpu::matmul_vec8_fp32(result.data(), a.data(), b.data(), m, n, p);
  return result;
}

std::vector<float> matmul_vectorized_partitioned(const std::vector<float>& a, const std::vector<float>& b, size_t m,
                                                 size_t n, size_t p, int thread_count) {
  checkShapes(a, b, m, n, p);
  std::vector<float> result(m * p, 0.f);
  cpu::matmul_vec8_partitioned_fp32(result.data(), a.data(), b.data(), m, n, p, thread_count);
  return result;
}

std::vector<float> matmul(const std::vector<float>& a, const std::vector<float>& b, size_t m, size_t n, size_t p,
                          const MatMulOptions& options) {
  switch (options.type) {
    case MatMulOpType::kScalar: return matmul_scalar(a, b, m, n, p);
    case MatMulOpType::kPartitioned: return matmul_partitioned(a, b, m, n, p, options.thread_count);
    case MatMulOpType::kVectorized: return matmul_vectorized(a, b, m, n, p);
    case MatMulOpType::kVectorizedPartitioned: return matmul_vectorized_partitioned(a, b, m, n, p, options.thread_count);
  }
  MMK_ERROR_EXIT(ExitCode::kCoreError, "Unknown MatMulOpType {}", static_cast<int>(options.type));
}

}  // namespace mmk::nn::functional
