// Copyright (c) MMK Team.
// Licensed under the MIT License.

#pragma once

#include <cstddef>
#include <vector>

#include "mmk/core/MatMulTypes.hpp"

namespace mmk::nn::functional {

/**
 * @brief Row-major FP32 matrix product. a is m x n, b is n x p, the returned buffer is m x p.
 *
 * Every variant returns a freshly allocated buffer and leaves a and b untouched. a.size() != m * n
 * or b.size() != n * p is a contract violation and aborts through MMK_RT_ASSERT_EQ.
 *
 * Variants agree bit for bit on every input: each result element is accumulated from 0.f over k
 * in ascending order, one rounded multiply and one rounded add per step.
 */
std::vector<float> matmul_scalar(const std::vector<float>& a, const std::vector<float>& b, size_t m, size_t n, size_t p);

std::vector<float> matmul_partitioned(const std::vector<float>& a, const std::vector<float>& b, size_t m, size_t n,
                                      size_t p, int thread_count);

std::vector<float> matmul_vectorized(const std::vector<float>& a, const std::vector<float>& b, size_t m, size_t n,
                                     size_t p);

std::vector<float> matmul_vectorized_partitioned(const std::vector<float>& a, const std::vector<float>& b, size_t m,
                                                 size_t n, size_t p, int thread_count);

// Dispatches on options.type.
std::vector<float> matmul(const std::vector<float>& a, const std::vector<float>& b, size_t m, size_t n, size_t p,
                          const MatMulOptions& options = MatMulOptions::defaults());

}  // namespace mmk::nn::functional
