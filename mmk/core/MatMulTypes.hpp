// Copyright (c) MMK Team.
// Licensed under the MIT License.

#pragma once

#include <optional>
#include <string>
#include <vector>

namespace mmk {

enum class MatMulOpType {
  // Dot product per element. Reference.
  kScalar = 0,

  // kScalar, rows spread over workers.
  kPartitioned = 1,

  // 8 lane broadcast multiply-accumulate.
  kVectorized = 2,

  // kVectorized, rows spread over workers.
  kVectorizedPartitioned = 3,
};

struct MatMulOptions {
  MatMulOpType type = MatMulOpType::kVectorizedPartitioned;

  // Only read by the partitioned variants. <= 1 means run on the calling thread.
  int thread_count = 1;

  static MatMulOptions defaults();
};

// "scalar", "partitioned", "vectorized", "vectorized_partitioned"
std::optional<MatMulOpType> str2MatMulOpType(const std::string& str);

std::string MatMulOpType2Str(MatMulOpType type);

const std::vector<MatMulOpType>& allMatMulOpTypes();

bool isPartitioned(MatMulOpType type);

}  // namespace mmk
