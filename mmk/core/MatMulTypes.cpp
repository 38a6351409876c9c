// Copyright (c) MMK Team.
// Licensed under the MIT License.

#include <unordered_map>

#include "mmk/core/MatMulTypes.hpp"
#include "mmk/core/Parallel.hpp"

namespace mmk {

MatMulOptions MatMulOptions::defaults() {
  MatMulOptions options;
  options.thread_count = MMK_MAX_NUM_THREADS();
  if (options.thread_count < 1) options.thread_count = 1;
  return options;
}

std::optional<MatMulOpType> str2MatMulOpType(const std::string& str) {
  static const std::unordered_map<std::string, MatMulOpType> map = {
      {"scalar", MatMulOpType::kScalar},
      {"partitioned", MatMulOpType::kPartitioned},
      {"vectorized", MatMulOpType::kVectorized},
      {"vectorized_partitioned", MatMulOpType::kVectorizedPartitioned}};

  auto it = map.find(str);
  if (it != map.end()) return it->second;
  return std::nullopt;
}

std::string MatMulOpType2Str(MatMulOpType type) {
  switch (type) {
    case MatMulOpType::kScalar: return "scalar";
    case MatMulOpType::kPartitioned: return "partitioned";
    case MatMulOpType::kVectorized: return "vectorized";
    case MatMulOpType::kVectorizedPartitioned: return "vectorized_partitioned";
  }
  return "unknown";
}

const std::vector<MatMulOpType>& allMatMulOpTypes() {
  static const std::vector<MatMulOpType> types = {MatMulOpType::kScalar, MatMulOpType::kPartitioned,
                                                  MatMulOpType::kVectorized, MatMulOpType::kVectorizedPartitioned};
  return types;
}

bool isPartitioned(MatMulOpType type) {
  return type == MatMulOpType::kPartitioned || type == MatMulOpType::kVectorizedPartitioned;
}

}  // namespace mmk
