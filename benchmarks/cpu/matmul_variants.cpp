// Copyright (c) MMK Team.
// Licensed under the MIT License.

#include <cstdlib>
#include <utility>
#include <vector>

#include <benchmark/benchmark.h>

#include "mmk/mmk.hpp"

namespace {

// a[i, j] = i + j, b[i, j] = i * j
std::pair<std::vector<float>, std::vector<float>> generateMatrices(size_t size) {
  std::vector<float> a(size * size);
  std::vector<float> b(size * size);
  for (size_t i = 0; i < size; ++i) {
    for (size_t j = 0; j < size; ++j) {
      a[i * size + j] = static_cast<float>(i + j);
      b[i * size + j] = static_cast<float>(i * j);
    }
  }
  return {std::move(a), std::move(b)};
}

// Set from MMK_BENCHMARK_CONFIG in main, read by the partitioned benchmarks.
mmk::MatMulOptions g_options = mmk::MatMulOptions::defaults();

void runVariant(benchmark::State& state, mmk::MatMulOpType type) {
  const auto size = static_cast<size_t>(state.range(0));
  auto [a, b] = generateMatrices(size);
  mmk::MatMulOptions options{.type = type, .thread_count = g_options.thread_count};

  for (auto _ : state) {
    auto c = mmk::nn::functional::matmul(a, b, size, size, size, options);
    benchmark::DoNotOptimize(c.data());
    benchmark::ClobberMemory();
  }
  state.SetLabel(mmk::isPartitioned(type) ? fmt::format("{} threads", options.thread_count) : "1 thread");
  state.SetItemsProcessed(state.iterations() * static_cast<int64_t>(size * size * size));
}

}  // namespace

static void matrix_multiply_scalar(benchmark::State& state) { runVariant(state, mmk::MatMulOpType::kScalar); }

static void matrix_multiply_partitioned(benchmark::State& state) { runVariant(state, mmk::MatMulOpType::kPartitioned); }

static void matrix_multiply_vectorized(benchmark::State& state) { runVariant(state, mmk::MatMulOpType::kVectorized); }

static void matrix_multiply_vectorized_partitioned(benchmark::State& state) {
  runVariant(state, mmk::MatMulOpType::kVectorizedPartitioned);
}

BENCHMARK(matrix_multiply_scalar)->Arg(256)->ArgName("size")->Unit(benchmark::kMillisecond);
BENCHMARK(matrix_multiply_partitioned)->Arg(256)->ArgName("size")->Unit(benchmark::kMillisecond);
BENCHMARK(matrix_multiply_vectorized)->Arg(256)->ArgName("size")->Unit(benchmark::kMillisecond);
BENCHMARK(matrix_multiply_vectorized_partitioned)->Arg(256)->ArgName("size")->Unit(benchmark::kMillisecond);

int main(int argc, char** argv) {
  if (const char* path = std::getenv("MMK_BENCHMARK_CONFIG")) {
    mmk::ConfigFile config(path);
    g_options = mmk::loadMatMulOptions(config);
  }
  mmk::showRuntimeInfo();
  MMK_INFO("partitioned variants use {} threads", g_options.thread_count);

  char arg0_default[] = "benchmark";
  char* args_default = reinterpret_cast<char*>(arg0_default);
  if (!argv) {
    argc = 1;
    argv = &args_default;
  }
  ::benchmark::Initialize(&argc, argv);
  if (::benchmark::ReportUnrecognizedArguments(argc, argv)) return 1;
  ::benchmark::RunSpecifiedBenchmarks();
  ::benchmark::Shutdown();
  return 0;
}
