// Copyright (c) MMK Team.
// Licensed under the MIT License.

#include <cmath>
#include <csignal>
#include <limits>
#include <tuple>
#include <vector>

#include <gtest/gtest.h>

#include "mmk/mmk.hpp"

/// Kernel tests
#include "MatMulKernelTest.hpp"

using mmk::MatMulOpType;

//===----------------------------------------------------------------------===//
// Fixed cases.
//===----------------------------------------------------------------------===//
TEST_F(MatMulKernelTest, TwoByThreeTimesThreeByTwo) {
  const std::vector<float> a = {1, 2, 3, 4, 5, 6};
  const std::vector<float> b = {7, 8, 9, 10, 11, 12};
  const std::vector<float> expected = {58, 64, 139, 154};

  EXPECT_EQ(mmk::nn::functional::matmul_scalar(a, b, 2, 3, 2), expected);
  EXPECT_EQ(mmk::nn::functional::matmul_partitioned(a, b, 2, 3, 2, 4), expected);
  EXPECT_EQ(mmk::nn::functional::matmul_vectorized(a, b, 2, 3, 2), expected);
  EXPECT_EQ(mmk::nn::functional::matmul_vectorized_partitioned(a, b, 2, 3, 2, 4), expected);
}

TEST_F(MatMulKernelTest, IdentityKeepsMatrix) {
  const size_t n = 11;
  std::vector<float> eye(n * n, 0.f);
  for (size_t i = 0; i < n; ++i) { eye[i * n + i] = 1.f; }
  auto x = mmk::test::random(n * n, -3.f, 3.f, 3);

  for (auto type : mmk::allMatMulOpTypes()) {
    EXPECT_EQ(run(type, x, eye, n, n, n, 3), x) << mmk::MatMulOpType2Str(type);
    EXPECT_EQ(run(type, eye, x, n, n, n, 3), x) << mmk::MatMulOpType2Str(type);
  }
}

TEST_F(MatMulKernelTest, ResultLengthIsMTimesP) {
  const std::vector<std::tuple<size_t, size_t, size_t>> shapes = {{1, 1, 1}, {3, 5, 7}, {9, 2, 16}, {4, 17, 33}};
  for (auto type : mmk::allMatMulOpTypes()) {
    for (const auto& [m, n, p] : shapes) {
      auto a = mmk::test::random(m * n, -1.f, 1.f, 1);
      auto b = mmk::test::random(n * p, -1.f, 1.f, 2);
      EXPECT_EQ(run(type, a, b, m, n, p, 2).size(), m * p) << mmk::MatMulOpType2Str(type);
    }
  }
}

//===----------------------------------------------------------------------===//
// Degenerate shapes.
//===----------------------------------------------------------------------===//
TEST_F(MatMulKernelTest, ZeroRowsOrColumnsGiveEmptyResult) {
  for (auto type : mmk::allMatMulOpTypes()) {
    // m = 0
    EXPECT_TRUE(run(type, {}, {1, 2, 3, 4, 5, 6}, 0, 3, 2, 4).empty()) << mmk::MatMulOpType2Str(type);
    // p = 0
    EXPECT_TRUE(run(type, {1, 2, 3, 4, 5, 6}, {}, 2, 3, 0, 4).empty()) << mmk::MatMulOpType2Str(type);
    // everything 0
    EXPECT_TRUE(run(type, {}, {}, 0, 0, 0, 4).empty()) << mmk::MatMulOpType2Str(type);
  }
}

TEST_F(MatMulKernelTest, ZeroSharedDimensionGivesZeros) {
  for (auto type : mmk::allMatMulOpTypes()) {
    auto c = run(type, {}, {}, 3, 0, 10, 4);
    EXPECT_EQ(c, std::vector<float>(30, 0.f)) << mmk::MatMulOpType2Str(type);
  }
}

//===----------------------------------------------------------------------===//
// Remainder lanes. P % 8 != 0.
//===----------------------------------------------------------------------===//
TEST_F(MatMulKernelTest, RemainderColumnsMatchScalar) {
  EXPECT_EQ(matmulIntegerExact(
                {
                    {{"M", 2}, {"N", 3}, {"P", 10}},
                    {{"M", 1}, {"N", 1}, {"P", 1}},
                    {{"M", 5}, {"N", 7}, {"P", 3}},
                    {{"M", 4}, {"N", 9}, {"P", 7}},
                    {{"M", 3}, {"N", 4}, {"P", 9}},
                    {{"M", 6}, {"N", 5}, {"P", 15}},
                    {{"M", 8}, {"N", 8}, {"P", 17}},
                    {{"M", 13}, {"N", 31}, {"P", 63}},
                },
                4),
            true);
}

TEST_F(MatMulKernelTest, FullLaneColumnsMatchScalar) {
  EXPECT_EQ(matmulIntegerExact(
                {
                    {{"M", 1}, {"N", 1}, {"P", 8}},
                    {{"M", 8}, {"N", 8}, {"P", 8}},
                    {{"M", 16}, {"N", 12}, {"P", 32}},
                    {{"M", 64}, {"N", 64}, {"P", 64}},
                },
                4),
            true);
}

TEST_F(MatMulKernelTest, KernelsStayInBounds) {
  EXPECT_EQ(kernelsStayInBounds(
                {
                    {{"M", 1}, {"N", 1}, {"P", 1}},
                    {{"M", 2}, {"N", 3}, {"P", 10}},
                    {{"M", 3}, {"N", 5}, {"P", 7}},
                    {{"M", 7}, {"N", 2}, {"P", 8}},
                    {{"M", 5}, {"N", 6}, {"P", 23}},
                    {{"M", 0}, {"N", 4}, {"P", 5}},
                    {{"M", 4}, {"N", 4}, {"P", 0}},
                },
                3),
            true);
}

//===----------------------------------------------------------------------===//
// Floating point inputs.
//===----------------------------------------------------------------------===//
TEST_F(MatMulKernelTest, RandomFloatsCloseToReference) {
  EXPECT_EQ(matmulRandomClose(
                {
                    {{"M", 1}, {"N", 1}, {"P", 1}},
                    {{"M", 5}, {"N", 5}, {"P", 5}},
                    {{"M", 16}, {"N", 16}, {"P", 16}},
                    {{"M", 16}, {"N", 18}, {"P", 20}},
                    {{"M", 33}, {"N", 65}, {"P", 17}},
                    {{"M", 128}, {"N", 128}, {"P", 128}},
                },
                4),
            true);
}

TEST_F(MatMulKernelTest, RandomFloatsBitIdenticalAcrossVariants) {
  EXPECT_EQ(matmulBitIdenticalToScalar(
                {
                    {{"M", 3}, {"N", 7}, {"P", 10}},
                    {{"M", 17}, {"N", 29}, {"P", 41}},
                    {{"M", 64}, {"N", 100}, {"P", 72}},
                },
                4),
            true);
}

TEST_F(MatMulKernelTest, NonFiniteValuesPropagate) {
  const float inf = std::numeric_limits<float>::infinity();
  const float nan = std::numeric_limits<float>::quiet_NaN();
  const std::vector<float> a = {1.f, inf, 0.f, 1.f};
  const std::vector<float> b = {1.f, 2.f, 3.f, 4.f, 5.f, 6.f, 7.f, 8.f, 9.f, nan};  // 2 x 5

  for (auto type : mmk::allMatMulOpTypes()) {
    auto c = run(type, a, b, 2, 2, 5, 2);
    ASSERT_EQ(c.size(), 10u);
    for (size_t j = 0; j < 4; ++j) { EXPECT_TRUE(std::isinf(c[j])) << mmk::MatMulOpType2Str(type); }
    EXPECT_TRUE(std::isnan(c[4])) << mmk::MatMulOpType2Str(type);
    EXPECT_EQ(c[5], 6.f) << mmk::MatMulOpType2Str(type);
    EXPECT_TRUE(std::isnan(c[9])) << mmk::MatMulOpType2Str(type);
  }
}

//===----------------------------------------------------------------------===//
// Partitioning.
//===----------------------------------------------------------------------===//
TEST_F(MatMulKernelTest, PartitionedIndependentOfThreadCount) {
  EXPECT_EQ(partitionedIndependentOfThreads(
                {
                    {{"M", 1}, {"N", 5}, {"P", 9}},
                    {{"M", 7}, {"N", 13}, {"P", 10}},
                    {{"M", 50}, {"N", 40}, {"P", 30}},
                    {{"M", 97}, {"N", 31}, {"P", 67}},
                },
                {0, -3, 2, 3, 4, 8, 16, 64}),
            true);
}

TEST_F(MatMulKernelTest, SingleThreadedExactOnIntegers) {
  EXPECT_EQ(matmulIntegerExact(
                {
                    {{"M", 2}, {"N", 3}, {"P", 10}},
                    {{"M", 31}, {"N", 17}, {"P", 19}},
                },
                1),
            true);
}

TEST_F(MatMulKernelTest, RepeatedCallsAreIdempotent) {
  auto a = mmk::test::random(9 * 14, -2.f, 2.f, 11);
  auto b = mmk::test::random(14 * 21, -2.f, 2.f, 12);
  const auto a_copy = a;
  const auto b_copy = b;

  for (auto type : mmk::allMatMulOpTypes()) {
    auto first = run(type, a, b, 9, 14, 21, 4);
    auto second = run(type, a, b, 9, 14, 21, 4);
    EXPECT_EQ(first, second) << mmk::MatMulOpType2Str(type);
  }
  EXPECT_EQ(a, a_copy);
  EXPECT_EQ(b, b_copy);
}

TEST_F(MatMulKernelTest, DispatchMatchesNamedFunctions) {
  auto a = mmk::test::random(6 * 5, -1.f, 1.f, 21);
  auto b = mmk::test::random(5 * 12, -1.f, 1.f, 22);

  EXPECT_EQ(run(MatMulOpType::kScalar, a, b, 6, 5, 12, 4), mmk::nn::functional::matmul_scalar(a, b, 6, 5, 12));
  EXPECT_EQ(run(MatMulOpType::kPartitioned, a, b, 6, 5, 12, 4),
            mmk::nn::functional::matmul_partitioned(a, b, 6, 5, 12, 4));
  EXPECT_EQ(run(MatMulOpType::kVectorized, a, b, 6, 5, 12, 4), mmk::nn::functional::matmul_vectorized(a, b, 6, 5, 12));
  EXPECT_EQ(run(MatMulOpType::kVectorizedPartitioned, a, b, 6, 5, 12, 4),
            mmk::nn::functional::matmul_vectorized_partitioned(a, b, 6, 5, 12, 4));
  EXPECT_EQ(mmk::nn::functional::matmul(a, b, 6, 5, 12), mmk::nn::functional::matmul_scalar(a, b, 6, 5, 12));
}

//===----------------------------------------------------------------------===//
// Contract violations trap.
//===----------------------------------------------------------------------===//
TEST_F(MatMulKernelTest, MismatchedBufferLengthsAbort) {
  ::testing::FLAGS_gtest_death_test_style = "threadsafe";
  const std::vector<float> a = {1, 2, 3, 4, 5};
  const std::vector<float> b = {7, 8, 9, 10, 11, 12};

  EXPECT_DEATH(mmk::nn::functional::matmul_scalar(a, b, 2, 3, 2), "");
  EXPECT_DEATH(mmk::nn::functional::matmul_partitioned(b, a, 2, 3, 2, 2), "");
  EXPECT_DEATH(mmk::nn::functional::matmul_vectorized(a, b, 2, 3, 2), "");
  EXPECT_DEATH(mmk::nn::functional::matmul_vectorized_partitioned(b, a, 2, 3, 2, 2), "");
}

TEST_F(MatMulKernelTest, OverflowingDimensionsAbort) {
  ::testing::FLAGS_gtest_death_test_style = "threadsafe";
  const size_t huge = size_t{1} << (sizeof(size_t) * 4);
  const std::vector<float> empty;
  const auto aborted = ::testing::KilledBySignal(SIGABRT);

  // huge * huge wraps to 0 and would otherwise match the empty buffers.
  EXPECT_EXIT(mmk::nn::functional::matmul_scalar(empty, empty, huge, huge, 0), aborted, "");
  EXPECT_EXIT(mmk::nn::functional::matmul_partitioned(empty, empty, 0, huge, huge, 2), aborted, "");
  EXPECT_EXIT(mmk::nn::functional::matmul_vectorized(empty, empty, huge, huge, 0), aborted, "");
  EXPECT_EXIT(mmk::nn::functional::matmul_vectorized_partitioned(empty, empty, 0, huge, huge, 2), aborted, "");

  // Both inputs are consistent, but the m x p result does not fit.
  EXPECT_EXIT(mmk::nn::functional::matmul_vectorized(empty, empty, huge, 0, huge), aborted, "");
}

//===----------------------------------------------------------------------===//
// f32x8.
//===----------------------------------------------------------------------===//
namespace hn = mmk::cpu::hn;

TEST_F(KernelTest, F32x8CoversChunk) {
  const mmk::cpu::F32x8Tag d;
  const size_t lanes = hn::Lanes(d);
  EXPECT_GE(lanes, 1u);
  EXPECT_LE(lanes, mmk::cpu::kF32ChunkSize);
  EXPECT_EQ(mmk::cpu::kF32ChunkSize % lanes, 0u);
}

TEST_F(KernelTest, F32x8PartialLoadZeroFillsTail) {
  const mmk::cpu::F32x8Tag d;
  const size_t lanes = hn::Lanes(d);
  const float nan = std::numeric_limits<float>::quiet_NaN();
  const float src[8] = {1.f, 2.f, 3.f, nan, nan, nan, nan, nan};

  for (size_t count = 0; count <= 3 && count <= lanes; ++count) {
    float out[8];
    hn::StoreU(hn::LoadN(d, src, count), d, out);
    for (size_t i = 0; i < lanes; ++i) {
      if (i < count) {
        EXPECT_EQ(out[i], src[i]);
      } else {
        EXPECT_EQ(out[i], 0.f) << "lane " << i << " count " << count;
      }
    }
  }
}

TEST_F(KernelTest, F32x8PartialStoreWritesOnlyCount) {
  const mmk::cpu::F32x8Tag d;
  const size_t lanes = hn::Lanes(d);
  for (size_t count = 0; count <= lanes; ++count) {
    float dst[10];
    for (auto& v : dst) { v = -1.f; }
    hn::StoreN(hn::Set(d, 5.f), d, dst, count);
    for (size_t i = 0; i < 10; ++i) { EXPECT_EQ(dst[i], i < count ? 5.f : -1.f) << "lane " << i << " count " << count; }
  }
}

TEST_F(KernelTest, F32x8MulAdd) {
  const mmk::cpu::F32x8Tag d;
  const size_t lanes = hn::Lanes(d);
  float a[8], b[8], c[8], out[8];
  for (int i = 0; i < 8; ++i) {
    a[i] = static_cast<float>(i);
    b[i] = static_cast<float>(i + 1);
    c[i] = 0.5f;
  }
  for (size_t base = 0; base < 8; base += lanes) {
    hn::StoreU(hn::Add(hn::LoadU(d, c + base), hn::Mul(hn::LoadU(d, a + base), hn::LoadU(d, b + base))), d,
               out + base);
  }
  for (int i = 0; i < 8; ++i) { EXPECT_EQ(out[i], static_cast<float>(i * (i + 1)) + 0.5f); }

  for (size_t base = 0; base < 8; base += lanes) { hn::StoreU(hn::Zero(d), d, out + base); }
  for (float v : out) { EXPECT_EQ(v, 0.f); }
}
