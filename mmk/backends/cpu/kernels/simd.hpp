// Copyright (c) MMK Team.
// Licensed under the MIT License.

#pragma once

#include <hwy/highway.h>

#include "mmk/core/DataTypes.hpp"

namespace mmk::cpu {
namespace hn = hwy::HWY_NAMESPACE;

// Kernels walk columns in chunks of 8 fp32 values.
inline constexpr size_t kF32ChunkSize = 8;

// One 8 lane vector on 256-bit targets. 128-bit targets get 4 lanes and cover a chunk with two vectors.
using F32x8Tag = hn::CappedTag<mmk_fp32_t, kF32ChunkSize>;
using f32x8 = hn::Vec<F32x8Tag>;

// Highway target the kernels were compiled for, e.g. "AVX2".
inline const char* simdBackendName() { return hwy::TargetName(HWY_TARGET); }

}  // namespace mmk::cpu
