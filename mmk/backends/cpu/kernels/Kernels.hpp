// Copyright (c) MMK Team.
// Licensed under the MIT License.

#pragma once

#include "mmk/backends/cpu/kernels/simd.hpp"           // IWYU pragma: export
#include "mmk/backends/cpu/kernels/matmul_scalar.hpp"  // IWYU pragma: export
#include "mmk/backends/cpu/kernels/matmul_vec8.hpp"    // IWYU pragma: export
