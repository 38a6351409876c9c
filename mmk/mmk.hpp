// Copyright (c) MMK Team.
// Licensed under the MIT License.

#pragma once

#include <vector>  // IWYU pragma: export

#include "mmk/core/DataTypes.hpp"                 // IWYU pragma: export
#include "mmk/core/MatMulTypes.hpp"               // IWYU pragma: export
#include "mmk/core/Parallel.hpp"                  // IWYU pragma: export
#include "mmk/engine/ConfigFile.hpp"              // IWYU pragma: export
#include "mmk/engine/MatMulConfig.hpp"            // IWYU pragma: export
#include "mmk/nn/Functional.hpp"                  // IWYU pragma: export
#include "mmk/backends/cpu/kernels/Kernels.hpp"  // IWYU pragma: export
#include "mmk/utils/Common.hpp"                   // IWYU pragma: export
#include "mmk/utils/CPUArchHelper.hpp"            // IWYU pragma: export

namespace mmk {

// Logs host architecture, the compiled SIMD backend and the parallel runtime's thread limit.
void showRuntimeInfo();

}  // namespace mmk
