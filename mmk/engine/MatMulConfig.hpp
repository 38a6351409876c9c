// Copyright (c) MMK Team.
// Licensed under the MIT License.
#pragma once

#include "mmk/core/MatMulTypes.hpp"
#include "mmk/engine/ConfigFile.hpp"

namespace mmk {

// Reads
//
// {
//   "matmul": { "variant": "vectorized", "thread_count": 4 },
//   "log_level": "warn"
// }
//
// Missing keys keep MatMulOptions::defaults(). "log_level" is applied to Logger::level() as a side effect.
// An unknown variant or log level, or a value of the wrong JSON type, exits with ExitCode::kConfigError.
MatMulOptions loadMatMulOptions(const ConfigFile& config);

// Inverse of loadMatMulOptions for the "matmul" section.
void storeMatMulOptions(ConfigFile& config, const MatMulOptions& options);

}  // namespace mmk
