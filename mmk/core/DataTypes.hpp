// Copyright (c) MMK Team.
// Licensed under the MIT License.

#pragma once

namespace mmk {

//===----------------------------------------------------------------------===//
// C & C++ Compiler Builtin Types Define
//===----------------------------------------------------------------------===//
using mmk_fp32_t = float;

}  // namespace mmk
