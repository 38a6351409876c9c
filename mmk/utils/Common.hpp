// Copyright (c) MMK Team.
// Licensed under the MIT License.

#pragma once

#include "mmk/utils/Log.hpp"  // IWYU pragma: export

#if defined(_MSC_VER)
#define MMK_FORCE_INLINE __forceinline
#elif defined(__GNUC__) || defined(__clang__)
#define MMK_FORCE_INLINE __attribute__((always_inline)) inline
#else
#define MMK_FORCE_INLINE inline
#endif

#define MMK_ENABLE_RT_ASSERT 1

namespace mmk {

enum class ExitCode : int32_t {  // NOLINT
  kSuccess = 0,
  kCoreError,
  kAssert,
  kIOError,
  kConfigError,
};

// mmk runtime assert
#if (MMK_ENABLE_RT_ASSERT)
#define MMK_RT_ASSERT(statement) \
  if (!(statement)) { MMK_ASSERT_EXIT(::mmk::ExitCode::kAssert, "{}", #statement); }

#define MMK_RT_ASSERT_EQ(statement1, statement2)                                                         \
  if ((statement1) != (statement2)) {                                                                    \
    MMK_ASSERT_EXIT(::mmk::ExitCode::kAssert, "{} != {} ({} vs {})", #statement1, #statement2, (statement1), \
                    (statement2));                                                                       \
  }
#else
#define MMK_RT_ASSERT(statement)

#define MMK_RT_ASSERT_EQ(statement1, statement2)
#endif

}  // namespace mmk
