// Copyright (c) MMK Team.
// Licensed under the MIT License.

#include "mmk/mmk.hpp"

namespace mmk {

void showRuntimeInfo() {
  MMK_INFO("arch: {}, simd: {}", cpu::CURRENT_ARCH_STRING, cpu::simdBackendName());
  MMK_INFO("host features: avx {}, avx2 {}, fma {}", cpu::hasAVX(), cpu::hasAVX2(), cpu::hasFMA());
#if defined(MMK_KERNEL_USE_THREADS) && defined(MMK_KERNEL_THREADS_VENDOR_OPENMP)
  MMK_INFO("threads: openmp, max {}", MMK_MAX_NUM_THREADS());
#else
  MMK_INFO("threads: disabled, partitioned variants run on the calling thread");
#endif
}

}  // namespace mmk
