// Copyright (c) MMK Team.
// Licensed under the MIT License.

#pragma once

#include <cstdint>

namespace mmk::cpu {

enum class CPUArch : int32_t {
  UNKNOWN_ARCH = 0,
  X86_ARCH = 1,
  X86_64_ARCH = 2,
  ARM_ARCH = 3,
  ARM64_ARCH = 4,
};

#if defined(__x86_64__) || defined(_M_X64) || defined(__amd64__)
constexpr CPUArch CURRENT_ARCH = CPUArch::X86_64_ARCH;
constexpr const char* CURRENT_ARCH_STRING = "x86_64";
#define MMK_HOST_ARCH_X86_64 1
#elif defined(__i386__) || defined(_M_IX86)
constexpr CPUArch CURRENT_ARCH = CPUArch::X86_ARCH;
constexpr const char* CURRENT_ARCH_STRING = "x86";
#define MMK_HOST_ARCH_X86 1
#elif defined(__aarch64__) || defined(_M_ARM64)
constexpr CPUArch CURRENT_ARCH = CPUArch::ARM64_ARCH;
constexpr const char* CURRENT_ARCH_STRING = "arm64";
#define MMK_HOST_ARCH_ARM64 1
#elif defined(__arm__) || defined(_M_ARM)
constexpr CPUArch CURRENT_ARCH = CPUArch::ARM_ARCH;
constexpr const char* CURRENT_ARCH_STRING = "arm";
#define MMK_HOST_ARCH_ARM 1
#else
constexpr CPUArch CURRENT_ARCH = CPUArch::UNKNOWN_ARCH;
constexpr const char* CURRENT_ARCH_STRING = "unknown";
#define MMK_HOST_ARCH_UNKNOWN 1
#endif

#if defined(MMK_HOST_ARCH_X86_64) || defined(MMK_HOST_ARCH_X86)
#if defined(__AVX__)
#define MMK_HOST_FEATURE_AVX 1
#endif

#if defined(__AVX2__)
#define MMK_HOST_FEATURE_AVX2 1
#endif

#if defined(__FMA__)
#define MMK_HOST_FEATURE_FMA 1
#endif
#endif  // x86 architectures

#ifdef MMK_HOST_FEATURE_AVX
constexpr bool hasAVX() { return true; }
#else
constexpr bool hasAVX() { return false; }
#endif

#ifdef MMK_HOST_FEATURE_AVX2
constexpr bool hasAVX2() { return true; }
#else
constexpr bool hasAVX2() { return false; }
#endif

#ifdef MMK_HOST_FEATURE_FMA
constexpr bool hasFMA() { return true; }
#else
constexpr bool hasFMA() { return false; }
#endif

}  // namespace mmk::cpu
