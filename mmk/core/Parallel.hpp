// Copyright (c) MMK Team.
// Licensed under the MIT License.
#pragma once

#ifdef MMK_KERNEL_USE_THREADS
//===----------------------------------------------------------------------===//
// OpenMP.
//
// The OpenMP runtime owns the worker threads. A parallel region forks onto
// them and joins before the loop statement completes.
//===----------------------------------------------------------------------===//
#if defined(MMK_KERNEL_THREADS_VENDOR_OPENMP)
#include <omp.h>

#define MMK_OMP_PRAGMA(x) _Pragma(#x)

#define MMK_AUTO_PARALLEL_FOR_BEGIN_NT(__iter__, __start__, __end__, __step__, __num_threads__) \
  MMK_OMP_PRAGMA(omp parallel for schedule(dynamic) num_threads(__num_threads__))               \
  for (long long __iter__ = (__start__); __iter__ < (__end__); __iter__ += (__step__)) {
#define MMK_AUTO_PARALLEL_FOR_END_NT() }

#define MMK_MAX_NUM_THREADS() omp_get_max_threads()

#endif  // defined(MMK_KERNEL_THREADS_VENDOR_OPENMP)
#endif  // MMK_KERNEL_USE_THREADS

#ifndef MMK_AUTO_PARALLEL_FOR_BEGIN_NT

#define MMK_AUTO_PARALLEL_FOR_BEGIN_NT(__iter__, __start__, __end__, __step__, __num_threads__) \
  for (long long __iter__ = (__start__); __iter__ < (__end__); __iter__ += (__step__)) {
#define MMK_AUTO_PARALLEL_FOR_END_NT() }

#define MMK_MAX_NUM_THREADS() 1

#endif  // MMK_AUTO_PARALLEL_FOR_BEGIN_NT

#define MMK_SERIAL_FOR_BEGIN(__iter__, __start__, __end__, __step__) \
  for (long long __iter__ = (__start__); __iter__ < (__end__); __iter__ += (__step__)) {
#define MMK_SERIAL_FOR_END() }

#define MMK_CONDITIONAL_PARALLEL_FOR(condition, num_threads, iter, start, end, step, ...)                            \
  do {                                                                                                              \
    if (condition) {                                                                                                \
      MMK_AUTO_PARALLEL_FOR_BEGIN_NT(iter, start, end, step, num_threads){__VA_ARGS__} MMK_AUTO_PARALLEL_FOR_END_NT() \
    } else {                                                                                                        \
      MMK_SERIAL_FOR_BEGIN(iter, start, end, step){__VA_ARGS__} MMK_SERIAL_FOR_END()                                \
    }                                                                                                               \
  } while (0)
