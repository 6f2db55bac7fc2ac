#pragma once

#if defined(__clang__) || defined(__GNUC__)
  #define MV3_RESTRICT __restrict__
  #define MV3_PRAGMA(x) _Pragma(#x)
  #define MV3_SIMD MV3_PRAGMA(omp simd)
#else
  #define MV3_RESTRICT
  #define MV3_PRAGMA(x)
  #define MV3_SIMD
#endif

// Below this many multiply-adds an OpenMP region costs more than it saves.
#ifndef MV3_PARALLEL_MIN_WORK
#define MV3_PARALLEL_MIN_WORK 32768
#endif
