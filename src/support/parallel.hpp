// SPDX-License-Identifier: MIT
#pragma once

/**
 * @file parallel.hpp
 * @brief Parallelization macros for OpenMP or sequential execution
 *
 * Usage:
 *   BSM_PRAGMA_PARALLEL_FOR_DYNAMIC
 *   for (size_t i = 0; i < n; ++i) { ... }
 *
 * The build enables OpenMP when find_package(OpenMP) succeeds; without it
 * the macro expands to nothing and loops run sequentially.
 *
 * Dynamic scheduling: per-item cost varies (root finding with
 * data-dependent iteration counts), so chunks of 16 are handed out on demand.
 */

#if defined(_OPENMP)
    #define BSM_PRAGMA_PARALLEL_FOR_DYNAMIC _Pragma("omp parallel for schedule(dynamic, 16)")
#else
    #define BSM_PRAGMA_PARALLEL_FOR_DYNAMIC
#endif
