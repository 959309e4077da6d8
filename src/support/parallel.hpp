// SPDX-License-Identifier: MIT
#pragma once

/**
 * @file parallel.hpp
 * @brief Parallelization macros for OpenMP or sequential execution
 *
 * Usage:
 *   PAYPLAN_PRAGMA_PARALLEL_FOR_DYNAMIC
 *   for (size_t i = 0; i < n; ++i) { ... }
 *
 * Without OpenMP every macro expands to nothing and loops run sequentially.
 */

#if defined(_OPENMP)
    #define PAYPLAN_PRAGMA_PARALLEL_FOR_DYNAMIC         _Pragma("omp parallel for schedule(dynamic, 1)")
    #define PAYPLAN_PRAGMA_ATOMIC                       _Pragma("omp atomic")
#else
    #define PAYPLAN_PRAGMA_PARALLEL_FOR_DYNAMIC
    #define PAYPLAN_PRAGMA_ATOMIC
#endif

/**
 * Available macros:
 * - PAYPLAN_PRAGMA_PARALLEL_FOR_DYNAMIC: Parallelize single loop, one item per chunk
 *   (work items with very different cost, e.g. plans of different length)
 * - PAYPLAN_PRAGMA_ATOMIC: Atomic update of a shared counter
 */
