/**
 * @file WrapOpenMP.h
 * @author FuzzyDetect developers
 * @date 19.10.26
 *
 * @details
 * Thread control for the parallel batch evaluation. Without FUZZYDETECT_OPENMP everything runs on one thread and the
 * functions below become no-ops, so callers need no ifdef-s.
 */

#pragma once

#if defined(FUZZYDETECT_OPENMP)
#include <omp.h>
#endif

namespace fuzzydetect {

#if defined(FUZZYDETECT_OPENMP)

/**
 * Upper bound of threads a batch evaluation will use.
 * @return omp_get_max_threads()
 */
inline int fuzzydetect_get_max_threads() { return omp_get_max_threads(); }

/**
 * Sets the number of threads for subsequent batch evaluations.
 * @param numThreads
 */
inline void fuzzydetect_set_num_threads(int numThreads) { omp_set_num_threads(numThreads); }

#else

/**
 * Serial build.
 * @return 1
 */
inline int fuzzydetect_get_max_threads() { return 1; }

/**
 * Serial build, ignored.
 */
inline void fuzzydetect_set_num_threads(int /*numThreads*/) {}

#endif

}  // namespace fuzzydetect
