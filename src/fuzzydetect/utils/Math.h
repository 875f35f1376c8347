/**
 * @file Math.h
 * @author FuzzyDetect developers
 * @date 19.10.26
 */

#pragma once

#include <algorithm>
#include <cmath>

namespace fuzzydetect::utils::Math {

/**
 * Compares two doubles with an absolute tolerance.
 * @param a
 * @param b
 * @param maxAbsoluteDifference
 * @return True if |a - b| <= maxAbsoluteDifference. Always false if a or b is NaN.
 */
inline bool isNearAbs(double a, double b, double maxAbsoluteDifference) {
  return std::abs(a - b) <= maxAbsoluteDifference;
}

/**
 * Compares two doubles with a tolerance relative to the larger magnitude.
 *
 * Below a magnitude of one the tolerance is treated as absolute, otherwise values around zero would never be near.
 *
 * @param a
 * @param b
 * @param maxRelativeDifference
 * @return
 */
inline bool isNear(double a, double b, double maxRelativeDifference = 1e-9) {
  const auto magnitude = std::max({std::abs(a), std::abs(b), 1.});
  return isNearAbs(a, b, maxRelativeDifference * magnitude);
}

/**
 * Checks value against the closed interval [min, max].
 * @param value
 * @param min
 * @param max
 * @return False for NaN.
 */
inline bool isInInterval(double value, double min, double max) { return value >= min and value <= max; }

}  // namespace fuzzydetect::utils::Math
