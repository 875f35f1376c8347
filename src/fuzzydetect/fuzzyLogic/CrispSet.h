/**
 * @file CrispSet.h
 * @author FuzzyDetect developers
 * @date 19.10.26
 */

#pragma once

#include <Eigen/Core>
#include <string>
#include <utility>

namespace fuzzydetect::fuzzy_logic {

/**
 * Used to represent the one-dimensional Crisp-Set on which the Fuzzy-Sets of a linguistic variable are defined.
 * A Crisp-Set is a named, closed interval [min, max] of possible values.
 */
class CrispSet {
 public:
  /**
   * Constructs a CrispSet.
   * @param name The name of the dimension.
   * @param range The interval of possible values for this dimension. min has to be strictly smaller than max.
   */
  CrispSet(std::string name, const std::pair<double, double> &range);

  /**
   * Checks whether the value lies inside the closed interval of this CrispSet.
   * @param value
   * @return False for values outside the interval and for NaN.
   */
  [[nodiscard]] bool contains(double value) const;

  /**
   * Discretizes the interval into evenly spaced sample points. Both borders are part of the samples.
   * @param numSamples Number of sample points. Has to be at least 2.
   * @return The sample points in ascending order.
   */
  [[nodiscard]] Eigen::ArrayXd sample(size_t numSamples) const;

  /**
   * Returns the center of the interval.
   * @return (min + max) / 2
   */
  [[nodiscard]] double getMidpoint() const;

  /**
   * Returns the name of the dimension.
   * @return
   */
  [[nodiscard]] const std::string &getName() const;

  /**
   * Returns the interval of the CrispSet.
   * @return [min, max]
   */
  [[nodiscard]] const std::pair<double, double> &getRange() const;

  /**
   * Returns a string representation of the CrispSet.
   */
  explicit operator std::string() const;

 private:
  std::string _name;

  /**
   * The interval of possible values in the form [min, max].
   */
  std::pair<double, double> _range;
};

}  // namespace fuzzydetect::fuzzy_logic
