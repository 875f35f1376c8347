/**
 * @file FuzzySetFactory.h
 * @author FuzzyDetect developers
 * @date 19.10.26
 */

#pragma once

#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "FuzzySet.h"
#include "fuzzydetect/options/MembershipFunctionOption.h"

namespace fuzzydetect::fuzzy_logic {

/**
 * Builds FuzzySets from a shape and its parameters.
 *
 * Malformed parameters (wrong count, NaN, infinite, unsorted, non-positive sigma) are reported as InvalidShapeError.
 * If the error is not thrown a nullptr is returned.
 */
class FuzzySetFactory {
 public:
  FuzzySetFactory() = delete;

  /**
   * Shape given by name, e.g. "Triangle".
   * @param linguisticTerm
   * @param functionName Parsed with MembershipFunctionOption::parseOptionExact().
   * @param params
   * @return
   */
  static std::shared_ptr<const FuzzySet> makeFuzzySet(const std::string &linguisticTerm,
                                                      const std::string &functionName,
                                                      const std::vector<double> &params);

  /**
   * Dispatches to makeTriangle(), makeTrapezoid() or makeGaussian().
   * @param linguisticTerm
   * @param function
   * @param params 3, 4 or 2 values.
   * @return
   */
  static std::shared_ptr<const FuzzySet> makeFuzzySet(const std::string &linguisticTerm,
                                                      MembershipFunctionOption function,
                                                      const std::vector<double> &params);

  /**
   * Membership 0 outside (min, max), 1 at peak, linear in between.
   * min == peak or peak == max gives a left or right shoulder.
   * @param linguisticTerm
   * @param min
   * @param peak
   * @param max
   * @return
   */
  static std::shared_ptr<const FuzzySet> makeTriangle(const std::string &linguisticTerm, double min, double peak,
                                                      double max);

  /**
   * Membership 0 outside (min, max), 1 on [leftPeak, rightPeak], linear in between.
   * @param linguisticTerm
   * @param min
   * @param leftPeak
   * @param rightPeak
   * @param max
   * @return
   */
  static std::shared_ptr<const FuzzySet> makeTrapezoid(const std::string &linguisticTerm, double min,
                                                       double leftPeak, double rightPeak, double max);

  /**
   * Unnormalized gaussian bell, 1 at mean.
   * @param linguisticTerm
   * @param mean
   * @param sigma > 0
   * @return
   */
  static std::shared_ptr<const FuzzySet> makeGaussian(const std::string &linguisticTerm, double mean, double sigma);

 private:
  static std::function<double(double)> triangleFunction(double min, double peak, double max);

  static std::function<double(double)> trapezoidFunction(double min, double leftPeak, double rightPeak, double max);

  static std::function<double(double)> gaussianFunction(double mean, double sigma);

  /**
   * Raises an InvalidShapeError if the parameters contain NaN or infinity or are not sorted ascending.
   * @param linguisticTerm
   * @param function
   * @param params
   * @param checkOrder Whether the parameters have to be monotonically non-decreasing.
   * @return True if the parameters are valid.
   */
  static bool checkParameters(const std::string &linguisticTerm, MembershipFunctionOption function,
                              const std::vector<double> &params, bool checkOrder);

  /**
   * Reports an InvalidShapeError about the parameter count.
   * @param linguisticTerm
   * @param function
   * @param expected
   * @param actual
   */
  static void throwInvalidNumberOfArguments(const std::string &linguisticTerm, MembershipFunctionOption function,
                                            size_t expected, size_t actual);
};

}  // namespace fuzzydetect::fuzzy_logic
