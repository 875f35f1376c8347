/**
 * @file FuzzySet.h
 * @author FuzzyDetect developers
 * @date 19.10.26
 */

#pragma once

#include <functional>
#include <string>
#include <tuple>
#include <vector>

#include "fuzzydetect/options/MembershipFunctionOption.h"

namespace fuzzydetect::fuzzy_logic {

/**
 * A linguistic term (e.g. "low") together with its membership function over one crisp dimension.
 * Immutable. Create it through FuzzySetFactory, which checks the shape parameters.
 */
class FuzzySet {
 public:
  /**
   * Shape, shape parameters and the evaluating function m = f(x).
   */
  using BaseMembershipFunction = std::tuple<MembershipFunctionOption, std::vector<double>, std::function<double(double)>>;

  /**
   * Constructor.
   * @param linguisticTerm
   * @param baseMembershipFunction
   */
  FuzzySet(std::string linguisticTerm, BaseMembershipFunction &&baseMembershipFunction);

  /**
   * Degree to which value belongs to this set.
   * @param value
   * @return In [0, 1]. 0 for NaN.
   */
  [[nodiscard]] double evaluate_membership(double value) const;

  /**
   * Returns the center of the region where the membership function reaches its maximum.
   * This is the peak of a triangle, the middle of the plateau of a trapezoid and the mean of a gaussian.
   * @return
   */
  [[nodiscard]] double getCore() const;

  /**
   * @return
   */
  [[nodiscard]] MembershipFunctionOption getShape() const;

  /**
   * @return Parameters in the order the factory took them.
   */
  [[nodiscard]] const std::vector<double> &getParameters() const;

  /**
   * @return E.g. "low": Triangle(0, 0, 3)
   */
  [[nodiscard]] std::string printBaseMembershipFunction() const;

  /**
   * @return
   */
  [[nodiscard]] const std::string &getLinguisticTerm() const;

 private:
  const std::string _linguisticTerm;

  const BaseMembershipFunction _membershipFunction;
};

}  // namespace fuzzydetect::fuzzy_logic
