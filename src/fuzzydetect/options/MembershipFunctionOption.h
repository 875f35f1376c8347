/**
 * @file MembershipFunctionOption.h
 * @author FuzzyDetect developers
 * @date 19.10.26
 */

#pragma once

#include <map>
#include <string>

#include "fuzzydetect/options/Option.h"

namespace fuzzydetect {

/**
 * Shape of the membership function of a linguistic term. FuzzySetFactory::makeFuzzySet() expects
 * three, four or two parameters respectively.
 */
class MembershipFunctionOption : public Option<MembershipFunctionOption> {
 public:
  /**
   * Possible shapes.
   */
  enum Value {
    /**
     * Rises linearly from a to 1 at b, falls linearly to c. a == b or b == c gives a shoulder.
     */
    Triangle,
    /**
     * Rises from a to the plateau [b, c], falls to d.
     */
    Trapezoid,
    /**
     * exp(-(x - mean)^2 / (2 sigma^2)).
     */
    Gaussian
  };

  /**
   * Constructor.
   */
  MembershipFunctionOption() = default;

  /**
   * Constructor from value.
   * @param option
   */
  constexpr MembershipFunctionOption(Value option) : _value(option) {}

  /**
   * Cast to value.
   * @return
   */
  constexpr operator Value() const { return _value; }

  /**
   * Names used in string representations of fuzzy sets.
   * @return map option -> name
   */
  static std::map<MembershipFunctionOption, std::string> getOptionNames() {
    return {
        {MembershipFunctionOption::Triangle, "Triangle"},
        {MembershipFunctionOption::Trapezoid, "Trapezoid"},
        {MembershipFunctionOption::Gaussian, "Gaussian"},
    };
  };

 private:
  Value _value{Value(-1)};
};
}  // namespace fuzzydetect
