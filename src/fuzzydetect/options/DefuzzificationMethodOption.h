/**
 * @file DefuzzificationMethodOption.h
 * @author FuzzyDetect developers
 * @date 19.10.26
 */

#pragma once

#include <map>
#include <string>

#include "fuzzydetect/options/Option.h"

namespace fuzzydetect {

/**
 * How the aggregated output membership function is reduced to a crisp score.
 * Both operate on the sampled output domain.
 */
class DefuzzificationMethodOption : public Option<DefuzzificationMethodOption> {
 public:
  /**
   * Possible methods.
   */
  enum Value {
    /**
     * Membership weighted mean of the sample points.
     */
    CoG,
    /**
     * Mean of the sample points at which the membership is maximal.
     */
    MoM
  };

  /**
   * Constructor.
   */
  DefuzzificationMethodOption() = default;

  /**
   * Constructor from value.
   * @param option
   */
  constexpr DefuzzificationMethodOption(Value option) : _value(option) {}

  /**
   * Cast to value.
   * @return
   */
  constexpr operator Value() const { return _value; }

  /**
   * Names accepted on the command line and in yaml files.
   * @return map option -> name
   */
  static std::map<DefuzzificationMethodOption, std::string> getOptionNames() {
    return {
        {DefuzzificationMethodOption::CoG, "centerOfGravity"},
        {DefuzzificationMethodOption::MoM, "meanOfMaximum"},
    };
  };

 private:
  Value _value{Value(-1)};
};
}  // namespace fuzzydetect
