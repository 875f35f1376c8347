/**
 * @file UncoveredInputPolicyOption.h
 * @author FuzzyDetect developers
 * @date 19.10.26
 */

#pragma once

#include <map>
#include <string>

#include "fuzzydetect/options/Option.h"

namespace fuzzydetect {

/**
 * Class representing what a fuzzy control system does for inputs where no rule fires.
 */
class UncoveredInputPolicyOption : public Option<UncoveredInputPolicyOption> {
 public:
  /**
   * Possible policies.
   */
  enum Value {
    /**
     * Return the midpoint of the output domain flagged as undetermined.
     */
    undetermined,
    /**
     * Fire the rule whose antecedent lies closest to the input.
     */
    nearestRule,
  };

  /**
   * Constructor.
   */
  UncoveredInputPolicyOption() = default;

  /**
   * Constructor from value.
   * @param option
   */
  constexpr UncoveredInputPolicyOption(Value option) : _value(option) {}

  /**
   * Cast to value.
   * @return
   */
  constexpr operator Value() const { return _value; }

  /**
   * Provides a way to iterate over the possible choices of UncoveredInputPolicyOption.
   * @return map option -> string representation
   */
  static std::map<UncoveredInputPolicyOption, std::string> getOptionNames() {
    return {
        {UncoveredInputPolicyOption::undetermined, "undetermined"},
        {UncoveredInputPolicyOption::nearestRule, "nearestRule"},
    };
  };

 private:
  Value _value{Value(-1)};
};
}  // namespace fuzzydetect
