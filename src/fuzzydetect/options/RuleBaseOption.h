/**
 * @file RuleBaseOption.h
 * @author FuzzyDetect developers
 * @date 19.10.26
 */

#pragma once

#include <map>
#include <string>

#include "fuzzydetect/options/Option.h"

namespace fuzzydetect {

/**
 * Class representing the built-in rule bases of the anomaly detector.
 */
class RuleBaseOption : public Option<RuleBaseOption> {
 public:
  /**
   * Possible rule bases.
   */
  enum Value {
    /**
     * Nine rules, each constraining all three indicators.
     */
    canonical,
    /**
     * Fourteen rules, most of them constraining only a pair of indicators.
     */
    pairwise,
  };

  /**
   * Constructor.
   */
  RuleBaseOption() = default;

  /**
   * Constructor from value.
   * @param option
   */
  constexpr RuleBaseOption(Value option) : _value(option) {}

  /**
   * Cast to value.
   * @return
   */
  constexpr operator Value() const { return _value; }

  /**
   * Provides a way to iterate over the possible choices of RuleBaseOption.
   * @return map option -> string representation
   */
  static std::map<RuleBaseOption, std::string> getOptionNames() {
    return {
        {RuleBaseOption::canonical, "canonical"},
        {RuleBaseOption::pairwise, "pairwise"},
    };
  };

 private:
  Value _value{Value(-1)};
};
}  // namespace fuzzydetect
