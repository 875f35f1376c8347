/**
 * @file DetectorSettings.h
 * @author FuzzyDetect developers
 * @date 19.10.26
 */

#pragma once

#include <memory>
#include <string>

#include "fuzzydetect/fuzzyLogic/FuzzyControlSystem.h"
#include "fuzzydetect/options/DefuzzificationMethodOption.h"
#include "fuzzydetect/options/RuleBaseOption.h"
#include "fuzzydetect/options/UncoveredInputPolicyOption.h"

namespace fuzzydetect {

/**
 * Construction time configuration of an AnomalyDetector.
 */
struct DetectorSettings {
  /**
   * Which built-in rule base to load.
   */
  RuleBaseOption ruleBase{RuleBaseOption::canonical};

  /**
   * How the aggregated output set is turned into a score.
   */
  DefuzzificationMethodOption defuzzificationMethod{DefuzzificationMethodOption::CoG};

  /**
   * Number of evenly spaced points of [0, 10] used for defuzzification.
   */
  size_t numSamples{1001};

  /**
   * What happens for inputs where no rule fires.
   */
  UncoveredInputPolicyOption uncoveredInputPolicy{UncoveredInputPolicyOption::undetermined};

  /**
   * Converts the settings to the string map consumed by the FuzzyControlSystem.
   * @return
   */
  [[nodiscard]] std::shared_ptr<fuzzy_logic::FuzzyControlSettings> toFuzzyControlSettings() const {
    return std::make_shared<fuzzy_logic::FuzzyControlSettings>(fuzzy_logic::FuzzyControlSettings{
        {"defuzzificationMethod", defuzzificationMethod.to_string()},
        {"numSamples", std::to_string(numSamples)},
        {"uncoveredInputPolicy", uncoveredInputPolicy.to_string()},
    });
  }
};

}  // namespace fuzzydetect
