/**
 * @file RuleBases.h
 * @author FuzzyDetect developers
 * @date 19.10.26
 *
 * The linguistic variables and rule bases of the anomaly detector.
 */

#pragma once

#include <memory>
#include <string>

#include "fuzzydetect/DetectorSettings.h"
#include "fuzzydetect/fuzzyLogic/FuzzyControlSystem.h"
#include "fuzzydetect/fuzzyLogic/LinguisticVariable.h"
#include "fuzzydetect/options/RuleBaseOption.h"

namespace fuzzydetect::rule_bases {

/**
 * Name of the normalized forecast error input (EP).
 */
inline const std::string forecastError{"forecast_error"};
/**
 * Name of the normalized variance change input (MV).
 */
inline const std::string varianceChange{"variance_change"};
/**
 * Name of the normalized correlation change input (MC).
 */
inline const std::string correlationChange{"correlation_change"};
/**
 * Name of the output variable.
 */
inline const std::string anomalyLevel{"anomaly_level"};

/**
 * Creates an indicator on [0, 1] with the terms low, medium and high.
 * @param name
 * @return
 */
std::shared_ptr<fuzzy_logic::LinguisticVariable> makeIndicatorVariable(const std::string &name);

/**
 * Creates the output variable on [0, 10] with the terms normal, slightly_anomalous, moderately_anomalous and
 * strongly_anomalous.
 * @return
 */
std::shared_ptr<fuzzy_logic::LinguisticVariable> makeAnomalyLevelVariable();

/**
 * Adds the nine rules where every antecedent constrains all three indicators.
 * @param fcs
 * @param ep
 * @param mv
 * @param mc
 * @param level
 */
void addCanonicalRules(fuzzy_logic::FuzzyControlSystem &fcs, const fuzzy_logic::LinguisticVariable &ep,
                       const fuzzy_logic::LinguisticVariable &mv, const fuzzy_logic::LinguisticVariable &mc,
                       const fuzzy_logic::LinguisticVariable &level);

/**
 * Adds the fourteen rules that mostly combine pairs of indicators.
 * @param fcs
 * @param ep
 * @param mv
 * @param mc
 * @param level
 */
void addPairwiseRules(fuzzy_logic::FuzzyControlSystem &fcs, const fuzzy_logic::LinguisticVariable &ep,
                      const fuzzy_logic::LinguisticVariable &mv, const fuzzy_logic::LinguisticVariable &mc,
                      const fuzzy_logic::LinguisticVariable &level);

/**
 * Builds the complete fuzzy control system of the anomaly detector.
 * @param settings
 * @return
 */
std::shared_ptr<const fuzzy_logic::FuzzyControlSystem> makeFuzzyControlSystem(const DetectorSettings &settings);

}  // namespace fuzzydetect::rule_bases
