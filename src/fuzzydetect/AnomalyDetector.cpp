/**
 * @file AnomalyDetector.cpp
 * @author FuzzyDetect developers
 * @date 19.10.26
 */

#include "AnomalyDetector.h"

#include <algorithm>

#include "fuzzydetect/RuleBases.h"
#include "fuzzydetect/utils/ExceptionHandler.h"
#include "fuzzydetect/utils/WrapOpenMP.h"
#include "fuzzydetect/utils/logging/Logger.h"

namespace fuzzydetect {

namespace {
/**
 * Number of indicators a window is described by.
 */
constexpr size_t numIndicators = 3;
}  // namespace

AnomalyDetector::AnomalyDetector(const DetectorSettings &settings) {
  Logger::createIfMissing();

  FuzzyDetectLog(INFO, "Rule base                : {}", settings.ruleBase.to_string());
  FuzzyDetectLog(INFO, "Defuzzification method   : {}", settings.defuzzificationMethod.to_string());
  FuzzyDetectLog(INFO, "Number of samples        : {}", settings.numSamples);
  FuzzyDetectLog(INFO, "Uncovered input policy   : {}", settings.uncoveredInputPolicy.to_string());

  _fuzzyControlSystem = rule_bases::makeFuzzyControlSystem(settings);

  FuzzyDetectLog(DEBUG, "{}", std::string(*_fuzzyControlSystem));
}

AnomalyDetector::AnomalyDetector(std::shared_ptr<const fuzzy_logic::FuzzyControlSystem> fuzzyControlSystem)
    : _fuzzyControlSystem(std::move(fuzzyControlSystem)) {
  Logger::createIfMissing();

  if (not _fuzzyControlSystem) {
    utils::ExceptionHandler::exception("AnomalyDetector: no fuzzy control system given.");
    _fuzzyControlSystem = rule_bases::makeFuzzyControlSystem(DetectorSettings{});
    FuzzyDetectLog(WARN, "AnomalyDetector: falling back to the default rule base.");
    return;
  }
  if (_fuzzyControlSystem->getInputVariables().size() != numIndicators) {
    utils::ExceptionHandler::exception("AnomalyDetector: the fuzzy control system needs {} inputs but has {}.",
                                       numIndicators, _fuzzyControlSystem->getInputVariables().size());
  }

  FuzzyDetectLog(INFO, "Using a custom fuzzy control system with {} rules.", _fuzzyControlSystem->getRules().size());
}

EvaluationResult AnomalyDetector::evaluate(double forecastError, double varianceChange,
                                           double correlationChange) const {
  return evaluate(Indicators{forecastError, varianceChange, correlationChange});
}

EvaluationResult AnomalyDetector::evaluate(const Indicators &indicators) const {
  const auto inference = _fuzzyControlSystem->predict(toCrispData(indicators));
  return {inference.crispValue, inference.linguisticTerm, inference.status};
}

std::vector<EvaluationResult> AnomalyDetector::evaluate(const std::vector<Indicators> &indicators) const {
  std::vector<bool> valid(indicators.size());
  for (size_t i = 0; i < indicators.size(); ++i) {
    valid[i] = _fuzzyControlSystem->validateInputs(toCrispData(indicators[i]));
  }

  const auto undetermined = _fuzzyControlSystem->undeterminedResult();
  const EvaluationResult fallback{undetermined.crispValue, undetermined.linguisticTerm, undetermined.status};
  std::vector<EvaluationResult> results(indicators.size(), fallback);

  FuzzyDetectLog(DEBUG, "Evaluating {} windows with up to {} threads.", indicators.size(),
                 fuzzydetect_get_max_threads());

  // results is presized so every iteration writes its own element.
#if defined(FUZZYDETECT_OPENMP)
#pragma omp parallel for schedule(dynamic)
#endif
  for (size_t i = 0; i < indicators.size(); ++i) {
    if (valid[i]) {
      results[i] = evaluate(indicators[i]);
    }
  }
  return results;
}

const fuzzy_logic::FuzzyControlSystem &AnomalyDetector::getFuzzyControlSystem() const { return *_fuzzyControlSystem; }

fuzzy_logic::CrispData AnomalyDetector::toCrispData(const Indicators &indicators) const {
  const auto &inputs = _fuzzyControlSystem->getInputVariables();
  const double values[numIndicators] = {indicators.forecastError, indicators.varianceChange,
                                        indicators.correlationChange};
  fuzzy_logic::CrispData data;
  for (size_t i = 0; i < std::min(numIndicators, inputs.size()); ++i) {
    data[inputs[i]->getName()] = values[i];
  }
  return data;
}

}  // namespace fuzzydetect
