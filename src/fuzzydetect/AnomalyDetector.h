/**
 * @file AnomalyDetector.h
 * @author FuzzyDetect developers
 * @date 19.10.26
 */

#pragma once

#include <memory>
#include <string>
#include <vector>

#include "fuzzydetect/DetectorSettings.h"
#include "fuzzydetect/fuzzyLogic/FuzzyControlSystem.h"

namespace fuzzydetect {

/**
 * The three normalized indicators of one time series window. All of them have to lie in [0, 1].
 */
struct Indicators {
  /**
   * Normalized forecast error (EP).
   */
  double forecastError;
  /**
   * Normalized variance change (MV).
   */
  double varianceChange;
  /**
   * Normalized correlation change (MC).
   */
  double correlationChange;
};

/**
 * Score and label of one window.
 */
struct EvaluationResult {
  /**
   * Anomaly score in [0, 10].
   */
  double score;
  /**
   * Dominant term of the anomaly level or "undetermined".
   */
  std::string label;
  /**
   * Which inference branch produced the result.
   */
  fuzzy_logic::InferenceStatus status;

  /**
   * Distinguishes "computed normal" from "no rule fired".
   * @return True if the score is the fallback midpoint.
   */
  [[nodiscard]] bool isUndetermined() const { return status == fuzzy_logic::InferenceStatus::undetermined; }
};

/**
 * Maps the indicators of a multivariate time series window to an anomaly score and label using Mamdani inference.
 *
 * The linguistic variables and the rule base are built once in the constructor and never modified afterwards, so
 * evaluate() may be called concurrently.
 */
class AnomalyDetector {
 public:
  /**
   * Builds the detector from the built-in variables and rule base.
   * @param settings
   */
  explicit AnomalyDetector(const DetectorSettings &settings = {});

  /**
   * Wraps a prebuilt fuzzy control system. Its first three input variables receive EP, MV and MC.
   * @param fuzzyControlSystem
   */
  explicit AnomalyDetector(std::shared_ptr<const fuzzy_logic::FuzzyControlSystem> fuzzyControlSystem);

  /**
   * Evaluates one window.
   * @param forecastError
   * @param varianceChange
   * @param correlationChange
   * @return
   * @throws InputOutOfRangeError if an input is not in [0, 1].
   */
  [[nodiscard]] EvaluationResult evaluate(double forecastError, double varianceChange,
                                          double correlationChange) const;

  /**
   * Evaluates one window.
   * @param indicators
   * @return
   * @throws InputOutOfRangeError if an input is not in [0, 1].
   */
  [[nodiscard]] EvaluationResult evaluate(const Indicators &indicators) const;

  /**
   * Evaluates a series of windows. All inputs are validated before any is evaluated.
   * @param indicators
   * @return One result per window in input order.
   * @throws InputOutOfRangeError if any input is not in [0, 1].
   */
  [[nodiscard]] std::vector<EvaluationResult> evaluate(const std::vector<Indicators> &indicators) const;

  /**
   * Getter for the underlying fuzzy control system.
   * @return
   */
  [[nodiscard]] const fuzzy_logic::FuzzyControlSystem &getFuzzyControlSystem() const;

 private:
  /**
   * Maps the indicators onto the names of the input variables.
   * @param indicators
   * @return
   */
  [[nodiscard]] fuzzy_logic::CrispData toCrispData(const Indicators &indicators) const;

  std::shared_ptr<const fuzzy_logic::FuzzyControlSystem> _fuzzyControlSystem;
};

}  // namespace fuzzydetect
