/**
 * @file FuzzyControlSystem.h
 * @author FuzzyDetect developers
 * @date 19.10.26
 */

#pragma once

#include <Eigen/Core>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "FuzzyRule.h"
#include "LinguisticVariable.h"
#include "fuzzydetect/options/DefuzzificationMethodOption.h"
#include "fuzzydetect/options/UncoveredInputPolicyOption.h"

namespace fuzzydetect::fuzzy_logic {

/**
 * The settings of a FuzzyControlSystem are a map of key-value pairs. The key is the name of the setting and the value
 * is the value of the setting.
 *
 * Known keys: "defuzzificationMethod", "numSamples", "uncoveredInputPolicy".
 */
using FuzzyControlSettings = std::map<std::string, std::string>;

/**
 * Crisp inputs of the form {variable_name: value}.
 */
using CrispData = std::map<std::string, double>;

/**
 * Describes which branch of the inference produced a result.
 */
enum class InferenceStatus {
  /**
   * At least one rule fired with a positive strength.
   */
  fired,
  /**
   * No rule fired. The rule closest to the input was fired instead.
   */
  nearestRule,
  /**
   * No rule fired. The result is the midpoint of the output domain.
   */
  undetermined,
};

/**
 * Converts an InferenceStatus to its name.
 * @param status
 * @return
 */
std::string to_string(InferenceStatus status);

/**
 * The outcome of a single inference.
 */
struct InferenceResult {
  /**
   * The defuzzified output value.
   */
  double crispValue;
  /**
   * The output term with the highest membership at crispValue or "undetermined".
   */
  std::string linguisticTerm;
  /**
   * The branch that produced this result.
   */
  InferenceStatus status;
  /**
   * Aggregated firing strength of every output term in declaration order.
   */
  std::vector<std::pair<std::string, double>> aggregatedStrengths;
};

/**
 * Used to represent a Fuzzy Control System. A Fuzzy Control System is a collection of FuzzyRules over a set of input
 * LinguisticVariables and one output LinguisticVariable that can be applied to a given input to predict an output.
 *
 * After construction the system is only read, so one instance may be shared between threads.
 */
class FuzzyControlSystem {
 public:
  /**
   * The label of results where no rule fired.
   */
  static inline const std::string undeterminedLabel{"undetermined"};

  /**
   * Constructs a FuzzyControlSystem without rules.
   * @param inputVariables The input variables. Names have to be unique and each variable needs at least one term.
   * @param outputVariable The output variable. Needs at least one term.
   * @param settings The settings of the FuzzyControlSystem. They are parsed and validated once here.
   */
  FuzzyControlSystem(std::vector<std::shared_ptr<const LinguisticVariable>> inputVariables,
                     std::shared_ptr<const LinguisticVariable> outputVariable,
                     std::shared_ptr<FuzzyControlSettings> settings);

  /**
   * Adds a new FuzzyRule to the FuzzyControlSystem.
   * @param rule The FuzzyRule to add.
   *
   * Every term of the antecedent has to exist on an input variable and the consequent has to be a term of the output
   * variable. Otherwise, an UnknownTermError is thrown.
   */
  void addRule(const FuzzyRule &rule);

  /**
   * Checks that every input variable has a finite value inside its domain.
   * @param data A map of the form {variable_name: value}.
   * @return True if the data can be used for a prediction.
   * @throws InputOutOfRangeError for missing, non-finite or out-of-domain values.
   */
  bool validateInputs(const CrispData &data) const;

  /**
   * Fuzzifies all input values.
   * @param data A map of the form {variable_name: value}.
   * @return A map of the form {variable_name: {linguistic_term: degree}}.
   */
  [[nodiscard]] FuzzifiedData fuzzify(const CrispData &data) const;

  /**
   * Applies all rules and aggregates the firing strengths per output term with the maximum.
   * @param fuzzifiedData
   * @return Aggregated strength of every output term in declaration order. Zero if no rule concludes a term.
   */
  [[nodiscard]] std::vector<std::pair<std::string, double>> applyRules(const FuzzifiedData &fuzzifiedData) const;

  /**
   * Evaluates the aggregated output membership max_t(min(strength_t, t(y))) at every sample point y.
   * @param aggregatedStrengths As returned by applyRules().
   * @param samples Points of the output domain.
   * @return Membership per sample point.
   */
  [[nodiscard]] Eigen::ArrayXd aggregateMembership(
      const std::vector<std::pair<std::string, double>> &aggregatedStrengths, const Eigen::ArrayXd &samples) const;

  /**
   * Predicts the output of the FuzzyControlSystem for the given data.
   * @param data A map of the form {variable_name: value}.
   * @return The predicted output and the label of the dominant output term.
   *
   * This method performs the full prediction process of the FuzzyControlSystem. It first applies all the rules to the
   * fuzzified data and aggregates the strengths per output term. The aggregated set is then defuzzified and the
   * output term with the highest membership at the crisp value is chosen as label.
   *
   * If no rule fires the uncovered input policy decides the result.
   */
  [[nodiscard]] InferenceResult predict(const CrispData &data) const;

  /**
   * Builds the result for inputs where no rule fires: the midpoint of the output domain.
   * @return
   */
  [[nodiscard]] InferenceResult undeterminedResult() const;

  /**
   * Getter for the input variables.
   * @return
   */
  [[nodiscard]] const std::vector<std::shared_ptr<const LinguisticVariable>> &getInputVariables() const;

  /**
   * Getter for the output variable.
   * @return
   */
  [[nodiscard]] const std::shared_ptr<const LinguisticVariable> &getOutputVariable() const;

  /**
   * Getter for the rules in the order they were added.
   * @return
   */
  [[nodiscard]] const std::vector<FuzzyRule> &getRules() const;

  /**
   * Getter for the parsed defuzzification method.
   * @return
   */
  [[nodiscard]] DefuzzificationMethodOption getDefuzzificationMethod() const;

  /**
   * Getter for the parsed number of samples.
   * @return
   */
  [[nodiscard]] size_t getNumSamples() const;

  /**
   * Getter for the parsed uncovered input policy.
   * @return
   */
  [[nodiscard]] UncoveredInputPolicyOption getUncoveredInputPolicy() const;

  /**
   * Returns a string representation of the FuzzyControlSystem.
   */
  explicit operator std::string() const;

 private:
  /**
   * Defuzzifies the aggregated strengths and labels the result.
   * @param aggregatedStrengths
   * @param status The status to put into the result.
   * @return The result or undeterminedResult() if the aggregated set has no mass.
   */
  [[nodiscard]] InferenceResult defuzzify(std::vector<std::pair<std::string, double>> aggregatedStrengths,
                                          InferenceStatus status) const;

  /**
   * Fires the single rule whose antecedent lies closest to the crisp inputs.
   * @param data
   * @return Aggregated strengths where only the consequent of the closest rule is set.
   */
  [[nodiscard]] std::vector<std::pair<std::string, double>> applyNearestRule(const CrispData &data) const;

  /**
   * Looks up an input variable by name.
   * @param name
   * @return The variable or nullptr.
   */
  [[nodiscard]] std::shared_ptr<const LinguisticVariable> findInputVariable(const std::string &name) const;

  /**
   * Reads the settings into the typed members.
   */
  void parseSettings();

  std::vector<std::shared_ptr<const LinguisticVariable>> _inputVariables;

  std::shared_ptr<const LinguisticVariable> _outputVariable;

  /**
   * The settings of the FuzzyControlSystem.
   */
  std::shared_ptr<FuzzyControlSettings> _settings;

  /**
   * All rules of the FuzzyControlSystem.
   */
  std::vector<FuzzyRule> _rules;

  DefuzzificationMethodOption _defuzzificationMethod{DefuzzificationMethodOption::CoG};

  /**
   * Number of evenly spaced points of the output domain used for defuzzification. 1001 points on [0, 10] give a
   * resolution of 0.01.
   */
  size_t _numSamples{1001};

  UncoveredInputPolicyOption _uncoveredInputPolicy{UncoveredInputPolicyOption::undetermined};
};

}  // namespace fuzzydetect::fuzzy_logic
