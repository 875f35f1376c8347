/**
 * @file FuzzyRule.h
 * @author FuzzyDetect developers
 * @date 19.10.26
 */

#pragma once

#include <string>

#include "Antecedent.h"

namespace fuzzydetect::fuzzy_logic {

/**
 * Used to represent a Fuzzy Rule. A Fuzzy Rule is a conditional statement of the form: IF antecedent THEN consequent.
 * The antecedent is an arbitrary AND/OR tree of terms, the consequent is a single term of the output variable.
 * Rules are immutable.
 */
class FuzzyRule {
 public:
  /**
   * Constructs a FuzzyRule of the form: IF antecedent THEN consequent.
   * @param antecedent The condition of the rule.
   * @param consequent A single term of the output variable, e.g. anomalyLevel == "normal".
   * @param weight Scales the firing strength. Has to lie in [0, 1].
   * @param label Optional name of the rule used in diagnostics.
   */
  FuzzyRule(Antecedent antecedent, const Antecedent &consequent, double weight = 1., std::string label = "");

  /**
   * Computes weight * antecedent(data).
   * @param data The fuzzified inputs.
   * @return The firing strength in [0, 1].
   */
  [[nodiscard]] double getFiringStrength(const FuzzifiedData &data) const;

  /**
   * Returns the antecedent of the FuzzyRule.
   * @return The antecedent of the FuzzyRule.
   */
  [[nodiscard]] const Antecedent &getAntecedent() const;

  /**
   * Returns the consequent of the FuzzyRule.
   * @return The consequent of the FuzzyRule.
   */
  [[nodiscard]] const Antecedent::Term &getConsequent() const;

  /**
   * Returns the weight of the FuzzyRule.
   * @return
   */
  [[nodiscard]] double getWeight() const;

  /**
   * Returns the label of the FuzzyRule.
   * @return
   */
  [[nodiscard]] const std::string &getLabel() const;

  /**
   * Returns a string representation of the FuzzyRule.
   */
  explicit operator std::string() const;

 private:
  /**
   * The antecedent of the FuzzyRule.
   */
  const Antecedent _antecedent;

  /**
   * The consequent of the FuzzyRule.
   */
  const Antecedent::Term _consequent;

  const double _weight;

  const std::string _label;
};

}  // namespace fuzzydetect::fuzzy_logic
