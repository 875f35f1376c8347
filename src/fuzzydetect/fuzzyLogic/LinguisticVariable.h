/**
 * @file LinguisticVariable.h
 * @author FuzzyDetect developers
 * @date 19.10.26
 */

#pragma once

#include <map>
#include <memory>
#include <string>
#include <vector>

#include "Antecedent.h"
#include "CrispSet.h"
#include "FuzzySet.h"

namespace fuzzydetect::fuzzy_logic {

/**
 * A class representing a LinguisticVariable. A LinguisticVariable is defined on a CrispSet and consists of several
 * FuzzySets, which are the linguistic terms of the LinguisticVariable. The terms keep the order in which they were
 * added.
 */
class LinguisticVariable {
 public:
  /**
   * Constructs a LinguisticVariable with the given name and range.
   * @param name The name of the LinguisticVariable.
   * @param range The range of the LinguisticVariable in the form [min, max].
   */
  LinguisticVariable(const std::string &name, const std::pair<double, double> &range);

  /**
   * Adds a new linguistic term to the LinguisticVariable.
   * @param linguisticTerm The linguistic term to add. Its name has to be unique within this variable.
   */
  void addLinguisticTerm(const std::shared_ptr<const FuzzySet> &linguisticTerm);

  /**
   * Overload of the operator== where the left-hand side is a linguistic variable, and the right-hand side is a
   * linguistic term. Returns the antecedent leaf "variable == term". This allows a very concise syntax to create
   * fuzzy rules.
   * @param linguisticTerm The name of the linguistic term.
   * @return An Antecedent consisting of a single term.
   * @throws UnknownTermError if the variable has no such term.
   */
  Antecedent operator==(const std::string &linguisticTerm) const;

  /**
   * Evaluates every linguistic term at the given value.
   * @param value
   * @return map linguistic term -> membership degree. Terms with degree zero are included.
   */
  [[nodiscard]] std::map<std::string, double> fuzzify(double value) const;

  /**
   * Checks whether a linguistic term with the given name exists.
   * @param linguisticTerm
   * @return
   */
  [[nodiscard]] bool hasLinguisticTerm(const std::string &linguisticTerm) const;

  /**
   * Returns the FuzzySet of the given linguistic term.
   * @param linguisticTerm
   * @return The FuzzySet or nullptr if the exception handler does not throw.
   * @throws UnknownTermError if the variable has no such term.
   */
  [[nodiscard]] std::shared_ptr<const FuzzySet> getLinguisticTerm(const std::string &linguisticTerm) const;

  /**
   * Returns all linguistic terms in the order they were added.
   * @return
   */
  [[nodiscard]] const std::vector<std::shared_ptr<const FuzzySet>> &getLinguisticTerms() const;

  /**
   * Getter for the name of the LinguisticVariable.
   * @return The name of the LinguisticVariable.
   */
  [[nodiscard]] const std::string &getName() const;

  /**
   * Getter for the domain of the LinguisticVariable.
   * @return
   */
  [[nodiscard]] const CrispSet &getCrispSet() const;

  /**
   *  Returns a string representation of the LinguisticVariable.
   */
  explicit operator std::string() const;

 private:
  /**
   * The CrispSet on which the LinguisticVariable is defined. Its name is the name of the variable.
   */
  CrispSet _crispSet;

  /**
   * All linguistic terms of the LinguisticVariable in insertion order.
   */
  std::vector<std::shared_ptr<const FuzzySet>> _linguisticTerms;
};
}  // namespace fuzzydetect::fuzzy_logic
