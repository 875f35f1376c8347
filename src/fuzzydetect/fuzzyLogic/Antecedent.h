/**
 * @file Antecedent.h
 * @author FuzzyDetect developers
 * @date 19.10.26
 */

#pragma once

#include <functional>
#include <map>
#include <string>
#include <variant>
#include <vector>

namespace fuzzydetect::fuzzy_logic {

/**
 * Membership degrees of fuzzified crisp inputs in the form {variable_name: {linguistic_term: degree}}.
 */
using FuzzifiedData = std::map<std::string, std::map<std::string, double>>;

/**
 * The condition part of a FuzzyRule. An Antecedent is a tree whose leaves are terms of the form
 * "variable == linguistic term" and whose inner nodes are conjunctions (fuzzy AND, minimum) or disjunctions
 * (fuzzy OR, maximum).
 *
 * Antecedents are usually built from linguistic variables:
 * @code
 * auto antecedent = (EP == "high" && MV == "high") || MC == "high";
 * @endcode
 */
class Antecedent {
 public:
  /**
   * Leaf of the tree: the degree to which a variable takes a linguistic term.
   */
  struct Term {
    /**
     * Name of the linguistic variable.
     */
    std::string variable;
    /**
     * Name of the linguistic term (fuzzy set) of the variable.
     */
    std::string linguisticTerm;
  };

  /**
   * Fuzzy AND over all operands.
   */
  struct Conjunction {
    /**
     * At least one operand.
     */
    std::vector<Antecedent> operands;
  };

  /**
   * Fuzzy OR over all operands.
   */
  struct Disjunction {
    /**
     * At least one operand.
     */
    std::vector<Antecedent> operands;
  };

  /**
   * Constructs a leaf.
   * @param term
   */
  Antecedent(Term term);

  /**
   * Constructs a conjunction. Nested conjunctions are flattened.
   * @param operands Must not be empty.
   * @return
   */
  static Antecedent makeConjunction(const std::vector<Antecedent> &operands);

  /**
   * Constructs a disjunction. Nested disjunctions are flattened.
   * @param operands Must not be empty.
   * @return
   */
  static Antecedent makeDisjunction(const std::vector<Antecedent> &operands);

  /**
   * Computes the degree to which the antecedent holds for the fuzzified inputs.
   * @param data
   * @return Degree in [0, 1].
   * @throws UnknownTermError if a leaf refers to a (variable, term) pair missing in data.
   */
  [[nodiscard]] double evaluate(const FuzzifiedData &data) const;

  /**
   * Reduces the tree with minimum for conjunctions and maximum for disjunctions, evaluating leaves with the given
   * function.
   * @param termEvaluator
   * @return
   */
  [[nodiscard]] double reduce(const std::function<double(const Term &)> &termEvaluator) const;

  /**
   * Returns all leaves in depth-first order.
   * @return
   */
  [[nodiscard]] std::vector<Term> getTerms() const;

  /**
   * Checks whether this antecedent is a single leaf.
   * @return
   */
  [[nodiscard]] bool isTerm() const;

  /**
   * Returns the leaf if this antecedent is a single leaf.
   * @return
   */
  [[nodiscard]] const Term &getTerm() const;

  /**
   * Returns a string representation of the Antecedent.
   */
  explicit operator std::string() const;

 private:
  /**
   * Appends the leaves of this subtree in declaration order.
   * @param terms
   */
  void collectTerms(std::vector<Term> &terms) const;

  /**
   * Private so that inner nodes can only be created through the flattening factories.
   * @param node
   */
  explicit Antecedent(std::variant<Term, Conjunction, Disjunction> node);

  std::variant<Term, Conjunction, Disjunction> _node;
};

/**
 * Fuzzy AND of two antecedents.
 * @param lhs
 * @param rhs
 * @return The conjunction of lhs and rhs.
 */
Antecedent operator&&(const Antecedent &lhs, const Antecedent &rhs);

/**
 * Fuzzy OR of two antecedents.
 * @param lhs
 * @param rhs
 * @return The disjunction of lhs and rhs.
 */
Antecedent operator||(const Antecedent &lhs, const Antecedent &rhs);

}  // namespace fuzzydetect::fuzzy_logic
