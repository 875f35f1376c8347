/**
 * @file Antecedent.cpp
 * @author FuzzyDetect developers
 * @date 19.10.26
 */

#include "Antecedent.h"

#include <algorithm>
#include <numeric>

#include "FuzzyLogicExceptions.h"
#include "fuzzydetect/utils/ExceptionHandler.h"

namespace fuzzydetect::fuzzy_logic {

namespace {
/**
 * Appends the operand to the list. If the operand is of the same node type as the list it is merged into, its
 * operands are appended instead.
 */
template <class NodeType>
void appendFlattened(std::vector<Antecedent> &operands, const Antecedent &operand,
                     const std::variant<Antecedent::Term, Antecedent::Conjunction, Antecedent::Disjunction> &node) {
  if (const auto *sameType = std::get_if<NodeType>(&node)) {
    operands.insert(operands.end(), sameType->operands.begin(), sameType->operands.end());
  } else {
    operands.push_back(operand);
  }
}
}  // namespace

Antecedent::Antecedent(Term term) : _node(std::move(term)) {}

Antecedent::Antecedent(std::variant<Term, Conjunction, Disjunction> node) : _node(std::move(node)) {}

Antecedent Antecedent::makeConjunction(const std::vector<Antecedent> &operands) {
  if (operands.empty()) {
    utils::ExceptionHandler::exception("Antecedent: a conjunction needs at least one operand.");
  }
  Conjunction conjunction;
  for (const auto &operand : operands) {
    appendFlattened<Conjunction>(conjunction.operands, operand, operand._node);
  }
  return Antecedent(std::move(conjunction));
}

Antecedent Antecedent::makeDisjunction(const std::vector<Antecedent> &operands) {
  if (operands.empty()) {
    utils::ExceptionHandler::exception("Antecedent: a disjunction needs at least one operand.");
  }
  Disjunction disjunction;
  for (const auto &operand : operands) {
    appendFlattened<Disjunction>(disjunction.operands, operand, operand._node);
  }
  return Antecedent(std::move(disjunction));
}

double Antecedent::evaluate(const FuzzifiedData &data) const {
  return reduce([&data](const Term &term) {
    const auto variable = data.find(term.variable);
    if (variable != data.end()) {
      const auto degree = variable->second.find(term.linguisticTerm);
      if (degree != variable->second.end()) {
        return degree->second;
      }
    }
    utils::ExceptionHandler::exception(UnknownTermError(fmt::format(
        R"(Antecedent: no membership degree for "{}" == "{}". The pair was never fuzzified.)", term.variable,
        term.linguisticTerm)));
    return 0.0;
  });
}

double Antecedent::reduce(const std::function<double(const Term &)> &termEvaluator) const {
  if (const auto *term = std::get_if<Term>(&_node)) {
    return termEvaluator(*term);
  }
  // Empty operand lists can only exist if the exception handler ignored the error on construction. They never hold.
  if (const auto *conjunction = std::get_if<Conjunction>(&_node)) {
    if (conjunction->operands.empty()) {
      return 0.;
    }
    return std::accumulate(conjunction->operands.begin(), conjunction->operands.end(), 1.,
                           [&termEvaluator](double acc, const Antecedent &operand) {
                             return std::min(acc, operand.reduce(termEvaluator));
                           });
  }
  const auto &disjunction = std::get<Disjunction>(_node);
  return std::accumulate(disjunction.operands.begin(), disjunction.operands.end(), 0.,
                         [&termEvaluator](double acc, const Antecedent &operand) {
                           return std::max(acc, operand.reduce(termEvaluator));
                         });
}

std::vector<Antecedent::Term> Antecedent::getTerms() const {
  std::vector<Term> terms;
  collectTerms(terms);
  return terms;
}

void Antecedent::collectTerms(std::vector<Term> &terms) const {
  if (const auto *term = std::get_if<Term>(&_node)) {
    terms.push_back(*term);
    return;
  }
  const auto &operands = std::holds_alternative<Conjunction>(_node) ? std::get<Conjunction>(_node).operands
                                                                    : std::get<Disjunction>(_node).operands;
  for (const auto &operand : operands) {
    operand.collectTerms(terms);
  }
}

bool Antecedent::isTerm() const { return std::holds_alternative<Term>(_node); }

const Antecedent::Term &Antecedent::getTerm() const { return std::get<Term>(_node); }

Antecedent::operator std::string() const {
  if (const auto *term = std::get_if<Term>(&_node)) {
    return fmt::format(R"("{}" == "{}")", term->variable, term->linguisticTerm);
  }

  const auto join = [](const std::vector<Antecedent> &operands, const std::string &op) {
    std::string result;
    for (const auto &operand : operands) {
      result += (result.empty() ? "" : op) + std::string(operand);
    }
    return "(" + result + ")";
  };

  if (const auto *conjunction = std::get_if<Conjunction>(&_node)) {
    return join(conjunction->operands, " && ");
  }
  return join(std::get<Disjunction>(_node).operands, " || ");
}

Antecedent operator&&(const Antecedent &lhs, const Antecedent &rhs) { return Antecedent::makeConjunction({lhs, rhs}); }

Antecedent operator||(const Antecedent &lhs, const Antecedent &rhs) { return Antecedent::makeDisjunction({lhs, rhs}); }

}  // namespace fuzzydetect::fuzzy_logic
