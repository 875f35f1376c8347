/**
 * @file FuzzyRule.cpp
 * @author FuzzyDetect developers
 * @date 19.10.26
 */

#include "FuzzyRule.h"

#include "fuzzydetect/utils/ExceptionHandler.h"
#include "fuzzydetect/utils/Math.h"

namespace fuzzydetect::fuzzy_logic {

namespace {
/**
 * Extracts the single term of a consequent. Compound consequents are rejected.
 */
Antecedent::Term toConsequentTerm(const Antecedent &consequent) {
  if (not consequent.isTerm()) {
    utils::ExceptionHandler::exception("FuzzyRule: the consequent {} has to be a single term.",
                                       std::string(consequent));
    return consequent.getTerms().front();
  }
  return consequent.getTerm();
}
}  // namespace

FuzzyRule::FuzzyRule(Antecedent antecedent, const Antecedent &consequent, double weight, std::string label)
    : _antecedent(std::move(antecedent)),
      _consequent(toConsequentTerm(consequent)),
      _weight(weight),
      _label(std::move(label)) {
  if (not utils::Math::isInInterval(_weight, 0., 1.)) {
    utils::ExceptionHandler::exception("FuzzyRule {}: weight {} is not in [0, 1].", _label, _weight);
  }
}

double FuzzyRule::getFiringStrength(const FuzzifiedData &data) const { return _weight * _antecedent.evaluate(data); }

const Antecedent &FuzzyRule::getAntecedent() const { return _antecedent; }

const Antecedent::Term &FuzzyRule::getConsequent() const { return _consequent; }

double FuzzyRule::getWeight() const { return _weight; }

const std::string &FuzzyRule::getLabel() const { return _label; }

FuzzyRule::operator std::string() const {
  const auto weightStr = _weight == 1. ? std::string("") : fmt::format(" WITH {}", _weight);
  const auto labelStr = _label.empty() ? std::string("") : fmt::format("[{}] ", _label);
  return fmt::format(R"({}IF {} THEN "{}" == "{}"{})", labelStr, std::string(_antecedent), _consequent.variable,
                     _consequent.linguisticTerm, weightStr);
}

}  // namespace fuzzydetect::fuzzy_logic
