/**
 * @file LinguisticVariable.cpp
 * @author FuzzyDetect developers
 * @date 19.10.26
 */

#include "LinguisticVariable.h"

#include <algorithm>
#include <numeric>

#include "FuzzyLogicExceptions.h"
#include "fuzzydetect/utils/ExceptionHandler.h"

namespace fuzzydetect::fuzzy_logic {

LinguisticVariable::LinguisticVariable(const std::string &name, const std::pair<double, double> &range)
    : _crispSet(name, range) {}

void LinguisticVariable::addLinguisticTerm(const std::shared_ptr<const FuzzySet> &linguisticTerm) {
  if (not linguisticTerm) {
    utils::ExceptionHandler::exception(
        InvalidShapeError(fmt::format("LinguisticVariable {}: cannot add an empty linguistic term.", getName())));
    return;
  }
  if (hasLinguisticTerm(linguisticTerm->getLinguisticTerm())) {
    utils::ExceptionHandler::exception("LinguisticVariable {}: linguistic term {} is defined twice.", getName(),
                                       linguisticTerm->getLinguisticTerm());
    return;
  }
  _linguisticTerms.push_back(linguisticTerm);
}

Antecedent LinguisticVariable::operator==(const std::string &linguisticTerm) const {
  if (not hasLinguisticTerm(linguisticTerm)) {
    utils::ExceptionHandler::exception(UnknownTermError(
        fmt::format("Linguistic term {} not found in variable {}", linguisticTerm, getName())));
  }
  return Antecedent::Term{getName(), linguisticTerm};
}

std::map<std::string, double> LinguisticVariable::fuzzify(double value) const {
  std::map<std::string, double> degrees;
  for (const auto &fuzzySet : _linguisticTerms) {
    degrees[fuzzySet->getLinguisticTerm()] = fuzzySet->evaluate_membership(value);
  }
  return degrees;
}

bool LinguisticVariable::hasLinguisticTerm(const std::string &linguisticTerm) const {
  return std::any_of(_linguisticTerms.begin(), _linguisticTerms.end(),
                     [&](const auto &fuzzySet) { return fuzzySet->getLinguisticTerm() == linguisticTerm; });
}

std::shared_ptr<const FuzzySet> LinguisticVariable::getLinguisticTerm(const std::string &linguisticTerm) const {
  const auto match =
      std::find_if(_linguisticTerms.begin(), _linguisticTerms.end(),
                   [&](const auto &fuzzySet) { return fuzzySet->getLinguisticTerm() == linguisticTerm; });
  if (match == _linguisticTerms.end()) {
    utils::ExceptionHandler::exception(UnknownTermError(
        fmt::format("Linguistic term {} not found in variable {}", linguisticTerm, getName())));
    return nullptr;
  }
  return *match;
}

const std::vector<std::shared_ptr<const FuzzySet>> &LinguisticVariable::getLinguisticTerms() const {
  return _linguisticTerms;
}

const std::string &LinguisticVariable::getName() const { return _crispSet.getName(); }

const CrispSet &LinguisticVariable::getCrispSet() const { return _crispSet; }

LinguisticVariable::operator std::string() const {
  const auto [min, max] = _crispSet.getRange();

  std::string linguisticTermsStr =
      std::accumulate(_linguisticTerms.begin(), _linguisticTerms.end(), std::string(""),
                      [](const std::string &acc, const std::shared_ptr<const FuzzySet> &b) {
                        return acc + "\t" + b->printBaseMembershipFunction() + "\n";
                      });

  return fmt::format("LinguisticVariable: domain: \"{}\" range: ({}, {})\n{}", getName(), min, max,
                     linguisticTermsStr);
}

}  // namespace fuzzydetect::fuzzy_logic
