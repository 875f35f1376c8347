/**
 * @file FuzzyControlSystem.cpp
 * @author FuzzyDetect developers
 * @date 19.10.26
 */

#include "FuzzyControlSystem.h"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <set>

#include "FuzzyLogicExceptions.h"
#include "fuzzydetect/utils/ExceptionHandler.h"
#include "fuzzydetect/utils/Math.h"
#include "fuzzydetect/utils/logging/Logger.h"

namespace fuzzydetect::fuzzy_logic {

std::string to_string(InferenceStatus status) {
  switch (status) {
    case InferenceStatus::fired:
      return "fired";
    case InferenceStatus::nearestRule:
      return "nearestRule";
    case InferenceStatus::undetermined:
      return "undetermined";
  }
  return "unknown";
}

FuzzyControlSystem::FuzzyControlSystem(std::vector<std::shared_ptr<const LinguisticVariable>> inputVariables,
                                       std::shared_ptr<const LinguisticVariable> outputVariable,
                                       std::shared_ptr<FuzzyControlSettings> settings)
    : _inputVariables(std::move(inputVariables)),
      _outputVariable(std::move(outputVariable)),
      _settings(settings ? std::move(settings) : std::make_shared<FuzzyControlSettings>()) {
  if (not _outputVariable) {
    utils::ExceptionHandler::exception("FuzzyControlSystem: no output variable given.");
    // term-less stand-in: no rule can be added and every prediction is undetermined
    _outputVariable = std::make_shared<const LinguisticVariable>(undeterminedLabel, std::make_pair(0., 1.));
  } else if (_outputVariable->getLinguisticTerms().empty()) {
    utils::ExceptionHandler::exception("FuzzyControlSystem: output variable {} has no linguistic terms.",
                                       _outputVariable->getName());
  }

  std::set<std::string> names{_outputVariable->getName()};
  for (const auto &variable : _inputVariables) {
    if (not variable) {
      utils::ExceptionHandler::exception("FuzzyControlSystem: input variables must not be empty.");
      continue;
    }
    if (variable->getLinguisticTerms().empty()) {
      utils::ExceptionHandler::exception("FuzzyControlSystem: input variable {} has no linguistic terms.",
                                         variable->getName());
    }
    if (not names.insert(variable->getName()).second) {
      utils::ExceptionHandler::exception("FuzzyControlSystem: variable name {} is used twice.", variable->getName());
    }
  }
  _inputVariables.erase(std::remove(_inputVariables.begin(), _inputVariables.end(), nullptr), _inputVariables.end());

  parseSettings();
}

void FuzzyControlSystem::parseSettings() {
  if (_settings->count("defuzzificationMethod") != 0) {
    _defuzzificationMethod = DefuzzificationMethodOption::parseOptionExact(_settings->at("defuzzificationMethod"));
  }

  if (_settings->count("numSamples") != 0) {
    const auto &numSamplesStr = _settings->at("numSamples");
    long long numSamples = 0;
    try {
      size_t parsedChars = 0;
      numSamples = std::stoll(numSamplesStr, &parsedChars);
      if (parsedChars != numSamplesStr.size()) {
        numSamples = 0;
      }
    } catch (const std::exception &) {
      numSamples = 0;
    }
    if (numSamples < 2) {
      utils::ExceptionHandler::exception("FuzzyControlSystem: numSamples has to be an integer >= 2 but is \"{}\"",
                                         numSamplesStr);
    } else {
      _numSamples = static_cast<size_t>(numSamples);
    }
  }

  if (_settings->count("uncoveredInputPolicy") != 0) {
    _uncoveredInputPolicy = UncoveredInputPolicyOption::parseOptionExact(_settings->at("uncoveredInputPolicy"));
  }

  for (const auto &[key, value] : *_settings) {
    if (key != "defuzzificationMethod" and key != "numSamples" and key != "uncoveredInputPolicy") {
      FuzzyDetectLog(WARN, "FuzzyControlSystem: ignoring unknown setting {}: {}", key, value);
    }
  }
}

void FuzzyControlSystem::addRule(const FuzzyRule &rule) {
  for (const auto &term : rule.getAntecedent().getTerms()) {
    const auto variable = findInputVariable(term.variable);
    if (not variable) {
      utils::ExceptionHandler::exception(UnknownTermError(fmt::format(
          "FuzzyControlSystem: rule {} refers to unknown input variable {}", std::string(rule), term.variable)));
      return;
    }
    if (not variable->hasLinguisticTerm(term.linguisticTerm)) {
      utils::ExceptionHandler::exception(
          UnknownTermError(fmt::format("FuzzyControlSystem: rule {} refers to unknown term {} of variable {}",
                                       std::string(rule), term.linguisticTerm, term.variable)));
      return;
    }
  }

  const auto &consequent = rule.getConsequent();
  if (consequent.variable != _outputVariable->getName() or
      not _outputVariable->hasLinguisticTerm(consequent.linguisticTerm)) {
    utils::ExceptionHandler::exception(UnknownTermError(
        fmt::format("FuzzyControlSystem: the consequent of rule {} is not a term of the output variable {}",
                    std::string(rule), _outputVariable->getName())));
    return;
  }

  _rules.push_back(rule);
}

bool FuzzyControlSystem::validateInputs(const CrispData &data) const {
  for (const auto &variable : _inputVariables) {
    const auto value = data.find(variable->getName());
    if (value == data.end()) {
      utils::ExceptionHandler::exception(
          InputOutOfRangeError(fmt::format("FuzzyControlSystem: no value for input {}", variable->getName())));
      return false;
    }
    if (not std::isfinite(value->second) or not variable->getCrispSet().contains(value->second)) {
      const auto [min, max] = variable->getCrispSet().getRange();
      utils::ExceptionHandler::exception(InputOutOfRangeError(fmt::format(
          "FuzzyControlSystem: input {} = {} is not in [{}, {}]", variable->getName(), value->second, min, max)));
      return false;
    }
  }
  return true;
}

FuzzifiedData FuzzyControlSystem::fuzzify(const CrispData &data) const {
  FuzzifiedData fuzzifiedData;
  for (const auto &variable : _inputVariables) {
    const auto value = data.find(variable->getName());
    if (value != data.end()) {
      fuzzifiedData[variable->getName()] = variable->fuzzify(value->second);
    }
  }
  return fuzzifiedData;
}

std::vector<std::pair<std::string, double>> FuzzyControlSystem::applyRules(const FuzzifiedData &fuzzifiedData) const {
  std::vector<std::pair<std::string, double>> aggregatedStrengths;
  for (const auto &outputTerm : _outputVariable->getLinguisticTerms()) {
    aggregatedStrengths.emplace_back(outputTerm->getLinguisticTerm(), 0.);
  }

  for (const auto &rule : _rules) {
    const double firingStrength = rule.getFiringStrength(fuzzifiedData);
    FuzzyDetectLog(TRACE, "Rule {} fires with {}", std::string(rule), firingStrength);
    for (auto &[term, strength] : aggregatedStrengths) {
      if (term == rule.getConsequent().linguisticTerm) {
        strength = std::max(strength, firingStrength);
      }
    }
  }
  return aggregatedStrengths;
}

Eigen::ArrayXd FuzzyControlSystem::aggregateMembership(
    const std::vector<std::pair<std::string, double>> &aggregatedStrengths, const Eigen::ArrayXd &samples) const {
  Eigen::ArrayXd membership = Eigen::ArrayXd::Zero(samples.size());
  for (const auto &[term, strength] : aggregatedStrengths) {
    if (strength <= 0.) {
      continue;
    }
    const auto fuzzySet = _outputVariable->getLinguisticTerm(term);
    const Eigen::ArrayXd cut =
        samples.unaryExpr([&fuzzySet](double y) { return fuzzySet->evaluate_membership(y); }).min(strength);
    membership = membership.max(cut);
  }
  return membership;
}

InferenceResult FuzzyControlSystem::predict(const CrispData &data) const {
  if (not validateInputs(data)) {
    return undeterminedResult();
  }

  const auto fuzzifiedData = fuzzify(data);
  auto aggregatedStrengths = applyRules(fuzzifiedData);

  const bool anyRuleFired = std::any_of(aggregatedStrengths.begin(), aggregatedStrengths.end(),
                                        [](const auto &termStrength) { return termStrength.second > 0.; });
  if (anyRuleFired) {
    return defuzzify(std::move(aggregatedStrengths), InferenceStatus::fired);
  }

  switch (_uncoveredInputPolicy) {
    case UncoveredInputPolicyOption::nearestRule: {
      FuzzyDetectLog(DEBUG, "No rule fired. Falling back to the nearest rule.");
      return defuzzify(applyNearestRule(data), InferenceStatus::nearestRule);
    }
    case UncoveredInputPolicyOption::undetermined:
    default: {
      FuzzyDetectLog(DEBUG, "No rule fired. Returning the midpoint of {}.", _outputVariable->getName());
      return undeterminedResult();
    }
  }
}

InferenceResult FuzzyControlSystem::defuzzify(std::vector<std::pair<std::string, double>> aggregatedStrengths,
                                              InferenceStatus status) const {
  const auto samples = _outputVariable->getCrispSet().sample(_numSamples);
  const Eigen::ArrayXd membership = aggregateMembership(aggregatedStrengths, samples);

  const double mass = membership.sum();
  if (not(mass > 0.)) {
    FuzzyDetectLog(DEBUG, "The aggregated output set has no mass. Returning the midpoint of {}.",
                   _outputVariable->getName());
    return undeterminedResult();
  }

  double crispValue = 0.;
  switch (_defuzzificationMethod) {
    case DefuzzificationMethodOption::MoM: {
      // Compare with a small tolerance to not miss a maximum due to numerical inaccuracies.
      const double maxMembership = membership.maxCoeff();
      double sum = 0.;
      size_t count = 0;
      for (Eigen::Index i = 0; i < samples.size(); ++i) {
        if (utils::Math::isNear(membership[i], maxMembership, 1e-5)) {
          sum += samples[i];
          ++count;
        }
      }
      crispValue = sum / static_cast<double>(count);
      break;
    }
    case DefuzzificationMethodOption::CoG:
    default: {
      // centroid_y = sum(y * mu(y)) / sum(mu(y))
      crispValue = (samples * membership).sum() / mass;
      break;
    }
  }

  // The first declared term wins ties.
  std::string label;
  double bestMembership = -1.;
  for (const auto &outputTerm : _outputVariable->getLinguisticTerms()) {
    const double degree = outputTerm->evaluate_membership(crispValue);
    if (degree > bestMembership) {
      bestMembership = degree;
      label = outputTerm->getLinguisticTerm();
    }
  }

  FuzzyDetectLog(TRACE, "Defuzzified {} with {} to {} ({})", _outputVariable->getName(),
                 _defuzzificationMethod.to_string(), crispValue, label);

  return {crispValue, label, status, std::move(aggregatedStrengths)};
}

std::vector<std::pair<std::string, double>> FuzzyControlSystem::applyNearestRule(const CrispData &data) const {
  std::vector<std::pair<std::string, double>> aggregatedStrengths;
  for (const auto &outputTerm : _outputVariable->getLinguisticTerms()) {
    aggregatedStrengths.emplace_back(outputTerm->getLinguisticTerm(), 0.);
  }

  // Closeness of a term is 1 - |x - core| / (max - min) of its variable. Conjunctions take the minimum, disjunctions
  // the maximum.
  const auto termCloseness = [&](const Antecedent::Term &term) {
    const auto variable = findInputVariable(term.variable);
    const auto [min, max] = variable->getCrispSet().getRange();
    const double core = variable->getLinguisticTerm(term.linguisticTerm)->getCore();
    const double closeness = 1. - std::abs(data.at(term.variable) - core) / (max - min);
    return std::clamp(closeness, 0., 1.);
  };

  const FuzzyRule *nearestRule = nullptr;
  double bestCloseness = -1.;
  for (const auto &rule : _rules) {
    const double closeness = rule.getAntecedent().reduce(termCloseness);
    if (closeness > bestCloseness) {
      bestCloseness = closeness;
      nearestRule = &rule;
    }
  }

  if (nearestRule) {
    FuzzyDetectLog(DEBUG, "Nearest rule {} with closeness {}", std::string(*nearestRule), bestCloseness);
    for (auto &[term, strength] : aggregatedStrengths) {
      if (term == nearestRule->getConsequent().linguisticTerm) {
        strength = nearestRule->getWeight() * bestCloseness;
      }
    }
  }
  return aggregatedStrengths;
}

InferenceResult FuzzyControlSystem::undeterminedResult() const {
  std::vector<std::pair<std::string, double>> aggregatedStrengths;
  for (const auto &outputTerm : _outputVariable->getLinguisticTerms()) {
    aggregatedStrengths.emplace_back(outputTerm->getLinguisticTerm(), 0.);
  }
  return {_outputVariable->getCrispSet().getMidpoint(), undeterminedLabel, InferenceStatus::undetermined,
          std::move(aggregatedStrengths)};
}

std::shared_ptr<const LinguisticVariable> FuzzyControlSystem::findInputVariable(const std::string &name) const {
  const auto match = std::find_if(_inputVariables.begin(), _inputVariables.end(),
                                  [&name](const auto &variable) { return variable->getName() == name; });
  return match == _inputVariables.end() ? nullptr : *match;
}

const std::vector<std::shared_ptr<const LinguisticVariable>> &FuzzyControlSystem::getInputVariables() const {
  return _inputVariables;
}

const std::shared_ptr<const LinguisticVariable> &FuzzyControlSystem::getOutputVariable() const {
  return _outputVariable;
}

const std::vector<FuzzyRule> &FuzzyControlSystem::getRules() const { return _rules; }

DefuzzificationMethodOption FuzzyControlSystem::getDefuzzificationMethod() const { return _defuzzificationMethod; }

size_t FuzzyControlSystem::getNumSamples() const { return _numSamples; }

UncoveredInputPolicyOption FuzzyControlSystem::getUncoveredInputPolicy() const { return _uncoveredInputPolicy; }

FuzzyControlSystem::operator std::string() const {
  const auto header = fmt::format("FuzzyControlSystem: \"{}\" ({}, numSamples: {}, uncovered inputs: {})\n",
                                  _outputVariable->getName(), _defuzzificationMethod.to_string(), _numSamples,
                                  _uncoveredInputPolicy.to_string());
  return std::accumulate(_rules.begin(), _rules.end(), header,
                         [](const std::string &acc, const FuzzyRule &rule) { return acc + std::string(rule) + "\n"; });
}

}  // namespace fuzzydetect::fuzzy_logic
