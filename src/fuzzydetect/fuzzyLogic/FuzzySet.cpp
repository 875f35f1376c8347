/**
 * @file FuzzySet.cpp
 * @author FuzzyDetect developers
 * @date 19.10.26
 */

#include "FuzzySet.h"

#include <spdlog/fmt/ranges.h>

#include <algorithm>
#include <cmath>
#include <utility>

#include "fuzzydetect/utils/ExceptionHandler.h"

namespace fuzzydetect::fuzzy_logic {

FuzzySet::FuzzySet(std::string linguisticTerm, BaseMembershipFunction &&baseMembershipFunction)
    : _linguisticTerm(std::move(linguisticTerm)), _membershipFunction(std::move(baseMembershipFunction)) {}

double FuzzySet::evaluate_membership(double value) const {
  if (std::isnan(value)) {
    return 0.0;
  }
  const double membership = std::get<2>(_membershipFunction)(value);
  return std::clamp(membership, 0.0, 1.0);
}

double FuzzySet::getCore() const {
  const auto &params = std::get<1>(_membershipFunction);
  switch (std::get<0>(_membershipFunction)) {
    case MembershipFunctionOption::Triangle:
      return params[1];
    case MembershipFunctionOption::Trapezoid:
      return 0.5 * (params[1] + params[2]);
    case MembershipFunctionOption::Gaussian:
      return params[0];
    default:
      utils::ExceptionHandler::exception("FuzzySet {}: unknown membership function shape", _linguisticTerm);
      return params.front();
  }
}

MembershipFunctionOption FuzzySet::getShape() const { return std::get<0>(_membershipFunction); }

const std::vector<double> &FuzzySet::getParameters() const { return std::get<1>(_membershipFunction); }

std::string FuzzySet::printBaseMembershipFunction() const {
  const auto &[shape, parameters, function] = _membershipFunction;
  return fmt::format(R"("{}": {}({}))", _linguisticTerm, shape.to_string(), fmt::join(parameters, ", "));
}

const std::string &FuzzySet::getLinguisticTerm() const { return _linguisticTerm; }

}  // namespace fuzzydetect::fuzzy_logic
