/**
 * @file FuzzySetFactory.cpp
 * @author FuzzyDetect developers
 * @date 19.10.26
 */

#include "FuzzySetFactory.h"

#include <spdlog/fmt/ranges.h>

#include <algorithm>
#include <cmath>
#include <numeric>

#include "FuzzyLogicExceptions.h"
#include "fuzzydetect/utils/ExceptionHandler.h"

namespace fuzzydetect::fuzzy_logic {

std::shared_ptr<const FuzzySet> FuzzySetFactory::makeFuzzySet(const std::string &linguisticTerm,
                                                              const std::string &functionName,
                                                              const std::vector<double> &params) {
  const auto optionNames = MembershipFunctionOption::getOptionNames();
  const auto match = std::find_if(optionNames.begin(), optionNames.end(),
                                  [&](const auto &optionAndName) { return optionAndName.second == functionName; });

  // Check if the function name is supported.
  if (match == optionNames.end()) {
    std::string supportedFunctions = std::accumulate(
        optionNames.begin(), optionNames.end(), std::string(),
        [](const std::string &acc, const auto &b) { return acc.empty() ? b.second : acc + ", " + b.second; });
    utils::ExceptionHandler::exception(
        InvalidShapeError(fmt::format("Cannot create FuzzySet: {}. Unsupported function name: {}. Choose from {}",
                                      linguisticTerm, functionName, supportedFunctions)));
    return nullptr;
  }

  return makeFuzzySet(linguisticTerm, match->first, params);
}

std::shared_ptr<const FuzzySet> FuzzySetFactory::makeFuzzySet(const std::string &linguisticTerm,
                                                              MembershipFunctionOption function,
                                                              const std::vector<double> &params) {
  switch (function) {
    case MembershipFunctionOption::Triangle:
      if (params.size() != 3) {
        throwInvalidNumberOfArguments(linguisticTerm, function, 3, params.size());
        return nullptr;
      }
      return makeTriangle(linguisticTerm, params[0], params[1], params[2]);
    case MembershipFunctionOption::Trapezoid:
      if (params.size() != 4) {
        throwInvalidNumberOfArguments(linguisticTerm, function, 4, params.size());
        return nullptr;
      }
      return makeTrapezoid(linguisticTerm, params[0], params[1], params[2], params[3]);
    case MembershipFunctionOption::Gaussian:
      if (params.size() != 2) {
        throwInvalidNumberOfArguments(linguisticTerm, function, 2, params.size());
        return nullptr;
      }
      return makeGaussian(linguisticTerm, params[0], params[1]);
    default:
      utils::ExceptionHandler::exception(
          InvalidShapeError(fmt::format("Cannot create FuzzySet: {}. Unknown membership function.", linguisticTerm)));
      return nullptr;
  }
}

std::shared_ptr<const FuzzySet> FuzzySetFactory::makeTriangle(const std::string &linguisticTerm, double min,
                                                              double peak, double max) {
  const std::vector<double> params{min, peak, max};
  if (not checkParameters(linguisticTerm, MembershipFunctionOption::Triangle, params, true)) {
    return nullptr;
  }
  return std::make_shared<const FuzzySet>(
      linguisticTerm,
      FuzzySet::BaseMembershipFunction{MembershipFunctionOption::Triangle, params, triangleFunction(min, peak, max)});
}

std::shared_ptr<const FuzzySet> FuzzySetFactory::makeTrapezoid(const std::string &linguisticTerm, double min,
                                                               double leftPeak, double rightPeak, double max) {
  const std::vector<double> params{min, leftPeak, rightPeak, max};
  if (not checkParameters(linguisticTerm, MembershipFunctionOption::Trapezoid, params, true)) {
    return nullptr;
  }
  return std::make_shared<const FuzzySet>(
      linguisticTerm, FuzzySet::BaseMembershipFunction{MembershipFunctionOption::Trapezoid, params,
                                                       trapezoidFunction(min, leftPeak, rightPeak, max)});
}

std::shared_ptr<const FuzzySet> FuzzySetFactory::makeGaussian(const std::string &linguisticTerm, double mean,
                                                              double sigma) {
  const std::vector<double> params{mean, sigma};
  if (not checkParameters(linguisticTerm, MembershipFunctionOption::Gaussian, params, false)) {
    return nullptr;
  }
  if (sigma <= 0) {
    utils::ExceptionHandler::exception(InvalidShapeError(
        fmt::format("Cannot create FuzzySet: {}. Gaussian needs a positive sigma, got {}", linguisticTerm, sigma)));
    return nullptr;
  }
  return std::make_shared<const FuzzySet>(
      linguisticTerm,
      FuzzySet::BaseMembershipFunction{MembershipFunctionOption::Gaussian, params, gaussianFunction(mean, sigma)});
}

std::function<double(double)> FuzzySetFactory::triangleFunction(double min, double peak, double max) {
  // Zero width edges are never divided by: value < peak implies min < peak and value > peak implies peak < max.
  auto triangular = [min, peak, max](double value) {
    if (value < min or value > max) {
      return 0.0;
    } else if (value == peak) {
      return 1.0;
    } else if (value < peak) {
      return (value - min) / (peak - min);
    } else {
      return (max - value) / (max - peak);
    }
  };
  return triangular;
}

std::function<double(double)> FuzzySetFactory::trapezoidFunction(double min, double leftPeak, double rightPeak,
                                                                 double max) {
  auto trapezoidal = [min, leftPeak, rightPeak, max](double value) {
    if (value < min or value > max) {
      return 0.0;
    } else if (value >= leftPeak and value <= rightPeak) {
      return 1.0;
    } else if (value < leftPeak) {
      return (value - min) / (leftPeak - min);
    } else {
      return (max - value) / (max - rightPeak);
    }
  };
  return trapezoidal;
}

std::function<double(double)> FuzzySetFactory::gaussianFunction(double mean, double sigma) {
  auto gaussian = [mean, sigma](double value) { return std::exp(-0.5 * std::pow((value - mean) / sigma, 2)); };
  return gaussian;
}

bool FuzzySetFactory::checkParameters(const std::string &linguisticTerm, MembershipFunctionOption function,
                                      const std::vector<double> &params, bool checkOrder) {
  if (not std::all_of(params.begin(), params.end(), [](double p) { return std::isfinite(p); })) {
    utils::ExceptionHandler::exception(InvalidShapeError(fmt::format(
        "Cannot create FuzzySet: {}. Parameters of {} have to be finite.", linguisticTerm, function.to_string())));
    return false;
  }
  if (checkOrder and not std::is_sorted(params.begin(), params.end())) {
    utils::ExceptionHandler::exception(InvalidShapeError(
        fmt::format("Cannot create FuzzySet: {}. Parameters of {} have to be non-decreasing, got ({})", linguisticTerm,
                    function.to_string(), fmt::join(params, ", "))));
    return false;
  }
  return true;
}

void FuzzySetFactory::throwInvalidNumberOfArguments(const std::string &linguisticTerm,
                                                    MembershipFunctionOption function, size_t expected,
                                                    size_t actual) {
  utils::ExceptionHandler::exception(
      InvalidShapeError(fmt::format("Cannot create FuzzySet: {}. Wrong number of parameters for {}: Expected {}, got {}",
                                    linguisticTerm, function.to_string(), expected, actual)));
}

}  // namespace fuzzydetect::fuzzy_logic
