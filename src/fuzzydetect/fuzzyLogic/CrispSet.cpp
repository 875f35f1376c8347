/**
 * @file CrispSet.cpp
 * @author FuzzyDetect developers
 * @date 19.10.26
 */

#include "CrispSet.h"

#include <cmath>

#include "fuzzydetect/utils/ExceptionHandler.h"
#include "fuzzydetect/utils/Math.h"

namespace fuzzydetect::fuzzy_logic {

CrispSet::CrispSet(std::string name, const std::pair<double, double> &range) : _name(std::move(name)), _range(range) {
  if (not(std::isfinite(range.first) and std::isfinite(range.second) and range.first < range.second)) {
    utils::ExceptionHandler::exception("CrispSet {}: invalid range [{}, {}]. Expected finite min < max.", _name,
                                       range.first, range.second);
  }
}

bool CrispSet::contains(double value) const { return utils::Math::isInInterval(value, _range.first, _range.second); }

Eigen::ArrayXd CrispSet::sample(size_t numSamples) const {
  if (numSamples < 2) {
    utils::ExceptionHandler::exception("CrispSet {}: at least two samples are needed, got {}", _name, numSamples);
    numSamples = 2;
  }
  return Eigen::ArrayXd::LinSpaced(static_cast<Eigen::Index>(numSamples), _range.first, _range.second);
}

double CrispSet::getMidpoint() const { return 0.5 * (_range.first + _range.second); }

const std::string &CrispSet::getName() const { return _name; }

const std::pair<double, double> &CrispSet::getRange() const { return _range; }

CrispSet::operator std::string() const { return fmt::format("CrispSet: {{{}: [{}, {}]}}", _name, _range.first, _range.second); }

}  // namespace fuzzydetect::fuzzy_logic
