/**
 * @file AnomalyEvalConfig.cpp
 * @author FuzzyDetect developers
 * @date 19.10.26
 */

#include "AnomalyEvalConfig.h"

#include <cctype>
#include <iomanip>
#include <sstream>

std::string AnomalyEvalConfig::to_string() const {
  using namespace std;
  ostringstream os;

  os << setw(valueOffset) << left << ruleBase.name << ":  " << ruleBase.value << endl;
  os << setw(valueOffset) << left << defuzzificationMethod.name << ":  " << defuzzificationMethod.value << endl;
  os << setw(valueOffset) << left << numSamples.name << ":  " << numSamples.value << endl;
  os << setw(valueOffset) << left << uncoveredInputPolicy.name << ":  " << uncoveredInputPolicy.value << endl;
  os << setw(valueOffset) << left << numThreads.name << ":  " << numThreads.value << endl;
  os << setw(valueOffset) << left << logLevel.name << ":  " << spdlog::level::to_string_view(logLevel.value).data()
     << endl;
  if (not logFileName.value.empty()) {
    os << setw(valueOffset) << left << logFileName.name << ":  " << logFileName.value << endl;
  }
  os << setw(valueOffset) << left << indicators.name << ":" << endl;
  for (const auto &[ep, mv, mc] : indicators.value) {
    os << "  - [" << ep << ", " << mv << ", " << mc << "]" << endl;
  }
  return os.str();
}

fuzzydetect::DetectorSettings AnomalyEvalConfig::toDetectorSettings() const {
  fuzzydetect::DetectorSettings settings;
  settings.ruleBase = ruleBase.value;
  settings.defuzzificationMethod = defuzzificationMethod.value;
  settings.numSamples = numSamples.value;
  settings.uncoveredInputPolicy = uncoveredInputPolicy.value;
  return settings;
}

bool AnomalyEvalConfig::parseLogLevel(const std::string &str, fuzzydetect::Logger::LogLevel &logLevel) {
  if (str.empty()) {
    return false;
  }
  switch (std::tolower(static_cast<unsigned char>(str[0]))) {
    case 't': {
      logLevel = fuzzydetect::Logger::LogLevel::trace;
      return true;
    }
    case 'd': {
      logLevel = fuzzydetect::Logger::LogLevel::debug;
      return true;
    }
    case 'i': {
      logLevel = fuzzydetect::Logger::LogLevel::info;
      return true;
    }
    case 'w': {
      logLevel = fuzzydetect::Logger::LogLevel::warn;
      return true;
    }
    case 'e': {
      logLevel = fuzzydetect::Logger::LogLevel::err;
      return true;
    }
    case 'c': {
      logLevel = fuzzydetect::Logger::LogLevel::critical;
      return true;
    }
    case 'o': {
      logLevel = fuzzydetect::Logger::LogLevel::off;
      return true;
    }
    default:
      return false;
  }
}

bool AnomalyEvalConfig::parseIndicators(const std::string &str, std::vector<fuzzydetect::Indicators> &indicators) {
  std::vector<fuzzydetect::Indicators> parsed;
  std::istringstream tripleStream(str);
  std::string triple;
  while (std::getline(tripleStream, triple, ';')) {
    if (triple.find_first_not_of(" \t") == std::string::npos) {
      continue;
    }
    std::istringstream valueStream(triple);
    std::string valueStr;
    std::vector<double> values;
    while (std::getline(valueStream, valueStr, ',')) {
      try {
        size_t parsedChars = 0;
        values.push_back(std::stod(valueStr, &parsedChars));
        if (valueStr.find_first_not_of(" \t", parsedChars) != std::string::npos) {
          return false;
        }
      } catch (const std::exception &) {
        return false;
      }
    }
    if (values.size() != 3) {
      return false;
    }
    parsed.push_back({values[0], values[1], values[2]});
  }
  indicators = std::move(parsed);
  return true;
}
