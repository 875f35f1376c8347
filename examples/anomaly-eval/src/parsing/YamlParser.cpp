/**
 * @file YamlParser.cpp
 * @author FuzzyDetect developers
 * @date 19.10.26
 */

#include "YamlParser.h"

#include <iostream>

namespace AnomalyEvalParser::YamlParser {

bool parseYamlFile(AnomalyEvalConfig &config) {
  const YAML::Node node = YAML::LoadFile(config.yamlFilename.value);

  bool success = true;

  if (node[config.ruleBase.name]) {
    config.ruleBase.value = fuzzydetect::RuleBaseOption::parseOptionExact(node[config.ruleBase.name].as<std::string>());
  }
  if (node[config.defuzzificationMethod.name]) {
    config.defuzzificationMethod.value = fuzzydetect::DefuzzificationMethodOption::parseOptionExact(
        node[config.defuzzificationMethod.name].as<std::string>());
  }
  if (node[config.numSamples.name]) {
    const auto numSamples = node[config.numSamples.name].as<long>();
    if (numSamples < 2) {
      std::cerr << "YamlParser::parseYamlFile: " << config.numSamples.name << " has to be an integer >= 2 but is "
                << numSamples << std::endl;
      success = false;
    } else {
      config.numSamples.value = static_cast<size_t>(numSamples);
    }
  }
  if (node[config.uncoveredInputPolicy.name]) {
    config.uncoveredInputPolicy.value = fuzzydetect::UncoveredInputPolicyOption::parseOptionExact(
        node[config.uncoveredInputPolicy.name].as<std::string>());
  }
  if (node[config.numThreads.name]) {
    const auto numThreads = node[config.numThreads.name].as<long>();
    if (numThreads < 0 or numThreads > AnomalyEvalConfig::maxNumThreads) {
      std::cerr << "YamlParser::parseYamlFile: " << config.numThreads.name << " has to be an integer in [0, "
                << AnomalyEvalConfig::maxNumThreads << "] but is " << numThreads << std::endl;
      success = false;
    } else {
      config.numThreads.value = static_cast<size_t>(numThreads);
    }
  }
  if (node[config.logLevel.name]) {
    const auto strArg = node[config.logLevel.name].as<std::string>();
    if (not AnomalyEvalConfig::parseLogLevel(strArg, config.logLevel.value)) {
      std::cerr << "YamlParser::parseYamlFile: Unknown Log Level: " << strArg << std::endl;
      success = false;
    }
  }
  if (node[config.logFileName.name]) {
    config.logFileName.value = node[config.logFileName.name].as<std::string>();
  }
  if (node[config.indicators.name]) {
    const auto indicatorsNode = node[config.indicators.name];
    if (not indicatorsNode.IsSequence()) {
      throw std::runtime_error("YamlParser::parseYamlFile: " + config.indicators.name +
                               " has to be a sequence of [ep, mv, mc] triples!");
    }
    config.indicators.value.clear();
    for (const auto &triple : indicatorsNode) {
      if (not triple.IsSequence() or triple.size() != 3) {
        throw std::runtime_error("YamlParser::parseYamlFile: every entry of " + config.indicators.name +
                                 " has to be a triple [ep, mv, mc]!");
      }
      config.indicators.value.push_back({triple[0].as<double>(), triple[1].as<double>(), triple[2].as<double>()});
    }
  }

  return success;
}

}  // namespace AnomalyEvalParser::YamlParser
