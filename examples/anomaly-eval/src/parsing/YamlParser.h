/**
 * @file YamlParser.h
 * @author FuzzyDetect developers
 * @date 19.10.26
 */
#pragma once

#include <yaml-cpp/yaml.h>

#include <string>

#include "AnomalyEvalConfig.h"

/**
 * Parser for input through YAML files.
 */
namespace AnomalyEvalParser::YamlParser {
/**
 * Parses the input for anomaly-eval from the Yaml File specified in the configuration.
 * Keys are the long names of the command line options.
 * @param config configuration where the input is stored.
 * @return false if any errors occurred during parsing.
 * @throws YAML::Exception if the file is no valid yaml or a value has the wrong type.
 */
bool parseYamlFile(AnomalyEvalConfig &config);
}  // namespace AnomalyEvalParser::YamlParser
