/**
 * @file AnomalyEvalParser.h
 * @author FuzzyDetect developers
 * @date 19.10.26
 */

#pragma once

#include "AnomalyEvalConfig.h"
#include "CLIParser.h"
#include "ParserExitCodes.h"
#include "YamlParser.h"

/**
 * Parser for input parameters of anomaly-eval.
 */
namespace AnomalyEvalParser {
/**
 * Parses the input from the command line and an optional yaml file. Values given on the command line override values
 * from the yaml file.
 * @param argc number of command line arguments.
 * @param argv command line argument array.
 * @param config configuration where the input is stored.
 * @return Indicator of success. See AnomalyEvalParser::exitCodes for possible values.
 */
exitCodes parseInput(int argc, char **argv, AnomalyEvalConfig &config);
}  // namespace AnomalyEvalParser
