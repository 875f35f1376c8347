/**
 * @file CLIParser.h
 * @author FuzzyDetect developers
 * @date 19.10.26
 */

#pragma once

#include <getopt.h>

#include <iostream>
#include <string>
#include <vector>

#include "AnomalyEvalConfig.h"
#include "ParserExitCodes.h"

/**
 * Parser for input from the command line.
 */
namespace AnomalyEvalParser::CLIParser {
/**
 * Checks if a yaml file is specified in the given command line arguments.
 * If one is found, its path is saved in the given configuration.
 *
 * @param argc number of command line arguments.
 * @param argv command line argument array.
 * @param config configuration where the input is stored.
 * @throws std::runtime_error if the file does not exist.
 */
void inputFilesPresent(int argc, char **argv, AnomalyEvalConfig &config);

/**
 * Parses the input for anomaly-eval from the command line.
 * @param argc number of command line arguments.
 * @param argv command line argument array.
 * @param config configuration where the input is stored.
 * @return Indicator of success. See AnomalyEvalParser::exitCodes for possible values.
 */
AnomalyEvalParser::exitCodes parseInput(int argc, char **argv, AnomalyEvalConfig &config);

/**
 * Prints the help message to the given stream.
 * @param ostream Typically std::out.
 * @param relPathOfExecutable  Typically argv[0].
 * @param optionNames names of all options.
 * @param optionDescriptions descriptions of all options in the same order.
 */
void printHelpMessage(std::ostream &ostream, const std::string &relPathOfExecutable,
                      const std::vector<std::string> &optionNames, const std::vector<std::string> &optionDescriptions);

}  // namespace AnomalyEvalParser::CLIParser
