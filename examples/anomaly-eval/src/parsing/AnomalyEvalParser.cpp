/**
 * @file AnomalyEvalParser.cpp
 * @author FuzzyDetect developers
 * @date 19.10.26
 */

#include "AnomalyEvalParser.h"

#include <string>
#include <vector>

AnomalyEvalParser::exitCodes AnomalyEvalParser::parseInput(int argc, char **argv, AnomalyEvalConfig &config) {
  // we need to copy argv because the call to getOpt in CLIParser::inputFilesPresent reorders it
  std::vector<std::string> argvStrings(argv, argv + argc);
  std::vector<char *> argvCopy;
  argvCopy.reserve(argc + 1);
  for (auto &arg : argvStrings) {
    argvCopy.push_back(arg.data());
  }
  argvCopy.push_back(nullptr);

  CLIParser::inputFilesPresent(argc, argv, config);

  if (not config.yamlFilename.value.empty()) {
    if (not YamlParser::parseYamlFile(config)) {
      return exitCodes::parsingError;
    }
  }

  return CLIParser::parseInput(argc, argvCopy.data(), config);
}
