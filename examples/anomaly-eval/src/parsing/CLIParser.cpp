/**
 * @file CLIParser.cpp
 * @author FuzzyDetect developers
 * @date 19.10.26
 */

#include "CLIParser.h"

#include <sys/stat.h>

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <limits>
#include <stdexcept>

namespace {

/**
 * Parses a case insensitive option name into target.
 * @tparam OptionType Class derived from fuzzydetect::Option.
 * @param strArg
 * @param target Untouched on failure.
 * @param what Printed in the error message.
 * @return False if strArg names no value of OptionType.
 */
template <class OptionType>
bool parseOptionArgument(std::string strArg, OptionType &target, const std::string &what) {
  std::transform(strArg.begin(), strArg.end(), strArg.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  try {
    target = OptionType::template parseOptionExact<true>(strArg);
    return true;
  } catch (const std::exception &) {
    std::cerr << "Unknown " << what << ": " << strArg << ". Possible values: " << OptionType::allOptionNames()
              << std::endl;
    return false;
  }
}

/**
 * Parses an integer in [minValue, maxValue] into target.
 * @param strArg
 * @param target Untouched on failure.
 * @param minValue
 * @param maxValue
 * @param what Printed in the error message.
 * @return
 */
bool parseCountArgument(const std::string &strArg, size_t &target, long minValue, long maxValue,
                        const std::string &what) {
  try {
    size_t numParsed = 0;
    const auto value = std::stol(strArg, &numParsed);
    if (numParsed != strArg.size() or value < minValue or value > maxValue) {
      std::cerr << what << " has to be an integer in [" << minValue << ", " << maxValue << "] but is " << strArg
                << std::endl;
      return false;
    }
    target = static_cast<size_t>(value);
    return true;
  } catch (const std::exception &) {
    std::cerr << "Error parsing " << what << ": " << strArg << std::endl;
    return false;
  }
}

}  // namespace

AnomalyEvalParser::exitCodes AnomalyEvalParser::CLIParser::parseInput(int argc, char **argv,
                                                                        AnomalyEvalConfig &config) {
  using namespace std;

  const auto helpOption =
      AnomalyEvalConfig::AnomalyEvalOption<std::string, 'h'>("", "help", false, "Display this message.");

  // create data structure for options that getopt can use
  const std::vector<struct option> long_options{
      config.yamlFilename.toGetoptOption(),
      config.ruleBase.toGetoptOption(),
      config.defuzzificationMethod.toGetoptOption(),
      config.numSamples.toGetoptOption(),
      config.uncoveredInputPolicy.toGetoptOption(),
      config.numThreads.toGetoptOption(),
      config.logLevel.toGetoptOption(),
      config.logFileName.toGetoptOption(),
      config.indicators.toGetoptOption(),
      helpOption.toGetoptOption(),
      // needed to signal the end of the array
      {nullptr, no_argument, nullptr, 0},
  };

  const std::vector<std::string> optionNames{
      config.yamlFilename.name,         config.ruleBase.name,   config.defuzzificationMethod.name,
      config.numSamples.name,           config.uncoveredInputPolicy.name,
      config.numThreads.name,           config.logLevel.name,   config.logFileName.name,
      config.indicators.name,           helpOption.name,
  };
  const std::vector<std::string> optionDescriptions{
      config.yamlFilename.description,  config.ruleBase.description, config.defuzzificationMethod.description,
      config.numSamples.description,    config.uncoveredInputPolicy.description,
      config.numThreads.description,    config.logLevel.description, config.logFileName.description,
      config.indicators.description,    helpOption.description,
  };

  // reset getopt to scan from the start of argv
  optind = 1;
  bool displayHelp = false;
  for (int cliOption = 0, cliOptionIndex = 0;
       (cliOption = getopt_long(argc, argv, "", long_options.data(), &cliOptionIndex)) != -1;) {
    string strArg;
    if (optarg != nullptr) strArg = optarg;
    switch (cliOption) {
      case decltype(config.yamlFilename)::getoptChar: {
        // already parsed in CLIParser::inputFilesPresent
        break;
      }
      case decltype(config.ruleBase)::getoptChar: {
        displayHelp |= not parseOptionArgument(strArg, config.ruleBase.value, "rule base");
        break;
      }
      case decltype(config.defuzzificationMethod)::getoptChar: {
        displayHelp |= not parseOptionArgument(strArg, config.defuzzificationMethod.value, "defuzzification method");
        break;
      }
      case decltype(config.numSamples)::getoptChar: {
        displayHelp |= not parseCountArgument(strArg, config.numSamples.value, 2, std::numeric_limits<long>::max(),
                                              "Number of samples");
        break;
      }
      case decltype(config.uncoveredInputPolicy)::getoptChar: {
        displayHelp |= not parseOptionArgument(strArg, config.uncoveredInputPolicy.value, "uncovered input policy");
        break;
      }
      case decltype(config.numThreads)::getoptChar: {
        displayHelp |= not parseCountArgument(strArg, config.numThreads.value, 0, AnomalyEvalConfig::maxNumThreads,
                                              "Number of threads");
        break;
      }
      case decltype(config.logLevel)::getoptChar: {
        if (not AnomalyEvalConfig::parseLogLevel(strArg, config.logLevel.value)) {
          cerr << "Unknown log level: " << strArg << ". Possible values: (trace debug info warn error critical off)"
               << endl;
          displayHelp = true;
        }
        break;
      }
      case decltype(config.logFileName)::getoptChar: {
        config.logFileName.value = strArg;
        break;
      }
      case decltype(config.indicators)::getoptChar: {
        if (not AnomalyEvalConfig::parseIndicators(strArg, config.indicators.value)) {
          cerr << "Error parsing indicators: " << strArg << endl;
          cerr << "Expected triples of numbers in the form \"ep,mv,mc;ep,mv,mc\"." << endl;
          displayHelp = true;
        }
        break;
      }
      case decltype(helpOption)::getoptChar: {
        printHelpMessage(std::cout, argv[0], optionNames, optionDescriptions);
        return AnomalyEvalParser::exitCodes::helpFlagFound;
      }
      default: {
        // getopt already complained
        displayHelp = true;
      }
    }
  }

  if (displayHelp) {
    printHelpMessage(std::cout, argv[0], optionNames, optionDescriptions);
    return AnomalyEvalParser::exitCodes::parsingError;
  }
  return AnomalyEvalParser::exitCodes::success;
}

void AnomalyEvalParser::CLIParser::printHelpMessage(std::ostream &ostream, const std::string &relPathOfExecutable,
                                                    const std::vector<std::string> &optionNames,
                                                    const std::vector<std::string> &optionDescriptions) {
  ostream << "Usage: " << relPathOfExecutable << " [OPTION]..." << std::endl;
  ostream << "Evaluates indicator triples with the fuzzy anomaly detector and prints \"score label status\" per triple."
          << std::endl
          << std::endl;
  for (size_t i = 0; i < optionNames.size(); ++i) {
    ostream << "    --" << std::setw(AnomalyEvalConfig::valueOffset + 2) << std::left << optionNames[i]
            << optionDescriptions[i] << std::endl;
  }
}

// anonymous namespace to hide helper function
namespace {

/**
 * Checks if a file with the given path exists.
 * @param filename
 * @return True iff the file exists.
 */
bool checkFileExists(const std::string &filename) {
  struct stat buffer;
  return (stat(filename.c_str(), &buffer) == 0);
}

}  // namespace

void AnomalyEvalParser::CLIParser::inputFilesPresent(int argc, char **argv, AnomalyEvalConfig &config) {
  // suppress error messages since we only want to look if the yaml option is there
  auto opterrBefore = opterr;
  opterr = 0;
  const struct option longOptions[] = {config.yamlFilename.toGetoptOption(),
                                       {nullptr, 0, nullptr, 0}};  // needed to signal the end of the array
  optind = 1;

  // search all cli parameters for input file options
  for (int cliOption = 0, cliOptionIndex = 0;
       (cliOption = getopt_long(argc, argv, "", longOptions, &cliOptionIndex)) != -1;) {
    switch (cliOption) {
      case decltype(config.yamlFilename)::getoptChar:
        config.yamlFilename.value = optarg;
        if (not checkFileExists(optarg)) {
          opterr = opterrBefore;
          throw std::runtime_error("CLIParser::inputFilesPresent: Yaml-File " + config.yamlFilename.value +
                                   " not found!");
        }
        break;
      default: {
        // do nothing
      }
    }
  }

  opterr = opterrBefore;
}
