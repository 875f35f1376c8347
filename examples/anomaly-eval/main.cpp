/**
 * @file main.cpp
 * @author FuzzyDetect developers
 * @date 19.10.26
 */

#include <cstdlib>
#include <iostream>

#include "fuzzydetect/FuzzyDetect.h"
#include "fuzzydetect/utils/WrapOpenMP.h"
#include "fuzzydetect/utils/logging/Logger.h"
#include "src/parsing/AnomalyEvalParser.h"

/**
 * The main function for anomaly-eval.
 * @param argc
 * @param argv
 * @return
 */
int main(int argc, char **argv) {
  AnomalyEvalConfig configuration;

  try {
    switch (AnomalyEvalParser::parseInput(argc, argv, configuration)) {
      case AnomalyEvalParser::exitCodes::success:
        break;
      case AnomalyEvalParser::exitCodes::helpFlagFound:
        return EXIT_SUCCESS;
      case AnomalyEvalParser::exitCodes::parsingError:
        return EXIT_FAILURE;
    }
  } catch (const std::exception &e) {
    std::cerr << "Error while parsing the input: " << e.what() << std::endl;
    return EXIT_FAILURE;
  }

  if (configuration.logFileName.value.empty()) {
    fuzzydetect::Logger::create(std::cerr);
  } else {
    fuzzydetect::Logger::create(configuration.logFileName.value);
  }
  fuzzydetect::Logger::get()->set_level(configuration.logLevel.value);

  FuzzyDetectLog(DEBUG, "Configuration:\n{}", configuration.to_string());
  if (configuration.indicators.value.empty()) {
    FuzzyDetectLog(WARN, "No indicators given. Nothing to evaluate.");
  }

  if (configuration.numThreads.value > 0) {
    fuzzydetect::fuzzydetect_set_num_threads(static_cast<int>(configuration.numThreads.value));
  }

  int exitCode = EXIT_SUCCESS;
  try {
    const fuzzydetect::AnomalyDetector detector(configuration.toDetectorSettings());
    for (const auto &result : detector.evaluate(configuration.indicators.value)) {
      std::cout << fmt::format("{:.4f} {} {}", result.score, result.label,
                               fuzzydetect::fuzzy_logic::to_string(result.status))
                << std::endl;
    }
  } catch (const std::exception &e) {
    std::cerr << e.what() << std::endl;
    exitCode = EXIT_FAILURE;
  }

  fuzzydetect::Logger::get()->flush();
  fuzzydetect::Logger::unregister();
  return exitCode;
}
