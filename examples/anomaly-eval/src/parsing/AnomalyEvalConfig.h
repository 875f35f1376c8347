/**
 * @file AnomalyEvalConfig.h
 * @author FuzzyDetect developers
 * @date 19.10.26
 */

#pragma once

#include <getopt.h>

#include <limits>
#include <string>
#include <utility>
#include <vector>

#include "fuzzydetect/AnomalyDetector.h"
#include "fuzzydetect/DetectorSettings.h"
#include "fuzzydetect/options/DefuzzificationMethodOption.h"
#include "fuzzydetect/options/RuleBaseOption.h"
#include "fuzzydetect/options/UncoveredInputPolicyOption.h"
#include "fuzzydetect/utils/logging/Logger.h"

/**
 * Class containing all necessary parameters for configuring an anomaly-eval run.
 */
class AnomalyEvalConfig {
 public:
  AnomalyEvalConfig() = default;

  /**
   * Struct to bundle information for options.
   * @tparam T Datatype of the option
   * @tparam getOptChar int for the switch case that is used during cli argument parsing with getOpt.
   * @note ints should be unique so they can be used for a switch case.
   * @note getOptChar should never be -1 because getopt uses this value to indicate that there are no more cli arguments
   */
  template <class T, int getOptChar>
  struct AnomalyEvalOption {
    /**
     * Value of this option.
     */
    T value;

    /**
     * Indicate whether this option is a flag or takes arguments.
     */
    bool requiresArgument;

    /**
     * String representation of the option name. Also the key of the option in yaml files.
     */
    std::string name;

    /**
     * String describing this option. This is displayed when anomaly-eval is invoked with --help.
     */
    std::string description;

    /**
     * Member to access the template parameter.
     */
    constexpr static int getoptChar{getOptChar};

    /**
     * Constructor
     * @param value Default value for this option.
     * @param newName String representation of the option name.
     * @param requiresArgument Indicate whether this option is a flag or takes arguments.
     * @param newDescription String describing this option. This is displayed when anomaly-eval is invoked with --help.
     */
    AnomalyEvalOption(T value, std::string newName, bool requiresArgument, std::string newDescription)
        : value(std::move(value)),
          requiresArgument(requiresArgument),
          name(std::move(newName)),
          description(std::move(newDescription)) {}

    /**
     * Returns a getopt option struct for this object.
     * @return
     */
    [[nodiscard]] struct option toGetoptOption() const {
      struct option retStruct {
        name.c_str(), requiresArgument, nullptr, getOptChar
      };
      return retStruct;
    }
  };

  /**
   * Convert the content of the config to a string representation.
   * @return
   */
  [[nodiscard]] std::string to_string() const;

  /**
   * Collects the options relevant for the detector.
   * @return
   */
  [[nodiscard]] fuzzydetect::DetectorSettings toDetectorSettings() const;

  /**
   * Parses a log level from its name. Only the first character is significant.
   * @param str
   * @param logLevel Set to the parsed level on success.
   * @return False if the string names no log level.
   */
  static bool parseLogLevel(const std::string &str, fuzzydetect::Logger::LogLevel &logLevel);

  /**
   * Parses indicator triples of the form "ep,mv,mc;ep,mv,mc".
   * @param str
   * @param indicators Set to the parsed triples on success.
   * @return False if any triple is malformed.
   */
  static bool parseIndicators(const std::string &str, std::vector<fuzzydetect::Indicators> &indicators);

  //  All options in the config

  /**
   * yamlFilename
   */
  AnomalyEvalOption<std::string, 'Y'> yamlFilename{"", "yaml-filename", true, "Path to a .yaml input file."};

  /**
   * ruleBase
   */
  AnomalyEvalOption<fuzzydetect::RuleBaseOption, 'r'> ruleBase{
      fuzzydetect::RuleBaseOption::canonical, "rule-base", true,
      "Built-in rule base of the detector. Possible Values: " + fuzzydetect::RuleBaseOption::allOptionNames()};

  /**
   * defuzzificationMethod
   */
  AnomalyEvalOption<fuzzydetect::DefuzzificationMethodOption, 'd'> defuzzificationMethod{
      fuzzydetect::DefuzzificationMethodOption::CoG, "defuzzification-method", true,
      "How the aggregated output set is reduced to a score. Possible Values: " +
          fuzzydetect::DefuzzificationMethodOption::allOptionNames()};

  /**
   * numSamples
   */
  AnomalyEvalOption<size_t, 'n'> numSamples{1001, "num-samples", true,
                                            "Number of sample points of the output domain used for defuzzification."};

  /**
   * uncoveredInputPolicy
   */
  AnomalyEvalOption<fuzzydetect::UncoveredInputPolicyOption, 'u'> uncoveredInputPolicy{
      fuzzydetect::UncoveredInputPolicyOption::undetermined, "uncovered-input-policy", true,
      "What to report if no rule fires. Possible Values: " + fuzzydetect::UncoveredInputPolicyOption::allOptionNames()};

  /**
   * numThreads
   */
  AnomalyEvalOption<size_t, 't'> numThreads{
      0, "num-threads", true,
      "Number of OpenMP threads for evaluating the indicators. 0 keeps the OpenMP default."};

  /**
   * logLevel
   */
  AnomalyEvalOption<fuzzydetect::Logger::LogLevel, 'l'> logLevel{
      fuzzydetect::Logger::LogLevel::warn, "log-level", true,
      "Log level for FuzzyDetect. Set to trace for per rule information. "
      "Possible Values: (trace debug info warn error critical off)"};

  /**
   * logFileName
   */
  AnomalyEvalOption<std::string, 'L'> logFileName{"", "log-file", true,
                                                  "Path to a file to store the log output. Default: stderr."};

  /**
   * indicators
   */
  AnomalyEvalOption<std::vector<fuzzydetect::Indicators>, 'i'> indicators{
      {}, "indicators", true,
      "Indicator triples to evaluate in the form \"ep,mv,mc;ep,mv,mc\". Every value has to lie in [0, 1]."};

  /**
   * Largest accepted num-threads, as OpenMP takes an int.
   */
  static constexpr long maxNumThreads{std::numeric_limits<int>::max()};

  /**
   * valueOffset used for cli-output alignment
   */
  static constexpr size_t valueOffset{26};
};
