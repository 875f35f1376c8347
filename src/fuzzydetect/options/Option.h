/**
 * @file Option.h
 * @author FuzzyDetect developers
 * @date 19.10.26
 */

#pragma once

#include <algorithm>
#include <cctype>
#include <istream>
#include <ostream>
#include <set>
#include <string>
#include <utility>

#include "fuzzydetect/utils/ExceptionHandler.h"

namespace fuzzydetect {
inline namespace options {

/**
 * Common interface of all enum-like detector options.
 *
 * Derived classes wrap an enum and provide a static getOptionNames() mapping every enum value to its name.
 * Everything else (string conversion, parsing, enumeration) is derived from that map here.
 *
 * @tparam actualOption The derived option class (CRTP).
 */
template <typename actualOption>
class Option {
 public:
  /**
   * Options are no flags. Deleted so `if (option)` does not compile.
   */
  explicit operator bool() = delete;

  /**
   * All values this option can take.
   * @return
   */
  static std::set<actualOption> getAllOptions() {
    std::set<actualOption> options;
    for (const auto &[optionEnum, optionName] : actualOption::getOptionNames()) {
      options.insert(optionEnum);
    }
    return options;
  }

  /**
   * Joins the names of all values of this option, e.g. for help texts.
   * @param delimiter Put between two names.
   * @param surround Put before the first and after the last name.
   * @return E.g. "(canonical pairwise)".
   */
  static std::string allOptionNames(const std::string &delimiter = " ",
                                    const std::pair<std::string, std::string> &surround = {"(", ")"}) {
    std::string joined = surround.first;
    bool first = true;
    for (const auto &[optionEnum, optionName] : actualOption::getOptionNames()) {
      if (not first) {
        joined += delimiter;
      }
      joined += optionName;
      first = false;
    }
    return joined + surround.second;
  }

  /**
   * Name of the held value.
   * @param fixedLength Pad the name with spaces to maxStringLength().
   * @return The name or "Unknown Option (<IntValue>)" for values outside the enum.
   */
  [[nodiscard]] std::string to_string(bool fixedLength = false) const {
    const auto &self = *static_cast<const actualOption *>(this);
    // keep the map alive while its strings are used
    const auto names = actualOption::getOptionNames();
    const auto match = names.find(self);
    if (match == names.end()) {
      return "Unknown Option (" + std::to_string(self) + ")";
    }
    auto name = match->second;
    if (fixedLength) {
      name.resize(maxStringLength(), ' ');
    }
    return name;
  }

  /**
   * Length of the longest option name.
   * @return
   */
  [[nodiscard]] static size_t maxStringLength() {
    static const size_t maxLength = [] {
      size_t longest = 0;
      for (const auto &[optionEnum, optionName] : actualOption::getOptionNames()) {
        longest = std::max(longest, optionName.size());
      }
      return longest;
    }();
    return maxLength;
  }

  /**
   * Finds the option whose name equals the given string.
   *
   * If nothing matches an exception listing the valid names is raised through the ExceptionHandler.
   *
   * @tparam lowercase Compare against the lower case version of the option names.
   * @param optionString
   * @return The matching option.
   */
  template <bool lowercase = false>
  static actualOption parseOptionExact(const std::string &optionString) {
    for (auto [optionEnum, optionName] : actualOption::getOptionNames()) {
      if constexpr (lowercase) {
        std::transform(optionName.begin(), optionName.end(), optionName.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
      }
      if (optionString == optionName) {
        return optionEnum;
      }
    }

    utils::ExceptionHandler::exception("Option::parseOptionExact(): \"{}\" is none of {}", optionString,
                                       allOptionNames(", ", {"[", "]"}));
    return actualOption();
  }

  /**
   * Writes the option name.
   * @param os
   * @param option
   * @return
   */
  friend std::ostream &operator<<(std::ostream &os, const Option &option) { return os << option.to_string(); }

  /**
   * Reads one word and parses it as option name.
   * @param in
   * @param option
   * @return
   */
  friend std::istream &operator>>(std::istream &in, actualOption &option) {
    std::string word;
    in >> word;
    option = parseOptionExact(word);
    return in;
  }
};

}  // namespace options
}  // namespace fuzzydetect
