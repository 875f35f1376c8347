/**
 * @file FuzzyLogicExceptions.h
 * @author FuzzyDetect developers
 * @date 19.10.26
 */

#pragma once

#include <string>

#include "fuzzydetect/utils/ExceptionHandler.h"

namespace fuzzydetect::fuzzy_logic {

/**
 * Raised when a membership function is constructed from malformed parameters.
 * Thrown at configuration time, never recovered from silently.
 */
class InvalidShapeError : public utils::ExceptionHandler::FuzzyDetectException {
 public:
  /**
   * Constructor.
   * @param description
   */
  explicit InvalidShapeError(std::string description) : FuzzyDetectException(std::move(description)) {}
};

/**
 * Raised when a (variable, linguistic term) pair is referenced that no linguistic variable defines.
 */
class UnknownTermError : public utils::ExceptionHandler::FuzzyDetectException {
 public:
  /**
   * Constructor.
   * @param description
   */
  explicit UnknownTermError(std::string description) : FuzzyDetectException(std::move(description)) {}
};

/**
 * Raised when a crisp input lies outside the domain of its linguistic variable or is not finite.
 * The fuzzy control system is stateless across calls, so it stays usable after this error.
 */
class InputOutOfRangeError : public utils::ExceptionHandler::FuzzyDetectException {
 public:
  /**
   * Constructor.
   * @param description
   */
  explicit InputOutOfRangeError(std::string description) : FuzzyDetectException(std::move(description)) {}
};

}  // namespace fuzzydetect::fuzzy_logic
