/**
 * @file ExceptionHandler.h
 * @author FuzzyDetect developers
 * @date 19.10.26
 */

#pragma once

#include <spdlog/fmt/fmt.h>

#include <exception>
#include <functional>
#include <mutex>
#include <string>

#include "fuzzydetect/utils/logging/Logger.h"

namespace fuzzydetect::utils {

/**
 * What ExceptionHandler does with a reported error.
 */
enum ExceptionBehavior {
  /**
   * Drop the error. The reporting function continues with its fallback.
   */
  ignore,
  /**
   * Throw the error. This is the default.
   */
  throwException,
  /**
   * Log the error and call std::abort().
   */
  printAbort,
  /**
   * Log the error and call the function passed to setCustomAbortFunction().
   */
  printCustomAbortFunction,
};

/**
 * Central place through which FuzzyDetect reports errors.
 *
 * Every configuration or input error goes through exception(). The globally set ExceptionBehavior decides whether it
 * is thrown, dropped or ends the program. Code reporting an error must therefore be prepared for exception() to
 * return and continue with a sensible fallback, e.g. the undetermined inference result.
 */
class ExceptionHandler {
 public:
  /**
   * Exception type of all errors raised by FuzzyDetect.
   * The error kinds of the fuzzy logic derive from it.
   */
  class FuzzyDetectException : public std::exception {
   public:
    /**
     * Constructor.
     * @param description Returned by what().
     */
    explicit FuzzyDetectException(std::string description);

    [[nodiscard]] const char *what() const noexcept override;

   private:
    std::string _description;
  };

  /**
   * Sets how subsequently reported errors are handled.
   * @param behavior
   */
  static void setBehavior(ExceptionBehavior behavior);

  /**
   * @return The active behavior.
   */
  static ExceptionBehavior getBehavior();

  /**
   * Function called under printCustomAbortFunction.
   * @param function
   */
  static void setCustomAbortFunction(std::function<void()> function);

  /**
   * Reports an exception object.
   * @tparam Exception Thrown with this static type, so derived error kinds stay catchable as such.
   * @param e
   */
  template <class Exception>
  static void exception(const Exception e) {
    std::lock_guard<std::mutex> guard(exceptionMutex);
    if (_behavior == throwException) {
      throw e;  // NOLINT
    }
    handleWithoutThrowing(e);
  }

  /**
   * Reports a FuzzyDetectException with the given message.
   * @param message
   */
  static void exception(const std::string &message);

  /**
   * Reports a FuzzyDetectException with the given message.
   * @param message
   */
  static void exception(const char *message);

  /**
   * Reports a FuzzyDetectException with a fmt formatted message, e.g.
   * exception("weight {} is not in [{}, {}]", weight, 0., 1.);
   * @tparam First
   * @tparam Args
   * @param formatString
   * @param first
   * @param args
   */
  template <typename First, typename... Args>
  static void exception(const std::string &formatString, const First &first, const Args &...args) {
    exception(fmt::format(fmt::runtime(formatString), first, args...));
  }

  /**
   * Reports the exception currently being handled.
   * @note Only meaningful inside a catch block. Outside of one an error about the misuse is reported instead.
   */
  static void rethrow();

 private:
  static std::mutex exceptionMutex;
  static ExceptionBehavior _behavior;
  static std::function<void()> _customAbortFunction;

  /**
   * Everything but throwException. Expects exceptionMutex to be held.
   * @param e
   */
  static void handleWithoutThrowing(const std::exception &e);
};

}  // namespace fuzzydetect::utils
