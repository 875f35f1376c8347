/**
 * @file ExceptionHandler.cpp
 * @author FuzzyDetect developers
 * @date 19.10.26
 */

#include "fuzzydetect/utils/ExceptionHandler.h"

#include <cstdlib>

namespace fuzzydetect::utils {

std::mutex ExceptionHandler::exceptionMutex;
ExceptionBehavior ExceptionHandler::_behavior = ExceptionBehavior::throwException;
std::function<void()> ExceptionHandler::_customAbortFunction = std::abort;

void ExceptionHandler::setBehavior(ExceptionBehavior behavior) {
  std::lock_guard<std::mutex> guard(exceptionMutex);
  _behavior = behavior;
}

ExceptionBehavior ExceptionHandler::getBehavior() {
  std::lock_guard<std::mutex> guard(exceptionMutex);
  return _behavior;
}

void ExceptionHandler::setCustomAbortFunction(std::function<void()> function) {
  std::lock_guard<std::mutex> guard(exceptionMutex);
  _customAbortFunction = std::move(function);
}

void ExceptionHandler::exception(const std::string &message) { exception(FuzzyDetectException(message)); }

void ExceptionHandler::exception(const char *message) { exception(FuzzyDetectException(message)); }

void ExceptionHandler::rethrow() {
  const auto current = std::current_exception();
  if (not current) {
    exception("ExceptionHandler::rethrow(): no exception is being handled.");
    return;
  }

  std::lock_guard<std::mutex> guard(exceptionMutex);
  if (_behavior == throwException) {
    std::rethrow_exception(current);
  }
  try {
    std::rethrow_exception(current);
  } catch (const std::exception &e) {
    handleWithoutThrowing(e);
  }
}

void ExceptionHandler::handleWithoutThrowing(const std::exception &e) {
  switch (_behavior) {
    case printAbort: {
      Logger::createIfMissing();
      FuzzyDetectLog(CRITICAL, "{}\nAborting.", e.what());
      std::abort();
    }
    case printCustomAbortFunction: {
      Logger::createIfMissing();
      FuzzyDetectLog(CRITICAL, "{}\nCalling the custom abort function.", e.what());
      _customAbortFunction();
      break;
    }
    case ignore:
    case throwException:
      break;
  }
}

ExceptionHandler::FuzzyDetectException::FuzzyDetectException(std::string description)
    : _description(std::move(description)) {}

const char *ExceptionHandler::FuzzyDetectException::what() const noexcept { return _description.c_str(); }

}  // namespace fuzzydetect::utils
