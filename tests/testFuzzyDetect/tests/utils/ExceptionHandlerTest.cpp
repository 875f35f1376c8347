/**
 * @file ExceptionHandlerTest.cpp
 * @author FuzzyDetect developers
 * @date 19.10.26
 */

#include "ExceptionHandlerTest.h"

#include <cstdlib>
#include <stdexcept>

#include "fuzzydetect/fuzzyLogic/FuzzyLogicExceptions.h"
#include "fuzzydetect/utils/WrapOpenMP.h"

namespace ExceptionHandlerTest {

using fuzzydetect::utils::ExceptionBehavior;
using fuzzydetect::utils::ExceptionHandler;
using namespace fuzzydetect::fuzzy_logic;

void ExceptionHandlerTest::TearDown() {
  ExceptionHandler::setBehavior(ExceptionBehavior::throwException);
  ExceptionHandler::setCustomAbortFunction(std::abort);
}

TEST_F(ExceptionHandlerTest, throwIsDefault) {
  EXPECT_EQ(ExceptionHandler::getBehavior(), ExceptionBehavior::throwException);
  EXPECT_THROW(ExceptionHandler::exception("message"), ExceptionHandler::FuzzyDetectException);
  EXPECT_THROW(ExceptionHandler::exception(std::string("message")), ExceptionHandler::FuzzyDetectException);
}

/**
 * Exceptions are thrown with their static type, so the error kinds of the fuzzy logic can be told apart.
 */
TEST_F(ExceptionHandlerTest, throwKeepsErrorKind) {
  EXPECT_THROW(ExceptionHandler::exception(std::out_of_range("foreign")), std::out_of_range);
  EXPECT_THROW(ExceptionHandler::exception(InvalidShapeError("shape")), InvalidShapeError);
  EXPECT_THROW(ExceptionHandler::exception(UnknownTermError("term")), UnknownTermError);
  EXPECT_THROW(ExceptionHandler::exception(InputOutOfRangeError("range")), InputOutOfRangeError);
  EXPECT_THROW(ExceptionHandler::exception(InputOutOfRangeError("range")), ExceptionHandler::FuzzyDetectException);

  try {
    ExceptionHandler::exception(InputOutOfRangeError("forecastError = 1.5 is not in [0, 1]"));
    FAIL() << "InputOutOfRangeError not thrown";
  } catch (const InputOutOfRangeError &error) {
    EXPECT_STREQ(error.what(), "forecastError = 1.5 is not in [0, 1]");
  }
}

TEST_F(ExceptionHandlerTest, formattedMessages) {
  try {
    ExceptionHandler::exception("rule {} has weight {}", "normal", 1.5);
    FAIL() << "FuzzyDetectException not thrown";
  } catch (const ExceptionHandler::FuzzyDetectException &error) {
    EXPECT_STREQ(error.what(), "rule normal has weight 1.5");
  }

  try {
    ExceptionHandler::exception("{} samples, {} terms, sorted: {}", 1001, 4, false);
    FAIL() << "FuzzyDetectException not thrown";
  } catch (const ExceptionHandler::FuzzyDetectException &error) {
    EXPECT_STREQ(error.what(), "1001 samples, 4 terms, sorted: false");
  }
}

TEST_F(ExceptionHandlerTest, ignoreReturns) {
  ExceptionHandler::setBehavior(ExceptionBehavior::ignore);
  EXPECT_EQ(ExceptionHandler::getBehavior(), ExceptionBehavior::ignore);

  EXPECT_NO_THROW(ExceptionHandler::exception("message"));
  EXPECT_NO_THROW(ExceptionHandler::exception("value {}", 3));
  EXPECT_NO_THROW(ExceptionHandler::exception(UnknownTermError("term")));
}

TEST_F(ExceptionHandlerTest, customAbortFunctionIsCalled) {
  int numCalls = 0;
  ExceptionHandler::setCustomAbortFunction([&numCalls]() { ++numCalls; });
  ExceptionHandler::setBehavior(ExceptionBehavior::printCustomAbortFunction);

  ExceptionHandler::exception("first");
  ExceptionHandler::exception(InvalidShapeError("second"));
  EXPECT_EQ(numCalls, 2);
}

TEST_F(ExceptionHandlerTest, abortingBehaviorsDie) {
  ExceptionHandler::setBehavior(ExceptionBehavior::printAbort);
  EXPECT_DEATH(ExceptionHandler::exception("fatal"), "");
  EXPECT_DEATH(ExceptionHandler::exception(std::logic_error("fatal")), "");

  // the default custom abort function is std::abort
  ExceptionHandler::setBehavior(ExceptionBehavior::printCustomAbortFunction);
  EXPECT_DEATH(ExceptionHandler::exception("fatal"), "");

  ExceptionHandler::setCustomAbortFunction([]() {
    FuzzyDetectLog(CRITICAL, "custom abort");
    std::exit(3);
  });
  EXPECT_EXIT(ExceptionHandler::exception(UnknownTermError("fatal")), ::testing::ExitedWithCode(3), "");
}

TEST_F(ExceptionHandlerTest, rethrowInsideCatch) {
  try {
    throw UnknownTermError("unknown term");
  } catch (const std::exception &) {
    EXPECT_THROW(ExceptionHandler::rethrow(), UnknownTermError);
  }

  ExceptionHandler::setBehavior(ExceptionBehavior::ignore);
  try {
    throw std::runtime_error("dropped");
  } catch (const std::exception &) {
    EXPECT_NO_THROW(ExceptionHandler::rethrow());
  }
}

TEST_F(ExceptionHandlerTest, rethrowOutsideCatch) {
  try {
    ExceptionHandler::rethrow();
    FAIL() << "FuzzyDetectException not thrown";
  } catch (const ExceptionHandler::FuzzyDetectException &error) {
    EXPECT_THAT(error.what(), ::testing::HasSubstr("no exception is being handled"));
  }

  ExceptionHandler::setBehavior(ExceptionBehavior::ignore);
  EXPECT_NO_THROW(ExceptionHandler::rethrow());
}

/**
 * Errors may be reported from within the parallel batch evaluation.
 */
TEST_F(ExceptionHandlerTest, concurrentReports) {
  if (fuzzydetect::fuzzydetect_get_max_threads() < 2) {
    GTEST_SKIP() << "Needs more than one OpenMP thread.";
  }

  int numCalls = 0;
  ExceptionHandler::setCustomAbortFunction([&numCalls]() { ++numCalls; });
  ExceptionHandler::setBehavior(ExceptionBehavior::printCustomAbortFunction);

  constexpr int numReports = 100;
  // numCalls is only touched while the handler holds its mutex
#if defined(FUZZYDETECT_OPENMP)
#pragma omp parallel for
#endif
  for (int i = 0; i < numReports; ++i) {
    ExceptionHandler::exception(InputOutOfRangeError("report " + std::to_string(i)));
  }
  EXPECT_EQ(numCalls, numReports);
}

}  // end namespace ExceptionHandlerTest
