/**
 * @file LoggerTest.h
 * @author FuzzyDetect developers
 * @date 19.10.26
 */

#pragma once

#include <gtest/gtest.h>

#include <sstream>

#include "FuzzyDetectTestBase.h"

namespace LoggerTest {

/**
 * Redirects the FuzzyDetect logger into a string stream.
 */
class LoggerTest : public FuzzyDetectTestBase {
 protected:
  void SetUp() override;

  /**
   * Logs one message on every level.
   * @param level Level the logger is set to beforehand.
   * @return Number of lines that reached the stream.
   */
  int countPrintedLines(fuzzydetect::Logger::LogLevel level);

  std::stringstream stream;
};

}  // end namespace LoggerTest
