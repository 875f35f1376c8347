/**
 * @file ExceptionHandlerTest.h
 * @author FuzzyDetect developers
 * @date 19.10.26
 */

#pragma once

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "FuzzyDetectTestBase.h"
#include "fuzzydetect/utils/ExceptionHandler.h"

namespace ExceptionHandlerTest {

/**
 * Restores the default behavior and abort function after every test.
 */
class ExceptionHandlerTest : public FuzzyDetectTestBase {
 protected:
  void TearDown() override;
};

}  // end namespace ExceptionHandlerTest
