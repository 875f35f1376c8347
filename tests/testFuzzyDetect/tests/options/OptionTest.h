/**
 * @file OptionTest.h
 * @author FuzzyDetect developers
 * @date 19.10.26
 */

#pragma once

#include <gmock/gmock.h>

#include "FuzzyDetectTestBase.h"

namespace OptionTest {

/**
 * Typed fixture running the same checks on every option class.
 * @tparam T An option class derived from fuzzydetect::Option.
 */
template <typename T>
class OptionTest : public FuzzyDetectTestBase {};

}  // end namespace OptionTest
