/**
 * @file FuzzyControlSystemTest.h
 * @author FuzzyDetect developers
 * @date 19.10.26
 */

#pragma once

#include <gtest/gtest.h>

#include <memory>
#include <string>

#include "FuzzyDetectTestBase.h"
#include "fuzzydetect/fuzzyLogic/FuzzyControlSystem.h"

/**
 * Works on a system with one input x and one output y, both on [0, 10], each with a low and a high term that meet at
 * 5 with degree 0. The rules are x == low -> y == small and x == high -> y == large.
 */
class FuzzyControlSystemTest : public FuzzyDetectTestBase {
 protected:
  void SetUp() override;

  void TearDown() override;

  /**
   * Builds the fuzzy control system with the two rules.
   * @param settings Settings passed to the system.
   * @return
   */
  std::shared_ptr<fuzzydetect::fuzzy_logic::FuzzyControlSystem> makeSystem(
      const fuzzydetect::fuzzy_logic::FuzzyControlSettings &settings = {});

  std::shared_ptr<fuzzydetect::fuzzy_logic::LinguisticVariable> x;
  std::shared_ptr<fuzzydetect::fuzzy_logic::LinguisticVariable> y;
};
