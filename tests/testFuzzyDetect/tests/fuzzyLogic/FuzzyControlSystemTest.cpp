/**
 * @file FuzzyControlSystemTest.cpp
 * @author FuzzyDetect developers
 * @date 19.10.26
 */

#include "FuzzyControlSystemTest.h"

#include <limits>

#include "fuzzydetect/fuzzyLogic/FuzzyLogicExceptions.h"
#include "fuzzydetect/fuzzyLogic/FuzzySetFactory.h"

using namespace fuzzydetect;
using namespace fuzzydetect::fuzzy_logic;

void FuzzyControlSystemTest::SetUp() {
  x = std::make_shared<LinguisticVariable>("x", std::make_pair(0., 10.));
  x->addLinguisticTerm(FuzzySetFactory::makeTriangle("low", 0, 0, 5));
  x->addLinguisticTerm(FuzzySetFactory::makeTriangle("high", 5, 10, 10));

  y = std::make_shared<LinguisticVariable>("y", std::make_pair(0., 10.));
  y->addLinguisticTerm(FuzzySetFactory::makeTriangle("small", 0, 0, 5));
  y->addLinguisticTerm(FuzzySetFactory::makeTriangle("large", 5, 10, 10));
}

void FuzzyControlSystemTest::TearDown() {
  utils::ExceptionHandler::setBehavior(utils::ExceptionBehavior::throwException);
}

std::shared_ptr<FuzzyControlSystem> FuzzyControlSystemTest::makeSystem(const FuzzyControlSettings &settings) {
  auto fcs = std::make_shared<FuzzyControlSystem>(std::vector<std::shared_ptr<const LinguisticVariable>>{x}, y,
                                                  std::make_shared<FuzzyControlSettings>(settings));
  fcs->addRule(FuzzyRule(*x == "low", *y == "small"));
  fcs->addRule(FuzzyRule(*x == "high", *y == "large"));
  return fcs;
}

/**
 * A fully activated shoulder is defuzzified to the centroid of the triangle.
 */
TEST_F(FuzzyControlSystemTest, testPredictCenterOfGravity) {
  const auto fcs = makeSystem();

  const auto result = fcs->predict({{"x", 0.}});
  EXPECT_NEAR(result.crispValue, 5. / 3., 1e-2);
  EXPECT_EQ(result.linguisticTerm, "small");
  EXPECT_EQ(result.status, InferenceStatus::fired);

  const auto large = fcs->predict({{"x", 10.}});
  EXPECT_NEAR(large.crispValue, 25. / 3., 1e-2);
  EXPECT_EQ(large.linguisticTerm, "large");
}

/**
 * Clipping the small set at 0.5 leaves a trapezoid with plateau [0, 2.5].
 */
TEST_F(FuzzyControlSystemTest, testPredictClipped) {
  const auto cog = makeSystem();
  const auto cogResult = cog->predict({{"x", 2.5}});
  // centroid of the rectangle [0, 2.5] and the triangle [2.5, 5] of height 0.5
  const double expected = (1.25 * 1.25 + 0.625 * (2.5 + 2.5 / 3.)) / 1.875;
  EXPECT_NEAR(cogResult.crispValue, expected, 1e-2);
  EXPECT_EQ(cogResult.linguisticTerm, "small");

  const auto mom = makeSystem({{"defuzzificationMethod", "meanOfMaximum"}});
  EXPECT_EQ(mom->getDefuzzificationMethod(), DefuzzificationMethodOption::MoM);
  const auto momResult = mom->predict({{"x", 2.5}});
  EXPECT_NEAR(momResult.crispValue, 1.25, 1e-6);
  EXPECT_EQ(momResult.linguisticTerm, "small");
  EXPECT_EQ(momResult.status, InferenceStatus::fired);
}

TEST_F(FuzzyControlSystemTest, testAggregatedStrengths) {
  const auto fcs = makeSystem();
  fcs->addRule(FuzzyRule(*x == "high", *y == "small", 0.3));

  const auto result = fcs->predict({{"x", 10.}});
  ASSERT_EQ(result.aggregatedStrengths.size(), 2);
  // output term order, max over the rules of a consequent
  EXPECT_EQ(result.aggregatedStrengths[0].first, "small");
  EXPECT_DOUBLE_EQ(result.aggregatedStrengths[0].second, 0.3);
  EXPECT_EQ(result.aggregatedStrengths[1].first, "large");
  EXPECT_DOUBLE_EQ(result.aggregatedStrengths[1].second, 1.);

  const auto strengths = fcs->applyRules(fcs->fuzzify({{"x", 2.5}}));
  EXPECT_DOUBLE_EQ(strengths[0].second, 0.5);
  EXPECT_DOUBLE_EQ(strengths[1].second, 0.);
}

TEST_F(FuzzyControlSystemTest, testAggregateMembership) {
  const auto fcs = makeSystem();
  Eigen::ArrayXd samples(5);
  samples << 0., 2.5, 4., 7.5, 10.;

  const auto membership = fcs->aggregateMembership({{"small", 0.5}, {"large", 0.25}}, samples);
  ASSERT_EQ(membership.size(), 5);
  EXPECT_DOUBLE_EQ(membership[0], 0.5);
  EXPECT_DOUBLE_EQ(membership[1], 0.5);
  EXPECT_NEAR(membership[2], 0.2, 1e-12);
  EXPECT_DOUBLE_EQ(membership[3], 0.25);
  EXPECT_DOUBLE_EQ(membership[4], 0.25);
}

/**
 * x = 5 lies in the gap between low and high, so no rule fires.
 */
TEST_F(FuzzyControlSystemTest, testNoRuleFiredUndetermined) {
  const auto fcs = makeSystem();
  EXPECT_EQ(fcs->getUncoveredInputPolicy(), UncoveredInputPolicyOption::undetermined);

  const auto result = fcs->predict({{"x", 5.}});
  EXPECT_DOUBLE_EQ(result.crispValue, 5.);
  EXPECT_EQ(result.linguisticTerm, FuzzyControlSystem::undeterminedLabel);
  EXPECT_EQ(result.status, InferenceStatus::undetermined);
  for (const auto &[term, strength] : result.aggregatedStrengths) {
    EXPECT_EQ(strength, 0.) << term;
  }
}

/**
 * Both rules are equally close to x = 5, the first one wins. Its consequent is activated with the closeness 0.5.
 */
TEST_F(FuzzyControlSystemTest, testNoRuleFiredNearestRule) {
  const auto fcs = makeSystem({{"uncoveredInputPolicy", "nearestRule"}});

  const auto result = fcs->predict({{"x", 5.}});
  EXPECT_EQ(result.status, InferenceStatus::nearestRule);
  EXPECT_EQ(result.linguisticTerm, "small");
  EXPECT_DOUBLE_EQ(result.aggregatedStrengths[0].second, 0.5);
  EXPECT_DOUBLE_EQ(result.aggregatedStrengths[1].second, 0.);
  EXPECT_NEAR(result.crispValue, fcs->predict({{"x", 2.5}}).crispValue, 1e-12);

  // rules that fire are not affected by the policy
  EXPECT_EQ(fcs->predict({{"x", 0.}}).status, InferenceStatus::fired);
}

TEST_F(FuzzyControlSystemTest, testNearestRuleWithZeroWeight) {
  auto fcs = std::make_shared<FuzzyControlSystem>(
      std::vector<std::shared_ptr<const LinguisticVariable>>{x}, y,
      std::make_shared<FuzzyControlSettings>(FuzzyControlSettings{{"uncoveredInputPolicy", "nearestRule"}}));
  fcs->addRule(FuzzyRule(*x == "low", *y == "small", 0.));

  const auto result = fcs->predict({{"x", 1.}});
  EXPECT_EQ(result.status, InferenceStatus::undetermined);
  EXPECT_EQ(result.linguisticTerm, FuzzyControlSystem::undeterminedLabel);
  EXPECT_DOUBLE_EQ(result.crispValue, 5.);
}

TEST_F(FuzzyControlSystemTest, testEmptyRuleBase) {
  const FuzzyControlSystem fcs({x}, y, nullptr);
  EXPECT_TRUE(fcs.getRules().empty());

  const auto result = fcs.predict({{"x", 3.}});
  EXPECT_EQ(result.status, InferenceStatus::undetermined);
  EXPECT_DOUBLE_EQ(result.crispValue, 5.);
}

/**
 * If two output terms are equally activated by the crisp value the first declared one is reported.
 */
TEST_F(FuzzyControlSystemTest, testLabelTieBreak) {
  auto output = std::make_shared<LinguisticVariable>("y", std::make_pair(0., 10.));
  output->addLinguisticTerm(FuzzySetFactory::makeTriangle("first", 0, 5, 10));
  output->addLinguisticTerm(FuzzySetFactory::makeTriangle("second", 0, 5, 10));

  FuzzyControlSystem fcs({x}, output, nullptr);
  fcs.addRule(FuzzyRule(*x == "low", *output == "second"));

  const auto result = fcs.predict({{"x", 0.}});
  EXPECT_NEAR(result.crispValue, 5., 1e-9);
  EXPECT_EQ(result.linguisticTerm, "first");
}

TEST_F(FuzzyControlSystemTest, testAddRuleUnknownTerms) {
  const auto fcs = makeSystem();

  EXPECT_THROW(fcs->addRule(FuzzyRule(Antecedent::Term{"z", "low"}, *y == "small")), UnknownTermError);
  EXPECT_THROW(fcs->addRule(FuzzyRule(Antecedent::Term{"x", "medium"}, *y == "small")), UnknownTermError);
  EXPECT_THROW(fcs->addRule(FuzzyRule(*x == "low", Antecedent::Term{"y", "huge"})), UnknownTermError);
  // the consequent has to refer to the output variable
  EXPECT_THROW(fcs->addRule(FuzzyRule(*x == "low", *x == "high")), UnknownTermError);
  EXPECT_EQ(fcs->getRules().size(), 2);
}

TEST_F(FuzzyControlSystemTest, testInvalidInputs) {
  const auto fcs = makeSystem();

  EXPECT_TRUE(fcs->validateInputs({{"x", 0.}}));
  EXPECT_TRUE(fcs->validateInputs({{"x", 10.}}));
  EXPECT_THROW((void)fcs->predict({{"x", 10.5}}), InputOutOfRangeError);
  EXPECT_THROW((void)fcs->predict({{"x", -0.1}}), InputOutOfRangeError);
  EXPECT_THROW((void)fcs->predict({{"x", std::numeric_limits<double>::quiet_NaN()}}), InputOutOfRangeError);
  EXPECT_THROW((void)fcs->predict({{"x", std::numeric_limits<double>::infinity()}}), InputOutOfRangeError);
  EXPECT_THROW((void)fcs->predict({{"w", 1.}}), InputOutOfRangeError);

  // the system stays usable
  EXPECT_EQ(fcs->predict({{"x", 0.}}).linguisticTerm, "small");

  utils::ExceptionHandler::setBehavior(utils::ExceptionBehavior::ignore);
  EXPECT_FALSE(fcs->validateInputs({{"x", 11.}}));
  const auto ignored = fcs->predict({{"x", 11.}});
  EXPECT_EQ(ignored.status, InferenceStatus::undetermined);
  EXPECT_DOUBLE_EQ(ignored.crispValue, 5.);
}

TEST_F(FuzzyControlSystemTest, testSettings) {
  const auto fcs = makeSystem({{"numSamples", "201"}, {"uncoveredInputPolicy", "nearestRule"}, {"color", "blue"}});
  EXPECT_EQ(fcs->getNumSamples(), 201);
  EXPECT_EQ(fcs->getUncoveredInputPolicy(), UncoveredInputPolicyOption::nearestRule);
  EXPECT_EQ(fcs->getDefuzzificationMethod(), DefuzzificationMethodOption::CoG);

  const auto defaults = makeSystem();
  EXPECT_EQ(defaults->getNumSamples(), 1001);

  EXPECT_THROW(makeSystem({{"numSamples", "1"}}), utils::ExceptionHandler::FuzzyDetectException);
  EXPECT_THROW(makeSystem({{"numSamples", "abc"}}), utils::ExceptionHandler::FuzzyDetectException);
  EXPECT_THROW(makeSystem({{"numSamples", "12x"}}), utils::ExceptionHandler::FuzzyDetectException);
  EXPECT_THROW(makeSystem({{"defuzzificationMethod", "bisector"}}), utils::ExceptionHandler::FuzzyDetectException);
  EXPECT_THROW(makeSystem({{"uncoveredInputPolicy", "clamp"}}), utils::ExceptionHandler::FuzzyDetectException);
}

TEST_F(FuzzyControlSystemTest, testInvalidVariables) {
  using Inputs = std::vector<std::shared_ptr<const LinguisticVariable>>;
  const auto empty = std::make_shared<LinguisticVariable>("empty", std::make_pair(0., 1.));

  EXPECT_THROW(FuzzyControlSystem(Inputs{x}, nullptr, nullptr), utils::ExceptionHandler::FuzzyDetectException);
  EXPECT_THROW(FuzzyControlSystem(Inputs{x}, empty, nullptr), utils::ExceptionHandler::FuzzyDetectException);
  EXPECT_THROW(FuzzyControlSystem(Inputs{empty}, y, nullptr), utils::ExceptionHandler::FuzzyDetectException);
  EXPECT_THROW(FuzzyControlSystem(Inputs{x, x}, y, nullptr), utils::ExceptionHandler::FuzzyDetectException);
  EXPECT_THROW(FuzzyControlSystem(Inputs{y}, y, nullptr), utils::ExceptionHandler::FuzzyDetectException);
}

/**
 * With errors ignored, invalid variables must still leave a system that predicts the undetermined result.
 */
TEST_F(FuzzyControlSystemTest, testInvalidVariablesIgnored) {
  using Inputs = std::vector<std::shared_ptr<const LinguisticVariable>>;
  utils::ExceptionHandler::setBehavior(utils::ExceptionBehavior::ignore);

  const FuzzyControlSystem nullInput(Inputs{nullptr, x}, y, nullptr);
  ASSERT_EQ(nullInput.getInputVariables().size(), 1);
  EXPECT_EQ(nullInput.getInputVariables()[0], x);
  EXPECT_TRUE(nullInput.validateInputs({{"x", 2.}}));
  EXPECT_EQ(nullInput.predict({{"x", 2.}}).status, InferenceStatus::undetermined);

  const FuzzyControlSystem onlyNullInput(Inputs{nullptr}, y, nullptr);
  EXPECT_TRUE(onlyNullInput.getInputVariables().empty());
  EXPECT_EQ(onlyNullInput.predict({{"x", 0.5}}).status, InferenceStatus::undetermined);

  FuzzyControlSystem nullOutput(Inputs{x}, nullptr, nullptr);
  ASSERT_NE(nullOutput.getOutputVariable(), nullptr);
  nullOutput.addRule(FuzzyRule(*x == "low", *y == "small"));
  EXPECT_TRUE(nullOutput.getRules().empty());
  const auto result = nullOutput.predict({{"x", 0.}});
  EXPECT_EQ(result.status, InferenceStatus::undetermined);
  EXPECT_EQ(result.linguisticTerm, FuzzyControlSystem::undeterminedLabel);
  EXPECT_TRUE(result.aggregatedStrengths.empty());
  EXPECT_NO_THROW((void)std::string(nullOutput));

  const auto empty = std::make_shared<LinguisticVariable>("empty", std::make_pair(0., 1.));
  FuzzyControlSystem emptyOutput(Inputs{x}, empty, nullptr);
  emptyOutput.addRule(FuzzyRule(*x == "low", *y == "small"));
  EXPECT_TRUE(emptyOutput.getRules().empty());
  EXPECT_DOUBLE_EQ(emptyOutput.predict({{"x", 0.}}).crispValue, 0.5);
}

TEST_F(FuzzyControlSystemTest, testToString) {
  const auto fcs = makeSystem();
  const auto str = std::string(*fcs);
  EXPECT_NE(str.find(R"(IF "x" == "low" THEN "y" == "small")"), std::string::npos) << str;
  EXPECT_NE(str.find(R"(IF "x" == "high" THEN "y" == "large")"), std::string::npos) << str;
  EXPECT_NE(str.find("centerOfGravity"), std::string::npos) << str;
}

TEST_F(FuzzyControlSystemTest, testInferenceStatusToString) {
  EXPECT_EQ(to_string(InferenceStatus::fired), "fired");
  EXPECT_EQ(to_string(InferenceStatus::nearestRule), "nearestRule");
  EXPECT_EQ(to_string(InferenceStatus::undetermined), "undetermined");
}
