/**
 * @file RuleBases.cpp
 * @author FuzzyDetect developers
 * @date 19.10.26
 */

#include "RuleBases.h"

#include "fuzzydetect/fuzzyLogic/FuzzySetFactory.h"

namespace fuzzydetect::rule_bases {

using fuzzy_logic::FuzzyControlSystem;
using fuzzy_logic::FuzzyRule;
using fuzzy_logic::FuzzySetFactory;
using fuzzy_logic::LinguisticVariable;

std::shared_ptr<LinguisticVariable> makeIndicatorVariable(const std::string &name) {
  auto variable = std::make_shared<LinguisticVariable>(name, std::make_pair(0., 1.));
  variable->addLinguisticTerm(FuzzySetFactory::makeTriangle("low", 0., 0., 0.4));
  variable->addLinguisticTerm(FuzzySetFactory::makeTriangle("medium", 0.2, 0.5, 0.8));
  variable->addLinguisticTerm(FuzzySetFactory::makeTriangle("high", 0.6, 1., 1.));
  return variable;
}

std::shared_ptr<LinguisticVariable> makeAnomalyLevelVariable() {
  auto variable = std::make_shared<LinguisticVariable>(anomalyLevel, std::make_pair(0., 10.));
  variable->addLinguisticTerm(FuzzySetFactory::makeTriangle("normal", 0., 0., 3.));
  variable->addLinguisticTerm(FuzzySetFactory::makeTriangle("slightly_anomalous", 1., 3., 5.));
  variable->addLinguisticTerm(FuzzySetFactory::makeTriangle("moderately_anomalous", 3., 5., 7.));
  variable->addLinguisticTerm(FuzzySetFactory::makeTriangle("strongly_anomalous", 6., 10., 10.));
  return variable;
}

void addCanonicalRules(FuzzyControlSystem &fcs, const LinguisticVariable &ep, const LinguisticVariable &mv,
                       const LinguisticVariable &mc, const LinguisticVariable &level) {
  fcs.addRule(FuzzyRule(ep == "low" && mv == "low" && mc == "low", level == "normal"));
  fcs.addRule(FuzzyRule(ep == "low" && mv == "medium" && mc == "low", level == "slightly_anomalous"));
  fcs.addRule(FuzzyRule(ep == "medium" && mv == "low" && mc == "low", level == "slightly_anomalous"));
  fcs.addRule(FuzzyRule(ep == "medium" && mv == "medium" && mc == "medium", level == "moderately_anomalous"));
  fcs.addRule(FuzzyRule(ep == "high" && mv == "low" && mc == "low", level == "moderately_anomalous"));
  fcs.addRule(FuzzyRule(ep == "low" && mv == "high" && mc == "high", level == "moderately_anomalous"));
  fcs.addRule(FuzzyRule(ep == "high" && mv == "medium" && mc == "medium", level == "strongly_anomalous"));
  fcs.addRule(FuzzyRule(ep == "high" && mv == "high" && mc == "low", level == "strongly_anomalous"));
  fcs.addRule(FuzzyRule(ep == "high" && mv == "high" && mc == "high", level == "strongly_anomalous"));
}

void addPairwiseRules(FuzzyControlSystem &fcs, const LinguisticVariable &ep, const LinguisticVariable &mv,
                      const LinguisticVariable &mc, const LinguisticVariable &level) {
  // normal
  fcs.addRule(FuzzyRule(ep == "low" && mv == "low" && mc == "low", level == "normal", 1., "R1_normal_all_low"));

  // one indicator slightly raised
  fcs.addRule(FuzzyRule(ep == "medium" && mv == "low" && mc == "low", level == "slightly_anomalous", 1.,
                        "R2_slightly_anom_medium_fe"));
  fcs.addRule(FuzzyRule(ep == "low" && mv == "medium" && mc == "low", level == "slightly_anomalous", 1.,
                        "R3_slightly_anom_medium_vc"));
  fcs.addRule(FuzzyRule(ep == "low" && mv == "low" && mc == "medium", level == "slightly_anomalous", 1.,
                        "R4_slightly_anom_medium_cc"));

  // two indicators medium
  fcs.addRule(FuzzyRule(ep == "medium" && mv == "medium", level == "moderately_anomalous", 1., "R5_moderate_fe_vc"));
  fcs.addRule(FuzzyRule(ep == "medium" && mc == "medium", level == "moderately_anomalous", 1., "R6_moderate_fe_cc"));
  fcs.addRule(FuzzyRule(mv == "medium" && mc == "medium", level == "moderately_anomalous", 1., "R7_moderate_vc_cc"));

  // two indicators high
  fcs.addRule(FuzzyRule(ep == "high" && mv == "high", level == "strongly_anomalous", 1., "R8_strong_fe_vc"));
  fcs.addRule(FuzzyRule(ep == "high" && mc == "high", level == "strongly_anomalous", 1., "R9_strong_fe_cc"));
  fcs.addRule(FuzzyRule(mv == "high" && mc == "high", level == "strongly_anomalous", 1., "R10_strong_vc_cc"));

  // one high, one medium
  fcs.addRule(FuzzyRule(ep == "high" && mv == "medium", level == "strongly_anomalous", 1., "R11_high_fe_medium_vc"));
  fcs.addRule(FuzzyRule(ep == "medium" && mv == "high", level == "strongly_anomalous", 1., "R12_medium_fe_high_vc"));
  fcs.addRule(FuzzyRule(ep == "high" && mc == "medium", level == "strongly_anomalous", 1., "R13_high_fe_medium_cc"));
  fcs.addRule(FuzzyRule(mv == "high" && mc == "medium", level == "strongly_anomalous", 1., "R14_high_vc_medium_cc"));
}

std::shared_ptr<const FuzzyControlSystem> makeFuzzyControlSystem(const DetectorSettings &settings) {
  const auto ep = makeIndicatorVariable(forecastError);
  const auto mv = makeIndicatorVariable(varianceChange);
  const auto mc = makeIndicatorVariable(correlationChange);
  const auto level = makeAnomalyLevelVariable();

  auto fcs = std::make_shared<FuzzyControlSystem>(std::vector<std::shared_ptr<const LinguisticVariable>>{ep, mv, mc},
                                                  level, settings.toFuzzyControlSettings());

  switch (settings.ruleBase) {
    case RuleBaseOption::pairwise: {
      addPairwiseRules(*fcs, *ep, *mv, *mc, *level);
      break;
    }
    case RuleBaseOption::canonical:
    default: {
      addCanonicalRules(*fcs, *ep, *mv, *mc, *level);
      break;
    }
  }
  return fcs;
}

}  // namespace fuzzydetect::rule_bases
