/**
 * @file CLIParserTest.cpp
 * @author FuzzyDetect developers
 * @date 19.10.26
 */
#include "CLIParserTest.h"

#include "src/parsing/AnomalyEvalParser.h"

AnomalyEvalParser::exitCodes CLIParserTest::parse(std::vector<std::string> arguments, AnomalyEvalConfig &config) {
  arguments.insert(arguments.begin(), "anomaly-eval");
  std::vector<char *> argv;
  for (auto &argument : arguments) {
    argv.push_back(argument.data());
  }
  argv.push_back(nullptr);
  return AnomalyEvalParser::parseInput(static_cast<int>(arguments.size()), argv.data(), config);
}

TEST_F(CLIParserTest, defaults) {
  AnomalyEvalConfig config;
  ASSERT_EQ(parse({}, config), AnomalyEvalParser::exitCodes::success);

  EXPECT_EQ(config.ruleBase.value, fuzzydetect::RuleBaseOption::canonical);
  EXPECT_EQ(config.defuzzificationMethod.value, fuzzydetect::DefuzzificationMethodOption::CoG);
  EXPECT_EQ(config.numSamples.value, 1001);
  EXPECT_EQ(config.uncoveredInputPolicy.value, fuzzydetect::UncoveredInputPolicyOption::undetermined);
  EXPECT_EQ(config.numThreads.value, 0);
  EXPECT_TRUE(config.indicators.value.empty());
}

TEST_F(CLIParserTest, parseOptions) {
  AnomalyEvalConfig config;
  ASSERT_EQ(parse({"--rule-base", "pairwise", "--defuzzification-method", "meanOfMaximum", "--num-samples", "501",
                   "--uncovered-input-policy", "nearestRule", "--num-threads", "2", "--log-level", "trace", "--indicators",
                   "0,0,0;1, 1, 1;0.5,0.4,0.3"},
                  config),
            AnomalyEvalParser::exitCodes::success);

  EXPECT_EQ(config.ruleBase.value, fuzzydetect::RuleBaseOption::pairwise);
  EXPECT_EQ(config.defuzzificationMethod.value, fuzzydetect::DefuzzificationMethodOption::MoM);
  EXPECT_EQ(config.numSamples.value, 501);
  EXPECT_EQ(config.uncoveredInputPolicy.value, fuzzydetect::UncoveredInputPolicyOption::nearestRule);
  EXPECT_EQ(config.numThreads.value, 2);
  EXPECT_EQ(config.logLevel.value, fuzzydetect::Logger::LogLevel::trace);
  ASSERT_EQ(config.indicators.value.size(), 3);
  EXPECT_DOUBLE_EQ(config.indicators.value[2].correlationChange, 0.3);
}

TEST_F(CLIParserTest, commandLineOverridesYaml) {
  AnomalyEvalConfig config;
  ASSERT_EQ(parse({"--yaml-filename", std::string(YAMLDIRECTORY) + "allOptions.yaml", "--rule-base", "canonical",
                   "--num-samples", "11"},
                  config),
            AnomalyEvalParser::exitCodes::success);

  // overridden
  EXPECT_EQ(config.ruleBase.value, fuzzydetect::RuleBaseOption::canonical);
  EXPECT_EQ(config.numSamples.value, 11);
  // from the yaml file
  EXPECT_EQ(config.defuzzificationMethod.value, fuzzydetect::DefuzzificationMethodOption::MoM);
  EXPECT_EQ(config.indicators.value.size(), 3);
}

TEST_F(CLIParserTest, invalidValues) {
  {
    AnomalyEvalConfig config;
    EXPECT_EQ(parse({"--rule-base", "exhaustive"}, config), AnomalyEvalParser::exitCodes::parsingError);
  }
  {
    AnomalyEvalConfig config;
    EXPECT_EQ(parse({"--num-samples", "1"}, config), AnomalyEvalParser::exitCodes::parsingError);
  }
  {
    AnomalyEvalConfig config;
    EXPECT_EQ(parse({"--indicators", "0.1,0.2"}, config), AnomalyEvalParser::exitCodes::parsingError);
  }
  {
    AnomalyEvalConfig config;
    EXPECT_EQ(parse({"--num-threads", "-3"}, config), AnomalyEvalParser::exitCodes::parsingError);
  }
  {
    // does not fit into the int OpenMP takes
    AnomalyEvalConfig config;
    EXPECT_EQ(parse({"--num-threads", "3000000000"}, config), AnomalyEvalParser::exitCodes::parsingError);
    EXPECT_EQ(config.numThreads.value, 0);
  }
  {
    AnomalyEvalConfig config;
    EXPECT_EQ(parse({"--log-level", "verbose"}, config), AnomalyEvalParser::exitCodes::parsingError);
  }
}

TEST_F(CLIParserTest, largestNumThreads) {
  AnomalyEvalConfig config;
  ASSERT_EQ(parse({"--num-threads", std::to_string(AnomalyEvalConfig::maxNumThreads)}, config),
            AnomalyEvalParser::exitCodes::success);
  EXPECT_EQ(config.numThreads.value, static_cast<size_t>(AnomalyEvalConfig::maxNumThreads));
}

TEST_F(CLIParserTest, missingYamlFile) {
  AnomalyEvalConfig config;
  EXPECT_THROW(parse({"--yaml-filename", "doesNotExist.yaml"}, config), std::runtime_error);
}

TEST_F(CLIParserTest, helpListsOptionValues) {
  AnomalyEvalConfig config;
  EXPECT_THAT(config.ruleBase.description, ::testing::HasSubstr("(canonical pairwise)"));
  EXPECT_THAT(config.uncoveredInputPolicy.description, ::testing::HasSubstr("(undetermined nearestRule)"));
}

TEST_F(CLIParserTest, helpFlag) {
  AnomalyEvalConfig config;
  EXPECT_EQ(parse({"--help"}, config), AnomalyEvalParser::exitCodes::helpFlagFound);
}

TEST_F(CLIParserTest, parseIndicatorsRejectsTrailingGarbage) {
  std::vector<fuzzydetect::Indicators> indicators{{0.1, 0.2, 0.3}};
  EXPECT_FALSE(AnomalyEvalConfig::parseIndicators("0.1,0.2,0.3x", indicators));
  // untouched on failure
  EXPECT_EQ(indicators.size(), 1);

  EXPECT_TRUE(AnomalyEvalConfig::parseIndicators("", indicators));
  EXPECT_TRUE(indicators.empty());
}
