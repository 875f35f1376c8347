/**
 * @file YamlParserTest.h
 * @author FuzzyDetect developers
 * @date 19.10.26
 */
#pragma once
#include <gtest/gtest.h>

#include <string>

#include "FuzzyDetectTestBase.h"

/**
 * Parses the files in yamlTestFiles/.
 */
class YamlParserTest : public FuzzyDetectTestBase {};
