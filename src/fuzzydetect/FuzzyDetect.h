/**
 * @file FuzzyDetect.h
 * @author FuzzyDetect developers
 * Main include file for the FuzzyDetect library.
 *
 * @date 19.10.26
 */

#pragma once

#include "fuzzydetect/AnomalyDetector.h"
#include "fuzzydetect/DetectorSettings.h"
#include "fuzzydetect/RuleBases.h"
#include "fuzzydetect/fuzzyLogic/FuzzyLogicExceptions.h"
#include "fuzzydetect/fuzzyLogic/FuzzySetFactory.h"
