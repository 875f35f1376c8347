/**
 * @file ParserExitCodes.h
 * @author FuzzyDetect developers
 * @date 19.10.26
 */

#pragma once

namespace AnomalyEvalParser {
/**
 * Exit values for the parse functions
 */
enum class exitCodes {
  success,
  parsingError,
  helpFlagFound,
};
}  // namespace AnomalyEvalParser
