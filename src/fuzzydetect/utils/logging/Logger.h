/**
 * @file Logger.h
 * @author FuzzyDetect developers
 * @date 19.10.26
 */

#pragma once

#include <spdlog/spdlog.h>

#include <iostream>
#include <memory>
#include <string>

/**
 * Logs through the FuzzyDetect logger.
 *
 * Levels below FUZZYDETECT_MIN_LOG_LVL are compiled out.
 *
 * @param lvl One of TRACE, DEBUG, INFO, WARN, ERROR, CRITICAL.
 * @param fmt fmt format string.
 * @param ... Format arguments.
 * @note Needs a terminating ';'.
 */
#define FuzzyDetectLog(lvl, fmt, ...) SPDLOG_LOGGER_##lvl(fuzzydetect::Logger::get(), fmt, ##__VA_ARGS__)

namespace fuzzydetect {
/**
 * Access to the spdlog logger all of FuzzyDetect writes to.
 *
 * The logger is registered globally under loggerName(). Applications decide where it writes by calling one of the
 * create() functions. Library entry points call createIfMissing() so logging never hits an unregistered logger.
 */
namespace Logger {

/**
 * Log levels as understood by spdlog.
 */
using LogLevel = spdlog::level::level_enum;

/**
 * @return Name the logger is registered under.
 */
const std::string &loggerName();

/**
 * (Re)creates the logger writing to a file. An existing logger is replaced.
 * @param filename
 */
void create(const std::string &filename);

/**
 * (Re)creates the logger writing to a stream. An existing logger is replaced.
 * @param oss
 */
void create(std::ostream &oss = std::cout);

/**
 * Creates the logger writing to std::cout unless one is already registered.
 */
void createIfMissing();

/**
 * Drops the logger. Only call this at the very end of the program or in tests,
 * FuzzyDetectLog without a registered logger dereferences a null pointer.
 */
void unregister();

/**
 * @return The registered logger or nullptr.
 */
std::shared_ptr<spdlog::logger> get();

}  // namespace Logger
}  // namespace fuzzydetect
