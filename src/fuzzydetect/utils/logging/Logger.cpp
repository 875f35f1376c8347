/**
 * @file Logger.cpp
 * @author FuzzyDetect developers
 * @date 19.10.26
 */

#include "Logger.h"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/ostream_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace fuzzydetect::Logger {

namespace {

/**
 * Replaces any registered FuzzyDetect logger by one writing to the given sink.
 * @param sink
 */
void registerWithSink(spdlog::sink_ptr sink) {
  unregister();
  spdlog::register_logger(std::make_shared<spdlog::logger>(loggerName(), std::move(sink)));
}

/**
 * Sink for a stream. Colored for std::cout and std::cerr if enabled at compile time.
 * @param oss
 * @return
 */
spdlog::sink_ptr makeStreamSink(std::ostream &oss) {
#ifdef FUZZYDETECT_COLORED_CONSOLE_LOGGING
  if (oss.rdbuf() == std::cout.rdbuf()) {
    return std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  }
  if (oss.rdbuf() == std::cerr.rdbuf()) {
    return std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  }
#endif
  return std::make_shared<spdlog::sinks::ostream_sink_mt>(oss);
}

}  // namespace

const std::string &loggerName() {
  static const std::string name{"FuzzyDetectLog"};
  return name;
}

void create(const std::string &filename) {
  registerWithSink(std::make_shared<spdlog::sinks::basic_file_sink_mt>(filename));
}

void create(std::ostream &oss) { registerWithSink(makeStreamSink(oss)); }

void createIfMissing() {
  if (not get()) {
    create();
  }
}

void unregister() { spdlog::drop(loggerName()); }

std::shared_ptr<spdlog::logger> get() { return spdlog::get(loggerName()); }

}  // namespace fuzzydetect::Logger
