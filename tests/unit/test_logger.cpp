#include "test_logger.hpp"

#include <cassert>
#include <iostream>
#include <sstream>
#include <string>

#include "paystream/log/logger.hpp"

namespace paystream::tests {

using log::Level;

void test_logger_levels() {
  assert(log::parse_level("debug") == Level::kDebug);
  assert(log::parse_level("warn") == Level::kWarn);
  assert(!log::parse_level("WARN"));
  assert(!log::parse_level(""));
  assert(log::level_name(Level::kError) == "ERROR");

  auto& logger = log::Logger::instance();
  const auto previous = logger.level();
  std::ostringstream sink;
  logger.set_stream(sink);
  logger.set_level(Level::kWarn);

  PAYSTREAM_LOG_INFO("test", "hidden");
  PAYSTREAM_LOG_DEBUG("test", "hidden");
  assert(sink.str().empty());

  PAYSTREAM_LOG_WARN("test", "shown");
  PAYSTREAM_LOG_ERROR("test", "also shown");
  assert(sink.str().find("shown") != std::string::npos);
  assert(sink.str().find("hidden") == std::string::npos);

  logger.set_stream(std::cerr);
  logger.set_level(previous);
}

void test_logger_format() {
  auto& logger = log::Logger::instance();
  const auto previous = logger.level();
  std::ostringstream sink;
  logger.set_stream(sink);
  logger.set_level(Level::kDebug);

  logger.write(Level::kInfo, "pipeline", "started");
  logger.write(Level::kDebug, "", "bare");

  const auto text = sink.str();
  const auto first_end = text.find('\n');
  assert(first_end != std::string::npos);
  const auto first = text.substr(0, first_end);
  // 2026-01-01T12:00:00.000000Z
  assert(first.size() > 28);
  assert(first[4] == '-' && first[10] == 'T' && first[19] == '.' && first[26] == 'Z');
  assert(first.substr(28) == "[INFO] [pipeline] started");

  const auto second = text.substr(first_end + 1);
  assert(second.substr(28) == "[DEBUG] bare\n");

  logger.set_stream(std::cerr);
  logger.set_level(previous);
}

}  // namespace paystream::tests
