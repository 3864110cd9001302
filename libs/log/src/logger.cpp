#include "paystream/log/logger.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <utility>

namespace paystream {
namespace log {

namespace {

std::string utc_timestamp() {
  const auto now = std::chrono::system_clock::now();
  const auto seconds = std::chrono::system_clock::to_time_t(now);
  const auto micros =
      std::chrono::duration_cast<std::chrono::microseconds>(now.time_since_epoch()) % 1'000'000;

  std::tm utc{};
  gmtime_r(&seconds, &utc);

  std::ostringstream oss;
  oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << '.' << std::setfill('0') << std::setw(6)
      << micros.count() << 'Z';
  return oss.str();
}

}  // namespace

std::string_view level_name(Level level) noexcept {
  switch (level) {
    case Level::kDebug:
      return "DEBUG";
    case Level::kInfo:
      return "INFO";
    case Level::kWarn:
      return "WARN";
    case Level::kError:
      return "ERROR";
  }
  return "UNKNOWN";
}

std::optional<Level> parse_level(std::string_view text) noexcept {
  if (text == "debug") {
    return Level::kDebug;
  }
  if (text == "info") {
    return Level::kInfo;
  }
  if (text == "warn") {
    return Level::kWarn;
  }
  if (text == "error") {
    return Level::kError;
  }
  return std::nullopt;
}

Logger& Logger::instance() {
  static Logger logger;
  return logger;
}

Logger::Logger() : out_(&std::cerr) {}

void Logger::set_level(Level level) noexcept {
  min_level_.store(level, std::memory_order_relaxed);
}

Level Logger::level() const noexcept {
  return min_level_.load(std::memory_order_relaxed);
}

void Logger::set_stream(std::ostream& stream) {
  std::scoped_lock lock(mutex_);
  out_ = &stream;
  if (file_.is_open()) {
    file_.close();
  }
}

bool Logger::open_file(const std::filesystem::path& path) {
  std::ofstream file(path, std::ios::app);
  if (!file) {
    return false;
  }

  std::scoped_lock lock(mutex_);
  file_ = std::move(file);
  out_ = &file_;
  return true;
}

void Logger::flush() {
  std::scoped_lock lock(mutex_);
  out_->flush();
}

void Logger::write(Level level, std::string_view component, std::string_view message) {
  if (!enabled(level)) {
    return;
  }

  std::ostringstream line;
  line << utc_timestamp() << " [" << level_name(level) << "] ";
  if (!component.empty()) {
    line << '[' << component << "] ";
  }
  line << message << '\n';

  std::scoped_lock lock(mutex_);
  *out_ << line.str();
  out_->flush();
}

}  // namespace log
}  // namespace paystream
