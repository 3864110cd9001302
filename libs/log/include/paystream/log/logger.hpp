#pragma once

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace paystream {
namespace log {

enum class Level : std::uint8_t {
  kDebug,
  kInfo,
  kWarn,
  kError,
};

[[nodiscard]] std::string_view level_name(Level level) noexcept;
[[nodiscard]] std::optional<Level> parse_level(std::string_view text) noexcept;

// Process-wide line logger. Each line is written and flushed under a mutex:
//   2026-01-01T12:00:00.000000Z [INFO] [pipeline] message
class Logger {
 public:
  static Logger& instance();

  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;

  void set_level(Level level) noexcept;
  [[nodiscard]] Level level() const noexcept;
  [[nodiscard]] bool enabled(Level level) const noexcept { return level >= this->level(); }

  // Redirects output to `stream`, which must outlive the logger's use of it.
  void set_stream(std::ostream& stream);
  // Appends to `path`. Returns false and keeps the current sink if the file cannot be opened.
  bool open_file(const std::filesystem::path& path);
  void flush();

  void write(Level level, std::string_view component, std::string_view message);

 private:
  Logger();

  mutable std::mutex mutex_;
  std::atomic<Level> min_level_{Level::kInfo};
  std::ostream* out_;
  std::ofstream file_;
};

}  // namespace log
}  // namespace paystream

#define PAYSTREAM_LOG(lvl, component, msg)                                    \
  do {                                                                        \
    auto& paystream_logger_ = ::paystream::log::Logger::instance();           \
    if (paystream_logger_.enabled(lvl)) {                                     \
      paystream_logger_.write(lvl, component, msg);                           \
    }                                                                         \
  } while (0)

#define PAYSTREAM_LOG_DEBUG(component, msg) PAYSTREAM_LOG(::paystream::log::Level::kDebug, component, msg)
#define PAYSTREAM_LOG_INFO(component, msg) PAYSTREAM_LOG(::paystream::log::Level::kInfo, component, msg)
#define PAYSTREAM_LOG_WARN(component, msg) PAYSTREAM_LOG(::paystream::log::Level::kWarn, component, msg)
#define PAYSTREAM_LOG_ERROR(component, msg) PAYSTREAM_LOG(::paystream::log::Level::kError, component, msg)
