#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace paystream {
namespace config {

struct PipelineConfig {
  std::size_t channel_capacity{100};
};

struct LoggingConfig {
  std::string level{"info"};
  std::filesystem::path file{"session.log"};  // empty: log to stderr
};

struct TelemetryConfig {
  bool enabled{true};
};

struct EngineConfig {
  PipelineConfig pipeline;
  LoggingConfig logging;
  TelemetryConfig telemetry;
};

struct ValidationError {
  std::string field;
  std::string message;
};

struct LoadResult {
  bool success{false};
  EngineConfig config;
  std::vector<ValidationError> errors;
  std::string raw_error;
};

class ConfigLoader {
 public:
  static LoadResult load(const std::filesystem::path& path);
  static LoadResult load_from_string(std::string_view toml_content);
  static std::vector<ValidationError> validate(const EngineConfig& config);
  static std::string generate_default();
};

}  // namespace config
}  // namespace paystream
