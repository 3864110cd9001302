#include "paystream/config/config_loader.hpp"

#define TOML_EXCEPTIONS 0
#include <toml++/toml.hpp>

#include <cstdint>
#include <sstream>
#include <utility>

#include "paystream/log/logger.hpp"

namespace paystream {
namespace config {

namespace {

std::int64_t get_int_or(const toml::table& tbl, std::string_view key, std::int64_t default_val) {
  if (auto val = tbl[key].value<std::int64_t>()) {
    return *val;
  }
  return default_val;
}

std::string get_str_or(const toml::table& tbl, std::string_view key, std::string_view default_val) {
  if (auto val = tbl[key].value<std::string_view>()) {
    return std::string(*val);
  }
  return std::string(default_val);
}

PipelineConfig parse_pipeline(const toml::table& root, std::vector<ValidationError>& errors) {
  PipelineConfig cfg;
  if (auto* pipeline = root["pipeline"].as_table()) {
    const auto capacity = get_int_or(*pipeline, "channel_capacity", static_cast<std::int64_t>(cfg.channel_capacity));
    if (capacity <= 0) {
      errors.push_back({"pipeline.channel_capacity", "must be greater than 0"});
    } else {
      cfg.channel_capacity = static_cast<std::size_t>(capacity);
    }
  }
  return cfg;
}

LoggingConfig parse_logging(const toml::table& root) {
  LoggingConfig cfg;
  if (auto* logging = root["logging"].as_table()) {
    cfg.level = get_str_or(*logging, "level", cfg.level);
    cfg.file = get_str_or(*logging, "file", cfg.file.string());
  }
  return cfg;
}

TelemetryConfig parse_telemetry(const toml::table& root) {
  TelemetryConfig cfg;
  if (auto* telemetry = root["telemetry"].as_table()) {
    if (auto val = (*telemetry)["enabled"].value<bool>()) {
      cfg.enabled = *val;
    }
  }
  return cfg;
}

LoadResult finish(const toml::table& root) {
  LoadResult result;
  std::vector<ValidationError> parse_errors;
  result.config.pipeline = parse_pipeline(root, parse_errors);
  result.config.logging = parse_logging(root);
  result.config.telemetry = parse_telemetry(root);

  result.errors = std::move(parse_errors);
  for (auto& error : ConfigLoader::validate(result.config)) {
    result.errors.push_back(std::move(error));
  }
  result.success = result.errors.empty();
  return result;
}

}  // namespace

LoadResult ConfigLoader::load(const std::filesystem::path& path) {
  LoadResult result;

  if (!std::filesystem::exists(path)) {
    result.raw_error = "Config file not found: " + path.string();
    return result;
  }

  auto parse_result = toml::parse_file(path.string());
  if (!parse_result) {
    std::ostringstream oss;
    oss << parse_result.error();
    result.raw_error = oss.str();
    return result;
  }

  return finish(parse_result.table());
}

LoadResult ConfigLoader::load_from_string(std::string_view toml_content) {
  LoadResult result;

  auto parse_result = toml::parse(toml_content);
  if (!parse_result) {
    std::ostringstream oss;
    oss << parse_result.error();
    result.raw_error = oss.str();
    return result;
  }

  return finish(parse_result.table());
}

std::vector<ValidationError> ConfigLoader::validate(const EngineConfig& config) {
  std::vector<ValidationError> errors;

  if (config.pipeline.channel_capacity == 0) {
    errors.push_back({"pipeline.channel_capacity", "must be greater than 0"});
  }

  if (!log::parse_level(config.logging.level)) {
    errors.push_back({"logging.level", "must be one of debug, info, warn, error"});
  }

  return errors;
}

std::string ConfigLoader::generate_default() {
  return R"(# paystream configuration
# Generated default configuration

[pipeline]
channel_capacity = 100  # transactions buffered between reader and ledger

[logging]
level = "info"          # debug | info | warn | error
file = "session.log"    # empty string logs to stderr

[telemetry]
enabled = true
)";
}

}  // namespace config
}  // namespace paystream
