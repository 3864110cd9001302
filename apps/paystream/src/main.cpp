#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include "paystream/common/cancellation.hpp"
#include "paystream/common/signal_cancellation.hpp"
#include "paystream/config/config_loader.hpp"
#include "paystream/ingest/csv_reader.hpp"
#include "paystream/ingest/stream_pipeline.hpp"
#include "paystream/ledger/account_store.hpp"
#include "paystream/log/logger.hpp"
#include "paystream/report/account_report.hpp"
#include "paystream/telemetry/pipeline_metrics.hpp"

namespace {

constexpr int kExitUsage = 1;
constexpr int kExitInputFailure = 2;

void print_usage(const char* program) {
  std::cerr << "Usage: " << program << " <transactions.csv> [config_file]\n"
            << "  transactions.csv: CSV with columns type, client, tx, amount\n"
            << "  config_file:      Path to TOML configuration file\n"
            << "                    If not specified, uses ./paystream.toml or built-in defaults\n";
}

std::filesystem::path find_config_path(int argc, char* argv[]) {
  if (argc > 2) {
    return std::filesystem::path{argv[2]};
  }

  std::vector<std::filesystem::path> default_paths{"./paystream.toml"};
  if (const char* home = std::getenv("HOME")) {
    default_paths.push_back(std::filesystem::path{home} / ".config/paystream/paystream.toml");
  }

  for (const auto& path : default_paths) {
    if (std::filesystem::exists(path)) {
      return path;
    }
  }

  return {};
}

bool load_config(int argc, char* argv[], paystream::config::EngineConfig& cfg) {
  using paystream::config::ConfigLoader;

  const auto config_path = find_config_path(argc, argv);
  auto result = config_path.empty() ? ConfigLoader::load_from_string(ConfigLoader::generate_default())
                                    : ConfigLoader::load(config_path);
  if (!result.success) {
    if (!result.raw_error.empty()) {
      std::cerr << "Config error: " << result.raw_error << "\n";
    }
    for (const auto& err : result.errors) {
      std::cerr << "Validation error [" << err.field << "]: " << err.message << "\n";
    }
    return false;
  }
  cfg = std::move(result.config);
  return true;
}

void configure_logging(const paystream::config::LoggingConfig& cfg) {
  auto& logger = paystream::log::Logger::instance();
  if (auto level = paystream::log::parse_level(cfg.level)) {
    logger.set_level(*level);
  }
  if (!cfg.file.empty() && !logger.open_file(cfg.file)) {
    std::cerr << "Cannot open log file " << cfg.file << ", logging to stderr\n";
  }
}

}  // namespace

int main(int argc, char* argv[]) {
  using namespace paystream;

  if (argc < 2) {
    print_usage(argv[0]);
    return kExitUsage;
  }

  config::EngineConfig cfg;
  if (!load_config(argc, argv, cfg)) {
    return kExitUsage;
  }
  configure_logging(cfg.logging);

  const std::filesystem::path input_path{argv[1]};
  std::ifstream input(input_path);
  if (!input) {
    std::cerr << "Cannot open input file: " << input_path << "\n";
    PAYSTREAM_LOG_ERROR("main", "cannot open input file " + input_path.string());
    return kExitUsage;
  }
  PAYSTREAM_LOG_INFO("main", "processing file " + input_path.string());

  common::CancellationToken cancel;

  ledger::AccountStore store;
  telemetry::PipelineMetrics metrics;
  ingest::CsvReader reader(input);
  ingest::StreamPipeline pipeline(store, {.channel_capacity = cfg.pipeline.channel_capacity},
                                  cfg.telemetry.enabled ? &metrics : nullptr);
  pipeline.set_rejection_handler([](const ingest::StreamPipeline::Rejection& rejection) {
    std::cerr << "Error processing transaction " << rejection.id.tx << " for client " << rejection.id.client
              << ": " << ledger::describe(rejection.status) << "\n";
  });

  ingest::StreamPipeline::Result result;
  {
    // SIGINT/SIGTERM stop the reader; whatever was already queued is still applied.
    common::SignalCancellation on_signal(cancel);
    result = pipeline.run(reader, cancel);
  }

  if (result.cancelled) {
    std::cerr << "\nReceived shutdown signal, stopped reading input\n";
  } else if (result.failure) {
    std::cerr << "Error processing CSV: " << *result.failure << "\n";
  } else {
    std::cerr << "Finished reading CSV\n";
  }

  report::write_accounts(std::cout, store.snapshot());

  if (cfg.telemetry.enabled) {
    const auto summary = metrics.summary();
    std::cerr << "Processed " << summary.received << " transactions: " << summary.applied << " applied, "
              << summary.rejected << " rejected, apply mean " << summary.apply_mean_ns << "ns p99 "
              << summary.apply_p99_ns << "ns\n";
  }

  log::Logger::instance().flush();
  return result.failure ? kExitInputFailure : 0;
}
