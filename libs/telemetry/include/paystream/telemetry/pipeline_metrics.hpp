#pragma once

#include <array>
#include <chrono>
#include <cstdint>
#include <mutex>

#include "paystream/ledger/tx_status.hpp"

namespace paystream {
namespace telemetry {

// Log2-bucketed latency histogram, 1ns to ~1s.
class LatencyHistogram {
 public:
  static constexpr std::size_t kNumBuckets = 30;

  void record(std::int64_t value_ns) noexcept;
  void reset() noexcept;

  [[nodiscard]] std::uint64_t count() const noexcept { return count_; }
  [[nodiscard]] double mean() const noexcept;
  // Midpoint of the bucket holding the p-th quantile, 0 < p <= 1.
  [[nodiscard]] double percentile(double p) const noexcept;

 private:
  std::array<std::uint64_t, kNumBuckets> buckets_{};
  std::uint64_t count_{0};
  std::int64_t sum_{0};
  std::int64_t max_{0};

  static std::size_t bucket_index(std::int64_t value_ns) noexcept;
  static std::int64_t bucket_midpoint(std::size_t idx) noexcept;
};

// Counters and apply latency of the consumer side of the pipeline.
class PipelineMetrics {
 public:
  struct Summary {
    std::uint64_t received{0};
    std::uint64_t applied{0};
    std::uint64_t rejected{0};
    std::array<std::uint64_t, ledger::kTxStatusCount> by_status{};
    std::uint64_t latency_samples{0};
    double apply_mean_ns{0.0};
    double apply_p99_ns{0.0};
  };

  void record_received();
  void record_outcome(ledger::TxStatus status, std::chrono::nanoseconds apply_latency);

  [[nodiscard]] Summary summary() const;
  void reset();

 private:
  mutable std::mutex mutex_;
  std::uint64_t received_{0};
  std::array<std::uint64_t, ledger::kTxStatusCount> by_status_{};
  LatencyHistogram apply_latency_{};
};

}  // namespace telemetry
}  // namespace paystream
