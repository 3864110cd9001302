#include "paystream/telemetry/pipeline_metrics.hpp"

#include <algorithm>
#include <bit>

namespace paystream {
namespace telemetry {

std::size_t LatencyHistogram::bucket_index(std::int64_t value_ns) noexcept {
  if (value_ns <= 0) {
    return 0;
  }
  // bucket[i] covers [2^(i-1), 2^i)
  const auto bits = std::bit_width(static_cast<std::uint64_t>(value_ns));
  return std::min(static_cast<std::size_t>(bits), kNumBuckets - 1);
}

std::int64_t LatencyHistogram::bucket_midpoint(std::size_t idx) noexcept {
  if (idx <= 1) {
    return 1;
  }
  return static_cast<std::int64_t>(3) << (idx - 2);
}

void LatencyHistogram::record(std::int64_t value_ns) noexcept {
  ++buckets_[bucket_index(value_ns)];
  ++count_;
  sum_ += value_ns;
  max_ = std::max(max_, value_ns);
}

void LatencyHistogram::reset() noexcept {
  buckets_.fill(0);
  count_ = 0;
  sum_ = 0;
  max_ = 0;
}

double LatencyHistogram::mean() const noexcept {
  if (count_ == 0) {
    return 0.0;
  }
  return static_cast<double>(sum_) / static_cast<double>(count_);
}

double LatencyHistogram::percentile(double p) const noexcept {
  if (count_ == 0) {
    return 0.0;
  }

  const auto target = std::max<std::uint64_t>(1, static_cast<std::uint64_t>(static_cast<double>(count_) * p));
  std::uint64_t cumulative = 0;
  for (std::size_t idx = 0; idx < kNumBuckets; ++idx) {
    cumulative += buckets_[idx];
    if (cumulative >= target) {
      return static_cast<double>(bucket_midpoint(idx));
    }
  }
  return static_cast<double>(max_);
}

void PipelineMetrics::record_received() {
  std::scoped_lock lock(mutex_);
  ++received_;
}

void PipelineMetrics::record_outcome(ledger::TxStatus status, std::chrono::nanoseconds apply_latency) {
  std::scoped_lock lock(mutex_);
  ++by_status_[static_cast<std::size_t>(status)];
  apply_latency_.record(apply_latency.count());
}

PipelineMetrics::Summary PipelineMetrics::summary() const {
  std::scoped_lock lock(mutex_);
  Summary out;
  out.received = received_;
  out.by_status = by_status_;
  out.applied = by_status_[static_cast<std::size_t>(ledger::TxStatus::kOk)];
  for (std::size_t idx = 0; idx < by_status_.size(); ++idx) {
    if (idx != static_cast<std::size_t>(ledger::TxStatus::kOk)) {
      out.rejected += by_status_[idx];
    }
  }
  out.latency_samples = apply_latency_.count();
  out.apply_mean_ns = apply_latency_.mean();
  out.apply_p99_ns = apply_latency_.percentile(0.99);
  return out;
}

void PipelineMetrics::reset() {
  std::scoped_lock lock(mutex_);
  received_ = 0;
  by_status_.fill(0);
  apply_latency_.reset();
}

}  // namespace telemetry
}  // namespace paystream
