#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

#include "paystream/common/bounded_channel.hpp"
#include "paystream/common/cancellation.hpp"
#include "paystream/common/types.hpp"
#include "paystream/ingest/transaction_source.hpp"
#include "paystream/ledger/account_store.hpp"
#include "paystream/ledger/transaction.hpp"
#include "paystream/ledger/tx_status.hpp"
#include "paystream/telemetry/pipeline_metrics.hpp"

namespace paystream {
namespace ingest {

struct StreamPipelineConfig {
  std::size_t channel_capacity{100};
};

// Producer thread: source -> bounded channel. Consumer thread: channel -> store.
//
// The producer checks the cancellation token before reading each record and
// while blocked on a full channel; a transaction is either fully enqueued or
// not at all. The consumer never looks at the token and drains whatever was
// enqueued before the channel closed, so the store always reflects a prefix
// of the input made of whole transactions.
class StreamPipeline {
 public:
  using Config = StreamPipelineConfig;

  struct Rejection {
    ledger::TransactionKind kind{ledger::TransactionKind::kDeposit};
    common::ClientTransaction id{};
    ledger::TxStatus status{ledger::TxStatus::kOk};
  };

  struct Result {
    std::uint64_t read{0};  // transactions handed to the consumer
    std::uint64_t applied{0};
    std::uint64_t rejected{0};
    bool cancelled{false};
    // Set when the producer stopped on a decode or read error.
    std::optional<std::string> failure{};
  };

  using RejectionHandler = std::function<void(const Rejection&)>;

  explicit StreamPipeline(ledger::AccountStore& store, Config config = Config{},
                          telemetry::PipelineMetrics* metrics = nullptr);

  // Invoked on the consumer thread for every transaction the store rejects.
  // An exception thrown by the handler is logged and the stream continues.
  void set_rejection_handler(RejectionHandler handler);

  // Blocks until the input is exhausted, a decode error stops the producer, or
  // `cancel` is raised; in every case the consumer finishes draining first.
  Result run(TransactionSource& source, const common::CancellationToken& cancel);

 private:
  void produce(TransactionSource& source, common::BoundedChannel<ledger::Transaction>& channel,
               const common::CancellationToken& cancel, Result& result);
  void consume(common::BoundedChannel<ledger::Transaction>& channel, Result& result);

  ledger::AccountStore& store_;
  Config config_;
  telemetry::PipelineMetrics* metrics_;
  RejectionHandler on_rejection_{};
};

}  // namespace ingest
}  // namespace paystream
