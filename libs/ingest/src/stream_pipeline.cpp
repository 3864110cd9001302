#include "paystream/ingest/stream_pipeline.hpp"

#include <exception>
#include <functional>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>
#include <utility>

#include "paystream/common/time_utils.hpp"
#include "paystream/log/logger.hpp"

namespace paystream {
namespace ingest {

namespace {
constexpr std::string_view kComponent = "pipeline";
}

StreamPipeline::StreamPipeline(ledger::AccountStore& store, Config config, telemetry::PipelineMetrics* metrics)
    : store_(store), config_(config), metrics_(metrics) {}

void StreamPipeline::set_rejection_handler(RejectionHandler handler) {
  on_rejection_ = std::move(handler);
}

StreamPipeline::Result StreamPipeline::run(TransactionSource& source, const common::CancellationToken& cancel) {
  common::BoundedChannel<ledger::Transaction> channel(config_.channel_capacity);
  Result result;

  // Each thread writes a disjoint set of Result fields; join() publishes them.
  std::thread consumer(&StreamPipeline::consume, this, std::ref(channel), std::ref(result));
  std::thread producer;
  try {
    producer = std::thread(&StreamPipeline::produce, this, std::ref(source), std::ref(channel), std::cref(cancel),
                           std::ref(result));
  } catch (const std::system_error& e) {
    channel.close();
    consumer.join();
    result.failure = std::string("cannot start producer thread: ") + e.what();
    PAYSTREAM_LOG_ERROR(kComponent, *result.failure);
    return result;
  }

  producer.join();
  consumer.join();

  PAYSTREAM_LOG_INFO(kComponent, "finished: read=" + std::to_string(result.read) +
                                     " applied=" + std::to_string(result.applied) +
                                     " rejected=" + std::to_string(result.rejected) +
                                     (result.cancelled ? " (cancelled)" : ""));
  return result;
}

void StreamPipeline::produce(TransactionSource& source, common::BoundedChannel<ledger::Transaction>& channel,
                             const common::CancellationToken& cancel, Result& result) {
  while (true) {
    if (cancel.is_cancelled()) {
      result.cancelled = true;
      PAYSTREAM_LOG_INFO(kComponent, "input processing cancelled");
      break;
    }

    std::optional<ledger::Transaction> transaction;
    try {
      transaction = source.next();
    } catch (const DecodeError& e) {
      result.failure = e.what();
      PAYSTREAM_LOG_ERROR(kComponent, std::string("decode failed, stopping input: ") + e.what());
      break;
    } catch (const std::exception& e) {
      result.failure = e.what();
      PAYSTREAM_LOG_ERROR(kComponent, std::string("input failed, stopping: ") + e.what());
      break;
    }

    if (!transaction) {
      PAYSTREAM_LOG_INFO(kComponent, "input exhausted");
      break;
    }

    const auto status = channel.send(*transaction, cancel);
    if (status == common::SendStatus::kCancelled) {
      result.cancelled = true;
      PAYSTREAM_LOG_INFO(kComponent, "input processing cancelled while waiting for the ledger");
      break;
    }
    if (status == common::SendStatus::kClosed) {
      result.failure = "transaction channel closed";
      PAYSTREAM_LOG_ERROR(kComponent, "transaction channel closed unexpectedly");
      break;
    }
    ++result.read;
  }

  channel.close();
}

void StreamPipeline::consume(common::BoundedChannel<ledger::Transaction>& channel, Result& result) {
  while (auto transaction = channel.receive()) {
    const Rejection context{
        .kind = ledger::kind(*transaction),
        .id = {.client = ledger::client_id(*transaction), .tx = ledger::transaction_id(*transaction)},
    };
    PAYSTREAM_LOG_DEBUG(kComponent, "received " + ledger::to_string(*transaction));
    if (metrics_) {
      metrics_->record_received();
    }

    const auto started = common::now_steady();
    const auto status = store_.process(std::move(*transaction));
    const auto elapsed = common::now_steady() - started;

    if (metrics_) {
      metrics_->record_outcome(status, elapsed);
    }

    if (status == ledger::TxStatus::kOk) {
      ++result.applied;
      continue;
    }

    ++result.rejected;
    PAYSTREAM_LOG_WARN(kComponent, std::string(ledger::kind_name(context.kind)) +
                                       " client=" + std::to_string(context.id.client) +
                                       " tx=" + std::to_string(context.id.tx) +
                                       " rejected: " + std::string(ledger::describe(status)));
    if (on_rejection_) {
      Rejection rejection = context;
      rejection.status = status;
      try {
        on_rejection_(rejection);
      } catch (const std::exception& e) {
        PAYSTREAM_LOG_ERROR(kComponent, std::string("rejection handler failed: ") + e.what());
      }
    }
  }
}

}  // namespace ingest
}  // namespace paystream
