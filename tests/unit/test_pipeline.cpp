#include "test_pipeline.hpp"

#include <cassert>
#include <cstdint>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <vector>

#include "paystream/common/cancellation.hpp"
#include "paystream/ingest/csv_reader.hpp"
#include "paystream/ingest/stream_pipeline.hpp"
#include "paystream/ledger/account_store.hpp"
#include "paystream/telemetry/pipeline_metrics.hpp"

namespace paystream::tests {

using common::Amount;

namespace {

// Emits `count` deposits of 1.0 for client 1 and raises `cancel` after
// handing out `cancel_after` of them.
class CancellingSource : public ingest::TransactionSource {
 public:
  CancellingSource(common::CancellationToken& cancel, std::uint32_t count, std::uint32_t cancel_after)
      : cancel_(cancel), count_(count), cancel_after_(cancel_after) {}

  std::optional<ledger::Transaction> next() override {
    if (emitted_ == count_) {
      return std::nullopt;
    }
    ++emitted_;
    if (emitted_ == cancel_after_) {
      cancel_.cancel();
    }
    return ledger::Deposit{ledger::MoneyTransaction(1, emitted_, Amount::from_whole(1))};
  }

 private:
  common::CancellationToken& cancel_;
  std::uint32_t count_;
  std::uint32_t cancel_after_;
  std::uint32_t emitted_{0};
};

}  // namespace

void test_pipeline_applies_stream() {
  std::istringstream input(
      "type, client, tx, amount\n"
      "deposit, 1, 1, 1.0\n"
      "deposit, 2, 2, 2.0\n"
      "deposit, 1, 3, 2.0\n"
      "withdrawal, 1, 4, 1.5\n"
      "withdrawal, 2, 5, 3.0\n");

  ledger::AccountStore store;
  telemetry::PipelineMetrics metrics;
  ingest::CsvReader reader(input);
  ingest::StreamPipeline pipeline(store, {.channel_capacity = 2}, &metrics);
  common::CancellationToken cancel;

  const auto result = pipeline.run(reader, cancel);
  assert(!result.cancelled);
  assert(!result.failure);
  assert(result.read == 5);
  assert(result.applied == 4);
  assert(result.rejected == 1);

  const auto accounts = store.snapshot();
  assert(accounts.size() == 2);
  assert(accounts.at(1).available() == *Amount::parse("1.5"));
  assert(accounts.at(1).total() == *Amount::parse("1.5"));
  assert(accounts.at(2).available() == *Amount::parse("2"));
  assert(!accounts.at(2).locked());

  const auto summary = metrics.summary();
  assert(summary.received == 5);
  assert(summary.applied == 4);
  assert(summary.by_status[static_cast<std::size_t>(ledger::TxStatus::kInsufficientFunds)] == 1);
}

void test_pipeline_reports_rejections() {
  std::istringstream input(
      "type,client,tx,amount\n"
      "deposit,1,1,100.00\n"
      "deposit,1,1,50.00\n"
      "dispute,1,1,\n"
      "chargeback,1,1,\n"
      "deposit,1,2,10\n");

  ledger::AccountStore store;
  ingest::CsvReader reader(input);
  ingest::StreamPipeline pipeline(store);
  std::vector<ingest::StreamPipeline::Rejection> rejections;
  pipeline.set_rejection_handler(
      [&rejections](const ingest::StreamPipeline::Rejection& rejection) { rejections.push_back(rejection); });
  common::CancellationToken cancel;

  const auto result = pipeline.run(reader, cancel);
  assert(result.applied == 3);
  assert(result.rejected == 2);
  assert(rejections.size() == 2);
  assert(rejections[0].status == ledger::TxStatus::kDuplicateTransactionId);
  assert(rejections[0].id.tx == 1);
  assert(rejections[1].status == ledger::TxStatus::kAccountLocked);
  assert(rejections[1].kind == ledger::TransactionKind::kDeposit);

  const auto account = store.find(1);
  assert(account->locked());
  assert(account->total() == Amount{});
}

void test_pipeline_survives_throwing_rejection_handler() {
  std::istringstream input(
      "type,client,tx,amount\n"
      "deposit,1,1,10\n"
      "withdrawal,1,2,50\n"
      "deposit,1,2,5\n"
      "resolve,1,1,\n"
      "deposit,1,3,1\n");

  ledger::AccountStore store;
  ingest::CsvReader reader(input);
  ingest::StreamPipeline pipeline(store);
  int calls = 0;
  pipeline.set_rejection_handler([&calls](const ingest::StreamPipeline::Rejection&) {
    ++calls;
    throw std::runtime_error("handler failure");
  });
  common::CancellationToken cancel;

  const auto result = pipeline.run(reader, cancel);
  assert(calls == 2);
  assert(!result.failure);
  assert(result.read == 5);
  assert(result.applied == 3);
  assert(result.rejected == 2);
  assert(store.find(1)->total() == Amount::from_whole(16));
}

void test_pipeline_stops_on_decode_error() {
  std::istringstream input(
      "type, client, tx, amount\n"
      "deposit, 1, 1, 10.0\n"
      "deposit, 1, 2, 5.0\n"
      "transfer, 1, 3, 1.0\n"
      "deposit, 1, 4, 7.0\n");

  ledger::AccountStore store;
  ingest::CsvReader reader(input);
  ingest::StreamPipeline pipeline(store);
  common::CancellationToken cancel;

  const auto result = pipeline.run(reader, cancel);
  assert(result.failure.has_value());
  assert(result.failure->find("line 4") != std::string::npos);
  assert(!result.cancelled);
  assert(result.read == 2);
  assert(result.applied == 2);
  assert(store.find(1)->total() == Amount::from_whole(15));
}

void test_pipeline_cancelled_before_start() {
  std::istringstream input("type, client, tx, amount\ndeposit, 1, 1, 10.0\n");
  ledger::AccountStore store;
  ingest::CsvReader reader(input);
  ingest::StreamPipeline pipeline(store);
  common::CancellationToken cancel;
  cancel.cancel();

  const auto result = pipeline.run(reader, cancel);
  assert(result.cancelled);
  assert(result.read == 0);
  assert(store.size() == 0);
}

void test_pipeline_cancelled_mid_stream() {
  common::CancellationToken cancel;
  CancellingSource source(cancel, 10'000, 250);
  ledger::AccountStore store;
  ingest::StreamPipeline pipeline(store, {.channel_capacity = 8});

  const auto result = pipeline.run(source, cancel);
  assert(result.cancelled);
  assert(!result.failure);
  // The transaction read when the token fired is dropped whole.
  assert(result.read == 249);
  assert(result.applied == result.read);

  // Store holds exactly the fully applied prefix.
  const auto account = store.find(1);
  assert(account.has_value());
  assert(account->total() == Amount::from_whole(static_cast<std::int64_t>(result.applied)));
  assert(account->ledger().size() == result.applied);
  assert(account->ledger().contains(249));
  assert(!account->ledger().contains(250));
}

}  // namespace paystream::tests
