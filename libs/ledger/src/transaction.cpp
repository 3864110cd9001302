#include "paystream/ledger/transaction.hpp"

#include <utility>

#include "paystream/common/time_utils.hpp"

namespace paystream {
namespace ledger {

namespace {

template <typename... Ts>
struct Overloaded : Ts... {
  using Ts::operator()...;
};
template <typename... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

const common::ClientTransaction& identity(const Transaction& transaction) noexcept {
  return std::visit(
      Overloaded{
          [](const Deposit& d) -> const common::ClientTransaction& { return d.money.id(); },
          [](const Withdrawal& w) -> const common::ClientTransaction& { return w.money.id(); },
          [](const Dispute& d) -> const common::ClientTransaction& { return d.target; },
          [](const Resolve& r) -> const common::ClientTransaction& { return r.target; },
          [](const Chargeback& c) -> const common::ClientTransaction& { return c.target; },
      },
      transaction);
}

}  // namespace

MoneyTransaction::MoneyTransaction(common::ClientId client, common::TxId tx, common::Amount amount)
    : id_{.client = client, .tx = tx}, amount_(amount), timestamp_ns_(common::now_wall_ns()) {
  if (!amount.is_positive()) {
    throw InvalidAmount("transaction amount must be positive, got: " + amount.to_string());
  }
}

TxStatus MoneyTransaction::mark_disputed() noexcept {
  if (state_ == DisputeState::kDisputed) {
    return TxStatus::kAlreadyDisputed;
  }
  if (state_ == DisputeState::kChargedback) {
    return TxStatus::kChargedbackImmutable;
  }
  state_ = DisputeState::kDisputed;
  return TxStatus::kOk;
}

TxStatus MoneyTransaction::resolve_dispute() noexcept {
  if (state_ != DisputeState::kDisputed) {
    return TxStatus::kNotDisputed;
  }
  state_ = DisputeState::kNormal;
  return TxStatus::kOk;
}

TxStatus MoneyTransaction::mark_chargedback() noexcept {
  if (state_ != DisputeState::kDisputed) {
    return TxStatus::kNotDisputed;
  }
  state_ = DisputeState::kChargedback;
  return TxStatus::kOk;
}

common::ClientId client_id(const Transaction& transaction) noexcept {
  return identity(transaction).client;
}

common::TxId transaction_id(const Transaction& transaction) noexcept {
  return identity(transaction).tx;
}

TransactionKind kind(const Transaction& transaction) noexcept {
  return std::visit(Overloaded{
                        [](const Deposit&) { return TransactionKind::kDeposit; },
                        [](const Withdrawal&) { return TransactionKind::kWithdrawal; },
                        [](const Dispute&) { return TransactionKind::kDispute; },
                        [](const Resolve&) { return TransactionKind::kResolve; },
                        [](const Chargeback&) { return TransactionKind::kChargeback; },
                    },
                    transaction);
}

std::string_view kind_name(TransactionKind kind) noexcept {
  switch (kind) {
    case TransactionKind::kDeposit:
      return "deposit";
    case TransactionKind::kWithdrawal:
      return "withdrawal";
    case TransactionKind::kDispute:
      return "dispute";
    case TransactionKind::kResolve:
      return "resolve";
    case TransactionKind::kChargeback:
      return "chargeback";
  }
  return "unknown";
}

const MoneyTransaction* money(const Transaction& transaction) noexcept {
  if (const auto* deposit = std::get_if<Deposit>(&transaction)) {
    return &deposit->money;
  }
  if (const auto* withdrawal = std::get_if<Withdrawal>(&transaction)) {
    return &withdrawal->money;
  }
  return nullptr;
}

MoneyTransaction* money(Transaction& transaction) noexcept {
  return const_cast<MoneyTransaction*>(money(std::as_const(transaction)));
}

std::string to_string(const Transaction& transaction) {
  std::string out{kind_name(kind(transaction))};
  out += " client=" + std::to_string(client_id(transaction));
  out += " tx=" + std::to_string(transaction_id(transaction));
  if (const auto* m = money(transaction)) {
    out += " amount=" + m->amount().to_string();
  }
  return out;
}

}  // namespace ledger
}  // namespace paystream
