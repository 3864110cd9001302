#include "paystream/ledger/account.hpp"

#include <optional>
#include <utility>
#include <variant>

namespace paystream {
namespace ledger {

TxStatus Account::process(Transaction transaction) {
  if (locked_ && !std::holds_alternative<Chargeback>(transaction)) {
    return TxStatus::kAccountLocked;
  }

  switch (kind(transaction)) {
    case TransactionKind::kDeposit:
      return apply_deposit(std::get<Deposit>(std::move(transaction)));
    case TransactionKind::kWithdrawal:
      return apply_withdrawal(std::get<Withdrawal>(std::move(transaction)));
    case TransactionKind::kDispute:
      return apply_dispute(std::get<Dispute>(transaction));
    case TransactionKind::kResolve:
      return apply_resolve(std::get<Resolve>(transaction));
    case TransactionKind::kChargeback:
      return apply_chargeback(std::get<Chargeback>(transaction));
  }
  return TxStatus::kTransactionNotFound;
}

TxStatus Account::apply_deposit(Deposit deposit) {
  const auto tx_id = deposit.money.id().tx;
  if (ledger_.contains(tx_id)) {
    return TxStatus::kDuplicateTransactionId;
  }

  const auto next = moved(deposit.money.amount(), Move::kCredit, Move::kNone, Move::kCredit);
  if (!next) {
    return TxStatus::kBalanceOverflow;
  }
  commit(*next);
  ledger_.add(tx_id, std::move(deposit));
  return TxStatus::kOk;
}

TxStatus Account::apply_withdrawal(Withdrawal withdrawal) {
  const auto tx_id = withdrawal.money.id().tx;
  if (ledger_.contains(tx_id)) {
    return TxStatus::kDuplicateTransactionId;
  }

  if (const auto status = withdraw(withdrawal.money.amount()); status != TxStatus::kOk) {
    return status;
  }
  ledger_.add(tx_id, std::move(withdrawal));
  return TxStatus::kOk;
}

TxStatus Account::apply_dispute(const Dispute& dispute) {
  const auto tx_id = dispute.target.tx;
  if (ledger_.is_disputed(tx_id)) {
    return TxStatus::kAlreadyDisputed;
  }
  if (ledger_.is_chargedback(tx_id)) {
    return TxStatus::kAlreadyChargedback;
  }

  auto* entry = ledger_.find(tx_id);
  auto* money_tx = entry ? money(*entry) : nullptr;
  if (!money_tx) {
    return TxStatus::kTransactionNotFound;
  }
  const auto next = moved(money_tx->amount(), Move::kDebit, Move::kCredit, Move::kNone);
  if (!next) {
    return TxStatus::kBalanceOverflow;
  }
  if (const auto status = money_tx->mark_disputed(); status != TxStatus::kOk) {
    return status;
  }

  commit(*next);
  return TxStatus::kOk;
}

TxStatus Account::apply_resolve(const Resolve& resolve) {
  const auto tx_id = resolve.target.tx;
  if (!ledger_.is_disputed(tx_id)) {
    return TxStatus::kNotDisputed;
  }

  auto* entry = ledger_.find(tx_id);
  auto* money_tx = entry ? money(*entry) : nullptr;
  if (!money_tx) {
    return TxStatus::kTransactionNotFound;
  }
  const auto next = moved(money_tx->amount(), Move::kCredit, Move::kDebit, Move::kNone);
  if (!next) {
    return TxStatus::kBalanceOverflow;
  }
  if (const auto status = money_tx->resolve_dispute(); status != TxStatus::kOk) {
    return status;
  }

  commit(*next);
  return TxStatus::kOk;
}

TxStatus Account::apply_chargeback(const Chargeback& chargeback) {
  const auto tx_id = chargeback.target.tx;
  if (!ledger_.is_disputed(tx_id)) {
    return TxStatus::kNotDisputed;
  }

  auto* entry = ledger_.find(tx_id);
  auto* money_tx = entry ? money(*entry) : nullptr;
  if (!money_tx) {
    return TxStatus::kTransactionNotFound;
  }
  const auto next = moved(money_tx->amount(), Move::kNone, Move::kDebit, Move::kDebit);
  if (!next) {
    return TxStatus::kBalanceOverflow;
  }
  if (const auto status = money_tx->mark_chargedback(); status != TxStatus::kOk) {
    return status;
  }

  commit(*next);
  locked_ = true;
  return TxStatus::kOk;
}

std::optional<Account::Balances> Account::moved(common::Amount amount, Move available, Move held,
                                                Move total) const noexcept {
  auto shift = [amount](common::Amount balance, Move move) -> std::optional<common::Amount> {
    switch (move) {
      case Move::kCredit:
        return balance.checked_add(amount);
      case Move::kDebit:
        return balance.checked_sub(amount);
      case Move::kNone:
        break;
    }
    return balance;
  };

  const auto next_available = shift(available_, available);
  const auto next_held = shift(held_, held);
  const auto next_total = shift(total_, total);
  if (!next_available || !next_held || !next_total) {
    return std::nullopt;
  }
  return Balances{.available = *next_available, .held = *next_held, .total = *next_total};
}

void Account::commit(const Balances& next) noexcept {
  available_ = next.available;
  held_ = next.held;
  total_ = next.total;
}

void Account::deposit(common::Amount amount) noexcept {
  if (locked_) {
    return;
  }
  if (const auto next = moved(amount, Move::kCredit, Move::kNone, Move::kCredit)) {
    commit(*next);
  }
}

TxStatus Account::withdraw(common::Amount amount) noexcept {
  if (locked_) {
    return TxStatus::kAccountLocked;
  }
  if (available_ < amount) {
    return TxStatus::kInsufficientFunds;
  }
  const auto next = moved(amount, Move::kDebit, Move::kNone, Move::kDebit);
  if (!next) {
    return TxStatus::kBalanceOverflow;
  }
  commit(*next);
  return TxStatus::kOk;
}

void Account::dispute(common::Amount amount) noexcept {
  if (locked_) {
    return;
  }
  if (const auto next = moved(amount, Move::kDebit, Move::kCredit, Move::kNone)) {
    commit(*next);
  }
}

void Account::resolve(common::Amount amount) noexcept {
  if (locked_) {
    return;
  }
  if (const auto next = moved(amount, Move::kCredit, Move::kDebit, Move::kNone)) {
    commit(*next);
  }
}

// Not gated on locked_: chargebacks keep applying after the account locks.
void Account::chargeback(common::Amount amount) noexcept {
  if (const auto next = moved(amount, Move::kNone, Move::kDebit, Move::kDebit)) {
    commit(*next);
  }
  locked_ = true;
}

}  // namespace ledger
}  // namespace paystream
