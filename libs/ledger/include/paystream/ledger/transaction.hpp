#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>

#include "paystream/common/amount.hpp"
#include "paystream/common/types.hpp"
#include "paystream/ledger/tx_status.hpp"

namespace paystream {
namespace ledger {

class InvalidAmount : public std::invalid_argument {
 public:
  explicit InvalidAmount(const std::string& what) : std::invalid_argument(what) {}
};

enum class DisputeState : std::uint8_t {
  kNormal,
  kDisputed,
  kChargedback,
};

// A deposit or withdrawal. The amount is validated once, on construction.
class MoneyTransaction {
 public:
  // Throws InvalidAmount unless amount > 0. Stamps the current wall-clock time.
  MoneyTransaction(common::ClientId client, common::TxId tx, common::Amount amount);

  [[nodiscard]] const common::ClientTransaction& id() const noexcept { return id_; }
  [[nodiscard]] common::Amount amount() const noexcept { return amount_; }
  [[nodiscard]] common::TimestampNs timestamp_ns() const noexcept { return timestamp_ns_; }
  [[nodiscard]] DisputeState state() const noexcept { return state_; }

  [[nodiscard]] bool is_disputed() const noexcept { return state_ == DisputeState::kDisputed; }
  [[nodiscard]] bool is_chargedback() const noexcept { return state_ == DisputeState::kChargedback; }

  // Normal -> Disputed -> {Normal, Chargedback}. Chargedback is terminal.
  [[nodiscard]] TxStatus mark_disputed() noexcept;
  [[nodiscard]] TxStatus resolve_dispute() noexcept;
  [[nodiscard]] TxStatus mark_chargedback() noexcept;

  friend bool operator==(const MoneyTransaction&, const MoneyTransaction&) = default;

 private:
  common::ClientTransaction id_;
  common::Amount amount_;
  common::TimestampNs timestamp_ns_{0};
  DisputeState state_{DisputeState::kNormal};
};

struct Deposit {
  MoneyTransaction money;
  friend bool operator==(const Deposit&, const Deposit&) = default;
};

struct Withdrawal {
  MoneyTransaction money;
  friend bool operator==(const Withdrawal&, const Withdrawal&) = default;
};

struct Dispute {
  common::ClientTransaction target;
  friend bool operator==(const Dispute&, const Dispute&) = default;
};

struct Resolve {
  common::ClientTransaction target;
  friend bool operator==(const Resolve&, const Resolve&) = default;
};

struct Chargeback {
  common::ClientTransaction target;
  friend bool operator==(const Chargeback&, const Chargeback&) = default;
};

using Transaction = std::variant<Deposit, Withdrawal, Dispute, Resolve, Chargeback>;

enum class TransactionKind : std::uint8_t {
  kDeposit,
  kWithdrawal,
  kDispute,
  kResolve,
  kChargeback,
};

[[nodiscard]] common::ClientId client_id(const Transaction& transaction) noexcept;
[[nodiscard]] common::TxId transaction_id(const Transaction& transaction) noexcept;
[[nodiscard]] TransactionKind kind(const Transaction& transaction) noexcept;
[[nodiscard]] std::string_view kind_name(TransactionKind kind) noexcept;

// Null for dispute, resolve and chargeback.
[[nodiscard]] const MoneyTransaction* money(const Transaction& transaction) noexcept;
[[nodiscard]] MoneyTransaction* money(Transaction& transaction) noexcept;

// "deposit client=1 tx=7 amount=1.5", for diagnostics.
[[nodiscard]] std::string to_string(const Transaction& transaction);

}  // namespace ledger
}  // namespace paystream
