#pragma once

#include <cstdint>
#include <optional>

#include "paystream/common/amount.hpp"
#include "paystream/common/types.hpp"
#include "paystream/ledger/ledger.hpp"
#include "paystream/ledger/transaction.hpp"
#include "paystream/ledger/tx_status.hpp"

namespace paystream {
namespace ledger {

// Balances of one client plus the ledger of its money transactions.
// total == available + held holds after every call. Not synchronized;
// AccountStore serializes access.
class Account {
 public:
  explicit Account(common::ClientId client) noexcept : client_(client) {}

  // Applies one transaction owned by this client. On any status other than
  // kOk the account and its ledger are left unchanged.
  //
  // A locked account rejects everything except chargebacks: several disputed
  // transactions may still need to be charged back after the first one locks it.
  [[nodiscard]] TxStatus process(Transaction transaction);

  // Raw balance movements. deposit, dispute and resolve are no-ops on a locked
  // account; chargeback always locks. A movement that would push any balance
  // out of range leaves the balances untouched (withdraw reports it).
  void deposit(common::Amount amount) noexcept;
  [[nodiscard]] TxStatus withdraw(common::Amount amount) noexcept;
  void dispute(common::Amount amount) noexcept;
  void resolve(common::Amount amount) noexcept;
  void chargeback(common::Amount amount) noexcept;

  [[nodiscard]] common::ClientId client() const noexcept { return client_; }
  [[nodiscard]] common::Amount available() const noexcept { return available_; }
  [[nodiscard]] common::Amount held() const noexcept { return held_; }
  [[nodiscard]] common::Amount total() const noexcept { return total_; }
  [[nodiscard]] bool locked() const noexcept { return locked_; }
  [[nodiscard]] const Ledger& ledger() const noexcept { return ledger_; }

 private:
  struct Balances {
    common::Amount available;
    common::Amount held;
    common::Amount total;
  };
  enum class Move : std::int8_t { kDebit = -1, kNone = 0, kCredit = 1 };

  // Balances after moving `amount` in the given direction for each of
  // available/held/total, or nullopt if one of them would overflow.
  [[nodiscard]] std::optional<Balances> moved(common::Amount amount, Move available, Move held,
                                              Move total) const noexcept;
  void commit(const Balances& next) noexcept;

  TxStatus apply_deposit(Deposit deposit);
  TxStatus apply_withdrawal(Withdrawal withdrawal);
  TxStatus apply_dispute(const Dispute& dispute);
  TxStatus apply_resolve(const Resolve& resolve);
  TxStatus apply_chargeback(const Chargeback& chargeback);

  common::ClientId client_;
  Ledger ledger_{};
  common::Amount available_{};
  common::Amount held_{};
  common::Amount total_{};
  bool locked_{false};
};

}  // namespace ledger
}  // namespace paystream
