#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <shared_mutex>
#include <unordered_map>

#include "paystream/common/types.hpp"
#include "paystream/ledger/account.hpp"
#include "paystream/ledger/transaction.hpp"
#include "paystream/ledger/tx_status.hpp"

namespace paystream {
namespace ledger {

// All accounts keyed by client id. Writers take the lock exclusively for the
// whole lookup-or-create plus apply, so two transactions of one client never
// interleave. Readers share it.
class AccountStore {
 public:
  AccountStore() = default;
  AccountStore(const AccountStore&) = delete;
  AccountStore& operator=(const AccountStore&) = delete;

  [[nodiscard]] TxStatus process(Transaction transaction);

  // Copy of every account, ordered by client id.
  [[nodiscard]] std::map<common::ClientId, Account> snapshot() const;
  [[nodiscard]] std::optional<Account> find(common::ClientId client) const;
  [[nodiscard]] std::size_t size() const;

 private:
  mutable std::shared_mutex mutex_;
  std::unordered_map<common::ClientId, Account> accounts_{};
};

}  // namespace ledger
}  // namespace paystream
