#pragma once

#include <cstddef>
#include <unordered_map>

#include "paystream/common/types.hpp"
#include "paystream/ledger/transaction.hpp"

namespace paystream {
namespace ledger {

// Money transactions of a single account, keyed by transaction id.
class Ledger {
 public:
  // Inserts or overwrites. Callers check uniqueness with find() first.
  void add(common::TxId tx_id, Transaction transaction);

  [[nodiscard]] const Transaction* find(common::TxId tx_id) const;
  [[nodiscard]] Transaction* find(common::TxId tx_id);

  [[nodiscard]] bool contains(common::TxId tx_id) const { return entries_.contains(tx_id); }
  [[nodiscard]] bool is_disputed(common::TxId tx_id) const;
  [[nodiscard]] bool is_chargedback(common::TxId tx_id) const;
  [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }

 private:
  std::unordered_map<common::TxId, Transaction> entries_{};
};

}  // namespace ledger
}  // namespace paystream
