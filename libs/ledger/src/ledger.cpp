#include "paystream/ledger/ledger.hpp"

#include <utility>

namespace paystream {
namespace ledger {

void Ledger::add(common::TxId tx_id, Transaction transaction) {
  entries_.insert_or_assign(tx_id, std::move(transaction));
}

const Transaction* Ledger::find(common::TxId tx_id) const {
  if (auto it = entries_.find(tx_id); it != entries_.end()) {
    return &it->second;
  }
  return nullptr;
}

Transaction* Ledger::find(common::TxId tx_id) {
  if (auto it = entries_.find(tx_id); it != entries_.end()) {
    return &it->second;
  }
  return nullptr;
}

bool Ledger::is_disputed(common::TxId tx_id) const {
  const auto* entry = find(tx_id);
  if (!entry) {
    return false;
  }
  const auto* money_tx = money(*entry);
  return money_tx && money_tx->is_disputed();
}

bool Ledger::is_chargedback(common::TxId tx_id) const {
  const auto* entry = find(tx_id);
  if (!entry) {
    return false;
  }
  const auto* money_tx = money(*entry);
  return money_tx && money_tx->is_chargedback();
}

}  // namespace ledger
}  // namespace paystream
