#include "paystream/ledger/account_store.hpp"

#include <mutex>
#include <utility>

namespace paystream {
namespace ledger {

TxStatus AccountStore::process(Transaction transaction) {
  const auto client = client_id(transaction);

  std::unique_lock lock(mutex_);
  auto [it, inserted] = accounts_.try_emplace(client, client);
  return it->second.process(std::move(transaction));
}

std::map<common::ClientId, Account> AccountStore::snapshot() const {
  std::shared_lock lock(mutex_);
  return {accounts_.begin(), accounts_.end()};
}

std::optional<Account> AccountStore::find(common::ClientId client) const {
  std::shared_lock lock(mutex_);
  if (auto it = accounts_.find(client); it != accounts_.end()) {
    return it->second;
  }
  return std::nullopt;
}

std::size_t AccountStore::size() const {
  std::shared_lock lock(mutex_);
  return accounts_.size();
}

}  // namespace ledger
}  // namespace paystream
