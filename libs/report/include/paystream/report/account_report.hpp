#pragma once

#include <map>
#include <ostream>

#include "paystream/common/types.hpp"
#include "paystream/ledger/account.hpp"

namespace paystream {
namespace report {

inline constexpr const char* kHeader = "client, available, held, total, locked";

// One row per client in ascending client id:
//   client, available, held, total, locked
//   1, 1.5, 0.0, 1.5, false
void write_accounts(std::ostream& out, const std::map<common::ClientId, ledger::Account>& accounts);

}  // namespace report
}  // namespace paystream
