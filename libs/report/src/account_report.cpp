#include "paystream/report/account_report.hpp"

namespace paystream {
namespace report {

void write_accounts(std::ostream& out, const std::map<common::ClientId, ledger::Account>& accounts) {
  out << kHeader << '\n';
  for (const auto& [client, account] : accounts) {
    out << client << ", " << account.available().to_string() << ", " << account.held().to_string() << ", "
        << account.total().to_string() << ", " << (account.locked() ? "true" : "false") << '\n';
  }
  out.flush();
}

}  // namespace report
}  // namespace paystream
