#include "paystream/ledger/tx_status.hpp"

namespace paystream {
namespace ledger {

std::string_view describe(TxStatus status) noexcept {
  switch (status) {
    case TxStatus::kOk:
      return "ok";
    case TxStatus::kAccountLocked:
      return "account is locked";
    case TxStatus::kDuplicateTransactionId:
      return "transaction id already exists";
    case TxStatus::kInsufficientFunds:
      return "insufficient funds";
    case TxStatus::kAlreadyDisputed:
      return "transaction is already under dispute";
    case TxStatus::kAlreadyChargedback:
      return "cannot dispute a chargedback transaction";
    case TxStatus::kChargedbackImmutable:
      return "chargedback transaction cannot change state";
    case TxStatus::kNotDisputed:
      return "transaction is not under dispute";
    case TxStatus::kTransactionNotFound:
      return "transaction not found";
    case TxStatus::kBalanceOverflow:
      return "balance would exceed the representable range";
  }
  return "unknown";
}

}  // namespace ledger
}  // namespace paystream
