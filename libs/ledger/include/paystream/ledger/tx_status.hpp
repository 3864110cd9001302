#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace paystream {
namespace ledger {

enum class TxStatus : std::uint8_t {
  kOk,
  kAccountLocked,
  kDuplicateTransactionId,
  kInsufficientFunds,
  kAlreadyDisputed,
  kAlreadyChargedback,
  kChargedbackImmutable,
  kNotDisputed,
  kTransactionNotFound,
  kBalanceOverflow,
};

inline constexpr std::size_t kTxStatusCount = 10;

[[nodiscard]] std::string_view describe(TxStatus status) noexcept;

}  // namespace ledger
}  // namespace paystream
