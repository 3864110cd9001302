#pragma once

#include <cstdint>

namespace paystream {
namespace common {

using ClientId = std::uint16_t;
using TxId = std::uint32_t;
using TimestampNs = std::int64_t;

// Identity of a transaction: owning client plus the client-scoped sequence number.
struct ClientTransaction {
  ClientId client{};
  TxId tx{};

  friend bool operator==(const ClientTransaction&, const ClientTransaction&) = default;
};

}  // namespace common
}  // namespace paystream
