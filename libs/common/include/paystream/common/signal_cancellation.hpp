#pragma once

#include "paystream/common/cancellation.hpp"

namespace paystream {
namespace common {

// Raises `token` on SIGINT or SIGTERM while the guard is alive and restores
// the default dispositions when it goes out of scope. The token is handed to
// the handler through a lock-free atomic pointer. Only one guard may be alive
// at a time, and `token` must outlive it.
class SignalCancellation {
 public:
  explicit SignalCancellation(CancellationToken& token);
  ~SignalCancellation();

  SignalCancellation(const SignalCancellation&) = delete;
  SignalCancellation& operator=(const SignalCancellation&) = delete;
};

}  // namespace common
}  // namespace paystream
