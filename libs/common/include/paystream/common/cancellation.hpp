#pragma once

#include <atomic>

namespace paystream {
namespace common {

// Cooperative cancellation flag shared by reference between the party that
// requests shutdown and the tasks that poll it. cancel() only performs a
// lock-free atomic store, so it may be called from a signal handler.
class CancellationToken {
 public:
  CancellationToken() = default;
  CancellationToken(const CancellationToken&) = delete;
  CancellationToken& operator=(const CancellationToken&) = delete;

  void cancel() noexcept { cancelled_.store(true, std::memory_order_release); }

  [[nodiscard]] bool is_cancelled() const noexcept {
    return cancelled_.load(std::memory_order_acquire);
  }

 private:
  std::atomic<bool> cancelled_{false};
  static_assert(std::atomic<bool>::is_always_lock_free);
};

}  // namespace common
}  // namespace paystream
