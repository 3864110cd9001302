#include "paystream/common/signal_cancellation.hpp"

#include <atomic>
#include <csignal>

namespace paystream {
namespace common {

namespace {

std::atomic<CancellationToken*> g_signal_token{nullptr};
static_assert(std::atomic<CancellationToken*>::is_always_lock_free);

void on_shutdown_signal(int) {
  if (auto* token = g_signal_token.load(std::memory_order_acquire)) {
    token->cancel();
  }
}

}  // namespace

SignalCancellation::SignalCancellation(CancellationToken& token) {
  g_signal_token.store(&token, std::memory_order_release);
  std::signal(SIGINT, on_shutdown_signal);
  std::signal(SIGTERM, on_shutdown_signal);
}

SignalCancellation::~SignalCancellation() {
  std::signal(SIGINT, SIG_DFL);
  std::signal(SIGTERM, SIG_DFL);
  g_signal_token.store(nullptr, std::memory_order_release);
}

}  // namespace common
}  // namespace paystream
