#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <utility>
#include <vector>

#include "paystream/common/cancellation.hpp"

namespace paystream {
namespace common {

enum class SendStatus : std::uint8_t {
  kSent,
  kCancelled,
  kClosed,
};

// Fixed-capacity multi-producer/multi-consumer FIFO. send() blocks while the
// ring is full, receive() blocks while it is empty and open. Once closed,
// send() fails and receive() drains the remaining elements before returning
// nullopt.
template <typename T>
class BoundedChannel {
 public:
  // Interval at which a blocked send() re-checks its cancellation token.
  static constexpr std::chrono::milliseconds kCancelPollInterval{10};

  explicit BoundedChannel(std::size_t capacity) : buffer_(capacity) {
    if (capacity == 0) {
      throw std::invalid_argument("BoundedChannel capacity must be positive");
    }
  }

  BoundedChannel(const BoundedChannel&) = delete;
  BoundedChannel& operator=(const BoundedChannel&) = delete;

  // Blocks while full. The value is moved into the channel only on kSent;
  // on kCancelled or kClosed it is left untouched.
  SendStatus send(T& value, const CancellationToken& cancel) {
    std::unique_lock lock(mutex_);
    while (true) {
      if (closed_) {
        return SendStatus::kClosed;
      }
      if (cancel.is_cancelled()) {
        return SendStatus::kCancelled;
      }
      if (count_ < buffer_.size()) {
        break;
      }
      not_full_.wait_for(lock, kCancelPollInterval);
    }

    buffer_[head_] = std::move(value);
    head_ = (head_ + 1) % buffer_.size();
    ++count_;
    lock.unlock();
    not_empty_.notify_one();
    return SendStatus::kSent;
  }

  SendStatus send(T&& value, const CancellationToken& cancel) {
    T local = std::move(value);
    return send(local, cancel);
  }

  // Non-blocking variant; returns false when full or closed.
  bool try_send(T value) {
    {
      std::scoped_lock lock(mutex_);
      if (closed_ || count_ == buffer_.size()) {
        return false;
      }
      buffer_[head_] = std::move(value);
      head_ = (head_ + 1) % buffer_.size();
      ++count_;
    }
    not_empty_.notify_one();
    return true;
  }

  // Blocks until an element is available or the channel is closed and drained.
  std::optional<T> receive() {
    std::unique_lock lock(mutex_);
    not_empty_.wait(lock, [this] { return count_ > 0 || closed_; });
    if (count_ == 0) {
      return std::nullopt;
    }

    std::optional<T> out = std::move(buffer_[tail_]);
    buffer_[tail_].reset();
    tail_ = (tail_ + 1) % buffer_.size();
    --count_;
    lock.unlock();
    not_full_.notify_one();
    return out;
  }

  void close() {
    {
      std::scoped_lock lock(mutex_);
      closed_ = true;
    }
    not_empty_.notify_all();
    not_full_.notify_all();
  }

  [[nodiscard]] bool is_closed() const {
    std::scoped_lock lock(mutex_);
    return closed_;
  }

  [[nodiscard]] std::size_t size() const {
    std::scoped_lock lock(mutex_);
    return count_;
  }

  [[nodiscard]] std::size_t capacity() const noexcept { return buffer_.size(); }

 private:
  mutable std::mutex mutex_;
  std::condition_variable not_empty_;
  std::condition_variable not_full_;
  std::vector<std::optional<T>> buffer_;
  std::size_t head_{0};
  std::size_t tail_{0};
  std::size_t count_{0};
  bool closed_{false};
};

}  // namespace common
}  // namespace paystream
