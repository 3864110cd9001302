#include "test_channel.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <stdexcept>
#include <thread>
#include "paystream/common/bounded_channel.hpp"

namespace paystream::tests {

using common::BoundedChannel;
using common::CancellationToken;
using common::SendStatus;

void test_channel_fifo_and_capacity() {
  bool threw = false;
  try {
    BoundedChannel<int> invalid(0);
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);

  BoundedChannel<int> channel(3);
  assert(channel.capacity() == 3);
  assert(channel.try_send(1));
  assert(channel.try_send(2));
  assert(channel.try_send(3));
  assert(!channel.try_send(4));
  assert(channel.size() == 3);

  assert(*channel.receive() == 1);
  assert(channel.try_send(4));
  assert(*channel.receive() == 2);
  assert(*channel.receive() == 3);
  assert(*channel.receive() == 4);
  assert(channel.size() == 0);
}

void test_channel_close_drains() {
  BoundedChannel<int> channel(4);
  CancellationToken cancel;
  assert(channel.send(7, cancel) == SendStatus::kSent);
  assert(channel.send(8, cancel) == SendStatus::kSent);
  channel.close();
  assert(channel.is_closed());

  assert(channel.send(9, cancel) == SendStatus::kClosed);
  assert(!channel.try_send(9));
  assert(*channel.receive() == 7);
  assert(*channel.receive() == 8);
  assert(!channel.receive());
}

void test_channel_send_cancelled_while_full() {
  BoundedChannel<int> channel(1);
  CancellationToken cancel;
  assert(channel.send(1, cancel) == SendStatus::kSent);

  std::thread canceller([&cancel] {
    std::this_thread::sleep_for(std::chrono::milliseconds(30));
    cancel.cancel();
  });

  int pending = 2;
  assert(channel.send(pending, cancel) == SendStatus::kCancelled);
  canceller.join();

  // Nothing half-sent: only the first element is queued and `pending` was not consumed.
  assert(pending == 2);
  assert(channel.size() == 1);
  assert(*channel.receive() == 1);
}

void test_channel_backpressure() {
  constexpr int kItems = 200;
  BoundedChannel<int> channel(2);
  CancellationToken cancel;
  std::atomic<int> max_depth{0};

  std::thread producer([&] {
    for (int i = 0; i < kItems; ++i) {
      assert(channel.send(i, cancel) == SendStatus::kSent);
      const int depth = static_cast<int>(channel.size());
      int seen = max_depth.load();
      while (depth > seen && !max_depth.compare_exchange_weak(seen, depth)) {
      }
    }
    channel.close();
  });

  int expected = 0;
  while (auto value = channel.receive()) {
    assert(*value == expected);
    ++expected;
    if (expected % 50 == 0) {
      std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
  }
  producer.join();

  assert(expected == kItems);
  assert(max_depth.load() <= 2);
}

}  // namespace paystream::tests
