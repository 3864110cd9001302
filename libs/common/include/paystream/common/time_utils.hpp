#pragma once

#include <chrono>

#include "paystream/common/types.hpp"

namespace paystream {
namespace common {

inline std::chrono::nanoseconds now_steady() noexcept {
  return std::chrono::steady_clock::now().time_since_epoch();
}

inline TimestampNs now_wall_ns() noexcept {
  return std::chrono::duration_cast<std::chrono::nanoseconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

}  // namespace common
}  // namespace paystream
