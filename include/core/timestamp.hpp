#pragma once

#include <chrono>
#include <cstdint>
#include <functional>

namespace netspeed::core {

// Wall-clock source in Unix milliseconds. Injected wherever tests need to
// drive time explicitly.
using Clock = std::function<std::int64_t()>;

inline std::uint64_t monotonic_timestamp_now_ns() {
  const auto now = std::chrono::steady_clock::now().time_since_epoch();
  return static_cast<std::uint64_t>(
      std::chrono::duration_cast<std::chrono::nanoseconds>(now).count());
}

inline std::int64_t unix_timestamp_now_ms() {
  const auto now = std::chrono::system_clock::now().time_since_epoch();
  return static_cast<std::int64_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(now).count());
}

inline Clock system_clock_source() {
  return [] { return unix_timestamp_now_ms(); };
}

}  // namespace netspeed::core
