#pragma once

#include <chrono>
#include <cstdint>

namespace sleep_agent::core {

using steady_time = std::chrono::steady_clock::time_point;

inline std::uint64_t monotonic_timestamp_now_ns() {
  const auto now = std::chrono::steady_clock::now().time_since_epoch();
  return static_cast<std::uint64_t>(
      std::chrono::duration_cast<std::chrono::nanoseconds>(now).count());
}

inline std::uint64_t unix_timestamp_now_ms() {
  const auto now = std::chrono::system_clock::now().time_since_epoch();
  return static_cast<std::uint64_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(now).count());
}

template <typename Rep, typename Period>
float to_float_ms(const std::chrono::duration<Rep, Period> duration) noexcept {
  return std::chrono::duration_cast<std::chrono::duration<float, std::milli>>(duration).count();
}

inline float elapsed_ms(const steady_time from, const steady_time to) noexcept { return to_float_ms(to - from); }

// Session hours covered by the ticks completed before the current one.
inline double hours_elapsed(const std::chrono::milliseconds tick_interval, const std::uint64_t completed_ticks) noexcept {
  return std::chrono::duration<double, std::ratio<3600>>(tick_interval).count() * static_cast<double>(completed_ticks);
}

}  // namespace sleep_agent::core
