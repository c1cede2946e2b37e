#pragma once

#include <algorithm>
#include <cmath>

namespace sleep_agent::core {

inline constexpr double clamp01(const double value) noexcept {
  return std::clamp(value, 0.0, 1.0);
}

inline double finite_or(const double value, const double fallback) noexcept {
  return std::isfinite(value) ? value : fallback;
}

}  // namespace sleep_agent::core
