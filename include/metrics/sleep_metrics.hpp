#pragma once

#include <array>
#include <chrono>
#include <vector>

#include "model/nudge_action.hpp"
#include "model/sleep_frame.hpp"

namespace sleep_agent::metrics {

struct SleepMetricsReport {
  std::array<std::chrono::milliseconds, model::kSleepStageCount> per_stage{};
  std::chrono::milliseconds total_sleep_time{0};
  std::chrono::milliseconds session_duration{0};
  double deep_pct{0.0};
  double rem_pct{0.0};
  double light_pct{0.0};
  double awake_pct{0.0};
  double quality_score{0.0};
  std::vector<model::nudge_action> interventions{};
};

// Session accumulator. Every derived figure is recomputed from the per-stage
// durations and the last observed state; nothing derived is cached.
class SleepMetrics {
 public:
  SleepMetrics() = default;

  void record(model::sleep_stage stage, std::chrono::milliseconds duration) noexcept;
  void observe(const model::sleep_state& state) noexcept;
  void add_intervention(model::nudge_action action);
  void reset() noexcept;

  [[nodiscard]] static double quality_score(double hrv, double heart_rate) noexcept;
  [[nodiscard]] double quality_score() const noexcept;

  [[nodiscard]] double deep_sleep_percentage() const noexcept;
  [[nodiscard]] double rem_sleep_percentage() const noexcept;
  [[nodiscard]] double light_sleep_percentage() const noexcept;
  [[nodiscard]] double awake_percentage() const noexcept;

  [[nodiscard]] std::chrono::milliseconds stage_duration(model::sleep_stage stage) const noexcept;
  [[nodiscard]] std::chrono::milliseconds total_sleep_time() const noexcept;
  [[nodiscard]] std::chrono::milliseconds session_duration() const noexcept;

  [[nodiscard]] const std::vector<model::nudge_action>& interventions() const noexcept;
  [[nodiscard]] SleepMetricsReport report() const;

 private:
  [[nodiscard]] double stage_fraction(model::sleep_stage stage) const noexcept;
  [[nodiscard]] std::chrono::milliseconds classified_duration() const noexcept;

  std::array<std::chrono::milliseconds, model::kSleepStageCount> per_stage_{};
  model::sleep_state last_state_{model::sleep_stage::UNKNOWN, 0.0, 0.0, 0.0};
  bool has_state_{false};
  std::vector<model::nudge_action> interventions_{};
};

}  // namespace sleep_agent::metrics
