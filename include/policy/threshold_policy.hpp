#pragma once

#include <cstdint>
#include <optional>

#include "policy/decision_policy.hpp"

namespace sleep_agent::policy {

struct ThresholdPolicyOptions {
  std::uint32_t cooldown_ticks{10};
  double heart_rate_threshold{75.0};
  double noise_threshold{0.5};
  double stress_threshold{0.7};
  double air_quality_threshold{0.5};
  double massage_after_awake_s{1200.0};
};

struct stage_targets {
  double temperature_c;
  double max_light_level;
};

stage_targets targets_for(model::sleep_stage stage) noexcept;

// Combined heart-rate / HRV strain in [0,1]; 60 bpm and 50 ms are treated as relaxed.
double physiological_stress(double heart_rate, double hrv) noexcept;

// Fixed-priority rule set with a cooldown between nudges.
class ThresholdPolicy final : public DecisionPolicy {
 public:
  explicit ThresholdPolicy(ThresholdPolicyOptions options = {}) noexcept;

  std::optional<model::nudge_action> decide(const model::sleep_state& state,
                                            const model::environment_snapshot& environment) override;

 private:
  std::optional<model::nudge_action> evaluate(const model::sleep_state& state,
                                              const model::environment_snapshot& environment) const;

  ThresholdPolicyOptions options_;
  std::uint64_t ticks_since_nudge_;
};

}  // namespace sleep_agent::policy
