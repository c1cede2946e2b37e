#include "policy/threshold_policy.hpp"

#include <string>
#include <utility>

#include "core/math.hpp"

namespace sleep_agent::policy {
namespace {

constexpr double kHumidityFloor = 45.0;
constexpr double kHumidityTarget = 50.0;
constexpr double kTemperatureTolerance = 1.0;
constexpr double kDaylightLevel = 0.5;
constexpr double kMassageIntensity = 0.3;

model::nudge_action make_action(model::nudge_payload payload, std::string reason) {
  return model::nudge_action{std::move(payload), std::move(reason)};
}

}  // namespace

stage_targets targets_for(const model::sleep_stage stage) noexcept {
  switch (stage) {
    case model::sleep_stage::LIGHT:
      return {19.0, 0.05};
    case model::sleep_stage::DEEP:
      return {17.0, 0.0};
    case model::sleep_stage::REM:
      return {18.0, 0.01};
    case model::sleep_stage::AWAKE:
    case model::sleep_stage::UNKNOWN:
      break;
  }
  return {22.0, 0.8};
}

double physiological_stress(const double heart_rate, const double hrv) noexcept {
  const double heart_rate_stress = core::clamp01((heart_rate - 60.0) / 40.0);
  const double hrv_stress = core::clamp01((50.0 - hrv) / 50.0);
  return (heart_rate_stress + hrv_stress) / 2.0;
}

ThresholdPolicy::ThresholdPolicy(const ThresholdPolicyOptions options) noexcept
    : options_(options), ticks_since_nudge_(options.cooldown_ticks) {}

std::optional<model::nudge_action> ThresholdPolicy::decide(const model::sleep_state& state,
                                                           const model::environment_snapshot& environment) {
  if (ticks_since_nudge_ < options_.cooldown_ticks) {
    ++ticks_since_nudge_;
    return std::nullopt;
  }

  auto action = evaluate(state, environment);
  if (action.has_value()) {
    ticks_since_nudge_ = 0;
  }
  return action;
}

std::optional<model::nudge_action> ThresholdPolicy::evaluate(const model::sleep_state& state,
                                                             const model::environment_snapshot& environment) const {
  if (state.stage == model::sleep_stage::UNKNOWN) {
    return std::nullopt;
  }

  const bool asleep = state.stage != model::sleep_stage::AWAKE;
  const stage_targets targets = targets_for(state.stage);

  if (state.stage == model::sleep_stage::LIGHT &&
      physiological_stress(state.heart_rate, state.hrv) >= options_.stress_threshold) {
    return make_action(model::haptic_nudge{model::haptic_kind::GENTLE_PULSE}, "high physiological stress");
  }

  if (state.heart_rate > options_.heart_rate_threshold) {
    return make_action(model::audio_nudge{model::audio_kind::PINK_NOISE}, "elevated heart rate");
  }

  if (!asleep && state.time_in_stage_s >= options_.massage_after_awake_s) {
    return make_action(model::bed_motor_nudge{model::bed_motor_kind::START_MASSAGE, kMassageIntensity},
                       "prolonged wakefulness");
  }

  if (environment.temperature > targets.temperature_c + kTemperatureTolerance) {
    return make_action(model::environment_nudge{model::environment_kind::LOWER_TEMPERATURE, targets.temperature_c},
                       "room warmer than stage target");
  }

  if (environment.humidity < kHumidityFloor) {
    return make_action(model::environment_nudge{model::environment_kind::RAISE_HUMIDITY, kHumidityTarget},
                       "humidity below comfort range");
  }

  if (environment.light_level > targets.max_light_level) {
    if (environment.light_level > kDaylightLevel) {
      return make_action(model::environment_nudge{model::environment_kind::CLOSE_BLINDS, 0.0},
                         "daylight in bedroom");
    }
    return make_action(model::environment_nudge{model::environment_kind::DIM_LIGHTS, targets.max_light_level},
                       "light above stage maximum");
  }

  if (environment.noise_level > options_.noise_threshold) {
    return make_action(model::audio_nudge{model::audio_kind::PINK_NOISE}, "masking ambient noise");
  }

  if (environment.air_quality < options_.air_quality_threshold) {
    return make_action(model::environment_nudge{model::environment_kind::START_HEPA_FILTER, 1.0},
                       "poor air quality");
  }

  return std::nullopt;
}

}  // namespace sleep_agent::policy
