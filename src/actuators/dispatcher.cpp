#include "actuators/dispatcher.hpp"

#include <cmath>
#include <exception>
#include <iostream>
#include <utility>
#include <variant>

namespace sleep_agent::actuators {
namespace {

constexpr double kTargetEpsilon = 1e-6;
constexpr const char* kHepaSleepMode = "sleep";
constexpr const char* kHepaOffMode = "off";

template <typename Command>
bool invoke_guarded(const char* what, Command&& command) {
  try {
    return command();
  } catch (const std::exception& ex) {
    std::cerr << "[dispatch] " << what << " threw: " << ex.what() << '\n';
    return false;
  }
}

}  // namespace

ActuatorDispatcher::ActuatorDispatcher(AudioHaptics& audio, EnvironmentController& environment, BedMotor& bed,
                                       store::HistoryStore& history) noexcept
    : audio_(audio), environment_(environment), bed_(bed), history_(history) {}

DispatchOutcome ActuatorDispatcher::dispatch(const model::nudge_action& action, metrics::SleepMetrics& metrics,
                                             const std::uint64_t timestamp_ms) {
  DispatchOutcome outcome{};

  outcome.delivered = std::visit([this, &outcome](const auto& nudge) { return route(nudge, outcome.suppressed); },
                                 action.payload);
  if (!outcome.delivered) {
    ++dispatch_failures_;
    std::cerr << "[dispatch] " << model::describe(action.payload) << " failed (" << action.reason << ")\n";
  } else if (outcome.suppressed) {
    std::cerr << "[dispatch] " << model::describe(action.payload) << " already applied; skipped\n";
  } else {
    std::cerr << "[dispatch] " << model::describe(action.payload) << " sent (" << action.reason << ")\n";
  }

  metrics.add_intervention(action);

  outcome.record = model::make_quick_action(action, timestamp_ms);
  outcome.persisted = invoke_guarded("history save", [this, &outcome] { return history_.save(outcome.record); });
  if (!outcome.persisted) {
    ++persistence_failures_;
    std::cerr << "[history] failed to persist " << outcome.record.action_type << " action; kept in memory\n";
  }

  return outcome;
}

bool ActuatorDispatcher::return_to_baseline() {
  applied_targets_.clear();

  bool ok = true;
  if (!invoke_guarded("stop_audio", [this] { return audio_.stop_audio(); })) {
    std::cerr << "[dispatch] baseline: stop_audio failed\n";
    ok = false;
  }
  if (!invoke_guarded("apply_haptic", [this] { return audio_.apply_haptic(0.0F); })) {
    std::cerr << "[dispatch] baseline: haptic reset failed\n";
    ok = false;
  }
  if (!invoke_guarded("release_overrides", [this] { return environment_.release_overrides(); })) {
    std::cerr << "[dispatch] baseline: environment release failed\n";
    ok = false;
  }
  if (!invoke_guarded("stop_massage", [this] { return bed_.stop_massage(); })) {
    std::cerr << "[dispatch] baseline: stop_massage failed\n";
    ok = false;
  }

  if (!ok) {
    ++dispatch_failures_;
  }
  return ok;
}

std::size_t ActuatorDispatcher::dispatch_failures() const noexcept { return dispatch_failures_; }

std::size_t ActuatorDispatcher::persistence_failures() const noexcept { return persistence_failures_; }

bool ActuatorDispatcher::route(const model::audio_nudge& nudge, bool& /*suppressed*/) {
  return invoke_guarded("play_audio", [this, &nudge] { return audio_.play_audio(nudge.kind); });
}

bool ActuatorDispatcher::route(const model::haptic_nudge& nudge, bool& /*suppressed*/) {
  const float intensity =
      nudge.kind == model::haptic_kind::STRONG_PULSE ? model::kStrongPulseIntensity : model::kGentlePulseIntensity;
  return invoke_guarded("apply_haptic", [this, intensity] { return audio_.apply_haptic(intensity); });
}

bool ActuatorDispatcher::route(const model::environment_nudge& nudge, bool& suppressed) {
  const double target = nudge.target;
  switch (nudge.kind) {
    case model::environment_kind::LOWER_TEMPERATURE:
      return apply_once("temperature", target, suppressed, [this, target] {
        return environment_.adjust_temperature(target);
      });
    case model::environment_kind::RAISE_HUMIDITY:
      return apply_once("humidity", target, suppressed, [this, target] {
        return environment_.adjust_humidity(target);
      });
    case model::environment_kind::DIM_LIGHTS:
      return apply_once("lighting", target, suppressed, [this, target] {
        return environment_.adjust_lighting(target);
      });
    case model::environment_kind::CLOSE_BLINDS:
      return apply_once("blinds", target, suppressed, [this, target] {
        return environment_.adjust_blinds(target);
      });
    case model::environment_kind::START_HEPA_FILTER:
      return apply_once("hepa", 1.0, suppressed, [this] {
        return environment_.set_hepa_filter(true, kHepaSleepMode);
      });
    case model::environment_kind::STOP_HEPA_FILTER:
      return apply_once("hepa", 0.0, suppressed, [this] {
        return environment_.set_hepa_filter(false, kHepaOffMode);
      });
  }
  return false;
}

bool ActuatorDispatcher::route(const model::bed_motor_nudge& nudge, bool& suppressed) {
  const double target = nudge.target;
  switch (nudge.kind) {
    case model::bed_motor_kind::ADJUST_HEAD:
      return apply_once("head", target, suppressed, [this, target] { return bed_.adjust_head_elevation(target); });
    case model::bed_motor_kind::ADJUST_FOOT:
      return apply_once("foot", target, suppressed, [this, target] { return bed_.adjust_foot_elevation(target); });
    case model::bed_motor_kind::START_MASSAGE:
      return apply_once("massage", target, suppressed, [this, target] { return bed_.start_massage(target); });
    case model::bed_motor_kind::STOP_MASSAGE:
      return apply_once("massage", 0.0, suppressed, [this] { return bed_.stop_massage(); });
  }
  return false;
}

// A command whose target is already in effect is not re-sent; a failed command
// forgets the cached target so the next attempt goes through.
template <typename Command>
bool ActuatorDispatcher::apply_once(const char* key, const double target, bool& suppressed, Command&& command) {
  const auto it = applied_targets_.find(key);
  if (it != applied_targets_.end() && std::fabs(it->second - target) <= kTargetEpsilon) {
    suppressed = true;
    return true;
  }

  if (!invoke_guarded(key, std::forward<Command>(command))) {
    applied_targets_.erase(key);
    return false;
  }

  applied_targets_[key] = target;
  return true;
}

}  // namespace sleep_agent::actuators
