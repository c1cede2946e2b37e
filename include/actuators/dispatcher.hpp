#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <unordered_map>

#include "actuators/actuators.hpp"
#include "metrics/sleep_metrics.hpp"
#include "model/nudge_action.hpp"
#include "model/quick_action.hpp"
#include "store/history_store.hpp"

namespace sleep_agent::actuators {

struct DispatchOutcome {
  bool delivered{false};
  bool suppressed{false};
  bool persisted{false};
  model::quick_action record{};
};

class ActuatorDispatcher {
 public:
  ActuatorDispatcher(AudioHaptics& audio, EnvironmentController& environment, BedMotor& bed,
                     store::HistoryStore& history) noexcept;

  // Routes the action to its domain, then records it in metrics and the history
  // store regardless of the delivery result.
  DispatchOutcome dispatch(const model::nudge_action& action, metrics::SleepMetrics& metrics,
                           std::uint64_t timestamp_ms);

  // Stops audio, zeroes haptics, releases environment overrides and stops massage.
  // Returns false if any domain rejected its command.
  bool return_to_baseline();

  [[nodiscard]] std::size_t dispatch_failures() const noexcept;
  [[nodiscard]] std::size_t persistence_failures() const noexcept;

 private:
  bool route(const model::audio_nudge& nudge, bool& suppressed);
  bool route(const model::haptic_nudge& nudge, bool& suppressed);
  bool route(const model::environment_nudge& nudge, bool& suppressed);
  bool route(const model::bed_motor_nudge& nudge, bool& suppressed);

  template <typename Command>
  bool apply_once(const char* key, double target, bool& suppressed, Command&& command);

  AudioHaptics& audio_;
  EnvironmentController& environment_;
  BedMotor& bed_;
  store::HistoryStore& history_;
  std::unordered_map<std::string, double> applied_targets_{};
  std::size_t dispatch_failures_{0};
  std::size_t persistence_failures_{0};
};

}  // namespace sleep_agent::actuators
