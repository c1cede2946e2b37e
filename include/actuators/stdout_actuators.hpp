#pragma once

#include <string>

#include "actuators/actuators.hpp"

namespace sleep_agent::actuators {

// Prints each command instead of driving hardware. Every call is accepted.
class StdoutActuators final : public AudioHaptics, public EnvironmentController, public BedMotor {
 public:
  bool play_audio(model::audio_kind kind) override;
  bool stop_audio() override;
  bool apply_haptic(float intensity) override;

  bool adjust_temperature(double target_c) override;
  bool adjust_humidity(double target_pct) override;
  bool adjust_lighting(double level) override;
  bool adjust_blinds(double position) override;
  bool set_hepa_filter(bool on, const std::string& mode) override;
  bool release_overrides() override;

  bool adjust_head_elevation(double value) override;
  bool adjust_foot_elevation(double value) override;
  bool start_massage(double intensity) override;
  bool stop_massage() override;
};

}  // namespace sleep_agent::actuators
