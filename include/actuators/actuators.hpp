#pragma once

#include <string>

#include "model/nudge_action.hpp"

namespace sleep_agent::actuators {

// Each call returns whether the command was accepted for delivery, not whether
// the device finished acting on it.

class AudioHaptics {
 public:
  virtual bool play_audio(model::audio_kind kind) = 0;
  virtual bool stop_audio() = 0;
  virtual bool apply_haptic(float intensity) = 0;
  virtual ~AudioHaptics() = default;
};

class EnvironmentController {
 public:
  virtual bool adjust_temperature(double target_c) = 0;
  virtual bool adjust_humidity(double target_pct) = 0;
  virtual bool adjust_lighting(double level) = 0;
  virtual bool adjust_blinds(double position) = 0;
  virtual bool set_hepa_filter(bool on, const std::string& mode) = 0;
  virtual bool release_overrides() = 0;
  virtual ~EnvironmentController() = default;
};

class BedMotor {
 public:
  virtual bool adjust_head_elevation(double value) = 0;
  virtual bool adjust_foot_elevation(double value) = 0;
  virtual bool start_massage(double intensity) = 0;
  virtual bool stop_massage() = 0;
  virtual ~BedMotor() = default;
};

}  // namespace sleep_agent::actuators
