#include "actuators/stdout_actuators.hpp"

#include <cstdio>
#include <string>

namespace sleep_agent::actuators {

bool StdoutActuators::play_audio(const model::audio_kind kind) {
  const std::string name(model::kind_name(kind));
  std::printf("[actuator] audio.play kind=%s\n", name.c_str());
  return true;
}

bool StdoutActuators::stop_audio() {
  std::printf("[actuator] audio.stop\n");
  return true;
}

bool StdoutActuators::apply_haptic(const float intensity) {
  std::printf("[actuator] haptic intensity=%.2f\n", intensity);
  return true;
}

bool StdoutActuators::adjust_temperature(const double target_c) {
  std::printf("[actuator] environment.temperature target_c=%.1f\n", target_c);
  return true;
}

bool StdoutActuators::adjust_humidity(const double target_pct) {
  std::printf("[actuator] environment.humidity target_pct=%.1f\n", target_pct);
  return true;
}

bool StdoutActuators::adjust_lighting(const double level) {
  std::printf("[actuator] environment.lighting level=%.2f\n", level);
  return true;
}

bool StdoutActuators::adjust_blinds(const double position) {
  std::printf("[actuator] environment.blinds position=%.2f\n", position);
  return true;
}

bool StdoutActuators::set_hepa_filter(const bool on, const std::string& mode) {
  std::printf("[actuator] environment.hepa on=%s mode=%s\n", on ? "true" : "false", mode.c_str());
  return true;
}

bool StdoutActuators::release_overrides() {
  std::printf("[actuator] environment.release\n");
  return true;
}

bool StdoutActuators::adjust_head_elevation(const double value) {
  std::printf("[actuator] bed.head elevation=%.2f\n", value);
  return true;
}

bool StdoutActuators::adjust_foot_elevation(const double value) {
  std::printf("[actuator] bed.foot elevation=%.2f\n", value);
  return true;
}

bool StdoutActuators::start_massage(const double intensity) {
  std::printf("[actuator] bed.massage.start intensity=%.2f\n", intensity);
  return true;
}

bool StdoutActuators::stop_massage() {
  std::printf("[actuator] bed.massage.stop\n");
  return true;
}

}  // namespace sleep_agent::actuators
