#pragma once

#include <memory>
#include <string>

#include "actuators/actuators.hpp"
#include "redis/connection.hpp"

namespace sleep_agent::actuators {

// Publishes each command as JSON on <prefix>:actuator:<domain> for the device
// bridges to consume. Delivery to a subscriber is not awaited.
class RedisCommandBus final : public AudioHaptics, public EnvironmentController, public BedMotor {
 public:
  RedisCommandBus(std::shared_ptr<redis::Connection> connection, std::string key_prefix);

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

  [[nodiscard]] std::string channel(const char* domain) const;

 private:
  bool publish(const char* domain, const std::string& payload);

  std::shared_ptr<redis::Connection> connection_;
  std::string key_prefix_;
};

}  // namespace sleep_agent::actuators
