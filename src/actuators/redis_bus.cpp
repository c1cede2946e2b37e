#include "actuators/redis_bus.hpp"

#include <iostream>
#include <utility>

#include <hiredis/hiredis.h>
#include <nlohmann/json.hpp>

namespace sleep_agent::actuators {
namespace {

constexpr const char* kAudioDomain = "audio";
constexpr const char* kHapticDomain = "haptic";
constexpr const char* kEnvironmentDomain = "environment";
constexpr const char* kBedDomain = "bed_motor";

std::string command_payload(const char* command) { return nlohmann::json{{"command", command}}.dump(); }

std::string command_payload(const char* command, const char* field, const double value) {
  return nlohmann::json{{"command", command}, {field, value}}.dump();
}

}  // namespace

RedisCommandBus::RedisCommandBus(std::shared_ptr<redis::Connection> connection, std::string key_prefix)
    : connection_(std::move(connection)), key_prefix_(std::move(key_prefix)) {}

std::string RedisCommandBus::channel(const char* domain) const { return key_prefix_ + ":actuator:" + domain; }

bool RedisCommandBus::play_audio(const model::audio_kind kind) {
  const nlohmann::json payload = {{"command", "play_audio"}, {"kind", std::string(model::kind_name(kind))}};
  return publish(kAudioDomain, payload.dump());
}

bool RedisCommandBus::stop_audio() { return publish(kAudioDomain, command_payload("stop_audio")); }

bool RedisCommandBus::apply_haptic(const float intensity) {
  return publish(kHapticDomain, command_payload("apply_haptic", "intensity", static_cast<double>(intensity)));
}

bool RedisCommandBus::adjust_temperature(const double target_c) {
  return publish(kEnvironmentDomain, command_payload("adjust_temperature", "target", target_c));
}

bool RedisCommandBus::adjust_humidity(const double target_pct) {
  return publish(kEnvironmentDomain, command_payload("adjust_humidity", "target", target_pct));
}

bool RedisCommandBus::adjust_lighting(const double level) {
  return publish(kEnvironmentDomain, command_payload("adjust_lighting", "level", level));
}

bool RedisCommandBus::adjust_blinds(const double position) {
  return publish(kEnvironmentDomain, command_payload("adjust_blinds", "position", position));
}

bool RedisCommandBus::set_hepa_filter(const bool on, const std::string& mode) {
  const nlohmann::json payload = {{"command", "set_hepa_filter"}, {"on", on}, {"mode", mode}};
  return publish(kEnvironmentDomain, payload.dump());
}

bool RedisCommandBus::release_overrides() {
  return publish(kEnvironmentDomain, command_payload("release_overrides"));
}

bool RedisCommandBus::adjust_head_elevation(const double value) {
  return publish(kBedDomain, command_payload("adjust_head_elevation", "value", value));
}

bool RedisCommandBus::adjust_foot_elevation(const double value) {
  return publish(kBedDomain, command_payload("adjust_foot_elevation", "value", value));
}

bool RedisCommandBus::start_massage(const double intensity) {
  return publish(kBedDomain, command_payload("start_massage", "intensity", intensity));
}

bool RedisCommandBus::stop_massage() { return publish(kBedDomain, command_payload("stop_massage")); }

bool RedisCommandBus::publish(const char* domain, const std::string& payload) {
  const auto reply = connection_->command({"PUBLISH", channel(domain), payload});
  if (reply == nullptr) {
    std::cerr << "[redis] PUBLISH " << channel(domain) << " failed: connection unavailable\n";
    return false;
  }
  if (reply->type != REDIS_REPLY_INTEGER) {
    std::cerr << "[redis] PUBLISH " << channel(domain) << " rejected\n";
    return false;
  }
  return true;
}

}  // namespace sleep_agent::actuators
