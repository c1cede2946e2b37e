#pragma once

#include <chrono>
#include <cstdint>
#include <string>

#include "policy/threshold_policy.hpp"

namespace sleep_agent::core {

struct RedisConfig {
  std::string host{"127.0.0.1"};
  std::uint16_t port{6379};
  std::string unix_socket{};
  std::string password{};
  int db{0};
  std::string key_prefix{"sleep:agent"};
  bool enabled{false};
};

enum class HistoryBackend { FILE, REDIS };
enum class ActuatorBackend { STDOUT, REDIS };

struct AgentConfig {
  std::chrono::milliseconds tick_interval{30'000};
  bool publish_health{true};
  bool stdout_debug{true};
  RedisConfig redis{};
  std::string vitals_feed{"feeds/vitals.csv"};
  std::string environment_feed{"feeds/environment.csv"};
  HistoryBackend history_backend{HistoryBackend::FILE};
  std::string history_path{"sleep-history.jsonl"};
  ActuatorBackend actuator_backend{ActuatorBackend::STDOUT};
  bool redis_ts_sink{false};
  policy::ThresholdPolicyOptions policy{};
};

AgentConfig load_agent_config(const std::string& path);

}  // namespace sleep_agent::core
