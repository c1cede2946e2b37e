#include "core/config.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace sleep_agent::core {
namespace {

std::string trim(const std::string& value) {
  const auto begin = std::find_if_not(value.begin(), value.end(), [](unsigned char c) { return std::isspace(c) != 0; });
  const auto end = std::find_if_not(value.rbegin(), value.rend(), [](unsigned char c) { return std::isspace(c) != 0; }).base();
  if (begin >= end) {
    return {};
  }
  return std::string(begin, end);
}

std::string lowercase(const std::string& value) {
  std::string out;
  out.reserve(value.size());
  for (const char c : value) {
    out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  return out;
}

bool parse_bool(const std::string& value) {
  const std::string lower = lowercase(value);
  return lower == "true" || lower == "yes" || lower == "on" || lower == "1";
}

double parse_non_negative(const std::string& key, const std::string& value) {
  const double parsed = std::stod(value);
  if (parsed < 0.0) {
    throw std::runtime_error(key + " must be greater than or equal to 0");
  }
  return parsed;
}

double parse_unit(const std::string& key, const std::string& value) {
  const double parsed = std::stod(value);
  if (parsed < 0.0 || parsed > 1.0) {
    throw std::runtime_error(key + " must be in range 0..1");
  }
  return parsed;
}

void apply_redis_address(RedisConfig& redis, const std::string& value) {
  redis.enabled = !value.empty();
  if (value.rfind("unix://", 0) == 0) {
    redis.unix_socket = value.substr(std::string("unix://").size());
    redis.host.clear();
    redis.port = 0;
    return;
  }

  if (!value.empty() && value.front() == '/') {
    redis.unix_socket = value;
    redis.host.clear();
    redis.port = 0;
    return;
  }

  redis.unix_socket.clear();
  const auto split = value.find(':');
  if (split == std::string::npos) {
    redis.host = value;
    return;
  }

  redis.host = value.substr(0, split);
  const auto parsed_port = std::stoi(value.substr(split + 1));
  if (parsed_port <= 0 || parsed_port > 65535) {
    throw std::runtime_error("redis.address port must be in range 1..65535");
  }

  redis.port = static_cast<std::uint16_t>(parsed_port);
}

void apply_key_value(AgentConfig& config, const std::string& key, const std::string& value) {
  if (key == "tick_interval_s") {
    const auto seconds = std::stoi(value);
    if (seconds <= 0 || seconds > 3600) {
      throw std::runtime_error("tick_interval_s must be in range 1..3600");
    }
    config.tick_interval = std::chrono::seconds(seconds);
    return;
  }

  if (key == "tick_interval_ms") {
    const auto millis = std::stoll(value);
    if (millis <= 0 || millis > 3'600'000) {
      throw std::runtime_error("tick_interval_ms must be in range 1..3600000");
    }
    config.tick_interval = std::chrono::milliseconds(millis);
    return;
  }

  if (key == "agent.publish_health") {
    config.publish_health = parse_bool(value);
    return;
  }

  if (key == "agent.stdout_debug") {
    config.stdout_debug = parse_bool(value);
    return;
  }

  if (key == "redis.address") {
    apply_redis_address(config.redis, value);
    return;
  }

  if (key == "redis.password") {
    config.redis.password = value;
    return;
  }

  if (key == "redis.db") {
    const auto db = std::stoi(value);
    if (db < 0) {
      throw std::runtime_error("redis.db must be greater than or equal to 0");
    }
    config.redis.db = db;
    return;
  }

  if (key == "redis.key_prefix") {
    if (value.empty()) {
      throw std::runtime_error("redis.key_prefix must not be empty");
    }
    config.redis.key_prefix = value;
    return;
  }

  if (key == "feeds.vitals") {
    config.vitals_feed = value;
    return;
  }

  if (key == "feeds.environment") {
    config.environment_feed = value;
    return;
  }

  if (key == "history.backend") {
    const std::string backend = lowercase(value);
    if (backend == "file") {
      config.history_backend = HistoryBackend::FILE;
    } else if (backend == "redis") {
      config.history_backend = HistoryBackend::REDIS;
    } else {
      throw std::runtime_error("history.backend must be file or redis");
    }
    return;
  }

  if (key == "history.path") {
    config.history_path = value;
    return;
  }

  if (key == "actuators.backend") {
    const std::string backend = lowercase(value);
    if (backend == "stdout") {
      config.actuator_backend = ActuatorBackend::STDOUT;
    } else if (backend == "redis") {
      config.actuator_backend = ActuatorBackend::REDIS;
    } else {
      throw std::runtime_error("actuators.backend must be stdout or redis");
    }
    return;
  }

  if (key == "sinks.redis_ts") {
    config.redis_ts_sink = parse_bool(value);
    return;
  }

  if (key == "policy.cooldown_ticks") {
    const auto ticks = std::stoll(value);
    if (ticks < 0) {
      throw std::runtime_error("policy.cooldown_ticks must be greater than or equal to 0");
    }
    config.policy.cooldown_ticks = static_cast<std::uint32_t>(ticks);
    return;
  }

  if (key == "policy.heart_rate_threshold") {
    config.policy.heart_rate_threshold = parse_non_negative(key, value);
    return;
  }

  if (key == "policy.noise_threshold") {
    config.policy.noise_threshold = parse_unit(key, value);
    return;
  }

  if (key == "policy.stress_threshold") {
    config.policy.stress_threshold = parse_unit(key, value);
    return;
  }

  if (key == "policy.air_quality_threshold") {
    config.policy.air_quality_threshold = parse_unit(key, value);
    return;
  }

  if (key == "policy.massage_after_awake_s") {
    config.policy.massage_after_awake_s = parse_non_negative(key, value);
    return;
  }
}

void validate(const AgentConfig& config) {
  const bool needs_redis = config.history_backend == HistoryBackend::REDIS ||
                           config.actuator_backend == ActuatorBackend::REDIS || config.redis_ts_sink;
  if (needs_redis && !config.redis.enabled) {
    throw std::runtime_error("redis.address is required when a redis backend or sink is enabled");
  }
}

}  // namespace

AgentConfig load_agent_config(const std::string& path) {
  AgentConfig config{};

  std::ifstream input(path);
  if (!input.is_open()) {
    throw std::runtime_error("unable to open config file: " + path);
  }

  std::vector<std::string> sections;
  std::string line;
  while (std::getline(input, line)) {
    const auto comment_pos = line.find('#');
    if (comment_pos != std::string::npos) {
      line.erase(comment_pos);
    }

    if (trim(line).empty()) {
      continue;
    }

    std::size_t indent_spaces = 0;
    while (indent_spaces < line.size() && line[indent_spaces] == ' ') {
      ++indent_spaces;
    }
    const std::size_t depth = indent_spaces / 2;

    const std::string stripped = trim(line);
    const auto colon_pos = stripped.find(':');
    if (colon_pos == std::string::npos) {
      continue;
    }

    const std::string key = trim(stripped.substr(0, colon_pos));
    const std::string value = trim(stripped.substr(colon_pos + 1));

    if (sections.size() > depth) {
      sections.resize(depth);
    }

    if (value.empty()) {
      if (sections.size() == depth) {
        sections.push_back(key);
      } else {
        sections[depth] = key;
      }
      continue;
    }

    std::ostringstream full_key;
    for (const auto& section : sections) {
      if (!section.empty()) {
        full_key << section << '.';
      }
    }
    full_key << key;

    apply_key_value(config, full_key.str(), value);
  }

  validate(config);
  return config;
}

}  // namespace sleep_agent::core
