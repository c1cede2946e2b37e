#include <chrono>
#include <csignal>
#include <cstdio>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <thread>

#include "actuators/redis_bus.hpp"
#include "actuators/stdout_actuators.hpp"
#include "core/config.hpp"
#include "core/controller.hpp"
#include "inference/rule_stage_model.hpp"
#include "policy/threshold_policy.hpp"
#include "redis/connection.hpp"
#include "sensors/environment.hpp"
#include "sensors/vitals.hpp"
#include "sinks/redis_ts.hpp"
#include "sinks/stdout_debug.hpp"
#include "store/file_history.hpp"
#include "store/redis_history.hpp"

namespace {

volatile std::sig_atomic_t g_shutdown_requested = 0;

void handle_shutdown_signal(int /*signal*/) {
  g_shutdown_requested = 1;
}

const char* history_backend_name(const sleep_agent::core::HistoryBackend backend) {
  return backend == sleep_agent::core::HistoryBackend::REDIS ? "redis" : "file";
}

const char* actuator_backend_name(const sleep_agent::core::ActuatorBackend backend) {
  return backend == sleep_agent::core::ActuatorBackend::REDIS ? "redis" : "stdout";
}

std::shared_ptr<sleep_agent::redis::Connection> make_connection(const sleep_agent::core::RedisConfig& redis) {
  sleep_agent::redis::ConnectionOptions options{};
  options.host = redis.host;
  options.port = redis.port;
  options.unix_socket = redis.unix_socket;
  options.password = redis.password;
  options.db = redis.db;

  auto connection = std::make_shared<sleep_agent::redis::Connection>(options);
  if (connection->ensure_connected()) {
    std::cerr << "[agent] redis connectivity confirmed at " << connection->endpoint() << '\n';
  } else {
    std::cerr << "[agent] redis connectivity check failed at " << connection->endpoint() << '\n';
  }
  return connection;
}

sleep_agent::core::Collaborators make_collaborators(const sleep_agent::core::AgentConfig& config) {
  using namespace sleep_agent;

  std::shared_ptr<redis::Connection> connection;
  if (config.redis.enabled) {
    connection = make_connection(config.redis);
  }

  core::Collaborators collaborators{};
  collaborators.vitals = std::make_unique<sensors::CsvVitalsFeed>(config.vitals_feed);
  collaborators.environment = std::make_unique<sensors::CsvEnvironmentFeed>(config.environment_feed);
  collaborators.stage_model = std::make_unique<inference::RuleStageModel>();
  collaborators.policy = std::make_unique<policy::ThresholdPolicy>(config.policy);

  if (config.actuator_backend == core::ActuatorBackend::REDIS) {
    auto bus = std::make_shared<actuators::RedisCommandBus>(connection, config.redis.key_prefix);
    collaborators.audio = bus;
    collaborators.environment_controller = bus;
    collaborators.bed = bus;
  } else {
    auto console = std::make_shared<actuators::StdoutActuators>();
    collaborators.audio = console;
    collaborators.environment_controller = console;
    collaborators.bed = console;
  }

  if (config.history_backend == core::HistoryBackend::REDIS) {
    collaborators.history = std::make_unique<store::RedisHistoryStore>(connection, config.redis.key_prefix + ":history");
  } else {
    collaborators.history = std::make_unique<store::FileHistoryStore>(config.history_path);
  }

  if (config.stdout_debug) {
    collaborators.sinks.push_back(std::make_unique<sinks::StdoutDebugSink>());
  }
  if (config.redis_ts_sink) {
    sinks::RedisTsOptions options{};
    options.key_prefix = config.redis.key_prefix;
    options.publish_health = config.publish_health;
    collaborators.sinks.push_back(std::make_unique<sinks::RedisTsSink>(connection, options));
  }

  return collaborators;
}

void print_session_summary(const sleep_agent::core::ControllerSnapshot& snapshot) {
  using std::chrono::duration_cast;
  using std::chrono::minutes;

  const auto& report = snapshot.report;
  std::printf("[summary] ticks=%llu total_sleep_min=%lld session_min=%lld quality=%.3f\n",
              static_cast<unsigned long long>(snapshot.tick),
              static_cast<long long>(duration_cast<minutes>(report.total_sleep_time).count()),
              static_cast<long long>(duration_cast<minutes>(report.session_duration).count()), report.quality_score);
  std::printf("[summary] deep=%.3f rem=%.3f light=%.3f awake=%.3f\n", report.deep_pct, report.rem_pct, report.light_pct,
              report.awake_pct);
  std::printf("[summary] nudges=%zu history_records=%zu\n", snapshot.nudge_count, snapshot.history.size());
  for (const auto& action : report.interventions) {
    std::printf("[summary]   %s (%s)\n", sleep_agent::model::describe(action.payload).c_str(), action.reason.c_str());
  }
}

}  // namespace

std::string format_config_settings(const sleep_agent::core::AgentConfig& config, const std::string& config_path) {
  std::ostringstream output;
  output << "[agent] loaded config from " << config_path
         << " | tick_interval_ms=" << config.tick_interval.count()
         << " | publish_health=" << (config.publish_health ? "true" : "false")
         << " | stdout_debug=" << (config.stdout_debug ? "true" : "false")
         << " | vitals_feed=" << config.vitals_feed
         << " | environment_feed=" << config.environment_feed
         << " | history=" << history_backend_name(config.history_backend)
         << " | actuators=" << actuator_backend_name(config.actuator_backend)
         << " | redis_ts_sink=" << (config.redis_ts_sink ? "true" : "false")
         << " | redis_enabled=" << (config.redis.enabled ? "true" : "false")
         << " | redis_address=";

  if (!config.redis.unix_socket.empty()) {
    output << "unix://" << config.redis.unix_socket;
  } else {
    output << config.redis.host << ':' << config.redis.port;
  }
  return output.str();
}

int main(int argc, char** argv) {
  std::signal(SIGINT, handle_shutdown_signal);
  std::signal(SIGTERM, handle_shutdown_signal);

  const std::string config_path = argc > 1 ? argv[1] : "configs/sleep-agent.yaml";

  sleep_agent::core::AgentConfig config{};
  try {
    config = sleep_agent::core::load_agent_config(config_path);
  } catch (const std::exception& ex) {
    std::cerr << "config error: " << ex.what() << '\n';
    return 1;
  }

  std::cerr << format_config_settings(config, config_path) << '\n';

  sleep_agent::core::Controller controller{config, make_collaborators(config)};
  if (!controller.start()) {
    std::cerr << "[agent] failed to start session\n";
    return 1;
  }

  while (g_shutdown_requested == 0) {
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
  }

  std::cerr << "[agent] shutdown signal received; stopping session\n";
  controller.stop();
  print_session_summary(controller.snapshot());

  return 0;
}
