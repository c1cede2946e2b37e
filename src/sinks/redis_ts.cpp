#include "sinks/redis_ts.hpp"

#include "core/timestamp.hpp"

#include <chrono>
#include <cmath>
#include <cstring>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include <hiredis/hiredis.h>

namespace sleep_agent::sinks {
namespace {

double sanitize_value(const double value) {
  return std::isfinite(value) ? value : 0.0;
}

void add_metric_args(std::vector<std::string>& args, const std::string& key_prefix,
                     const std::uint64_t timestamp_ms, const char* suffix, const double value) {
  args.emplace_back(key_prefix + ":" + suffix);
  args.emplace_back(std::to_string(timestamp_ms));
  args.emplace_back(std::to_string(value));
}

const std::vector<std::string>& base_metric_suffixes() {
  static const std::vector<std::string> kMetricSuffixes = {
      "raw:heart_rate",
      "raw:hrv",
      "raw:spo2",
      "raw:body_temperature",
      "raw:room_temperature",
      "raw:humidity",
      "raw:noise",
      "raw:light",
      "sleep:stage",
      "sleep:confidence",
      "sleep:quality",
      "sleep:deep_pct",
      "sleep:rem_pct",
      "sleep:nudged",
  };
  return kMetricSuffixes;
}

const std::vector<std::string>& health_metric_suffixes() {
  static const std::vector<std::string> kMetricSuffixes = {
      "agent:heartbeat",
      "agent:loop_jitter",
      "agent:compute_time",
      "agent:redis_latency",
      "agent:signal_failures",
      "agent:classification_failures",
      "agent:dispatch_failures",
      "agent:persistence_failures",
      "agent:missed_cycles",
  };
  return kMetricSuffixes;
}

}  // namespace

RedisTsSink::RedisTsSink(std::shared_ptr<redis::Connection> connection, RedisTsOptions options)
    : connection_(std::move(connection)), options_(std::move(options)) {
  metric_suffixes_ = base_metric_suffixes();
  if (options_.publish_health) {
    const auto& health = health_metric_suffixes();
    metric_suffixes_.insert(metric_suffixes_.end(), health.begin(), health.end());
  }
  reserve_command_buffers();
}

const std::vector<std::string>& RedisTsSink::metric_suffixes() const noexcept { return metric_suffixes_; }

bool RedisTsSink::ensure_schema() {
  if (schema_ready_) {
    return true;
  }

  for (const auto& suffix : metric_suffixes_) {
    const std::string key = options_.key_prefix + ":" + suffix;
    const auto reply = connection_->command({"TS.CREATE", key, "DUPLICATE_POLICY", "LAST"});
    if (reply == nullptr) {
      return false;
    }

    const bool already_exists =
        reply->type == REDIS_REPLY_ERROR && reply->str != nullptr && strstr(reply->str, "already exists") != nullptr;
    const bool unknown_command =
        reply->type == REDIS_REPLY_ERROR && reply->str != nullptr && strstr(reply->str, "unknown command") != nullptr;
    const bool ok = reply->type != REDIS_REPLY_ERROR || already_exists;

    if (unknown_command) {
      std::cerr << "[redis] RedisTimeSeries module not available (TS.CREATE unknown command)\n";
      timeseries_available_ = false;
      return false;
    }
    if (!ok) {
      std::cerr << "[redis] schema error on TS.CREATE " << key << ": "
                << (reply->str != nullptr ? reply->str : "unknown") << '\n';
      return false;
    }
  }

  schema_ready_ = true;
  return true;
}

bool RedisTsSink::publish(model::sleep_frame& frame) {
  if (!timeseries_available_) {
    return false;
  }
  if (!ensure_schema()) {
    return false;
  }

  if (publish_impl(frame)) {
    return true;
  }

  if (!connection_->reconnect()) {
    return false;
  }
  return publish_impl(frame);
}

bool RedisTsSink::publish_impl(model::sleep_frame& frame) {
  const std::uint64_t timestamp_ms = frame.timestamp_ms != 0 ? frame.timestamp_ms : core::unix_timestamp_now_ms();

  command_args_.clear();
  command_args_.emplace_back("TS.MADD");

  const auto append_metric = [&](const char* suffix, const double value) {
    add_metric_args(command_args_, options_.key_prefix, timestamp_ms, suffix, value);
  };

  if (frame.vitals_valid) {
    append_metric("raw:heart_rate", sanitize_value(frame.vitals.heart_rate));
    append_metric("raw:hrv", sanitize_value(frame.vitals.hrv));
    append_metric("raw:spo2", sanitize_value(frame.vitals.spo2));
    append_metric("raw:body_temperature", sanitize_value(frame.vitals.body_temperature));
  }
  if (frame.environment_valid) {
    append_metric("raw:room_temperature", sanitize_value(frame.environment.temperature));
    append_metric("raw:humidity", sanitize_value(frame.environment.humidity));
    append_metric("raw:noise", sanitize_value(frame.environment.noise_level));
    append_metric("raw:light", sanitize_value(frame.environment.light_level));
  }
  append_metric("sleep:stage", static_cast<double>(static_cast<std::uint8_t>(frame.stage)));
  append_metric("sleep:confidence", sanitize_value(frame.stage_confidence));
  append_metric("sleep:quality", sanitize_value(frame.quality_score));
  append_metric("sleep:deep_pct", sanitize_value(frame.deep_pct));
  append_metric("sleep:rem_pct", sanitize_value(frame.rem_pct));
  append_metric("sleep:nudged", frame.nudged ? 1.0 : 0.0);

  if (options_.publish_health) {
    append_metric("agent:heartbeat", static_cast<double>(frame.agent.heartbeat_ms));
    append_metric("agent:loop_jitter", sanitize_value(frame.agent.loop_jitter_ms));
    append_metric("agent:compute_time", sanitize_value(frame.agent.compute_time_ms));
    append_metric("agent:redis_latency", sanitize_value(frame.agent.redis_latency_ms));
    append_metric("agent:signal_failures", static_cast<double>(frame.agent.signal_failures));
    append_metric("agent:classification_failures", static_cast<double>(frame.agent.classification_failures));
    append_metric("agent:dispatch_failures", static_cast<double>(frame.agent.dispatch_failures));
    append_metric("agent:persistence_failures", static_cast<double>(frame.agent.persistence_failures));
    append_metric("agent:missed_cycles", static_cast<double>(frame.agent.missed_cycles));
  }

  const auto publish_start = std::chrono::steady_clock::now();
  const auto reply = connection_->command(command_args_);
  const auto publish_end = std::chrono::steady_clock::now();
  frame.agent.redis_latency_ms = core::elapsed_ms(publish_start, publish_end);
  if (reply == nullptr) {
    return false;
  }
  return reply->type != REDIS_REPLY_ERROR;
}

void RedisTsSink::reserve_command_buffers() {
  command_args_.reserve(1 + (metric_suffixes_.size() * 3));
}

}  // namespace sleep_agent::sinks
