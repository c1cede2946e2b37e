#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include "redis/connection.hpp"
#include "sinks/frame_sink.hpp"

namespace sleep_agent::sinks {

struct RedisTsOptions {
  std::string key_prefix{"sleep:agent"};
  bool publish_health{true};
};

class RedisTsSink final : public FrameSink {
 public:
  RedisTsSink(std::shared_ptr<redis::Connection> connection, RedisTsOptions options = {});

  const char* name() const override { return "redis_ts"; }
  bool publish(model::sleep_frame& frame) override;

  [[nodiscard]] const std::vector<std::string>& metric_suffixes() const noexcept;

 private:
  bool ensure_schema();
  bool publish_impl(model::sleep_frame& frame);
  void reserve_command_buffers();

  std::shared_ptr<redis::Connection> connection_;
  RedisTsOptions options_;
  std::vector<std::string> metric_suffixes_;
  std::vector<std::string> command_args_;
  bool timeseries_available_{true};
  bool schema_ready_{false};
};

}  // namespace sleep_agent::sinks
