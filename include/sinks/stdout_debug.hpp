#pragma once

#include "sinks/frame_sink.hpp"

namespace sleep_agent::sinks {

class StdoutDebugSink final : public FrameSink {
 public:
  const char* name() const override { return "stdout"; }
  bool publish(model::sleep_frame& frame) override;
};

}  // namespace sleep_agent::sinks
