#pragma once

#include "model/sleep_frame.hpp"

namespace sleep_agent::sinks {

class FrameSink {
 public:
  virtual const char* name() const = 0;
  virtual bool publish(model::sleep_frame& frame) = 0;
  virtual ~FrameSink() = default;
};

}  // namespace sleep_agent::sinks
