#include "sinks/stdout_debug.hpp"

#include <cstdio>
#include <string>

namespace sleep_agent::sinks {

bool StdoutDebugSink::publish(model::sleep_frame& frame) {
  const std::string stage(model::stage_name(frame.stage));
  std::printf("[tick %llu] stage=%s confidence=%.2f quality=%.2f hr=%.1f hrv=%.1f deep_pct=%.2f rem_pct=%.2f nudged=%s\n",
              static_cast<unsigned long long>(frame.tick), stage.c_str(), frame.stage_confidence, frame.quality_score,
              frame.vitals.heart_rate, frame.vitals.hrv, frame.deep_pct, frame.rem_pct, frame.nudged ? "yes" : "no");
  return true;
}

}  // namespace sleep_agent::sinks
