#pragma once

#include <cstdio>
#include <string>
#include <vector>

#include "model/sleep_frame.hpp"
#include "sensors/csv_feed.hpp"

namespace sleep_agent::sensors {

class EnvironmentSource {
 public:
  // Fills frame.environment; false when no current reading is available.
  virtual bool sample(model::sleep_frame& frame) = 0;
  virtual ~EnvironmentSource() = default;
};

// temperature,humidity,noise,light,bed_incline[,air_quality]
// noise, light and air quality are normalized to [0,1].
class CsvEnvironmentFeed final : public EnvironmentSource {
 public:
  explicit CsvEnvironmentFeed(std::string path);
  CsvEnvironmentFeed(std::FILE* file, bool owns_file = false);

  bool sample(model::sleep_frame& frame) override;

 private:
  static constexpr double kDefaultAirQuality = 0.8;

  CsvFeed feed_;
  std::vector<double> fields_{};
};

}  // namespace sleep_agent::sensors
