#pragma once

#include <cstdio>
#include <string>
#include <vector>

#include "model/sleep_frame.hpp"
#include "sensors/csv_feed.hpp"

namespace sleep_agent::sensors {

class VitalsSource {
 public:
  // Fills frame.vitals; false when no current reading is available.
  virtual bool sample(model::sleep_frame& frame) = 0;
  virtual ~VitalsSource() = default;
};

// heart_rate,hrv,spo2,body_temperature[,movement,respiratory_rate]
class CsvVitalsFeed final : public VitalsSource {
 public:
  explicit CsvVitalsFeed(std::string path);
  CsvVitalsFeed(std::FILE* file, bool owns_file = false);

  bool sample(model::sleep_frame& frame) override;

 private:
  static constexpr double kDefaultRespiratoryRate = 14.0;

  CsvFeed feed_;
  std::vector<double> fields_{};
};

}  // namespace sleep_agent::sensors
