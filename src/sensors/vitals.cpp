#include "sensors/vitals.hpp"

#include <utility>

namespace sleep_agent::sensors {

CsvVitalsFeed::CsvVitalsFeed(std::string path) : feed_(std::move(path)) {}

CsvVitalsFeed::CsvVitalsFeed(std::FILE* file, const bool owns_file) : feed_(file, owns_file) {}

bool CsvVitalsFeed::sample(model::sleep_frame& frame) {
  if (!feed_.next(fields_)) {
    return false;
  }
  if (fields_.size() < 4 || fields_.size() > 6) {
    return false;
  }

  model::vital_signs vitals{};
  vitals.heart_rate = fields_[0];
  vitals.hrv = fields_[1];
  vitals.spo2 = fields_[2];
  vitals.body_temperature = fields_[3];
  vitals.movement = fields_.size() > 4 ? fields_[4] : 0.0;
  vitals.respiratory_rate = fields_.size() > 5 ? fields_[5] : kDefaultRespiratoryRate;

  if (vitals.heart_rate < 0.0 || vitals.hrv < 0.0 || vitals.spo2 < 0.0 || vitals.spo2 > 100.0 ||
      vitals.movement < 0.0 || vitals.respiratory_rate < 0.0) {
    return false;
  }

  frame.vitals = vitals;
  return true;
}

}  // namespace sleep_agent::sensors
