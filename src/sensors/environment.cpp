#include "sensors/environment.hpp"

#include <utility>

namespace sleep_agent::sensors {
namespace {

bool is_unit(const double value) noexcept { return value >= 0.0 && value <= 1.0; }

}  // namespace

CsvEnvironmentFeed::CsvEnvironmentFeed(std::string path) : feed_(std::move(path)) {}

CsvEnvironmentFeed::CsvEnvironmentFeed(std::FILE* file, const bool owns_file) : feed_(file, owns_file) {}

bool CsvEnvironmentFeed::sample(model::sleep_frame& frame) {
  if (!feed_.next(fields_)) {
    return false;
  }
  if (fields_.size() < 5 || fields_.size() > 6) {
    return false;
  }

  model::environment_snapshot environment{};
  environment.temperature = fields_[0];
  environment.humidity = fields_[1];
  environment.noise_level = fields_[2];
  environment.light_level = fields_[3];
  environment.bed_incline = fields_[4];
  environment.air_quality = fields_.size() > 5 ? fields_[5] : kDefaultAirQuality;

  if (!is_unit(environment.noise_level) || !is_unit(environment.light_level) || !is_unit(environment.air_quality)) {
    return false;
  }

  frame.environment = environment;
  return true;
}

}  // namespace sleep_agent::sensors
