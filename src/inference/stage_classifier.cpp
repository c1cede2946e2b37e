#include "inference/stage_classifier.hpp"

#include <cmath>
#include <exception>
#include <iostream>
#include <utility>

#include "core/math.hpp"

namespace sleep_agent::inference {
namespace {

constexpr std::array<model::sleep_stage, 4> kScoreStages = {
    model::sleep_stage::AWAKE,
    model::sleep_stage::LIGHT,
    model::sleep_stage::DEEP,
    model::sleep_stage::REM,
};

double previous_stage_feature(const model::sleep_stage stage) noexcept {
  if (stage == model::sleep_stage::UNKNOWN) {
    return 0.0;
  }
  return static_cast<double>(model::stage_index(stage)) / 3.0;
}

}  // namespace

normalized_features normalize(const stage_features& features) noexcept {
  normalized_features out{};
  out.heart_rate = core::clamp01((features.heart_rate - 40.0) / 60.0);
  out.hrv = core::clamp01((features.hrv - 10.0) / 70.0);
  out.spo2 = core::clamp01((features.spo2 - 90.0) / 10.0);
  out.movement = core::clamp01(features.movement);
  out.body_temperature = core::clamp01((features.body_temperature - 35.0) / 3.0);
  out.respiratory_rate = core::clamp01((features.respiratory_rate - 8.0) / 17.0);
  out.time_of_night = core::clamp01(features.time_of_night_h / 8.0);
  out.previous_stage = previous_stage_feature(features.previous_stage);
  return out;
}

stage_features features_from(const model::vital_signs& vitals, const double time_of_night_h,
                             const model::sleep_stage previous_stage) noexcept {
  stage_features features{};
  features.heart_rate = vitals.heart_rate;
  features.hrv = vitals.hrv;
  features.spo2 = vitals.spo2;
  features.movement = vitals.movement;
  features.body_temperature = vitals.body_temperature;
  features.respiratory_rate = vitals.respiratory_rate;
  features.time_of_night_h = time_of_night_h;
  features.previous_stage = previous_stage;
  return features;
}

StageClassifier::StageClassifier(StageModel& model) noexcept : model_(model) {}

std::optional<stage_prediction> StageClassifier::classify(const stage_features& features) noexcept {
  stage_scores scores{};
  try {
    if (!model_.available()) {
      record_failure("model unavailable");
      return std::nullopt;
    }
    scores = model_.infer(features, normalize(features));
  } catch (const std::exception& ex) {
    record_failure(std::string("inference error: ") + ex.what());
    return std::nullopt;
  }

  double total = 0.0;
  std::size_t best = 0;
  for (std::size_t i = 0; i < scores.size(); ++i) {
    if (!std::isfinite(scores[i]) || scores[i] < 0.0) {
      record_failure("malformed output: non-finite or negative score");
      return std::nullopt;
    }
    total += scores[i];
    if (scores[i] > scores[best]) {
      best = i;
    }
  }

  if (total <= 0.0) {
    record_failure("malformed output: no stage scored");
    return std::nullopt;
  }

  return stage_prediction{kScoreStages[best], scores[best]};
}

const std::string& StageClassifier::last_error() const noexcept { return last_error_; }

std::size_t StageClassifier::failures() const noexcept { return failures_; }

void StageClassifier::record_failure(std::string reason) {
  ++failures_;
  std::cerr << "[classifier] classification failed: " << reason << '\n';
  last_error_ = std::move(reason);
}

}  // namespace sleep_agent::inference
