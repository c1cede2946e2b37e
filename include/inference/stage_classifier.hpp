#pragma once

#include <array>
#include <cstddef>
#include <optional>
#include <string>

#include "model/sleep_frame.hpp"

namespace sleep_agent::inference {

struct stage_features {
  double heart_rate{0.0};
  double hrv{0.0};
  double spo2{0.0};
  double movement{0.0};
  double body_temperature{0.0};
  double respiratory_rate{0.0};
  double time_of_night_h{0.0};
  model::sleep_stage previous_stage{model::sleep_stage::UNKNOWN};
};

// Inputs scaled to [0,1] for the model.
struct normalized_features {
  double heart_rate;
  double hrv;
  double spo2;
  double movement;
  double body_temperature;
  double respiratory_rate;
  double time_of_night;
  double previous_stage;
};

normalized_features normalize(const stage_features& features) noexcept;

stage_features features_from(const model::vital_signs& vitals, double time_of_night_h,
                             model::sleep_stage previous_stage) noexcept;

// Scores indexed awake, light, deep, rem.
using stage_scores = std::array<double, 4>;

class StageModel {
 public:
  virtual bool available() const = 0;
  virtual stage_scores infer(const stage_features& features, const normalized_features& normalized) = 0;
  virtual ~StageModel() = default;
};

struct stage_prediction {
  model::sleep_stage stage;
  double confidence;
};

class StageClassifier {
 public:
  explicit StageClassifier(StageModel& model) noexcept;

  // Empty on failure; the caller keeps its previous stage.
  std::optional<stage_prediction> classify(const stage_features& features) noexcept;

  [[nodiscard]] const std::string& last_error() const noexcept;
  [[nodiscard]] std::size_t failures() const noexcept;

 private:
  void record_failure(std::string reason);

  StageModel& model_;
  std::string last_error_{};
  std::size_t failures_{0};
};

}  // namespace sleep_agent::inference
