#pragma once

#include "inference/stage_classifier.hpp"

namespace sleep_agent::inference {

// Threshold scoring over raw vitals; stands in when no trained model is deployed.
class RuleStageModel final : public StageModel {
 public:
  bool available() const override { return true; }
  stage_scores infer(const stage_features& features, const normalized_features& normalized) override;

  static double awake_score(const stage_features& features) noexcept;
  static double light_score(const stage_features& features) noexcept;
  static double deep_score(const stage_features& features) noexcept;
  static double rem_score(const stage_features& features) noexcept;
};

}  // namespace sleep_agent::inference
