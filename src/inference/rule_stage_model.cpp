#include "inference/rule_stage_model.hpp"

#include <algorithm>

namespace sleep_agent::inference {
namespace {

bool within(const double value, const double low, const double high) noexcept {
  return low <= value && value <= high;
}

}  // namespace

stage_scores RuleStageModel::infer(const stage_features& features, const normalized_features& /*normalized*/) {
  return {awake_score(features), light_score(features), deep_score(features), rem_score(features)};
}

double RuleStageModel::awake_score(const stage_features& features) noexcept {
  double score = 0.0;
  if (features.heart_rate > 70.0) score += 0.3;
  if (features.heart_rate > 80.0) score += 0.2;
  if (features.movement > 0.5) score += 0.3;
  if (features.movement > 0.8) score += 0.2;
  if (features.respiratory_rate > 16.0) score += 0.2;
  if (features.time_of_night_h < 1.0 || features.time_of_night_h > 7.0) score += 0.1;
  return std::min(score, 1.0);
}

double RuleStageModel::light_score(const stage_features& features) noexcept {
  double score = 0.0;
  if (within(features.heart_rate, 55.0, 70.0)) score += 0.3;
  if (within(features.hrv, 20.0, 45.0)) score += 0.2;
  if (within(features.movement, 0.1, 0.4)) score += 0.2;
  if (features.spo2 > 95.0) score += 0.1;
  if (within(features.time_of_night_h, 1.0, 3.0)) score += 0.2;
  return std::min(score, 1.0);
}

double RuleStageModel::deep_score(const stage_features& features) noexcept {
  double score = 0.0;
  if (features.heart_rate < 60.0) score += 0.3;
  if (features.heart_rate < 50.0) score += 0.2;
  if (features.hrv > 40.0) score += 0.3;
  if (features.movement < 0.2) score += 0.3;
  if (features.movement < 0.1) score += 0.2;
  if (features.respiratory_rate < 14.0) score += 0.1;
  if (features.spo2 > 96.0) score += 0.1;
  return std::min(score, 1.0);
}

double RuleStageModel::rem_score(const stage_features& features) noexcept {
  double score = 0.0;
  if (within(features.heart_rate, 60.0, 80.0)) score += 0.2;
  if (within(features.hrv, 25.0, 50.0)) score += 0.2;
  if (within(features.movement, 0.2, 0.6)) score += 0.2;
  if (within(features.respiratory_rate, 14.0, 18.0)) score += 0.2;
  if (within(features.time_of_night_h, 3.0, 6.0)) score += 0.2;
  return std::min(score, 1.0);
}

}  // namespace sleep_agent::inference
