#include "metrics/sleep_metrics.hpp"

#include <utility>

#include "core/math.hpp"

namespace sleep_agent::metrics {

void SleepMetrics::record(const model::sleep_stage stage, const std::chrono::milliseconds duration) noexcept {
  if (duration.count() <= 0) {
    return;
  }
  per_stage_[model::stage_index(stage)] += duration;
}

void SleepMetrics::observe(const model::sleep_state& state) noexcept {
  last_state_ = state;
  has_state_ = true;
}

void SleepMetrics::add_intervention(model::nudge_action action) { interventions_.push_back(std::move(action)); }

void SleepMetrics::reset() noexcept {
  per_stage_.fill(std::chrono::milliseconds{0});
  last_state_ = model::sleep_state{model::sleep_stage::UNKNOWN, 0.0, 0.0, 0.0};
  has_state_ = false;
  interventions_.clear();
}

double SleepMetrics::quality_score(const double hrv, const double heart_rate) noexcept {
  const double hrv_term = core::clamp01(core::finite_or(hrv, 0.0) / 100.0);
  const double hr = core::finite_or(heart_rate, 100.0);
  const double heart_rate_term = core::clamp01(1.0 - ((hr - 60.0) / 40.0));
  return (hrv_term + heart_rate_term) / 2.0;
}

double SleepMetrics::quality_score() const noexcept {
  if (!has_state_) {
    return 0.0;
  }
  return quality_score(last_state_.hrv, last_state_.heart_rate);
}

double SleepMetrics::deep_sleep_percentage() const noexcept { return stage_fraction(model::sleep_stage::DEEP); }

double SleepMetrics::rem_sleep_percentage() const noexcept { return stage_fraction(model::sleep_stage::REM); }

double SleepMetrics::light_sleep_percentage() const noexcept { return stage_fraction(model::sleep_stage::LIGHT); }

double SleepMetrics::awake_percentage() const noexcept { return stage_fraction(model::sleep_stage::AWAKE); }

std::chrono::milliseconds SleepMetrics::stage_duration(const model::sleep_stage stage) const noexcept {
  return per_stage_[model::stage_index(stage)];
}

std::chrono::milliseconds SleepMetrics::total_sleep_time() const noexcept {
  return stage_duration(model::sleep_stage::LIGHT) + stage_duration(model::sleep_stage::DEEP) +
         stage_duration(model::sleep_stage::REM);
}

std::chrono::milliseconds SleepMetrics::session_duration() const noexcept {
  return classified_duration() + stage_duration(model::sleep_stage::UNKNOWN);
}

const std::vector<model::nudge_action>& SleepMetrics::interventions() const noexcept { return interventions_; }

SleepMetricsReport SleepMetrics::report() const {
  SleepMetricsReport report{};
  report.per_stage = per_stage_;
  report.total_sleep_time = total_sleep_time();
  report.session_duration = session_duration();
  report.deep_pct = deep_sleep_percentage();
  report.rem_pct = rem_sleep_percentage();
  report.light_pct = light_sleep_percentage();
  report.awake_pct = awake_percentage();
  report.quality_score = quality_score();
  report.interventions = interventions_;
  return report;
}

double SleepMetrics::stage_fraction(const model::sleep_stage stage) const noexcept {
  const auto total = classified_duration();
  if (total.count() <= 0) {
    return 0.0;
  }
  return static_cast<double>(stage_duration(stage).count()) / static_cast<double>(total.count());
}

// Awake counts toward the denominator so the four stage fractions sum to one.
std::chrono::milliseconds SleepMetrics::classified_duration() const noexcept {
  return stage_duration(model::sleep_stage::AWAKE) + total_sleep_time();
}

}  // namespace sleep_agent::metrics
