#include "core/controller.hpp"

#include <cmath>
#include <exception>
#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>

#include "core/timestamp.hpp"

namespace sleep_agent::core {
namespace {

Collaborators checked(Collaborators collaborators) {
  if (collaborators.vitals == nullptr) {
    throw std::invalid_argument("controller requires a vitals source");
  }
  if (collaborators.environment == nullptr) {
    throw std::invalid_argument("controller requires an environment source");
  }
  if (collaborators.stage_model == nullptr) {
    throw std::invalid_argument("controller requires a stage model");
  }
  if (collaborators.policy == nullptr) {
    throw std::invalid_argument("controller requires a decision policy");
  }
  if (collaborators.audio == nullptr || collaborators.environment_controller == nullptr ||
      collaborators.bed == nullptr) {
    throw std::invalid_argument("controller requires all three actuator domains");
  }
  if (collaborators.history == nullptr) {
    throw std::invalid_argument("controller requires a history store");
  }
  for (const auto& sink : collaborators.sinks) {
    if (sink == nullptr) {
      throw std::invalid_argument("controller sink list contains a null sink");
    }
  }
  return collaborators;
}

template <typename Source>
bool sample_guarded(const char* what, Source& source, model::sleep_frame& frame) {
  try {
    return source.sample(frame);
  } catch (const std::exception& ex) {
    std::cerr << "[controller] " << what << " source threw: " << ex.what() << '\n';
    return false;
  }
}

}  // namespace

Controller::Controller(AgentConfig config, Collaborators collaborators)
    : config_(std::move(config)),
      collaborators_(checked(std::move(collaborators))),
      classifier_(*collaborators_.stage_model),
      policy_(*collaborators_.policy),
      dispatcher_(*collaborators_.audio, *collaborators_.environment_controller, *collaborators_.bed,
                  *collaborators_.history),
      scheduler_(config_.tick_interval) {
  frame_.stage = model::sleep_stage::UNKNOWN;
  sink_was_ok_.assign(collaborators_.sinks.size(), true);
}

Controller::~Controller() { stop(); }

bool Controller::start() {
  std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
  if (active_) {
    return false;
  }

  {
    std::lock_guard<std::mutex> lock(tick_mutex_);
    if (!history_loaded_) {
      load_history();
    }
    reset_session();
    active_ = true;
    publish_snapshot();
  }

  if (!scheduler_.start([this] { tick(); })) {
    active_ = false;
    std::cerr << "[controller] scheduler refused to start\n";
    return false;
  }

  std::cerr << "[controller] session started; tick every " << config_.tick_interval.count() << " ms\n";
  return true;
}

void Controller::stop() {
  std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
  if (!active_) {
    return;
  }

  scheduler_.stop();

  std::lock_guard<std::mutex> lock(tick_mutex_);
  active_ = false;
  if (!dispatcher_.return_to_baseline()) {
    std::cerr << "[controller] one or more actuators did not return to baseline\n";
  }
  publish_snapshot();
  std::cerr << "[controller] session stopped after " << session_ticks_ << " tick(s)\n";
}

void Controller::tick() {
  std::unique_lock<std::mutex> lock(tick_mutex_);
  if (!active_) {
    return;
  }
  const auto cycle_start = std::chrono::steady_clock::now();

  ++session_ticks_;
  frame_.tick = session_ticks_;
  frame_.timestamp_ms = unix_timestamp_now_ms();
  frame_.monotonic_ns = monotonic_timestamp_now_ns();
  frame_.nudged = false;

  const bool signals_ok = collect_signals();
  if (signals_ok) {
    classify_stage();
  }
  aggregate_metrics();
  if (signals_ok) {
    decide_and_dispatch();
  }

  const auto cycle_end = std::chrono::steady_clock::now();
  const float actual_period_ms =
      previous_cycle_start_.has_value() ? elapsed_ms(*previous_cycle_start_, cycle_start) : 0.0F;
  const float compute_ms = elapsed_ms(cycle_start, cycle_end);
  update_agent_health(actual_period_ms, compute_ms);
  previous_cycle_start_ = cycle_start;

  publish_sinks();
  const ControllerSnapshot published = publish_snapshot();
  const TickObserver observer = observer_;
  lock.unlock();

  if (observer) {
    observer(published);
  }
}

bool Controller::active() const { return active_; }

ControllerSnapshot Controller::snapshot() const {
  std::lock_guard<std::mutex> lock(snapshot_mutex_);
  return snapshot_;
}

SchedulerStats Controller::scheduler_stats() const { return scheduler_.stats(); }

void Controller::set_tick_observer(TickObserver observer) {
  std::lock_guard<std::mutex> lock(tick_mutex_);
  observer_ = std::move(observer);
}

void Controller::load_history() {
  history_loaded_ = true;

  std::vector<model::quick_action> loaded;
  bool ok = false;
  try {
    ok = collaborators_.history->load_all(loaded);
  } catch (const std::exception& ex) {
    std::cerr << "[history] load threw: " << ex.what() << '\n';
  }

  if (!ok) {
    ++history_load_failures_;
    std::cerr << "[history] load failed; starting with an empty history\n";
    return;
  }

  history_.insert(history_.end(), loaded.begin(), loaded.end());
  std::cerr << "[history] loaded " << loaded.size() << " record(s)\n";
}

void Controller::reset_session() {
  metrics_.reset();
  state_ = model::sleep_state{model::sleep_stage::UNKNOWN, 0.0, 0.0, 0.0};
  stage_confidence_ = 0.0;
  session_ticks_ = 0;
  last_nudge_.reset();
  nudge_count_ = 0;
  previous_cycle_start_.reset();
  signals_were_ok_ = true;
  frame_.stage = model::sleep_stage::UNKNOWN;
  frame_.stage_confidence = 0.0;
  frame_.time_in_stage_s = 0.0;
  frame_.quality_score = 0.0;
  frame_.deep_pct = 0.0;
  frame_.rem_pct = 0.0;
}

bool Controller::collect_signals() {
  frame_.vitals_valid = sample_guarded("vitals", *collaborators_.vitals, frame_);
  frame_.environment_valid = sample_guarded("environment", *collaborators_.environment, frame_);

  const bool ok = frame_.vitals_valid && frame_.environment_valid;
  if (!ok) {
    ++signal_failures_;
    if (signals_were_ok_) {
      std::cerr << "[controller] " << (frame_.vitals_valid ? "environment" : "vitals")
                << " unavailable; holding stage " << model::stage_name(state_.stage) << '\n';
      signals_were_ok_ = false;
    }
  } else if (!signals_were_ok_) {
    std::cerr << "[controller] signals recovered\n";
    signals_were_ok_ = true;
  }
  return ok;
}

void Controller::classify_stage() {
  const double elapsed_h = hours_elapsed(config_.tick_interval, session_ticks_ - 1);
  const auto prediction = classifier_.classify(inference::features_from(frame_.vitals, elapsed_h, state_.stage));
  if (!prediction.has_value()) {
    return;
  }

  if (prediction->stage != state_.stage) {
    state_.time_in_stage_s = 0.0;
  }
  state_.stage = prediction->stage;
  stage_confidence_ = prediction->confidence;
}

// Every tick credits its full period to the stage held at the end of the tick,
// including ticks whose signals or classification failed.
void Controller::aggregate_metrics() {
  metrics_.record(state_.stage, config_.tick_interval);
  state_.time_in_stage_s += std::chrono::duration<double>(config_.tick_interval).count();
  if (frame_.vitals_valid) {
    state_.heart_rate = frame_.vitals.heart_rate;
    state_.hrv = frame_.vitals.hrv;
    metrics_.observe(state_);
  }

  frame_.stage = state_.stage;
  frame_.stage_confidence = stage_confidence_;
  frame_.time_in_stage_s = state_.time_in_stage_s;
  frame_.quality_score = metrics_.quality_score();
  frame_.deep_pct = metrics_.deep_sleep_percentage();
  frame_.rem_pct = metrics_.rem_sleep_percentage();
}

void Controller::decide_and_dispatch() {
  const auto action = policy_.decide(state_, frame_.environment);
  if (!action.has_value()) {
    return;
  }

  const auto outcome = dispatcher_.dispatch(*action, metrics_, frame_.timestamp_ms);
  history_.push_back(outcome.record);
  last_nudge_ = *action;
  ++nudge_count_;
  frame_.nudged = true;
}

void Controller::update_agent_health(const float actual_period_ms, const float compute_time_ms) {
  const float tick_ms = to_float_ms(config_.tick_interval);

  frame_.agent.heartbeat_ms = unix_timestamp_now_ms();
  frame_.agent.loop_jitter_ms = actual_period_ms > 0.0F ? std::fabs(actual_period_ms - tick_ms) : 0.0F;
  frame_.agent.compute_time_ms = compute_time_ms;
  frame_.agent.signal_failures = signal_failures_;
  frame_.agent.classification_failures = static_cast<std::uint32_t>(classifier_.failures());
  frame_.agent.dispatch_failures = static_cast<std::uint32_t>(dispatcher_.dispatch_failures());
  frame_.agent.persistence_failures =
      static_cast<std::uint32_t>(dispatcher_.persistence_failures()) + history_load_failures_;
  frame_.agent.sink_errors = sink_errors_;
  frame_.agent.missed_cycles = static_cast<std::uint32_t>(scheduler_.stats().missed_cycles);
}

void Controller::publish_sinks() {
  for (std::size_t i = 0; i < collaborators_.sinks.size(); ++i) {
    auto& sink = *collaborators_.sinks[i];
    bool ok = false;
    try {
      ok = sink.publish(frame_);
    } catch (const std::exception& ex) {
      std::cerr << "[" << sink.name() << "] publish threw: " << ex.what() << '\n';
    }

    if (!ok) {
      ++sink_errors_;
      if (sink_was_ok_[i]) {
        std::cerr << "[" << sink.name() << "] publish failed\n";
        sink_was_ok_[i] = false;
      }
    } else if (!sink_was_ok_[i]) {
      std::cerr << "[" << sink.name() << "] publish recovered\n";
      sink_was_ok_[i] = true;
    }
  }
}

ControllerSnapshot Controller::publish_snapshot() {
  ControllerSnapshot next{};
  next.active = active_;
  next.tick = session_ticks_;
  next.stage = state_.stage;
  next.stage_confidence = stage_confidence_;
  next.quality_score = metrics_.quality_score();
  next.report = metrics_.report();
  next.history = history_;
  next.last_nudge = last_nudge_;
  next.nudge_count = nudge_count_;
  next.health = frame_.agent;

  std::lock_guard<std::mutex> lock(snapshot_mutex_);
  snapshot_ = next;
  return next;
}

}  // namespace sleep_agent::core
