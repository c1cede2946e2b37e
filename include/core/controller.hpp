#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

#include "actuators/actuators.hpp"
#include "actuators/dispatcher.hpp"
#include "core/config.hpp"
#include "core/scheduler.hpp"
#include "inference/stage_classifier.hpp"
#include "metrics/sleep_metrics.hpp"
#include "model/nudge_action.hpp"
#include "model/quick_action.hpp"
#include "model/sleep_frame.hpp"
#include "policy/decision_policy.hpp"
#include "sensors/environment.hpp"
#include "sensors/vitals.hpp"
#include "sinks/frame_sink.hpp"
#include "store/history_store.hpp"

namespace sleep_agent::core {

// Everything the controller talks to. Actuator domains are shared so one backend
// object can serve all three interfaces.
struct Collaborators {
  std::unique_ptr<sensors::VitalsSource> vitals{};
  std::unique_ptr<sensors::EnvironmentSource> environment{};
  std::unique_ptr<inference::StageModel> stage_model{};
  std::unique_ptr<policy::DecisionPolicy> policy{};
  std::shared_ptr<actuators::AudioHaptics> audio{};
  std::shared_ptr<actuators::EnvironmentController> environment_controller{};
  std::shared_ptr<actuators::BedMotor> bed{};
  std::unique_ptr<store::HistoryStore> history{};
  std::vector<std::unique_ptr<sinks::FrameSink>> sinks{};
};

// Read-only view published at the end of every tick.
struct ControllerSnapshot {
  bool active{false};
  std::uint64_t tick{0};
  model::sleep_stage stage{model::sleep_stage::UNKNOWN};
  double stage_confidence{0.0};
  double quality_score{0.0};
  metrics::SleepMetricsReport report{};
  std::vector<model::quick_action> history{};
  std::optional<model::nudge_action> last_nudge{};
  std::size_t nudge_count{0};
  model::sleep_frame::AgentHealth health{};
};

class Controller {
 public:
  using TickObserver = std::function<void(const ControllerSnapshot&)>;

  // Throws std::invalid_argument when a required collaborator is missing.
  Controller(AgentConfig config, Collaborators collaborators);
  ~Controller();

  Controller(const Controller&) = delete;
  Controller& operator=(const Controller&) = delete;

  // Loads history on the first call, resets the session and schedules ticks.
  // False if a session is already active.
  bool start();

  // Halts scheduling and returns every actuator domain to baseline. Metrics of
  // the finished session stay readable until the next start().
  void stop();

  // One sample, classify, aggregate, decide, dispatch, publish cycle. The
  // scheduler calls this. A no-op while no session is active, so a stopped
  // session's report stays frozen.
  void tick();

  [[nodiscard]] bool active() const;
  [[nodiscard]] ControllerSnapshot snapshot() const;
  [[nodiscard]] SchedulerStats scheduler_stats() const;

  // Invoked on the tick thread after each snapshot is published, outside the
  // tick lock. The observer must not call start() or stop().
  void set_tick_observer(TickObserver observer);

 private:
  void load_history();
  void reset_session();
  bool collect_signals();
  void classify_stage();
  void aggregate_metrics();
  void decide_and_dispatch();
  void update_agent_health(float actual_period_ms, float compute_time_ms);
  void publish_sinks();
  ControllerSnapshot publish_snapshot();

  AgentConfig config_;
  Collaborators collaborators_;
  inference::StageClassifier classifier_;
  policy::PolicyAdapter policy_;
  actuators::ActuatorDispatcher dispatcher_;
  metrics::SleepMetrics metrics_{};

  mutable std::mutex tick_mutex_;
  model::sleep_frame frame_{};
  model::sleep_state state_{model::sleep_stage::UNKNOWN, 0.0, 0.0, 0.0};
  double stage_confidence_{0.0};
  std::uint64_t session_ticks_{0};
  std::uint32_t signal_failures_{0};
  std::uint32_t sink_errors_{0};
  std::uint32_t history_load_failures_{0};
  bool signals_were_ok_{true};
  std::vector<bool> sink_was_ok_{};
  std::vector<model::quick_action> history_{};
  std::optional<model::nudge_action> last_nudge_{};
  std::size_t nudge_count_{0};
  bool history_loaded_{false};
  std::optional<std::chrono::steady_clock::time_point> previous_cycle_start_{};
  TickObserver observer_{};

  mutable std::mutex snapshot_mutex_;
  ControllerSnapshot snapshot_{};

  std::mutex lifecycle_mutex_;
  std::atomic<bool> active_{false};
  TickScheduler scheduler_;
};

}  // namespace sleep_agent::core
