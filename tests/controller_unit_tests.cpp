#include <algorithm>
#include <atomic>
#include <chrono>
#include <cmath>
#include <deque>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "actuators/actuators.hpp"
#include "core/config.hpp"
#include "core/controller.hpp"
#include "core/scheduler.hpp"
#include "inference/stage_classifier.hpp"
#include "model/nudge_action.hpp"
#include "model/quick_action.hpp"
#include "model/sleep_frame.hpp"
#include "policy/decision_policy.hpp"
#include "sensors/environment.hpp"
#include "sensors/vitals.hpp"
#include "sinks/frame_sink.hpp"
#include "store/history_store.hpp"

using sleep_agent::core::ActuatorBackend;
using sleep_agent::core::AgentConfig;
using sleep_agent::core::Collaborators;
using sleep_agent::core::Controller;
using sleep_agent::core::ControllerSnapshot;
using sleep_agent::core::HistoryBackend;
using sleep_agent::core::TickScheduler;
using sleep_agent::core::load_agent_config;
using sleep_agent::model::audio_kind;
using sleep_agent::model::audio_nudge;
using sleep_agent::model::environment_kind;
using sleep_agent::model::environment_nudge;
using sleep_agent::model::environment_snapshot;
using sleep_agent::model::nudge_action;
using sleep_agent::model::quick_action;
using sleep_agent::model::sleep_frame;
using sleep_agent::model::sleep_stage;
using sleep_agent::model::sleep_state;
using sleep_agent::model::vital_signs;
using std::chrono::milliseconds;
using std::chrono::seconds;

namespace {

int fail(const char* name, const char* msg) {
  std::cerr << "[FAIL] " << name << ": " << msg << '\n';
  return 1;
}

// Redirects std::cerr for the lifetime of the object.
class CerrCapture {
 public:
  CerrCapture() : previous_(std::cerr.rdbuf(buffer_.rdbuf())) {}
  ~CerrCapture() { std::cerr.rdbuf(previous_); }

  CerrCapture(const CerrCapture&) = delete;
  CerrCapture& operator=(const CerrCapture&) = delete;

  std::size_t lines_containing(const std::string& needle) const {
    std::istringstream input(buffer_.str());
    std::size_t count = 0;
    std::string line;
    while (std::getline(input, line)) {
      if (line.find(needle) != std::string::npos) {
        ++count;
      }
    }
    return count;
  }

 private:
  std::ostringstream buffer_;
  std::streambuf* previous_;
};

vital_signs deep_vitals() { return vital_signs{55.0, 80.0, 98.0, 36.2, 0.05, 12.0}; }

environment_snapshot calm_room() { return environment_snapshot{18.0, 50.0, 0.1, 0.0, 0.0, 0.9}; }

class FakeVitals final : public sleep_agent::sensors::VitalsSource {
 public:
  bool sample(sleep_frame& frame) override {
    if (available) {
      frame.vitals = reading;
    }
    return available;
  }

  vital_signs reading{deep_vitals()};
  bool available{true};
};

class FakeEnvironment final : public sleep_agent::sensors::EnvironmentSource {
 public:
  bool sample(sleep_frame& frame) override {
    if (available) {
      frame.environment = reading;
    }
    return available;
  }

  environment_snapshot reading{calm_room()};
  bool available{true};
};

// Emits a one-hot-ish score for the scripted stage; an empty entry throws.
class ScriptedModel final : public sleep_agent::inference::StageModel {
 public:
  bool available() const override { return true; }

  sleep_agent::inference::stage_scores infer(const sleep_agent::inference::stage_features& /*features*/,
                                             const sleep_agent::inference::normalized_features& /*normalized*/) override {
    ++calls;
    std::optional<sleep_stage> stage = fallback;
    if (!script.empty()) {
      stage = script.front();
      script.pop_front();
    }
    if (!stage.has_value()) {
      throw std::runtime_error("inference backend crashed");
    }
    sleep_agent::inference::stage_scores scores{0.1, 0.1, 0.1, 0.1};
    scores[sleep_agent::model::stage_index(*stage)] = 0.7;
    return scores;
  }

  std::deque<std::optional<sleep_stage>> script{};
  sleep_stage fallback{sleep_stage::DEEP};
  int calls{0};
};

class ScriptedPolicy final : public sleep_agent::policy::DecisionPolicy {
 public:
  std::optional<nudge_action> decide(const sleep_state& state, const environment_snapshot& /*environment*/) override {
    ++calls;
    last_state = state;
    if (repeat.has_value()) {
      return repeat;
    }
    if (script.empty()) {
      return std::nullopt;
    }
    auto next = script.front();
    script.pop_front();
    return next;
  }

  std::deque<std::optional<nudge_action>> script{};
  std::optional<nudge_action> repeat{};
  sleep_state last_state{};
  int calls{0};
};

class RecordingActuators final : public sleep_agent::actuators::AudioHaptics,
                                 public sleep_agent::actuators::EnvironmentController,
                                 public sleep_agent::actuators::BedMotor {
 public:
  struct call {
    std::string name;
    double value;
  };

  bool play_audio(audio_kind kind) override {
    return record("play_audio", static_cast<double>(static_cast<int>(kind)), fail_audio);
  }
  bool stop_audio() override { return record("stop_audio", 0.0, false); }
  bool apply_haptic(const float intensity) override { return record("apply_haptic", intensity, false); }
  bool adjust_temperature(const double target_c) override { return record("adjust_temperature", target_c, false); }
  bool adjust_humidity(const double target_pct) override { return record("adjust_humidity", target_pct, false); }
  bool adjust_lighting(const double level) override { return record("adjust_lighting", level, false); }
  bool adjust_blinds(const double position) override { return record("adjust_blinds", position, false); }
  bool set_hepa_filter(const bool on, const std::string& /*mode*/) override {
    return record("set_hepa_filter", on ? 1.0 : 0.0, false);
  }
  bool release_overrides() override { return record("release_overrides", 0.0, false); }
  bool adjust_head_elevation(const double value) override { return record("adjust_head_elevation", value, false); }
  bool adjust_foot_elevation(const double value) override { return record("adjust_foot_elevation", value, false); }
  bool start_massage(const double intensity) override { return record("start_massage", intensity, false); }
  bool stop_massage() override { return record("stop_massage", 0.0, false); }

  std::size_t count(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<std::size_t>(
        std::count_if(calls_.begin(), calls_.end(), [&name](const call& c) { return c.name == name; }));
  }

  std::size_t total() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return calls_.size();
  }

  std::vector<call> calls() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return calls_;
  }

  void clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    calls_.clear();
  }

  std::atomic<bool> fail_audio{false};

 private:
  bool record(const char* name, const double value, const bool fail_call) {
    std::lock_guard<std::mutex> lock(mutex_);
    calls_.push_back(call{name, value});
    return !fail_call;
  }

  mutable std::mutex mutex_;
  std::vector<call> calls_{};
};

class MemoryHistory final : public sleep_agent::store::HistoryStore {
 public:
  bool save(const quick_action& action) override {
    ++save_calls;
    if (fail_save) {
      return false;
    }
    saved.push_back(action);
    return true;
  }

  bool load_all(std::vector<quick_action>& out) override {
    ++load_calls;
    if (fail_load) {
      return false;
    }
    out.insert(out.end(), saved.begin(), saved.end());
    return true;
  }

  std::vector<quick_action> saved{};
  bool fail_save{false};
  bool fail_load{false};
  int save_calls{0};
  int load_calls{0};
};

class CountingSink final : public sleep_agent::sinks::FrameSink {
 public:
  const char* name() const override { return "counting"; }
  bool publish(sleep_frame& frame) override {
    ++published;
    last = frame;
    if (!failures.empty()) {
      const bool failed = failures.front();
      failures.pop_front();
      return !failed;
    }
    return true;
  }

  int published{0};
  sleep_frame last{};
  std::deque<bool> failures{};
};

// Owns nothing; the controller owns the fakes and this keeps handles to them.
struct Harness {
  FakeVitals* vitals{nullptr};
  FakeEnvironment* environment{nullptr};
  ScriptedModel* model{nullptr};
  ScriptedPolicy* policy{nullptr};
  std::shared_ptr<RecordingActuators> actuators{};
  MemoryHistory* history{nullptr};
  CountingSink* sink{nullptr};
  std::unique_ptr<Controller> controller{};
};

// Started harnesses use the configured period, so the scheduler never fires
// during a test and ticks are driven by hand.
Harness make_harness(AgentConfig config = {}, std::vector<quick_action> stored = {}, bool fail_load = false,
                     bool started = true) {
  Harness harness{};
  Collaborators collaborators{};

  auto vitals = std::make_unique<FakeVitals>();
  harness.vitals = vitals.get();
  collaborators.vitals = std::move(vitals);

  auto environment = std::make_unique<FakeEnvironment>();
  harness.environment = environment.get();
  collaborators.environment = std::move(environment);

  auto model = std::make_unique<ScriptedModel>();
  harness.model = model.get();
  collaborators.stage_model = std::move(model);

  auto policy = std::make_unique<ScriptedPolicy>();
  harness.policy = policy.get();
  collaborators.policy = std::move(policy);

  harness.actuators = std::make_shared<RecordingActuators>();
  collaborators.audio = harness.actuators;
  collaborators.environment_controller = harness.actuators;
  collaborators.bed = harness.actuators;

  auto history = std::make_unique<MemoryHistory>();
  history->saved = std::move(stored);
  history->fail_load = fail_load;
  harness.history = history.get();
  collaborators.history = std::move(history);

  auto sink = std::make_unique<CountingSink>();
  harness.sink = sink.get();
  collaborators.sinks.push_back(std::move(sink));

  harness.controller = std::make_unique<Controller>(std::move(config), std::move(collaborators));
  if (started) {
    harness.controller->start();
  }
  return harness;
}

AgentConfig hourly_config() {
  AgentConfig config{};
  config.tick_interval = seconds(3600);
  return config;
}

template <typename Predicate>
bool wait_for(Predicate predicate, const milliseconds timeout = milliseconds(3000)) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (predicate()) {
      return true;
    }
    std::this_thread::sleep_for(milliseconds(5));
  }
  return predicate();
}

std::filesystem::path write_config(const char* name, const std::string& content) {
  const auto path = std::filesystem::temp_directory_path() / name;
  std::ofstream out(path);
  out << content;
  return path;
}

bool config_throws(const char* name, const std::string& content) {
  const auto path = write_config(name, content);
  bool threw = false;
  try {
    (void)load_agent_config(path.string());
  } catch (const std::exception&) {
    threw = true;
  }
  std::filesystem::remove(path);
  return threw;
}

int test_config_parsing() {
  const auto path = write_config("sleep_agent_config.yaml",
                                 "# session settings\n"
                                 "tick_interval_s: 15\n"
                                 "agent:\n"
                                 "  stdout_debug: false\n"
                                 "redis:\n"
                                 "  address: 10.0.0.5:6380  # bridge\n"
                                 "  db: 2\n"
                                 "  key_prefix: bedroom\n"
                                 "feeds:\n"
                                 "  vitals: /tmp/vitals.csv\n"
                                 "history:\n"
                                 "  backend: redis\n"
                                 "actuators:\n"
                                 "  backend: redis\n"
                                 "policy:\n"
                                 "  cooldown_ticks: 4\n"
                                 "  noise_threshold: 0.35\n"
                                 "unknown_section:\n"
                                 "  ignored: 1\n");
  const AgentConfig config = load_agent_config(path.string());
  std::filesystem::remove(path);

  if (config.tick_interval != seconds(15) || config.stdout_debug) {
    return fail("test_config_parsing", "top-level and agent keys should parse");
  }
  if (!config.redis.enabled || config.redis.host != "10.0.0.5" || config.redis.port != 6380 || config.redis.db != 2 ||
      config.redis.key_prefix != "bedroom") {
    return fail("test_config_parsing", "redis section should parse");
  }
  if (config.vitals_feed != "/tmp/vitals.csv" || config.environment_feed != "feeds/environment.csv") {
    return fail("test_config_parsing", "feed paths should parse and default");
  }
  if (config.history_backend != HistoryBackend::REDIS || config.actuator_backend != ActuatorBackend::REDIS) {
    return fail("test_config_parsing", "backends should parse");
  }
  if (config.policy.cooldown_ticks != 4U || std::fabs(config.policy.noise_threshold - 0.35) > 1e-9 ||
      std::fabs(config.policy.heart_rate_threshold - 75.0) > 1e-9) {
    return fail("test_config_parsing", "policy options should parse and default");
  }

  const auto unix_path = write_config("sleep_agent_unix.yaml", "redis:\n  address: unix:///run/redis.sock\n");
  const AgentConfig unix_config = load_agent_config(unix_path.string());
  std::filesystem::remove(unix_path);
  if (!unix_config.redis.enabled || unix_config.redis.unix_socket != "/run/redis.sock") {
    return fail("test_config_parsing", "unix socket address should parse");
  }

  const AgentConfig defaults{};
  if (defaults.tick_interval != seconds(30) || defaults.history_backend != HistoryBackend::FILE ||
      defaults.actuator_backend != ActuatorBackend::STDOUT || defaults.redis.enabled) {
    return fail("test_config_parsing", "defaults should describe a local 30 s session");
  }

  if (!config_throws("sleep_agent_bad_port.yaml", "redis:\n  address: localhost:99999\n")) {
    return fail("test_config_parsing", "bad redis port should throw");
  }
  if (!config_throws("sleep_agent_bad_tick.yaml", "tick_interval_s: 0\n")) {
    return fail("test_config_parsing", "zero tick interval should throw");
  }
  if (!config_throws("sleep_agent_bad_noise.yaml", "policy:\n  noise_threshold: 1.5\n")) {
    return fail("test_config_parsing", "noise threshold above 1 should throw");
  }
  if (!config_throws("sleep_agent_bad_backend.yaml", "history:\n  backend: sqlite\n")) {
    return fail("test_config_parsing", "unknown history backend should throw");
  }
  if (!config_throws("sleep_agent_no_redis.yaml", "sinks:\n  redis_ts: true\n")) {
    return fail("test_config_parsing", "redis sink without an address should throw");
  }

  bool missing_threw = false;
  try {
    (void)load_agent_config("/nonexistent/sleep-agent.yaml");
  } catch (const std::exception&) {
    missing_threw = true;
  }
  if (!missing_threw) {
    return fail("test_config_parsing", "missing config file should throw");
  }

  return 0;
}

int test_missing_collaborator_rejected() {
  Collaborators collaborators{};
  collaborators.vitals = std::make_unique<FakeVitals>();
  bool threw = false;
  try {
    Controller controller(AgentConfig{}, std::move(collaborators));
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  if (!threw) {
    return fail("test_missing_collaborator_rejected", "controller without collaborators should throw");
  }
  return 0;
}

int test_deep_sleep_tick_credits_deep_time() {
  auto harness = make_harness();
  harness.controller->tick();

  const ControllerSnapshot snapshot = harness.controller->snapshot();
  if (snapshot.stage != sleep_stage::DEEP) {
    return fail("test_deep_sleep_tick_credits_deep_time", "stage should be deep");
  }
  if (snapshot.report.per_stage[sleep_agent::model::stage_index(sleep_stage::DEEP)] != seconds(30)) {
    return fail("test_deep_sleep_tick_credits_deep_time", "deep duration should grow by one 30 s tick");
  }
  if (std::fabs(snapshot.quality_score - 0.9) > 1e-9) {
    return fail("test_deep_sleep_tick_credits_deep_time", "quality should reflect hrv 80 / hr 55");
  }
  if (harness.sink->published != 1 || harness.sink->last.stage != sleep_stage::DEEP ||
      std::fabs(harness.sink->last.deep_pct - 1.0) > 1e-9) {
    return fail("test_deep_sleep_tick_credits_deep_time", "sink should receive the classified frame");
  }
  if (harness.policy->last_state.stage != sleep_stage::DEEP || harness.policy->last_state.heart_rate != 55.0) {
    return fail("test_deep_sleep_tick_credits_deep_time", "policy should see the classified state");
  }

  return 0;
}

int test_classification_failure_retains_stage() {
  auto harness = make_harness();
  harness.model->script = {sleep_stage::DEEP, std::nullopt, sleep_stage::REM};

  harness.controller->tick();

  std::size_t error_lines = 0;
  {
    CerrCapture capture;
    harness.controller->tick();
    error_lines = capture.lines_containing("[classifier]");
  }

  ControllerSnapshot snapshot = harness.controller->snapshot();
  if (snapshot.stage != sleep_stage::DEEP) {
    return fail("test_classification_failure_retains_stage", "failed classification must keep the previous stage");
  }
  if (error_lines != 1U) {
    return fail("test_classification_failure_retains_stage", "exactly one classifier error should be logged");
  }
  if (snapshot.report.per_stage[sleep_agent::model::stage_index(sleep_stage::DEEP)] != seconds(60)) {
    return fail("test_classification_failure_retains_stage", "failed tick should be credited to the retained stage");
  }
  if (snapshot.health.classification_failures != 1U) {
    return fail("test_classification_failure_retains_stage", "classification failure should be counted");
  }

  harness.controller->tick();
  snapshot = harness.controller->snapshot();
  if (snapshot.stage != sleep_stage::REM || snapshot.tick != 3U) {
    return fail("test_classification_failure_retains_stage", "next tick should classify normally");
  }

  return 0;
}

int test_no_action_means_no_side_effects() {
  auto harness = make_harness();
  for (int i = 0; i < 3; ++i) {
    harness.controller->tick();
  }

  const ControllerSnapshot snapshot = harness.controller->snapshot();
  if (harness.actuators->total() != 0U) {
    return fail("test_no_action_means_no_side_effects", "no actuator should be called");
  }
  if (!snapshot.report.interventions.empty() || snapshot.nudge_count != 0U || snapshot.last_nudge.has_value()) {
    return fail("test_no_action_means_no_side_effects", "no intervention should be recorded");
  }
  if (harness.history->save_calls != 0) {
    return fail("test_no_action_means_no_side_effects", "nothing should be persisted");
  }
  if (harness.policy->calls != 3) {
    return fail("test_no_action_means_no_side_effects", "policy should be consulted every tick");
  }

  return 0;
}

int test_audio_nudge_dispatched_and_persisted() {
  auto harness = make_harness();
  const nudge_action action{audio_nudge{audio_kind::PINK_NOISE}, "elevated heart rate"};
  harness.policy->script = {action};

  harness.controller->tick();
  harness.controller->tick();

  if (harness.actuators->count("play_audio") != 1U || harness.actuators->total() != 1U) {
    return fail("test_audio_nudge_dispatched_and_persisted", "play_audio should be called exactly once");
  }
  if (harness.actuators->calls().front().value != static_cast<double>(static_cast<int>(audio_kind::PINK_NOISE))) {
    return fail("test_audio_nudge_dispatched_and_persisted", "pink noise should be requested");
  }

  const ControllerSnapshot snapshot = harness.controller->snapshot();
  if (snapshot.report.interventions.size() != 1U || snapshot.report.interventions.front() != action) {
    return fail("test_audio_nudge_dispatched_and_persisted", "one intervention should be recorded");
  }
  if (harness.history->saved.size() != 1U) {
    return fail("test_audio_nudge_dispatched_and_persisted", "save should be called once");
  }

  const quick_action& saved = harness.history->saved.front();
  if (saved.action_type != "audio" || saved.reason != "elevated heart rate" ||
      sleep_agent::model::parse_details(saved.action_type, saved.action_details) != action.payload ||
      saved.timestamp_ms == 0U) {
    return fail("test_audio_nudge_dispatched_and_persisted", "persisted record should match the action");
  }
  if (snapshot.history.size() != 1U || snapshot.history.front() != saved) {
    return fail("test_audio_nudge_dispatched_and_persisted", "visible history should include the record");
  }
  if (!snapshot.last_nudge.has_value() || *snapshot.last_nudge != action || snapshot.nudge_count != 1U) {
    return fail("test_audio_nudge_dispatched_and_persisted", "last nudge and count should be tracked");
  }

  return 0;
}

int test_persistence_failure_keeps_intervention() {
  auto harness = make_harness();
  harness.history->fail_save = true;
  harness.policy->script = {nudge_action{audio_nudge{audio_kind::PINK_NOISE}, "elevated heart rate"}};

  std::size_t logged = 0;
  {
    CerrCapture capture;
    harness.controller->tick();
    logged = capture.lines_containing("[history] failed to persist");
  }

  if (logged != 1U) {
    return fail("test_persistence_failure_keeps_intervention", "persistence failure should be logged once");
  }

  harness.controller->tick();
  const ControllerSnapshot snapshot = harness.controller->snapshot();
  if (snapshot.report.interventions.size() != 1U) {
    return fail("test_persistence_failure_keeps_intervention", "intervention must survive a failed save");
  }
  if (snapshot.history.size() != 1U) {
    return fail("test_persistence_failure_keeps_intervention", "in-memory history stays authoritative");
  }
  if (snapshot.health.persistence_failures != 1U || snapshot.tick != 2U) {
    return fail("test_persistence_failure_keeps_intervention", "later ticks should run and the failure be counted");
  }

  return 0;
}

int test_stage_durations_sum_to_tick_time() {
  AgentConfig config{};
  config.tick_interval = seconds(30);
  auto harness = make_harness(config);
  const sleep_stage cycle[] = {sleep_stage::AWAKE, sleep_stage::LIGHT, sleep_stage::DEEP, sleep_stage::REM};

  for (std::size_t n = 1; n <= 24; ++n) {
    harness.model->script.push_back(cycle[n % 4]);
    harness.controller->tick();

    const auto report = harness.controller->snapshot().report;
    milliseconds sum{0};
    for (const auto duration : report.per_stage) {
      sum += duration;
    }
    if (sum != seconds(30) * static_cast<long long>(n)) {
      return fail("test_stage_durations_sum_to_tick_time", "stage durations must sum to n * tick duration");
    }
    const double pct = report.deep_pct + report.rem_pct + report.light_pct + report.awake_pct;
    if (std::fabs(pct - 1.0) > 1e-9) {
      return fail("test_stage_durations_sum_to_tick_time", "stage percentages must sum to 1");
    }
  }

  return 0;
}

int test_signal_unavailable_skips_classification() {
  auto harness = make_harness();
  harness.policy->repeat = nudge_action{audio_nudge{audio_kind::PINK_NOISE}, "elevated heart rate"};

  harness.controller->tick();
  const int model_calls = harness.model->calls;
  const int policy_calls = harness.policy->calls;

  harness.vitals->available = false;
  harness.controller->tick();
  harness.vitals->available = true;
  harness.environment->available = false;
  harness.controller->tick();

  const ControllerSnapshot snapshot = harness.controller->snapshot();
  if (harness.model->calls != model_calls || harness.policy->calls != policy_calls) {
    return fail("test_signal_unavailable_skips_classification", "classification and decision should be skipped");
  }
  if (snapshot.stage != sleep_stage::DEEP ||
      snapshot.report.per_stage[sleep_agent::model::stage_index(sleep_stage::DEEP)] != seconds(90)) {
    return fail("test_signal_unavailable_skips_classification", "retained stage should still accrue time");
  }
  if (snapshot.health.signal_failures != 2U || snapshot.nudge_count != 1U) {
    return fail("test_signal_unavailable_skips_classification", "outages should be counted without nudging");
  }
  if (harness.sink->published != 3 || harness.sink->last.environment_valid) {
    return fail("test_signal_unavailable_skips_classification", "frames should still publish with validity flags");
  }

  return 0;
}

int test_stop_returns_actuators_to_baseline() {
  auto harness = make_harness(hourly_config(), {}, false, false);
  if (!harness.controller->start()) {
    return fail("test_stop_returns_actuators_to_baseline", "start should succeed");
  }
  if (harness.controller->start()) {
    return fail("test_stop_returns_actuators_to_baseline", "second start should be refused");
  }
  if (!harness.controller->active() || !harness.controller->snapshot().active) {
    return fail("test_stop_returns_actuators_to_baseline", "controller should be active");
  }

  harness.controller->tick();
  harness.controller->stop();

  if (harness.controller->active() || harness.controller->snapshot().active) {
    return fail("test_stop_returns_actuators_to_baseline", "controller should be inactive after stop");
  }
  if (harness.actuators->count("stop_audio") != 1U || harness.actuators->count("apply_haptic") != 1U ||
      harness.actuators->count("release_overrides") != 1U || harness.actuators->count("stop_massage") != 1U) {
    return fail("test_stop_returns_actuators_to_baseline", "every domain should receive its baseline command");
  }
  const auto calls = harness.actuators->calls();
  const auto haptic = std::find_if(calls.begin(), calls.end(), [](const auto& c) { return c.name == "apply_haptic"; });
  if (haptic == calls.end() || haptic->value != 0.0) {
    return fail("test_stop_returns_actuators_to_baseline", "haptics should be zeroed");
  }

  const ControllerSnapshot snapshot = harness.controller->snapshot();
  if (snapshot.report.per_stage[sleep_agent::model::stage_index(sleep_stage::DEEP)] != seconds(3600)) {
    return fail("test_stop_returns_actuators_to_baseline", "metrics should survive stop");
  }

  harness.controller->stop();
  if (harness.actuators->count("stop_audio") != 1U) {
    return fail("test_stop_returns_actuators_to_baseline", "stop while inactive should be a no-op");
  }

  if (!harness.controller->start()) {
    return fail("test_stop_returns_actuators_to_baseline", "restart should succeed");
  }
  if (harness.controller->snapshot().report.session_duration != milliseconds(0)) {
    return fail("test_stop_returns_actuators_to_baseline", "restart should begin a fresh session");
  }
  harness.controller->stop();

  return 0;
}

int test_history_loaded_once_at_start() {
  const quick_action first = sleep_agent::model::make_quick_action(
      nudge_action{audio_nudge{audio_kind::PINK_NOISE}, "elevated heart rate"}, 1000);
  const quick_action second = sleep_agent::model::make_quick_action(
      nudge_action{environment_nudge{environment_kind::DIM_LIGHTS, 0.05}, "light above stage maximum"}, 2000);
  auto harness = make_harness(hourly_config(), {first, second}, false, false);

  harness.controller->start();
  ControllerSnapshot snapshot = harness.controller->snapshot();
  if (snapshot.history.size() != 2U || snapshot.history[0] != first || snapshot.history[1] != second) {
    return fail("test_history_loaded_once_at_start", "stored history should seed the visible history");
  }
  harness.controller->stop();
  harness.controller->start();
  harness.controller->stop();

  if (harness.history->load_calls != 1) {
    return fail("test_history_loaded_once_at_start", "history should be loaded only once");
  }
  if (harness.controller->snapshot().history.size() != 2U) {
    return fail("test_history_loaded_once_at_start", "restart must not duplicate history");
  }

  auto broken = make_harness(hourly_config(), {first}, true, false);
  {
    CerrCapture capture;
    if (!broken.controller->start()) {
      return fail("test_history_loaded_once_at_start", "load failure must not prevent start");
    }
    if (capture.lines_containing("[history] load failed") != 1U) {
      return fail("test_history_loaded_once_at_start", "load failure should be logged");
    }
  }
  broken.controller->tick();
  snapshot = broken.controller->snapshot();
  broken.controller->stop();
  if (!snapshot.history.empty() || snapshot.health.persistence_failures != 1U) {
    return fail("test_history_loaded_once_at_start", "failed load should leave an empty history and count");
  }

  return 0;
}

int test_environment_command_not_reapplied() {
  auto harness = make_harness(hourly_config());
  const nudge_action cool{environment_nudge{environment_kind::LOWER_TEMPERATURE, 17.0}, "room warmer than stage target"};
  harness.policy->repeat = cool;

  harness.controller->tick();
  harness.controller->tick();

  if (harness.actuators->count("adjust_temperature") != 1U) {
    return fail("test_environment_command_not_reapplied", "same target should reach the actuator once");
  }
  if (harness.controller->snapshot().report.interventions.size() != 2U || harness.history->saved.size() != 2U) {
    return fail("test_environment_command_not_reapplied", "each decision is still recorded");
  }

  harness.policy->repeat = nudge_action{environment_nudge{environment_kind::LOWER_TEMPERATURE, 16.5}, "still warm"};
  harness.controller->tick();
  if (harness.actuators->count("adjust_temperature") != 2U) {
    return fail("test_environment_command_not_reapplied", "a new target should be applied");
  }

  harness.policy->repeat.reset();
  harness.controller->stop();
  harness.controller->start();
  harness.policy->repeat = cool;
  harness.controller->tick();
  if (harness.actuators->count("adjust_temperature") != 3U) {
    return fail("test_environment_command_not_reapplied", "baseline should clear the applied-target cache");
  }

  return 0;
}

int test_inactive_controller_ignores_ticks() {
  auto harness = make_harness(hourly_config(), {}, false, false);
  harness.policy->repeat = nudge_action{audio_nudge{audio_kind::PINK_NOISE}, "elevated heart rate"};

  harness.controller->tick();
  if (harness.controller->snapshot().tick != 0U || harness.model->calls != 0 || harness.sink->published != 0) {
    return fail("test_inactive_controller_ignores_ticks", "tick before start must do nothing");
  }

  harness.controller->start();
  harness.controller->tick();
  harness.controller->stop();
  const ControllerSnapshot finished = harness.controller->snapshot();
  const int policy_calls = harness.policy->calls;
  const std::size_t actuator_calls = harness.actuators->total();

  harness.controller->tick();
  harness.controller->tick();

  const ControllerSnapshot after = harness.controller->snapshot();
  if (after.tick != finished.tick || after.report.per_stage != finished.report.per_stage ||
      after.report.interventions.size() != finished.report.interventions.size() ||
      after.nudge_count != finished.nudge_count) {
    return fail("test_inactive_controller_ignores_ticks", "finished session report must stay frozen");
  }
  if (harness.policy->calls != policy_calls || harness.actuators->total() != actuator_calls ||
      harness.history->saved.size() != 1U || harness.sink->published != 1) {
    return fail("test_inactive_controller_ignores_ticks", "tick after stop must not reach any collaborator");
  }

  return 0;
}

int test_actuator_failure_is_isolated() {
  auto harness = make_harness();
  harness.actuators->fail_audio = true;
  harness.policy->script = {nudge_action{audio_nudge{audio_kind::PINK_NOISE}, "elevated heart rate"},
                            nudge_action{environment_nudge{environment_kind::RAISE_HUMIDITY, 50.0}, "dry air"}};

  std::size_t logged = 0;
  {
    CerrCapture capture;
    harness.controller->tick();
    logged = capture.lines_containing("[dispatch]");
  }
  harness.controller->tick();

  const ControllerSnapshot snapshot = harness.controller->snapshot();
  if (logged == 0U) {
    return fail("test_actuator_failure_is_isolated", "dispatch failure should be logged");
  }
  if (snapshot.report.interventions.size() != 2U || harness.history->saved.size() != 2U) {
    return fail("test_actuator_failure_is_isolated", "failed dispatch should still be recorded and persisted");
  }
  if (harness.actuators->count("adjust_humidity") != 1U) {
    return fail("test_actuator_failure_is_isolated", "other domains should keep working");
  }
  if (snapshot.health.dispatch_failures != 1U) {
    return fail("test_actuator_failure_is_isolated", "dispatch failure should be counted");
  }

  return 0;
}

int test_action_without_reason_is_dropped() {
  auto harness = make_harness();
  harness.policy->script = {nudge_action{audio_nudge{audio_kind::PINK_NOISE}, ""}};
  harness.controller->tick();

  const ControllerSnapshot snapshot = harness.controller->snapshot();
  if (harness.actuators->total() != 0U || !snapshot.report.interventions.empty() || harness.history->save_calls != 0) {
    return fail("test_action_without_reason_is_dropped", "reasonless action must not be dispatched");
  }

  return 0;
}

int test_sink_failures_log_on_transition() {
  auto harness = make_harness();
  harness.sink->failures = {true, true, true, false};

  std::size_t failed_lines = 0;
  std::size_t recovered_lines = 0;
  {
    CerrCapture capture;
    for (int i = 0; i < 4; ++i) {
      harness.controller->tick();
    }
    failed_lines = capture.lines_containing("publish failed");
    recovered_lines = capture.lines_containing("publish recovered");
  }

  if (failed_lines != 1U || recovered_lines != 1U) {
    return fail("test_sink_failures_log_on_transition", "sink failures should log on transitions only");
  }
  if (harness.controller->snapshot().health.sink_errors != 3U) {
    return fail("test_sink_failures_log_on_transition", "every failed publish should be counted");
  }

  return 0;
}

int test_tick_observer_receives_each_snapshot() {
  auto harness = make_harness();
  std::vector<std::uint64_t> seen;
  harness.controller->set_tick_observer([&seen](const ControllerSnapshot& snapshot) { seen.push_back(snapshot.tick); });

  for (int i = 0; i < 3; ++i) {
    harness.controller->tick();
  }

  if (seen != std::vector<std::uint64_t>{1, 2, 3}) {
    return fail("test_tick_observer_receives_each_snapshot", "observer should see every tick in order");
  }

  return 0;
}

int test_scheduler_runs_ticks_without_overlap() {
  TickScheduler scheduler(milliseconds(10));
  std::atomic<int> in_flight{0};
  std::atomic<int> max_in_flight{0};
  std::atomic<int> ticks{0};

  scheduler.start([&] {
    const int now = ++in_flight;
    int expected = max_in_flight.load();
    while (now > expected && !max_in_flight.compare_exchange_weak(expected, now)) {
    }
    std::this_thread::sleep_for(milliseconds(25));
    --in_flight;
    ++ticks;
  });

  const bool progressed = wait_for([&] { return ticks.load() >= 4; });
  scheduler.stop();

  if (!progressed) {
    return fail("test_scheduler_runs_ticks_without_overlap", "scheduler should keep ticking");
  }
  if (max_in_flight.load() != 1) {
    return fail("test_scheduler_runs_ticks_without_overlap", "ticks must never overlap");
  }
  const auto stats = scheduler.stats();
  if (stats.missed_cycles == 0U || stats.ticks_executed != static_cast<std::size_t>(ticks.load())) {
    return fail("test_scheduler_runs_ticks_without_overlap", "overruns should be skipped and counted");
  }
  if (scheduler.running()) {
    return fail("test_scheduler_runs_ticks_without_overlap", "scheduler should not run after stop");
  }

  return 0;
}

int test_scheduler_stop_interrupts_wait() {
  TickScheduler scheduler(seconds(60));
  std::atomic<int> ticks{0};
  if (!scheduler.start([&] { ++ticks; })) {
    return fail("test_scheduler_stop_interrupts_wait", "start should succeed");
  }
  if (scheduler.start([&] { ++ticks; })) {
    return fail("test_scheduler_stop_interrupts_wait", "double start should be refused");
  }

  const auto begin = std::chrono::steady_clock::now();
  scheduler.stop();
  const auto elapsed = std::chrono::steady_clock::now() - begin;

  if (elapsed > seconds(5)) {
    return fail("test_scheduler_stop_interrupts_wait", "stop should not wait for the next period");
  }
  if (ticks.load() != 0) {
    return fail("test_scheduler_stop_interrupts_wait", "first tick is due one period after start");
  }

  return 0;
}

int test_scheduler_survives_throwing_tick() {
  TickScheduler scheduler(milliseconds(5));
  std::atomic<int> ticks{0};

  {
    CerrCapture capture;
    scheduler.start([&] {
      if (++ticks == 1) {
        throw std::runtime_error("sensor bridge exploded");
      }
    });
    const bool progressed = wait_for([&] { return ticks.load() >= 3; });
    scheduler.stop();
    if (!progressed) {
      return fail("test_scheduler_survives_throwing_tick", "scheduler should continue after a throwing tick");
    }
    if (capture.lines_containing("[scheduler] tick failed") != 1U) {
      return fail("test_scheduler_survives_throwing_tick", "the throwing tick should be logged once");
    }
  }

  if (scheduler.stats().failed_ticks != 1U) {
    return fail("test_scheduler_survives_throwing_tick", "failed tick should be counted");
  }

  return 0;
}

int test_controller_driven_by_scheduler() {
  AgentConfig config{};
  config.tick_interval = milliseconds(20);
  auto harness = make_harness(config, {}, false, false);
  std::atomic<std::uint64_t> observed{0};
  harness.controller->set_tick_observer([&observed](const ControllerSnapshot& snapshot) { observed = snapshot.tick; });

  harness.controller->start();
  const bool progressed = wait_for([&] { return observed.load() >= 3U; });
  harness.controller->stop();

  if (!progressed) {
    return fail("test_controller_driven_by_scheduler", "scheduled ticks should run");
  }

  const ControllerSnapshot snapshot = harness.controller->snapshot();
  milliseconds sum{0};
  for (const auto duration : snapshot.report.per_stage) {
    sum += duration;
  }
  if (sum != milliseconds(20) * static_cast<long long>(snapshot.tick)) {
    return fail("test_controller_driven_by_scheduler", "every scheduled tick should be credited once");
  }
  if (harness.actuators->count("release_overrides") != 1U) {
    return fail("test_controller_driven_by_scheduler", "stop should issue baseline commands");
  }

  return 0;
}

}  // namespace

int main() {
  if (int rc = test_config_parsing(); rc != 0) return rc;
  if (int rc = test_missing_collaborator_rejected(); rc != 0) return rc;
  if (int rc = test_deep_sleep_tick_credits_deep_time(); rc != 0) return rc;
  if (int rc = test_classification_failure_retains_stage(); rc != 0) return rc;
  if (int rc = test_no_action_means_no_side_effects(); rc != 0) return rc;
  if (int rc = test_audio_nudge_dispatched_and_persisted(); rc != 0) return rc;
  if (int rc = test_persistence_failure_keeps_intervention(); rc != 0) return rc;
  if (int rc = test_stage_durations_sum_to_tick_time(); rc != 0) return rc;
  if (int rc = test_signal_unavailable_skips_classification(); rc != 0) return rc;
  if (int rc = test_stop_returns_actuators_to_baseline(); rc != 0) return rc;
  if (int rc = test_history_loaded_once_at_start(); rc != 0) return rc;
  if (int rc = test_environment_command_not_reapplied(); rc != 0) return rc;
  if (int rc = test_inactive_controller_ignores_ticks(); rc != 0) return rc;
  if (int rc = test_actuator_failure_is_isolated(); rc != 0) return rc;
  if (int rc = test_action_without_reason_is_dropped(); rc != 0) return rc;
  if (int rc = test_sink_failures_log_on_transition(); rc != 0) return rc;
  if (int rc = test_tick_observer_receives_each_snapshot(); rc != 0) return rc;
  if (int rc = test_scheduler_runs_ticks_without_overlap(); rc != 0) return rc;
  if (int rc = test_scheduler_stop_interrupts_wait(); rc != 0) return rc;
  if (int rc = test_scheduler_survives_throwing_tick(); rc != 0) return rc;
  if (int rc = test_controller_driven_by_scheduler(); rc != 0) return rc;

  std::cout << "[PASS] controller unit tests\n";
  return 0;
}
