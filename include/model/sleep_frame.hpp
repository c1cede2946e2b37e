#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string_view>
#include <type_traits>

namespace sleep_agent::model {

enum class sleep_stage : std::uint8_t {
    AWAKE = 0,
    LIGHT = 1,
    DEEP = 2,
    REM = 3,
    UNKNOWN = 4,
};

inline constexpr std::size_t kSleepStageCount = 5;

inline constexpr std::array<sleep_stage, kSleepStageCount> kAllSleepStages = {
    sleep_stage::AWAKE, sleep_stage::LIGHT, sleep_stage::DEEP, sleep_stage::REM, sleep_stage::UNKNOWN,
};

constexpr std::size_t stage_index(const sleep_stage stage) noexcept {
    return static_cast<std::size_t>(stage);
}

constexpr std::string_view stage_name(const sleep_stage stage) noexcept {
    switch (stage) {
        case sleep_stage::AWAKE:
            return "awake";
        case sleep_stage::LIGHT:
            return "light";
        case sleep_stage::DEEP:
            return "deep";
        case sleep_stage::REM:
            return "rem";
        case sleep_stage::UNKNOWN:
            break;
    }
    return "unknown";
}

struct vital_signs {
    double heart_rate;
    double hrv;
    double spo2;
    double body_temperature;
    double movement;
    double respiratory_rate;
};

struct environment_snapshot {
    double temperature;
    double humidity;
    double noise_level;  // 0..1
    double light_level;  // 0..1
    double bed_incline;
    double air_quality;  // 0..1
};

struct sleep_state {
    sleep_stage stage;
    double hrv;
    double heart_rate;
    double time_in_stage_s;
};

// Per-tick record handed to sinks.
// Trivial layout: timestamps, the tick's inputs, then classification and health.
struct sleep_frame {
    struct AgentHealth {
        std::uint64_t heartbeat_ms;
        float loop_jitter_ms;
        float compute_time_ms;
        float redis_latency_ms;
        std::uint32_t signal_failures;
        std::uint32_t classification_failures;
        std::uint32_t dispatch_failures;
        std::uint32_t persistence_failures;
        std::uint32_t sink_errors;
        std::uint32_t missed_cycles;
    };

    std::uint64_t timestamp_ms;
    std::uint64_t monotonic_ns;
    std::uint64_t tick;

    vital_signs vitals;
    environment_snapshot environment;
    bool vitals_valid;
    bool environment_valid;

    sleep_stage stage;
    double stage_confidence;
    double time_in_stage_s;
    double quality_score;
    double deep_pct;
    double rem_pct;
    bool nudged;

    AgentHealth agent;
};

static_assert(std::is_standard_layout_v<sleep_frame>, "sleep_frame must be standard layout");
static_assert(std::is_trivial_v<sleep_frame>, "sleep_frame must be trivial");

}  // namespace sleep_agent::model
