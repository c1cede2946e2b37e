#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace sleep_agent::model {

enum class audio_kind : std::uint8_t {
    PINK_NOISE = 0,
    ISOCHRONIC_TONES = 1,
    BINAURAL_BEATS = 2,
    NATURE_SOUNDS = 3,
};

enum class haptic_kind : std::uint8_t {
    GENTLE_PULSE = 0,
    STRONG_PULSE = 1,
};

enum class environment_kind : std::uint8_t {
    LOWER_TEMPERATURE = 0,
    RAISE_HUMIDITY = 1,
    DIM_LIGHTS = 2,
    CLOSE_BLINDS = 3,
    START_HEPA_FILTER = 4,
    STOP_HEPA_FILTER = 5,
};

enum class bed_motor_kind : std::uint8_t {
    ADJUST_HEAD = 0,
    ADJUST_FOOT = 1,
    START_MASSAGE = 2,
    STOP_MASSAGE = 3,
};

struct audio_nudge {
    audio_kind kind{audio_kind::PINK_NOISE};

    bool operator==(const audio_nudge&) const = default;
};

struct haptic_nudge {
    haptic_kind kind{haptic_kind::GENTLE_PULSE};

    bool operator==(const haptic_nudge&) const = default;
};

struct environment_nudge {
    environment_kind kind{environment_kind::LOWER_TEMPERATURE};
    double target{0.0};

    bool operator==(const environment_nudge&) const = default;
};

// target is elevation for head/foot and intensity for massage.
struct bed_motor_nudge {
    bed_motor_kind kind{bed_motor_kind::ADJUST_HEAD};
    double target{0.0};

    bool operator==(const bed_motor_nudge&) const = default;
};

using nudge_payload = std::variant<audio_nudge, haptic_nudge, environment_nudge, bed_motor_nudge>;

struct nudge_action {
    nudge_payload payload{};
    std::string reason{};

    bool operator==(const nudge_action&) const = default;
};

inline constexpr float kGentlePulseIntensity = 0.3F;
inline constexpr float kStrongPulseIntensity = 0.7F;

std::string_view action_type(const nudge_payload& payload) noexcept;

std::string_view kind_name(audio_kind kind) noexcept;
std::string_view kind_name(haptic_kind kind) noexcept;
std::string_view kind_name(environment_kind kind) noexcept;
std::string_view kind_name(bed_motor_kind kind) noexcept;

std::optional<audio_kind> parse_audio_kind(std::string_view name) noexcept;
std::optional<haptic_kind> parse_haptic_kind(std::string_view name) noexcept;
std::optional<environment_kind> parse_environment_kind(std::string_view name) noexcept;
std::optional<bed_motor_kind> parse_bed_motor_kind(std::string_view name) noexcept;

// Short "domain:kind[=target]" form used in log lines.
std::string describe(const nudge_payload& payload);

}  // namespace sleep_agent::model
