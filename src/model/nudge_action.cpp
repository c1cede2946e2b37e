#include "model/nudge_action.hpp"

#include <array>
#include <cstddef>
#include <sstream>
#include <type_traits>
#include <utility>

namespace sleep_agent::model {
namespace {

constexpr std::array<std::string_view, 4> kAudioNames = {"pink_noise", "isochronic_tones", "binaural_beats",
                                                         "nature_sounds"};
constexpr std::array<std::string_view, 2> kHapticNames = {"gentle_pulse", "strong_pulse"};
constexpr std::array<std::string_view, 6> kEnvironmentNames = {"lower_temperature", "raise_humidity", "dim_lights",
                                                               "close_blinds",      "start_hepa_filter",
                                                               "stop_hepa_filter"};
constexpr std::array<std::string_view, 4> kBedMotorNames = {"adjust_head", "adjust_foot", "start_massage",
                                                            "stop_massage"};

template <typename Kind, std::size_t N>
std::optional<Kind> parse_kind(const std::array<std::string_view, N>& names, const std::string_view name) noexcept {
  for (std::size_t i = 0; i < N; ++i) {
    if (names[i] == name) {
      return static_cast<Kind>(i);
    }
  }
  return std::nullopt;
}

template <std::size_t N, typename Kind>
std::string_view name_of(const std::array<std::string_view, N>& names, const Kind kind) noexcept {
  const auto index = static_cast<std::size_t>(kind);
  return index < N ? names[index] : std::string_view{"unknown"};
}

struct ActionTypeVisitor {
  std::string_view operator()(const audio_nudge&) const noexcept { return "audio"; }
  std::string_view operator()(const haptic_nudge&) const noexcept { return "haptic"; }
  std::string_view operator()(const environment_nudge&) const noexcept { return "environment"; }
  std::string_view operator()(const bed_motor_nudge&) const noexcept { return "bed_motor"; }
};

}  // namespace

std::string_view action_type(const nudge_payload& payload) noexcept {
  return std::visit(ActionTypeVisitor{}, payload);
}

std::string_view kind_name(const audio_kind kind) noexcept { return name_of(kAudioNames, kind); }
std::string_view kind_name(const haptic_kind kind) noexcept { return name_of(kHapticNames, kind); }
std::string_view kind_name(const environment_kind kind) noexcept { return name_of(kEnvironmentNames, kind); }
std::string_view kind_name(const bed_motor_kind kind) noexcept { return name_of(kBedMotorNames, kind); }

std::optional<audio_kind> parse_audio_kind(const std::string_view name) noexcept {
  return parse_kind<audio_kind>(kAudioNames, name);
}

std::optional<haptic_kind> parse_haptic_kind(const std::string_view name) noexcept {
  return parse_kind<haptic_kind>(kHapticNames, name);
}

std::optional<environment_kind> parse_environment_kind(const std::string_view name) noexcept {
  return parse_kind<environment_kind>(kEnvironmentNames, name);
}

std::optional<bed_motor_kind> parse_bed_motor_kind(const std::string_view name) noexcept {
  return parse_kind<bed_motor_kind>(kBedMotorNames, name);
}

std::string describe(const nudge_payload& payload) {
  std::ostringstream out;
  out << action_type(payload) << ':';
  std::visit(
      [&out](const auto& nudge) {
        out << kind_name(nudge.kind);
        using Nudge = std::decay_t<decltype(nudge)>;
        if constexpr (std::is_same_v<Nudge, environment_nudge> || std::is_same_v<Nudge, bed_motor_nudge>) {
          out << '=' << nudge.target;
        }
      },
      payload);
  return out.str();
}

}  // namespace sleep_agent::model
