#include "model/quick_action.hpp"

#include <cmath>
#include <string>
#include <type_traits>
#include <utility>

#include <nlohmann/json.hpp>

namespace sleep_agent::model {
namespace {

std::optional<double> read_target(const nlohmann::json& details) {
  const auto it = details.find("target");
  if (it == details.end() || !it->is_number()) {
    return std::nullopt;
  }
  const double target = it->get<double>();
  if (!std::isfinite(target)) {
    return std::nullopt;
  }
  return target;
}

std::optional<std::string> read_string(const nlohmann::json& object, const char* key) {
  const auto it = object.find(key);
  if (it == object.end() || !it->is_string()) {
    return std::nullopt;
  }
  return it->get<std::string>();
}

}  // namespace

quick_action make_quick_action(const nudge_action& action, const std::uint64_t timestamp_ms) {
  quick_action record{};
  record.timestamp_ms = timestamp_ms;
  record.action_type = std::string(action_type(action.payload));
  record.action_details = serialize_details(action.payload);
  record.reason = action.reason;
  return record;
}

std::string serialize_details(const nudge_payload& payload) {
  nlohmann::json details = nlohmann::json::object();
  std::visit(
      [&details](const auto& nudge) {
        details["kind"] = std::string(kind_name(nudge.kind));
        using Nudge = std::decay_t<decltype(nudge)>;
        if constexpr (std::is_same_v<Nudge, environment_nudge> || std::is_same_v<Nudge, bed_motor_nudge>) {
          details["target"] = nudge.target;
        }
      },
      payload);
  return details.dump();
}

std::optional<nudge_payload> parse_details(const std::string_view action_type, const std::string_view details) {
  const auto parsed = nlohmann::json::parse(details.begin(), details.end(), nullptr, false);
  if (parsed.is_discarded() || !parsed.is_object()) {
    return std::nullopt;
  }

  const auto kind = read_string(parsed, "kind");
  if (!kind.has_value()) {
    return std::nullopt;
  }

  if (action_type == "audio") {
    if (const auto audio = parse_audio_kind(*kind)) {
      return audio_nudge{*audio};
    }
    return std::nullopt;
  }

  if (action_type == "haptic") {
    if (const auto haptic = parse_haptic_kind(*kind)) {
      return haptic_nudge{*haptic};
    }
    return std::nullopt;
  }

  if (action_type == "environment") {
    const auto environment = parse_environment_kind(*kind);
    const auto target = read_target(parsed);
    if (environment.has_value() && target.has_value()) {
      return environment_nudge{*environment, *target};
    }
    return std::nullopt;
  }

  if (action_type == "bed_motor") {
    const auto bed = parse_bed_motor_kind(*kind);
    const auto target = read_target(parsed);
    if (bed.has_value() && target.has_value()) {
      return bed_motor_nudge{*bed, *target};
    }
    return std::nullopt;
  }

  return std::nullopt;
}

std::string to_json_line(const quick_action& action) {
  const nlohmann::json record = {
      {"timestamp_ms", action.timestamp_ms},
      {"action_type", action.action_type},
      {"action_details", action.action_details},
      {"reason", action.reason},
  };
  return record.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::optional<quick_action> parse_quick_action(const std::string_view line) {
  const auto parsed = nlohmann::json::parse(line.begin(), line.end(), nullptr, false);
  if (parsed.is_discarded() || !parsed.is_object()) {
    return std::nullopt;
  }

  const auto timestamp_it = parsed.find("timestamp_ms");
  if (timestamp_it == parsed.end() || !timestamp_it->is_number_unsigned()) {
    return std::nullopt;
  }

  auto type = read_string(parsed, "action_type");
  auto details = read_string(parsed, "action_details");
  auto reason = read_string(parsed, "reason");
  if (!type.has_value() || !details.has_value() || !reason.has_value() || reason->empty()) {
    return std::nullopt;
  }

  if (!parse_details(*type, *details).has_value()) {
    return std::nullopt;
  }

  quick_action record{};
  record.timestamp_ms = timestamp_it->get<std::uint64_t>();
  record.action_type = std::move(*type);
  record.action_details = std::move(*details);
  record.reason = std::move(*reason);
  return record;
}

}  // namespace sleep_agent::model
