#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "model/nudge_action.hpp"

namespace sleep_agent::model {

// Durable record of one dispatched nudge. Immutable once created.
struct quick_action {
  std::uint64_t timestamp_ms{0};
  std::string action_type{};
  std::string action_details{};
  std::string reason{};

  bool operator==(const quick_action&) const = default;
};

quick_action make_quick_action(const nudge_action& action, std::uint64_t timestamp_ms);

// JSON object text for the payload, e.g. {"kind":"dim_lights","target":0.05}.
std::string serialize_details(const nudge_payload& payload);

std::optional<nudge_payload> parse_details(std::string_view action_type, std::string_view details);

std::string to_json_line(const quick_action& action);

// Rejects records with missing fields, an unknown action type or undecodable details.
std::optional<quick_action> parse_quick_action(std::string_view line);

}  // namespace sleep_agent::model
