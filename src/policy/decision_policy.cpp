#include "policy/decision_policy.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <iostream>
#include <string>
#include <type_traits>
#include <variant>

namespace sleep_agent::policy {
namespace {

bool has_finite_target(const model::nudge_payload& payload) noexcept {
  return std::visit(
      [](const auto& nudge) {
        using Nudge = std::decay_t<decltype(nudge)>;
        if constexpr (std::is_same_v<Nudge, model::environment_nudge> ||
                      std::is_same_v<Nudge, model::bed_motor_nudge>) {
          return std::isfinite(nudge.target);
        } else {
          return true;
        }
      },
      payload);
}

// Rejects overlong forms, surrogates and code points above U+10FFFF.
bool is_valid_utf8(const std::string& text) noexcept {
  std::size_t i = 0;
  while (i < text.size()) {
    const auto lead = static_cast<unsigned char>(text[i]);
    std::size_t length = 0;
    std::uint32_t code_point = 0;
    if (lead < 0x80) {
      ++i;
      continue;
    }
    if ((lead & 0xE0U) == 0xC0U) {
      length = 2;
      code_point = lead & 0x1FU;
    } else if ((lead & 0xF0U) == 0xE0U) {
      length = 3;
      code_point = lead & 0x0FU;
    } else if ((lead & 0xF8U) == 0xF0U) {
      length = 4;
      code_point = lead & 0x07U;
    } else {
      return false;
    }
    if (i + length > text.size()) {
      return false;
    }
    for (std::size_t k = 1; k < length; ++k) {
      const auto next = static_cast<unsigned char>(text[i + k]);
      if ((next & 0xC0U) != 0x80U) {
        return false;
      }
      code_point = (code_point << 6U) | (next & 0x3FU);
    }
    constexpr std::uint32_t kMinimum[] = {0, 0, 0x80, 0x800, 0x10000};
    if (code_point < kMinimum[length] || code_point > 0x10FFFF || (code_point >= 0xD800 && code_point <= 0xDFFF)) {
      return false;
    }
    i += length;
  }
  return true;
}

}  // namespace

bool has_reason(const model::nudge_action& action) noexcept {
  return std::any_of(action.reason.begin(), action.reason.end(),
                     [](unsigned char c) { return std::isspace(c) == 0; });
}

PolicyAdapter::PolicyAdapter(DecisionPolicy& policy) noexcept : policy_(policy) {}

std::optional<model::nudge_action> PolicyAdapter::decide(const model::sleep_state& state,
                                                         const model::environment_snapshot& environment) noexcept {
  std::optional<model::nudge_action> action;
  try {
    action = policy_.decide(state, environment);
  } catch (const std::exception& ex) {
    ++errors_;
    std::cerr << "[policy] decision failed: " << ex.what() << '\n';
    return std::nullopt;
  }

  if (!action.has_value()) {
    return std::nullopt;
  }

  if (!has_reason(*action)) {
    ++rejected_;
    std::cerr << "[policy] rejected " << model::describe(action->payload) << ": missing reason\n";
    return std::nullopt;
  }

  if (!is_valid_utf8(action->reason)) {
    ++rejected_;
    std::cerr << "[policy] rejected " << model::describe(action->payload) << ": reason is not valid UTF-8\n";
    return std::nullopt;
  }

  if (!has_finite_target(action->payload)) {
    ++rejected_;
    std::cerr << "[policy] rejected " << model::action_type(action->payload) << " action: non-finite target\n";
    return std::nullopt;
  }

  return action;
}

std::size_t PolicyAdapter::rejected() const noexcept { return rejected_; }

std::size_t PolicyAdapter::errors() const noexcept { return errors_; }

}  // namespace sleep_agent::policy
