#pragma once

#include <cstddef>
#include <optional>

#include "model/nudge_action.hpp"
#include "model/sleep_frame.hpp"

namespace sleep_agent::policy {

class DecisionPolicy {
 public:
  virtual std::optional<model::nudge_action> decide(const model::sleep_state& state,
                                                    const model::environment_snapshot& environment) = 0;
  virtual ~DecisionPolicy() = default;
};

// Narrows whatever the policy returns to actions the dispatcher can execute.
// Only actions with a non-blank UTF-8 reason and finite targets leave the adapter.
class PolicyAdapter {
 public:
  explicit PolicyAdapter(DecisionPolicy& policy) noexcept;

  std::optional<model::nudge_action> decide(const model::sleep_state& state,
                                            const model::environment_snapshot& environment) noexcept;

  [[nodiscard]] std::size_t rejected() const noexcept;
  [[nodiscard]] std::size_t errors() const noexcept;

 private:
  DecisionPolicy& policy_;
  std::size_t rejected_{0};
  std::size_t errors_{0};
};

bool has_reason(const model::nudge_action& action) noexcept;

}  // namespace sleep_agent::policy
