#pragma once

#include <vector>

#include "model/quick_action.hpp"

namespace sleep_agent::store {

class HistoryStore {
 public:
  virtual bool save(const model::quick_action& action) = 0;
  // Appends every persisted record to out, oldest first.
  virtual bool load_all(std::vector<model::quick_action>& out) = 0;
  virtual ~HistoryStore() = default;
};

}  // namespace sleep_agent::store
