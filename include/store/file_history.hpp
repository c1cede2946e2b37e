#pragma once

#include <string>
#include <vector>

#include "store/history_store.hpp"

namespace sleep_agent::store {

// One JSON object per line, appended and flushed on every save.
class FileHistoryStore final : public HistoryStore {
 public:
  explicit FileHistoryStore(std::string path);

  bool save(const model::quick_action& action) override;
  bool load_all(std::vector<model::quick_action>& out) override;

  [[nodiscard]] const std::string& path() const noexcept;

 private:
  std::string path_;
};

}  // namespace sleep_agent::store
