#pragma once

#include <memory>
#include <string>
#include <vector>

#include "redis/connection.hpp"
#include "store/history_store.hpp"

namespace sleep_agent::store {

// Records are JSON strings in a Redis list, oldest at the head.
class RedisHistoryStore final : public HistoryStore {
 public:
  RedisHistoryStore(std::shared_ptr<redis::Connection> connection, std::string key);

  bool save(const model::quick_action& action) override;
  bool load_all(std::vector<model::quick_action>& out) override;

  [[nodiscard]] const std::string& key() const noexcept;

 private:
  redis::Reply run(const std::vector<std::string>& args);

  std::shared_ptr<redis::Connection> connection_;
  std::string key_;
};

}  // namespace sleep_agent::store
