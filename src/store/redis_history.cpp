#include "store/redis_history.hpp"

#include <cstddef>
#include <iostream>
#include <string_view>
#include <utility>

#include <hiredis/hiredis.h>

namespace sleep_agent::store {

RedisHistoryStore::RedisHistoryStore(std::shared_ptr<redis::Connection> connection, std::string key)
    : connection_(std::move(connection)), key_(std::move(key)) {}

const std::string& RedisHistoryStore::key() const noexcept { return key_; }

bool RedisHistoryStore::save(const model::quick_action& action) {
  const auto reply = run({"RPUSH", key_, model::to_json_line(action)});
  if (reply == nullptr) {
    return false;
  }
  if (reply->type != REDIS_REPLY_INTEGER) {
    std::cerr << "[history] RPUSH " << key_ << " rejected: " << (reply->str != nullptr ? reply->str : "unexpected reply")
              << '\n';
    return false;
  }
  return true;
}

bool RedisHistoryStore::load_all(std::vector<model::quick_action>& out) {
  const auto reply = run({"LRANGE", key_, "0", "-1"});
  if (reply == nullptr) {
    return false;
  }
  if (reply->type != REDIS_REPLY_ARRAY) {
    std::cerr << "[history] LRANGE " << key_ << " rejected: "
              << (reply->str != nullptr ? reply->str : "unexpected reply") << '\n';
    return false;
  }

  std::size_t skipped = 0;
  for (std::size_t i = 0; i < reply->elements; ++i) {
    const redisReply* element = reply->element[i];
    if (element == nullptr || element->type != REDIS_REPLY_STRING || element->str == nullptr) {
      ++skipped;
      continue;
    }
    auto record = model::parse_quick_action(std::string_view(element->str, element->len));
    if (!record.has_value()) {
      ++skipped;
      continue;
    }
    out.push_back(std::move(*record));
  }

  if (skipped > 0) {
    std::cerr << "[history] skipped " << skipped << " malformed record(s) in " << key_ << '\n';
  }
  return true;
}

// One reconnect-and-retry when the link drops mid-command.
redis::Reply RedisHistoryStore::run(const std::vector<std::string>& args) {
  auto reply = connection_->command(args);
  if (reply != nullptr) {
    return reply;
  }
  if (!connection_->reconnect()) {
    return nullptr;
  }
  return connection_->command(args);
}

}  // namespace sleep_agent::store
