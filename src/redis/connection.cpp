#include "redis/connection.hpp"

#include <iostream>
#include <utility>

#include <hiredis/hiredis.h>

namespace sleep_agent::redis {

void ReplyDeleter::operator()(redisReply* reply) const {
  if (reply != nullptr) {
    freeReplyObject(reply);
  }
}

bool is_error(const redisReply* reply) noexcept { return reply == nullptr || reply->type == REDIS_REPLY_ERROR; }

Connection::Connection(ConnectionOptions options) : options_(std::move(options)) {}

Connection::~Connection() = default;

Connection::Connection(Connection&&) noexcept = default;
Connection& Connection::operator=(Connection&&) noexcept = default;

void Connection::ContextDeleter::operator()(redisContext* context) const {
  if (context != nullptr) {
    redisFree(context);
  }
}

const ConnectionOptions& Connection::options() const noexcept { return options_; }

std::string Connection::endpoint() const {
  if (!options_.unix_socket.empty()) {
    return "unix://" + options_.unix_socket;
  }
  return options_.host + ':' + std::to_string(options_.port);
}

bool Connection::ensure_connected() {
  if (context_ != nullptr && context_->err == REDIS_OK) {
    return true;
  }
  return reconnect();
}

bool Connection::reconnect() {
  context_.reset();

  timeval timeout{};
  timeout.tv_sec = static_cast<time_t>(options_.connect_timeout_ms / 1000);
  timeout.tv_usec = static_cast<suseconds_t>((options_.connect_timeout_ms % 1000) * 1000);

  redisContext* raw = nullptr;
  if (!options_.unix_socket.empty()) {
    raw = redisConnectUnixWithTimeout(options_.unix_socket.c_str(), timeout);
  } else {
    raw = redisConnectWithTimeout(options_.host.c_str(), static_cast<int>(options_.port), timeout);
  }
  if (raw == nullptr || raw->err != REDIS_OK) {
    if (raw != nullptr) {
      std::cerr << "[redis] connect failed: " << raw->errstr << '\n';
      redisFree(raw);
    } else {
      std::cerr << "[redis] connect failed: out of memory\n";
    }
    return false;
  }

  context_.reset(raw);
  if (!authenticate() || !select_db()) {
    context_.reset();
    return false;
  }
  return true;
}

Reply Connection::command(const std::vector<std::string>& args) {
  if (!ensure_connected()) {
    return nullptr;
  }

  command_argv_.clear();
  command_argv_len_.clear();
  for (const auto& arg : args) {
    command_argv_.push_back(arg.c_str());
    command_argv_len_.push_back(arg.size());
  }

  auto* reply = static_cast<redisReply*>(redisCommandArgv(context_.get(), static_cast<int>(command_argv_.size()),
                                                          command_argv_.data(), command_argv_len_.data()));
  if (reply == nullptr) {
    context_.reset();
  }
  return Reply(reply);
}

bool Connection::authenticate() {
  if (options_.password.empty()) {
    return true;
  }

  const char* argv[] = {"AUTH", options_.password.c_str()};
  const std::size_t argv_len[] = {4, options_.password.size()};
  Reply reply(static_cast<redisReply*>(redisCommandArgv(context_.get(), 2, argv, argv_len)));
  if (is_error(reply.get())) {
    std::cerr << "[redis] AUTH rejected\n";
    return false;
  }
  return true;
}

bool Connection::select_db() {
  if (options_.db == 0) {
    return true;
  }

  const std::string db = std::to_string(options_.db);
  const char* argv[] = {"SELECT", db.c_str()};
  const std::size_t argv_len[] = {6, db.size()};
  Reply reply(static_cast<redisReply*>(redisCommandArgv(context_.get(), 2, argv, argv_len)));
  if (is_error(reply.get())) {
    std::cerr << "[redis] SELECT " << options_.db << " rejected\n";
    return false;
  }
  return true;
}

}  // namespace sleep_agent::redis
