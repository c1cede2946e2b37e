#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

struct redisContext;
struct redisReply;

namespace sleep_agent::redis {

struct ConnectionOptions {
  std::string host{"127.0.0.1"};
  std::uint16_t port{6379};
  std::string unix_socket{};
  std::string password{};
  int db{0};
  std::uint32_t connect_timeout_ms{1000};
};

struct ReplyDeleter {
  void operator()(redisReply* reply) const;
};

using Reply = std::unique_ptr<redisReply, ReplyDeleter>;

// Lazily connected hiredis context shared by the store, the command bus and the
// time-series sink. A failed command drops the context so the next call reconnects.
class Connection {
 public:
  explicit Connection(ConnectionOptions options = {});
  ~Connection();

  Connection(const Connection&) = delete;
  Connection& operator=(const Connection&) = delete;
  Connection(Connection&&) noexcept;
  Connection& operator=(Connection&&) noexcept;

  bool ensure_connected();
  bool reconnect();

  // Null on I/O failure. Error replies are returned to the caller.
  Reply command(const std::vector<std::string>& args);

  [[nodiscard]] const ConnectionOptions& options() const noexcept;
  [[nodiscard]] std::string endpoint() const;

 private:
  struct ContextDeleter {
    void operator()(redisContext* context) const;
  };

  bool authenticate();
  bool select_db();

  ConnectionOptions options_;
  std::unique_ptr<redisContext, ContextDeleter> context_;
  std::vector<const char*> command_argv_;
  std::vector<std::size_t> command_argv_len_;
};

bool is_error(const redisReply* reply) noexcept;

}  // namespace sleep_agent::redis
