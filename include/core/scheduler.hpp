#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <thread>

namespace sleep_agent::core {

struct SchedulerStats {
  std::size_t ticks_executed{0};
  std::size_t missed_cycles{0};
  std::size_t failed_ticks{0};
};

// Runs one tick per period on a single worker thread. The first tick is due one
// period after start(). A tick that overruns its slot causes the slots it covered
// to be skipped, never queued, so ticks cannot overlap.
class TickScheduler {
 public:
  using TickFn = std::function<void()>;

  explicit TickScheduler(std::chrono::milliseconds period);
  ~TickScheduler();

  TickScheduler(const TickScheduler&) = delete;
  TickScheduler& operator=(const TickScheduler&) = delete;
  TickScheduler(TickScheduler&&) = delete;
  TickScheduler& operator=(TickScheduler&&) = delete;

  // False if already running.
  bool start(TickFn tick);

  // Cancels the pending wait, lets an in-flight tick finish, then joins.
  // Called from inside a tick it only prevents further ticks.
  void stop();

  [[nodiscard]] bool running() const;
  [[nodiscard]] SchedulerStats stats() const;
  [[nodiscard]] std::chrono::milliseconds period() const noexcept;

 private:
  void run_loop();
  void join_worker();

  const std::chrono::milliseconds period_;
  TickFn tick_{};
  mutable std::mutex mutex_;
  std::condition_variable wake_;
  bool stop_requested_{false};
  bool running_{false};
  SchedulerStats stats_{};
  std::thread worker_{};
};

}  // namespace sleep_agent::core
