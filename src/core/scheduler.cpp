#include "core/scheduler.hpp"

#include <exception>
#include <iostream>
#include <utility>

namespace sleep_agent::core {

TickScheduler::TickScheduler(const std::chrono::milliseconds period)
    : period_(period.count() > 0 ? period : std::chrono::milliseconds(1)) {}

TickScheduler::~TickScheduler() {
  stop();
  join_worker();
}

bool TickScheduler::start(TickFn tick) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (running_) {
      return false;
    }
  }

  join_worker();

  std::lock_guard<std::mutex> lock(mutex_);
  tick_ = std::move(tick);
  stop_requested_ = false;
  running_ = true;
  worker_ = std::thread([this] { run_loop(); });
  return true;
}

void TickScheduler::stop() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stop_requested_ = true;
  }
  wake_.notify_all();

  if (worker_.joinable() && worker_.get_id() == std::this_thread::get_id()) {
    return;
  }
  join_worker();
}

bool TickScheduler::running() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return running_;
}

SchedulerStats TickScheduler::stats() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return stats_;
}

std::chrono::milliseconds TickScheduler::period() const noexcept { return period_; }

void TickScheduler::join_worker() {
  if (worker_.joinable() && worker_.get_id() != std::this_thread::get_id()) {
    worker_.join();
  }
}

void TickScheduler::run_loop() {
  auto next_wakeup = std::chrono::steady_clock::now() + period_;

  while (true) {
    {
      std::unique_lock<std::mutex> lock(mutex_);
      if (wake_.wait_until(lock, next_wakeup, [this] { return stop_requested_; })) {
        break;
      }
    }

    bool failed = false;
    try {
      tick_();
    } catch (const std::exception& ex) {
      failed = true;
      std::cerr << "[scheduler] tick failed: " << ex.what() << '\n';
    }

    next_wakeup += period_;
    const auto now = std::chrono::steady_clock::now();
    std::size_t skipped = 0;
    if (now > next_wakeup) {
      skipped = static_cast<std::size_t>((now - next_wakeup) / period_) + 1;
      next_wakeup += period_ * static_cast<long long>(skipped);
      std::cerr << "[scheduler] tick overran its period; skipped " << skipped << " tick(s)\n";
    }

    std::lock_guard<std::mutex> lock(mutex_);
    ++stats_.ticks_executed;
    stats_.missed_cycles += skipped;
    if (failed) {
      ++stats_.failed_ticks;
    }
  }

  std::lock_guard<std::mutex> lock(mutex_);
  running_ = false;
}

}  // namespace sleep_agent::core
