#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "polytutor/common.hpp"

namespace polytutor {

// Keyed one-shot timers served by a single thread. Scheduling an existing key
// replaces its timer; a cancelled timer never fires.
class TimerService {
 public:
  using Callback = std::function<void()>;
  using Clock = std::chrono::steady_clock;

  TimerService() {
    running_.store(true);
    worker_ = std::thread([this]() { run_loop(); });
  }

  ~TimerService() { stop(); }

  TimerService(const TimerService&) = delete;
  TimerService& operator=(const TimerService&) = delete;

  void schedule(const std::string& key, std::chrono::milliseconds delay, Callback cb) {
    {
      std::lock_guard<std::mutex> lock(mu_);
      timers_[key] = Entry{Clock::now() + delay, std::move(cb)};
    }
    cv_.notify_all();
  }

  bool cancel(const std::string& key) {
    std::lock_guard<std::mutex> lock(mu_);
    const bool removed = timers_.erase(key) > 0;
    if (removed) {
      cv_.notify_all();
    }
    return removed;
  }

  bool pending(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mu_);
    return timers_.count(key) > 0;
  }

  std::size_t size() const {
    std::lock_guard<std::mutex> lock(mu_);
    return timers_.size();
  }

  void stop() {
    {
      std::lock_guard<std::mutex> lock(mu_);
      if (!running_.exchange(false)) {
        return;
      }
    }
    cv_.notify_all();
    if (worker_.joinable()) {
      worker_.join();
    }
  }

 private:
  struct Entry {
    Clock::time_point due;
    Callback cb;
  };

  void run_loop() {
    while (running_.load()) {
      std::vector<std::pair<std::string, Callback>> due;
      {
        std::unique_lock<std::mutex> lock(mu_);
        if (!running_.load()) {
          break;
        }
        Clock::time_point next_wake = Clock::now() + std::chrono::seconds(60);
        for (const auto& kv : timers_) {
          next_wake = (std::min)(next_wake, kv.second.due);
        }
        cv_.wait_until(lock, next_wake);
        if (!running_.load()) {
          break;
        }

        const auto now = Clock::now();
        for (auto it = timers_.begin(); it != timers_.end();) {
          if (it->second.due <= now) {
            due.emplace_back(it->first, std::move(it->second.cb));
            it = timers_.erase(it);
          } else {
            ++it;
          }
        }
      }

      for (auto& [key, cb] : due) {
        try {
          if (cb) {
            cb();
          }
        } catch (const std::exception& e) {
          Logger::log(Logger::Level::kError, "Timer " + key + " failed: " + e.what());
        }
      }
    }
  }

  mutable std::mutex mu_;
  std::condition_variable cv_;
  std::map<std::string, Entry> timers_;
  std::atomic<bool> running_{false};
  std::thread worker_;
};

}  // namespace polytutor
