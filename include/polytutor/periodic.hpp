#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

#include "polytutor/common.hpp"

namespace polytutor {

inline constexpr int kDefaultHealthCheckIntervalSec = 30;

// Calls a callback every interval on a dedicated thread until stopped.
class PeriodicTask {
 public:
  using Callback = std::function<void()>;

  PeriodicTask(std::string name, std::chrono::milliseconds interval, Callback cb)
      : name_(std::move(name)), interval_(interval), cb_(std::move(cb)) {}

  ~PeriodicTask() { stop(); }

  PeriodicTask(const PeriodicTask&) = delete;
  PeriodicTask& operator=(const PeriodicTask&) = delete;

  void start() {
    if (running_.exchange(true)) {
      return;
    }
    worker_ = std::thread([this]() { loop(); });
  }

  void stop() {
    {
      std::lock_guard<std::mutex> lock(wait_mu_);
      if (!running_.exchange(false)) {
        return;
      }
    }
    cv_.notify_all();
    if (worker_.joinable()) {
      worker_.join();
    }
  }

  bool running() const { return running_.load(); }

 private:
  void loop() {
    while (running_.load()) {
      std::unique_lock<std::mutex> lock(wait_mu_);
      const bool stopped = cv_.wait_for(lock, interval_, [this]() { return !running_.load(); });
      lock.unlock();

      if (stopped || !running_.load()) {
        break;
      }

      try {
        if (cb_) {
          cb_();
        }
      } catch (const std::exception& e) {
        Logger::log(Logger::Level::kError, name_ + " tick failed: " + e.what());
      }
    }
  }

  std::string name_;
  std::chrono::milliseconds interval_;
  Callback cb_;
  std::atomic<bool> running_{false};
  std::thread worker_;
  std::mutex wait_mu_;
  std::condition_variable cv_;
};

}  // namespace polytutor
