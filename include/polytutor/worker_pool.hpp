#pragma once

#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "polytutor/common.hpp"

namespace polytutor {

// Fixed set of threads draining a FIFO of jobs. Jobs still queued at stop()
// are dropped. Workers share the queue state, so a pool may be destroyed from
// inside one of its own jobs.
class WorkerPool {
 public:
  using Job = std::function<void()>;

  WorkerPool(std::string name, std::size_t threads) : state_(std::make_shared<State>()) {
    state_->name = std::move(name);
    state_->running.store(true);
    const std::size_t n = (std::max)(std::size_t{1}, threads);
    workers_.reserve(n);
    for (std::size_t i = 0; i < n; ++i) {
      workers_.emplace_back([state = state_]() { loop(*state); });
    }
  }

  ~WorkerPool() { stop(); }

  WorkerPool(const WorkerPool&) = delete;
  WorkerPool& operator=(const WorkerPool&) = delete;

  bool submit(Job job) {
    if (!state_->running.load()) {
      return false;
    }
    {
      std::lock_guard<std::mutex> lock(state_->mu);
      state_->jobs.push_back(std::move(job));
    }
    state_->cv.notify_one();
    return true;
  }

  std::size_t queued() const {
    std::lock_guard<std::mutex> lock(state_->mu);
    return state_->jobs.size();
  }

  std::size_t size() const { return workers_.size(); }

  void stop() {
    if (!state_->running.exchange(false)) {
      return;
    }
    state_->cv.notify_all();
    for (auto& t : workers_) {
      if (!t.joinable()) {
        continue;
      }
      if (t.get_id() == std::this_thread::get_id()) {
        t.detach();
      } else {
        t.join();
      }
    }
  }

 private:
  struct State {
    std::string name;
    std::mutex mu;
    std::condition_variable cv;
    std::deque<Job> jobs;
    std::atomic<bool> running{false};
  };

  static void loop(State& st) {
    while (true) {
      Job job;
      {
        std::unique_lock<std::mutex> lock(st.mu);
        st.cv.wait(lock, [&st]() { return !st.jobs.empty() || !st.running.load(); });
        if (!st.running.load()) {
          return;
        }
        job = std::move(st.jobs.front());
        st.jobs.pop_front();
      }

      try {
        job();
      } catch (const std::exception& e) {
        Logger::log(Logger::Level::kError, st.name + " job failed: " + e.what());
      }
    }
  }

  std::shared_ptr<State> state_;
  std::vector<std::thread> workers_;
};

}  // namespace polytutor
