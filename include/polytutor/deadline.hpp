#pragma once

#include <atomic>
#include <chrono>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <string>
#include <thread>
#include <type_traits>

#include "polytutor/errors.hpp"

namespace polytutor {

// Point in time after which a call's result is no longer wanted. Copies share
// one cancellation flag, so work running on another thread can observe a
// cancel() issued by the caller that gave up waiting.
class Deadline {
 public:
  using Clock = std::chrono::steady_clock;

  explicit Deadline(std::chrono::milliseconds budget)
      : budget_(budget), at_(Clock::now() + budget), cancelled_(std::make_shared<std::atomic<bool>>(false)) {}

  bool expired() const { return cancelled() || Clock::now() >= at_; }

  std::chrono::milliseconds remaining() const {
    const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(at_ - Clock::now());
    return left.count() > 0 ? left : std::chrono::milliseconds(0);
  }

  std::chrono::milliseconds budget() const { return budget_; }
  Clock::time_point at() const { return at_; }

  void cancel() const { cancelled_->store(true); }
  bool cancelled() const { return cancelled_->load(); }

 private:
  std::chrono::milliseconds budget_;
  Clock::time_point at_;
  std::shared_ptr<std::atomic<bool>> cancelled_;
};

// Runs fn(deadline) on its own thread and waits at most until the deadline.
// The first outcome wins: if the deadline passes first the token is cancelled
// and a Timeout error is raised; whatever fn produces afterwards is discarded.
template <typename Fn>
auto run_with_deadline(Fn fn, const Deadline& deadline, const std::string& what, const std::string& message_id = "")
    -> decltype(fn(deadline)) {
  using Result = decltype(fn(deadline));
  auto promise = std::make_shared<std::promise<Result>>();
  std::future<Result> fut = promise->get_future();

  std::thread([promise, fn = std::move(fn), deadline]() mutable {
    try {
      if constexpr (std::is_void_v<Result>) {
        fn(deadline);
        promise->set_value();
      } else {
        promise->set_value(fn(deadline));
      }
    } catch (...) {
      promise->set_exception(std::current_exception());
    }
  }).detach();

  if (fut.wait_until(deadline.at()) != std::future_status::ready) {
    deadline.cancel();
    throw AgentError(ErrorCode::kTimeout,
                     what + " timed out after " + std::to_string(deadline.budget().count()) + "ms", message_id);
  }
  return fut.get();
}

}  // namespace polytutor
