#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include "polytutor/common.hpp"
#include "polytutor/errors.hpp"
#include "polytutor/events.hpp"
#include "polytutor/message.hpp"

namespace polytutor {

inline constexpr std::size_t kDefaultDeadLetterCapacity = 1000;

struct DeadLetter {
  AgentMessage message;
  std::string reason;
  std::string at{now_iso8601()};
};

struct BusStats {
  std::size_t queue_size{0};
  std::size_t subscriber_count{0};
  std::size_t dead_letter_count{0};
  uint64_t delivered{0};
  uint64_t dead_lettered{0};
  uint64_t delivery_failures{0};
  uint64_t broadcasts{0};

  json to_json() const {
    return json{{"queueSize", queue_size},
                {"subscribers", subscriber_count},
                {"deadLetters", dead_letter_count},
                {"delivered", delivered},
                {"deadLettered", dead_lettered},
                {"deliveryFailures", delivery_failures},
                {"broadcasts", broadcasts}};
  }
};

// Typed router between agent types. route() and broadcast() only enqueue; a
// single dispatcher thread drains the queue in FIFO order and invokes handlers
// outside the subscriber lock. Delivery is never retried.
class MessageBus {
 public:
  using Handler = std::function<void(const AgentMessage&)>;
  using HandlerId = uint64_t;

  explicit MessageBus(EventHub* events = nullptr, std::size_t dead_letter_capacity = kDefaultDeadLetterCapacity)
      : events_(events), dead_letter_capacity_((std::max)(std::size_t{1}, dead_letter_capacity)) {
    running_.store(true);
    dispatcher_ = std::thread([this]() { run_loop(); });
  }

  ~MessageBus() { stop(); }

  MessageBus(const MessageBus&) = delete;
  MessageBus& operator=(const MessageBus&) = delete;

  HandlerId subscribe(AgentType type, Handler handler) {
    std::lock_guard<std::mutex> lock(sub_mu_);
    const HandlerId id = ++next_handler_id_;
    subscribers_[type].push_back(Subscription{id, std::move(handler)});
    return id;
  }

  // Unknown (type, id) pairs are ignored.
  void unsubscribe(AgentType type, HandlerId id) {
    std::lock_guard<std::mutex> lock(sub_mu_);
    auto it = subscribers_.find(type);
    if (it == subscribers_.end()) {
      return;
    }
    auto& v = it->second;
    v.erase(std::remove_if(v.begin(), v.end(), [id](const Subscription& s) { return s.id == id; }), v.end());
    if (v.empty()) {
      subscribers_.erase(it);
    }
  }

  bool has_subscriber(AgentType type) const {
    std::lock_guard<std::mutex> lock(sub_mu_);
    auto it = subscribers_.find(type);
    return it != subscribers_.end() && !it->second.empty();
  }

  void route(const AgentMessage& msg) {
    validate(msg);
    if (!recipient_allowed(msg)) {
      Logger::log(Logger::Level::kWarn, std::string("Routing ") + message_type_name(msg.type) + " to " +
                                            agent_type_name(msg.recipient) + " is not declared in the routing table");
    }
    enqueue(Pending{msg, false});
  }

  void broadcast(const AgentMessage& msg) {
    validate(msg);
    enqueue(Pending{msg, true});
  }

  void setup_routing(MessageType type, const std::vector<AgentType>& allowed) {
    std::lock_guard<std::mutex> lock(sub_mu_);
    routing_[type] = std::set<AgentType>(allowed.begin(), allowed.end());
  }

  // Lists inconsistencies between the routing table and the live subscribers.
  std::vector<std::string> validate_routing() const {
    std::lock_guard<std::mutex> lock(sub_mu_);
    std::vector<std::string> problems;
    std::set<AgentType> declared;
    for (const auto& kv : routing_) {
      for (const AgentType t : kv.second) {
        declared.insert(t);
        auto it = subscribers_.find(t);
        if (it == subscribers_.end() || it->second.empty()) {
          problems.push_back(std::string(message_type_name(kv.first)) + " declares " + agent_type_name(t) +
                             " but it has no subscriber");
        }
      }
    }
    for (const auto& kv : subscribers_) {
      if (!kv.second.empty() && declared.count(kv.first) == 0) {
        problems.push_back(std::string(agent_type_name(kv.first)) + " is subscribed but missing from the routing table");
      }
    }
    return problems;
  }

  std::vector<DeadLetter> dead_letters() const {
    std::lock_guard<std::mutex> lock(dlq_mu_);
    return std::vector<DeadLetter>(dead_letters_.begin(), dead_letters_.end());
  }

  void clear_dead_letters() {
    std::lock_guard<std::mutex> lock(dlq_mu_);
    dead_letters_.clear();
  }

  BusStats stats() const {
    BusStats s;
    {
      std::lock_guard<std::mutex> lock(queue_mu_);
      s.queue_size = queue_.size();
    }
    {
      std::lock_guard<std::mutex> lock(sub_mu_);
      for (const auto& kv : subscribers_) {
        s.subscriber_count += kv.second.size();
      }
    }
    {
      std::lock_guard<std::mutex> lock(dlq_mu_);
      s.dead_letter_count = dead_letters_.size();
    }
    s.delivered = delivered_.load();
    s.dead_lettered = dead_lettered_.load();
    s.delivery_failures = delivery_failures_.load();
    s.broadcasts = broadcasts_.load();
    return s;
  }

  // Blocks until every queued message has been handed to its handler.
  bool wait_idle(std::chrono::milliseconds timeout = std::chrono::milliseconds(5000)) {
    std::unique_lock<std::mutex> lock(queue_mu_);
    return idle_cv_.wait_for(lock, timeout, [this]() { return queue_.empty() && !dispatching_; });
  }

  void stop() {
    if (!running_.exchange(false)) {
      return;
    }
    queue_cv_.notify_all();
    if (dispatcher_.joinable()) {
      dispatcher_.join();
    }
  }

 private:
  struct Subscription {
    HandlerId id;
    Handler handler;
  };

  struct Pending {
    AgentMessage message;
    bool broadcast{false};
  };

  static void validate(const AgentMessage& msg) {
    if (auto problem = envelope_problem(msg)) {
      throw AgentError(ErrorCode::kInvalidMessage, "Invalid message envelope: " + *problem, msg.id);
    }
  }

  bool recipient_allowed(const AgentMessage& msg) const {
    std::lock_guard<std::mutex> lock(sub_mu_);
    auto it = routing_.find(msg.type);
    return it == routing_.end() || it->second.count(msg.recipient) > 0;
  }

  void enqueue(Pending p) {
    if (!running_.load()) {
      throw AgentError(ErrorCode::kAgentUnavailable, "Message bus is stopped", p.message.id);
    }
    {
      std::lock_guard<std::mutex> lock(queue_mu_);
      queue_.push_back(std::move(p));
    }
    queue_cv_.notify_one();
  }

  void run_loop() {
    while (true) {
      Pending next;
      {
        std::unique_lock<std::mutex> lock(queue_mu_);
        queue_cv_.wait(lock, [this]() { return !queue_.empty() || !running_.load(); });
        if (!running_.load()) {
          break;
        }
        next = std::move(queue_.front());
        queue_.pop_front();
        dispatching_ = true;
      }

      if (next.broadcast) {
        deliver_broadcast(next.message);
      } else {
        deliver(next.message);
      }

      {
        std::lock_guard<std::mutex> lock(queue_mu_);
        dispatching_ = false;
      }
      idle_cv_.notify_all();
    }
    idle_cv_.notify_all();
  }

  void deliver(const AgentMessage& msg) {
    std::optional<Handler> handler;
    {
      std::lock_guard<std::mutex> lock(sub_mu_);
      auto it = subscribers_.find(msg.recipient);
      if (it != subscribers_.end() && !it->second.empty()) {
        handler = it->second.front().handler;
      }
    }

    if (!handler.has_value()) {
      ++dead_lettered_;
      push_dead_letter(msg, "no subscriber");
      Logger::log(Logger::Level::kWarn, "Dead-lettered " + msg.id + ": no subscriber for " +
                                            agent_type_name(msg.recipient));
      emit(kEventDeadLettered, msg, "no subscriber for recipient");
      return;
    }

    try {
      (*handler)(msg);
      ++delivered_;
    } catch (const std::exception& e) {
      ++delivery_failures_;
      push_dead_letter(msg, e.what());
      Logger::log(Logger::Level::kError, "Delivery of " + msg.id + " to " + agent_type_name(msg.recipient) +
                                             " failed: " + e.what());
      emit(kEventDeliveryFailed, msg, e.what());
    }
  }

  void deliver_broadcast(const AgentMessage& msg) {
    ++broadcasts_;
    std::vector<std::pair<AgentType, Handler>> targets;
    {
      std::lock_guard<std::mutex> lock(sub_mu_);
      for (const auto& kv : subscribers_) {
        if (kv.first == msg.sender) {
          continue;
        }
        for (const auto& s : kv.second) {
          targets.emplace_back(kv.first, s.handler);
        }
      }
    }

    for (const auto& [type, handler] : targets) {
      try {
        handler(msg);
        ++delivered_;
      } catch (const std::exception& e) {
        ++delivery_failures_;
        Logger::log(Logger::Level::kError, "Broadcast of " + msg.id + " to " + agent_type_name(type) +
                                               " failed: " + e.what());
        emit(kEventDeliveryFailed, msg, e.what());
      }
    }
  }

  void push_dead_letter(const AgentMessage& msg, const std::string& reason) {
    std::lock_guard<std::mutex> lock(dlq_mu_);
    dead_letters_.push_back(DeadLetter{msg, reason});
    while (dead_letters_.size() > dead_letter_capacity_) {
      dead_letters_.pop_front();
    }
  }

  void emit(const char* event, const AgentMessage& msg, const std::string& reason) {
    if (!events_) {
      return;
    }
    events_->emit(event, json{{"messageId", msg.id},
                              {"sender", agent_type_name(msg.sender)},
                              {"recipient", agent_type_name(msg.recipient)},
                              {"messageType", message_type_name(msg.type)},
                              {"reason", reason}});
  }

  EventHub* events_;
  std::size_t dead_letter_capacity_;

  mutable std::mutex sub_mu_;
  HandlerId next_handler_id_{0};
  std::map<AgentType, std::vector<Subscription>> subscribers_;
  std::map<MessageType, std::set<AgentType>> routing_;

  mutable std::mutex queue_mu_;
  std::condition_variable queue_cv_;
  std::condition_variable idle_cv_;
  std::deque<Pending> queue_;
  bool dispatching_{false};

  mutable std::mutex dlq_mu_;
  std::deque<DeadLetter> dead_letters_;

  std::atomic<uint64_t> delivered_{0};
  std::atomic<uint64_t> dead_lettered_{0};
  std::atomic<uint64_t> delivery_failures_{0};
  std::atomic<uint64_t> broadcasts_{0};

  std::atomic<bool> running_{false};
  std::thread dispatcher_;
};

}  // namespace polytutor
