#pragma once

#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "polytutor/common.hpp"

namespace polytutor {

inline constexpr const char* kEventAgentInitialized = "agent_initialized";
inline constexpr const char* kEventAgentInitFailed = "agent_init_failed";
inline constexpr const char* kEventAgentError = "agent_error";
inline constexpr const char* kEventAgentUnhealthy = "agent_unhealthy";
inline constexpr const char* kEventHealthCheckFailed = "health_check_failed";
inline constexpr const char* kEventDeadLettered = "message_dead_lettered";
inline constexpr const char* kEventDeliveryFailed = "message_delivery_failed";
inline constexpr const char* kEventQueryProcessed = "query_processed";
inline constexpr const char* kEventQueryFailed = "query_failed";
inline constexpr const char* kEventLearningMilestone = "learning_milestone";
inline constexpr const char* kEventConceptMastered = "concept_mastered";
inline constexpr const char* kEventConfusionDetected = "confusion_detected";

// Observer registry for outbound events. Listeners are copied out under the
// lock and invoked outside it, so a listener may subscribe or unsubscribe
// without deadlocking. One failing listener never stops the others.
class EventHub {
 public:
  using Listener = std::function<void(const std::string& event, const json& data)>;
  using ListenerId = uint64_t;

  ListenerId on(const std::string& event, Listener cb) {
    std::lock_guard<std::mutex> lock(mu_);
    const ListenerId id = ++next_id_;
    listeners_[event].push_back(Entry{id, std::move(cb)});
    return id;
  }

  // Receives every event.
  ListenerId on_any(Listener cb) { return on("*", std::move(cb)); }

  void off(ListenerId id) {
    std::lock_guard<std::mutex> lock(mu_);
    for (auto& kv : listeners_) {
      auto& v = kv.second;
      v.erase(std::remove_if(v.begin(), v.end(), [id](const Entry& e) { return e.id == id; }), v.end());
    }
  }

  void emit(const std::string& event, const json& data = json::object()) {
    std::vector<Listener> targets;
    {
      std::lock_guard<std::mutex> lock(mu_);
      ++counts_[event];
      for (const char* key : {event.c_str(), "*"}) {
        auto it = listeners_.find(key);
        if (it == listeners_.end()) {
          continue;
        }
        for (const auto& e : it->second) {
          targets.push_back(e.cb);
        }
      }
    }

    for (const auto& cb : targets) {
      try {
        cb(event, data);
      } catch (const std::exception& e) {
        Logger::log(Logger::Level::kError, "Event listener for " + event + " failed: " + e.what());
      }
    }
  }

  uint64_t count(const std::string& event) const {
    std::lock_guard<std::mutex> lock(mu_);
    auto it = counts_.find(event);
    return it == counts_.end() ? 0 : it->second;
  }

 private:
  struct Entry {
    ListenerId id;
    Listener cb;
  };

  mutable std::mutex mu_;
  ListenerId next_id_{0};
  std::unordered_map<std::string, std::vector<Entry>> listeners_;
  std::unordered_map<std::string, uint64_t> counts_;
};

}  // namespace polytutor
