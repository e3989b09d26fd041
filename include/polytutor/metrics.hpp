#pragma once

#include <chrono>
#include <deque>
#include <mutex>
#include <numeric>
#include <string>
#include <unordered_map>

#include "polytutor/common.hpp"

namespace polytutor {

class Metrics {
 public:
  void inc(const std::string& key, uint64_t delta = 1) {
    std::lock_guard<std::mutex> lock(mu_);
    counters_[key] += delta;
  }

  uint64_t get(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mu_);
    auto it = counters_.find(key);
    return it == counters_.end() ? 0 : it->second;
  }

  json to_json() const {
    std::lock_guard<std::mutex> lock(mu_);
    json j = json::object();
    for (const auto& kv : counters_) {
      j[kv.first] = kv.second;
    }
    j["updatedAt"] = now_iso8601();
    return j;
  }

 private:
  mutable std::mutex mu_;
  std::unordered_map<std::string, uint64_t> counters_;
};

// Bounded window of samples with a running mean.
class RollingWindow {
 public:
  explicit RollingWindow(std::size_t capacity) : capacity_(capacity) {}

  void add(double v) {
    samples_.push_back(v);
    while (samples_.size() > capacity_) {
      samples_.pop_front();
    }
  }

  double mean() const {
    if (samples_.empty()) {
      return 0.0;
    }
    return std::accumulate(samples_.begin(), samples_.end(), 0.0) / static_cast<double>(samples_.size());
  }

  std::size_t size() const { return samples_.size(); }

 private:
  std::size_t capacity_;
  std::deque<double> samples_;
};

inline constexpr std::size_t kAgentLatencyWindow = 100;

class AgentMetrics {
 public:
  AgentMetrics() : started_(std::chrono::steady_clock::now()) {}

  void record(double latency_ms, bool failed) {
    std::lock_guard<std::mutex> lock(mu_);
    ++messages_;
    if (failed) {
      ++errors_;
    }
    latencies_.add(latency_ms);
    last_activity_ = now_iso8601();
  }

  uint64_t message_count() const {
    std::lock_guard<std::mutex> lock(mu_);
    return messages_;
  }

  uint64_t error_count() const {
    std::lock_guard<std::mutex> lock(mu_);
    return errors_;
  }

  double average_latency_ms() const {
    std::lock_guard<std::mutex> lock(mu_);
    return latencies_.mean();
  }

  double error_rate() const {
    std::lock_guard<std::mutex> lock(mu_);
    return messages_ == 0 ? 0.0 : static_cast<double>(errors_) / static_cast<double>(messages_);
  }

  int64_t uptime_ms() const {
    return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started_)
        .count();
  }

  json snapshot() const {
    std::lock_guard<std::mutex> lock(mu_);
    return json{{"messageCount", messages_},
                {"errorCount", errors_},
                {"averageResponseTimeMs", latencies_.mean()},
                {"errorRate", messages_ == 0 ? 0.0 : static_cast<double>(errors_) / static_cast<double>(messages_)},
                {"uptimeMs", uptime_ms()},
                {"lastActivity", last_activity_}};
  }

 private:
  mutable std::mutex mu_;
  std::chrono::steady_clock::time_point started_;
  uint64_t messages_{0};
  uint64_t errors_{0};
  RollingWindow latencies_{kAgentLatencyWindow};
  std::string last_activity_;
};

inline fs::path default_metrics_path() {
  return expand_user_path("~/.polytutor") / "state" / "metrics.json";
}

inline bool write_metrics_snapshot(const json& snapshot, const fs::path& path = default_metrics_path()) {
  return write_text_file(path, snapshot.dump(2));
}

}  // namespace polytutor
