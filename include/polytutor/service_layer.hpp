#pragma once

#include <chrono>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "polytutor/common.hpp"
#include "polytutor/config.hpp"
#include "polytutor/errors.hpp"
#include "polytutor/http.hpp"
#include "polytutor/types.hpp"

namespace polytutor {

struct AiResponse {
  std::string response;
  std::string model;
  std::optional<double> confidence;
  std::string conversation_id;
};

struct VideoResult {
  std::string id;
  std::string title;
  std::string description;
  std::string url;
  std::string channel;
  int duration_s{0};

  json to_json() const {
    return json{{"id", id},         {"title", title},     {"description", description},
                {"url", url},       {"channel", channel}, {"duration", duration_s}};
  }
};

struct HealthStatus {
  std::string status{"unhealthy"};
  std::string timestamp;
  std::map<std::string, bool> services;

  bool healthy() const { return status == "healthy"; }
};

// Boundary to the external AI, video-search, file and analytics services.
// Every call except track_event raises ServiceConnectionFailed when the
// upstream cannot be reached.
class ServiceLayer {
 public:
  virtual ~ServiceLayer() = default;

  virtual AiResponse query_ai(const std::string& provider, const std::string& prompt,
                              const json& context = json::object(), const std::string& conversation_id = "",
                              std::optional<AgentType> agent = std::nullopt) = 0;
  virtual std::vector<VideoResult> search_videos(const std::string& query,
                                                 const std::string& subject = "organic chemistry",
                                                 int max_results = 10) = 0;
  virtual std::string read_file(const std::string& path) = 0;
  virtual void write_file(const std::string& path, const std::string& content) = 0;

  // Fire and forget. Failures are logged, never raised.
  virtual void track_event(const std::string& event, const json& data, std::optional<AgentType> agent = std::nullopt,
                           const std::string& user_id = "") = 0;

  // Fetches health from upstream and refreshes the cached per-service map.
  HealthStatus get_health() {
    try {
      HealthStatus h = fetch_health();
      std::lock_guard<std::mutex> lock(health_mu_);
      for (const auto& kv : h.services) {
        service_health_[kv.first] = kv.second;
      }
      reachable_ = true;
      return h;
    } catch (const AgentError&) {
      std::lock_guard<std::mutex> lock(health_mu_);
      reachable_ = false;
      throw;
    }
  }

  bool is_service_healthy(const std::string& name) const {
    std::lock_guard<std::mutex> lock(health_mu_);
    auto it = service_health_.find(name);
    return it != service_health_.end() && it->second;
  }

  // Result of the most recent get_health() call.
  bool is_reachable() const {
    std::lock_guard<std::mutex> lock(health_mu_);
    return reachable_;
  }

 protected:
  virtual HealthStatus fetch_health() = 0;

 private:
  mutable std::mutex health_mu_;
  std::map<std::string, bool> service_health_;
  bool reachable_{false};
};

inline constexpr int kAiCacheTtlSec = 5 * 60;
inline constexpr int kVideoCacheTtlSec = 30 * 60;
inline constexpr std::size_t kServiceCacheCapacity = 1000;

// Talks to the MCP gateway over HTTP.
class HttpServiceLayer : public ServiceLayer {
 public:
  explicit HttpServiceLayer(ServiceConfig cfg) : cfg_(std::move(cfg)) {
    while (!cfg_.base_url.empty() && cfg_.base_url.back() == '/') {
      cfg_.base_url.pop_back();
    }
  }

  AiResponse query_ai(const std::string& provider, const std::string& prompt, const json& context,
                      const std::string& conversation_id, std::optional<AgentType> agent) override {
    const std::string p = provider.empty() ? cfg_.ai_provider : to_lower(provider);
    const std::string cache_key = "ai:" + p + ":" + prompt + ":" + context.dump();
    if (auto cached = cache_get(cache_key)) {
      return parse_ai_response(*cached);
    }

    json body{{"message", prompt},
              {"agentMetadata", {{"timestamp", now_iso8601()}}}};
    if (!context.empty()) {
      body["context"] = context.dump();
    }
    if (!conversation_id.empty()) {
      body["conversationId"] = conversation_id;
    }
    if (agent.has_value()) {
      body["agentMetadata"]["agentType"] = agent_type_name(*agent);
    }

    const json data = make_request(p == "openai" ? "/api/openai" : "/api/claude", body);
    AiResponse r = parse_ai_response(data);
    cache_put(cache_key, data, kAiCacheTtlSec);
    return r;
  }

  std::vector<VideoResult> search_videos(const std::string& query, const std::string& subject,
                                         int max_results) override {
    const std::string cache_key = "video:" + subject + ":" + query + ":" + std::to_string(max_results);
    if (auto cached = cache_get(cache_key)) {
      return parse_video_results(*cached);
    }
    const json data = make_request("/api/youtube", json{{"query", query},
                                                        {"subject", subject},
                                                        {"maxResults", max_results},
                                                        {"filter", {{"quality", "high"}, {"educational", true}}}});
    std::vector<VideoResult> out = parse_video_results(data);
    cache_put(cache_key, data, kVideoCacheTtlSec);
    return out;
  }

  std::string read_file(const std::string& path) override {
    const json data = make_request("/filesystem/read", json{{"path", path}});
    try {
      return data.is_object() ? data.value("content", "") : std::string();
    } catch (const json::exception& e) {
      throw AgentError(ErrorCode::kServiceConnectionFailed, "Malformed file content for " + path + ": " + e.what());
    }
  }

  void write_file(const std::string& path, const std::string& content) override {
    make_request("/filesystem/write", json{{"path", path}, {"content", content}});
  }

  void track_event(const std::string& event, const json& data, std::optional<AgentType> agent,
                   const std::string& user_id) override {
    json body{{"event", event}, {"data", data}, {"timestamp", now_iso8601()}};
    if (agent.has_value()) {
      body["agentType"] = agent_type_name(*agent);
    }
    if (!user_id.empty()) {
      body["userId"] = user_id;
    }
    try {
      make_request("/analytics/track", body);
    } catch (const AgentError& e) {
      Logger::log(Logger::Level::kWarn, std::string("Analytics tracking failed: ") + e.what());
    }
  }

  // Upstream replies are untrusted: any shape or type mismatch is a
  // ServiceConnectionFailed, never a raw json exception.
  static AiResponse parse_ai_response(const json& data) {
    if (!data.is_object()) {
      throw AgentError(ErrorCode::kServiceConnectionFailed, "AI reply is not a JSON object");
    }
    AiResponse r;
    try {
      r.response = data.value("response", "");
      r.model = data.value("model", "");
      r.conversation_id = data.value("conversationId", "");
    } catch (const json::exception& e) {
      throw AgentError(ErrorCode::kServiceConnectionFailed, std::string("Malformed AI reply: ") + e.what());
    }
    if (data.contains("confidence") && data["confidence"].is_number()) {
      r.confidence = data["confidence"].get<double>();
    }
    return r;
  }

  static std::vector<VideoResult> parse_video_results(const json& data) {
    if (!data.is_object()) {
      throw AgentError(ErrorCode::kServiceConnectionFailed, "Video search reply is not a JSON object");
    }
    std::vector<VideoResult> out;
    if (!data.contains("videos") || !data["videos"].is_array()) {
      return out;
    }
    try {
      for (const auto& v : data["videos"]) {
        if (!v.is_object()) {
          continue;
        }
        VideoResult r;
        r.id = v.value("id", "");
        r.title = v.value("title", "");
        r.description = v.value("description", "");
        r.url = v.value("url", "");
        r.channel = v.value("channel", "");
        r.duration_s = v.value("duration", 0);
        out.push_back(std::move(r));
      }
    } catch (const json::exception& e) {
      throw AgentError(ErrorCode::kServiceConnectionFailed, std::string("Malformed video search reply: ") + e.what());
    }
    return out;
  }

 protected:
  HealthStatus fetch_health() override {
    thread_local HttpClient client;
    const HttpResponse resp = client.get(cfg_.base_url + "/health", {}, (std::min)(cfg_.timeout_s, 10));
    if (!resp.ok()) {
      throw AgentError(ErrorCode::kServiceConnectionFailed, "Health check failed: " + describe(resp));
    }

    HealthStatus h;
    try {
      const json data = json::parse(resp.body);
      h.status = data.value("status", "unhealthy");
      h.timestamp = data.value("timestamp", now_iso8601());
      if (data.contains("services") && data["services"].is_object()) {
        for (auto it = data["services"].begin(); it != data["services"].end(); ++it) {
          h.services[it.key()] = it.value().is_boolean() && it.value().get<bool>();
        }
      }
    } catch (const json::exception& e) {
      throw AgentError(ErrorCode::kServiceConnectionFailed, std::string("Malformed health response: ") + e.what());
    }
    return h;
  }

 private:
  struct CacheEntry {
    json data;
    std::chrono::steady_clock::time_point expires_at;
  };

  static std::string describe(const HttpResponse& resp) {
    if (!resp.error.empty()) {
      return resp.error;
    }
    return "HTTP " + std::to_string(resp.status) + ": " + resp.body.substr(0, 200);
  }

  json make_request(const std::string& endpoint, const json& body) {
    std::map<std::string, std::string> headers;
    if (!cfg_.api_key.empty()) {
      headers["Authorization"] = "Bearer " + cfg_.api_key;
    }

    thread_local HttpClient client;
    const HttpResponse resp = client.post_json(cfg_.base_url + endpoint, body, headers, cfg_.timeout_s);
    if (!resp.ok()) {
      throw AgentError(ErrorCode::kServiceConnectionFailed, endpoint + " failed: " + describe(resp));
    }
    try {
      return resp.body.empty() ? json::object() : json::parse(resp.body);
    } catch (const json::parse_error& e) {
      throw AgentError(ErrorCode::kServiceConnectionFailed, endpoint + " returned malformed JSON: " + e.what());
    }
  }

  std::optional<json> cache_get(const std::string& key) {
    std::lock_guard<std::mutex> lock(cache_mu_);
    auto it = cache_.find(key);
    if (it == cache_.end()) {
      return std::nullopt;
    }
    if (std::chrono::steady_clock::now() > it->second.expires_at) {
      cache_.erase(it);
      return std::nullopt;
    }
    return it->second.data;
  }

  void cache_put(const std::string& key, const json& data, int ttl_s) {
    std::lock_guard<std::mutex> lock(cache_mu_);
    if (cache_.size() >= kServiceCacheCapacity) {
      cache_.erase(cache_.begin());
    }
    cache_[key] = CacheEntry{data, std::chrono::steady_clock::now() + std::chrono::seconds(ttl_s)};
  }

  ServiceConfig cfg_;
  std::mutex cache_mu_;
  std::unordered_map<std::string, CacheEntry> cache_;
};

}  // namespace polytutor
