#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "polytutor/common.hpp"
#include "polytutor/errors.hpp"
#include "polytutor/types.hpp"

namespace polytutor {

struct ServiceConfig {
  std::string base_url{"http://localhost:10000"};
  std::string api_key;
  std::string ai_provider{"claude"};
  int timeout_s{30};
};

struct TimeoutConfig {
  int conversation_ms{30000};
  int agent_ms{60000};
  int generation_ms{30000};
  int confusion_ms{45000};
  int health_check_interval_s{30};
};

struct BusConfig {
  std::size_t dead_letter_capacity{1000};
};

struct AgentConfig {
  bool enabled{true};
  int max_concurrent_tasks{5};
  int timeout_ms{30000};
  int retry_attempts{3};
  Priority priority{Priority::kMedium};
  // Service names that must report healthy before the agent starts.
  std::vector<std::string> required_tools;
};

struct LoggingConfig {
  bool json{false};
  std::string level{"info"};
};

struct Config {
  ServiceConfig service{};
  TimeoutConfig timeouts{};
  BusConfig bus{};
  std::map<AgentType, AgentConfig> agents{};
  LoggingConfig logging{};

  AgentConfig agent(AgentType type) const;
};

inline AgentConfig default_agent_config(AgentType type) {
  AgentConfig c;
  switch (type) {
    case AgentType::kConversation:
      c.priority = Priority::kHigh;
      break;
    case AgentType::kContentSpecialist:
      c.max_concurrent_tasks = 3;
      c.timeout_ms = 45000;
      break;
    case AgentType::kVisualLearning:
      c.max_concurrent_tasks = 2;
      c.timeout_ms = 60000;
      break;
    case AgentType::kAssessment:
    case AgentType::kResource:
    case AgentType::kPedagogy:
    case AgentType::kOrchestrator:
      break;
  }
  return c;
}

inline AgentConfig Config::agent(AgentType type) const {
  auto it = agents.find(type);
  return it == agents.end() ? default_agent_config(type) : it->second;
}

inline std::string resolve_env_ref(const std::string& value) {
  if (value.empty()) {
    return "";
  }

  // Supports "$ENV_NAME" and "${ENV_NAME}".
  if (value[0] != '$') {
    return value;
  }

  std::string env_name = value.substr(1);
  if (!env_name.empty() && env_name.front() == '{' && env_name.back() == '}') {
    env_name = env_name.substr(1, env_name.size() - 2);
  }
  if (env_name.empty()) {
    return value;
  }

  const char* v = std::getenv(env_name.c_str());
  return (v && *v) ? std::string(v) : "";
}

inline fs::path get_data_dir() {
  return expand_user_path("~/.polytutor");
}

inline fs::path get_config_path() {
  return get_data_dir() / "config.json";
}

inline json agent_config_json(const AgentConfig& c) {
  return json{{"enabled", c.enabled},
              {"maxConcurrentTasks", c.max_concurrent_tasks},
              {"timeoutMs", c.timeout_ms},
              {"retryAttempts", c.retry_attempts},
              {"priority", priority_name(c.priority)},
              {"requiredTools", c.required_tools}};
}

inline json default_config_json() {
  json agents = json::object();
  for (const AgentType t : kAllAgentTypes) {
    if (t == AgentType::kOrchestrator) {
      continue;
    }
    agents[agent_type_name(t)] = agent_config_json(default_agent_config(t));
  }

  return json{{"service",
               {{"baseUrl", "http://localhost:10000"},
                {"apiKey", "$POLYTUTOR_API_KEY"},
                {"aiProvider", "claude"},
                {"timeoutSeconds", 30}}},
              {"timeouts",
               {{"conversationMs", 30000},
                {"agentMs", 60000},
                {"generationMs", 30000},
                {"confusionMs", 45000},
                {"healthCheckIntervalSeconds", 30}}},
              {"bus", {{"deadLetterCapacity", 1000}}},
              {"agents", agents},
              {"logging", {{"json", false}, {"level", "info"}}}};
}

inline int positive_or(const json& obj, const char* key, int fallback) {
  const int v = obj.value(key, fallback);
  return v > 0 ? v : fallback;
}

// Reads a config document. Unknown keys are ignored; invalid values raise
// ConfigurationError.
inline Config parse_config(const json& root) {
  Config cfg{};
  if (!root.is_object()) {
    throw AgentError(ErrorCode::kConfigurationError, "config root must be an object");
  }

  try {
    if (root.contains("service") && root["service"].is_object()) {
      const auto& s = root["service"];
      cfg.service.base_url = s.value("baseUrl", cfg.service.base_url);
      cfg.service.api_key = resolve_env_ref(s.value("apiKey", ""));
      cfg.service.ai_provider = to_lower(s.value("aiProvider", cfg.service.ai_provider));
      cfg.service.timeout_s = positive_or(s, "timeoutSeconds", cfg.service.timeout_s);
    }

    if (root.contains("timeouts") && root["timeouts"].is_object()) {
      const auto& t = root["timeouts"];
      cfg.timeouts.conversation_ms = positive_or(t, "conversationMs", cfg.timeouts.conversation_ms);
      cfg.timeouts.agent_ms = positive_or(t, "agentMs", cfg.timeouts.agent_ms);
      cfg.timeouts.generation_ms = positive_or(t, "generationMs", cfg.timeouts.generation_ms);
      cfg.timeouts.confusion_ms = positive_or(t, "confusionMs", cfg.timeouts.confusion_ms);
      cfg.timeouts.health_check_interval_s =
          positive_or(t, "healthCheckIntervalSeconds", cfg.timeouts.health_check_interval_s);
    }

    if (root.contains("bus") && root["bus"].is_object()) {
      const int cap = positive_or(root["bus"], "deadLetterCapacity", static_cast<int>(cfg.bus.dead_letter_capacity));
      cfg.bus.dead_letter_capacity = static_cast<std::size_t>(cap);
    }

    if (root.contains("agents") && root["agents"].is_object()) {
      for (auto it = root["agents"].begin(); it != root["agents"].end(); ++it) {
        const auto type = parse_agent_type(it.key());
        if (!type.has_value() || *type == AgentType::kOrchestrator) {
          throw AgentError(ErrorCode::kConfigurationError, "unknown agent in config: " + it.key());
        }
        if (!it.value().is_object()) {
          continue;
        }
        const auto& a = it.value();
        AgentConfig c = default_agent_config(*type);
        c.enabled = a.value("enabled", c.enabled);
        c.max_concurrent_tasks = positive_or(a, "maxConcurrentTasks", c.max_concurrent_tasks);
        c.timeout_ms = positive_or(a, "timeoutMs", c.timeout_ms);
        c.retry_attempts = (std::max)(0, a.value("retryAttempts", c.retry_attempts));
        c.priority = parse_priority(a.value("priority", std::string(priority_name(c.priority))), c.priority);
        if (a.contains("requiredTools") && a["requiredTools"].is_array()) {
          c.required_tools.clear();
          for (const auto& tool : a["requiredTools"]) {
            if (tool.is_string()) {
              c.required_tools.push_back(tool.get<std::string>());
            }
          }
        }
        cfg.agents[*type] = c;
      }
    }

    if (root.contains("logging") && root["logging"].is_object()) {
      const auto& l = root["logging"];
      cfg.logging.json = l.value("json", cfg.logging.json);
      cfg.logging.level = l.value("level", cfg.logging.level);
    }
  } catch (const json::exception& e) {
    throw AgentError(ErrorCode::kConfigurationError, std::string("invalid config value: ") + e.what());
  }

  if (cfg.service.ai_provider != "claude" && cfg.service.ai_provider != "openai") {
    throw AgentError(ErrorCode::kConfigurationError, "aiProvider must be claude or openai");
  }
  return cfg;
}

inline Config load_config(const fs::path& path = get_config_path()) {
  const std::string raw = read_text_file(path);
  if (raw.empty()) {
    return Config{};
  }

  try {
    return parse_config(json::parse(raw));
  } catch (const json::parse_error& e) {
    Logger::log(Logger::Level::kWarn, std::string("Failed to parse config: ") + e.what());
    return Config{};
  }
}

inline void apply_logging_config(const LoggingConfig& logging) {
  const char* env = std::getenv("POLYTUTOR_LOG_JSON");
  Logger::set_json(logging.json || (env && std::string(env) == "1"));
  Logger::set_min_level(Logger::parse_level(logging.level));
}

inline bool save_default_config(const fs::path& path = get_config_path()) {
  return write_text_file(path, default_config_json().dump(2));
}

}  // namespace polytutor
