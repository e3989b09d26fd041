#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "polytutor/common.hpp"
#include "polytutor/config.hpp"
#include "polytutor/deadline.hpp"
#include "polytutor/errors.hpp"
#include "polytutor/events.hpp"
#include "polytutor/message.hpp"
#include "polytutor/message_bus.hpp"
#include "polytutor/metrics.hpp"
#include "polytutor/periodic.hpp"
#include "polytutor/service_layer.hpp"
#include "polytutor/worker_pool.hpp"

namespace polytutor {

enum class AgentState { kUninitialized, kInitializing, kHealthy, kUnhealthy, kShutdown };

inline const char* agent_state_name(AgentState s) {
  switch (s) {
    case AgentState::kUninitialized:
      return "uninitialized";
    case AgentState::kInitializing:
      return "initializing";
    case AgentState::kHealthy:
      return "healthy";
    case AgentState::kUnhealthy:
      return "unhealthy";
    case AgentState::kShutdown:
      return "shutdown";
  }
  return "unknown";
}

// Shared collaborators handed to every agent.
struct AgentDeps {
  MessageBus* bus{nullptr};
  std::shared_ptr<ServiceLayer> services;
  EventHub* events{nullptr};
  std::string ai_provider{"claude"};
  std::chrono::milliseconds health_interval{std::chrono::seconds(kDefaultHealthCheckIntervalSec)};
};

class Agent : public std::enable_shared_from_this<Agent> {
 public:
  Agent(AgentType type, AgentDeps deps, AgentConfig config)
      : type_(type), deps_(std::move(deps)), config_(std::move(config)) {
    if (!deps_.bus || !deps_.services) {
      throw AgentError(ErrorCode::kConfigurationError,
                       std::string("agent ") + agent_type_name(type_) + " needs a bus and a service layer");
    }
  }

  virtual ~Agent() {
    if (health_task_) {
      health_task_->stop();
    }
    if (pool_) {
      pool_->stop();
    }
  }

  Agent(const Agent&) = delete;
  Agent& operator=(const Agent&) = delete;

  AgentType type() const { return type_; }
  std::string name() const { return agent_type_name(type_); }
  const AgentConfig& config() const { return config_; }
  const AgentMetrics& metrics() const { return metrics_; }

  AgentState state() const {
    std::lock_guard<std::mutex> lock(state_mu_);
    return state_;
  }

  bool is_initialized() const {
    const AgentState s = state();
    return s == AgentState::kHealthy || s == AgentState::kUnhealthy;
  }

  virtual std::vector<std::string> capabilities() const = 0;

  // Subscribes to the bus, runs agent setup, checks required services and
  // starts the periodic health check. A second call is an error.
  void initialize() {
    {
      std::lock_guard<std::mutex> lock(state_mu_);
      if (state_ != AgentState::kUninitialized) {
        throw AgentError(ErrorCode::kConfigurationError, "Agent " + name() + " already initialized", "", type_);
      }
      state_ = AgentState::kInitializing;
    }

    try {
      pool_ = std::make_unique<WorkerPool>(name() + " worker",
                                           static_cast<std::size_t>((std::max)(1, config_.max_concurrent_tasks)));
      std::weak_ptr<Agent> weak = weak_from_this();
      handler_id_ = deps_.bus->subscribe(type_, [weak](const AgentMessage& msg) {
        auto self = weak.lock();
        if (!self) {
          throw AgentError(ErrorCode::kAgentUnavailable, "agent released", msg.id);
        }
        self->enqueue(msg);
      });

      initialize_agent();
      validate_required_tools();

      health_task_ = std::make_unique<PeriodicTask>(name() + " health check", deps_.health_interval, [this]() {
        health_check();
        send_heartbeat();
      });
      health_task_->start();

      set_state(AgentState::kHealthy);
      emit(kEventAgentInitialized, json{{"agentType", name()}});
      Logger::log(Logger::Level::kInfo, "Agent " + name() + " initialized");
      send_heartbeat();
    } catch (const std::exception& e) {
      if (handler_id_.has_value()) {
        deps_.bus->unsubscribe(type_, *handler_id_);
        handler_id_.reset();
      }
      if (health_task_) {
        health_task_->stop();
      }
      if (pool_) {
        pool_->stop();
      }
      set_state(AgentState::kUnhealthy);
      emit(kEventAgentInitFailed, json{{"agentType", name()}, {"error", e.what()}});
      throw;
    }
  }

  void shutdown() {
    {
      std::lock_guard<std::mutex> lock(state_mu_);
      if (state_ == AgentState::kShutdown) {
        return;
      }
      state_ = AgentState::kShutdown;
    }
    if (health_task_) {
      health_task_->stop();
    }
    if (handler_id_.has_value()) {
      deps_.bus->unsubscribe(type_, *handler_id_);
      handler_id_.reset();
    }
    if (pool_) {
      pool_->stop();
    }
    shutdown_agent();
    Logger::log(Logger::Level::kInfo, "Agent " + name() + " shut down");
  }

  // Initialized, upstream reachable, and the agent-specific check passes.
  bool health_check() {
    if (!is_initialized()) {
      return false;
    }
    try {
      bool healthy = deps_.services->is_reachable();
      for (const auto& tool : config_.required_tools) {
        healthy = healthy && deps_.services->is_service_healthy(tool);
      }
      healthy = healthy && perform_health_check();
      set_state(healthy ? AgentState::kHealthy : AgentState::kUnhealthy);
      return healthy;
    } catch (const std::exception& e) {
      set_state(AgentState::kUnhealthy);
      emit(kEventHealthCheckFailed, json{{"agentType", name()}, {"error", e.what()}});
      return false;
    }
  }

  // Runs process_message under the message's timeout override, else the
  // configured default. A Timeout is raised once the budget is spent even if
  // the work later completes.
  Payload process_with_timeout(const AgentMessage& msg) {
    const auto budget = msg.timeout.value_or(std::chrono::milliseconds(config_.timeout_ms));
    const Deadline deadline(budget);
    std::shared_ptr<Agent> self = shared_from_this();
    try {
      return run_with_deadline([self, msg](const Deadline& d) { return self->process_message(msg, d); }, deadline,
                               name() + " " + (msg.payload ? payload_name(*msg.payload) : "message"), msg.id);
    } catch (const AgentError& e) {
      if (e.agent().has_value()) {
        throw;
      }
      throw AgentError(e.code(), e.what(), e.message_id().empty() ? msg.id : e.message_id(), type_);
    }
  }

  json status() const {
    return json{{"agentType", name()},
                {"state", agent_state_name(state())},
                {"capabilities", capabilities()},
                {"config", agent_config_json(config_)},
                {"metrics", metrics_.snapshot()}};
  }

 protected:
  virtual Payload process_message(const AgentMessage& msg, const Deadline& deadline) = 0;

  virtual void initialize_agent() {}
  virtual void shutdown_agent() {}
  virtual bool perform_health_check() { return true; }

  virtual void on_notification(const Notification& n) {
    Logger::log(Logger::Level::kDebug, "Agent " + name() + " ignored notification " + n.kind);
  }

  ServiceLayer& services() { return *deps_.services; }
  const std::string& ai_provider() const { return deps_.ai_provider; }

  AiResponse query_ai(const std::string& prompt, const json& context = json::object()) {
    return deps_.services->query_ai(deps_.ai_provider, prompt, context, "", type_);
  }

  void emit(const std::string& event, const json& data) {
    if (deps_.events) {
      deps_.events->emit(event, data);
    }
  }

  void broadcast_notification(const std::string& kind, const json& data, Priority priority = Priority::kMedium) {
    deps_.bus->broadcast(make_message(type_, AgentType::kOrchestrator, MessageType::kNotification,
                                      Notification{kind, data}, priority));
  }

  [[noreturn]] void unsupported(const AgentMessage& msg) const {
    throw AgentError(ErrorCode::kUnsupportedOperation,
                     "Agent " + name() + " cannot handle " + (msg.payload ? payload_name(*msg.payload) : "message"),
                     msg.id, type_);
  }

 private:
  void set_state(AgentState s) {
    std::lock_guard<std::mutex> lock(state_mu_);
    if (state_ != AgentState::kShutdown) {
      state_ = s;
    }
  }

  void enqueue(const AgentMessage& msg) {
    std::shared_ptr<Agent> self = shared_from_this();
    if (!pool_ || !pool_->submit([self, msg]() { self->handle_message(msg); })) {
      throw AgentError(ErrorCode::kAgentUnavailable, "Agent " + name() + " is not accepting work", msg.id, type_);
    }
  }

  void handle_message(const AgentMessage& msg) {
    const auto started = std::chrono::steady_clock::now();
    try {
      if (auto problem = envelope_problem(msg)) {
        throw AgentError(ErrorCode::kInvalidMessage, "Invalid message format: " + *problem, msg.id, type_);
      }

      switch (msg.type) {
        case MessageType::kNotification:
          if (const auto* n = std::get_if<Notification>(&*msg.payload)) {
            on_notification(*n);
          }
          return;
        case MessageType::kRequest:
        case MessageType::kTaskAssignment:
          break;
        case MessageType::kResponse:
        case MessageType::kError:
        case MessageType::kHeartbeat:
          throw AgentError(ErrorCode::kProcessingError,
                           "Agent " + name() + " cannot handle message type " + message_type_name(msg.type), msg.id,
                           type_);
      }

      Payload result = process_with_timeout(msg);
      if (msg.type == MessageType::kRequest) {
        deps_.bus->route(make_response(msg, std::move(result)));
      }
      metrics_.record(elapsed_ms(started), false);
    } catch (const AgentError& e) {
      metrics_.record(elapsed_ms(started), true);
      handle_error(e, msg);
    } catch (const std::exception& e) {
      metrics_.record(elapsed_ms(started), true);
      handle_error(AgentError(ErrorCode::kProcessingError, std::string("Message processing failed: ") + e.what(),
                              msg.id, type_),
                   msg);
    }
  }

  void handle_error(const AgentError& error, const AgentMessage& original) {
    Logger::log(Logger::Level::kWarn, "Agent " + name() + " failed on " + original.id + ": " + error.what());
    emit(kEventAgentError, json{{"agentType", name()},
                                {"error", error.what()},
                                {"code", error_code_name(error.code())},
                                {"retryable", error.retryable()},
                                {"messageId", original.id}});

    const ErrorReply reply = to_error_reply(error, type_);
    try {
      if (original.type == MessageType::kRequest && !original.correlation_id.empty()) {
        deps_.bus->route(make_response(original, reply));
      }
      deps_.bus->route(make_message(type_, AgentType::kOrchestrator, MessageType::kError, reply, Priority::kHigh));
    } catch (const AgentError& e) {
      Logger::log(Logger::Level::kError, "Agent " + name() + " could not report error: " + e.what());
    }
  }

  void validate_required_tools() {
    if (config_.required_tools.empty()) {
      try {
        deps_.services->get_health();
      } catch (const AgentError& e) {
        Logger::log(Logger::Level::kWarn, "Agent " + name() + " started without upstream services: " + e.what());
      }
      return;
    }

    const HealthStatus health = deps_.services->get_health();
    for (const auto& tool : config_.required_tools) {
      auto it = health.services.find(tool);
      if (it == health.services.end() || !it->second) {
        throw AgentError(ErrorCode::kServiceConnectionFailed, "Required tool not available: " + tool, "", type_);
      }
    }
  }

  void send_heartbeat() {
    if (!deps_.bus->has_subscriber(AgentType::kOrchestrator)) {
      return;
    }
    try {
      deps_.bus->route(make_message(type_, AgentType::kOrchestrator, MessageType::kHeartbeat,
                                    Heartbeat{state() == AgentState::kHealthy, metrics_.snapshot()},
                                    Priority::kLow));
    } catch (const AgentError& e) {
      Logger::log(Logger::Level::kWarn, "Heartbeat from " + name() + " failed: " + e.what());
    }
  }

  static double elapsed_ms(std::chrono::steady_clock::time_point started) {
    return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started).count();
  }

  AgentType type_;
  AgentDeps deps_;
  AgentConfig config_;
  AgentMetrics metrics_;

  mutable std::mutex state_mu_;
  AgentState state_{AgentState::kUninitialized};

  std::optional<MessageBus::HandlerId> handler_id_;
  std::unique_ptr<WorkerPool> pool_;
  std::unique_ptr<PeriodicTask> health_task_;
};

}  // namespace polytutor
