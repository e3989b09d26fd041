#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <deque>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "polytutor/adaptive_engine.hpp"
#include "polytutor/agent.hpp"
#include "polytutor/agents.hpp"
#include "polytutor/common.hpp"
#include "polytutor/config.hpp"
#include "polytutor/errors.hpp"
#include "polytutor/events.hpp"
#include "polytutor/generators.hpp"
#include "polytutor/message.hpp"
#include "polytutor/message_bus.hpp"
#include "polytutor/metrics.hpp"
#include "polytutor/periodic.hpp"
#include "polytutor/service_layer.hpp"

namespace polytutor {

inline constexpr std::size_t kQueryTimeWindow = 1000;
inline constexpr std::size_t kSessionHistoryLimit = 10;

inline constexpr const char* kDegradedResponseText =
    "I'm sorry, I encountered an error while processing your question. Please try rephrasing your question or ask "
    "something else.";

using ExecutionPlan = std::vector<std::vector<AgentType>>;

struct TutorContent {
  std::string text;
  std::vector<json> visualizations;
  std::vector<json> videos;
  std::vector<json> assessments;
  std::vector<json> resources;
  std::vector<json> interactive;
};

struct TutorMetadata {
  std::vector<AgentType> agents_involved;
  int64_t processing_time_ms{0};
  double confidence{0.0};
  std::vector<std::string> sources;
  std::vector<json> adaptations;
  std::vector<AgentType> failed_agents;
};

struct TutorResponse {
  std::string id;
  std::string timestamp;
  std::string type{"explanation"};
  TutorContent content{};
  TutorMetadata metadata{};
  std::vector<std::string> follow_up_suggestions;
  std::vector<std::string> related_topics;

  bool involved(AgentType t) const {
    return std::find(metadata.agents_involved.begin(), metadata.agents_involved.end(), t) !=
           metadata.agents_involved.end();
  }
};

inline json to_json(const TutorResponse& r) {
  json agents = json::array();
  for (const AgentType t : r.metadata.agents_involved) {
    agents.push_back(agent_type_name(t));
  }
  json failed = json::array();
  for (const AgentType t : r.metadata.failed_agents) {
    failed.push_back(agent_type_name(t));
  }
  return json{{"id", r.id},
              {"timestamp", r.timestamp},
              {"type", r.type},
              {"content",
               {{"text", r.content.text},
                {"visualizations", r.content.visualizations},
                {"videos", r.content.videos},
                {"assessments", r.content.assessments},
                {"resources", r.content.resources},
                {"interactive", r.content.interactive}}},
              {"metadata",
               {{"agentsInvolved", agents},
                {"processingTime", r.metadata.processing_time_ms},
                {"confidence", r.metadata.confidence},
                {"sources", r.metadata.sources},
                {"adaptations", r.metadata.adaptations},
                {"failedAgents", failed}}},
              {"followUpSuggestions", r.follow_up_suggestions},
              {"relatedTopics", r.related_topics}};
}

// Creates the agent for a type; returning nullptr skips the type.
using AgentFactory = std::function<std::shared_ptr<Agent>(AgentType, AgentDeps, AgentConfig)>;

// Entry point for student queries. Owns the bus, the agents and the adaptive
// engine; runs the staged plan and merges agent contributions.
class Orchestrator {
 public:
  Orchestrator(Config cfg, std::shared_ptr<ServiceLayer> services,
               std::shared_ptr<GeneratorRegistry> generators = nullptr)
      : cfg_(std::move(cfg)),
        services_(std::move(services)),
        bus_(&events_, cfg_.bus.dead_letter_capacity),
        query_times_(kQueryTimeWindow) {
    if (!services_) {
      throw AgentError(ErrorCode::kConfigurationError, "orchestrator needs a service layer");
    }
    if (!generators) {
      generators = make_default_generators(services_, cfg_.service.ai_provider);
    }
    EngineOptions opts;
    opts.generation_timeout = std::chrono::milliseconds(cfg_.timeouts.generation_ms);
    opts.confusion_timeout = std::chrono::milliseconds(cfg_.timeouts.confusion_ms);
    engine_ = std::make_shared<AdaptiveEngine>(std::move(generators), &events_, opts);
  }

  ~Orchestrator() { shutdown(); }

  Orchestrator(const Orchestrator&) = delete;
  Orchestrator& operator=(const Orchestrator&) = delete;

  EventHub& events() { return events_; }
  MessageBus& bus() { return bus_; }
  AdaptiveEngine& engine() { return *engine_; }
  bool initialized() const { return initialized_.load(); }

  AgentDeps agent_deps() {
    AgentDeps deps;
    deps.bus = &bus_;
    deps.services = services_;
    deps.events = &events_;
    deps.ai_provider = cfg_.service.ai_provider;
    deps.health_interval = std::chrono::seconds(cfg_.timeouts.health_check_interval_s);
    return deps;
  }

  // Creates and initializes every enabled agent. An agent that fails to
  // start is skipped; the orchestrator still comes up.
  void initialize(AgentFactory factory = {}) {
    if (initialized_.load()) {
      throw AgentError(ErrorCode::kConfigurationError, "Orchestrator already initialized");
    }
    if (!factory) {
      std::shared_ptr<AdaptiveEngine> engine = engine_;
      factory = [engine](AgentType type, AgentDeps deps, AgentConfig config) {
        return make_agent(type, std::move(deps), std::move(config), engine);
      };
    }

    try {
      services_->get_health();
    } catch (const AgentError& e) {
      Logger::log(Logger::Level::kWarn, std::string("Service layer unreachable at startup: ") + e.what());
    }

    handler_id_ = bus_.subscribe(AgentType::kOrchestrator, [this](const AgentMessage& msg) { handle_message(msg); });
    setup_routing();

    for (const AgentType type : kAllAgentTypes) {
      if (type == AgentType::kOrchestrator) {
        continue;
      }
      const AgentConfig agent_cfg = cfg_.agent(type);
      if (!agent_cfg.enabled) {
        continue;
      }
      std::shared_ptr<Agent> agent;
      try {
        agent = factory(type, agent_deps(), agent_cfg);
      } catch (const std::exception& e) {
        Logger::log(Logger::Level::kError, std::string("Failed to create agent ") + agent_type_name(type) + ": " +
                                               e.what());
        events_.emit(kEventAgentInitFailed, json{{"agentType", agent_type_name(type)}, {"error", e.what()}});
        continue;
      }
      if (!agent) {
        continue;
      }
      try {
        agent->initialize();
      } catch (const std::exception& e) {
        Logger::log(Logger::Level::kError, std::string("Failed to initialize agent ") + agent_type_name(type) +
                                               ": " + e.what());
        continue;
      }
      std::lock_guard<std::mutex> lock(agents_mu_);
      agents_[type] = agent;
    }

    for (const auto& problem : bus_.validate_routing()) {
      Logger::log(Logger::Level::kDebug, "Routing: " + problem);
    }

    health_task_ = std::make_unique<PeriodicTask>(
        "orchestrator health sweep", std::chrono::seconds(cfg_.timeouts.health_check_interval_s),
        [this]() { run_health_check_now(); });
    health_task_->start();
    initialized_.store(true);
    Logger::log(Logger::Level::kInfo, "Orchestrator initialized with " + std::to_string(agent_count()) + " agents");
  }

  std::size_t agent_count() const {
    std::lock_guard<std::mutex> lock(agents_mu_);
    return agents_.size();
  }

  std::shared_ptr<Agent> agent(AgentType type) const {
    std::lock_guard<std::mutex> lock(agents_mu_);
    auto it = agents_.find(type);
    return it == agents_.end() ? nullptr : it->second;
  }

  // Never throws: any unrecoverable failure yields the degraded response.
  TutorResponse process_query(const std::string& text, const ConversationContext& context) {
    const auto started = std::chrono::steady_clock::now();
    const std::string request_id = "req_" + std::to_string(now_ms()) + "_" + random_id(9);
    metrics_.inc("queries");

    try {
      if (!initialized_.load()) {
        throw AgentError(ErrorCode::kAgentUnavailable, "Orchestrator not initialized", request_id);
      }
      ConversationContext ctx = context;
      if (ctx.previous_queries.empty()) {
        ctx.previous_queries = session_history(ctx.session_id);
      }

      const QueryAnalysis analysis = analyze_query(text, ctx, request_id);
      const std::vector<AgentType> required = determine_required_agents(analysis);
      std::vector<AgentType> failed;
      const auto responses = coordinate_agents(create_execution_plan(required), analysis, request_id, failed);

      TutorResponse response = synthesize(responses, analysis);
      response.metadata.failed_agents = failed;
      response.metadata.processing_time_ms = elapsed_ms(started);
      record_query_time(response.metadata.processing_time_ms);
      remember_query(ctx.session_id, text);

      json used = json::array();
      for (const AgentType t : required) {
        used.push_back(agent_type_name(t));
      }
      events_.emit(kEventQueryProcessed, json{{"requestId", request_id},
                                              {"query", text},
                                              {"processingTime", response.metadata.processing_time_ms},
                                              {"agentsUsed", used},
                                              {"success", true}});
      return response;
    } catch (const std::exception& e) {
      metrics_.inc("errors");
      Logger::log(Logger::Level::kError, "Query " + request_id + " failed: " + e.what());
      events_.emit(kEventQueryFailed, json{{"requestId", request_id},
                                           {"query", text},
                                           {"error", e.what()},
                                           {"processingTime", elapsed_ms(started)}});
      return degraded_response();
    }
  }

  static std::vector<AgentType> determine_required_agents(const QueryAnalysis& q) {
    std::vector<AgentType> agents = {AgentType::kConversation};
    auto add = [&agents](AgentType t) {
      if (std::find(agents.begin(), agents.end(), t) == agents.end()) {
        agents.push_back(t);
      }
    };
    if (q.needs_explanation || !q.concepts.empty()) {
      add(AgentType::kContentSpecialist);
    }
    if (q.needs_visualization || q.requests_visual_content) {
      add(AgentType::kVisualLearning);
    }
    if (q.needs_assessment || q.requests_practice) {
      add(AgentType::kAssessment);
    }
    if (q.needs_learning_path || q.requests_study_plan) {
      add(AgentType::kPedagogy);
    }
    if (q.needs_resources || q.requests_additional_materials) {
      add(AgentType::kResource);
    }
    return agents;
  }

  // Fixed three-stage shape: analysis, supporting content, pedagogy.
  static ExecutionPlan create_execution_plan(const std::vector<AgentType>& required) {
    auto has = [&required](AgentType t) { return std::find(required.begin(), required.end(), t) != required.end(); };
    ExecutionPlan plan;

    std::vector<AgentType> stage1 = {AgentType::kConversation};
    if (has(AgentType::kContentSpecialist)) {
      stage1.push_back(AgentType::kContentSpecialist);
    }
    plan.push_back(stage1);

    std::vector<AgentType> stage2;
    for (const AgentType t : {AgentType::kVisualLearning, AgentType::kAssessment, AgentType::kResource}) {
      if (has(t)) {
        stage2.push_back(t);
      }
    }
    if (!stage2.empty()) {
      plan.push_back(stage2);
    }

    if (has(AgentType::kPedagogy)) {
      plan.push_back({AgentType::kPedagogy});
    }
    return plan;
  }

  static TutorResponse degraded_response() {
    TutorResponse r;
    r.id = "resp_" + std::to_string(now_ms()) + "_" + random_id(9);
    r.timestamp = now_iso8601();
    r.type = "feedback";
    r.content.text = kDegradedResponseText;
    r.metadata.agents_involved = {AgentType::kOrchestrator};
    r.metadata.confidence = 0.0;
    r.follow_up_suggestions = {"Try asking a more specific question",
                               "Check if your question is about organic chemistry",
                               "Ask for help with a particular concept"};
    return r;
  }

  // Polls the service layer and every agent once. Returns agent -> healthy.
  json run_health_check_now() {
    try {
      services_->get_health();
    } catch (const AgentError& e) {
      events_.emit(kEventHealthCheckFailed, json{{"error", e.what()}});
    }

    std::map<AgentType, std::shared_ptr<Agent>> agents;
    {
      std::lock_guard<std::mutex> lock(agents_mu_);
      agents = agents_;
    }
    json out = json::object();
    for (const auto& kv : agents) {
      const std::string name = agent_type_name(kv.first);
      try {
        const bool healthy = kv.second->health_check();
        out[name] = healthy;
        if (!healthy) {
          events_.emit(kEventAgentUnhealthy, json{{"agentType", name}});
        }
      } catch (const std::exception& e) {
        out[name] = false;
        events_.emit(kEventHealthCheckFailed, json{{"agentType", name}, {"error", e.what()}});
      }
    }
    return out;
  }

  std::vector<std::string> session_history(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(history_mu_);
    auto it = history_.find(session_id);
    if (it == history_.end()) {
      return {};
    }
    return std::vector<std::string>(it->second.begin(), it->second.end());
  }

  json metrics_snapshot() const {
    json last_seen = json::object();
    double avg = 0.0;
    {
      std::lock_guard<std::mutex> lock(stats_mu_);
      for (const auto& kv : last_seen_) {
        last_seen[agent_type_name(kv.first)] = kv.second;
      }
      avg = query_times_.mean();
    }
    return json{{"queryCount", metrics_.get("queries")},
                {"errorCount", metrics_.get("errors")},
                {"agentErrors", metrics_.get("agent_errors")},
                {"deadLetters", events_.count(kEventDeadLettered)},
                {"deliveryFailures", events_.count(kEventDeliveryFailed)},
                {"lateResponses", metrics_.get("late_responses")},
                {"averageQueryTimeMs", avg},
                {"agentLastSeen", last_seen}};
  }

  json status() const {
    json agents = json::array();
    {
      std::lock_guard<std::mutex> lock(agents_mu_);
      for (const auto& kv : agents_) {
        agents.push_back(kv.second->status());
      }
    }
    return json{{"initialized", initialized_.load()},
                {"agentCount", agents.size()},
                {"agents", agents},
                {"queueStats", bus_.stats().to_json()},
                {"metrics", metrics_snapshot()}};
  }

  void shutdown() {
    if (shut_down_.exchange(true)) {
      return;
    }
    if (health_task_) {
      health_task_->stop();
    }
    std::map<AgentType, std::shared_ptr<Agent>> agents;
    {
      std::lock_guard<std::mutex> lock(agents_mu_);
      agents = agents_;
    }
    for (const auto& kv : agents) {
      kv.second->shutdown();
    }
    if (handler_id_.has_value()) {
      bus_.unsubscribe(AgentType::kOrchestrator, *handler_id_);
      handler_id_.reset();
    }
    fail_pending_waiters();
    bus_.stop();
    initialized_.store(false);
    Logger::log(Logger::Level::kInfo, "Orchestrator shut down");
  }

 private:
  using Waiter = std::shared_ptr<std::promise<AgentMessage>>;

  static int64_t elapsed_ms(std::chrono::steady_clock::time_point started) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started).count();
  }

  void setup_routing() {
    std::vector<AgentType> all(kAllAgentTypes.begin(), kAllAgentTypes.end());
    bus_.setup_routing(MessageType::kRequest, all);
    bus_.setup_routing(MessageType::kResponse, all);
    bus_.setup_routing(MessageType::kNotification, all);
    bus_.setup_routing(MessageType::kError, {AgentType::kOrchestrator});
    bus_.setup_routing(MessageType::kHeartbeat, {AgentType::kOrchestrator});
  }

  QueryAnalysis analyze_query(const std::string& text, const ConversationContext& ctx, const std::string& request_id) {
    AgentMessage msg = make_request(AgentType::kOrchestrator, AgentType::kConversation,
                                    ProcessQueryRequest{text, ctx}, request_id + ":conversation:analysis",
                                    Priority::kHigh);
    try {
      const AgentMessage reply = send_and_wait(msg, std::chrono::milliseconds(cfg_.timeouts.conversation_ms));
      const auto* analysis = std::get_if<QueryAnalysis>(&*reply.payload);
      if (!analysis) {
        throw AgentError(ErrorCode::kProcessingError,
                         std::string("unexpected analysis payload ") + payload_name(*reply.payload), msg.id,
                         AgentType::kConversation);
      }
      return *analysis;
    } catch (const AgentError& e) {
      throw AgentError(ErrorCode::kCriticalPathFailure,
                       std::string("Critical error: Conversation agent failed: ") + e.what(), msg.id,
                       AgentType::kConversation);
    }
  }

  // Each stage runs concurrently and settles fully before the next starts.
  // Failures are recorded in `failed`; only CONVERSATION is fatal, and it
  // aborts the plan as soon as its stage settles.
  std::map<AgentType, AgentContribution> coordinate_agents(const ExecutionPlan& plan, const QueryAnalysis& analysis,
                                                           const std::string& request_id,
                                                           std::vector<AgentType>& failed) {
    std::map<AgentType, AgentContribution> responses;
    const auto timeout = std::chrono::milliseconds(cfg_.timeouts.agent_ms);

    for (const auto& stage : plan) {
      std::vector<std::pair<AgentType, std::future<AgentContribution>>> calls;
      for (const AgentType type : stage) {
        AgentMessage msg = make_request(AgentType::kOrchestrator, type, build_payload(type, analysis, responses),
                                        request_id + ":" + agent_type_name(type), Priority::kHigh);
        calls.emplace_back(type, std::async(std::launch::async, [this, msg, timeout]() {
                             return call_agent(msg, timeout);
                           }));
      }

      for (auto& call : calls) {
        try {
          responses[call.first] = call.second.get();
        } catch (const std::exception& e) {
          failed.push_back(call.first);
          metrics_.inc("agent_errors");
          Logger::log(Logger::Level::kWarn, std::string("Agent ") + agent_type_name(call.first) + " failed for " +
                                                request_id + ": " + e.what());
          events_.emit(kEventAgentError, json{{"agentType", agent_type_name(call.first)},
                                              {"error", e.what()},
                                              {"requestId", request_id}});
        }
      }

      // Later stages never start once the critical path is lost.
      if (std::find(failed.begin(), failed.end(), AgentType::kConversation) != failed.end()) {
        throw AgentError(ErrorCode::kCriticalPathFailure, "Critical error: Conversation agent failed", request_id,
                         AgentType::kConversation);
      }
    }
    return responses;
  }

  AgentContribution call_agent(const AgentMessage& msg, std::chrono::milliseconds timeout) {
    if (!agent(msg.recipient)) {
      throw AgentError(ErrorCode::kAgentUnavailable,
                       std::string("Agent ") + agent_type_name(msg.recipient) + " not available", msg.id,
                       msg.recipient);
    }
    const AgentMessage reply = send_and_wait(msg, timeout);
    if (const auto* c = std::get_if<AgentContribution>(&*reply.payload)) {
      return *c;
    }
    throw AgentError(ErrorCode::kProcessingError,
                     std::string("unexpected reply payload ") + payload_name(*reply.payload), msg.id, msg.recipient);
  }

  Payload build_payload(AgentType type, const QueryAnalysis& q, const std::map<AgentType, AgentContribution>& prior) {
    auto fill = [&q, &prior](StageInput& s) {
      s.analysis = q;
      s.prior = prior;
    };
    switch (type) {
      case AgentType::kContentSpecialist: {
        ExplainConceptRequest r;
        fill(r);
        r.concepts = q.concepts;
        r.difficulty = q.context.student_level;
        return r;
      }
      case AgentType::kVisualLearning: {
        VisualizationRequest r;
        fill(r);
        r.concepts = q.concepts;
        r.visualization_type = q.preferred_visualization;
        r.complexity = q.context.preferences.detail_level.empty() ? "medium" : q.context.preferences.detail_level;
        return r;
      }
      case AgentType::kAssessment: {
        AssessmentRequest r;
        fill(r);
        r.concepts = q.concepts;
        r.difficulty = q.requested_difficulty > 0 ? q.requested_difficulty : 3;
        r.question_type = q.preferred_question_type;
        return r;
      }
      case AgentType::kResource: {
        ResourceRequest r;
        fill(r);
        r.topics = q.concepts;
        r.resource_types = q.preferred_resource_types;
        return r;
      }
      case AgentType::kPedagogy: {
        LearningPathRequest r;
        fill(r);
        r.learning_goals = q.learning_goals;
        return r;
      }
      case AgentType::kConversation:
      case AgentType::kOrchestrator:
        break;
    }
    ComposeReplyRequest r;
    fill(r);
    return r;
  }

  // The waiter is registered before routing and removed on first match or on
  // timeout, whichever happens first. A reply arriving later finds no waiter.
  AgentMessage send_and_wait(AgentMessage msg, std::chrono::milliseconds timeout) {
    auto waiter = std::make_shared<std::promise<AgentMessage>>();
    std::future<AgentMessage> reply = waiter->get_future();
    {
      std::lock_guard<std::mutex> lock(waiters_mu_);
      waiters_[msg.correlation_id] = waiter;
    }
    try {
      bus_.route(msg);
    } catch (const AgentError&) {
      std::lock_guard<std::mutex> lock(waiters_mu_);
      waiters_.erase(msg.correlation_id);
      throw;
    }

    if (reply.wait_for(timeout) != std::future_status::ready) {
      std::size_t removed = 0;
      {
        std::lock_guard<std::mutex> lock(waiters_mu_);
        removed = waiters_.erase(msg.correlation_id);
      }
      if (removed != 0) {
        throw AgentError(ErrorCode::kTimeout, "Message timeout after " + std::to_string(timeout.count()) + "ms",
                         msg.id, msg.recipient);
      }
    }

    AgentMessage response = reply.get();
    if (const auto* err = std::get_if<ErrorReply>(&*response.payload)) {
      throw AgentError(err->code, err->message, msg.id, err->agent.value_or(msg.recipient));
    }
    return response;
  }

  void fail_pending_waiters() {
    std::map<std::string, Waiter> pending;
    {
      std::lock_guard<std::mutex> lock(waiters_mu_);
      pending.swap(waiters_);
    }
    for (auto& kv : pending) {
      kv.second->set_exception(std::make_exception_ptr(
          AgentError(ErrorCode::kAgentUnavailable, "Orchestrator shutting down", kv.first)));
    }
  }

  void handle_message(const AgentMessage& msg) {
    switch (msg.type) {
      case MessageType::kResponse:
        resolve_waiter(msg);
        return;
      case MessageType::kError:
        if (const auto* err = std::get_if<ErrorReply>(&*msg.payload)) {
          metrics_.inc("agent_errors");
          events_.emit(kEventAgentError, json{{"agentType", agent_type_name(msg.sender)},
                                              {"error", err->message},
                                              {"code", error_code_name(err->code)},
                                              {"retryable", err->retryable}});
        }
        return;
      case MessageType::kHeartbeat: {
        std::lock_guard<std::mutex> lock(stats_mu_);
        last_seen_[msg.sender] = msg.timestamp;
        return;
      }
      case MessageType::kNotification:
        if (const auto* n = std::get_if<Notification>(&*msg.payload)) {
          handle_notification(msg.sender, *n);
        }
        return;
      case MessageType::kRequest:
      case MessageType::kTaskAssignment:
        break;
    }
    Logger::log(Logger::Level::kWarn, std::string("Orchestrator ignored ") + message_type_name(msg.type) + " from " +
                                          agent_type_name(msg.sender));
  }

  void resolve_waiter(const AgentMessage& msg) {
    Waiter waiter;
    {
      std::lock_guard<std::mutex> lock(waiters_mu_);
      auto it = waiters_.find(msg.correlation_id);
      if (it != waiters_.end()) {
        waiter = it->second;
        waiters_.erase(it);
      }
    }
    if (!waiter) {
      metrics_.inc("late_responses");
      Logger::log(Logger::Level::kDebug, "Dropped late response " + msg.correlation_id);
      return;
    }
    waiter->set_value(msg);
  }

  void handle_notification(AgentType sender, const Notification& n) {
    json data = n.data;
    data["agentType"] = agent_type_name(sender);
    if (n.kind == "learning_milestone") {
      services_->track_event("learning_milestone", data, sender, data.value("userId", ""));
      events_.emit(kEventLearningMilestone, data);
    } else if (n.kind == "concept_mastered") {
      services_->track_event("concept_mastered", data, sender, data.value("userId", ""));
      events_.emit(kEventConceptMastered, data);
    } else if (n.kind == "study_session_completed") {
      services_->track_event("study_session_completed", data, sender, data.value("userId", ""));
    } else {
      Logger::log(Logger::Level::kDebug, "Received notification " + n.kind);
    }
  }

  static void append_unique(std::vector<std::string>& out, const std::vector<std::string>& in) {
    for (const auto& s : in) {
      if (std::find(out.begin(), out.end(), s) == out.end()) {
        out.push_back(s);
      }
    }
  }

  static std::string response_type(const QueryAnalysis& q) {
    if (q.requests_assessment) {
      return "question";
    }
    if (q.requests_additional_materials) {
      return "resources";
    }
    if (q.requests_encouragement) {
      return "encouragement";
    }
    if (q.requests_feedback) {
      return "feedback";
    }
    return "explanation";
  }

  TutorResponse synthesize(const std::map<AgentType, AgentContribution>& responses, const QueryAnalysis& q) const {
    auto find = [&responses](AgentType t) -> const AgentContribution* {
      auto it = responses.find(t);
      return it == responses.end() ? nullptr : &it->second;
    };
    const AgentContribution* conversation = find(AgentType::kConversation);
    const AgentContribution* content = find(AgentType::kContentSpecialist);
    const AgentContribution* visual = find(AgentType::kVisualLearning);
    const AgentContribution* assessment = find(AgentType::kAssessment);
    const AgentContribution* resource = find(AgentType::kResource);
    const AgentContribution* pedagogy = find(AgentType::kPedagogy);

    TutorResponse r;
    r.id = "resp_" + std::to_string(now_ms()) + "_" + random_id(9);
    r.timestamp = now_iso8601();
    r.type = response_type(q);

    if (conversation && !conversation->text.empty()) {
      r.content.text = conversation->text;
    }
    if (content && !content->text.empty()) {
      r.content.text = r.content.text.empty() ? content->text : r.content.text + "\n\n" + content->text;
    }
    if (visual) {
      r.content.visualizations = visual->visualizations;
      r.content.interactive = visual->interactive;
    }
    for (const AgentContribution* c : {resource, visual, content}) {
      if (c && !c->videos.empty()) {
        r.content.videos = c->videos;
        break;
      }
    }
    if (assessment) {
      r.content.assessments = assessment->assessments;
    }
    if (resource) {
      r.content.resources = resource->resources;
    }

    double total = 0.0;
    int count = 0;
    for (const auto& kv : responses) {
      r.metadata.agents_involved.push_back(kv.first);
      append_unique(r.metadata.sources, kv.second.sources);
      if (kv.second.confidence.has_value()) {
        total += *kv.second.confidence;
        ++count;
      }
    }
    r.metadata.confidence = count > 0 ? total / count : 0.7;
    if (pedagogy) {
      r.metadata.adaptations = pedagogy->adaptations;
    }
    if (visual) {
      r.metadata.adaptations.insert(r.metadata.adaptations.end(), visual->adaptations.begin(),
                                    visual->adaptations.end());
    }

    if (pedagogy && !pedagogy->next_steps.empty()) {
      r.follow_up_suggestions = pedagogy->next_steps;
    } else if (content) {
      r.follow_up_suggestions = content->related_topics;
    }
    if (content) {
      r.related_topics = content->prerequisites;
    }
    return r;
  }

  void record_query_time(int64_t ms) {
    std::lock_guard<std::mutex> lock(stats_mu_);
    query_times_.add(static_cast<double>(ms));
  }

  void remember_query(const std::string& session_id, const std::string& text) {
    if (session_id.empty()) {
      return;
    }
    std::lock_guard<std::mutex> lock(history_mu_);
    auto& h = history_[session_id];
    h.push_back(text);
    while (h.size() > kSessionHistoryLimit) {
      h.pop_front();
    }
  }

  Config cfg_;
  std::shared_ptr<ServiceLayer> services_;
  EventHub events_;
  MessageBus bus_;
  std::shared_ptr<AdaptiveEngine> engine_;

  std::atomic<bool> initialized_{false};
  std::atomic<bool> shut_down_{false};
  std::optional<MessageBus::HandlerId> handler_id_;

  mutable std::mutex agents_mu_;
  std::map<AgentType, std::shared_ptr<Agent>> agents_;

  std::mutex waiters_mu_;
  std::map<std::string, Waiter> waiters_;

  Metrics metrics_;
  mutable std::mutex stats_mu_;
  RollingWindow query_times_;
  std::map<AgentType, std::string> last_seen_;

  mutable std::mutex history_mu_;
  std::map<std::string, std::deque<std::string>> history_;

  std::unique_ptr<PeriodicTask> health_task_;
};

}  // namespace polytutor
