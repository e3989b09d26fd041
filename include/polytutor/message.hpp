#pragma once

#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "polytutor/common.hpp"
#include "polytutor/errors.hpp"
#include "polytutor/learning_types.hpp"
#include "polytutor/types.hpp"

namespace polytutor {

template <typename... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};
template <typename... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

// Normalized form of a student query, produced by the conversation agent.
struct QueryAnalysis {
  std::string original_query;
  std::string intent{"question"};
  std::vector<std::string> concepts;
  ConversationContext context{};

  bool needs_explanation{false};
  bool needs_visualization{false};
  bool needs_assessment{false};
  bool needs_learning_path{false};
  bool needs_resources{false};

  bool requests_visual_content{false};
  bool requests_practice{false};
  bool requests_study_plan{false};
  bool requests_additional_materials{false};
  bool requests_assessment{false};
  bool requests_encouragement{false};
  bool requests_feedback{false};

  std::string preferred_visualization;
  std::string preferred_question_type;
  std::vector<std::string> preferred_resource_types;
  int requested_difficulty{3};
  std::vector<std::string> learning_goals;
};

// Partial result one agent contributes to a tutor response.
struct AgentContribution {
  std::string text;
  std::vector<json> visualizations;
  std::vector<json> videos;
  std::vector<json> assessments;
  std::vector<json> resources;
  std::vector<json> interactive;
  std::vector<std::string> sources;
  std::optional<double> confidence;
  std::vector<json> adaptations;
  std::vector<std::string> next_steps;
  std::vector<std::string> related_topics;
  std::vector<std::string> prerequisites;
};

struct ProcessQueryRequest {
  std::string query;
  ConversationContext context{};
};

// Common input of every staged agent call: the analysis plus whatever earlier
// stages produced.
struct StageInput {
  QueryAnalysis analysis{};
  std::map<AgentType, AgentContribution> prior;
};

struct ComposeReplyRequest : StageInput {};

struct ExplainConceptRequest : StageInput {
  std::vector<std::string> concepts;
  Complexity difficulty{Complexity::kIntermediate};
};

struct VisualizationRequest : StageInput {
  std::vector<std::string> concepts;
  std::string visualization_type;
  std::string complexity{"medium"};
};

struct AssessmentRequest : StageInput {
  std::vector<std::string> concepts;
  int difficulty{3};
  std::string question_type;
};

struct ResourceRequest : StageInput {
  std::vector<std::string> topics;
  std::vector<std::string> resource_types;
};

struct LearningPathRequest : StageInput {
  std::vector<std::string> learning_goals;
};

struct ErrorReply {
  ErrorCode code{ErrorCode::kProcessingError};
  std::string message;
  bool retryable{false};
  std::optional<AgentType> agent;
  std::string message_id;
};

struct Heartbeat {
  bool healthy{true};
  json metrics{json::object()};
};

struct Notification {
  std::string kind;
  json data{json::object()};
};

using Payload = std::variant<ProcessQueryRequest, ComposeReplyRequest, ExplainConceptRequest, VisualizationRequest,
                             AssessmentRequest, ResourceRequest, LearningPathRequest, QueryAnalysis,
                             AgentContribution, ErrorReply, Heartbeat, Notification>;

inline const char* payload_name(const Payload& p) {
  return std::visit(overloaded{
                        [](const ProcessQueryRequest&) { return "process_query"; },
                        [](const ComposeReplyRequest&) { return "compose_reply"; },
                        [](const ExplainConceptRequest&) { return "explain_concept"; },
                        [](const VisualizationRequest&) { return "create_visualization"; },
                        [](const AssessmentRequest&) { return "generate_question"; },
                        [](const ResourceRequest&) { return "find_resources"; },
                        [](const LearningPathRequest&) { return "create_learning_path"; },
                        [](const QueryAnalysis&) { return "query_analysis"; },
                        [](const AgentContribution&) { return "agent_contribution"; },
                        [](const ErrorReply&) { return "error_reply"; },
                        [](const Heartbeat&) { return "heartbeat"; },
                        [](const Notification&) { return "notification"; },
                    },
                    p);
}

struct AgentMessage {
  std::string id;
  std::string timestamp;
  AgentType sender{AgentType::kOrchestrator};
  AgentType recipient{AgentType::kOrchestrator};
  MessageType type{MessageType::kRequest};
  std::optional<Payload> payload;
  Priority priority{Priority::kMedium};
  std::string correlation_id;
  std::optional<std::chrono::milliseconds> timeout;
};

inline json to_json(const AgentContribution& c) {
  json j{{"text", c.text},
         {"visualizations", c.visualizations},
         {"videos", c.videos},
         {"assessments", c.assessments},
         {"resources", c.resources},
         {"interactive", c.interactive},
         {"sources", c.sources},
         {"adaptations", c.adaptations},
         {"nextSteps", c.next_steps},
         {"relatedTopics", c.related_topics},
         {"prerequisites", c.prerequisites}};
  if (c.confidence.has_value()) {
    j["confidence"] = *c.confidence;
  }
  return j;
}

inline json to_json(const QueryAnalysis& q) {
  return json{{"originalQuery", q.original_query},
              {"intent", q.intent},
              {"concepts", q.concepts},
              {"context", to_json(q.context)},
              {"needs",
               {{"explanation", q.needs_explanation},
                {"visualization", q.needs_visualization},
                {"assessment", q.needs_assessment},
                {"learningPath", q.needs_learning_path},
                {"resources", q.needs_resources}}},
              {"requests",
               {{"visualContent", q.requests_visual_content},
                {"practice", q.requests_practice},
                {"studyPlan", q.requests_study_plan},
                {"additionalMaterials", q.requests_additional_materials},
                {"assessment", q.requests_assessment},
                {"encouragement", q.requests_encouragement},
                {"feedback", q.requests_feedback}}},
              {"requestedDifficulty", q.requested_difficulty}};
}

inline json stage_input_json(const StageInput& s) {
  json prior = json::object();
  for (const auto& kv : s.prior) {
    prior[agent_type_name(kv.first)] = to_json(kv.second);
  }
  return json{{"analysis", to_json(s.analysis)}, {"previousResponses", prior}};
}

inline json to_json(const Payload& p) {
  json body = std::visit(
      overloaded{
          [](const ProcessQueryRequest& r) { return json{{"query", r.query}, {"context", to_json(r.context)}}; },
          [](const ComposeReplyRequest& r) { return stage_input_json(r); },
          [](const ExplainConceptRequest& r) {
            json j = stage_input_json(r);
            j["concepts"] = r.concepts;
            j["difficulty"] = complexity_name(r.difficulty);
            return j;
          },
          [](const VisualizationRequest& r) {
            json j = stage_input_json(r);
            j["concepts"] = r.concepts;
            j["visualizationType"] = r.visualization_type;
            j["complexity"] = r.complexity;
            return j;
          },
          [](const AssessmentRequest& r) {
            json j = stage_input_json(r);
            j["concepts"] = r.concepts;
            j["difficulty"] = r.difficulty;
            j["questionType"] = r.question_type;
            return j;
          },
          [](const ResourceRequest& r) {
            json j = stage_input_json(r);
            j["topics"] = r.topics;
            j["resourceTypes"] = r.resource_types;
            return j;
          },
          [](const LearningPathRequest& r) {
            json j = stage_input_json(r);
            j["learningGoals"] = r.learning_goals;
            return j;
          },
          [](const QueryAnalysis& q) { return to_json(q); },
          [](const AgentContribution& c) { return to_json(c); },
          [](const ErrorReply& e) {
            return json{{"code", error_code_name(e.code)}, {"message", e.message}, {"retryable", e.retryable}};
          },
          [](const Heartbeat& h) { return json{{"healthy", h.healthy}, {"metrics", h.metrics}}; },
          [](const Notification& n) { return json{{"kind", n.kind}, {"data", n.data}}; },
      },
      p);
  body["type"] = payload_name(p);
  return body;
}

inline json to_json(const AgentMessage& m) {
  json j{{"id", m.id},
         {"timestamp", m.timestamp},
         {"sender", agent_type_name(m.sender)},
         {"recipient", agent_type_name(m.recipient)},
         {"messageType", message_type_name(m.type)},
         {"priority", priority_name(m.priority)}};
  if (!m.correlation_id.empty()) {
    j["correlationId"] = m.correlation_id;
  }
  if (m.timeout.has_value()) {
    j["timeoutMs"] = m.timeout->count();
  }
  j["payload"] = m.payload.has_value() ? to_json(*m.payload) : json(nullptr);
  return j;
}

inline AgentMessage make_message(AgentType sender, AgentType recipient, MessageType type, Payload payload,
                                 Priority priority = Priority::kMedium) {
  AgentMessage m;
  m.id = sequential_id("msg");
  m.timestamp = now_iso8601();
  m.sender = sender;
  m.recipient = recipient;
  m.type = type;
  m.payload = std::move(payload);
  m.priority = priority;
  return m;
}

inline AgentMessage make_request(AgentType sender, AgentType recipient, Payload payload,
                                 std::string correlation_id = "", Priority priority = Priority::kMedium) {
  AgentMessage m = make_message(sender, recipient, MessageType::kRequest, std::move(payload), priority);
  m.correlation_id = correlation_id.empty() ? sequential_id("corr") : std::move(correlation_id);
  return m;
}

inline AgentMessage make_response(const AgentMessage& original, Payload payload) {
  AgentMessage m =
      make_message(original.recipient, original.sender, MessageType::kResponse, std::move(payload), original.priority);
  m.correlation_id = original.correlation_id;
  return m;
}

inline ErrorReply to_error_reply(const AgentError& e, AgentType agent) {
  return ErrorReply{e.code(), e.what(), e.retryable(), agent, e.message_id()};
}

// Envelope check shared by the bus (on route) and agents (on receipt). Returns
// the first problem found, or nullopt when the envelope is well formed.
inline std::optional<std::string> envelope_problem(const AgentMessage& m) {
  if (trim(m.id).empty()) {
    return "missing id";
  }
  if (trim(m.timestamp).empty()) {
    return "missing timestamp";
  }
  if (!m.payload.has_value()) {
    return "missing payload";
  }
  if (m.type == MessageType::kRequest && trim(m.correlation_id).empty()) {
    return "request without correlation id";
  }
  if (m.type == MessageType::kResponse && trim(m.correlation_id).empty()) {
    return "response without correlation id";
  }
  return std::nullopt;
}

}  // namespace polytutor
