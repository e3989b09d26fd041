#pragma once

#include <algorithm>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "polytutor/adaptive_engine.hpp"
#include "polytutor/agent.hpp"
#include "polytutor/common.hpp"
#include "polytutor/concept_catalog.hpp"
#include "polytutor/message.hpp"

namespace polytutor {

inline constexpr int kMaxVideosPerTopic = 3;
inline constexpr std::size_t kMaxVisualizedConcepts = 2;

// Analyzes raw queries and writes the conversational part of the reply.
class ConversationAgent : public Agent {
 public:
  ConversationAgent(AgentDeps deps, AgentConfig config)
      : Agent(AgentType::kConversation, std::move(deps), std::move(config)) {}

  std::vector<std::string> capabilities() const override {
    return {"process_query", "compose_reply", "intent_detection", "concept_extraction"};
  }

  static QueryAnalysis analyze(const std::string& query, const ConversationContext& context) {
    const std::string q = to_lower(query);

    QueryAnalysis a;
    a.original_query = query;
    a.context = context;
    a.concepts = concepts_in_text(query);
    if (!a.concepts.empty()) {
      a.context.current_topic = a.concepts.front();
    }

    a.requests_visual_content =
        contains_any(q, {"show me", "visual", "draw", "diagram", "animat", "3d", "picture", "simulat", "concept map"});
    a.requests_practice = contains_any(q, {"quiz", "practice", "test me", "exercise", "problems"});
    a.requests_assessment = a.requests_practice;
    a.requests_study_plan = contains_any(q, {"study plan", "learning path", "roadmap", "curriculum", "plan my"});
    a.requests_additional_materials = contains_any(q, {"video", "resources", "materials", "reading", "links"});
    a.requests_encouragement = contains_any(q, {"frustrated", "confused", "stuck", "give up", "too hard"});
    a.requests_feedback = contains_any(q, {"is this right", "check my", "feedback", "did i get"});

    a.needs_explanation =
        !a.concepts.empty() || contains_any(q, {"how", "why", "what", "explain", "describe", "mechanism"});
    a.needs_visualization = a.requests_visual_content;
    a.needs_assessment = a.requests_assessment;
    a.needs_learning_path = a.requests_study_plan;
    a.needs_resources = a.requests_additional_materials;

    if (a.requests_assessment) {
      a.intent = "assessment";
    } else if (a.requests_study_plan) {
      a.intent = "study_plan";
    } else if (a.requests_additional_materials) {
      a.intent = "resources";
    } else if (a.requests_encouragement) {
      a.intent = "encouragement";
    } else if (a.requests_feedback) {
      a.intent = "feedback";
    }

    if (contains_any(q, {"3d"})) {
      a.preferred_visualization = "3d";
    } else if (contains_any(q, {"simulat"})) {
      a.preferred_visualization = "simulation";
    } else if (contains_any(q, {"concept map"})) {
      a.preferred_visualization = "concept-map";
    } else if (contains_any(q, {"diagram", "draw"})) {
      a.preferred_visualization = "diagram";
    } else if (contains_any(q, {"animat"})) {
      a.preferred_visualization = "animation";
    }

    a.preferred_question_type = contains_any(q, {"short answer", "explain why"}) ? "short_answer" : "multiple_choice";
    if (contains_any(q, {"video"})) {
      a.preferred_resource_types.push_back("video");
    }
    if (contains_any(q, {"article", "reading"})) {
      a.preferred_resource_types.push_back("article");
    }
    if (a.preferred_resource_types.empty()) {
      a.preferred_resource_types = {"video", "article"};
    }

    int difficulty = context.student_level == Complexity::kBeginner
                         ? 2
                         : (context.student_level == Complexity::kAdvanced ? 4 : 3);
    if (contains_any(q, {"harder", "challenging", "advanced"})) {
      ++difficulty;
    }
    if (contains_any(q, {"easier", "simple", "basic"})) {
      --difficulty;
    }
    a.requested_difficulty = std::clamp(difficulty, 1, 5);

    for (const auto& c : a.concepts) {
      a.learning_goals.push_back("Understand " + c);
    }
    return a;
  }

 protected:
  Payload process_message(const AgentMessage& msg, const Deadline&) override {
    return std::visit(overloaded{
                          [](const ProcessQueryRequest& r) -> Payload { return analyze(r.query, r.context); },
                          [this](const ComposeReplyRequest& r) -> Payload { return compose_reply(r); },
                          [this, &msg](const auto&) -> Payload { unsupported(msg); },
                      },
                      *msg.payload);
  }

 private:
  AgentContribution compose_reply(const ComposeReplyRequest& r) {
    const QueryAnalysis& a = r.analysis;
    AgentContribution out;
    const std::string prompt = "You are a patient organic chemistry tutor. The student (" +
                               std::string(complexity_name(a.context.student_level)) + " level) asked: \"" +
                               a.original_query + "\". Reply conversationally in a few sentences" +
                               (a.requests_encouragement ? " and encourage them." : ".");
    try {
      const AiResponse ai = query_ai(prompt, stage_input_json(r));
      out.text = ai.response;
      out.confidence = ai.confidence.value_or(0.85);
      out.sources.push_back("ai_conversation");
    } catch (const AgentError& e) {
      Logger::log(Logger::Level::kWarn, "Conversation reply fell back to template: " + std::string(e.what()));
      out.text = template_reply(a);
      out.confidence = 0.6;
    }
    return out;
  }

  static std::string template_reply(const QueryAnalysis& a) {
    std::string text;
    if (a.requests_encouragement) {
      text = "It's normal to find this tricky, and you're asking exactly the right questions. ";
    }
    if (a.concepts.empty()) {
      return text + "Let's work through your question step by step.";
    }
    return text + "Let's work through " + join(a.concepts, " and ") + " step by step.";
  }
};

// Detailed concept explanations backed by the AI service.
class ContentSpecialistAgent : public Agent {
 public:
  ContentSpecialistAgent(AgentDeps deps, AgentConfig config)
      : Agent(AgentType::kContentSpecialist, std::move(deps), std::move(config)) {}

  std::vector<std::string> capabilities() const override {
    return {"explain_concept", "analyze_prerequisites", "suggest_pathway"};
  }

 protected:
  Payload process_message(const AgentMessage& msg, const Deadline& deadline) override {
    const auto* req = std::get_if<ExplainConceptRequest>(&*msg.payload);
    if (!req) {
      unsupported(msg);
    }

    const std::string concept_name = req->concepts.empty() ? req->analysis.original_query : req->concepts.front();
    const ConceptEntry* entry = find_concept(concept_name);

    std::string prompt = "Explain " + concept_name + " to a " + complexity_name(req->difficulty) +
                         " organic chemistry student. Cover the mechanism, a worked example and one common "
                         "misconception.";
    if (entry && !entry->prerequisites.empty()) {
      prompt += " Assume they know: " + join(entry->prerequisites, ", ") + ".";
    }
    const AiResponse ai =
        query_ai(prompt, json{{"concept", concept_name}, {"difficulty", complexity_name(req->difficulty)}});

    AgentContribution out;
    out.text = ai.response;
    out.confidence = ai.confidence.value_or(0.8);
    out.sources = {"chemistry_knowledge_base", "ai_explanation"};
    if (entry) {
      out.prerequisites = entry->prerequisites;
      out.related_topics = entry->next_concepts;
    }

    if (!deadline.cancelled()) {
      try {
        const auto videos = services().search_videos(concept_name + " organic chemistry");
        for (std::size_t i = 0; i < videos.size() && i < static_cast<std::size_t>(kMaxVideosPerTopic); ++i) {
          out.videos.push_back(videos[i].to_json());
        }
        if (!out.videos.empty()) {
          out.sources.push_back("video_search");
        }
      } catch (const AgentError& e) {
        Logger::log(Logger::Level::kWarn, "Video lookup for " + concept_name + " failed: " + e.what());
      }
    }

    services().track_event("concept_explained",
                           json{{"concept", concept_name},
                                {"difficulty", complexity_name(req->difficulty)},
                                {"hasPrerequisites", !out.prerequisites.empty()},
                                {"explanationLength", out.text.size()}},
                           AgentType::kContentSpecialist, req->analysis.context.user_id);
    return out;
  }
};

// Runs the adaptive modality engine for each requested concept.
class VisualLearningAgent : public Agent {
 public:
  VisualLearningAgent(AgentDeps deps, AgentConfig config, std::shared_ptr<AdaptiveEngine> engine)
      : Agent(AgentType::kVisualLearning, std::move(deps), std::move(config)), engine_(std::move(engine)) {
    if (!engine_) {
      throw AgentError(ErrorCode::kConfigurationError, "visual learning agent needs an adaptive engine", "",
                       AgentType::kVisualLearning);
    }
  }

  std::vector<std::string> capabilities() const override {
    return {"create_visualization", "adaptive_modality_selection", "confusion_detection"};
  }

  static Complexity detail_to_complexity(const std::string& detail, Complexity fallback) {
    const std::string d = to_lower(detail);
    if (d == "low" || d == "basic") {
      return Complexity::kBeginner;
    }
    if (d == "high" || d == "detailed") {
      return Complexity::kAdvanced;
    }
    if (d == "medium") {
      return Complexity::kIntermediate;
    }
    return fallback;
  }

 protected:
  Payload process_message(const AgentMessage& msg, const Deadline& deadline) override {
    const auto* req = std::get_if<VisualizationRequest>(&*msg.payload);
    if (!req) {
      unsupported(msg);
    }

    std::vector<std::string> concepts = req->concepts;
    if (concepts.empty()) {
      concepts.push_back(req->analysis.context.current_topic.empty() ? req->analysis.original_query
                                                                     : req->analysis.context.current_topic);
    }
    const std::string& user_id = req->analysis.context.user_id;
    const std::optional<std::string> user =
        user_id.empty() ? std::nullopt : std::optional<std::string>(user_id);

    AgentContribution out;
    std::vector<std::string> failures;
    for (std::size_t i = 0; i < concepts.size() && i < kMaxVisualizedConcepts; ++i) {
      if (deadline.cancelled()) {
        break;
      }
      const ConceptAnalysis analysis = build_analysis(concepts[i], *req);
      LearningQuery query;
      query.text = req->analysis.original_query;
      query.user_id = user_id;

      try {
        const GeneratedContent content = engine_->generate_adaptive_content(query, analysis, user);
        json visual = to_json(content);
        out.visualizations.push_back(visual);
        if (content.modality == Modality::kSimulation || content.modality == Modality::kInteractive) {
          out.interactive.push_back(visual);
        }
        if (user.has_value()) {
          engine_->start_adaptive_session(*user, content.id);
        }
      } catch (const AgentError& e) {
        failures.push_back(e.what());
      }
    }

    if (out.visualizations.empty()) {
      throw AgentError(ErrorCode::kGenerationExhausted,
                       failures.empty() ? "no visualization produced" : join(failures, "; "), msg.id,
                       AgentType::kVisualLearning);
    }
    for (const auto& e : engine_->adaptation_events(user_id)) {
      if (std::find(concepts.begin(), concepts.end(), e.concept_name) != concepts.end()) {
        out.adaptations.push_back(to_json(e));
      }
    }
    out.confidence = failures.empty() ? 0.8 : 0.6;
    out.sources.push_back("adaptive_content_engine");
    return out;
  }

  void on_notification(const Notification& n) override {
    if (n.kind != "content_understood") {
      return;
    }
    engine_->stop_adaptive_session(n.data.value("userId", ""), n.data.value("contentId", ""));
  }

 private:
  static ConceptAnalysis build_analysis(const std::string& concept_name, const VisualizationRequest& req) {
    ConceptAnalysis a;
    a.topic = concept_name;
    const ConceptEntry* entry = find_concept(concept_name);
    const Complexity base = entry ? entry->complexity : req.analysis.context.student_level;
    a.complexity = detail_to_complexity(req.complexity, base);
    a.keywords = entry ? entry->keywords : split_words(to_lower(req.analysis.original_query));
    if (entry) {
      a.prerequisites = entry->prerequisites;
    }
    const auto preferred = parse_modality(req.visualization_type);
    a.suggested_modality = preferred.value_or(modality_from_topic(a));
    return a;
  }

  std::shared_ptr<AdaptiveEngine> engine_;
};

// Practice questions, from the AI service when available, else from templates.
class AssessmentAgent : public Agent {
 public:
  AssessmentAgent(AgentDeps deps, AgentConfig config)
      : Agent(AgentType::kAssessment, std::move(deps), std::move(config)) {}

  std::vector<std::string> capabilities() const override { return {"generate_question", "evaluate_answer"}; }

  static std::vector<json> template_questions(const std::vector<std::string>& concepts, int difficulty,
                                              const std::string& question_type) {
    std::vector<json> out;
    for (const auto& c : concepts) {
      json q{{"id", sequential_id("question")},
             {"concept", c},
             {"type", question_type},
             {"difficulty", difficulty}};
      if (question_type == "multiple_choice") {
        q["prompt"] = "Which statement about " + c + " is correct?";
        q["options"] = json::array({"It depends only on the substrate", "It depends on the reaction conditions",
                                    "It never occurs in solution", "It only occurs in the gas phase"});
        q["answer"] = 1;
      } else {
        q["prompt"] = "In your own words, explain the key idea behind " + c + ".";
      }
      out.push_back(std::move(q));
    }
    return out;
  }

 protected:
  Payload process_message(const AgentMessage& msg, const Deadline&) override {
    const auto* req = std::get_if<AssessmentRequest>(&*msg.payload);
    if (!req) {
      unsupported(msg);
    }
    std::vector<std::string> concepts = req->concepts;
    if (concepts.empty()) {
      concepts.push_back(req->analysis.original_query);
    }
    const std::string type = req->question_type.empty() ? "multiple_choice" : req->question_type;

    AgentContribution out;
    try {
      const AiResponse ai = query_ai("Write " + std::to_string(concepts.size()) + " " + type +
                                         " question(s) at difficulty " + std::to_string(req->difficulty) +
                                         "/5 about: " + join(concepts, ", ") +
                                         ". Reply with a JSON array of objects with prompt, options and answer.",
                                     json{{"concepts", concepts}, {"difficulty", req->difficulty}});
      const json parsed = json::parse(ai.response);
      if (!parsed.is_array() || parsed.empty()) {
        throw AgentError(ErrorCode::kProcessingError, "question list was empty", msg.id, AgentType::kAssessment);
      }
      for (const auto& q : parsed) {
        if (q.is_object() && q.contains("prompt") && q["prompt"].is_string()) {
          out.assessments.push_back(q);
        }
      }
      if (!out.assessments.empty()) {
        out.confidence = ai.confidence.value_or(0.85);
        out.sources.push_back("ai_assessment");
      } else {
        Logger::log(Logger::Level::kWarn, "Assessment reply had no usable questions");
      }
    } catch (const json::parse_error& e) {
      Logger::log(Logger::Level::kWarn, std::string("Assessment reply was not JSON: ") + e.what());
    } catch (const AgentError& e) {
      Logger::log(Logger::Level::kWarn, std::string("Assessment generation fell back to templates: ") + e.what());
    }

    if (out.assessments.empty()) {
      out.assessments = template_questions(concepts, req->difficulty, type);
      out.confidence = 0.7;
      out.sources.push_back("question_templates");
    }
    return out;
  }
};

// External videos and reading for the query's topics.
class ResourceAgent : public Agent {
 public:
  ResourceAgent(AgentDeps deps, AgentConfig config)
      : Agent(AgentType::kResource, std::move(deps), std::move(config)) {}

  std::vector<std::string> capabilities() const override { return {"find_resources", "video_search"}; }

 protected:
  Payload process_message(const AgentMessage& msg, const Deadline& deadline) override {
    const auto* req = std::get_if<ResourceRequest>(&*msg.payload);
    if (!req) {
      unsupported(msg);
    }
    std::vector<std::string> topics = req->topics;
    if (topics.empty()) {
      topics.push_back(req->analysis.original_query);
    }
    const bool want_videos = req->resource_types.empty() ||
                             std::find(req->resource_types.begin(), req->resource_types.end(), "video") !=
                                 req->resource_types.end();
    const bool want_articles = req->resource_types.empty() ||
                               std::find(req->resource_types.begin(), req->resource_types.end(), "article") !=
                                   req->resource_types.end();

    AgentContribution out;
    for (const auto& topic : topics) {
      if (deadline.cancelled()) {
        break;
      }
      if (want_videos) {
        const auto videos = services().search_videos(topic, "organic chemistry", kMaxVideosPerTopic);
        for (const auto& v : videos) {
          out.videos.push_back(v.to_json());
        }
      }
      if (want_articles) {
        out.resources.push_back(json{{"title", topic + " practice problems"},
                                     {"type", "article"},
                                     {"topic", topic},
                                     {"source", "chemistry_knowledge_base"}});
      }
    }
    out.sources.push_back("youtube");
    if (want_articles) {
      out.sources.push_back("chemistry_knowledge_base");
    }
    out.confidence = out.videos.empty() ? 0.6 : 0.8;
    return out;
  }
};

// Orders concepts into a study path using the catalog's prerequisites.
class PedagogyAgent : public Agent {
 public:
  PedagogyAgent(AgentDeps deps, AgentConfig config)
      : Agent(AgentType::kPedagogy, std::move(deps), std::move(config)) {}

  std::vector<std::string> capabilities() const override { return {"create_learning_path", "adapt_pacing"}; }

 protected:
  Payload process_message(const AgentMessage& msg, const Deadline&) override {
    const auto* req = std::get_if<LearningPathRequest>(&*msg.payload);
    if (!req) {
      unsupported(msg);
    }
    const QueryAnalysis& a = req->analysis;

    AgentContribution out;
    std::vector<std::string> path;
    for (const auto& c : a.concepts) {
      if (const ConceptEntry* entry = find_concept(c)) {
        for (const auto& p : entry->prerequisites) {
          if (std::find(path.begin(), path.end(), p) == path.end()) {
            path.push_back(p);
            out.next_steps.push_back("Review " + p);
          }
        }
      }
    }
    for (const auto& c : a.concepts) {
      out.next_steps.push_back("Practice " + c);
    }
    if (req->prior.count(AgentType::kAssessment) != 0) {
      out.next_steps.push_back("Work through the practice questions above");
    }
    for (const auto& c : a.concepts) {
      if (const ConceptEntry* entry = find_concept(c)) {
        for (const auto& n : entry->next_concepts) {
          out.next_steps.push_back("Then move on to " + n);
        }
      }
    }
    if (out.next_steps.empty()) {
      out.next_steps.push_back("Tell me which topic you want to master first");
    }

    const std::string pace = a.context.student_level == Complexity::kBeginner
                                 ? "slow"
                                 : (a.context.student_level == Complexity::kAdvanced ? "fast" : "moderate");
    out.adaptations.push_back(json{{"type", "pacing"}, {"value", pace}});
    out.text = a.learning_goals.empty() ? "" : "Study plan: " + join(a.learning_goals, "; ") + ".";
    out.confidence = 0.8;
    out.sources.push_back("learning_path_planner");

    if (!a.context.user_id.empty() && !a.concepts.empty()) {
      broadcast_notification("learning_milestone", json{{"userId", a.context.user_id},
                                                        {"milestone", "learning_path_created"},
                                                        {"concepts", a.concepts}});
    }
    return out;
  }
};

// Builds the built-in agent for a type. The orchestrator itself is not an agent.
inline std::shared_ptr<Agent> make_agent(AgentType type, AgentDeps deps, AgentConfig config,
                                         std::shared_ptr<AdaptiveEngine> engine) {
  switch (type) {
    case AgentType::kConversation:
      return std::make_shared<ConversationAgent>(std::move(deps), std::move(config));
    case AgentType::kContentSpecialist:
      return std::make_shared<ContentSpecialistAgent>(std::move(deps), std::move(config));
    case AgentType::kVisualLearning:
      return std::make_shared<VisualLearningAgent>(std::move(deps), std::move(config), std::move(engine));
    case AgentType::kAssessment:
      return std::make_shared<AssessmentAgent>(std::move(deps), std::move(config));
    case AgentType::kResource:
      return std::make_shared<ResourceAgent>(std::move(deps), std::move(config));
    case AgentType::kPedagogy:
      return std::make_shared<PedagogyAgent>(std::move(deps), std::move(config));
    case AgentType::kOrchestrator:
      break;
  }
  throw AgentError(ErrorCode::kConfigurationError, "Cannot create orchestrator agent");
}

}  // namespace polytutor
