#pragma once

#include <optional>
#include <string>
#include <vector>

#include "polytutor/common.hpp"
#include "polytutor/types.hpp"

namespace polytutor {

struct StudentPreferences {
  std::string detail_level{"medium"};
  std::string interactivity{"medium"};
  std::string language{"en"};
};

struct ConversationContext {
  std::string session_id;
  std::string user_id;
  Complexity student_level{Complexity::kIntermediate};
  StudentPreferences preferences{};
  std::vector<std::string> previous_queries;
  std::string current_topic;
};

inline json to_json(const ConversationContext& c) {
  return json{{"sessionId", c.session_id},
              {"userId", c.user_id},
              {"studentLevel", complexity_name(c.student_level)},
              {"preferences",
               {{"detailLevel", c.preferences.detail_level},
                {"interactivity", c.preferences.interactivity},
                {"language", c.preferences.language}}},
              {"previousQueries", c.previous_queries},
              {"currentTopic", c.current_topic}};
}

struct LearningQuery {
  std::string id{sequential_id("query")};
  std::string text;
  std::string timestamp{now_iso8601()};
  std::string user_id;
};

struct ConceptAnalysis {
  std::string topic;
  Complexity complexity{Complexity::kIntermediate};
  std::vector<std::string> keywords;
  Modality suggested_modality{Modality::kAnimation};
  std::vector<std::string> prerequisites;
};

inline json to_json(const ConceptAnalysis& a) {
  return json{{"topic", a.topic},
              {"complexity", complexity_name(a.complexity)},
              {"keywords", a.keywords},
              {"suggestedModality", modality_name(a.suggested_modality)},
              {"prerequisites", a.prerequisites}};
}

struct ContentMetadata {
  std::string title;
  std::string description;
  int estimated_duration_s{60};
  int difficulty{5};
  std::vector<std::string> tags;
};

struct GeneratedContent {
  std::string id;
  std::string query_id;
  Modality modality{Modality::kText};
  json data{json::object()};
  ContentMetadata metadata{};
};

inline json to_json(const GeneratedContent& c) {
  return json{{"id", c.id},
              {"queryId", c.query_id},
              {"modality", modality_name(c.modality)},
              {"data", c.data},
              {"metadata",
               {{"title", c.metadata.title},
                {"description", c.metadata.description},
                {"estimatedDuration", c.metadata.estimated_duration_s},
                {"difficulty", c.metadata.difficulty},
                {"tags", c.metadata.tags}}}};
}

enum class InteractionAction { kView, kInteract, kFeedback, kSwitchModality, kGoDeeper, kSimplify };

struct UserInteraction {
  std::string user_id;
  std::string session_id;
  std::string content_id;
  std::string timestamp{now_iso8601()};
  InteractionAction action{InteractionAction::kView};
  double time_spent_s{0.0};
  Modality modality{Modality::kText};
  bool understood{false};
  bool switched_modality{false};
  std::optional<Modality> previous_modality;
  int depth{0};
};

enum class AdaptationTrigger {
  kTimeThreshold,
  kConfusionDetected,
  kManualSwitch,
  kSystemSuggestion,
  kGoDeeper,
  kSimplify,
};

inline const char* adaptation_trigger_name(AdaptationTrigger t) {
  switch (t) {
    case AdaptationTrigger::kTimeThreshold:
      return "time_threshold";
    case AdaptationTrigger::kConfusionDetected:
      return "confusion_detected";
    case AdaptationTrigger::kManualSwitch:
      return "manual_switch";
    case AdaptationTrigger::kSystemSuggestion:
      return "system_suggestion";
    case AdaptationTrigger::kGoDeeper:
      return "go_deeper";
    case AdaptationTrigger::kSimplify:
      return "simplify";
  }
  return "system_suggestion";
}

struct AdaptationEvent {
  std::string timestamp{now_iso8601()};
  AdaptationTrigger trigger{AdaptationTrigger::kSystemSuggestion};
  Modality from_modality{Modality::kText};
  Modality to_modality{Modality::kText};
  std::string concept_name;
  std::string user_id;
  bool successful{false};
};

inline json to_json(const AdaptationEvent& e) {
  return json{{"timestamp", e.timestamp},
              {"trigger", adaptation_trigger_name(e.trigger)},
              {"fromModality", modality_name(e.from_modality)},
              {"toModality", modality_name(e.to_modality)},
              {"concept", e.concept_name},
              {"userId", e.user_id},
              {"successful", e.successful}};
}

struct Recommendation {
  std::string concept_name;
  Modality recommended{Modality::kAnimation};
  double confidence{0.0};
  std::string reasoning;
  std::vector<Modality> fallbacks;
  ModalityTable<double> probabilities{};
};

inline json to_json(const Recommendation& r) {
  json fallbacks = json::array();
  for (const Modality m : r.fallbacks) {
    fallbacks.push_back(modality_name(m));
  }
  json probs = json::object();
  for (const Modality m : kAllModalities) {
    probs[modality_name(m)] = r.probabilities[modality_index(m)];
  }
  return json{{"concept", r.concept_name},
              {"recommendedModality", modality_name(r.recommended)},
              {"confidence", r.confidence},
              {"reasoning", r.reasoning},
              {"fallbacks", fallbacks},
              {"probabilities", probs}};
}

}  // namespace polytutor
