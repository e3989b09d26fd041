#pragma once

#include <algorithm>
#include <chrono>
#include <iterator>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "polytutor/common.hpp"
#include "polytutor/deadline.hpp"
#include "polytutor/errors.hpp"
#include "polytutor/events.hpp"
#include "polytutor/generators.hpp"
#include "polytutor/learning_types.hpp"
#include "polytutor/predictor.hpp"
#include "polytutor/timers.hpp"
#include "polytutor/user_model.hpp"

namespace polytutor {

inline constexpr std::size_t kMaxGenerationCandidates = 4;
inline constexpr int kMaxDepth = 4;

struct EngineOptions {
  std::chrono::milliseconds generation_timeout{30000};
  std::chrono::milliseconds confusion_timeout{45000};
};

struct ModalitySuggestion {
  Modality modality{Modality::kText};
  std::string reasoning;
};

// Modality implied by topic keywords alone, for callers without a user.
inline Modality modality_from_topic(const ConceptAnalysis& analysis) {
  const std::string topic = to_lower(analysis.topic);
  if (contains_any(topic, {"network", "system"})) {
    return Modality::kConceptMap;
  }
  if (contains_any(topic, {"structure", "dna"})) {
    return Modality::k3d;
  }
  if (contains_any(topic, {"process", "cycle"})) {
    return Modality::kAnimation;
  }
  if (contains_any(topic, {"gravity", "simulation"})) {
    return Modality::kSimulation;
  }
  return Modality::kAnimation;
}

inline std::vector<Modality> static_fallback_chain(Modality primary) {
  using M = Modality;
  switch (primary) {
    case M::kAnimation:
      return {M::kAnimation, M::kSimulation, M::kDiagram, M::kText};
    case M::kSimulation:
      return {M::kSimulation, M::kAnimation, M::k3d, M::kDiagram};
    case M::k3d:
      return {M::k3d, M::kAnimation, M::kSimulation, M::kDiagram};
    case M::kConceptMap:
      return {M::kConceptMap, M::kDiagram, M::kAnimation, M::kText};
    case M::kDiagram:
      return {M::kDiagram, M::kAnimation, M::kText};
    case M::kInteractive:
      return {M::kSimulation, M::kAnimation, M::k3d, M::kDiagram};
    case M::kText:
      return {M::kText, M::kDiagram};
  }
  return {M::kAnimation, M::kText};
}

// Chooses a modality per learner and walks a finite fallback chain until one
// generator succeeds. Owns the per-user models and the adaptation log.
class AdaptiveEngine {
 public:
  explicit AdaptiveEngine(std::shared_ptr<GeneratorRegistry> generators, EventHub* events = nullptr,
                          EngineOptions options = {})
      : generators_(std::move(generators)), events_(events), options_(options) {
    if (!generators_) {
      throw AgentError(ErrorCode::kConfigurationError, "adaptive engine needs a generator registry");
    }
  }

  ~AdaptiveEngine() { timers_.stop(); }

  AdaptiveEngine(const AdaptiveEngine&) = delete;
  AdaptiveEngine& operator=(const AdaptiveEngine&) = delete;

  Recommendation recommend(const std::string& user_id, const std::string& concept_name,
                           const ConceptAnalysis& analysis) {
    return predictor_for(user_id)->predict_best_modality(concept_name, analysis);
  }

  // At most four distinct modalities, best first.
  std::vector<Modality> candidate_modalities(const ConceptAnalysis& analysis,
                                             const std::optional<std::string>& user_id) {
    std::vector<Modality> chain;
    if (user_id.has_value() && !user_id->empty()) {
      const Recommendation r = predictor_for(*user_id)->predict_best_modality(analysis.topic, analysis);
      chain.push_back(r.recommended);
      chain.insert(chain.end(), r.fallbacks.begin(), r.fallbacks.end());
    } else {
      chain = static_fallback_chain(modality_from_topic(analysis));
    }

    std::vector<Modality> out;
    for (const Modality m : chain) {
      if (std::find(out.begin(), out.end(), m) == out.end()) {
        out.push_back(m);
      }
      if (out.size() == kMaxGenerationCandidates) {
        break;
      }
    }
    return out;
  }

  GeneratedContent generate_adaptive_content(const LearningQuery& query, const ConceptAnalysis& analysis,
                                             const std::optional<std::string>& user_id = std::nullopt) {
    const std::vector<Modality> candidates = candidate_modalities(analysis, user_id);
    const Modality primary = candidates.front();
    const std::string uid = user_id.value_or("");

    std::vector<std::string> failures;
    for (std::size_t i = 0; i < candidates.size(); ++i) {
      const Modality m = candidates[i];
      try {
        GeneratedContent content = generate_once(query, analysis, m);
        if (i > 0) {
          record_event(AdaptationTrigger::kSystemSuggestion, primary, m, analysis.topic, uid, true);
        }
        return content;
      } catch (const std::exception& e) {
        Logger::log(Logger::Level::kWarn,
                    std::string(modality_name(m)) + " generation failed for " + analysis.topic + ": " + e.what());
        failures.push_back(std::string(modality_name(m)) + ": " + e.what());
        if (i > 0) {
          record_event(AdaptationTrigger::kSystemSuggestion, primary, m, analysis.topic, uid, false);
        }
      }
    }

    throw AgentError(ErrorCode::kGenerationExhausted,
                     "All modalities failed for concept: " + analysis.topic + " (" + join(failures, "; ") + ")",
                     query.id);
  }

  // Arms a confusion timer for (user, content). Firing only emits an event.
  void start_adaptive_session(const std::string& user_id, const std::string& content_id) {
    EventHub* events = events_;
    timers_.schedule(session_key(user_id, content_id), options_.confusion_timeout, [events, user_id, content_id]() {
      Logger::log(Logger::Level::kInfo, "Possible confusion: " + user_id + " on " + content_id);
      if (events) {
        events->emit(kEventConfusionDetected, json{{"userId", user_id}, {"contentId", content_id}});
      }
    });
  }

  void stop_adaptive_session(const std::string& user_id, const std::string& content_id) {
    timers_.cancel(session_key(user_id, content_id));
  }

  bool session_active(const std::string& user_id, const std::string& content_id) const {
    return timers_.pending(session_key(user_id, content_id));
  }

  void record_user_interaction(const UserInteraction& interaction) {
    if (auto e = predictor_for(interaction.user_id)->update_beliefs_after_interaction(interaction)) {
      append_event(*e);
    }
    if (interaction.understood) {
      stop_adaptive_session(interaction.user_id, interaction.content_id);
    }
  }

  ModalitySuggestion suggest_alternative_modality(const std::string& user_id, Modality current,
                                                  const std::string& concept_name, const ConceptAnalysis& analysis) {
    for (const auto& r : predictor_for(user_id)->ranked_recommendations(concept_name, analysis)) {
      if (r.recommended != current) {
        record_event(AdaptationTrigger::kConfusionDetected, current, r.recommended, concept_name, user_id, false);
        return ModalitySuggestion{r.recommended, r.reasoning};
      }
    }
    return ModalitySuggestion{Modality::kText, "No better alternative found, trying a simplified text explanation"};
  }

  json user_analytics(const std::string& user_id) {
    auto predictor = predictor_for(user_id);
    const UserModel& model = predictor->model();

    ConceptAnalysis general;
    general.topic = "general";
    json ranked = json::array();
    for (const auto& r : predictor->ranked_recommendations("general", general)) {
      ranked.push_back(to_json(r));
    }
    json events = json::array();
    for (const auto& e : adaptation_events(user_id)) {
      events.push_back(to_json(e));
    }
    return json{{"progress", model.progress().to_json()},
                {"patterns", model.learning_patterns().to_json()},
                {"beliefs", model.beliefs().to_json()},
                {"averageModalitySwitches", model.average_modality_switches()},
                {"adaptationEvents", events},
                {"recommendations", ranked}};
  }

  // Moves one level deeper (max 4) and generates content there. Returns
  // nullopt when already at the deepest level.
  std::optional<GeneratedContent> go_deeper(const std::string& user_id, const ConceptAnalysis& analysis,
                                            Modality modality) {
    return change_depth(user_id, analysis, modality, +1, AdaptationTrigger::kGoDeeper);
  }

  std::optional<GeneratedContent> simplify(const std::string& user_id, const ConceptAnalysis& analysis,
                                           Modality modality) {
    return change_depth(user_id, analysis, modality, -1, AdaptationTrigger::kSimplify);
  }

  int depth(const std::string& user_id, const std::string& concept_name) const {
    std::lock_guard<std::mutex> lock(mu_);
    auto it = depths_.find(session_key(user_id, concept_slug(concept_name)));
    return it == depths_.end() ? 0 : it->second;
  }

  std::vector<AdaptationEvent> adaptation_events(const std::optional<std::string>& user_id = std::nullopt) const {
    std::lock_guard<std::mutex> lock(mu_);
    if (!user_id.has_value()) {
      return events_log_;
    }
    std::vector<AdaptationEvent> out;
    std::copy_if(events_log_.begin(), events_log_.end(), std::back_inserter(out),
                 [&user_id](const AdaptationEvent& e) { return e.user_id == *user_id; });
    return out;
  }

 private:
  struct UserState {
    std::shared_ptr<UserModel> model;
    std::shared_ptr<BayesianPredictor> predictor;
  };

  static std::string session_key(const std::string& a, const std::string& b) { return a + "|" + b; }

  std::shared_ptr<BayesianPredictor> predictor_for(const std::string& user_id) {
    std::lock_guard<std::mutex> lock(mu_);
    auto it = users_.find(user_id);
    if (it == users_.end()) {
      auto model = std::make_shared<UserModel>(user_id);
      it = users_.emplace(user_id, UserState{model, std::make_shared<BayesianPredictor>(model)}).first;
    }
    return it->second.predictor;
  }

  GeneratedContent generate_once(const LearningQuery& query, const ConceptAnalysis& analysis, Modality m) {
    std::shared_ptr<ContentGenerator> generator = generators_->get(m);
    if (!generator) {
      throw AgentError(ErrorCode::kUnsupportedOperation, std::string("no generator for ") + modality_name(m));
    }

    const Deadline deadline(options_.generation_timeout);
    json data = run_with_deadline(
        [generator, analysis](const Deadline& d) { return generator->generate(analysis, d); }, deadline,
        std::string(modality_name(m)) + " generation", query.id);

    GeneratedContent content;
    content.id = concept_slug(analysis.topic) + "_" + std::to_string(now_ms()) + "_" + random_id(6);
    content.query_id = query.id;
    content.modality = m;
    content.data = std::move(data);
    content.metadata.title = "Understanding " + analysis.topic;
    content.metadata.description = std::string(modality_name(m)) + " explanation of " + analysis.topic;
    content.metadata.estimated_duration_s = static_cast<int>(modality_base_time_s(m));
    content.metadata.difficulty = complexity_level(analysis.complexity);
    content.metadata.tags = analysis.keywords;
    return content;
  }

  std::optional<GeneratedContent> change_depth(const std::string& user_id, const ConceptAnalysis& analysis,
                                               Modality modality, int step, AdaptationTrigger trigger) {
    const std::string key = session_key(user_id, concept_slug(analysis.topic));
    int target = 0;
    {
      std::lock_guard<std::mutex> lock(mu_);
      const int current = depths_[key];
      target = current + step;
      if (target < 0 || target > kMaxDepth) {
        return std::nullopt;
      }
    }

    ConceptAnalysis at_depth = analysis;
    at_depth.complexity = target <= 1 ? Complexity::kBeginner
                                      : (target == 2 ? Complexity::kIntermediate : Complexity::kAdvanced);
    LearningQuery query;
    query.text = analysis.topic;
    query.user_id = user_id;
    GeneratedContent content = generate_once(query, at_depth, modality);
    content.data["depth"] = target;

    {
      std::lock_guard<std::mutex> lock(mu_);
      depths_[key] = target;
    }
    record_event(trigger, modality, modality, analysis.topic, user_id, true);
    return content;
  }

  void record_event(AdaptationTrigger trigger, Modality from, Modality to, const std::string& concept_name,
                    const std::string& user_id, bool successful) {
    AdaptationEvent e;
    e.trigger = trigger;
    e.from_modality = from;
    e.to_modality = to;
    e.concept_name = concept_name;
    e.user_id = user_id;
    e.successful = successful;
    append_event(e);
  }

  void append_event(const AdaptationEvent& e) {
    std::lock_guard<std::mutex> lock(mu_);
    events_log_.push_back(e);
  }

  std::shared_ptr<GeneratorRegistry> generators_;
  EventHub* events_;
  EngineOptions options_;

  mutable std::mutex mu_;
  std::map<std::string, UserState> users_;
  std::map<std::string, int> depths_;
  std::vector<AdaptationEvent> events_log_;

  TimerService timers_;
};

}  // namespace polytutor
