#pragma once

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include "polytutor/common.hpp"
#include "polytutor/learning_types.hpp"
#include "polytutor/types.hpp"
#include "polytutor/user_model.hpp"

namespace polytutor {

enum class ConceptType { kProcess, kStructure, kSystem, kRelationship };

inline const char* concept_type_name(ConceptType t) {
  switch (t) {
    case ConceptType::kProcess:
      return "process";
    case ConceptType::kStructure:
      return "structure";
    case ConceptType::kSystem:
      return "system";
    case ConceptType::kRelationship:
      return "relationship";
  }
  return "process";
}

inline ConceptType infer_concept_type(const ConceptAnalysis& analysis) {
  std::vector<std::string> keywords;
  for (const auto& k : analysis.keywords) {
    keywords.push_back(to_lower(k));
  }
  const std::string topic = to_lower(analysis.topic);
  auto any_keyword = [&keywords](const std::vector<std::string>& needles) {
    return std::any_of(keywords.begin(), keywords.end(),
                       [&needles](const std::string& k) { return contains_any(k, needles); });
  };

  if (any_keyword({"process", "flow", "cycle", "reaction", "synthesis"}) || contains_any(topic, {"how", "work"})) {
    return ConceptType::kProcess;
  }
  if (any_keyword({"structure", "anatomy", "molecule", "dna", "cell", "organ"}) || contains_any(topic, {"structure"})) {
    return ConceptType::kStructure;
  }
  if (any_keyword({"system", "network", "organization", "framework"}) || contains_any(topic, {"system", "network"})) {
    return ConceptType::kSystem;
  }
  if (any_keyword({"relationship", "connection", "cause", "effect", "correlation"})) {
    return ConceptType::kRelationship;
  }
  return ConceptType::kProcess;
}

// Prior effectiveness of each modality, indexed like kAllModalities.
inline constexpr ModalityTable<double> kModalityPriors = {0.25, 0.20, 0.15, 0.15, 0.15, 0.05, 0.05};

inline const ModalityTable<double>& concept_type_weights(ConceptType t) {
  //                                                 anim  sim   3d    cmap  diag  inter text
  static constexpr ModalityTable<double> kProcess = {0.40, 0.30, 0.10, 0.10, 0.05, 0.03, 0.02};
  static constexpr ModalityTable<double> kStructure = {0.20, 0.03, 0.40, 0.10, 0.25, 0.01, 0.01};
  static constexpr ModalityTable<double> kSystem = {0.10, 0.30, 0.03, 0.40, 0.15, 0.01, 0.01};
  static constexpr ModalityTable<double> kRelationship = {0.15, 0.10, 0.03, 0.45, 0.25, 0.01, 0.01};
  switch (t) {
    case ConceptType::kProcess:
      return kProcess;
    case ConceptType::kStructure:
      return kStructure;
    case ConceptType::kSystem:
      return kSystem;
    case ConceptType::kRelationship:
      return kRelationship;
  }
  return kProcess;
}

inline double modality_complexity_bonus(Modality m) {
  switch (m) {
    case Modality::kText:
      return 0.9;
    case Modality::kDiagram:
      return 0.95;
    case Modality::kAnimation:
    case Modality::kInteractive:
      return 1.0;
    case Modality::kSimulation:
      return 1.1;
    case Modality::k3d:
      return 1.05;
    case Modality::kConceptMap:
      return 1.15;
  }
  return 1.0;
}

inline double complexity_match(Complexity concept_complexity, double user_preference, Modality m) {
  const double diff = std::abs(static_cast<double>(complexity_level(concept_complexity)) - user_preference);
  return (std::max)(0.3, 1.0 - diff / 10.0) * modality_complexity_bonus(m);
}

inline double time_efficiency(Modality m, double learning_speed) {
  const double t = modality_base_time_s(m);
  if (learning_speed > 1.2) {
    return (std::max)(0.5, 2.0 - t / 60.0);
  }
  if (learning_speed < 0.8) {
    return (std::min)(1.5, 0.5 + t / 120.0);
  }
  return 1.0;
}

struct ConfidenceInterval {
  double lower{0.2};
  double upper{0.8};
};

struct LearningOutcome {
  double success_probability{0.0};
  double expected_time_s{0.0};
  std::string confidence_level{"low"};

  json to_json() const {
    return json{{"successProbability", success_probability},
                {"expectedTime", expected_time_s},
                {"confidenceLevel", confidence_level}};
  }
};

// Weighted-scoring modality ranking over one user's beliefs.
class BayesianPredictor {
 public:
  explicit BayesianPredictor(std::shared_ptr<UserModel> model) : model_(std::move(model)) {}

  const UserModel& model() const { return *model_; }

  // Normalized score of every modality; the entries sum to 1.
  ModalityTable<double> modality_probabilities(const ConceptAnalysis& analysis) const {
    const BayesianBeliefs beliefs = model_->beliefs();
    const ConceptType type = infer_concept_type(analysis);
    const auto& weights = concept_type_weights(type);

    ModalityTable<double> p{};
    double total = 0.0;
    for (const Modality m : kAllModalities) {
      const std::size_t i = modality_index(m);
      double score = kModalityPriors[i];
      score *= 1.0 + beliefs.preference(m);
      score *= 1.0 + weights[i];
      score *= complexity_match(analysis.complexity, beliefs.complexity_preference, m);
      score *= 0.5 + model_->success_rate(m);
      score *= time_efficiency(m, beliefs.learning_speed);
      p[i] = score;
      total += score;
    }

    if (total <= 0.0) {
      p.fill(1.0 / static_cast<double>(kModalityCount));
      return p;
    }
    for (double& v : p) {
      v /= total;
    }
    return p;
  }

  Recommendation predict_best_modality(const std::string& concept_name, const ConceptAnalysis& analysis) const {
    const ModalityTable<double> p = modality_probabilities(analysis);
    const std::vector<Modality> order = rank(p);

    Recommendation r;
    r.concept_name = concept_name;
    r.recommended = order.front();
    r.confidence = p[modality_index(r.recommended)];
    r.reasoning = reasoning(r.recommended, analysis);
    r.fallbacks.assign(order.begin() + 1, order.begin() + 4);
    r.probabilities = p;

    Logger::log(Logger::Level::kDebug, "Recommended " + std::string(modality_name(r.recommended)) + " for " +
                                           concept_name + " (" + r.reasoning + ")");
    return r;
  }

  // One recommendation per modality, best first, without fallbacks.
  std::vector<Recommendation> ranked_recommendations(const std::string& concept_name,
                                                     const ConceptAnalysis& analysis) const {
    const ModalityTable<double> p = modality_probabilities(analysis);
    std::vector<Recommendation> out;
    for (const Modality m : rank(p)) {
      Recommendation r;
      r.concept_name = concept_name;
      r.recommended = m;
      r.confidence = p[modality_index(m)];
      r.reasoning = reasoning(m, analysis);
      r.probabilities = p;
      out.push_back(std::move(r));
    }
    return out;
  }

  // Records the interaction. Returns the manual-switch event it represents, if any.
  std::optional<AdaptationEvent> update_beliefs_after_interaction(const UserInteraction& interaction) {
    model_->record_interaction(interaction);
    if (!interaction.switched_modality && interaction.action != InteractionAction::kSwitchModality) {
      return std::nullopt;
    }

    AdaptationEvent e;
    e.trigger = AdaptationTrigger::kManualSwitch;
    e.from_modality = interaction.previous_modality.value_or(interaction.modality);
    e.to_modality = interaction.modality;
    e.concept_name = concept_key(interaction.content_id);
    e.user_id = interaction.user_id;
    e.successful = interaction.understood;
    return e;
  }

  // Wilson score interval (z = 1.96) around the observed success rate.
  ConfidenceInterval confidence_interval(Modality m) const {
    const std::size_t count = model_->interaction_count(m);
    if (count == 0) {
      return ConfidenceInterval{};
    }
    constexpr double z = 1.96;
    const double n = static_cast<double>(count);
    const double p = model_->success_rate(m);
    const double center = p + z * z / (2.0 * n);
    const double margin = z * std::sqrt((p * (1.0 - p) + z * z / (4.0 * n)) / n);
    const double denom = 1.0 + z * z / n;
    return ConfidenceInterval{(std::max)(0.0, (center - margin) / denom), (std::min)(1.0, (center + margin) / denom)};
  }

  LearningOutcome predict_learning_outcome(const std::string& concept_name, Modality m, double complexity) const {
    const BayesianBeliefs beliefs = model_->beliefs();
    const double factor = (std::max)(0.1, 1.0 - std::abs(complexity - beliefs.complexity_preference) / 10.0);

    LearningOutcome out;
    out.success_probability = (beliefs.preference(m) * 0.4 + model_->success_rate(m) * 0.6) * factor;
    out.expected_time_s = model_->average_time_to_understand(m) * (1.0 + (complexity - 5.0) / 10.0);

    const std::size_t count = model_->interaction_count(m);
    if (count >= 10) {
      out.confidence_level = "high";
    } else if (count >= 3) {
      out.confidence_level = "medium";
    } else {
      out.confidence_level = "low";
    }
    Logger::log(Logger::Level::kDebug, "Outcome for " + concept_name + " via " + modality_name(m) + ": " +
                                           out.confidence_level + " confidence");
    return out;
  }

 private:
  // Highest probability first; ties keep kAllModalities order.
  static std::vector<Modality> rank(const ModalityTable<double>& p) {
    std::vector<Modality> order(kAllModalities.begin(), kAllModalities.end());
    std::stable_sort(order.begin(), order.end(),
                     [&p](Modality a, Modality b) { return p[modality_index(a)] > p[modality_index(b)]; });
    return order;
  }

  static std::string percent(double v) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(0) << v * 100.0;
    return ss.str();
  }

  std::string reasoning(Modality m, const ConceptAnalysis& analysis) const {
    const double success = model_->success_rate(m);
    const double avg_time = model_->average_time_to_understand(m);
    const double pref = model_->beliefs().preference(m);

    std::vector<std::string> reasons;
    if (success > 0.7) {
      reasons.push_back("High success rate (" + percent(success) + "%)");
    }
    if (pref > 0.2) {
      reasons.push_back("Strong user preference (" + percent(pref) + "%)");
    }
    if (avg_time < 60.0) {
      std::ostringstream ss;
      ss << std::fixed << std::setprecision(0) << avg_time;
      reasons.push_back("Quick understanding (avg " + ss.str() + "s)");
    }
    if (analysis.complexity == Complexity::kAdvanced && (m == Modality::kConceptMap || m == Modality::kSimulation)) {
      reasons.push_back("Handles complex concepts well");
    }
    if (analysis.complexity == Complexity::kBeginner && (m == Modality::kAnimation || m == Modality::kDiagram)) {
      reasons.push_back("Good for introductory concepts");
    }
    if (reasons.empty()) {
      reasons.push_back("Based on general effectiveness for this concept type");
    }
    return join(reasons, ", ");
  }

  std::shared_ptr<UserModel> model_;
};

}  // namespace polytutor
