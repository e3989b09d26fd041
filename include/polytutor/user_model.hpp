#pragma once

#include <algorithm>
#include <cmath>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <vector>

#include "polytutor/common.hpp"
#include "polytutor/learning_types.hpp"
#include "polytutor/types.hpp"

namespace polytutor {

inline constexpr double kPreferenceLearningRate = 0.1;
inline constexpr double kComplexityStep = 0.1;
inline constexpr double kDefaultSuccessRate = 0.5;
inline constexpr double kDefaultTimeToUnderstandSec = 60.0;
inline constexpr double kFastLearnerSec = 45.0;
inline constexpr double kSlowLearnerSec = 90.0;

// Typical seconds needed to take in one piece of content of each modality.
inline double modality_base_time_s(Modality m) {
  switch (m) {
    case Modality::kText:
      return 15;
    case Modality::kDiagram:
      return 30;
    case Modality::kAnimation:
      return 45;
    case Modality::k3d:
    case Modality::kInteractive:
      return 90;
    case Modality::kSimulation:
      return 120;
    case Modality::kConceptMap:
      return 180;
  }
  return 60;
}

struct BayesianBeliefs {
  ModalityTable<double> preferences{};
  double complexity_preference{5.0};
  // 1.0 is a typical learner; above 1.2 is fast, below 0.8 slow.
  double learning_speed{1.0};
  std::string last_updated{now_iso8601()};

  double preference(Modality m) const { return preferences[modality_index(m)]; }

  json to_json() const {
    json prefs = json::object();
    for (const Modality m : kAllModalities) {
      prefs[modality_name(m)] = preference(m);
    }
    return json{{"modalityPreferences", prefs},
                {"complexityPreference", complexity_preference},
                {"learningSpeed", learning_speed},
                {"lastUpdated", last_updated}};
  }
};

struct UserProgress {
  std::string user_id;
  std::vector<std::string> concepts_learned;
  double average_comprehension{0.0};
  Modality preferred_modality{Modality::kAnimation};
  std::string learning_speed{"normal"};
  ModalityTable<double> success_rates{};
  ModalityTable<double> time_to_understand_s{};
  std::string last_updated{now_iso8601()};

  json to_json() const {
    json rates = json::object();
    json times = json::object();
    for (const Modality m : kAllModalities) {
      rates[modality_name(m)] = success_rates[modality_index(m)];
      times[modality_name(m)] = time_to_understand_s[modality_index(m)];
    }
    return json{{"userId", user_id},
                {"conceptsLearned", concepts_learned},
                {"averageComprehension", average_comprehension},
                {"preferredModality", modality_name(preferred_modality)},
                {"learningSpeed", learning_speed},
                {"modalitySuccessRates", rates},
                {"averageTimeToUnderstand", times},
                {"lastUpdated", last_updated}};
  }
};

struct LearningPatterns {
  Modality preferred_modality{Modality::kAnimation};
  double preference_confidence{0.0};
  int complexity_level{5};
  std::string speed{"normal"};
  double average_time_s{kDefaultTimeToUnderstandSec};
  std::string recommendation;

  json to_json() const {
    return json{{"preferredModality", modality_name(preferred_modality)},
                {"preferenceConfidence", preference_confidence},
                {"complexityLevel", complexity_level},
                {"speed", speed},
                {"averageTimeSeconds", average_time_s},
                {"recommendation", recommendation}};
  }
};

// Lowercase, '-'-separated form of a concept name, safe to embed in ids.
inline std::string concept_slug(const std::string& name) {
  std::string out;
  for (const char c : to_lower(trim(name))) {
    if (std::isalnum(static_cast<unsigned char>(c)) != 0) {
      out.push_back(c);
    } else if (!out.empty() && out.back() != '-') {
      out.push_back('-');
    }
  }
  while (!out.empty() && out.back() == '-') {
    out.pop_back();
  }
  return out.empty() ? "concept" : out;
}

// Concept a piece of content belongs to: the content id up to the first '_'.
inline std::string concept_key(const std::string& content_id) {
  const auto p = content_id.find('_');
  return p == std::string::npos || p == 0 ? content_id : content_id.substr(0, p);
}

// Interaction history and belief state of one learner.
class UserModel {
 public:
  explicit UserModel(std::string user_id) : user_id_(std::move(user_id)) {
    progress_.user_id = user_id_;
    for (const Modality m : kAllModalities) {
      progress_.success_rates[modality_index(m)] = kDefaultSuccessRate;
      progress_.time_to_understand_s[modality_index(m)] = modality_base_time_s(m);
    }
  }

  const std::string& user_id() const { return user_id_; }

  void record_interaction(const UserInteraction& interaction) {
    std::lock_guard<std::mutex> lock(mu_);
    interactions_.push_back(interaction);
    update_progress(interaction);
    update_beliefs(interaction);
  }

  double success_rate(Modality m) const {
    std::lock_guard<std::mutex> lock(mu_);
    return success_rate_locked(m);
  }

  double average_time_to_understand(Modality m) const {
    std::lock_guard<std::mutex> lock(mu_);
    return average_time_locked(m);
  }

  std::size_t interaction_count(Modality m) const {
    std::lock_guard<std::mutex> lock(mu_);
    return static_cast<std::size_t>(std::count_if(interactions_.begin(), interactions_.end(),
                                                  [m](const UserInteraction& i) { return i.modality == m; }));
  }

  std::size_t interaction_count() const {
    std::lock_guard<std::mutex> lock(mu_);
    return interactions_.size();
  }

  // Mean number of extra modalities needed per concept, over the concepts
  // that needed at least one switch.
  double average_modality_switches() const {
    std::lock_guard<std::mutex> lock(mu_);
    std::map<std::string, std::set<Modality>> by_concept;
    for (const auto& i : interactions_) {
      by_concept[concept_key(i.content_id)].insert(i.modality);
    }
    double total = 0.0;
    int concepts = 0;
    for (const auto& kv : by_concept) {
      if (kv.second.size() > 1) {
        total += static_cast<double>(kv.second.size() - 1);
        ++concepts;
      }
    }
    return concepts > 0 ? total / concepts : 0.0;
  }

  // 1-10 rating from time spent, switches and whether the concept was ever
  // understood. 5 when there is no history.
  double concept_difficulty(const std::string& concept_name) const {
    const std::string needle = concept_slug(concept_name);

    std::lock_guard<std::mutex> lock(mu_);
    double time_sum = 0.0;
    int n = 0;
    bool switched = false;
    bool understood = false;
    for (const auto& i : interactions_) {
      if (to_lower(i.content_id).find(needle) == std::string::npos) {
        continue;
      }
      time_sum += i.time_spent_s;
      ++n;
      switched = switched || i.switched_modality;
      understood = understood || i.understood;
    }
    if (n == 0) {
      return 5.0;
    }

    double difficulty = std::clamp(time_sum / n / 30.0, 1.0, 10.0);
    if (switched) {
      difficulty += 2.0;
    }
    if (!understood) {
      difficulty += 3.0;
    }
    return (std::min)(difficulty, 10.0);
  }

  LearningPatterns learning_patterns() const {
    std::lock_guard<std::mutex> lock(mu_);
    LearningPatterns p;

    // Preferred modality needs at least two interactions to count.
    double best_rate = -1.0;
    for (const Modality m : kAllModalities) {
      const auto count = std::count_if(interactions_.begin(), interactions_.end(),
                                       [m](const UserInteraction& i) { return i.modality == m; });
      const double rate = progress_.success_rates[modality_index(m)];
      if (count >= 2 && rate > best_rate) {
        best_rate = rate;
        p.preferred_modality = m;
      }
    }
    p.preference_confidence = best_rate < 0 ? 0.0 : best_rate;
    p.complexity_level = static_cast<int>(std::lround(std::clamp(beliefs_.complexity_preference, 1.0, 10.0)));

    p.average_time_s = kDefaultTimeToUnderstandSec;
    if (!interactions_.empty()) {
      double sum = 0.0;
      for (const auto& i : interactions_) {
        sum += i.time_spent_s;
      }
      p.average_time_s = sum / static_cast<double>(interactions_.size());
    }

    if (p.average_time_s < kFastLearnerSec) {
      p.speed = "fast";
      p.recommendation = "Can handle more complex concepts and faster pacing";
    } else if (p.average_time_s > kSlowLearnerSec) {
      p.speed = "slow";
      p.recommendation = "Benefits from more detailed explanations and practice time";
    } else {
      p.speed = "normal";
      p.recommendation = "Current pacing works well, continue with a balanced approach";
    }
    return p;
  }

  BayesianBeliefs beliefs() const {
    std::lock_guard<std::mutex> lock(mu_);
    return beliefs_;
  }

  UserProgress progress() const {
    std::lock_guard<std::mutex> lock(mu_);
    return progress_;
  }

 private:
  double success_rate_locked(Modality m) const {
    int total = 0;
    int ok = 0;
    for (const auto& i : interactions_) {
      if (i.modality == m) {
        ++total;
        ok += i.understood ? 1 : 0;
      }
    }
    return total == 0 ? kDefaultSuccessRate : static_cast<double>(ok) / total;
  }

  double average_time_locked(Modality m) const {
    double sum = 0.0;
    int n = 0;
    for (const auto& i : interactions_) {
      if (i.modality == m && i.understood) {
        sum += i.time_spent_s;
        ++n;
      }
    }
    return n == 0 ? kDefaultTimeToUnderstandSec : sum / n;
  }

  void update_progress(const UserInteraction& interaction) {
    const std::size_t idx = modality_index(interaction.modality);
    progress_.success_rates[idx] = success_rate_locked(interaction.modality);

    if (interaction.understood) {
      int successes = 0;
      for (const auto& i : interactions_) {
        successes += (i.modality == interaction.modality && i.understood) ? 1 : 0;
      }
      const double prev = progress_.time_to_understand_s[idx];
      progress_.time_to_understand_s[idx] = (prev * (successes - 1) + interaction.time_spent_s) / successes;

      const std::string key = concept_key(interaction.content_id);
      if (!key.empty() && std::find(progress_.concepts_learned.begin(), progress_.concepts_learned.end(), key) ==
                              progress_.concepts_learned.end()) {
        progress_.concepts_learned.push_back(key);
      }
    }

    int understood = 0;
    for (const auto& i : interactions_) {
      understood += i.understood ? 1 : 0;
    }
    progress_.average_comprehension = static_cast<double>(understood) / static_cast<double>(interactions_.size());

    std::size_t best = 0;
    for (std::size_t i = 1; i < kModalityCount; ++i) {
      if (progress_.success_rates[i] > progress_.success_rates[best]) {
        best = i;
      }
    }
    progress_.preferred_modality = kAllModalities[best];

    double mean_time = 0.0;
    for (const double t : progress_.time_to_understand_s) {
      mean_time += t;
    }
    mean_time /= static_cast<double>(kModalityCount);
    if (mean_time < kFastLearnerSec) {
      progress_.learning_speed = "fast";
    } else if (mean_time > kSlowLearnerSec) {
      progress_.learning_speed = "slow";
    } else {
      progress_.learning_speed = "normal";
    }
    progress_.last_updated = now_iso8601();
  }

  void update_beliefs(const UserInteraction& interaction) {
    double& pref = beliefs_.preferences[modality_index(interaction.modality)];
    if (interaction.understood) {
      pref = (std::min)(1.0, pref + kPreferenceLearningRate * (1.0 - pref));
    } else {
      pref = (std::max)(0.0, pref - kPreferenceLearningRate * pref);
    }

    if (interaction.understood && interaction.time_spent_s < kDefaultTimeToUnderstandSec) {
      beliefs_.complexity_preference = (std::min)(10.0, beliefs_.complexity_preference + kComplexityStep);
    } else if (!interaction.understood || interaction.switched_modality) {
      beliefs_.complexity_preference = (std::max)(1.0, beliefs_.complexity_preference - kComplexityStep);
    }

    // Speed relative to the typical time for the modalities actually understood.
    double ratio_sum = 0.0;
    int n = 0;
    for (const auto& i : interactions_) {
      if (i.understood && i.time_spent_s > 0.0) {
        ratio_sum += modality_base_time_s(i.modality) / i.time_spent_s;
        ++n;
      }
    }
    if (n > 0) {
      beliefs_.learning_speed = std::clamp(ratio_sum / n, 0.5, 2.0);
    }
    beliefs_.last_updated = now_iso8601();
  }

  std::string user_id_;
  mutable std::mutex mu_;
  std::vector<UserInteraction> interactions_;
  UserProgress progress_;
  BayesianBeliefs beliefs_;
};

}  // namespace polytutor
