#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "polytutor/common.hpp"
#include "polytutor/deadline.hpp"
#include "polytutor/errors.hpp"
#include "polytutor/learning_types.hpp"
#include "polytutor/service_layer.hpp"
#include "polytutor/types.hpp"

namespace polytutor {

// Produces renderer-ready data for one modality. May throw; the adaptive
// engine treats any exception as a failed attempt.
class ContentGenerator {
 public:
  virtual ~ContentGenerator() = default;

  virtual Modality modality() const = 0;
  virtual json generate(const ConceptAnalysis& analysis, const Deadline& deadline) = 0;
};

class GeneratorRegistry {
 public:
  void add(std::shared_ptr<ContentGenerator> generator) {
    if (!generator) {
      throw AgentError(ErrorCode::kConfigurationError, "null content generator");
    }
    std::lock_guard<std::mutex> lock(mu_);
    generators_[generator->modality()] = std::move(generator);
  }

  std::shared_ptr<ContentGenerator> get(Modality m) const {
    std::lock_guard<std::mutex> lock(mu_);
    auto it = generators_.find(m);
    return it == generators_.end() ? nullptr : it->second;
  }

  std::vector<Modality> modalities() const {
    std::lock_guard<std::mutex> lock(mu_);
    std::vector<Modality> out;
    for (const auto& kv : generators_) {
      out.push_back(kv.first);
    }
    return out;
  }

 private:
  mutable std::mutex mu_;
  std::map<Modality, std::shared_ptr<ContentGenerator>> generators_;
};

inline const char* modality_content_hint(Modality m) {
  switch (m) {
    case Modality::kAnimation:
      return "an ordered list of animation frames, each with a caption and the elements that move";
    case Modality::kSimulation:
      return "simulation parameters with ranges and the rules that update the state";
    case Modality::k3d:
      return "a 3D scene: atoms or parts with coordinates, bonds and camera hints";
    case Modality::kConceptMap:
      return "a concept map with nodes and labelled edges";
    case Modality::kDiagram:
      return "a labelled diagram with components and annotations";
    case Modality::kInteractive:
      return "interactive steps the learner performs, each with feedback";
    case Modality::kText:
      return "a short structured explanation with sections";
  }
  return "a structured explanation";
}

// Asks the AI service for modality-specific JSON.
class AiContentGenerator : public ContentGenerator {
 public:
  AiContentGenerator(Modality modality, std::shared_ptr<ServiceLayer> services, std::string provider)
      : modality_(modality), services_(std::move(services)), provider_(std::move(provider)) {}

  Modality modality() const override { return modality_; }

  json generate(const ConceptAnalysis& analysis, const Deadline& deadline) override {
    const std::string prompt = std::string("Create ") + modality_content_hint(modality_) + " teaching \"" +
                               analysis.topic + "\" at " + complexity_name(analysis.complexity) +
                               " level. Reply with a single JSON object only.";
    const AiResponse r = services_->query_ai(provider_, prompt, to_json(analysis));
    if (deadline.expired()) {
      throw AgentError(ErrorCode::kTimeout, std::string(modality_name(modality_)) + " generation expired");
    }

    json data;
    try {
      data = json::parse(r.response);
    } catch (const json::parse_error&) {
      data = json{{"description", r.response}};
    }
    if (!data.is_object()) {
      data = json{{"content", data}};
    }
    if (trim(r.response).empty()) {
      throw AgentError(ErrorCode::kProcessingError,
                       std::string("empty ") + modality_name(modality_) + " content for " + analysis.topic);
    }
    data["modality"] = modality_name(modality_);
    return data;
  }

 private:
  Modality modality_;
  std::shared_ptr<ServiceLayer> services_;
  std::string provider_;
};

// Local plain-text outline; needs no network.
class TextGenerator : public ContentGenerator {
 public:
  Modality modality() const override { return Modality::kText; }

  json generate(const ConceptAnalysis& analysis, const Deadline&) override {
    json sections = json::array();
    sections.push_back(json{{"heading", "Overview"},
                            {"body", analysis.topic + " explained at " + complexity_name(analysis.complexity) +
                                         " level."}});
    if (!analysis.prerequisites.empty()) {
      sections.push_back(json{{"heading", "Before you start"}, {"body", join(analysis.prerequisites, ", ")}});
    }
    if (!analysis.keywords.empty()) {
      sections.push_back(json{{"heading", "Key terms"}, {"body", join(analysis.keywords, ", ")}});
    }
    return json{{"modality", "text"}, {"title", analysis.topic}, {"sections", sections}};
  }
};

inline std::shared_ptr<GeneratorRegistry> make_default_generators(std::shared_ptr<ServiceLayer> services,
                                                                  const std::string& provider) {
  auto registry = std::make_shared<GeneratorRegistry>();
  for (const Modality m : kAllModalities) {
    if (m == Modality::kText) {
      registry->add(std::make_shared<TextGenerator>());
    } else {
      registry->add(std::make_shared<AiContentGenerator>(m, services, provider));
    }
  }
  return registry;
}

}  // namespace polytutor
