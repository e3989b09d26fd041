#pragma once

#include <array>
#include <optional>
#include <string>
#include <vector>

#include "polytutor/common.hpp"

namespace polytutor {

enum class AgentType {
  kConversation,
  kContentSpecialist,
  kVisualLearning,
  kAssessment,
  kResource,
  kPedagogy,
  kOrchestrator,
};

inline constexpr std::array<AgentType, 7> kAllAgentTypes = {
    AgentType::kConversation, AgentType::kContentSpecialist, AgentType::kVisualLearning,
    AgentType::kAssessment,   AgentType::kResource,          AgentType::kPedagogy,
    AgentType::kOrchestrator,
};

inline const char* agent_type_name(AgentType t) {
  switch (t) {
    case AgentType::kConversation:
      return "conversation";
    case AgentType::kContentSpecialist:
      return "content-specialist";
    case AgentType::kVisualLearning:
      return "visual-learning";
    case AgentType::kAssessment:
      return "assessment";
    case AgentType::kResource:
      return "resource";
    case AgentType::kPedagogy:
      return "pedagogy";
    case AgentType::kOrchestrator:
      return "orchestrator";
  }
  return "unknown";
}

inline std::optional<AgentType> parse_agent_type(const std::string& name) {
  const std::string n = to_lower(trim(name));
  for (const AgentType t : kAllAgentTypes) {
    if (n == agent_type_name(t)) {
      return t;
    }
  }
  return std::nullopt;
}

enum class MessageType {
  kRequest,
  kResponse,
  kNotification,
  kError,
  kHeartbeat,
  kTaskAssignment,
};

inline const char* message_type_name(MessageType t) {
  switch (t) {
    case MessageType::kRequest:
      return "request";
    case MessageType::kResponse:
      return "response";
    case MessageType::kNotification:
      return "notification";
    case MessageType::kError:
      return "error";
    case MessageType::kHeartbeat:
      return "heartbeat";
    case MessageType::kTaskAssignment:
      return "task-assignment";
  }
  return "unknown";
}

enum class Priority { kLow, kMedium, kHigh, kCritical };

inline const char* priority_name(Priority p) {
  switch (p) {
    case Priority::kLow:
      return "low";
    case Priority::kMedium:
      return "medium";
    case Priority::kHigh:
      return "high";
    case Priority::kCritical:
      return "critical";
  }
  return "medium";
}

inline Priority parse_priority(const std::string& name, Priority fallback = Priority::kMedium) {
  const std::string n = to_lower(trim(name));
  if (n == "low") {
    return Priority::kLow;
  }
  if (n == "medium") {
    return Priority::kMedium;
  }
  if (n == "high") {
    return Priority::kHigh;
  }
  if (n == "critical") {
    return Priority::kCritical;
  }
  return fallback;
}

enum class Modality {
  kAnimation,
  kSimulation,
  k3d,
  kConceptMap,
  kDiagram,
  kInteractive,
  kText,
};

inline constexpr std::size_t kModalityCount = 7;

inline constexpr std::array<Modality, kModalityCount> kAllModalities = {
    Modality::kAnimation, Modality::kSimulation,  Modality::k3d,  Modality::kConceptMap,
    Modality::kDiagram,   Modality::kInteractive, Modality::kText,
};

inline std::size_t modality_index(Modality m) { return static_cast<std::size_t>(m); }

inline const char* modality_name(Modality m) {
  switch (m) {
    case Modality::kAnimation:
      return "animation";
    case Modality::kSimulation:
      return "simulation";
    case Modality::k3d:
      return "3d";
    case Modality::kConceptMap:
      return "concept-map";
    case Modality::kDiagram:
      return "diagram";
    case Modality::kInteractive:
      return "interactive";
    case Modality::kText:
      return "text";
  }
  return "text";
}

inline std::optional<Modality> parse_modality(const std::string& name) {
  const std::string n = to_lower(trim(name));
  for (const Modality m : kAllModalities) {
    if (n == modality_name(m)) {
      return m;
    }
  }
  return std::nullopt;
}

// One value per modality, indexed by modality_index().
template <typename T>
using ModalityTable = std::array<T, kModalityCount>;

enum class Complexity { kBeginner, kIntermediate, kAdvanced };

inline const char* complexity_name(Complexity c) {
  switch (c) {
    case Complexity::kBeginner:
      return "beginner";
    case Complexity::kIntermediate:
      return "intermediate";
    case Complexity::kAdvanced:
      return "advanced";
  }
  return "intermediate";
}

inline Complexity parse_complexity(const std::string& name, Complexity fallback = Complexity::kIntermediate) {
  const std::string n = to_lower(trim(name));
  if (n == "beginner") {
    return Complexity::kBeginner;
  }
  if (n == "intermediate") {
    return Complexity::kIntermediate;
  }
  if (n == "advanced") {
    return Complexity::kAdvanced;
  }
  return fallback;
}

// Maps the three levels onto the 1-10 scale used by complexity preferences.
inline int complexity_level(Complexity c) {
  switch (c) {
    case Complexity::kBeginner:
      return 3;
    case Complexity::kIntermediate:
      return 6;
    case Complexity::kAdvanced:
      return 9;
  }
  return 5;
}

}  // namespace polytutor
