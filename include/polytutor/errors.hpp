#pragma once

#include <optional>
#include <stdexcept>
#include <string>

#include "polytutor/common.hpp"
#include "polytutor/types.hpp"

namespace polytutor {

enum class ErrorCode {
  kInvalidMessage,
  kUnsupportedOperation,
  kProcessingError,
  kTimeout,
  kServiceConnectionFailed,
  kCriticalPathFailure,
  kAgentUnavailable,
  kConfigurationError,
  kGenerationExhausted,
};

inline const char* error_code_name(ErrorCode code) {
  switch (code) {
    case ErrorCode::kInvalidMessage:
      return "INVALID_MESSAGE";
    case ErrorCode::kUnsupportedOperation:
      return "UNSUPPORTED_OPERATION";
    case ErrorCode::kProcessingError:
      return "PROCESSING_ERROR";
    case ErrorCode::kTimeout:
      return "TIMEOUT";
    case ErrorCode::kServiceConnectionFailed:
      return "SERVICE_CONNECTION_FAILED";
    case ErrorCode::kCriticalPathFailure:
      return "CRITICAL_PATH_FAILURE";
    case ErrorCode::kAgentUnavailable:
      return "AGENT_UNAVAILABLE";
    case ErrorCode::kConfigurationError:
      return "CONFIGURATION_ERROR";
    case ErrorCode::kGenerationExhausted:
      return "GENERATION_EXHAUSTED";
  }
  return "PROCESSING_ERROR";
}

inline ErrorCode parse_error_code(const std::string& name) {
  static constexpr ErrorCode kCodes[] = {
      ErrorCode::kInvalidMessage,     ErrorCode::kUnsupportedOperation,    ErrorCode::kProcessingError,
      ErrorCode::kTimeout,            ErrorCode::kServiceConnectionFailed, ErrorCode::kCriticalPathFailure,
      ErrorCode::kAgentUnavailable,   ErrorCode::kConfigurationError,      ErrorCode::kGenerationExhausted,
  };
  for (const ErrorCode c : kCodes) {
    if (name == error_code_name(c)) {
      return c;
    }
  }
  return ErrorCode::kProcessingError;
}

// Transient conditions a caller may reasonably try again.
inline bool is_retryable(ErrorCode code) {
  return code == ErrorCode::kTimeout || code == ErrorCode::kServiceConnectionFailed ||
         code == ErrorCode::kAgentUnavailable;
}

class AgentError : public std::runtime_error {
 public:
  AgentError(ErrorCode code, const std::string& message, std::string message_id = "",
             std::optional<AgentType> agent = std::nullopt)
      : std::runtime_error(message),
        code_(code),
        message_id_(std::move(message_id)),
        agent_(agent),
        retryable_(is_retryable(code)) {}

  ErrorCode code() const { return code_; }
  const std::string& message_id() const { return message_id_; }
  std::optional<AgentType> agent() const { return agent_; }
  bool retryable() const { return retryable_; }

  json to_json() const {
    json j{{"code", error_code_name(code_)}, {"message", what()}, {"retryable", retryable_}};
    if (!message_id_.empty()) {
      j["messageId"] = message_id_;
    }
    if (agent_.has_value()) {
      j["agentType"] = agent_type_name(*agent_);
    }
    return j;
  }

 private:
  ErrorCode code_;
  std::string message_id_;
  std::optional<AgentType> agent_;
  bool retryable_;
};

}  // namespace polytutor
