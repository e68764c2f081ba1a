#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>

#include <nlohmann/json.hpp>

namespace oaicompat {

struct TokenUsage {
  std::int64_t prompt_tokens = 0;
  std::int64_t completion_tokens = 0;
};

/// Result of a non-streaming query: `choices[0].message`, normalized.
struct ResponseMessage {
  std::optional<std::string> role;
  std::optional<std::string> content;
  std::optional<nlohmann::json> tool_calls;
  nlohmann::json raw = nlohmann::json::object();
};

/// One parsed stream frame. `delta` is `choices[0].delta` as sent.
struct DeltaEvent {
  nlohmann::json delta = nlohmann::json::object();
  std::string content;
  std::optional<std::string> finish_reason;
  std::optional<TokenUsage> usage;
};

struct StopEvent {};

struct ErrorEvent {
  std::string message;
};

using QueryEvent = std::variant<ResponseMessage, DeltaEvent, StopEvent, ErrorEvent>;

inline bool is_terminal(const QueryEvent& event) {
  return std::holds_alternative<StopEvent>(event) || std::holds_alternative<ErrorEvent>(event);
}

}  // namespace oaicompat
