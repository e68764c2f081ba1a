#pragma once

#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

#include "oaicompat/events.hpp"

namespace oaicompat {

enum class Role { System, User, Assistant, Tool };

const char* role_name(Role role);

struct ChatMessage {
  Role role = Role::User;
  std::string content;
  // Extra members sent verbatim alongside role/content (tool_call_id, tool_calls, name).
  nlohmann::json extra = nlohmann::json::object();
};

using Conversation = std::vector<ChatMessage>;

/// A bare prompt becomes a single user message.
Conversation make_conversation(const std::string& prompt);

nlohmann::json message_to_json(const ChatMessage& message);
nlohmann::json conversation_to_json(const Conversation& conversation);

/**
 * Request body for /chat/completions. `model_options` entries are merged in
 * first, so they can never replace `model`, `messages` or `stream`.
 */
nlohmann::json build_chat_request_body(const std::string& model,
                                       const Conversation& conversation,
                                       bool stream,
                                       const nlohmann::json& model_options);

struct DecodedChatResponse {
  std::variant<ResponseMessage, ErrorEvent> result;
  std::optional<TokenUsage> usage;
};

/// Maps a `choices[0].message` object onto a ResponseMessage; absent members stay empty.
ResponseMessage parse_response_message(const nlohmann::json& message);

std::optional<TokenUsage> parse_usage(const nlohmann::json& payload);

/**
 * Decodes a complete non-streaming response body. A server-reported `error`
 * is returned as an ErrorEvent; a body that is not JSON, or carries no
 * choices, throws DecodeError.
 */
DecodedChatResponse decode_chat_response(const std::string& body);

}  // namespace oaicompat
