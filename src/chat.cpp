#include "oaicompat/chat.hpp"

#include "oaicompat/error.hpp"
#include "oaicompat/utils/values.hpp"

#include <nlohmann/json.hpp>

#include <utility>

namespace oaicompat {
namespace {

using json = nlohmann::json;

}  // namespace

const char* role_name(Role role) {
  switch (role) {
    case Role::System: return "system";
    case Role::User: return "user";
    case Role::Assistant: return "assistant";
    case Role::Tool: return "tool";
  }
  return "user";
}

Conversation make_conversation(const std::string& prompt) {
  ChatMessage message;
  message.role = Role::User;
  message.content = prompt;
  return {std::move(message)};
}

json message_to_json(const ChatMessage& message) {
  json result = message.extra.is_object() ? message.extra : json::object();
  result["role"] = role_name(message.role);
  result["content"] = message.content;
  return result;
}

json conversation_to_json(const Conversation& conversation) {
  json messages = json::array();
  for (const auto& message : conversation) {
    messages.push_back(message_to_json(message));
  }
  return messages;
}

json build_chat_request_body(const std::string& model,
                             const Conversation& conversation,
                             bool stream,
                             const json& model_options) {
  json body = model_options.is_object() ? model_options : json::object();
  body["model"] = model;
  body["messages"] = conversation_to_json(conversation);
  body["stream"] = stream;
  return body;
}

ResponseMessage parse_response_message(const json& message) {
  ResponseMessage result;
  if (!message.is_object()) {
    return result;
  }
  result.raw = message;
  result.role = utils::optional_string(message, "role");
  result.content = utils::optional_string(message, "content");
  auto tool_calls = message.find("tool_calls");
  if (tool_calls != message.end() && !tool_calls->is_null()) {
    result.tool_calls = *tool_calls;
  }
  return result;
}

std::optional<TokenUsage> parse_usage(const json& payload) {
  if (!payload.is_object()) {
    return std::nullopt;
  }
  auto it = payload.find("usage");
  if (it == payload.end() || !it->is_object() || it->empty()) {
    return std::nullopt;
  }
  TokenUsage usage;
  usage.prompt_tokens = utils::non_negative_integer(*it, "prompt_tokens");
  usage.completion_tokens = utils::non_negative_integer(*it, "completion_tokens");
  return usage;
}

DecodedChatResponse decode_chat_response(const std::string& body) {
  json payload;
  try {
    payload = json::parse(body);
  } catch (const json::exception& ex) {
    throw DecodeError(std::string("Failed to parse chat completion response: ") + ex.what());
  }
  if (!payload.is_object()) {
    throw DecodeError("Chat completion response is not a JSON object");
  }

  if (payload.contains("error")) {
    return DecodedChatResponse{ErrorEvent{utils::error_message(payload.at("error"))}, std::nullopt};
  }

  auto choices = payload.find("choices");
  if (choices == payload.end() || !choices->is_array() || choices->empty()) {
    throw DecodeError("Chat completion response has no choices");
  }
  const json& first = choices->front();
  json message = first.is_object() ? first.value("message", json::object()) : json::object();

  return DecodedChatResponse{parse_response_message(message), parse_usage(payload)};
}

}  // namespace oaicompat
