#include <gtest/gtest.h>

#include "oaicompat/chat.hpp"
#include "oaicompat/error.hpp"

#include <nlohmann/json.hpp>

using nlohmann::json;
using oaicompat::ChatMessage;
using oaicompat::Conversation;
using oaicompat::DecodeError;
using oaicompat::ErrorEvent;
using oaicompat::ResponseMessage;
using oaicompat::Role;

TEST(ChatRequestBodyTest, PromotesPromptToSingleUserMessage) {
  auto conversation = oaicompat::make_conversation("Explain this function");
  ASSERT_EQ(conversation.size(), 1u);
  EXPECT_EQ(conversation[0].role, Role::User);

  json body = oaicompat::build_chat_request_body("gpt-4o-mini", conversation, false, json::object());
  EXPECT_EQ(body.at("model"), "gpt-4o-mini");
  EXPECT_EQ(body.at("stream"), false);
  ASSERT_EQ(body.at("messages").size(), 1u);
  EXPECT_EQ(body.at("messages")[0].at("role"), "user");
  EXPECT_EQ(body.at("messages")[0].at("content"), "Explain this function");
}

TEST(ChatRequestBodyTest, MergesOptionsWithoutReplacingFixedFields) {
  Conversation conversation;
  conversation.push_back(ChatMessage{Role::System, "You are terse.", json::object()});
  conversation.push_back(ChatMessage{Role::User, "Hi", json::object()});

  json options = {{"temperature", 0.2},
                  {"response_format", {{"type", "json_object"}}},
                  {"model", "other"},
                  {"messages", json::array()},
                  {"stream", false}};

  json body = oaicompat::build_chat_request_body("local-model", conversation, true, options);
  EXPECT_EQ(body.at("model"), "local-model");
  EXPECT_EQ(body.at("stream"), true);
  ASSERT_EQ(body.at("messages").size(), 2u);
  EXPECT_EQ(body.at("messages")[0].at("role"), "system");
  EXPECT_DOUBLE_EQ(body.at("temperature").get<double>(), 0.2);
  EXPECT_EQ(body.at("response_format").at("type"), "json_object");
}

TEST(ChatRequestBodyTest, IgnoresNonObjectOptions) {
  json body = oaicompat::build_chat_request_body("m", oaicompat::make_conversation("x"), false, json::array({1, 2}));
  EXPECT_EQ(body.size(), 3u);
}

TEST(ChatRequestBodyTest, CarriesExtraMessageFields) {
  ChatMessage tool_reply;
  tool_reply.role = Role::Tool;
  tool_reply.content = "{\"ok\":true}";
  tool_reply.extra = {{"tool_call_id", "call_1"}, {"role", "ignored"}};

  json message = oaicompat::message_to_json(tool_reply);
  EXPECT_EQ(message.at("role"), "tool");
  EXPECT_EQ(message.at("tool_call_id"), "call_1");
  EXPECT_EQ(message.at("content"), "{\"ok\":true}");
}

TEST(ChatResponseDecoderTest, MapsMessageFieldsVerbatim) {
  const std::string body = R"({
    "id": "chatcmpl-1",
    "choices": [{"index": 0, "message": {
      "role": "assistant",
      "content": "int main() { return 0; }",
      "tool_calls": [{"id": "call_1", "type": "function", "function": {"name": "rename", "arguments": "{}"}}]
    }, "finish_reason": "tool_calls"}],
    "usage": {"prompt_tokens": 12, "completion_tokens": 7, "total_tokens": 19}
  })";

  auto decoded = oaicompat::decode_chat_response(body);
  ASSERT_TRUE(std::holds_alternative<ResponseMessage>(decoded.result));
  const auto& message = std::get<ResponseMessage>(decoded.result);
  EXPECT_EQ(message.role, std::optional<std::string>("assistant"));
  EXPECT_EQ(message.content, std::optional<std::string>("int main() { return 0; }"));
  ASSERT_TRUE(message.tool_calls.has_value());
  EXPECT_EQ(message.tool_calls->at(0).at("function").at("name"), "rename");

  ASSERT_TRUE(decoded.usage.has_value());
  EXPECT_EQ(decoded.usage->prompt_tokens, 12);
  EXPECT_EQ(decoded.usage->completion_tokens, 7);
}

TEST(ChatResponseDecoderTest, MissingMessageFieldsStayEmpty) {
  auto decoded = oaicompat::decode_chat_response(R"({"choices":[{"message":{"content":null}}]})");
  const auto& message = std::get<ResponseMessage>(decoded.result);
  EXPECT_FALSE(message.role.has_value());
  EXPECT_FALSE(message.content.has_value());
  EXPECT_FALSE(message.tool_calls.has_value());
  EXPECT_FALSE(decoded.usage.has_value());
}

TEST(ChatResponseDecoderTest, UsageCountersDefaultToZero) {
  auto decoded = oaicompat::decode_chat_response(R"({"choices":[{"message":{}}],"usage":{"prompt_tokens":4}})");
  ASSERT_TRUE(decoded.usage.has_value());
  EXPECT_EQ(decoded.usage->prompt_tokens, 4);
  EXPECT_EQ(decoded.usage->completion_tokens, 0);
}

TEST(ChatResponseDecoderTest, ErrorMemberBecomesErrorEvent) {
  auto with_message = oaicompat::decode_chat_response(R"({"error":{"message":"model not found","type":"invalid"}})");
  ASSERT_TRUE(std::holds_alternative<ErrorEvent>(with_message.result));
  EXPECT_EQ(std::get<ErrorEvent>(with_message.result).message, "model not found");
  EXPECT_FALSE(with_message.usage.has_value());

  auto without_message = oaicompat::decode_chat_response(R"({"error":{"code":42}})");
  EXPECT_EQ(std::get<ErrorEvent>(without_message.result).message, R"({"code":42})");

  auto plain = oaicompat::decode_chat_response(R"({"error":"quota exceeded"})");
  EXPECT_EQ(std::get<ErrorEvent>(plain.result).message, "quota exceeded");
}

TEST(ChatResponseDecoderTest, MalformedBodyThrowsDecodeError) {
  EXPECT_THROW(oaicompat::decode_chat_response("{\"choices\": ["), DecodeError);
  EXPECT_THROW(oaicompat::decode_chat_response("<html>bad gateway</html>"), DecodeError);
  EXPECT_THROW(oaicompat::decode_chat_response("[]"), DecodeError);
  EXPECT_THROW(oaicompat::decode_chat_response(R"({"choices":[]})"), DecodeError);
}
