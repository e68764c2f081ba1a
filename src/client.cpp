#include "oaicompat/client.hpp"

#include "oaicompat/error.hpp"
#include "oaicompat/http_client.hpp"
#include "oaicompat/utils/env.hpp"
#include "oaicompat/utils/text.hpp"
#include "oaicompat/utils/values.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <map>
#include <mutex>
#include <system_error>
#include <thread>
#include <utility>
#include <variant>

namespace oaicompat {

struct ChatClient::State {
  ClientOptions options;
  std::string endpoint_url;
  Logger logger;
  std::shared_ptr<HttpClient> http_client;
  Dispatcher dispatcher;

  mutable std::mutex usage_mutex;
  mutable TokenUsage usage;

  void add_usage(const TokenUsage& delta) const;
};

namespace {

using json = nlohmann::json;

constexpr const char* kChatCompletionsPath = "/chat/completions";
constexpr const char* kApiKeyEnv = "OPENAI_COMPATIBLE_API_KEY";
constexpr const char* kBaseUrlEnv = "OPENAI_COMPATIBLE_BASE_URL";
constexpr const char* kProxyEnv = "OPENAI_COMPATIBLE_PROXY";
constexpr const char* kLogEnv = "OAICOMPAT_LOG";
constexpr std::size_t kResponsePreviewBytes = 100;

std::string strip_trailing_slashes(std::string url) {
  while (!url.empty() && url.back() == '/') {
    url.pop_back();
  }
  return url;
}

ClientOptions resolve_options(ClientOptions options) {
  if (options.api_key.empty()) {
    options.api_key = utils::read_env_or(kApiKeyEnv, "");
  }

  if (options.base_url.empty() || options.base_url == kDefaultBaseUrl) {
    options.base_url = utils::read_env_or(kBaseUrlEnv, kDefaultBaseUrl);
  }
  options.base_url = strip_trailing_slashes(options.base_url);

  if (!options.proxy) {
    if (auto env_proxy = utils::read_env(kProxyEnv)) {
      if (!env_proxy->empty()) {
        options.proxy = *env_proxy;
      }
    }
  }

  if (options.log_level == LogLevel::Off) {
    if (auto env_log = utils::read_env(kLogEnv)) {
      options.log_level = parse_log_level(*env_log, options.log_level);
      if (options.log_level != LogLevel::Off && !options.logger) {
        options.logger = make_stderr_logger();
      }
    }
  }

  if (options.api_key.empty()) {
    throw OaiCompatError(std::string("Missing API key. Provide ClientOptions.api_key or set the ") + kApiKeyEnv +
                         " environment variable.");
  }
  if (options.timeout.count() <= 0) {
    throw OaiCompatError("ClientOptions.timeout must be positive");
  }
  return options;
}

json build_request_log_details(const HttpRequest& request) {
  json details;
  details["method"] = request.method;
  details["url"] = request.url;
  details["headers"] = sanitize_headers(request.headers);
  return details;
}

json build_response_log_details(const HttpRequest& request,
                                const HttpResponse& response,
                                std::chrono::steady_clock::duration duration) {
  json details = build_request_log_details(request);
  details["status"] = response.status_code;
  details["duration_ms"] = std::chrono::duration_cast<std::chrono::milliseconds>(duration).count();
  details["response_headers"] = sanitize_headers(response.headers);
  return details;
}

[[noreturn]] void throw_status_error(const HttpResponse& response) {
  std::string body = utils::trim(response.body);
  std::string message = "HTTP " + std::to_string(response.status_code);
  if (!body.empty()) {
    message += ": " + body;
  }

  json error_body = json::object();
  if (auto payload = utils::safe_json(response.body)) {
    if (payload->is_object() && payload->contains("error")) {
      error_body = payload->at("error");
    } else {
      error_body = std::move(*payload);
    }
  }
  throw HttpStatusError(std::move(message), response.status_code, std::move(body), std::move(error_body),
                        response.headers);
}

HttpRequest build_http_request(const ClientOptions& options, const std::string& url, std::string body, bool stream) {
  HttpRequest request;
  request.method = "POST";
  request.url = url;
  request.body = std::move(body);
  request.timeout = options.timeout;

  std::map<std::string, std::string> headers = options.default_headers;
  headers["Authorization"] = std::string("Bearer ") + options.api_key;
  headers["Content-Type"] = "application/json";
  headers["Accept"] = stream ? "text/event-stream" : "application/json";
  request.headers = std::move(headers);
  return request;
}

HttpResponse perform_request(const Logger& logger,
                             HttpClient& http_client,
                             const HttpRequest& request,
                             const char* success_message = "connection established") {
  logger.log(LogLevel::Debug, "sending request", build_request_log_details(request));
  auto start_time = std::chrono::steady_clock::now();

  HttpResponse response = http_client.request(request);

  auto duration = std::chrono::steady_clock::now() - start_time;
  if (!is_success_status(response.status_code)) {
    logger.log(LogLevel::Error, "request failed", build_response_log_details(request, response, duration));
    throw_status_error(response);
  }
  logger.log(LogLevel::Info, success_message, build_response_log_details(request, response, duration));
  return response;
}

}  // namespace

void ChatClient::State::add_usage(const TokenUsage& delta) const {
  std::lock_guard<std::mutex> lock(usage_mutex);
  usage.prompt_tokens = utils::saturating_add(usage.prompt_tokens, delta.prompt_tokens);
  usage.completion_tokens = utils::saturating_add(usage.completion_tokens, delta.completion_tokens);
}

ChatClient::ChatClient(ClientOptions options,
                       std::unique_ptr<HttpClient> http_client,
                       std::shared_ptr<Executor> executor) {
  auto state = std::make_shared<State>();
  state->options = resolve_options(std::move(options));
  state->endpoint_url = state->options.base_url + kChatCompletionsPath;
  state->logger = Logger(state->options.log_level, state->options.logger);

  if (!http_client) {
    HttpClientOptions http_options;
    http_options.proxy = state->options.proxy;
    http_client = make_default_http_client(std::move(http_options));
    if (state->options.proxy) {
      state->logger.log(LogLevel::Info, "using proxy", {{"proxy", *state->options.proxy}});
    }
  }
  state->http_client = std::move(http_client);
  state->dispatcher = Dispatcher(std::move(executor), state->logger);
  state_ = std::move(state);
}

bool ChatClient::is_configured(const ClientOptions& options) {
  if (!options.api_key.empty()) {
    return true;
  }
  return !utils::read_env_or(kApiKeyEnv, "").empty();
}

const ClientOptions& ChatClient::options() const {
  return state_->options;
}

const std::string& ChatClient::model() const {
  return state_->options.model;
}

const std::string& ChatClient::endpoint_url() const {
  return state_->endpoint_url;
}

TokenUsage ChatClient::usage() const {
  std::lock_guard<std::mutex> lock(state_->usage_mutex);
  return state_->usage;
}

void ChatClient::query(const Conversation& conversation,
                       const EventCallback& callback,
                       bool stream,
                       const json& model_options) const {
  run_query(*state_, conversation, callback, stream, model_options);
}

void ChatClient::query(const std::string& prompt,
                       const EventCallback& callback,
                       bool stream,
                       const json& model_options) const {
  run_query(*state_, make_conversation(prompt), callback, stream, model_options);
}

void ChatClient::query_async(Conversation conversation,
                             EventCallback callback,
                             bool stream,
                             json model_options) const {
  std::shared_ptr<State> state = state_;
  try {
    std::thread([state, conversation = std::move(conversation), callback, stream,
                 model_options = std::move(model_options)]() {
      run_query(*state, conversation, callback, stream, model_options);
    }).detach();
  } catch (const std::system_error& ex) {
    state->logger.log(LogLevel::Error, "failed to start query thread", {{"what", ex.what()}});
    state->dispatcher.deliver(callback, ErrorEvent{std::string("Failed to start query thread: ") + ex.what()});
  }
}

void ChatClient::query_async(const std::string& prompt,
                             EventCallback callback,
                             bool stream,
                             json model_options) const {
  query_async(make_conversation(prompt), std::move(callback), stream, std::move(model_options));
}

void ChatClient::run_query(const State& state,
                           const Conversation& conversation,
                           const EventCallback& callback,
                           bool stream,
                           const json& model_options) {
  const Logger& logger = state.logger;
  bool terminal_delivered = false;

  auto notify_error = [&](const std::string& message) {
    if (!terminal_delivered) {
      terminal_delivered = true;
      state.dispatcher.deliver(callback, ErrorEvent{message});
    }
    logger.log(LogLevel::Error, "query failed", {{"model", state.options.model}, {"message", message}});
  };

  try {
    if (!model_options.is_null() && !model_options.is_object()) {
      logger.log(LogLevel::Warn, "ignoring model options that are not a JSON object",
                 {{"type", model_options.type_name()}});
    }

    logger.log(LogLevel::Info, "requesting model", {{"model", state.options.model}, {"stream", stream}});
    json body = build_chat_request_body(state.options.model, conversation, stream, model_options);
    HttpRequest request = build_http_request(state.options, state.endpoint_url, body.dump(), stream);

    if (!stream) {
      HttpResponse response = perform_request(logger, *state.http_client, request);
      DecodedChatResponse decoded = decode_chat_response(response.body);

      if (auto* error = std::get_if<ErrorEvent>(&decoded.result)) {
        notify_error(error->message);
        return;
      }

      // Counters are updated before delivery so callers observe them from inside the callback.
      if (decoded.usage) {
        state.add_usage(*decoded.usage);
      }
      auto& message = std::get<ResponseMessage>(decoded.result);
      logger.log(LogLevel::Debug, "full response",
                 {{"content", utils::preview(message.content.value_or(""), kResponsePreviewBytes)}});
      terminal_delivered = true;
      state.dispatcher.deliver(callback, std::move(message));
      return;
    }

    ChatStreamDecoder decoder(
        [&](QueryEvent event) {
          if (auto* delta = std::get_if<DeltaEvent>(&event)) {
            if (delta->usage) {
              state.add_usage(*delta->usage);
            }
            if (!delta->content.empty()) {
              logger.log(LogLevel::Debug, "stream delta", {{"content", delta->content}});
            }
          } else if (std::holds_alternative<StopEvent>(event)) {
            logger.log(LogLevel::Info, "streaming finished", {{"model", state.options.model}});
            terminal_delivered = true;
          } else if (auto* error = std::get_if<ErrorEvent>(&event)) {
            logger.log(LogLevel::Error, "stream reported error", {{"message", error->message}});
            terminal_delivered = true;
          }
          state.dispatcher.deliver(callback, std::move(event));
        },
        logger);

    LineSplitter splitter;
    const auto start_time = std::chrono::steady_clock::now();
    bool first_chunk = true;
    request.collect_body = false;
    request.on_chunk = [&](const char* data, std::size_t size) {
      // Only 2xx bodies reach here, so the first chunk marks a live stream.
      if (first_chunk) {
        first_chunk = false;
        auto elapsed = std::chrono::steady_clock::now() - start_time;
        logger.log(LogLevel::Info, "connection established",
                   {{"url", state.endpoint_url},
                    {"time_to_first_byte_ms", std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count()}});
      }
      for (const auto& line : splitter.feed(data, size)) {
        if (!decoder.feed_line(line)) {
          return false;
        }
      }
      return true;
    };

    perform_request(logger, *state.http_client, request, "stream transfer finished");

    if (!decoder.finished()) {
      if (auto tail = splitter.finalize()) {
        decoder.feed_line(*tail);
      }
    }
    if (!decoder.finished()) {
      logger.log(LogLevel::Info, "stream ended without [DONE]",
                 {{"model", state.options.model}, {"skipped_frames", decoder.skipped_frames()}});
    }
  } catch (const OaiCompatError& ex) {
    notify_error(ex.what());
  } catch (const std::exception& ex) {
    notify_error(std::string("General exception encountered while running the query: ") + ex.what());
  }
}

}  // namespace oaicompat
