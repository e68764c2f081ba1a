#pragma once

#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "oaicompat/chat.hpp"
#include "oaicompat/dispatcher.hpp"
#include "oaicompat/error.hpp"
#include "oaicompat/events.hpp"
#include "oaicompat/executor.hpp"
#include "oaicompat/http_client.hpp"
#include "oaicompat/logging.hpp"
#include "oaicompat/streaming.hpp"

namespace oaicompat {

inline constexpr const char* kDefaultBaseUrl = "https://api.openai.com/v1";
inline constexpr const char* kDefaultModel = "default";

struct ClientOptions {
  std::string api_key;
  std::string base_url = kDefaultBaseUrl;
  std::string model = kDefaultModel;
  std::optional<std::string> proxy;
  std::chrono::milliseconds timeout{120000};
  std::map<std::string, std::string> default_headers;
  LogLevel log_level = LogLevel::Off;
  LoggerCallback logger;
};

/**
 * Chat completion client for one model on one OpenAI-compatible endpoint.
 *
 * Results go to the caller's callback through the executor given at
 * construction (inline when none). Query operations never throw; every
 * failure becomes a single ErrorEvent. Token usage reported by the server is
 * summed across all queries made through this client.
 *
 * Missing settings are read from OPENAI_COMPATIBLE_API_KEY,
 * OPENAI_COMPATIBLE_BASE_URL, OPENAI_COMPATIBLE_PROXY and OAICOMPAT_LOG.
 */
class ChatClient {
public:
  explicit ChatClient(ClientOptions options,
                      std::unique_ptr<HttpClient> http_client = nullptr,
                      std::shared_ptr<Executor> executor = nullptr);

  // True when an API key is set in `options` or in the environment.
  static bool is_configured(const ClientOptions& options = {});

  const ClientOptions& options() const;
  const std::string& model() const;
  const std::string& endpoint_url() const;

  TokenUsage usage() const;

  void query(const Conversation& conversation,
             const EventCallback& callback,
             bool stream = false,
             const nlohmann::json& model_options = nlohmann::json::object()) const;

  void query(const std::string& prompt,
             const EventCallback& callback,
             bool stream = false,
             const nlohmann::json& model_options = nlohmann::json::object()) const;

  /**
   * Runs query() on a detached thread and returns at once. There is no join
   * and no cancellation; completion is only observable through the callback.
   * The thread keeps the client's shared state alive, so the ChatClient
   * itself may be destroyed while queries are in flight.
   */
  void query_async(Conversation conversation,
                   EventCallback callback,
                   bool stream = false,
                   nlohmann::json model_options = nlohmann::json::object()) const;

  void query_async(const std::string& prompt,
                   EventCallback callback,
                   bool stream = false,
                   nlohmann::json model_options = nlohmann::json::object()) const;

private:
  struct State;

  static void run_query(const State& state,
                        const Conversation& conversation,
                        const EventCallback& callback,
                        bool stream,
                        const nlohmann::json& model_options);

  std::shared_ptr<State> state_;
};

}  // namespace oaicompat
