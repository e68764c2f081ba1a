#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>

namespace oaicompat {

struct HttpRequest {
  std::string method = "POST";
  std::string url;
  std::map<std::string, std::string> headers;
  std::string body;
  // Bounds connection establishment and read inactivity, not the whole transfer.
  std::chrono::milliseconds timeout{120000};
  // Receives the body of a 2xx response as it arrives. Returning false stops the transfer.
  std::function<bool(const char*, std::size_t)> on_chunk;
  bool collect_body = true;
};

struct HttpResponse {
  long status_code = 0;
  std::map<std::string, std::string> headers;
  std::string body;
  // True when on_chunk asked the transfer to stop before the server finished.
  bool stopped_early = false;
};

struct HttpClientOptions {
  std::optional<std::string> proxy;
  bool verify_tls = true;
  std::optional<std::string> ca_bundle;
  std::string user_agent = "oaicompat/0.1";
};

/**
 * One request, one attempt. Implementations throw TransportError for
 * connection-level failures and return every HTTP status as-is; bodies of
 * error statuses are always collected and never passed to on_chunk.
 */
class HttpClient {
public:
  virtual ~HttpClient() = default;
  virtual HttpResponse request(const HttpRequest& request) = 0;
};

std::unique_ptr<HttpClient> make_default_http_client(HttpClientOptions options = {});

inline bool is_success_status(long status_code) {
  return status_code >= 200 && status_code < 300;
}

}  // namespace oaicompat
