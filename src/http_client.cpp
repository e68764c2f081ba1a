#include "oaicompat/http_client.hpp"

#include "oaicompat/error.hpp"
#include "oaicompat/utils/text.hpp"

#include <curl/curl.h>

#include <algorithm>
#include <exception>
#include <map>
#include <memory>
#include <string>
#include <string_view>

namespace oaicompat {
namespace {

struct CurlHandleDeleter {
  void operator()(CURL* handle) const { curl_easy_cleanup(handle); }
};

struct CurlListDeleter {
  void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};

using CurlHandle = std::unique_ptr<CURL, CurlHandleDeleter>;
using CurlList = std::unique_ptr<curl_slist, CurlListDeleter>;

struct WriteContext {
  CURL* curl = nullptr;
  std::string* body = nullptr;
  std::string* error_body = nullptr;
  const std::function<bool(const char*, std::size_t)>* on_chunk = nullptr;
  long status_code = 0;
  bool stopped = false;
  std::exception_ptr failure;
};

size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
  auto* context = static_cast<WriteContext*>(userdata);
  const size_t total = size * nmemb;

  if (context->status_code == 0) {
    curl_easy_getinfo(context->curl, CURLINFO_RESPONSE_CODE, &context->status_code);
  }

  // Error bodies are kept whole so the caller can report them; they never reach on_chunk.
  if (!is_success_status(context->status_code)) {
    context->error_body->append(ptr, total);
    return total;
  }

  if (context->on_chunk && *context->on_chunk) {
    try {
      if (!(*context->on_chunk)(ptr, total)) {
        context->stopped = true;
        return 0;
      }
    } catch (...) {
      context->failure = std::current_exception();
      return 0;
    }
  }
  if (context->body) {
    context->body->append(ptr, total);
  }
  return total;
}

size_t header_callback(char* buffer, size_t size, size_t nitems, void* userdata) {
  const std::size_t total_size = size * nitems;
  const std::string_view line(buffer, total_size);
  auto* headers = static_cast<std::map<std::string, std::string>*>(userdata);

  // A new status line starts a new header block (redirects, 100-continue).
  if (utils::starts_with(line, "HTTP/")) {
    headers->clear();
    return total_size;
  }

  auto colon_pos = line.find(':');
  if (colon_pos != std::string_view::npos) {
    std::string key = utils::trim(line.substr(0, colon_pos));
    std::string value = utils::trim(line.substr(colon_pos + 1));
    if (!key.empty()) {
      (*headers)[key] = value;
    }
  }

  return total_size;
}

class CurlHttpClient : public HttpClient {
public:
  explicit CurlHttpClient(HttpClientOptions options) : options_(std::move(options)) {}

  HttpResponse request(const HttpRequest& request) override {
    CurlHandle curl(curl_easy_init());
    if (!curl) {
      throw TransportError("Failed to initialize libcurl");
    }

    CurlList header_list;
    for (const auto& [key, value] : request.headers) {
      std::string header = key + ": " + value;
      curl_slist* appended = curl_slist_append(header_list.get(), header.c_str());
      if (!appended) {
        throw TransportError("Failed to build request headers");
      }
      (void)header_list.release();
      header_list.reset(appended);
    }

    HttpResponse response;
    WriteContext context;
    context.curl = curl.get();
    context.body = request.collect_body ? &response.body : nullptr;
    context.error_body = &response.body;
    context.on_chunk = request.on_chunk ? &request.on_chunk : nullptr;

    CURL* handle = curl.get();
    curl_easy_setopt(handle, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(handle, CURLOPT_CUSTOMREQUEST, request.method.c_str());
    curl_easy_setopt(handle, CURLOPT_HTTPHEADER, header_list.get());
    curl_easy_setopt(handle, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(handle, CURLOPT_WRITEDATA, &context);
    curl_easy_setopt(handle, CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(handle, CURLOPT_HEADERDATA, &response.headers);
    curl_easy_setopt(handle, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(handle, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(handle, CURLOPT_USERAGENT, options_.user_agent.c_str());

    const long timeout_ms = static_cast<long>(request.timeout.count());
    if (timeout_ms > 0) {
      curl_easy_setopt(handle, CURLOPT_CONNECTTIMEOUT_MS, timeout_ms);
      curl_easy_setopt(handle, CURLOPT_LOW_SPEED_LIMIT, 1L);
      curl_easy_setopt(handle, CURLOPT_LOW_SPEED_TIME, std::max(1L, timeout_ms / 1000));
    }

    if (options_.proxy && !options_.proxy->empty()) {
      curl_easy_setopt(handle, CURLOPT_PROXY, options_.proxy->c_str());
    }
    curl_easy_setopt(handle, CURLOPT_SSL_VERIFYPEER, options_.verify_tls ? 1L : 0L);
    curl_easy_setopt(handle, CURLOPT_SSL_VERIFYHOST, options_.verify_tls ? 2L : 0L);
    if (options_.ca_bundle && !options_.ca_bundle->empty()) {
      curl_easy_setopt(handle, CURLOPT_CAINFO, options_.ca_bundle->c_str());
    }

    if (!request.body.empty()) {
      curl_easy_setopt(handle, CURLOPT_POSTFIELDS, request.body.c_str());
      curl_easy_setopt(handle, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(request.body.size()));
    }

    const CURLcode res = curl_easy_perform(handle);

    if (context.failure) {
      std::rethrow_exception(context.failure);
    }

    curl_easy_getinfo(handle, CURLINFO_RESPONSE_CODE, &response.status_code);

    if (res == CURLE_WRITE_ERROR && context.stopped) {
      response.stopped_early = true;
    } else if (res == CURLE_OPERATION_TIMEDOUT) {
      throw TransportTimeoutError(std::string("libcurl error: ") + curl_easy_strerror(res));
    } else if (res != CURLE_OK) {
      throw TransportError(std::string("libcurl error: ") + curl_easy_strerror(res));
    }

    return response;
  }

private:
  HttpClientOptions options_;
};

struct CurlGlobalState {
  CurlGlobalState() { curl_global_init(CURL_GLOBAL_DEFAULT); }
  ~CurlGlobalState() { curl_global_cleanup(); }
};

CurlGlobalState& curl_state() {
  static CurlGlobalState state;
  return state;
}

}  // namespace

std::unique_ptr<HttpClient> make_default_http_client(HttpClientOptions options) {
  (void)curl_state();
  return std::make_unique<CurlHttpClient>(std::move(options));
}

}  // namespace oaicompat
