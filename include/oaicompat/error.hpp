#pragma once

#include <map>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

namespace oaicompat {

class OaiCompatError : public std::runtime_error {
public:
  explicit OaiCompatError(const std::string& message)
      : std::runtime_error(message) {}
};

/// Connection, DNS, TLS or transfer failure. Never retried by the library.
class TransportError : public OaiCompatError {
public:
  explicit TransportError(const std::string& message)
      : OaiCompatError(message) {}
};

class TransportTimeoutError : public TransportError {
public:
  using TransportError::TransportError;
};

/// Non-2xx response from the endpoint.
class HttpStatusError : public OaiCompatError {
public:
  HttpStatusError(std::string message,
                  long status_code,
                  std::string body,
                  nlohmann::json error_body,
                  std::map<std::string, std::string> headers)
      : OaiCompatError(std::move(message)),
        status_code_(status_code),
        body_(std::move(body)),
        error_body_(std::move(error_body)),
        headers_(std::move(headers)) {}

  long status_code() const { return status_code_; }
  const std::string& body() const { return body_; }
  const nlohmann::json& error_body() const { return error_body_; }
  const std::map<std::string, std::string>& headers() const { return headers_; }

private:
  long status_code_;
  std::string body_;
  nlohmann::json error_body_;
  std::map<std::string, std::string> headers_;
};

/// Whole response body could not be decoded.
class DecodeError : public OaiCompatError {
public:
  explicit DecodeError(const std::string& message)
      : OaiCompatError(message) {}
};

}  // namespace oaicompat
