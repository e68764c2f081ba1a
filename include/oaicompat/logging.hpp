#pragma once

#include <functional>
#include <map>
#include <string>

#include <nlohmann/json.hpp>

namespace oaicompat {

enum class LogLevel { Off = 0, Error = 1, Warn = 2, Info = 3, Debug = 4 };

using LoggerCallback = std::function<void(LogLevel level, const std::string& message, const nlohmann::json& details)>;

LogLevel parse_log_level(const std::string& value, LogLevel fallback = LogLevel::Off);

const char* log_level_name(LogLevel level);

/**
 * Level filter in front of a LoggerCallback. Copies are cheap and share the
 * same sink, so a client and the dispatcher it owns log through one callback.
 */
class Logger {
public:
  Logger() = default;
  Logger(LogLevel level, LoggerCallback sink);

  bool enabled(LogLevel level) const;
  void log(LogLevel level, const std::string& message, const nlohmann::json& details = {}) const;

  LogLevel level() const { return level_; }

private:
  LogLevel level_ = LogLevel::Off;
  LoggerCallback sink_;
};

/// Console sink writing "> [prefix] LEVEL: message details" to stderr.
LoggerCallback make_stderr_logger(std::string prefix = "oaicompat");

/// Copy of `headers` with credential-bearing values replaced by "***".
std::map<std::string, std::string> sanitize_headers(const std::map<std::string, std::string>& headers);

}  // namespace oaicompat
