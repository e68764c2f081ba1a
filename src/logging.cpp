#include "oaicompat/logging.hpp"

#include <algorithm>
#include <cctype>
#include <exception>
#include <iostream>
#include <memory>
#include <mutex>
#include <set>

namespace oaicompat {
namespace {

std::string to_lower(const std::string& value) {
  std::string lowered; lowered.reserve(value.size());
  std::transform(value.begin(), value.end(), std::back_inserter(lowered), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return lowered;
}

}  // namespace

LogLevel parse_log_level(const std::string& value, LogLevel fallback) {
  const std::string lowered = to_lower(value);
  if (lowered == "off") return LogLevel::Off;
  if (lowered == "error") return LogLevel::Error;
  if (lowered == "warn" || lowered == "warning") return LogLevel::Warn;
  if (lowered == "info") return LogLevel::Info;
  if (lowered == "debug") return LogLevel::Debug;
  return fallback;
}

const char* log_level_name(LogLevel level) {
  switch (level) {
    case LogLevel::Off: return "OFF";
    case LogLevel::Error: return "ERROR";
    case LogLevel::Warn: return "WARN";
    case LogLevel::Info: return "INFO";
    case LogLevel::Debug: return "DEBUG";
  }
  return "UNKNOWN";
}

Logger::Logger(LogLevel level, LoggerCallback sink) : level_(level), sink_(std::move(sink)) {}

bool Logger::enabled(LogLevel level) const {
  if (!sink_ || level == LogLevel::Off) {
    return false;
  }
  return static_cast<int>(level) <= static_cast<int>(level_);
}

void Logger::log(LogLevel level, const std::string& message, const nlohmann::json& details) const {
  if (!enabled(level)) {
    return;
  }
  // A failing sink must not turn a log call into a failed query.
  try {
    sink_(level, message, details);
  } catch (const std::exception& ex) {
    std::cerr << "> [oaicompat] logger callback threw while logging \"" << message << "\": " << ex.what()
              << std::endl;
  }
}

LoggerCallback make_stderr_logger(std::string prefix) {
  auto write_mutex = std::make_shared<std::mutex>();
  return [prefix = std::move(prefix), write_mutex](LogLevel level, const std::string& message, const nlohmann::json& details) {
    std::lock_guard<std::mutex> lock(*write_mutex);
    std::cerr << "> [" << prefix << "] " << log_level_name(level) << ": " << message;
    if (!details.is_null() && !details.empty()) {
      std::cerr << ' ' << details.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    }
    std::cerr << std::endl;
  };
}

std::map<std::string, std::string> sanitize_headers(const std::map<std::string, std::string>& headers) {
  static const std::set<std::string> kSensitive = {"authorization", "cookie", "set-cookie", "proxy-authorization"};
  std::map<std::string, std::string> sanitized;
  for (const auto& [key, value] : headers) {
    if (kSensitive.count(to_lower(key))) {
      sanitized[key] = "***";
    } else {
      sanitized[key] = value;
    }
  }
  return sanitized;
}

}  // namespace oaicompat
