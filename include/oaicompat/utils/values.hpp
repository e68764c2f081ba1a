#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace oaicompat::utils {

std::optional<nlohmann::json> safe_json(const std::string& text);

/// Strings are returned verbatim, anything else is serialized.
std::string stringify(const nlohmann::json& value);

/// Human-readable message of an `error` member: its `message` when it has one.
std::string error_message(const nlohmann::json& error);

std::optional<std::string> optional_string(const nlohmann::json& object, const char* key);

/// Integer member clamped to [0, INT64_MAX]; missing or non-numeric members read as 0.
std::int64_t non_negative_integer(const nlohmann::json& object, const char* key);

/// `total + amount`, stopping at INT64_MAX. Negative amounts leave the total unchanged.
std::int64_t saturating_add(std::int64_t total, std::int64_t amount);

}  // namespace oaicompat::utils
