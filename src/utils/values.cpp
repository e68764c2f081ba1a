#include "oaicompat/utils/values.hpp"

#include <limits>

namespace oaicompat::utils {

std::optional<nlohmann::json> safe_json(const std::string& text) {
  auto parsed = nlohmann::json::parse(text, nullptr, false);
  if (parsed.is_discarded()) {
    return std::nullopt;
  }
  return parsed;
}

std::string stringify(const nlohmann::json& value) {
  if (value.is_string()) {
    return value.get<std::string>();
  }
  return value.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::string error_message(const nlohmann::json& error) {
  if (error.is_object()) {
    auto it = error.find("message");
    if (it != error.end() && !it->is_null()) {
      return stringify(*it);
    }
  }
  return stringify(error);
}

std::optional<std::string> optional_string(const nlohmann::json& object, const char* key) {
  if (!object.is_object()) {
    return std::nullopt;
  }
  auto it = object.find(key);
  if (it == object.end() || it->is_null()) {
    return std::nullopt;
  }
  return stringify(*it);
}

std::int64_t non_negative_integer(const nlohmann::json& object, const char* key) {
  if (!object.is_object()) {
    return 0;
  }
  auto it = object.find(key);
  if (it == object.end() || !it->is_number()) {
    return 0;
  }
  constexpr auto kMax = std::numeric_limits<std::int64_t>::max();
  if (it->is_number_unsigned()) {
    const auto value = it->get<std::uint64_t>();
    return value > static_cast<std::uint64_t>(kMax) ? kMax : static_cast<std::int64_t>(value);
  }
  if (it->is_number_float()) {
    const double value = it->get<double>();
    // NaN fails the first comparison; 2^63 is exactly representable as a double.
    if (!(value > 0.0)) {
      return 0;
    }
    return value >= 9223372036854775808.0 ? kMax : static_cast<std::int64_t>(value);
  }
  const auto value = it->get<std::int64_t>();
  return value < 0 ? 0 : value;
}

std::int64_t saturating_add(std::int64_t total, std::int64_t amount) {
  constexpr auto kMax = std::numeric_limits<std::int64_t>::max();
  if (amount <= 0) {
    return total;
  }
  return total > kMax - amount ? kMax : total + amount;
}

}  // namespace oaicompat::utils
