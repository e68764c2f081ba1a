#include "oaicompat/utils/env.hpp"

#include "oaicompat/utils/text.hpp"

#include <cstdlib>

namespace oaicompat::utils {

std::optional<std::string> read_env(const std::string& name) {
  const char* raw = std::getenv(name.c_str());
  if (!raw) {
    return std::nullopt;
  }
  return trim(raw);
}

std::string read_env_or(const std::string& name, const std::string& fallback) {
  auto value = read_env(name);
  if (!value || value->empty()) {
    return fallback;
  }
  return *value;
}

}  // namespace oaicompat::utils
