#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace oaicompat::utils {

std::string trim(std::string_view value);

std::string_view trim_trailing(std::string_view value);

bool starts_with(std::string_view value, std::string_view prefix);

/// Strict UTF-8 check: rejects overlong forms, surrogates and code points above U+10FFFF.
bool is_valid_utf8(std::string_view text);

/// First `limit` bytes of `text`, cut back to a code point boundary.
std::string preview(std::string_view text, std::size_t limit);

}  // namespace oaicompat::utils
