#include "oaicompat/utils/text.hpp"

#include <cctype>

namespace oaicompat::utils {
namespace {

bool is_space(char ch) {
  return std::isspace(static_cast<unsigned char>(ch)) != 0;
}

bool is_continuation(unsigned char byte) {
  return (byte & 0xC0u) == 0x80u;
}

}  // namespace

std::string trim(std::string_view value) {
  std::size_t begin = 0;
  while (begin < value.size() && is_space(value[begin])) {
    ++begin;
  }
  return std::string(trim_trailing(value.substr(begin)));
}

std::string_view trim_trailing(std::string_view value) {
  std::size_t end = value.size();
  while (end > 0 && is_space(value[end - 1])) {
    --end;
  }
  return value.substr(0, end);
}

bool starts_with(std::string_view value, std::string_view prefix) {
  return value.size() >= prefix.size() && value.compare(0, prefix.size(), prefix) == 0;
}

bool is_valid_utf8(std::string_view text) {
  std::size_t i = 0;
  const std::size_t size = text.size();
  while (i < size) {
    const auto lead = static_cast<unsigned char>(text[i]);
    if (lead < 0x80u) {
      ++i;
      continue;
    }

    std::size_t length = 0;
    unsigned int code_point = 0;
    if (lead >= 0xC2u && lead <= 0xDFu) {
      length = 2;
      code_point = lead & 0x1Fu;
    } else if (lead >= 0xE0u && lead <= 0xEFu) {
      length = 3;
      code_point = lead & 0x0Fu;
    } else if (lead >= 0xF0u && lead <= 0xF4u) {
      length = 4;
      code_point = lead & 0x07u;
    } else {
      return false;
    }

    if (i + length > size) {
      return false;
    }
    for (std::size_t k = 1; k < length; ++k) {
      const auto byte = static_cast<unsigned char>(text[i + k]);
      if (!is_continuation(byte)) {
        return false;
      }
      code_point = (code_point << 6) | (byte & 0x3Fu);
    }

    if (length == 3 && (code_point < 0x800u || (code_point >= 0xD800u && code_point <= 0xDFFFu))) {
      return false;
    }
    if (length == 4 && (code_point < 0x10000u || code_point > 0x10FFFFu)) {
      return false;
    }
    i += length;
  }
  return true;
}

std::string preview(std::string_view text, std::size_t limit) {
  if (text.size() <= limit) {
    return std::string(text);
  }
  std::size_t end = limit;
  while (end > 0 && is_continuation(static_cast<unsigned char>(text[end]))) {
    --end;
  }
  return std::string(text.substr(0, end));
}

}  // namespace oaicompat::utils
