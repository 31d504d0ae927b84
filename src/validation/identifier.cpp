#include "albumcat/validation/identifier.h"

#include "albumcat/core/normalization.h"

#include <array>
#include <string>

namespace albumcat::validation {

namespace {

constexpr std::array<std::size_t, 5> kGroupLengths = {8, 4, 4, 4, 12};

bool all_hex(const std::string_view text) {
  for (const char ch : text) {
    if (!core::is_hex_digit(ch)) {
      return false;
    }
  }
  return true;
}

// strip_wrapper removes one matching {} or () pair. Returns false when the
// text carries a lone or mismatched bracket.
bool strip_wrapper(std::string_view& text) {
  if (text.empty()) {
    return false;
  }

  const char open = text.front();
  const char close = text.back();
  const bool opens = open == '{' || open == '(';
  const bool closes = close == '}' || close == ')';

  if (!opens && !closes) {
    return true;
  }
  if (text.size() < 2 || !((open == '{' && close == '}') || (open == '(' && close == ')'))) {
    return false;
  }

  text = text.substr(1, text.size() - 2);
  return true;
}

}  // namespace

bool is_valid_guid(const std::string_view text) {
  std::string_view guid = core::trim_view(text);
  if (!strip_wrapper(guid) || guid.size() != kGuidStringLength) {
    return false;
  }

  std::size_t pos = 0;
  for (std::size_t i = 0; i < kGroupLengths.size(); ++i) {
    if (i > 0) {
      if (guid[pos] != '-') {
        return false;
      }
      ++pos;
    }
    if (!all_hex(guid.substr(pos, kGroupLengths[i]))) {
      return false;
    }
    pos += kGroupLengths[i];
  }

  return pos == guid.size();
}

bool is_valid_identifier_text(const nlohmann::json& value) {
  if (!value.is_string()) {
    return false;
  }
  return is_valid_guid(value.get_ref<const std::string&>());
}

}  // namespace albumcat::validation
