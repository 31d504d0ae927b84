#pragma once

#include <cstddef>
#include <optional>
#include <string_view>

namespace albumcat::core {

// decode_utf8 reads the code point starting at text[pos] and advances pos past it.
// Overlong forms, surrogates and values above U+10FFFF are invalid: the result is
// nullopt and pos moves forward by a single byte so scanning can continue.
inline std::optional<char32_t> decode_utf8(const std::string_view text, std::size_t& pos) {
  const auto lead = static_cast<unsigned char>(text[pos]);
  ++pos;
  if (lead < 0x80) {
    return static_cast<char32_t>(lead);
  }

  std::size_t length = 0;
  char32_t cp = 0;
  unsigned char min_second = 0x80;
  unsigned char max_second = 0xBF;
  if (lead >= 0xC2 && lead <= 0xDF) {
    length = 2;
    cp = lead & 0x1Fu;
  } else if (lead >= 0xE0 && lead <= 0xEF) {
    length = 3;
    cp = lead & 0x0Fu;
    if (lead == 0xE0) {
      min_second = 0xA0;
    } else if (lead == 0xED) {
      max_second = 0x9F;
    }
  } else if (lead >= 0xF0 && lead <= 0xF4) {
    length = 4;
    cp = lead & 0x07u;
    if (lead == 0xF0) {
      min_second = 0x90;
    } else if (lead == 0xF4) {
      max_second = 0x8F;
    }
  } else {
    return std::nullopt;
  }

  const std::size_t start = pos;
  if (start + length - 1 > text.size()) {
    return std::nullopt;
  }
  for (std::size_t i = 0; i + 1 < length; ++i) {
    const auto byte = static_cast<unsigned char>(text[start + i]);
    const unsigned char low = i == 0 ? min_second : 0x80;
    const unsigned char high = i == 0 ? max_second : 0xBF;
    if (byte < low || byte > high) {
      return std::nullopt;
    }
    cp = (cp << 6) | (byte & 0x3Fu);
  }

  pos = start + length - 1;
  return cp;
}

// is_valid_utf8 reports whether every byte of text belongs to a well-formed sequence.
inline bool is_valid_utf8(const std::string_view text) {
  std::size_t pos = 0;
  while (pos < text.size()) {
    if (!decode_utf8(text, pos).has_value()) {
      return false;
    }
  }
  return true;
}

}  // namespace albumcat::core
