#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace albumcat::core {

// Deterministic ASCII-only text utilities shared by the validators.
// These functions are locale-independent and produce byte-stable output
// across all platforms and compilers.
//
// - ASCII lowercasing: A-Z -> a-z via explicit char math (no std::tolower)
// - Whitespace set: space, tab, newline, carriage return, vertical tab, form feed
// - No locale dependence, no undefined behavior on negative char values

inline bool is_ascii_space(const char ch) {
  return ch == ' ' || ch == '\t' || ch == '\n' || ch == '\r' || ch == '\v' || ch == '\f';
}

inline bool is_ascii_digit(const char ch) { return ch >= '0' && ch <= '9'; }

inline bool is_ascii_alpha(const char ch) {
  return (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z');
}

inline bool is_hex_digit(const char ch) {
  return is_ascii_digit(ch) || (ch >= 'a' && ch <= 'f') || (ch >= 'A' && ch <= 'F');
}

// normalize_ascii_lower converts ASCII uppercase (A-Z) to lowercase (a-z).
// Non-ASCII characters are preserved unchanged.
inline std::string normalize_ascii_lower(const std::string_view input) {
  std::string result;
  result.reserve(input.size());

  for (const char ch : input) {
    if (ch >= 'A' && ch <= 'Z') {
      constexpr char kCaseOffset = 'a' - 'A';
      result.push_back(static_cast<char>(ch + kCaseOffset));
    } else {
      result.push_back(ch);
    }
  }

  return result;
}

// trim_view removes leading and trailing ASCII whitespace without copying.
inline std::string_view trim_view(const std::string_view input) {
  std::size_t start = 0;
  while (start < input.size() && is_ascii_space(input[start])) {
    ++start;
  }

  std::size_t end = input.size();
  while (end > start && is_ascii_space(input[end - 1])) {
    --end;
  }

  return input.substr(start, end - start);
}

// trim removes leading and trailing ASCII whitespace.
inline std::string trim(const std::string_view input) { return std::string{trim_view(input)}; }

// split_on cuts input at every occurrence of delimiter.
// Empty input yields an empty list; otherwise the result always has
// (number of delimiters + 1) entries, empty entries included.
inline std::vector<std::string_view> split_on(const std::string_view input, const char delimiter) {
  std::vector<std::string_view> parts;
  if (input.empty()) {
    return parts;
  }

  std::size_t start = 0;
  while (true) {
    const auto pos = input.find(delimiter, start);
    if (pos == std::string_view::npos) {
      parts.push_back(input.substr(start));
      break;
    }
    parts.push_back(input.substr(start, pos - start));
    start = pos + 1;
  }

  return parts;
}

}  // namespace albumcat::core
