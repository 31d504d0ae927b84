#pragma once

#include <nlohmann/json.hpp>

#include <cstddef>
#include <string_view>

namespace albumcat::validation {

// GUID text recognition.
//
// Accepted (hex digits in either case, surrounding whitespace ignored):
//   550e8400-e29b-41d4-a716-446655440000
//   {550e8400-e29b-41d4-a716-446655440000}
//   (550e8400-e29b-41d4-a716-446655440000)
// Rejected: one-sided or mismatched wrappers, missing or extra groups,
// wrong group lengths, non-hex characters.

constexpr std::size_t kGuidHexDigits = 32;
constexpr std::size_t kGuidStringLength = kGuidHexDigits + 4;

// is_valid_guid classifies text; it performs no canonicalization.
[[nodiscard]] bool is_valid_guid(std::string_view text);

// is_valid_identifier_text accepts any JSON value; non-strings are rejected.
[[nodiscard]] bool is_valid_identifier_text(const nlohmann::json& value);

}  // namespace albumcat::validation
