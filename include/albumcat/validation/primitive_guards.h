#pragma once

#include <nlohmann/json.hpp>

namespace albumcat::validation {

// Primitive guards over untyped input. Each one inspects the runtime kind of
// the JSON value first, so a value of the wrong kind is classified, not thrown on.

// is_non_empty_text: a string whose trimmed length is > 0.
[[nodiscard]] bool is_non_empty_text(const nlohmann::json& value);

// is_non_negative_finite_number: an integer or floating value that is finite and >= 0.
// Numeric strings ("12") are not numbers.
[[nodiscard]] bool is_non_negative_finite_number(const nlohmann::json& value);

// is_http_url: non-blank text that parses as an absolute http or https URL.
[[nodiscard]] bool is_http_url(const nlohmann::json& value);

}  // namespace albumcat::validation
