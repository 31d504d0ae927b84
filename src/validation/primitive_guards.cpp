#include "albumcat/validation/primitive_guards.h"

#include "albumcat/core/normalization.h"
#include "albumcat/validation/http_url.h"

#include <cmath>
#include <cstdint>
#include <string>

namespace albumcat::validation {

bool is_non_empty_text(const nlohmann::json& value) {
  if (!value.is_string()) {
    return false;
  }
  return !core::trim_view(value.get_ref<const std::string&>()).empty();
}

bool is_non_negative_finite_number(const nlohmann::json& value) {
  if (value.is_number_unsigned()) {
    return true;
  }
  if (value.is_number_integer()) {
    return value.get<std::int64_t>() >= 0;
  }
  if (value.is_number_float()) {
    const double number = value.get<double>();
    return std::isfinite(number) && number >= 0.0;
  }
  return false;
}

bool is_http_url(const nlohmann::json& value) {
  if (!is_non_empty_text(value)) {
    return false;
  }
  return parse_http_url(value.get_ref<const std::string&>()).has_value();
}

}  // namespace albumcat::validation
