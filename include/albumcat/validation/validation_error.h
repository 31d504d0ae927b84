#pragma once

#include <string>

namespace albumcat::validation {

// ValidationErrorKind classifies why untrusted input was rejected.
// - kTypeMismatch: wrong runtime kind (e.g. a number where text is expected)
// - kFormatMismatch: text that fails the structural grammar
// - kValueOutOfRange: structurally valid but semantically impossible
//   (day 31 in a 30-day month, octet > 255)
enum class ValidationErrorKind {
  kTypeMismatch,
  kFormatMismatch,
  kValueOutOfRange,
};

// ValidationError carries the classification plus a message suitable for
// showing to the person who typed the value.
struct ValidationError {
  ValidationErrorKind kind{ValidationErrorKind::kFormatMismatch};
  std::string message;
};

[[nodiscard]] std::string validation_error_kind_to_string(ValidationErrorKind kind);

}  // namespace albumcat::validation
