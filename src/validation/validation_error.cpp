#include "albumcat/validation/validation_error.h"

namespace albumcat::validation {

std::string validation_error_kind_to_string(const ValidationErrorKind kind) {
  switch (kind) {
    case ValidationErrorKind::kTypeMismatch:
      return "type_mismatch";
    case ValidationErrorKind::kFormatMismatch:
      return "format_mismatch";
    case ValidationErrorKind::kValueOutOfRange:
      return "value_out_of_range";
  }
  return "unknown";
}

}  // namespace albumcat::validation
