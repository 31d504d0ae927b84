#include "albumcat/validation/record_guard.h"

#include "albumcat/domain/album.h"
#include "albumcat/validation/primitive_guards.h"

#include <cstdint>
#include <limits>

namespace albumcat::validation {

namespace {

// field_or_null returns the member when present, a null value otherwise, so
// the guards see an absent key the same way they see an explicit null.
const nlohmann::json& field_or_null(const nlohmann::json& object, const char* key) {
  static const nlohmann::json kNull;
  if (!object.is_object()) {
    return kNull;
  }
  const auto it = object.find(key);
  return it != object.end() ? *it : kNull;
}

}  // namespace

bool is_album_id(const nlohmann::json& value) {
  if (value.is_number_unsigned()) {
    return value.get<std::uint64_t>() <=
           static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max());
  }
  return value.is_number_integer();
}

bool is_well_formed_album(const nlohmann::json& value) {
  if (!value.is_object()) {
    return false;
  }

  namespace f = domain::album_fields;
  return is_album_id(field_or_null(value, f::kId)) &&
         is_non_empty_text(field_or_null(value, f::kTitle)) &&
         is_non_empty_text(field_or_null(value, f::kArtist)) &&
         is_non_negative_finite_number(field_or_null(value, f::kPrice)) &&
         is_http_url(field_or_null(value, f::kImageUrl));
}

FormValidation validate_form_input(const nlohmann::json& partial) {
  namespace f = domain::album_fields;
  FormValidation result;

  if (!is_non_empty_text(field_or_null(partial, f::kTitle))) {
    result.errors[f::kTitle] = "Title is required";
  }
  if (!is_non_empty_text(field_or_null(partial, f::kArtist))) {
    result.errors[f::kArtist] = "Artist is required";
  }
  if (!is_non_negative_finite_number(field_or_null(partial, f::kPrice))) {
    result.errors[f::kPrice] = "Price must be a non-negative number";
  }
  if (!is_http_url(field_or_null(partial, f::kImageUrl))) {
    result.errors[f::kImageUrl] = "Image must be a valid http/https URL";
  }

  result.valid = result.errors.empty();
  return result;
}

}  // namespace albumcat::validation
