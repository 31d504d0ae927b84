#pragma once

#include <nlohmann/json.hpp>

#include <map>
#include <string>

namespace albumcat::validation {

// FieldErrors maps a record field name to a message for the form that edits it.
using FieldErrors = std::map<std::string, std::string>;

// FormValidation is the outcome of checking one form submission.
// Invariant: valid == errors.empty().
struct FormValidation {
  bool valid{true};    // NOLINT(readability-identifier-naming)
  FieldErrors errors;  // NOLINT(readability-identifier-naming)
};

// is_album_id accepts JSON integers that fit AlbumId (signed 64-bit).
// Unsigned values above INT64_MAX, floats and numeric strings are rejected.
[[nodiscard]] bool is_album_id(const nlohmann::json& value);

// is_well_formed_album decides whether an untyped value is a complete album
// record: an object with an is_album_id id, non-empty title and artist, a
// non-negative finite price, and an http/https image_url. Extra keys are ignored.
[[nodiscard]] bool is_well_formed_album(const nlohmann::json& value);

// validate_form_input checks every editable field of a (possibly partial)
// album independently, so one call reports all problems. id and genre are not
// checked. A non-object value reports every field.
[[nodiscard]] FormValidation validate_form_input(const nlohmann::json& partial);

}  // namespace albumcat::validation
