#pragma once

#include "albumcat/core/result.h"
#include "albumcat/validation/validation_error.h"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace albumcat::validation {

// CalendarDate is a plain proleptic Gregorian date. Two dates compare equal
// iff they name the same day, independent of how the text was written.
struct CalendarDate {
  int year{1970};
  int month{1};
  int day{1};
  auto operator<=>(const CalendarDate&) const = default;
};

// Day/month/year parsing for user-entered dates (European convention).
//
// Grammar (after trimming surrounding whitespace):
//   D{1,2} SEP M{1,2} SEP YYYY     SEP is '/', '-' or '.'
// Examples: "31/12/2024", "1/1/2025", "15-06-2024", "15.06.2024".
// Month-first and year-first text is rejected, never reinterpreted.

// is_leap_year: divisible by 4, except centuries not divisible by 400.
[[nodiscard]] bool is_leap_year(int year);

// days_in_month returns 28-31, or 0 when month is outside [1, 12].
[[nodiscard]] int days_in_month(int month, int year);

// is_valid_calendar_date_text: value is a string matching the grammar that
// names a real calendar day.
[[nodiscard]] bool is_valid_calendar_date_text(const nlohmann::json& value);

// parse_calendar_date returns the date, or nullopt for text that does not
// match the grammar or names an impossible day.
[[nodiscard]] std::optional<CalendarDate> parse_calendar_date(std::string_view text);

// validate_and_parse_calendar_date accepts any JSON value.
// Errors:
//   kTypeMismatch    value is not a string
//   kFormatMismatch  text does not match the grammar
//   kValueOutOfRange month or day outside the calendar
[[nodiscard]] core::Result<CalendarDate, ValidationError> validate_and_parse_calendar_date(
    const nlohmann::json& value);

// to_iso8601 formats a date as YYYY-MM-DD.
[[nodiscard]] std::string to_iso8601(const CalendarDate& date);

}  // namespace albumcat::validation
