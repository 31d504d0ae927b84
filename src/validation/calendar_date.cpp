#include "albumcat/validation/calendar_date.h"

#include "albumcat/core/normalization.h"

#include <iomanip>
#include <sstream>

namespace albumcat::validation {

namespace {

constexpr const char* kTypeMismatchMessage = "Input must be a string in dd/mm/yyyy format";
constexpr const char* kInvalidDateMessage = "Date must be in dd/mm/yyyy and be a real calendar date";

constexpr std::size_t kYearDigits = 4;

bool is_date_separator(const char ch) { return ch == '/' || ch == '-' || ch == '.'; }

// DateFields holds the numbers read from text that matched the grammar,
// before any calendar check.
struct DateFields {
  int day{0};
  int month{0};
  int year{0};
};

// read_number consumes between min_digits and max_digits ASCII digits from
// text starting at pos. Returns nullopt if fewer than min_digits are present.
std::optional<int> read_number(const std::string_view text, std::size_t& pos,
                               const std::size_t min_digits, const std::size_t max_digits) {
  int value = 0;
  std::size_t count = 0;
  while (pos < text.size() && count < max_digits && core::is_ascii_digit(text[pos])) {
    value = value * 10 + (text[pos] - '0');
    ++pos;
    ++count;
  }
  if (count < min_digits) {
    return std::nullopt;
  }
  return value;
}

// match_grammar applies the D{1,2} SEP M{1,2} SEP YYYY grammar to trimmed text.
std::optional<DateFields> match_grammar(const std::string_view raw) {
  const std::string_view text = core::trim_view(raw);
  std::size_t pos = 0;

  const auto day = read_number(text, pos, 1, 2);
  if (!day.has_value() || pos >= text.size() || !is_date_separator(text[pos])) {
    return std::nullopt;
  }
  ++pos;

  const auto month = read_number(text, pos, 1, 2);
  if (!month.has_value() || pos >= text.size() || !is_date_separator(text[pos])) {
    return std::nullopt;
  }
  ++pos;

  const auto year = read_number(text, pos, kYearDigits, kYearDigits);
  if (!year.has_value() || pos != text.size()) {
    return std::nullopt;
  }

  return DateFields{day.value(), month.value(), year.value()};
}

bool is_real_date(const DateFields& fields) {
  if (fields.month < 1 || fields.month > 12) {
    return false;
  }
  return fields.day >= 1 && fields.day <= days_in_month(fields.month, fields.year);
}

}  // namespace

bool is_leap_year(const int year) {
  return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

int days_in_month(const int month, const int year) {
  switch (month) {
    case 1:
    case 3:
    case 5:
    case 7:
    case 8:
    case 10:
    case 12:
      return 31;
    case 4:
    case 6:
    case 9:
    case 11:
      return 30;
    case 2:
      return is_leap_year(year) ? 29 : 28;
    default:
      return 0;
  }
}

bool is_valid_calendar_date_text(const nlohmann::json& value) {
  if (!value.is_string()) {
    return false;
  }
  const auto fields = match_grammar(value.get_ref<const std::string&>());
  return fields.has_value() && is_real_date(fields.value());
}

std::optional<CalendarDate> parse_calendar_date(const std::string_view text) {
  const auto fields = match_grammar(text);
  if (!fields.has_value() || !is_real_date(fields.value())) {
    return std::nullopt;
  }
  return CalendarDate{fields->year, fields->month, fields->day};
}

core::Result<CalendarDate, ValidationError> validate_and_parse_calendar_date(
    const nlohmann::json& value) {
  using DateResult = core::Result<CalendarDate, ValidationError>;

  if (!value.is_string()) {
    return DateResult::err({ValidationErrorKind::kTypeMismatch, kTypeMismatchMessage});
  }

  const auto fields = match_grammar(value.get_ref<const std::string&>());
  if (!fields.has_value()) {
    return DateResult::err({ValidationErrorKind::kFormatMismatch, kInvalidDateMessage});
  }
  if (!is_real_date(fields.value())) {
    return DateResult::err({ValidationErrorKind::kValueOutOfRange, kInvalidDateMessage});
  }

  return DateResult::ok(CalendarDate{fields->year, fields->month, fields->day});
}

std::string to_iso8601(const CalendarDate& date) {
  std::ostringstream out;
  out << std::setfill('0') << std::setw(4) << date.year << '-' << std::setw(2) << date.month
      << '-' << std::setw(2) << date.day;
  return out.str();
}

}  // namespace albumcat::validation
