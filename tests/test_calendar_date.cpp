#include "albumcat/validation/calendar_date.h"

#include <catch2/catch.hpp>

#include <string>

using namespace albumcat::validation;

TEST_CASE("is_leap_year follows the Gregorian rule", "[validation][date]") {
  CHECK(is_leap_year(2024));
  CHECK(is_leap_year(2000));
  CHECK(is_leap_year(1600));
  CHECK_FALSE(is_leap_year(2023));
  CHECK_FALSE(is_leap_year(1900));
  CHECK_FALSE(is_leap_year(2100));
}

TEST_CASE("days_in_month handles variable month lengths", "[validation][date]") {
  CHECK(days_in_month(1, 2023) == 31);
  CHECK(days_in_month(2, 2023) == 28);
  CHECK(days_in_month(2, 2024) == 29);
  CHECK(days_in_month(4, 2024) == 30);
  CHECK(days_in_month(11, 2024) == 30);
  CHECK(days_in_month(12, 2024) == 31);
  CHECK(days_in_month(0, 2024) == 0);
  CHECK(days_in_month(13, 2024) == 0);
}

TEST_CASE("is_valid_calendar_date_text accepts real day/month/year dates", "[validation][date]") {
  CHECK(is_valid_calendar_date_text("31/12/2024"));
  CHECK(is_valid_calendar_date_text("1/1/2025"));
  CHECK(is_valid_calendar_date_text("29/02/2024"));
  CHECK(is_valid_calendar_date_text("15-06-2024"));
  CHECK(is_valid_calendar_date_text("15.06.2024"));
  CHECK(is_valid_calendar_date_text("29/02/2000"));
  CHECK(is_valid_calendar_date_text("  01/02/2024  "));
}

TEST_CASE("is_valid_calendar_date_text rejects impossible days", "[validation][date]") {
  CHECK_FALSE(is_valid_calendar_date_text("32/12/2024"));
  CHECK_FALSE(is_valid_calendar_date_text("29/02/2023"));
  CHECK_FALSE(is_valid_calendar_date_text("29/02/1900"));
  CHECK_FALSE(is_valid_calendar_date_text("31/11/2024"));
  CHECK_FALSE(is_valid_calendar_date_text("31/04/2024"));
  CHECK_FALSE(is_valid_calendar_date_text("0/01/2024"));
  CHECK_FALSE(is_valid_calendar_date_text("00/01/2024"));
  CHECK_FALSE(is_valid_calendar_date_text("01/00/2024"));
}

TEST_CASE("is_valid_calendar_date_text rejects malformed text", "[validation][date]") {
  SECTION("month-first and year-first orders are not reinterpreted") {
    CHECK_FALSE(is_valid_calendar_date_text("12/13/2024"));
    CHECK_FALSE(is_valid_calendar_date_text("2024/12/31"));
  }

  SECTION("year must have exactly four digits") {
    CHECK_FALSE(is_valid_calendar_date_text("01/01/24"));
    CHECK_FALSE(is_valid_calendar_date_text("01/01/202"));
    CHECK_FALSE(is_valid_calendar_date_text("01/01/20245"));
  }

  SECTION("day and month have at most two digits") {
    CHECK_FALSE(is_valid_calendar_date_text("001/01/2024"));
    CHECK_FALSE(is_valid_calendar_date_text("01/012/2024"));
  }

  SECTION("only / - . separate fields") {
    CHECK_FALSE(is_valid_calendar_date_text("01 01 2024"));
    CHECK_FALSE(is_valid_calendar_date_text("01//01/2024"));
    CHECK_FALSE(is_valid_calendar_date_text("01_01_2024"));
  }

  SECTION("blank and non-string input") {
    CHECK_FALSE(is_valid_calendar_date_text(""));
    CHECK_FALSE(is_valid_calendar_date_text("   "));
    CHECK_FALSE(is_valid_calendar_date_text(nullptr));
    CHECK_FALSE(is_valid_calendar_date_text(123));
  }
}

TEST_CASE("parse_calendar_date returns the named day", "[validation][date]") {
  const auto date = parse_calendar_date("01/01/2025");
  REQUIRE(date.has_value());
  CHECK(date->year == 2025);
  CHECK(date->month == 1);
  CHECK(date->day == 1);
}

TEST_CASE("parse_calendar_date treats the separator as cosmetic", "[validation][date]") {
  const auto slashes = parse_calendar_date("15/06/2024");
  const auto dashes = parse_calendar_date("15-06-2024");
  const auto dots = parse_calendar_date("15.6.2024");

  REQUIRE(slashes.has_value());
  REQUIRE(dashes.has_value());
  REQUIRE(dots.has_value());
  CHECK(slashes.value() == dashes.value());
  CHECK(dashes.value() == dots.value());
}

TEST_CASE("parse_calendar_date agrees across separators for every day of a leap year",
          "[validation][date]") {
  for (int month = 1; month <= 12; ++month) {
    for (int day = 1; day <= days_in_month(month, 2024); ++day) {
      const std::string body = std::to_string(day) + "%" + std::to_string(month) + "%2024";
      std::string slash = body;
      std::string dash = body;
      std::string dot = body;
      for (std::size_t i = 0; i < body.size(); ++i) {
        if (body[i] == '%') {
          slash[i] = '/';
          dash[i] = '-';
          dot[i] = '.';
        }
      }

      const auto a = parse_calendar_date(slash);
      const auto b = parse_calendar_date(dash);
      const auto c = parse_calendar_date(dot);
      REQUIRE(a.has_value());
      REQUIRE(b.has_value());
      REQUIRE(c.has_value());
      CHECK(a.value() == b.value());
      CHECK(b.value() == c.value());
      CHECK(a->month == month);
      CHECK(a->day == day);
    }
  }
}

TEST_CASE("parse_calendar_date returns nullopt for invalid input", "[validation][date]") {
  CHECK_FALSE(parse_calendar_date("32/12/2024").has_value());
  CHECK_FALSE(parse_calendar_date("invalid").has_value());
  CHECK_FALSE(parse_calendar_date("").has_value());
}

TEST_CASE("CalendarDate orders chronologically", "[validation][date]") {
  const auto earlier = parse_calendar_date("31/12/2023");
  const auto later = parse_calendar_date("1/1/2024");
  REQUIRE(earlier.has_value());
  REQUIRE(later.has_value());
  CHECK(earlier.value() < later.value());
}

TEST_CASE("validate_and_parse_calendar_date reports structured outcomes", "[validation][date]") {
  SECTION("valid text yields a date and no error") {
    const auto result = validate_and_parse_calendar_date("25/12/2024");
    REQUIRE(result.has_value());
    CHECK(to_iso8601(result.value()) == "2024-12-25");
  }

  SECTION("non-string input is a type mismatch") {
    const auto result = validate_and_parse_calendar_date(20241225);
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().kind == ValidationErrorKind::kTypeMismatch);
    CHECK(result.error().message.find("must be a string") != std::string::npos);

    CHECK(validate_and_parse_calendar_date(nullptr).error().kind ==
          ValidationErrorKind::kTypeMismatch);
  }

  SECTION("text outside the grammar is a format mismatch") {
    const auto result = validate_and_parse_calendar_date("2024-12-25");
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().kind == ValidationErrorKind::kFormatMismatch);
    CHECK(result.error().message.find("real calendar date") != std::string::npos);
  }

  SECTION("impossible days are out of range") {
    const auto result = validate_and_parse_calendar_date("31/04/2024");
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().kind == ValidationErrorKind::kValueOutOfRange);
  }
}

TEST_CASE("to_iso8601 zero-pads every field", "[validation][date]") {
  CHECK(to_iso8601(CalendarDate{2025, 1, 5}) == "2025-01-05");
  CHECK(to_iso8601(CalendarDate{999, 12, 31}) == "0999-12-31");
}
