#include "albumcat/validation/primitive_guards.h"

#include <catch2/catch.hpp>

#include <limits>

using namespace albumcat::validation;

TEST_CASE("is_non_empty_text", "[validation][guards]") {
  SECTION("accepts text with visible characters") {
    CHECK(is_non_empty_text("hello"));
    CHECK(is_non_empty_text("  space  "));
  }

  SECTION("rejects empty and whitespace-only text") {
    CHECK_FALSE(is_non_empty_text(""));
    CHECK_FALSE(is_non_empty_text("  "));
    CHECK_FALSE(is_non_empty_text("\t\n"));
  }

  SECTION("rejects non-text values") {
    CHECK_FALSE(is_non_empty_text(nullptr));
    CHECK_FALSE(is_non_empty_text(nlohmann::json{}));
    CHECK_FALSE(is_non_empty_text(123));
    CHECK_FALSE(is_non_empty_text(true));
    CHECK_FALSE(is_non_empty_text(nlohmann::json::object()));
  }
}

TEST_CASE("is_non_negative_finite_number", "[validation][guards]") {
  SECTION("accepts zero and positive numbers") {
    CHECK(is_non_negative_finite_number(0));
    CHECK(is_non_negative_finite_number(1));
    CHECK(is_non_negative_finite_number(99.99));
    CHECK(is_non_negative_finite_number(0.0));
    CHECK(is_non_negative_finite_number(18446744073709551615ULL));
  }

  SECTION("rejects negative numbers") {
    CHECK_FALSE(is_non_negative_finite_number(-1));
    CHECK_FALSE(is_non_negative_finite_number(-0.01));
  }

  SECTION("rejects non-finite numbers") {
    CHECK_FALSE(is_non_negative_finite_number(std::numeric_limits<double>::quiet_NaN()));
    CHECK_FALSE(is_non_negative_finite_number(std::numeric_limits<double>::infinity()));
    CHECK_FALSE(is_non_negative_finite_number(-std::numeric_limits<double>::infinity()));
  }

  SECTION("rejects non-numeric values") {
    CHECK_FALSE(is_non_negative_finite_number("123"));
    CHECK_FALSE(is_non_negative_finite_number(nullptr));
    CHECK_FALSE(is_non_negative_finite_number(false));
  }
}

TEST_CASE("is_http_url", "[validation][guards]") {
  SECTION("accepts http and https URLs") {
    CHECK(is_http_url("http://example.com"));
    CHECK(is_http_url("https://example.com/path"));
    CHECK(is_http_url("https://aka.ms/albums-daprlogo"));
    CHECK(is_http_url("HTTPS://EXAMPLE.COM/Cover.png"));
  }

  SECTION("rejects other schemes") {
    CHECK_FALSE(is_http_url("ftp://example.com"));
    CHECK_FALSE(is_http_url("file:///path/to/file"));
    CHECK_FALSE(is_http_url("mailto:someone@example.com"));
    CHECK_FALSE(is_http_url("javascript:alert(1)"));
  }

  SECTION("rejects text that does not parse") {
    CHECK_FALSE(is_http_url("not-a-url"));
    CHECK_FALSE(is_http_url("http://"));
    CHECK_FALSE(is_http_url("https://exa mple.com"));
    CHECK_FALSE(is_http_url("http://example.com:99999"));
  }

  SECTION("rejects empty and non-string input") {
    CHECK_FALSE(is_http_url(""));
    CHECK_FALSE(is_http_url("  "));
    CHECK_FALSE(is_http_url(nullptr));
    CHECK_FALSE(is_http_url(123));
  }
}
