#include "albumcat/validation/http_url.h"

#include "albumcat/core/normalization.h"
#include "albumcat/core/utf8.h"
#include "albumcat/validation/ipv6.h"

#include <algorithm>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace albumcat::validation {

namespace {

constexpr int kHttpDefaultPort = 80;
constexpr int kHttpsDefaultPort = 443;
constexpr int kMaxPort = 65535;
constexpr std::size_t kMaxIpv4Parts = 4;
// Any IPv4 part value at or above this is out of range; parsing saturates here.
constexpr std::uint64_t kIpv4NumberCeiling = std::uint64_t{1} << 40;

// C0 controls and space are stripped from both ends.
bool is_c0_or_space(const char ch) {
  return static_cast<unsigned char>(ch) <= 0x20;
}

bool is_forbidden_host_char(const char ch) {
  const auto byte = static_cast<unsigned char>(ch);
  if (byte <= 0x20 || byte == 0x7f) {
    return true;
  }
  switch (ch) {
    case '#':
    case '%':
    case '/':
    case ':':
    case '<':
    case '>':
    case '?':
    case '@':
    case '[':
    case '\\':
    case ']':
    case '^':
    case '|':
      return true;
    default:
      return false;
  }
}

std::string strip_url_whitespace(const std::string_view text) {
  std::size_t start = 0;
  while (start < text.size() && is_c0_or_space(text[start])) {
    ++start;
  }
  std::size_t end = text.size();
  while (end > start && is_c0_or_space(text[end - 1])) {
    --end;
  }

  std::string result;
  result.reserve(end - start);
  for (std::size_t i = start; i < end; ++i) {
    const char ch = text[i];
    if (ch != '\t' && ch != '\n' && ch != '\r') {
      result.push_back(ch);
    }
  }
  return result;
}

// parse_port returns nullopt for non-digits or values above 65535.
std::optional<int> parse_port(const std::string_view text) {
  int port = 0;
  for (const char ch : text) {
    if (!core::is_ascii_digit(ch)) {
      return std::nullopt;
    }
    port = port * 10 + (ch - '0');
    if (port > kMaxPort) {
      return std::nullopt;
    }
  }
  return port;
}

int hex_value(const char ch) {
  if (core::is_ascii_digit(ch)) {
    return ch - '0';
  }
  return (ch >= 'a' && ch <= 'f') ? ch - 'a' + 10 : ch - 'A' + 10;
}

// percent_decode turns "%XY" into the byte 0xXY. A '%' without two hex digits
// after it stays literal.
std::string percent_decode(const std::string_view text) {
  std::string result;
  result.reserve(text.size());
  for (std::size_t i = 0; i < text.size(); ++i) {
    if (text[i] == '%' && i + 2 < text.size() && core::is_hex_digit(text[i + 1]) &&
        core::is_hex_digit(text[i + 2])) {
      result.push_back(static_cast<char>(hex_value(text[i + 1]) * 16 + hex_value(text[i + 2])));
      i += 2;
    } else {
      result.push_back(text[i]);
    }
  }
  return result;
}

// parse_ipv4_number reads one dotted part of a numeric host: "0x" prefix is
// hexadecimal, another leading zero is octal, anything else decimal.
std::optional<std::uint64_t> parse_ipv4_number(std::string_view part) {
  if (part.empty()) {
    return std::nullopt;
  }

  std::uint64_t radix = 10;
  if (part.size() >= 2 && part[0] == '0' && (part[1] == 'x' || part[1] == 'X')) {
    radix = 16;
    part.remove_prefix(2);
  } else if (part.size() >= 2 && part[0] == '0') {
    radix = 8;
    part.remove_prefix(1);
  }

  std::uint64_t value = 0;
  for (const char ch : part) {
    std::uint64_t digit = 0;
    if (core::is_ascii_digit(ch)) {
      digit = static_cast<std::uint64_t>(ch - '0');
    } else if (radix == 16 && core::is_hex_digit(ch)) {
      digit = static_cast<std::uint64_t>(hex_value(ch));
    } else {
      return std::nullopt;
    }
    if (digit >= radix) {
      return std::nullopt;
    }
    value = std::min(value * radix + digit, kIpv4NumberCeiling);
  }
  return value;
}

// ends_in_number: a host whose last label is numeric must be an IPv4 address.
bool ends_in_number(const std::vector<std::string_view>& labels) {
  const std::string_view last = labels.back();
  const auto is_digit = [](const char ch) { return core::is_ascii_digit(ch); };
  if (!last.empty() && std::all_of(last.begin(), last.end(), is_digit)) {
    return true;
  }
  return parse_ipv4_number(last).has_value();
}

// parse_ipv4_host accepts one to four parts; the last part fills the remaining
// bytes, so "127.1" and "0x7f000001" both mean 127.0.0.1. Returns dotted-quad text.
std::optional<std::string> parse_ipv4_host(const std::vector<std::string_view>& labels) {
  if (labels.size() > kMaxIpv4Parts) {
    return std::nullopt;
  }

  std::vector<std::uint64_t> numbers;
  numbers.reserve(labels.size());
  for (const auto label : labels) {
    const auto number = parse_ipv4_number(label);
    if (!number.has_value()) {
      return std::nullopt;
    }
    numbers.push_back(number.value());
  }

  std::uint64_t address = 0;
  for (std::size_t i = 0; i + 1 < numbers.size(); ++i) {
    if (numbers[i] > 255) {
      return std::nullopt;
    }
    address |= numbers[i] << (8 * (3 - i));
  }
  const std::size_t last_bytes = kMaxIpv4Parts + 1 - numbers.size();
  if (numbers.back() >= (std::uint64_t{1} << (8 * last_bytes))) {
    return std::nullopt;
  }
  address |= numbers.back();

  return std::to_string((address >> 24) & 0xFF) + "." + std::to_string((address >> 16) & 0xFF) +
         "." + std::to_string((address >> 8) & 0xFF) + "." + std::to_string(address & 0xFF);
}

// parse_domain_host percent-decodes and lower-cases a non-bracketed host, then
// rejects forbidden characters and numeric hosts that are not valid IPv4.
std::optional<std::string> parse_domain_host(const std::string_view raw_host) {
  const std::string decoded = percent_decode(raw_host);
  if (decoded.empty() || !core::is_valid_utf8(decoded)) {
    return std::nullopt;
  }

  std::string domain = core::normalize_ascii_lower(decoded);
  for (const char ch : domain) {
    if (is_forbidden_host_char(ch)) {
      return std::nullopt;
    }
  }

  auto labels = core::split_on(domain, '.');
  if (labels.size() > 1 && labels.back().empty()) {
    labels.pop_back();
  }
  if (ends_in_number(labels)) {
    return parse_ipv4_host(labels);
  }
  return domain;
}

}  // namespace

std::optional<HttpUrl> parse_http_url(const std::string_view text) {
  const std::string input = strip_url_whitespace(text);
  if (input.empty()) {
    return std::nullopt;
  }

  const std::string_view view{input};

  // Scheme: ALPHA *( ALPHA / DIGIT / "+" / "-" / "." ) ":"
  const auto colon_pos = view.find(':');
  if (colon_pos == std::string_view::npos || colon_pos == 0 || !core::is_ascii_alpha(view[0])) {
    return std::nullopt;
  }
  for (std::size_t i = 1; i < colon_pos; ++i) {
    const char ch = view[i];
    if (!core::is_ascii_alpha(ch) && !core::is_ascii_digit(ch) && ch != '+' && ch != '-' &&
        ch != '.') {
      return std::nullopt;
    }
  }

  HttpUrl url;
  url.scheme = core::normalize_ascii_lower(view.substr(0, colon_pos));
  if (url.scheme == "http") {
    url.port = kHttpDefaultPort;
  } else if (url.scheme == "https") {
    url.port = kHttpsDefaultPort;
  } else {
    return std::nullopt;
  }

  std::string_view rest = view.substr(colon_pos + 1);
  while (!rest.empty() && (rest.front() == '/' || rest.front() == '\\')) {
    rest.remove_prefix(1);
  }

  // Authority ends at the first path, query or fragment delimiter.
  const auto authority_end = rest.find_first_of("/\\?#");
  std::string_view authority = rest.substr(0, authority_end);
  if (authority_end != std::string_view::npos) {
    const std::string_view tail = rest.substr(authority_end);
    url.path_and_query = tail.front() == '/' || tail.front() == '\\' ? std::string{tail}
                                                                       : "/" + std::string{tail};
  } else {
    url.path_and_query = "/";
  }

  const auto at_pos = authority.rfind('@');
  if (at_pos != std::string_view::npos) {
    authority = authority.substr(at_pos + 1);
  }
  if (authority.empty()) {
    return std::nullopt;
  }

  std::string_view host;
  std::string_view port_view;
  bool has_port = false;

  if (authority.front() == '[') {
    const auto close_pos = authority.find(']');
    if (close_pos == std::string_view::npos) {
      return std::nullopt;
    }
    if (!is_valid_ipv6_address(authority.substr(1, close_pos - 1))) {
      return std::nullopt;
    }
    host = authority.substr(0, close_pos + 1);
    const std::string_view after = authority.substr(close_pos + 1);
    if (!after.empty()) {
      if (after.front() != ':') {
        return std::nullopt;
      }
      port_view = after.substr(1);
      has_port = true;
    }
  } else {
    const auto port_pos = authority.rfind(':');
    if (port_pos != std::string_view::npos) {
      host = authority.substr(0, port_pos);
      port_view = authority.substr(port_pos + 1);
      has_port = true;
    } else {
      host = authority;
    }
    if (host.empty()) {
      return std::nullopt;
    }
  }

  // "http://host:" keeps the default port.
  if (has_port && !port_view.empty()) {
    const auto port = parse_port(port_view);
    if (!port.has_value()) {
      return std::nullopt;
    }
    url.port = port.value();
  }

  if (host.front() == '[') {
    url.host = core::normalize_ascii_lower(host);
  } else {
    auto domain = parse_domain_host(host);
    if (!domain.has_value()) {
      return std::nullopt;
    }
    url.host = std::move(domain.value());
  }
  return url;
}

}  // namespace albumcat::validation
