#pragma once

#include <nlohmann/json.hpp>

#include <cstddef>
#include <string_view>
#include <vector>

namespace albumcat::validation {

// Textual IPv6 address recognition (RFC 4291 section 2.2 text forms).
//
// Accepted forms:
//   2001:0db8:85a3:0000:0000:8a2e:0370:7334   full, eight hextets
//   2001:db8::1, ::1, ::                      zero-compressed
//   ::ffff:192.0.2.128, 1:2:3:4:5:6:1.2.3.4   embedded IPv4 suffix
//
// The recognizer classifies only; it never produces a canonical form.
// Each structural rule is exposed separately so it can be tested on its own.

// CompressionKind reports how many "::" markers an address contains.
enum class CompressionKind {
  kNone,       // no "::"; the address must spell out all eight groups
  kSingle,     // exactly one "::"
  kAmbiguous,  // two or more "::"; expansion would be ambiguous
};

// CompressionSplit holds the text on either side of the single "::".
// When kind == kNone the whole address is in left and right is empty.
struct CompressionSplit {
  CompressionKind kind{CompressionKind::kNone};
  std::string_view left;
  std::string_view right;
};

// kIpv6GroupCount is the number of 16-bit groups in an address.
constexpr std::size_t kIpv6GroupCount = 8;

// kIpv4GroupWeight is the number of hextet slots an embedded IPv4 suffix fills.
constexpr std::size_t kIpv4GroupWeight = 2;

// split_compression locates the "::" marker.
[[nodiscard]] CompressionSplit split_compression(std::string_view address);

// split_groups cuts one side of the address on single colons.
// An empty side yields an empty list, never a list holding one empty string.
[[nodiscard]] std::vector<std::string_view> split_groups(std::string_view side);

// is_hextet: 1 to 4 hexadecimal digits, either case.
[[nodiscard]] bool is_hextet(std::string_view group);

// is_valid_ipv4_text: four dot-separated decimal octets in [0, 255],
// digits only, no leading zeros ("0" itself is fine, "01" is not).
[[nodiscard]] bool is_valid_ipv4_text(std::string_view text);

// group_count_fits applies the counting rule to an already split address.
// hextets excludes the IPv4 suffix, which counts as kIpv4GroupWeight slots.
//   compressed: total <= 7 (the "::" stands in for at least one group)
//   otherwise:  total == 8
[[nodiscard]] bool group_count_fits(std::size_t hextets, bool has_ipv4, bool compressed);

// is_valid_ipv6_address runs the full recognizer over text.
// Leading and trailing whitespace is ignored; blank text is rejected.
[[nodiscard]] bool is_valid_ipv6_address(std::string_view text);

// is_valid_ipv6_text accepts any JSON value; non-strings are rejected.
[[nodiscard]] bool is_valid_ipv6_text(const nlohmann::json& value);

}  // namespace albumcat::validation
