#include "albumcat/validation/ipv6.h"

#include "albumcat/core/normalization.h"

#include <string>

namespace albumcat::validation {

namespace {

constexpr std::string_view kCompressionMarker = "::";
constexpr std::size_t kIpv4OctetCount = 4;
constexpr int kMaxOctetValue = 255;
constexpr std::size_t kMaxHextetDigits = 4;

bool all_hextets(const std::vector<std::string_view>& groups) {
  for (const auto group : groups) {
    if (!is_hextet(group)) {
      return false;
    }
  }
  return true;
}

}  // namespace

CompressionSplit split_compression(const std::string_view address) {
  const auto pos = address.find(kCompressionMarker);
  if (pos == std::string_view::npos) {
    return CompressionSplit{CompressionKind::kNone, address, {}};
  }

  const std::string_view left = address.substr(0, pos);
  const std::string_view right = address.substr(pos + kCompressionMarker.size());
  if (right.find(kCompressionMarker) != std::string_view::npos) {
    return CompressionSplit{CompressionKind::kAmbiguous, left, right};
  }

  return CompressionSplit{CompressionKind::kSingle, left, right};
}

std::vector<std::string_view> split_groups(const std::string_view side) {
  return core::split_on(side, ':');
}

bool is_hextet(const std::string_view group) {
  if (group.empty() || group.size() > kMaxHextetDigits) {
    return false;
  }
  for (const char ch : group) {
    if (!core::is_hex_digit(ch)) {
      return false;
    }
  }
  return true;
}

bool is_valid_ipv4_text(const std::string_view text) {
  const auto octets = core::split_on(text, '.');
  if (octets.size() != kIpv4OctetCount) {
    return false;
  }

  for (const auto octet : octets) {
    // At most three digits; anything longer is either > 255 or zero-padded.
    if (octet.empty() || octet.size() > 3) {
      return false;
    }

    int value = 0;
    for (const char ch : octet) {
      if (!core::is_ascii_digit(ch)) {
        return false;
      }
      value = value * 10 + (ch - '0');
    }

    if (value > kMaxOctetValue) {
      return false;
    }
    // Canonical decimal only: the text must read back as the same number.
    if (octet.size() > 1 && octet.front() == '0') {
      return false;
    }
  }

  return true;
}

bool group_count_fits(const std::size_t hextets, const bool has_ipv4, const bool compressed) {
  const std::size_t total = hextets + (has_ipv4 ? kIpv4GroupWeight : 0);
  if (compressed) {
    return total <= kIpv6GroupCount - 1;
  }
  return total == kIpv6GroupCount;
}

bool is_valid_ipv6_address(const std::string_view text) {
  const std::string_view address = core::trim_view(text);
  if (address.empty()) {
    return false;
  }

  const CompressionSplit split = split_compression(address);
  if (split.kind == CompressionKind::kAmbiguous) {
    return false;
  }
  const bool compressed = split.kind == CompressionKind::kSingle;

  std::vector<std::string_view> left = split_groups(split.left);
  std::vector<std::string_view> right = split_groups(split.right);

  // Only the final group of the address may carry a dotted IPv4 suffix:
  // the right side when "::" is present, the single list otherwise.
  std::vector<std::string_view>& tail = compressed ? right : left;
  bool has_ipv4 = false;
  if (!tail.empty() && tail.back().find('.') != std::string_view::npos) {
    if (!is_valid_ipv4_text(tail.back())) {
      return false;
    }
    has_ipv4 = true;
    tail.pop_back();
  }

  // A dotted group anywhere else fails here, since '.' is not a hex digit.
  if (!all_hextets(left) || !all_hextets(right)) {
    return false;
  }

  return group_count_fits(left.size() + right.size(), has_ipv4, compressed);
}

bool is_valid_ipv6_text(const nlohmann::json& value) {
  if (!value.is_string()) {
    return false;
  }
  return is_valid_ipv6_address(value.get_ref<const std::string&>());
}

}  // namespace albumcat::validation
