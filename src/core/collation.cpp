#include "albumcat/core/collation.h"

#include "albumcat/core/normalization.h"
#include "albumcat/core/utf8.h"

#include <algorithm>
#include <vector>

namespace albumcat::core {

namespace {

// Class bases leave room for 256 weights per class below the letters.
constexpr int kWhitespaceBase = 0;
constexpr int kSymbolBase = 256;
constexpr int kDigitBase = 512;
constexpr int kLetterBase = 768;
constexpr int kOtherBase = 1024;
// Past U+10FFFF, so malformed bytes follow every decoded code point.
constexpr int kMalformedBase = kOtherBase + 0x110000;

constexpr char32_t kNoBreakSpace = 0xA0;
constexpr char32_t kMultiplicationSign = 0xD7;
constexpr char32_t kDivisionSign = 0xF7;

// Base letters for U+00C0..U+00FF. '*' marks entries handled separately.
constexpr std::string_view kLatin1Letters =
    "aaaaaa*ceeeeiiiidnooooo*ouuuuy**"
    "aaaaaa*ceeeeiiiidnooooo*ouuuuy*y";

// Base letters for U+0100..U+017F. '*' marks the ligatures IJ and OE.
constexpr std::string_view kLatinExtendedALetters =
    "aaaaaa"        // U+0100 A macron, breve, ogonek
    "cccccccc"      // U+0106 C acute, circumflex, dot, caron
    "dddd"          // U+010E D caron, stroke
    "eeeeeeeeee"    // U+0112 E macron, breve, dot, ogonek, caron
    "gggggggg"      // U+011C G circumflex, breve, dot, cedilla
    "hhhh"          // U+0124 H circumflex, stroke
    "iiiiiiiiii"    // U+0128 I tilde, macron, breve, ogonek, dot / dotless
    "**"            // U+0132 IJ
    "jj"            // U+0134 J circumflex
    "kkk"           // U+0136 K cedilla, kra
    "llllllllll"    // U+0139 L acute, cedilla, caron, middle dot, stroke
    "nnnnnnnnn"     // U+0143 N acute, cedilla, caron, apostrophe, eng
    "oooooo"        // U+014C O macron, breve, double acute
    "**"            // U+0152 OE
    "rrrrrr"        // U+0154 R acute, cedilla, caron
    "ssssssss"      // U+015A S acute, circumflex, cedilla, caron
    "tttttt"        // U+0162 T cedilla, caron, stroke
    "uuuuuuuuuuuu"  // U+0168 U tilde, macron, breve, ring, double acute, ogonek
    "ww"            // U+0174 W circumflex
    "yyy"           // U+0176 Y circumflex, Y diaeresis
    "zzzzzz"        // U+0179 Z acute, dot, caron
    "s";            // U+017F long s

static_assert(kLatin1Letters.size() == 0x40);
static_assert(kLatinExtendedALetters.size() == 0x80);

// base_letters returns the lower-case ASCII letters a Latin letter sorts as,
// or an empty view when cp is not a foldable Latin letter.
std::string_view base_letters(const char32_t cp) {
  switch (cp) {
    case 0xC6:
    case 0xE6:
      return "ae";
    case 0xDE:
    case 0xFE:
      return "th";
    case 0xDF:
      return "ss";
    case 0x132:
    case 0x133:
      return "ij";
    case 0x152:
    case 0x153:
      return "oe";
    case kMultiplicationSign:
    case kDivisionSign:
      return {};
    default:
      break;
  }
  if (cp >= 0xC0 && cp <= 0xFF) {
    return kLatin1Letters.substr(cp - 0xC0, 1);
  }
  if (cp >= 0x100 && cp <= 0x17F) {
    return kLatinExtendedALetters.substr(cp - 0x100, 1);
  }
  return {};
}

// accent_mark identifies the accented form of a folded letter independent of case.
// Upper and lower case pairs map to the same value.
char32_t accent_mark(const char32_t cp) {
  if (cp >= 0xC0 && cp <= 0xDE) {
    return cp + 0x20;
  }
  if (cp == 0x178) {
    return 0xFF;  // Y diaeresis pairs with U+00FF
  }
  const bool odd_upper = (cp >= 0x139 && cp <= 0x148) || (cp >= 0x179 && cp <= 0x17E);
  if (odd_upper) {
    return (cp % 2 == 1) ? cp + 1 : cp;
  }
  if (cp >= 0x100 && cp <= 0x177 && cp != 0x138 && cp != 0x149) {
    return cp | 1u;
  }
  return cp;
}

// CollationKey splits a string into base-letter weights and a tie-breaking accent row.
struct CollationKey {
  std::vector<int> primary;
  std::vector<char32_t> accents;
};

CollationKey make_key(const std::string_view text) {
  CollationKey key;
  key.primary.reserve(text.size());
  key.accents.reserve(text.size());

  std::size_t pos = 0;
  while (pos < text.size()) {
    const std::size_t start = pos;
    const auto cp = decode_utf8(text, pos);
    if (!cp.has_value()) {
      key.primary.push_back(kMalformedBase + static_cast<unsigned char>(text[start]));
      key.accents.push_back(0);
      continue;
    }

    const char32_t value = cp.value();
    if (value < 0x80) {
      key.primary.push_back(collation_weight(static_cast<char>(value)));
      key.accents.push_back(0);
      continue;
    }

    const std::string_view letters = base_letters(value);
    if (!letters.empty()) {
      for (const char letter : letters) {
        key.primary.push_back(collation_weight(letter));
      }
      key.accents.push_back(accent_mark(value));
      continue;
    }

    if (value == kNoBreakSpace) {
      key.primary.push_back(kWhitespaceBase + static_cast<int>(value));
    } else if (value <= 0xFF) {
      // Latin-1 punctuation, currency and the multiplication/division signs.
      key.primary.push_back(kSymbolBase + static_cast<int>(value));
    } else {
      key.primary.push_back(kOtherBase + static_cast<int>(value));
    }
    key.accents.push_back(0);
  }

  return key;
}

template <typename T>
int compare_sequences(const std::vector<T>& a, const std::vector<T>& b) {
  const auto [it_a, it_b] = std::mismatch(a.begin(), a.end(), b.begin(), b.end());
  if (it_a != a.end() && it_b != b.end()) {
    return *it_a < *it_b ? -1 : 1;
  }
  if (a.size() == b.size()) {
    return 0;
  }
  return a.size() < b.size() ? -1 : 1;
}

}  // namespace

int collation_weight(const char ch) {
  const auto byte = static_cast<unsigned char>(ch);

  if (byte >= 0x80) {
    return kMalformedBase + byte;
  }
  if (is_ascii_space(ch)) {
    return kWhitespaceBase + byte;
  }
  if (is_ascii_digit(ch)) {
    return kDigitBase + byte;
  }
  if (is_ascii_alpha(ch)) {
    // Fold case: 'A' and 'a' share a weight.
    const char lower = (ch >= 'A' && ch <= 'Z') ? static_cast<char>(ch + ('a' - 'A')) : ch;
    return kLetterBase + static_cast<unsigned char>(lower);
  }
  // Remaining printable ASCII and control characters.
  return kSymbolBase + byte;
}

int compare_collated(const std::string_view a, const std::string_view b) {
  const CollationKey key_a = make_key(a);
  const CollationKey key_b = make_key(b);

  const int primary = compare_sequences(key_a.primary, key_b.primary);
  if (primary != 0) {
    return primary;
  }
  return compare_sequences(key_a.accents, key_b.accents);
}

}  // namespace albumcat::core
