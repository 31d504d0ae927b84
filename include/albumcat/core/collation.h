#pragma once

#include <string_view>

namespace albumcat::core {

// Human-oriented, case-insensitive string ordering used for catalog display.
//
// Byte order puts '_' after 'Z', orders upper case before lower case, and sends
// every accented letter past 'z'. Display ordering instead groups characters by
// class:
//   whitespace < punctuation/symbols < digits < letters < other code points
// Text is read as UTF-8. Letters compare with case folded, and the Latin-1
// Supplement and Latin Extended-A letters compare as their base letters
// ("É" as "e", "Ł" as "l", "ß" as "ss", "Æ" as "ae"). When two strings are equal
// on base letters, the accents break the tie: unaccented first, then by code point.
// A string that is a prefix of another sorts first, so the empty string sorts
// before any non-empty value. Bytes that are not valid UTF-8 sort after every
// code point.
//
// The ordering is locale-independent and deterministic across platforms.

// compare_collated returns <0, 0 or >0 as a sorts before, equal to, or after b.
// Strings that differ only in letter case compare equal.
[[nodiscard]] int compare_collated(std::string_view a, std::string_view b);

// collation_weight maps one ASCII byte to its ordering weight (exposed for tests).
[[nodiscard]] int collation_weight(char ch);

}  // namespace albumcat::core
