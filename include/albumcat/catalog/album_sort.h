#pragma once

#include "albumcat/domain/album.h"

#include <optional>
#include <string_view>
#include <vector>

namespace albumcat::catalog {

// SortKey selects the album field that drives ordering.
enum class SortKey {
  kTitle,
  kArtist,
  kGenre,
  kId,
};

enum class SortDirection {
  kAscending,
  kDescending,
};

// parse_sort_key maps query text to a key (trimmed, case-insensitive).
// "name" is an alias for "title". Returns nullopt for anything else.
[[nodiscard]] std::optional<SortKey> parse_sort_key(std::string_view text);

// parse_sort_direction: "desc" (trimmed, case-insensitive) is descending,
// every other value, including empty, is ascending.
[[nodiscard]] SortDirection parse_sort_direction(std::string_view text);

// sort_albums returns a new, ordered copy; the input is never modified.
//
// Text keys compare with core::compare_collated (case-insensitive, display
// collation). A missing genre orders as the empty string, ahead of every
// genre when ascending. kId compares numerically.
// Ordering is stable in both directions: the direction flips the comparison
// only, so records that compare equal keep their input order.
[[nodiscard]] std::vector<domain::Album> sort_albums(const std::vector<domain::Album>& albums,
                                                     SortKey key = SortKey::kTitle,
                                                     SortDirection direction = SortDirection::kAscending);

// sort_albums with a query-string key. Unrecognized keys never fail: every
// album then orders as if the field were empty, which leaves the input order.
[[nodiscard]] std::vector<domain::Album> sort_albums(const std::vector<domain::Album>& albums,
                                                     std::string_view key,
                                                     SortDirection direction = SortDirection::kAscending);

[[nodiscard]] std::vector<domain::Album> sort_albums_by_title(
    const std::vector<domain::Album>& albums, SortDirection direction = SortDirection::kAscending);

[[nodiscard]] std::vector<domain::Album> sort_albums_by_artist(
    const std::vector<domain::Album>& albums, SortDirection direction = SortDirection::kAscending);

[[nodiscard]] std::vector<domain::Album> sort_albums_by_genre(
    const std::vector<domain::Album>& albums, SortDirection direction = SortDirection::kAscending);

}  // namespace albumcat::catalog
