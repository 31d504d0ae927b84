#include "albumcat/catalog/album_sort.h"

#include "albumcat/core/collation.h"
#include "albumcat/core/normalization.h"

#include <algorithm>
#include <string>

namespace albumcat::catalog {

namespace {

std::string_view text_value(const domain::Album& album, const SortKey key) {
  switch (key) {
    case SortKey::kTitle:
      return album.title;
    case SortKey::kArtist:
      return album.artist;
    case SortKey::kGenre:
      return album.genre.has_value() ? std::string_view{album.genre.value()} : std::string_view{};
    case SortKey::kId:
      break;
  }
  return {};
}

// compare_by returns <0, 0 or >0 in ascending order for the given key.
int compare_by(const domain::Album& a, const domain::Album& b, const SortKey key) {
  if (key == SortKey::kId) {
    if (a.id == b.id) {
      return 0;
    }
    return a.id < b.id ? -1 : 1;
  }
  return core::compare_collated(text_value(a, key), text_value(b, key));
}

std::vector<domain::Album> stable_sorted(const std::vector<domain::Album>& albums,
                                         const std::optional<SortKey> key,
                                         const SortDirection direction) {
  std::vector<domain::Album> sorted = albums;
  if (!key.has_value()) {
    // Unknown key: every album compares as empty, so stable order is input order.
    return sorted;
  }

  const int sign = direction == SortDirection::kDescending ? -1 : 1;
  std::stable_sort(sorted.begin(), sorted.end(),
                   [&](const domain::Album& a, const domain::Album& b) {
                     return sign * compare_by(a, b, key.value()) < 0;
                   });
  return sorted;
}

}  // namespace

std::optional<SortKey> parse_sort_key(const std::string_view text) {
  const std::string key = core::normalize_ascii_lower(core::trim_view(text));
  if (key == "title" || key == "name") {
    return SortKey::kTitle;
  }
  if (key == "artist") {
    return SortKey::kArtist;
  }
  if (key == "genre") {
    return SortKey::kGenre;
  }
  if (key == "id") {
    return SortKey::kId;
  }
  return std::nullopt;
}

SortDirection parse_sort_direction(const std::string_view text) {
  const std::string direction = core::normalize_ascii_lower(core::trim_view(text));
  return direction == "desc" ? SortDirection::kDescending : SortDirection::kAscending;
}

std::vector<domain::Album> sort_albums(const std::vector<domain::Album>& albums, const SortKey key,
                                       const SortDirection direction) {
  return stable_sorted(albums, key, direction);
}

std::vector<domain::Album> sort_albums(const std::vector<domain::Album>& albums,
                                       const std::string_view key, const SortDirection direction) {
  return stable_sorted(albums, parse_sort_key(key), direction);
}

std::vector<domain::Album> sort_albums_by_title(const std::vector<domain::Album>& albums,
                                                const SortDirection direction) {
  return sort_albums(albums, SortKey::kTitle, direction);
}

std::vector<domain::Album> sort_albums_by_artist(const std::vector<domain::Album>& albums,
                                                 const SortDirection direction) {
  return sort_albums(albums, SortKey::kArtist, direction);
}

std::vector<domain::Album> sort_albums_by_genre(const std::vector<domain::Album>& albums,
                                                const SortDirection direction) {
  return sort_albums(albums, SortKey::kGenre, direction);
}

}  // namespace albumcat::catalog
