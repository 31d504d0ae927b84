#include "albumcat/catalog/album_sort.h"

#include <catch2/catch.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

using namespace albumcat;
using catalog::SortDirection;
using catalog::SortKey;

namespace {

domain::Album make_album(std::int64_t id, std::string title, std::string artist,
                         std::optional<std::string> genre = std::nullopt) {
  return domain::Album{domain::AlbumId{id},
                       std::move(title),
                       std::move(artist),
                       9.99,
                       "https://example.com/cover-" + std::to_string(id) + ".png",
                       std::move(genre)};
}

std::vector<std::int64_t> ids_of(const std::vector<domain::Album>& albums) {
  std::vector<std::int64_t> ids;
  ids.reserve(albums.size());
  for (const auto& album : albums) {
    ids.push_back(album.id.value);
  }
  return ids;
}

std::vector<domain::Album> sample_albums() {
  return {
      make_album(1, "Zebra Album", "Charlie", std::string{"Rock"}),
      make_album(2, "Apple Album", "alpha", std::nullopt),
      make_album(3, "Banana Album", "Bravo", std::string{"Jazz"}),
  };
}

}  // namespace

TEST_CASE("sort_albums orders by title ascending and descending", "[catalog][sort]") {
  const auto albums = sample_albums();

  const auto ascending = catalog::sort_albums(albums, SortKey::kTitle);
  CHECK(ids_of(ascending) == std::vector<std::int64_t>{2, 3, 1});

  const auto descending = catalog::sort_albums(albums, SortKey::kTitle, SortDirection::kDescending);
  CHECK(ids_of(descending) == std::vector<std::int64_t>{1, 3, 2});
}

TEST_CASE("sort_albums does not modify its input", "[catalog][sort]") {
  const auto albums = sample_albums();
  const std::vector<domain::Album> before = albums;

  for (const auto key : {SortKey::kTitle, SortKey::kArtist, SortKey::kGenre, SortKey::kId}) {
    for (const auto direction : {SortDirection::kAscending, SortDirection::kDescending}) {
      const auto sorted = catalog::sort_albums(albums, key, direction);
      CHECK(sorted.size() == albums.size());
      CHECK(albums == before);
    }
  }

  // Every field of every record, not only the order of ids.
  REQUIRE(albums.size() == 3);
  CHECK(albums[0].title == "Zebra Album");
  CHECK(albums[0].genre == std::optional<std::string>{"Rock"});
  CHECK(albums[1].title == "Apple Album");
  CHECK_FALSE(albums[1].genre.has_value());
  CHECK(albums[2].artist == "Bravo");
}

TEST_CASE("sort_albums returns the same records, reordered", "[catalog][sort]") {
  const auto albums = sample_albums();
  const auto sorted = catalog::sort_albums_by_genre(albums, SortDirection::kDescending);

  REQUIRE(sorted.size() == 3);
  CHECK(sorted[0] == albums[0]);
  CHECK(sorted[1] == albums[2]);
  CHECK(sorted[2] == albums[1]);
}

TEST_CASE("sort_albums places accented titles among their base letters", "[catalog][sort]") {
  const std::vector<domain::Album> albums = {
      make_album(1, "Zebra", "a"),
      make_album(2, "\xC3\x89mile", "a"),
      make_album(3, "Apple", "a"),
      make_album(4, "Emile", "a"),
  };

  CHECK(ids_of(catalog::sort_albums_by_title(albums)) == std::vector<std::int64_t>{3, 4, 2, 1});
  CHECK(ids_of(catalog::sort_albums_by_title(albums, SortDirection::kDescending)) ==
        std::vector<std::int64_t>{1, 2, 4, 3});
}

TEST_CASE("sort_albums compares artist without regard to case", "[catalog][sort]") {
  const auto sorted = catalog::sort_albums_by_artist(sample_albums());
  CHECK(ids_of(sorted) == std::vector<std::int64_t>{2, 3, 1});
}

TEST_CASE("sort_albums puts a missing genre first when ascending", "[catalog][sort]") {
  const auto albums = sample_albums();

  CHECK(ids_of(catalog::sort_albums_by_genre(albums)) == std::vector<std::int64_t>{2, 3, 1});
  CHECK(ids_of(catalog::sort_albums_by_genre(albums, SortDirection::kDescending)) ==
        std::vector<std::int64_t>{1, 3, 2});
}

TEST_CASE("sort_albums keeps ties in input order in both directions", "[catalog][sort]") {
  const std::vector<domain::Album> albums = {
      make_album(10, "Same", "B"),
      make_album(11, "same", "A"),
      make_album(12, "Other", "C"),
      make_album(13, "SAME", "D"),
  };

  CHECK(ids_of(catalog::sort_albums_by_title(albums)) == std::vector<std::int64_t>{12, 10, 11, 13});
  CHECK(ids_of(catalog::sort_albums_by_title(albums, SortDirection::kDescending)) ==
        std::vector<std::int64_t>{10, 11, 13, 12});
}

TEST_CASE("sort_albums by id compares numerically", "[catalog][sort]") {
  const std::vector<domain::Album> albums = {
      make_album(100, "a", "a"),
      make_album(9, "b", "b"),
      make_album(20, "c", "c"),
  };

  CHECK(ids_of(catalog::sort_albums(albums, SortKey::kId)) ==
        std::vector<std::int64_t>{9, 20, 100});
  CHECK(ids_of(catalog::sort_albums(albums, SortKey::kId, SortDirection::kDescending)) ==
        std::vector<std::int64_t>{100, 20, 9});
}

TEST_CASE("sort_albums accepts query-string keys", "[catalog][sort]") {
  const auto albums = sample_albums();

  SECTION("name is an alias for title") {
    CHECK(ids_of(catalog::sort_albums(albums, std::string_view{"name"})) ==
          std::vector<std::int64_t>{2, 3, 1});
  }

  SECTION("keys are case-insensitive") {
    CHECK(ids_of(catalog::sort_albums(albums, std::string_view{" Artist "},
                                      SortDirection::kDescending)) ==
          std::vector<std::int64_t>{1, 3, 2});
  }

  SECTION("an unknown key keeps the input order") {
    CHECK(ids_of(catalog::sort_albums(albums, std::string_view{"price"})) ==
          std::vector<std::int64_t>{1, 2, 3});
    CHECK(ids_of(catalog::sort_albums(albums, std::string_view{"price"},
                                      SortDirection::kDescending)) ==
          std::vector<std::int64_t>{1, 2, 3});
  }
}

TEST_CASE("sort_albums handles empty and single-element input", "[catalog][sort]") {
  CHECK(catalog::sort_albums({}, SortKey::kTitle).empty());

  const std::vector<domain::Album> one = {make_album(5, "Solo", "Solo")};
  CHECK(ids_of(catalog::sort_albums(one, SortKey::kGenre, SortDirection::kDescending)) ==
        std::vector<std::int64_t>{5});
}

TEST_CASE("parse_sort_key recognizes known keys only", "[catalog][sort]") {
  CHECK(catalog::parse_sort_key("title") == SortKey::kTitle);
  CHECK(catalog::parse_sort_key("NAME") == SortKey::kTitle);
  CHECK(catalog::parse_sort_key("artist") == SortKey::kArtist);
  CHECK(catalog::parse_sort_key("genre") == SortKey::kGenre);
  CHECK(catalog::parse_sort_key("id") == SortKey::kId);
  CHECK_FALSE(catalog::parse_sort_key("price").has_value());
  CHECK_FALSE(catalog::parse_sort_key("").has_value());
}

TEST_CASE("parse_sort_direction defaults to ascending", "[catalog][sort]") {
  CHECK(catalog::parse_sort_direction("desc") == SortDirection::kDescending);
  CHECK(catalog::parse_sort_direction("DESC") == SortDirection::kDescending);
  CHECK(catalog::parse_sort_direction("asc") == SortDirection::kAscending);
  CHECK(catalog::parse_sort_direction("") == SortDirection::kAscending);
  CHECK(catalog::parse_sort_direction("descending") == SortDirection::kAscending);
}
