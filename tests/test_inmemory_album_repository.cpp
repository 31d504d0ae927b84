#include "albumcat/storage/inmemory_album_repository.h"

#include <catch2/catch.hpp>

#include <cstdint>
#include <optional>
#include <string>

using namespace albumcat;

TEST_CASE("InMemoryAlbumRepository::upsert stores album", "[storage][repository]") {
  storage::InMemoryAlbumRepository repo;
  domain::Album album{domain::AlbumId{1}, "Sweet Sweet Dapr", "Daprize", 10.99,
                      "https://example.com/1.png", std::string{"Soul"}};

  REQUIRE(repo.upsert(album).has_value());

  auto retrieved = repo.get(domain::AlbumId{1});
  REQUIRE(retrieved.has_value());
  CHECK(retrieved->title == "Sweet Sweet Dapr");
  CHECK(retrieved->artist == "Daprize");
  CHECK(retrieved->price == 10.99);
  CHECK(retrieved->genre == std::optional<std::string>{"Soul"});
}

TEST_CASE("InMemoryAlbumRepository::upsert replaces existing album", "[storage][repository]") {
  storage::InMemoryAlbumRepository repo;
  domain::Album first{domain::AlbumId{1}, "Title1", "Artist1", 1.0, "http://a.example/1.png",
                      std::string{"Rock"}};
  domain::Album second{domain::AlbumId{1}, "Title2", "Artist2", 2.0, "http://a.example/2.png",
                       std::nullopt};

  REQUIRE(repo.upsert(first).has_value());
  REQUIRE(repo.upsert(second).has_value());

  auto retrieved = repo.get(domain::AlbumId{1});
  REQUIRE(retrieved.has_value());
  CHECK(retrieved->title == "Title2");
  CHECK_FALSE(retrieved->genre.has_value());
  CHECK(repo.list_all().size() == 1);
}

TEST_CASE("InMemoryAlbumRepository::get returns nullopt for missing album",
          "[storage][repository]") {
  storage::InMemoryAlbumRepository repo;
  CHECK_FALSE(repo.get(domain::AlbumId{42}).has_value());
}

TEST_CASE("InMemoryAlbumRepository::list_all is ordered by id", "[storage][repository]") {
  storage::InMemoryAlbumRepository repo;
  for (const std::int64_t id : {5, 1, 3}) {
    REQUIRE(repo.upsert(domain::Album{domain::AlbumId{id}, "T", "A", 0.0, "http://x.example/",
                                      std::nullopt})
                .has_value());
  }

  auto all = repo.list_all();
  REQUIRE(all.size() == 3);
  CHECK(all[0].id.value == 1);
  CHECK(all[1].id.value == 3);
  CHECK(all[2].id.value == 5);
}
