#pragma once

#include "albumcat/core/result.h"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>

namespace albumcat::domain {

// AlbumId is the catalog-unique integer identifier of an album.
struct AlbumId {
  std::int64_t value{0};
  auto operator<=>(const AlbumId&) const = default;
};

// Album is one catalog record.
// Schema:
// - id: integer, unique within a catalog
// - title: non-empty text
// - artist: non-empty text
// - price: finite number >= 0
// - image_url: absolute http/https URL
// - genre: optional text
struct Album {
  AlbumId id;
  std::string title;
  std::string artist;
  double price{0.0};
  std::string image_url;
  std::optional<std::string> genre;

  // validate checks schema invariants.
  // Returns ok(true) if valid, err(message) naming the first failing field.
  [[nodiscard]] core::Result<bool, std::string> validate() const;

  bool operator==(const Album&) const = default;
};

// JSON field names, shared by the shape guard and the serializers.
namespace album_fields {
constexpr const char* kId = "id";
constexpr const char* kTitle = "title";
constexpr const char* kArtist = "artist";
constexpr const char* kPrice = "price";
constexpr const char* kImageUrl = "image_url";
constexpr const char* kGenre = "genre";
}  // namespace album_fields

/// Serialize an album; genre is omitted when absent.
[[nodiscard]] nlohmann::json album_to_json(const Album& album);

/// Deserialize an album from untyped JSON.
/// Fails with a message when the value is not a well-formed album record or
/// genre is present but not a string.
[[nodiscard]] core::Result<Album, std::string> album_from_json(const nlohmann::json& j);

}  // namespace albumcat::domain
