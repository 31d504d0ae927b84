#include "albumcat/domain/album.h"

#include "albumcat/core/normalization.h"
#include "albumcat/validation/http_url.h"
#include "albumcat/validation/record_guard.h"

#include <cmath>

namespace albumcat::domain {

core::Result<bool, std::string> Album::validate() const {
  if (core::trim_view(title).empty()) {
    return core::Result<bool, std::string>::err("title must not be empty");
  }

  if (core::trim_view(artist).empty()) {
    return core::Result<bool, std::string>::err("artist must not be empty");
  }

  if (!std::isfinite(price) || price < 0.0) {
    return core::Result<bool, std::string>::err("price must be a finite number >= 0");
  }

  if (!validation::parse_http_url(image_url).has_value()) {
    return core::Result<bool, std::string>::err("image_url must be an http/https URL");
  }

  return core::Result<bool, std::string>::ok(true);
}

nlohmann::json album_to_json(const Album& album) {
  nlohmann::json j;
  j[album_fields::kId] = album.id.value;
  j[album_fields::kTitle] = album.title;
  j[album_fields::kArtist] = album.artist;
  j[album_fields::kPrice] = album.price;
  j[album_fields::kImageUrl] = album.image_url;
  if (album.genre.has_value()) {
    j[album_fields::kGenre] = album.genre.value();
  }
  return j;
}

core::Result<Album, std::string> album_from_json(const nlohmann::json& j) {
  if (!validation::is_well_formed_album(j)) {
    const auto form = validation::validate_form_input(j);
    std::string message = "not a well-formed album";
    if (!j.is_object()) {
      message += ": expected an object";
    } else if (!j.contains(album_fields::kId) ||
               !validation::is_album_id(j[album_fields::kId])) {
      message += ": id must be a signed 64-bit integer";
    } else if (!form.errors.empty()) {
      message += ": " + form.errors.begin()->second;
    }
    return core::Result<Album, std::string>::err(message);
  }

  Album album;
  album.id = AlbumId{j[album_fields::kId].get<std::int64_t>()};
  album.title = j[album_fields::kTitle].get<std::string>();
  album.artist = j[album_fields::kArtist].get<std::string>();
  album.price = j[album_fields::kPrice].get<double>();
  album.image_url = j[album_fields::kImageUrl].get<std::string>();

  if (j.contains(album_fields::kGenre) && !j[album_fields::kGenre].is_null()) {
    if (!j[album_fields::kGenre].is_string()) {
      return core::Result<Album, std::string>::err("genre must be a string when present");
    }
    album.genre = j[album_fields::kGenre].get<std::string>();
  }

  return core::Result<Album, std::string>::ok(album);
}

}  // namespace albumcat::domain
