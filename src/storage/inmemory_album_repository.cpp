#include "albumcat/storage/inmemory_album_repository.h"

namespace albumcat::storage {

core::Result<bool, std::string> InMemoryAlbumRepository::upsert(const domain::Album& album) {
  albums_[album.id] = album;
  return core::Result<bool, std::string>::ok(true);
}

std::optional<domain::Album> InMemoryAlbumRepository::get(const domain::AlbumId& id) const {
  auto it = albums_.find(id);
  if (it != albums_.end()) {
    return it->second;
  }
  return std::nullopt;
}

std::vector<domain::Album> InMemoryAlbumRepository::list_all() const {
  std::vector<domain::Album> result;
  result.reserve(albums_.size());
  for (const auto& [id, album] : albums_) {
    result.push_back(album);
  }
  return result;
}

}  // namespace albumcat::storage
