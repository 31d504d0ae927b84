#pragma once

#include "albumcat/storage/album_repository.h"

#include <map>

namespace albumcat::storage {

// InMemoryAlbumRepository stores albums in a std::map keyed by AlbumId.
// std::map guarantees deterministic iteration order (sorted by id).
class InMemoryAlbumRepository final : public IAlbumRepository {
 public:
  [[nodiscard]] core::Result<bool, std::string> upsert(const domain::Album& album) override;
  [[nodiscard]] std::optional<domain::Album> get(const domain::AlbumId& id) const override;
  [[nodiscard]] std::vector<domain::Album> list_all() const override;

 private:
  std::map<domain::AlbumId, domain::Album> albums_;
};

}  // namespace albumcat::storage
