#pragma once

#include "albumcat/core/result.h"
#include "albumcat/domain/album.h"

#include <optional>
#include <string>
#include <vector>

namespace albumcat::storage {

// IAlbumRepository isolates catalog persistence for deterministic testing.
// upsert inserts or replaces by id and reports backend failures.
// list_all returns albums ordered by id.
class IAlbumRepository {
 public:
  virtual ~IAlbumRepository() = default;
  [[nodiscard]] virtual core::Result<bool, std::string> upsert(const domain::Album& album) = 0;
  [[nodiscard]] virtual std::optional<domain::Album> get(const domain::AlbumId& id) const = 0;
  [[nodiscard]] virtual std::vector<domain::Album> list_all() const = 0;
};

}  // namespace albumcat::storage
