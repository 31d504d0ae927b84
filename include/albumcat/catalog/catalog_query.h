#pragma once

#include "albumcat/core/result.h"
#include "albumcat/domain/album.h"
#include "albumcat/storage/album_repository.h"

#include <optional>
#include <string>
#include <vector>

namespace albumcat::catalog {

// CatalogQuery mirrors the "?sort=<key>&dir=<asc|desc>" query pair of the
// album listing. Both parts are optional and taken as raw user text.
struct CatalogQuery {
  std::optional<std::string> sort;  // NOLINT(readability-identifier-naming)
  std::optional<std::string> dir;   // NOLINT(readability-identifier-naming)
};

// list_albums returns the repository contents, ordered per the query.
// - sort absent or blank: repository order (by id)
// - sort = title|name|artist|genre|id: ordered by that key; dir "desc" reverses
// - any other sort value: repository order
[[nodiscard]] std::vector<domain::Album> list_albums(const storage::IAlbumRepository& repo,
                                                     const CatalogQuery& query);

// get_album looks up one album; kNotFound when the id is not in the catalog.
[[nodiscard]] core::Result<domain::Album, core::StorageError> get_album(
    const storage::IAlbumRepository& repo, const domain::AlbumId& id);

}  // namespace albumcat::catalog
