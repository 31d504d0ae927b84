#include "albumcat/catalog/catalog_query.h"

#include "albumcat/catalog/album_sort.h"
#include "albumcat/core/normalization.h"

namespace albumcat::catalog {

std::vector<domain::Album> list_albums(const storage::IAlbumRepository& repo,
                                       const CatalogQuery& query) {
  auto albums = repo.list_all();

  if (!query.sort.has_value() || core::trim_view(query.sort.value()).empty()) {
    return albums;
  }

  const SortDirection direction = parse_sort_direction(query.dir.value_or("asc"));
  return sort_albums(albums, std::string_view{query.sort.value()}, direction);
}

core::Result<domain::Album, core::StorageError> get_album(const storage::IAlbumRepository& repo,
                                                          const domain::AlbumId& id) {
  auto album = repo.get(id);
  if (!album.has_value()) {
    return core::Result<domain::Album, core::StorageError>::err(core::StorageError::kNotFound);
  }
  return core::Result<domain::Album, core::StorageError>::ok(album.value());
}

}  // namespace albumcat::catalog
