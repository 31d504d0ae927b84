#pragma once

#include "albumcat/storage/album_repository.h"
#include "albumcat/storage/sqlite/catalog_db.h"

#include <memory>

namespace albumcat::storage::sqlite {

// SqliteAlbumRepository implements IAlbumRepository with SQLite backend.
// Requires CatalogDb::ensure_schema(). A missing genre is stored as NULL.
class SqliteAlbumRepository final : public IAlbumRepository {
 public:
  explicit SqliteAlbumRepository(std::shared_ptr<CatalogDb> db);

  [[nodiscard]] core::Result<bool, std::string> upsert(const domain::Album& album) override;
  [[nodiscard]] std::optional<domain::Album> get(const domain::AlbumId& id) const override;
  [[nodiscard]] std::vector<domain::Album> list_all() const override;

 private:
  std::shared_ptr<CatalogDb> db_;
};

}  // namespace albumcat::storage::sqlite
