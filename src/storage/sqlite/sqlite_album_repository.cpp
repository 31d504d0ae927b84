#include "albumcat/storage/sqlite/sqlite_album_repository.h"

#include <sqlite3.h>

#include <string>
#include <utility>

namespace albumcat::storage::sqlite {

namespace {

std::string column_text(sqlite3_stmt* stmt, const int column) {
  const unsigned char* text = sqlite3_column_text(stmt, column);
  return text != nullptr ? reinterpret_cast<const char*>(text) : std::string{};
}

// read_album maps the current row of "SELECT album_id, title, artist, price, image_url, genre".
domain::Album read_album(sqlite3_stmt* stmt) {
  domain::Album album;
  album.id = domain::AlbumId{sqlite3_column_int64(stmt, 0)};
  album.title = column_text(stmt, 1);
  album.artist = column_text(stmt, 2);
  album.price = sqlite3_column_double(stmt, 3);
  album.image_url = column_text(stmt, 4);
  if (sqlite3_column_type(stmt, 5) != SQLITE_NULL) {
    album.genre = column_text(stmt, 5);
  }
  return album;
}

}  // namespace

SqliteAlbumRepository::SqliteAlbumRepository(std::shared_ptr<CatalogDb> db)
    : db_(std::move(db)) {}

core::Result<bool, std::string> SqliteAlbumRepository::upsert(const domain::Album& album) {
  const char* sql = R"(
    INSERT INTO albums (album_id, title, artist, price, image_url, genre)
    VALUES (?, ?, ?, ?, ?, ?)
    ON CONFLICT(album_id) DO UPDATE SET
      title = excluded.title,
      artist = excluded.artist,
      price = excluded.price,
      image_url = excluded.image_url,
      genre = excluded.genre
  )";

  Statement stmt(*db_, sql);
  if (!stmt.ok()) {
    return core::Result<bool, std::string>::err("Failed to prepare album upsert: " +
                                                stmt.error());
  }

  sqlite3_bind_int64(stmt.handle(), 1, album.id.value);
  sqlite3_bind_text(stmt.handle(), 2, album.title.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt.handle(), 3, album.artist.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_double(stmt.handle(), 4, album.price);
  sqlite3_bind_text(stmt.handle(), 5, album.image_url.c_str(), -1, SQLITE_TRANSIENT);
  if (album.genre.has_value()) {
    sqlite3_bind_text(stmt.handle(), 6, album.genre->c_str(), -1, SQLITE_TRANSIENT);
  } else {
    sqlite3_bind_null(stmt.handle(), 6);
  }

  if (sqlite3_step(stmt.handle()) != SQLITE_DONE) {
    return core::Result<bool, std::string>::err(
        "Failed to upsert album " + std::to_string(album.id.value) + ": " +
        db_->last_error());
  }

  return core::Result<bool, std::string>::ok(true);
}

std::optional<domain::Album> SqliteAlbumRepository::get(const domain::AlbumId& id) const {
  const char* sql =
      "SELECT album_id, title, artist, price, image_url, genre FROM albums WHERE album_id = ?";

  Statement stmt(*db_, sql);
  if (!stmt.ok()) {
    return std::nullopt;
  }

  sqlite3_bind_int64(stmt.handle(), 1, id.value);

  if (sqlite3_step(stmt.handle()) == SQLITE_ROW) {
    return read_album(stmt.handle());
  }

  return std::nullopt;
}

std::vector<domain::Album> SqliteAlbumRepository::list_all() const {
  const char* sql =
      "SELECT album_id, title, artist, price, image_url, genre FROM albums ORDER BY album_id";

  Statement stmt(*db_, sql);
  if (!stmt.ok()) {
    return {};
  }

  std::vector<domain::Album> result;
  while (sqlite3_step(stmt.handle()) == SQLITE_ROW) {
    result.push_back(read_album(stmt.handle()));
  }

  return result;
}

}  // namespace albumcat::storage::sqlite
