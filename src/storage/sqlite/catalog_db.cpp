#include "albumcat/storage/sqlite/catalog_db.h"

#include <sqlite3.h>

namespace albumcat::storage::sqlite {

namespace {

constexpr int kCurrentSchemaVersion = 1;

constexpr const char* kCatalogSchema = R"(
CREATE TABLE IF NOT EXISTS schema_version (
  version INTEGER PRIMARY KEY,
  applied_at TEXT NOT NULL
);

CREATE TABLE IF NOT EXISTS albums (
  album_id INTEGER PRIMARY KEY,
  title TEXT NOT NULL,
  artist TEXT NOT NULL,
  price REAL NOT NULL CHECK(price >= 0),
  image_url TEXT NOT NULL,
  genre TEXT
);

INSERT OR IGNORE INTO schema_version (version, applied_at)
VALUES (1, datetime('now'));
)";

}  // namespace

void CatalogDb::Closer::operator()(sqlite3* handle) const {
  sqlite3_close(handle);
}

void Statement::Finalizer::operator()(sqlite3_stmt* stmt) const {
  sqlite3_finalize(stmt);
}

CatalogDb::CatalogDb(sqlite3* handle) : handle_(handle) {}

core::Result<std::shared_ptr<CatalogDb>, std::string> CatalogDb::open(const std::string& path) {
  sqlite3* handle = nullptr;
  if (sqlite3_open(path.c_str(), &handle) != SQLITE_OK) {
    const std::string reason = handle != nullptr ? sqlite3_errmsg(handle) : "out of memory";
    sqlite3_close(handle);
    return core::Result<std::shared_ptr<CatalogDb>, std::string>::err(
        "Cannot open catalog " + path + ": " + reason);
  }

  return core::Result<std::shared_ptr<CatalogDb>, std::string>::ok(
      std::shared_ptr<CatalogDb>(new CatalogDb(handle)));
}

int CatalogDb::schema_version() const {
  // A missing schema_version table fails to prepare, which means version 0.
  Statement stmt(*this, "SELECT MAX(version) FROM schema_version");
  if (!stmt.ok() || sqlite3_step(stmt.handle()) != SQLITE_ROW) {
    return 0;
  }
  return sqlite3_column_int(stmt.handle(), 0);
}

core::Result<bool, std::string> CatalogDb::ensure_schema() {
  if (schema_version() >= kCurrentSchemaVersion) {
    return core::Result<bool, std::string>::ok(true);
  }

  auto applied = run(kCatalogSchema);
  if (!applied.has_value()) {
    return core::Result<bool, std::string>::err("Schema setup failed: " + applied.error());
  }
  return applied;
}

core::Result<bool, std::string> CatalogDb::begin() { return run("BEGIN"); }

core::Result<bool, std::string> CatalogDb::commit() { return run("COMMIT"); }

core::Result<bool, std::string> CatalogDb::rollback() { return run("ROLLBACK"); }

std::string CatalogDb::last_error() const { return sqlite3_errmsg(handle_.get()); }

core::Result<bool, std::string> CatalogDb::run(const char* sql) {
  char* message = nullptr;
  if (sqlite3_exec(handle_.get(), sql, nullptr, nullptr, &message) != SQLITE_OK) {
    const std::string reason = message != nullptr ? message : last_error();
    sqlite3_free(message);
    return core::Result<bool, std::string>::err(reason);
  }
  return core::Result<bool, std::string>::ok(true);
}

Statement::Statement(const CatalogDb& db, const char* sql) {
  sqlite3_stmt* raw = nullptr;
  if (sqlite3_prepare_v2(db.handle_.get(), sql, -1, &raw, nullptr) != SQLITE_OK) {
    error_ = db.last_error();
    sqlite3_finalize(raw);
    return;
  }
  stmt_.reset(raw);
}

}  // namespace albumcat::storage::sqlite
