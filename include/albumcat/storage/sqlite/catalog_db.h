#pragma once

#include "albumcat/core/result.h"

#include <memory>
#include <string>

struct sqlite3;
struct sqlite3_stmt;

namespace albumcat::storage::sqlite {

class Statement;

// CatalogDb is one open SQLite connection holding an album catalog.
// Pass ":memory:" for a throwaway catalog. Not for use from several threads.
class CatalogDb {
 public:
  [[nodiscard]] static core::Result<std::shared_ptr<CatalogDb>, std::string> open(
      const std::string& path);

  CatalogDb(const CatalogDb&) = delete;
  CatalogDb& operator=(const CatalogDb&) = delete;

  // Highest applied schema version; 0 for a fresh file.
  [[nodiscard]] int schema_version() const;

  // Creates the albums table and records version 1. No-op once applied.
  [[nodiscard]] core::Result<bool, std::string> ensure_schema();

  // Explicit transaction control for multi-record writes.
  [[nodiscard]] core::Result<bool, std::string> begin();
  [[nodiscard]] core::Result<bool, std::string> commit();
  [[nodiscard]] core::Result<bool, std::string> rollback();

  // Message for the most recent failed call on this connection.
  [[nodiscard]] std::string last_error() const;

 private:
  friend class Statement;

  struct Closer {
    void operator()(sqlite3* handle) const;
  };

  explicit CatalogDb(sqlite3* handle);

  core::Result<bool, std::string> run(const char* sql);

  std::unique_ptr<sqlite3, Closer> handle_;
};

// Statement owns one prepared statement; ok() is false when SQL did not compile.
class Statement {
 public:
  Statement(const CatalogDb& db, const char* sql);

  Statement(const Statement&) = delete;
  Statement& operator=(const Statement&) = delete;

  [[nodiscard]] bool ok() const { return stmt_ != nullptr; }
  [[nodiscard]] const std::string& error() const { return error_; }
  [[nodiscard]] sqlite3_stmt* handle() const { return stmt_.get(); }

 private:
  struct Finalizer {
    void operator()(sqlite3_stmt* stmt) const;
  };

  std::unique_ptr<sqlite3_stmt, Finalizer> stmt_;
  std::string error_;
};

}  // namespace albumcat::storage::sqlite
