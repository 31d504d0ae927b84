#include "catalog.h"

#include "albumcat/catalog/album_sort.h"
#include "albumcat/catalog/catalog_query.h"
#include "albumcat/storage/sqlite/sqlite_album_repository.h"
#include "albumcat/storage/sqlite/catalog_db.h"

#include "catalog_logic.h"
#include "shared/arg_parser.h"
#include "shared/json_file.h"
#include <charconv>
#include <cstdint>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace {

struct CatalogCliConfig {
  std::string db_path{"data/albumcat.db"};
  albumcat::catalog::CatalogQuery query;
};

bool handle_db(CatalogCliConfig& config, const std::string& value) {
  if (value.empty()) {
    std::cerr << "Invalid --db: path must not be empty\n";
    return false;
  }
  config.db_path = value;
  return true;
}

bool handle_sort(CatalogCliConfig& config, const std::string& value) {
  if (!albumcat::catalog::parse_sort_key(value).has_value()) {
    std::cerr << "Invalid --sort: " << value << " (valid: title, name, artist, genre, id)\n";
    return false;
  }
  config.query.sort = value;
  return true;
}

bool handle_dir(CatalogCliConfig& config, const std::string& value) {
  if (value != "asc" && value != "desc") {
    std::cerr << "Invalid --dir: " << value << " (valid: asc, desc)\n";
    return false;
  }
  config.query.dir = value;
  return true;
}

std::vector<albumcat::apps::Option<CatalogCliConfig>> db_options() {
  return {{"--db", true, "Path to SQLite database file", handle_db}};
}

std::vector<albumcat::apps::Option<CatalogCliConfig>> list_options() {
  return {
      {"--db", true, "Path to SQLite database file", handle_db},
      {"--sort", true, "Sort key (title|name|artist|genre|id)", handle_sort},
      {"--dir", true, "Sort direction (asc|desc)", handle_dir},
  };
}

// Open the catalog and ensure its schema, or print the error and return nullptr.
std::shared_ptr<albumcat::storage::sqlite::CatalogDb> open_db(const std::string& path) {
  auto db_result = albumcat::storage::sqlite::CatalogDb::open(path);
  if (!db_result.has_value()) {
    std::cerr << "Failed to open database: " << db_result.error() << "\n";
    return nullptr;
  }
  auto db = db_result.value();
  auto schema_result = db->ensure_schema();
  if (!schema_result.has_value()) {
    std::cerr << "Failed to initialize schema: " << schema_result.error() << "\n";
    return nullptr;
  }
  return db;
}

std::optional<std::int64_t> parse_album_id(const std::string& text) {
  std::int64_t id = 0;
  const char* end = text.data() + text.size();
  const auto [ptr, ec] = std::from_chars(text.data(), end, id);
  if (ec != std::errc{} || ptr != end) {
    return std::nullopt;
  }
  return id;
}

}  // namespace

int cmd_import(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const auto options = db_options();
  const auto parsed = albumcat::apps::parse_options(argc, argv, options);
  if (parsed.errors > 0 || parsed.positionals.size() != 1) {
    albumcat::apps::print_usage(std::cerr, "albumcat_cli import <file.json> [--db <db-path>]",
                                options);
    return 1;
  }

  const auto document = albumcat::apps::load_json_file(parsed.positionals[0]);
  if (!document.has_value()) {
    std::cerr << document.error() << "\n";
    return 1;
  }

  auto db = open_db(parsed.config.db_path);
  if (!db) {
    return 1;
  }

  // One transaction for the whole file. Rejected records do not undo stored
  // ones; a failed write discards the whole import.
  auto begun = db->begin();
  if (!begun.has_value()) {
    std::cerr << "Failed to start import: " << begun.error() << "\n";
    return 1;
  }

  albumcat::storage::sqlite::SqliteAlbumRepository repo(db);
  const ImportOutcome outcome = execute_import(document.value(), repo);

  if (outcome.storage_failed || outcome.malformed) {
    auto rolled_back = db->rollback();
    if (!rolled_back.has_value()) {
      std::cerr << "Failed to roll back import: " << rolled_back.error() << "\n";
    }
    return 1;
  }

  auto committed = db->commit();
  if (!committed.has_value()) {
    std::cerr << "Failed to commit import: " << committed.error() << "\n";
    return 1;
  }
  return import_exit_code(outcome);
}

int cmd_list(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const auto options = list_options();
  const auto parsed = albumcat::apps::parse_options(argc, argv, options);
  if (parsed.errors > 0 || !parsed.positionals.empty()) {
    albumcat::apps::print_usage(std::cerr, "albumcat_cli list [options]", options);
    return 1;
  }

  auto db = open_db(parsed.config.db_path);
  if (!db) {
    return 1;
  }

  albumcat::storage::sqlite::SqliteAlbumRepository repo(db);
  return execute_list(repo, parsed.config.query);
}

int cmd_get(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const auto options = db_options();
  const auto parsed = albumcat::apps::parse_options(argc, argv, options);
  if (parsed.errors > 0 || parsed.positionals.size() != 1) {
    albumcat::apps::print_usage(std::cerr, "albumcat_cli get <id> [--db <db-path>]", options);
    return 1;
  }

  const auto id = parse_album_id(parsed.positionals[0]);
  if (!id.has_value()) {
    std::cerr << "Invalid album id: " << parsed.positionals[0] << "\n";
    return 1;
  }

  auto db = open_db(parsed.config.db_path);
  if (!db) {
    return 1;
  }

  albumcat::storage::sqlite::SqliteAlbumRepository repo(db);
  return execute_get(repo, id.value());
}
