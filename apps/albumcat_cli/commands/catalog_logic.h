#pragma once

#include "albumcat/catalog/catalog_query.h"
#include "albumcat/storage/album_repository.h"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>

// ImportOutcome counts what execute_import did with one document.
// storage_failed means a write failed; importing stopped at that record and
// the caller must discard what was stored.
struct ImportOutcome {
  std::size_t stored{0};       // NOLINT(readability-identifier-naming)
  std::size_t rejected{0};     // NOLINT(readability-identifier-naming)
  bool malformed{false};       // NOLINT(readability-identifier-naming)
  bool storage_failed{false};  // NOLINT(readability-identifier-naming)
};

// import_exit_code: 0 when every record was stored, 1 otherwise.
int import_exit_code(const ImportOutcome& outcome);

// execute_import: validate every album in document and store the well-formed ones.
//   document is either an array of albums or an object with an "albums" array.
//   Prints {"stored", "rejected"} unless the document is malformed or a write fails.
// execute_list: print the catalog as a JSON array, ordered per query.
// execute_get: print one album, or report it missing.
// All three take only interface types; no concrete storage headers in this TU.
ImportOutcome execute_import(const nlohmann::json& document,
                             albumcat::storage::IAlbumRepository& repo);
int execute_list(const albumcat::storage::IAlbumRepository& repo,
                 const albumcat::catalog::CatalogQuery& query);
int execute_get(const albumcat::storage::IAlbumRepository& repo, std::int64_t id);
