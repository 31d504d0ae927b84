#include "catalog_logic.h"

#include "albumcat/domain/album.h"

#include <iostream>
#include <string>

int import_exit_code(const ImportOutcome& outcome) {
  const bool clean = !outcome.malformed && !outcome.storage_failed && outcome.rejected == 0;
  return clean ? 0 : 1;
}

ImportOutcome execute_import(const nlohmann::json& document,
                             albumcat::storage::IAlbumRepository& repo) {
  ImportOutcome outcome;

  const nlohmann::json* albums = &document;
  if (document.is_object() && document.contains("albums")) {
    albums = &document["albums"];
  }
  if (!albums->is_array()) {
    std::cerr << "Import document must be an array of albums or {\"albums\": [...]}\n";
    outcome.malformed = true;
    return outcome;
  }

  for (std::size_t i = 0; i < albums->size(); ++i) {
    const auto album = albumcat::domain::album_from_json((*albums)[i]);
    if (!album.has_value()) {
      std::cerr << "Rejected album at index " << i << ": " << album.error() << "\n";
      ++outcome.rejected;
      continue;
    }

    const auto upserted = repo.upsert(album.value());
    if (!upserted.has_value()) {
      std::cerr << "Failed to store album at index " << i << ": " << upserted.error() << "\n";
      outcome.storage_failed = true;
      return outcome;
    }
    ++outcome.stored;
  }

  nlohmann::json out;
  out["stored"] = outcome.stored;
  out["rejected"] = outcome.rejected;
  std::cout << out.dump(2) << "\n";

  return outcome;
}

int execute_list(const albumcat::storage::IAlbumRepository& repo,
                 const albumcat::catalog::CatalogQuery& query) {
  nlohmann::json out = nlohmann::json::array();
  for (const auto& album : albumcat::catalog::list_albums(repo, query)) {
    out.push_back(albumcat::domain::album_to_json(album));
  }

  std::cout << out.dump(2) << "\n";
  return 0;
}

int execute_get(const albumcat::storage::IAlbumRepository& repo, const std::int64_t id) {
  const auto album = albumcat::catalog::get_album(repo, albumcat::domain::AlbumId{id});
  if (!album.has_value()) {
    std::cerr << "Album not found: " << id << "\n";
    return 1;
  }

  std::cout << albumcat::domain::album_to_json(album.value()).dump(2) << "\n";
  return 0;
}
