#pragma once

#include "albumcat/core/result.h"

#include <nlohmann/json.hpp>

#include <fstream>
#include <string>

namespace albumcat::apps {

// load_json_file reads and parses a whole JSON document.
// Parse errors are returned as messages, never thrown to the caller.
inline core::Result<nlohmann::json, std::string> load_json_file(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    return core::Result<nlohmann::json, std::string>::err("Cannot open file: " + path);
  }

  try {
    return core::Result<nlohmann::json, std::string>::ok(nlohmann::json::parse(in));
  } catch (const nlohmann::json::parse_error& e) {
    return core::Result<nlohmann::json, std::string>::err("Invalid JSON in " + path + ": " +
                                                          e.what());
  }
}

}  // namespace albumcat::apps
