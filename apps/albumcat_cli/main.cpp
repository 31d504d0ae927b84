#include "albumcat/core/version.h"

#include "commands/catalog.h"
#include "commands/validate.h"
#include <iostream>
#include <string>

namespace {

void print_usage() {
  std::cerr << "albumcat_cli v" << albumcat::core::kBuildVersion << "\n"
            << "Usage:\n"
            << "  albumcat_cli validate <date|guid|ipv6|url> <value>\n"
            << "  albumcat_cli validate-album <file.json>\n"
            << "  albumcat_cli import <file.json> [--db <db-path>]\n"
            << "  albumcat_cli list [--db <db-path>] [--sort <key>] [--dir asc|desc]\n"
            << "  albumcat_cli get <id> [--db <db-path>]\n";
}

}  // namespace

int main(int argc, char* argv[]) {
  if (argc < 2) {
    print_usage();
    return 1;
  }

  const std::string subcommand = argv[1];
  if (subcommand == "validate") {
    return cmd_validate(argc, argv);
  }
  if (subcommand == "validate-album") {
    return cmd_validate_album(argc, argv);
  }
  if (subcommand == "import") {
    return cmd_import(argc, argv);
  }
  if (subcommand == "list") {
    return cmd_list(argc, argv);
  }
  if (subcommand == "get") {
    return cmd_get(argc, argv);
  }

  std::cerr << "Unknown subcommand: " << subcommand << "\n";
  print_usage();
  return 1;
}
