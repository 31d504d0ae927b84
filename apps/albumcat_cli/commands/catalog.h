#pragma once

// cmd_import: load albums from a JSON file into the catalog database.
// Usage: albumcat_cli import <file.json> [--db <db-path>]
int cmd_import(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)

// cmd_list: print the catalog.
// Usage: albumcat_cli list [--db <db-path>] [--sort title|name|artist|genre|id] [--dir asc|desc]
int cmd_list(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)

// cmd_get: print one album by id.
// Usage: albumcat_cli get <id> [--db <db-path>]
int cmd_get(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
