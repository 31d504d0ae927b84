#pragma once

// cmd_validate: classify one value.
// Usage: albumcat_cli validate <date|guid|ipv6|url> <value>
// Exit code 0 when the value is valid, 1 otherwise.
int cmd_validate(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)

// cmd_validate_album: run form validation over an album JSON file.
// Usage: albumcat_cli validate-album <file.json>
// Prints {"valid": bool, "errors": {field: message}}; exit code 0 iff valid.
int cmd_validate_album(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
