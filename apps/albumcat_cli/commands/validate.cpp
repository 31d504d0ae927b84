#include "validate.h"

#include "albumcat/validation/calendar_date.h"
#include "albumcat/validation/identifier.h"
#include "albumcat/validation/ipv6.h"
#include "albumcat/validation/primitive_guards.h"
#include "albumcat/validation/record_guard.h"

#include <nlohmann/json.hpp>

#include "shared/arg_parser.h"
#include "shared/json_file.h"
#include <iostream>
#include <string>
#include <vector>

namespace {

struct ValidateCliConfig {};

int print_classification(const bool valid) {
  std::cout << (valid ? "valid" : "invalid") << "\n";
  return valid ? 0 : 1;
}

}  // namespace

int cmd_validate(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const std::vector<albumcat::apps::Option<ValidateCliConfig>> options;
  const auto parsed = albumcat::apps::parse_options(argc, argv, options);

  if (parsed.errors > 0 || parsed.positionals.size() != 2) {
    albumcat::apps::print_usage(std::cerr, "albumcat_cli validate <date|guid|ipv6|url> <value>",
                                options);
    return 1;
  }

  const std::string& kind = parsed.positionals[0];
  const nlohmann::json value = parsed.positionals[1];

  if (kind == "date") {
    const auto result = albumcat::validation::validate_and_parse_calendar_date(value);
    if (!result.has_value()) {
      std::cout << "invalid: " << result.error().message << " ("
                << albumcat::validation::validation_error_kind_to_string(result.error().kind)
                << ")\n";
      return 1;
    }
    std::cout << "valid: " << albumcat::validation::to_iso8601(result.value()) << "\n";
    return 0;
  }
  if (kind == "guid") {
    return print_classification(albumcat::validation::is_valid_identifier_text(value));
  }
  if (kind == "ipv6") {
    return print_classification(albumcat::validation::is_valid_ipv6_text(value));
  }
  if (kind == "url") {
    return print_classification(albumcat::validation::is_http_url(value));
  }

  std::cerr << "Unknown value kind: " << kind << " (valid: date, guid, ipv6, url)\n";
  return 1;
}

int cmd_validate_album(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const std::vector<albumcat::apps::Option<ValidateCliConfig>> options;
  const auto parsed = albumcat::apps::parse_options(argc, argv, options);

  if (parsed.errors > 0 || parsed.positionals.size() != 1) {
    albumcat::apps::print_usage(std::cerr, "albumcat_cli validate-album <file.json>", options);
    return 1;
  }

  const auto document = albumcat::apps::load_json_file(parsed.positionals[0]);
  if (!document.has_value()) {
    std::cerr << document.error() << "\n";
    return 1;
  }

  const auto form = albumcat::validation::validate_form_input(document.value());

  nlohmann::json out;
  out["valid"] = form.valid;
  out["errors"] = form.errors;
  std::cout << out.dump(2) << "\n";

  return form.valid ? 0 : 1;
}
