#pragma once

#include <optional>
#include <string>

namespace progeval::cli_detail {

struct CliOptions {
  std::string config_path;
  std::string sample_path;
  std::optional<int> island_id;
  std::optional<int> version_generated;
  std::optional<int> timeout_seconds;  // overrides the config file
  std::string out_json_path;
};

// Throws ConfigError for unknown flags, missing values and missing required flags.
CliOptions parse_cli_options(int argc, char** argv);

std::string usage();

}  // namespace progeval::cli_detail
