#include "options.hpp"

#include <stdexcept>

#include "progeval/errors.hpp"

namespace progeval::cli_detail {

namespace {

std::string take_value(int argc, char** argv, int& i, const std::string& flag) {
  if (i + 1 >= argc) {
    throw ConfigError("missing value for " + flag);
  }
  return argv[++i];
}

int take_int(int argc, char** argv, int& i, const std::string& flag) {
  const std::string text = take_value(argc, argv, i, flag);
  std::size_t used = 0;
  int value = 0;
  try {
    value = std::stoi(text, &used);
  } catch (const std::logic_error&) {
    throw ConfigError("invalid " + flag + ": " + text);
  }
  if (used != text.size()) {
    throw ConfigError("invalid " + flag + ": " + text);
  }
  return value;
}

}  // namespace

CliOptions parse_cli_options(int argc, char** argv) {
  CliOptions opts;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--config") {
      opts.config_path = take_value(argc, argv, i, arg);
      continue;
    }
    if (arg == "--sample") {
      opts.sample_path = take_value(argc, argv, i, arg);
      continue;
    }
    if (arg == "--island") {
      opts.island_id = take_int(argc, argv, i, arg);
      continue;
    }
    if (arg == "--version") {
      const int version = take_int(argc, argv, i, arg);
      if (version < 0) {
        throw ConfigError("invalid --version: must not be negative");
      }
      opts.version_generated = version;
      continue;
    }
    if (arg == "--timeout") {
      const int timeout = take_int(argc, argv, i, arg);
      if (timeout <= 0) {
        throw ConfigError("invalid --timeout: must be positive");
      }
      opts.timeout_seconds = timeout;
      continue;
    }
    if (arg == "--out-json") {
      opts.out_json_path = take_value(argc, argv, i, arg);
      continue;
    }
    throw ConfigError("unknown argument: " + arg);
  }
  if (opts.config_path.empty() || opts.sample_path.empty()) {
    throw ConfigError("--config and --sample are required");
  }
  return opts;
}

std::string usage() {
  return "usage: progeval_eval --config <file.json> --sample <fragment-file> [--island N] [--version N] "
         "[--timeout S] [--out-json path]";
}

}  // namespace progeval::cli_detail
