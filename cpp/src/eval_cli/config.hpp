#pragma once

#include <string>
#include <vector>

#include "json.hpp"
#include "progeval/value.hpp"

namespace progeval::cli_detail {

struct EvalConfig {
  std::string template_path;
  std::string function_to_evolve;
  std::string function_to_run;
  std::vector<Value> inputs;
  int timeout_seconds = 30;
};

// Either a bare JSON scalar (null, true, 3, 0.5, "text") or a typed value
// {"type": "int", "value": 3}.
Value decode_input(const JsonValue& v);

// Throws ConfigError naming the offending field.
EvalConfig decode_config(const JsonValue& root);

EvalConfig load_config(const std::string& path);

std::string read_file(const std::string& path);

}  // namespace progeval::cli_detail
