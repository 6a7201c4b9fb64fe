#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "eval_cli/config.hpp"
#include "eval_cli/json.hpp"
#include "eval_cli/options.hpp"
#include "progeval/errors.hpp"
#include "progeval/value.hpp"

namespace {

using progeval::ConfigError;
using progeval::ValueTag;
using progeval::cli_detail::EvalConfig;
using progeval::cli_detail::JsonParser;
using progeval::cli_detail::JsonValue;

bool check(bool cond, const std::string& msg) {
  if (!cond) {
    std::cerr << "FAIL: " << msg << "\n";
    return false;
  }
  return true;
}

JsonValue parse_json(const std::string& text) {
  JsonParser parser(text);
  return parser.parse();
}

bool test_decode_config() {
  const EvalConfig cfg = progeval::cli_detail::decode_config(parse_json(
      "{\"template_path\": \"t.py\", \"function_to_evolve\": \"priority\", \"function_to_run\": \"evaluate\","
      " \"timeout_seconds\": 7,"
      " \"inputs\": [21, 0.5, \"a\\u00e9\", true, null, {\"type\": \"float\", \"value\": 2},"
      " {\"type\": \"int\", \"value\": 9007199254740993}]}"));
  if (!check(cfg.template_path == "t.py" && cfg.function_to_evolve == "priority" && cfg.function_to_run == "evaluate",
             "string fields")) {
    return false;
  }
  if (!check(cfg.timeout_seconds == 7, "timeout field")) return false;
  if (!check(cfg.inputs.size() == 7, "seven inputs expected")) return false;
  if (!check(cfg.inputs[0].tag == ValueTag::Int && cfg.inputs[0].i == 21, "bare integer is an int")) return false;
  if (!check(cfg.inputs[1].tag == ValueTag::Float && cfg.inputs[1].f == 0.5, "bare fraction is a float")) {
    return false;
  }
  if (!check(cfg.inputs[2].tag == ValueTag::Str && cfg.inputs[2].s == "a\xc3\xa9", "unicode escape as UTF-8")) {
    return false;
  }
  if (!check(cfg.inputs[3].tag == ValueTag::Bool && cfg.inputs[3].b, "true is a bool")) return false;
  if (!check(cfg.inputs[4].tag == ValueTag::None, "null is None")) return false;
  if (!check(cfg.inputs[5].tag == ValueTag::Float && cfg.inputs[5].f == 2.0, "typed float")) return false;
  return check(cfg.inputs[6].tag == ValueTag::Int && cfg.inputs[6].i == 9007199254740993LL,
               "typed int keeps every digit");
}

bool expect_config_error(const std::string& json, const std::string& msg) {
  try {
    (void)progeval::cli_detail::decode_config(parse_json(json));
  } catch (const ConfigError&) {
    return true;
  }
  return check(false, msg);
}

bool test_config_errors() {
  if (!expect_config_error("[]", "non-object config")) return false;
  if (!expect_config_error("{\"function_to_evolve\": \"f\", \"function_to_run\": \"f\", \"inputs\": []}",
                           "missing template_path")) {
    return false;
  }
  if (!expect_config_error(
          "{\"template_path\": \"t\", \"function_to_evolve\": \"f\", \"function_to_run\": \"f\", \"inputs\": 3}",
          "inputs must be an array")) {
    return false;
  }
  if (!expect_config_error("{\"template_path\": \"t\", \"function_to_evolve\": \"f\", \"function_to_run\": \"f\","
                           " \"timeout_seconds\": 0, \"inputs\": []}",
                           "timeout must be positive")) {
    return false;
  }
  return expect_config_error("{\"template_path\": \"t\", \"function_to_evolve\": \"f\", \"function_to_run\": \"f\","
                             " \"inputs\": [{\"type\": \"int\", \"value\": 1.5}]}",
                             "typed int must be integral");
}

bool test_cli_options() {
  std::vector<std::string> args = {"progeval_eval", "--config", "c.json", "--sample", "s.txt",
                                   "--island",      "3",        "--version", "2",     "--timeout", "4"};
  std::vector<char*> argv;
  for (std::string& a : args) argv.push_back(&a[0]);
  const progeval::cli_detail::CliOptions opts =
      progeval::cli_detail::parse_cli_options(static_cast<int>(argv.size()), argv.data());
  if (!check(opts.config_path == "c.json" && opts.sample_path == "s.txt", "paths")) return false;
  if (!check(opts.island_id && *opts.island_id == 3, "island")) return false;
  if (!check(opts.version_generated && *opts.version_generated == 2, "version")) return false;
  if (!check(opts.timeout_seconds && *opts.timeout_seconds == 4, "timeout override")) return false;

  std::vector<std::string> bad = {"progeval_eval", "--config", "c.json", "--island", "x3"};
  std::vector<char*> bad_argv;
  for (std::string& a : bad) bad_argv.push_back(&a[0]);
  try {
    (void)progeval::cli_detail::parse_cli_options(static_cast<int>(bad_argv.size()), bad_argv.data());
  } catch (const ConfigError&) {
    return true;
  }
  return check(false, "bad island value should throw ConfigError");
}

bool expect_json_error(const std::string& text, const std::string& what) {
  try {
    (void)parse_json(text);
  } catch (const std::runtime_error& e) {
    return check(std::string(e.what()).find(what) != std::string::npos,
                 "error for " + text + " should mention [" + what + "]: " + e.what());
  }
  return check(false, "expected a JSON error for " + text);
}

bool test_json_parser() {
  const JsonValue v = parse_json(" {\"a\": [true, false, null], \"s\": \"\\ud83d\\ude00\", \"n\": -1.5e2} ");
  const JsonValue& a = *progeval::cli_detail::find_field(v, "a");
  if (!check(a.array_v.size() == 3 && a.array_v[0].bool_v && !a.array_v[1].bool_v, "bool literals")) return false;
  if (!check(a.array_v[2].kind == JsonValue::Kind::Null, "null literal")) return false;
  if (!check(progeval::cli_detail::find_field(v, "s")->string_v == "\xf0\x9f\x98\x80",
             "surrogate pair decodes to one 4-byte character")) {
    return false;
  }
  if (!check(progeval::cli_detail::find_field(v, "n")->number_v == -150.0, "exponent number")) return false;

  if (!expect_json_error("[1, 2", "offset 5")) return false;
  if (!expect_json_error("[1] x", "trailing")) return false;
  if (!expect_json_error("tru", "literal")) return false;
  if (!expect_json_error("\"\\ud83d\"", "surrogate")) return false;
  return expect_json_error("1.", "fraction");
}

bool test_json_quote() {
  return check(progeval::cli_detail::json_quote("a\"b\\c\n") == "\"a\\\"b\\\\c\\n\"", "json_quote escapes");
}

}  // namespace

int main() {
  if (!test_decode_config()) return 1;
  if (!test_config_errors()) return 1;
  if (!test_cli_options()) return 1;
  if (!test_json_parser()) return 1;
  if (!test_json_quote()) return 1;
  std::cout << "progeval_test_eval_cli: OK\n";
  return 0;
}
