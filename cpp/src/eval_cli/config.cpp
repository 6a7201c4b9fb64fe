#include "config.hpp"

#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>

#include "progeval/errors.hpp"

namespace progeval::cli_detail {

namespace {

bool is_integer_spelling(const std::string& s) {
  return !s.empty() && s.find_first_of(".eE") == std::string::npos;
}

Value decode_number(const JsonValue& raw, bool want_int) {
  if (!want_int) {
    return Value::from_float(raw.number_v);
  }
  if (!is_integer_spelling(raw.spelling)) {
    throw ConfigError("int input must be integral: " + raw.spelling);
  }
  errno = 0;
  const long long i = std::strtoll(raw.spelling.c_str(), nullptr, 10);
  if (errno == ERANGE) {
    throw ConfigError("int input out of range: " + raw.spelling);
  }
  return Value::from_int(i);
}

Value decode_typed_value(const JsonValue& v) {
  const std::string t = require_string(require_object_field(v, "type"), "type");
  if (t == "none") {
    return Value::none();
  }
  const JsonValue& raw = require_object_field(v, "value");
  if (t == "bool") {
    if (raw.kind != JsonValue::Kind::Bool) {
      throw ConfigError("bool typed value requires bool payload");
    }
    return Value::from_bool(raw.bool_v);
  }
  if (t == "int" || t == "float") {
    if (raw.kind != JsonValue::Kind::Number) {
      throw ConfigError(t + " typed value requires numeric payload");
    }
    return decode_number(raw, t == "int");
  }
  if (t == "str") {
    return Value::from_str(require_string(raw, "value"));
  }
  throw ConfigError("unknown typed value type: " + t);
}

}  // namespace

Value decode_input(const JsonValue& v) {
  switch (v.kind) {
    case JsonValue::Kind::Null:
      return Value::none();
    case JsonValue::Kind::Bool:
      return Value::from_bool(v.bool_v);
    case JsonValue::Kind::Number:
      return decode_number(v, is_integer_spelling(v.spelling));
    case JsonValue::Kind::String:
      return Value::from_str(v.string_v);
    case JsonValue::Kind::Object:
      return decode_typed_value(v);
    case JsonValue::Kind::Array:
      break;
  }
  throw ConfigError("inputs must be scalars or typed values");
}

EvalConfig decode_config(const JsonValue& root) {
  if (root.kind != JsonValue::Kind::Object) {
    throw ConfigError("config must be a JSON object");
  }
  EvalConfig cfg;
  try {
    cfg.template_path = require_string(require_object_field(root, "template_path"), "template_path");
    cfg.function_to_evolve = require_string(require_object_field(root, "function_to_evolve"), "function_to_evolve");
    cfg.function_to_run = require_string(require_object_field(root, "function_to_run"), "function_to_run");
    if (const JsonValue* timeout = find_field(root, "timeout_seconds")) {
      cfg.timeout_seconds = require_int(*timeout, "timeout_seconds");
    }
  } catch (const ConfigError&) {
    throw;
  } catch (const std::runtime_error& e) {
    throw ConfigError(e.what());
  }
  if (cfg.timeout_seconds <= 0) {
    throw ConfigError("timeout_seconds must be positive");
  }

  const JsonValue* inputs = find_field(root, "inputs");
  if (inputs == nullptr || inputs->kind != JsonValue::Kind::Array) {
    throw ConfigError("inputs must be an array");
  }
  for (const JsonValue& item : inputs->array_v) {
    cfg.inputs.push_back(decode_input(item));
  }
  return cfg;
}

std::string read_file(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw ConfigError("cannot open " + path);
  }
  std::stringstream buf;
  buf << in.rdbuf();
  return buf.str();
}

EvalConfig load_config(const std::string& path) {
  const std::string text = read_file(path);
  JsonValue root;
  try {
    JsonParser parser(text);
    root = parser.parse();
  } catch (const std::runtime_error& e) {
    throw ConfigError(path + ": " + e.what());
  }
  EvalConfig cfg = decode_config(root);

  // A relative template path is taken relative to the config file.
  if (!cfg.template_path.empty() && cfg.template_path[0] != '/') {
    const std::size_t slash = path.rfind('/');
    if (slash != std::string::npos) {
      cfg.template_path = path.substr(0, slash + 1) + cfg.template_path;
    }
  }
  return cfg;
}

}  // namespace progeval::cli_detail
