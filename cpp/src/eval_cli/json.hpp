#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace progeval::cli_detail {

struct JsonValue {
  enum class Kind { Null, Bool, Number, String, Array, Object };
  Kind kind = Kind::Null;
  bool bool_v = false;
  double number_v = 0.0;
  std::string spelling;  // numbers keep their source text so integers survive exactly
  std::string string_v;
  std::vector<JsonValue> array_v;
  std::map<std::string, JsonValue> object_v;
};

class JsonParser {
 public:
  explicit JsonParser(std::string text);

  JsonValue parse();

 private:
  // Throws std::runtime_error naming the current offset.
  [[noreturn]] void fail(const std::string& message) const;

  JsonValue parse_value();
  JsonValue parse_object();
  JsonValue parse_array();
  JsonValue parse_string();
  JsonValue parse_number();
  JsonValue parse_literal();
  std::uint32_t parse_hex4();
  std::uint32_t parse_code_point();
  static void append_utf8(std::string& out, std::uint32_t code);

  bool more_items(char close);
  void skip_digits(const char* part);
  void expect(char c);
  bool peek(char c) const;
  void skip_ws();

  std::string text_;
  std::size_t pos_ = 0;
};

// Field access for objects; all throw std::runtime_error on a shape mismatch.
// find_field returns null for an absent key.
const JsonValue* find_field(const JsonValue& obj, const char* key);
const JsonValue& require_object_field(const JsonValue& obj, const char* key);
int require_int(const JsonValue& v, const char* field_name);
std::string require_string(const JsonValue& v, const char* field_name);

// JSON string literal for `s`, quotes included.
std::string json_quote(const std::string& s);

}  // namespace progeval::cli_detail
