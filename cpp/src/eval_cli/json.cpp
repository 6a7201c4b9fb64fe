#include "json.hpp"

#include <cctype>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <stdexcept>
#include <utility>

namespace progeval::cli_detail {

namespace {

bool is_digit(char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; }

}  // namespace

JsonParser::JsonParser(std::string text) : text_(std::move(text)) {}

JsonValue JsonParser::parse() {
  JsonValue v = parse_value();
  skip_ws();
  if (pos_ != text_.size()) {
    fail("trailing characters");
  }
  return v;
}

void JsonParser::fail(const std::string& message) const {
  throw std::runtime_error("JSON offset " + std::to_string(pos_) + ": " + message);
}

JsonValue JsonParser::parse_value() {
  skip_ws();
  if (pos_ >= text_.size()) {
    fail("unexpected end of input");
  }
  switch (text_[pos_]) {
    case '{':
      return parse_object();
    case '[':
      return parse_array();
    case '"':
      return parse_string();
    case 't':
    case 'f':
    case 'n':
      return parse_literal();
    default:
      break;
  }
  if (text_[pos_] == '-' || is_digit(text_[pos_])) {
    return parse_number();
  }
  fail(std::string("unexpected character '") + text_[pos_] + "'");
}

// After an element: consumes ',' and returns true, or consumes `close` and
// returns false.
bool JsonParser::more_items(char close) {
  skip_ws();
  if (peek(close)) {
    pos_++;
    return false;
  }
  expect(',');
  return true;
}

JsonValue JsonParser::parse_object() {
  expect('{');
  JsonValue out;
  out.kind = JsonValue::Kind::Object;
  skip_ws();
  if (peek('}')) {
    pos_++;
    return out;
  }
  do {
    skip_ws();
    std::string key = parse_string().string_v;
    skip_ws();
    expect(':');
    out.object_v[std::move(key)] = parse_value();
  } while (more_items('}'));
  return out;
}

JsonValue JsonParser::parse_array() {
  expect('[');
  JsonValue out;
  out.kind = JsonValue::Kind::Array;
  skip_ws();
  if (peek(']')) {
    pos_++;
    return out;
  }
  do {
    out.array_v.push_back(parse_value());
  } while (more_items(']'));
  return out;
}

JsonValue JsonParser::parse_string() {
  expect('"');
  JsonValue out;
  out.kind = JsonValue::Kind::String;
  std::string& s = out.string_v;
  while (pos_ < text_.size()) {
    const char c = text_[pos_++];
    if (c == '"') {
      return out;
    }
    if (c != '\\') {
      s.push_back(c);
      continue;
    }
    if (pos_ >= text_.size()) break;
    switch (text_[pos_++]) {
      case '"': s.push_back('"'); break;
      case '\\': s.push_back('\\'); break;
      case '/': s.push_back('/'); break;
      case 'b': s.push_back('\b'); break;
      case 'f': s.push_back('\f'); break;
      case 'n': s.push_back('\n'); break;
      case 'r': s.push_back('\r'); break;
      case 't': s.push_back('\t'); break;
      case 'u': append_utf8(s, parse_code_point()); break;
      default: fail("unsupported escape");
    }
  }
  fail("unterminated string");
}

std::uint32_t JsonParser::parse_hex4() {
  if (pos_ + 4 > text_.size()) {
    fail("truncated \\u escape");
  }
  std::uint32_t code = 0;
  for (int i = 0; i < 4; ++i) {
    const char h = text_[pos_];
    std::uint32_t digit = 0;
    if (is_digit(h)) digit = static_cast<std::uint32_t>(h - '0');
    else if (h >= 'a' && h <= 'f') digit = static_cast<std::uint32_t>(h - 'a' + 10);
    else if (h >= 'A' && h <= 'F') digit = static_cast<std::uint32_t>(h - 'A' + 10);
    else fail("bad hex digit in \\u escape");
    code = (code << 4) | digit;
    pos_++;
  }
  return code;
}

// A high surrogate must be followed by an escaped low surrogate.
std::uint32_t JsonParser::parse_code_point() {
  const std::uint32_t high = parse_hex4();
  if (high < 0xD800 || high > 0xDFFF) {
    return high;
  }
  if (high > 0xDBFF || text_.compare(pos_, 2, "\\u") != 0) {
    fail("unpaired surrogate");
  }
  pos_ += 2;
  const std::uint32_t low = parse_hex4();
  if (low < 0xDC00 || low > 0xDFFF) {
    fail("unpaired surrogate");
  }
  return 0x10000 + ((high - 0xD800) << 10) + (low - 0xDC00);
}

void JsonParser::append_utf8(std::string& out, std::uint32_t code) {
  if (code < 0x80) {
    out.push_back(static_cast<char>(code));
    return;
  }
  int tail = 0;
  if (code < 0x800) {
    out.push_back(static_cast<char>(0xC0 | (code >> 6)));
    tail = 1;
  } else if (code < 0x10000) {
    out.push_back(static_cast<char>(0xE0 | (code >> 12)));
    tail = 2;
  } else {
    out.push_back(static_cast<char>(0xF0 | (code >> 18)));
    tail = 3;
  }
  for (int shift = 6 * (tail - 1); shift >= 0; shift -= 6) {
    out.push_back(static_cast<char>(0x80 | ((code >> shift) & 0x3F)));
  }
}

void JsonParser::skip_digits(const char* part) {
  if (pos_ >= text_.size() || !is_digit(text_[pos_])) {
    fail(std::string("number is missing its ") + part);
  }
  while (pos_ < text_.size() && is_digit(text_[pos_])) pos_++;
}

JsonValue JsonParser::parse_number() {
  const std::size_t start = pos_;
  if (peek('-')) pos_++;
  if (peek('0')) {
    pos_++;
  } else {
    skip_digits("integer part");
  }
  if (peek('.')) {
    pos_++;
    skip_digits("fraction");
  }
  if (peek('e') || peek('E')) {
    pos_++;
    if (peek('+') || peek('-')) pos_++;
    skip_digits("exponent");
  }
  JsonValue out;
  out.kind = JsonValue::Kind::Number;
  out.spelling = text_.substr(start, pos_ - start);
  out.number_v = std::strtod(out.spelling.c_str(), nullptr);
  return out;
}

JsonValue JsonParser::parse_literal() {
  struct Literal {
    const char* word;
    JsonValue::Kind kind;
    bool value;
  };
  static const Literal kLiterals[] = {
      {"true", JsonValue::Kind::Bool, true},
      {"false", JsonValue::Kind::Bool, false},
      {"null", JsonValue::Kind::Null, false},
  };
  for (const Literal& lit : kLiterals) {
    const std::size_t n = std::strlen(lit.word);
    if (text_.compare(pos_, n, lit.word) == 0) {
      pos_ += n;
      JsonValue out;
      out.kind = lit.kind;
      out.bool_v = lit.value;
      return out;
    }
  }
  fail("unknown literal");
}

void JsonParser::expect(char c) {
  if (!peek(c)) {
    fail(std::string("expected '") + c + "'");
  }
  pos_++;
}

bool JsonParser::peek(char c) const { return pos_ < text_.size() && text_[pos_] == c; }

void JsonParser::skip_ws() {
  while (pos_ < text_.size() && std::isspace(static_cast<unsigned char>(text_[pos_]))) pos_++;
}

const JsonValue* find_field(const JsonValue& obj, const char* key) {
  if (obj.kind != JsonValue::Kind::Object) {
    throw std::runtime_error("expected object");
  }
  const auto it = obj.object_v.find(key);
  return it == obj.object_v.end() ? nullptr : &it->second;
}

const JsonValue& require_object_field(const JsonValue& obj, const char* key) {
  const JsonValue* field = find_field(obj, key);
  if (field == nullptr) {
    throw std::runtime_error(std::string("missing field: ") + key);
  }
  return *field;
}

int require_int(const JsonValue& v, const char* field_name) {
  if (v.kind != JsonValue::Kind::Number) {
    throw std::runtime_error(std::string(field_name) + " must be a number");
  }
  const long long i = static_cast<long long>(v.number_v);
  if (static_cast<double>(i) != v.number_v) {
    throw std::runtime_error(std::string(field_name) + " must be an integer");
  }
  return static_cast<int>(i);
}

std::string require_string(const JsonValue& v, const char* field_name) {
  if (v.kind != JsonValue::Kind::String) {
    throw std::runtime_error(std::string(field_name) + " must be a string");
  }
  return v.string_v;
}

std::string json_quote(const std::string& s) {
  std::string out = "\"";
  for (const char c : s) {
    switch (c) {
      case '"': out += "\\\""; break;
      case '\\': out += "\\\\"; break;
      case '\n': out += "\\n"; break;
      case '\r': out += "\\r"; break;
      case '\t': out += "\\t"; break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          char buf[8];
          std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(c)));
          out += buf;
        } else {
          out.push_back(c);
        }
    }
  }
  out += "\"";
  return out;
}

}  // namespace progeval::cli_detail
