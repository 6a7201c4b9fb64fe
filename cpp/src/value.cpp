#include "progeval/value.hpp"

#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <string>

namespace progeval {

namespace {

// Shortest decimal spelling that reads back as the same double, laid out the
// way Python's float repr does: fixed notation for exponents in [-4, 16).
std::string float_to_string(double x) {
  if (std::isnan(x)) {
    return "nan";
  }
  if (std::isinf(x)) {
    return x < 0 ? "-inf" : "inf";
  }
  if (x == 0.0) {
    return std::signbit(x) ? "-0.0" : "0.0";
  }

  char buf[40];
  for (int precision = 1; precision <= 17; ++precision) {
    std::snprintf(buf, sizeof(buf), "%.*e", precision - 1, x);
    if (std::strtod(buf, nullptr) == x) {
      break;
    }
  }

  std::string text(buf);
  std::string sign;
  if (text[0] == '-') {
    sign = "-";
    text.erase(0, 1);
  }
  const std::size_t e_pos = text.find('e');
  const int exponent = std::atoi(text.c_str() + e_pos + 1);
  std::string digits;
  for (std::size_t i = 0; i < e_pos; ++i) {
    if (text[i] != '.') digits.push_back(text[i]);
  }
  while (digits.size() > 1 && digits.back() == '0') {
    digits.pop_back();
  }

  std::string out;
  if (exponent >= 16 || exponent < -4) {
    out = digits.substr(0, 1);
    if (digits.size() > 1) {
      out += "." + digits.substr(1);
    }
    char exp_buf[8];
    std::snprintf(exp_buf, sizeof(exp_buf), "e%c%02d", exponent < 0 ? '-' : '+', std::abs(exponent));
    out += exp_buf;
  } else if (exponent >= 0) {
    const std::size_t int_len = static_cast<std::size_t>(exponent) + 1;
    if (digits.size() <= int_len) {
      out = digits + std::string(int_len - digits.size(), '0') + ".0";
    } else {
      out = digits.substr(0, int_len) + "." + digits.substr(int_len);
    }
  } else {
    out = "0." + std::string(static_cast<std::size_t>(-exponent - 1), '0') + digits;
  }
  return sign + out;
}

}  // namespace

std::string value_to_string(const Value& v) {
  switch (v.tag) {
    case ValueTag::Int:
      return std::to_string(v.i);
    case ValueTag::Float:
      return float_to_string(v.f);
    case ValueTag::Bool:
      return v.b ? "True" : "False";
    case ValueTag::None:
      return "None";
    case ValueTag::Str:
      return v.s;
  }
  return "None";
}

std::string value_repr(const Value& v) {
  if (v.tag != ValueTag::Str) {
    return value_to_string(v);
  }
  const char quote = (v.s.find('\'') != std::string::npos && v.s.find('"') == std::string::npos) ? '"' : '\'';
  std::string out(1, quote);
  for (char c : v.s) {
    if (c == '\\') out += "\\\\";
    else if (c == '\n') out += "\\n";
    else if (c == '\t') out += "\\t";
    else if (c == '\r') out += "\\r";
    else if (c == quote) {
      out.push_back('\\');
      out.push_back(c);
    } else {
      out.push_back(c);
    }
  }
  out.push_back(quote);
  return out;
}

}  // namespace progeval
