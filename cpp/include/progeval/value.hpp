#pragma once

#include <cstdint>
#include <string>
#include <utility>

namespace progeval {

enum class ValueTag : std::uint8_t {
  Int,
  Float,
  Bool,
  None,
  Str,
};

struct Value {
  union {
    std::int64_t i;
    double f;
  };
  bool b = false;
  ValueTag tag = ValueTag::None;
  std::string s;

  Value() : i(0) {}

  static Value from_int(std::int64_t v) {
    Value out;
    out.tag = ValueTag::Int;
    out.i = v;
    return out;
  }

  static Value from_float(double v) {
    Value out;
    out.tag = ValueTag::Float;
    out.f = v;
    return out;
  }

  static Value from_bool(bool v) {
    Value out;
    out.tag = ValueTag::Bool;
    out.b = v;
    return out;
  }

  static Value from_str(std::string v) {
    Value out;
    out.tag = ValueTag::Str;
    out.s = std::move(v);
    return out;
  }

  static Value none() { return Value(); }
};

inline bool is_numeric(const Value& v) {
  return v.tag == ValueTag::Int || v.tag == ValueTag::Float;
}

inline const char* type_name(const Value& v) {
  switch (v.tag) {
    case ValueTag::Int:
      return "int";
    case ValueTag::Float:
      return "float";
    case ValueTag::Bool:
      return "bool";
    case ValueTag::None:
      return "NoneType";
    case ValueTag::Str:
      return "str";
  }
  return "NoneType";
}

// Python str() of a value: 21, 0.5, 2.0, True, None, or the raw text of a string.
std::string value_to_string(const Value& v);

// Python repr() of a value; differs from value_to_string only for strings, which are quoted.
std::string value_repr(const Value& v);

}  // namespace progeval
