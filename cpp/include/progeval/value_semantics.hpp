#pragma once

#include <cmath>
#include <cstdint>

#include "progeval/value.hpp"

namespace progeval::vm_semantics {

enum class CmpOp : std::uint8_t {
  LT,
  LE,
  GT,
  GE,
  EQ,
  NE,
};

enum class CompareStatus : std::uint8_t {
  Ok,
  InvalidOp,
  BoolOrderingNotSupported,
  NoneOrderingNotSupported,
  UnsupportedTypes,
};

inline bool to_numeric_pair(const Value& a, const Value& b, double& a_out, double& b_out,
                            bool& any_float) {
  if (!is_numeric(a) || !is_numeric(b)) {
    return false;
  }
  any_float = (a.tag == ValueTag::Float) || (b.tag == ValueTag::Float);
  a_out = (a.tag == ValueTag::Float) ? a.f : static_cast<double>(a.i);
  b_out = (b.tag == ValueTag::Float) ? b.f : static_cast<double>(b.i);
  return true;
}

inline double as_double(const Value& v) {
  return v.tag == ValueTag::Float ? v.f : static_cast<double>(v.i);
}

inline double py_float_mod(double a, double b) {
  return a - std::floor(a / b) * b;
}

inline std::int64_t py_int_mod(std::int64_t a, std::int64_t b) {
  std::int64_t r = a % b;
  if (r != 0 && ((r < 0) != (b < 0))) {
    r += b;
  }
  return r;
}

inline std::int64_t py_int_floordiv(std::int64_t a, std::int64_t b) {
  std::int64_t q = a / b;
  if ((a % b != 0) && ((a < 0) != (b < 0))) {
    q -= 1;
  }
  return q;
}

// Python truthiness for the scalar types of the language.
inline bool is_truthy(const Value& v) {
  switch (v.tag) {
    case ValueTag::Int:
      return v.i != 0;
    case ValueTag::Float:
      return v.f != 0.0;
    case ValueTag::Bool:
      return v.b;
    case ValueTag::None:
      return false;
    case ValueTag::Str:
      return !v.s.empty();
  }
  return false;
}

inline bool apply_order(CmpOp op, int sign, bool& out_bool) {
  if (op == CmpOp::LT) out_bool = sign < 0;
  else if (op == CmpOp::LE) out_bool = sign <= 0;
  else if (op == CmpOp::GT) out_bool = sign > 0;
  else if (op == CmpOp::GE) out_bool = sign >= 0;
  else if (op == CmpOp::EQ) out_bool = sign == 0;
  else if (op == CmpOp::NE) out_bool = sign != 0;
  else return false;
  return true;
}

inline CompareStatus compare_values(CmpOp op, const Value& a, const Value& b, bool& out_bool) {
  double a_num = 0.0;
  double b_num = 0.0;
  bool any_float = false;
  if (to_numeric_pair(a, b, a_num, b_num, any_float)) {
    if (op == CmpOp::LT) out_bool = a_num < b_num;
    else if (op == CmpOp::LE) out_bool = a_num <= b_num;
    else if (op == CmpOp::GT) out_bool = a_num > b_num;
    else if (op == CmpOp::GE) out_bool = a_num >= b_num;
    else if (op == CmpOp::EQ) out_bool = a_num == b_num;
    else if (op == CmpOp::NE) out_bool = a_num != b_num;
    else return CompareStatus::InvalidOp;
    return CompareStatus::Ok;
  }

  if (a.tag == ValueTag::Str && b.tag == ValueTag::Str) {
    const int c = a.s.compare(b.s);
    if (!apply_order(op, c < 0 ? -1 : (c > 0 ? 1 : 0), out_bool)) {
      return CompareStatus::InvalidOp;
    }
    return CompareStatus::Ok;
  }

  if (a.tag == ValueTag::Bool && b.tag == ValueTag::Bool) {
    if (op == CmpOp::EQ) {
      out_bool = (a.b == b.b);
      return CompareStatus::Ok;
    }
    if (op == CmpOp::NE) {
      out_bool = (a.b != b.b);
      return CompareStatus::Ok;
    }
    return CompareStatus::BoolOrderingNotSupported;
  }

  if (a.tag == ValueTag::None || b.tag == ValueTag::None) {
    if (op == CmpOp::EQ) {
      out_bool = (a.tag == ValueTag::None && b.tag == ValueTag::None);
      return CompareStatus::Ok;
    }
    if (op == CmpOp::NE) {
      out_bool = !(a.tag == ValueTag::None && b.tag == ValueTag::None);
      return CompareStatus::Ok;
    }
    return CompareStatus::NoneOrderingNotSupported;
  }

  // Mixed kinds are never equal, as in Python.
  if (op == CmpOp::EQ) {
    out_bool = false;
    return CompareStatus::Ok;
  }
  if (op == CmpOp::NE) {
    out_bool = true;
    return CompareStatus::Ok;
  }
  return CompareStatus::UnsupportedTypes;
}

}  // namespace progeval::vm_semantics
