#include "progeval/builtins.hpp"

#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <limits>
#include <string>
#include <utility>

#include "progeval/value_semantics.hpp"

namespace progeval {

namespace {

constexpr const char* kBuiltinNames[] = {"abs", "min", "max", "clip", "int", "float",
                                         "str", "len", "round", "bool"};

BuiltinResult fail(ErrCode code, const std::string& message) {
  BuiltinResult out;
  out.is_error = true;
  out.err = Err{code, message};
  return out;
}

BuiltinResult ok(Value v) {
  BuiltinResult out;
  out.value = std::move(v);
  return out;
}

// bool takes part in arithmetic as the int 0 or 1.
Value as_number(const Value& v) {
  if (v.tag == ValueTag::Bool) {
    return Value::from_int(v.b ? 1 : 0);
  }
  return v;
}

std::string strip(const std::string& s) {
  std::size_t begin = 0;
  std::size_t end = s.size();
  while (begin < end && std::isspace(static_cast<unsigned char>(s[begin]))) begin++;
  while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) end--;
  return s.substr(begin, end - begin);
}

bool float_to_int(double x, std::int64_t& out, Err& err) {
  if (std::isnan(x)) {
    err = Err{ErrCode::Value, "cannot convert float NaN to integer"};
    return false;
  }
  if (std::isinf(x)) {
    err = Err{ErrCode::Overflow, "cannot convert float infinity to integer"};
    return false;
  }
  const double t = std::trunc(x);
  if (t < -9223372036854775808.0 || t >= 9223372036854775808.0) {
    err = Err{ErrCode::Overflow, "int too large to convert"};
    return false;
  }
  out = static_cast<std::int64_t>(t);
  return true;
}

BuiltinResult call_abs(const std::vector<Value>& args) {
  if (args.size() != 1) {
    return fail(ErrCode::Type, "abs() takes exactly one argument (" + std::to_string(args.size()) + " given)");
  }
  const Value x = as_number(args[0]);
  if (!is_numeric(x)) {
    return fail(ErrCode::Type, std::string("bad operand type for abs(): '") + type_name(x) + "'");
  }
  if (x.tag == ValueTag::Float) {
    return ok(Value::from_float(std::fabs(x.f)));
  }
  if (x.i == std::numeric_limits<std::int64_t>::min()) {
    return fail(ErrCode::Overflow, "integer overflow in abs()");
  }
  return ok(Value::from_int(x.i < 0 ? -x.i : x.i));
}

BuiltinResult call_min_max(const std::string& name, const std::vector<Value>& args) {
  if (args.size() < 2) {
    return fail(ErrCode::Type, name + "() expects at least 2 arguments");
  }
  const bool want_min = name == "min";
  std::size_t best = 0;
  for (std::size_t i = 1; i < args.size(); ++i) {
    bool less = false;
    const vm_semantics::CompareStatus st =
        vm_semantics::compare_values(vm_semantics::CmpOp::LT, as_number(want_min ? args[i] : args[best]),
                                     as_number(want_min ? args[best] : args[i]), less);
    if (st != vm_semantics::CompareStatus::Ok) {
      return fail(ErrCode::Type, std::string("'<' not supported between instances of '") + type_name(args[i]) +
                                     "' and '" + type_name(args[best]) + "'");
    }
    if (less) {
      best = i;
    }
  }
  return ok(args[best]);
}

BuiltinResult call_clip(const std::vector<Value>& args) {
  if (args.size() != 3) {
    return fail(ErrCode::Type, "clip expects 3 arguments: clip(x, lo, hi)");
  }
  const Value x = as_number(args[0]);
  const Value lo = as_number(args[1]);
  const Value hi = as_number(args[2]);
  if (!is_numeric(x) || !is_numeric(lo) || !is_numeric(hi)) {
    return fail(ErrCode::Type, "clip expects numeric arguments");
  }
  const bool any_float =
      (x.tag == ValueTag::Float) || (lo.tag == ValueTag::Float) || (hi.tag == ValueTag::Float);
  if (any_float) {
    const double x2 = vm_semantics::as_double(x);
    const double lo2 = vm_semantics::as_double(lo);
    const double hi2 = vm_semantics::as_double(hi);
    if (lo2 > hi2) {
      return fail(ErrCode::Value, "clip requires lo <= hi");
    }
    return ok(Value::from_float(x2 < lo2 ? lo2 : (x2 > hi2 ? hi2 : x2)));
  }
  if (lo.i > hi.i) {
    return fail(ErrCode::Value, "clip requires lo <= hi");
  }
  return ok(Value::from_int(x.i < lo.i ? lo.i : (x.i > hi.i ? hi.i : x.i)));
}

BuiltinResult call_int(const std::vector<Value>& args) {
  if (args.empty()) {
    return ok(Value::from_int(0));
  }
  if (args.size() != 1) {
    return fail(ErrCode::Type, "int() takes at most 1 argument");
  }
  const Value x = as_number(args[0]);
  if (x.tag == ValueTag::Int) {
    return ok(x);
  }
  if (x.tag == ValueTag::Float) {
    std::int64_t out = 0;
    Err err{ErrCode::Value, ""};
    if (!float_to_int(x.f, out, err)) {
      return fail(err.code, err.message);
    }
    return ok(Value::from_int(out));
  }
  if (x.tag == ValueTag::Str) {
    const std::string text = strip(x.s);
    const std::string invalid = "invalid literal for int() with base 10: " + value_repr(x);
    std::size_t p = 0;
    if (p < text.size() && (text[p] == '+' || text[p] == '-')) p++;
    if (p == text.size()) {
      return fail(ErrCode::Value, invalid);
    }
    for (std::size_t i = p; i < text.size(); ++i) {
      if (!std::isdigit(static_cast<unsigned char>(text[i]))) {
        return fail(ErrCode::Value, invalid);
      }
    }
    errno = 0;
    const long long v = std::strtoll(text.c_str(), nullptr, 10);
    if (errno == ERANGE) {
      return fail(ErrCode::Overflow, "int too large to convert");
    }
    return ok(Value::from_int(v));
  }
  return fail(ErrCode::Type,
              std::string("int() argument must be a string or a real number, not '") + type_name(x) + "'");
}

BuiltinResult call_float(const std::vector<Value>& args) {
  if (args.empty()) {
    return ok(Value::from_float(0.0));
  }
  if (args.size() != 1) {
    return fail(ErrCode::Type, "float() takes at most 1 argument");
  }
  const Value x = as_number(args[0]);
  if (is_numeric(x)) {
    return ok(Value::from_float(vm_semantics::as_double(x)));
  }
  if (x.tag == ValueTag::Str) {
    const std::string text = strip(x.s);
    char* end = nullptr;
    const double v = std::strtod(text.c_str(), &end);
    if (text.empty() || end != text.c_str() + text.size()) {
      return fail(ErrCode::Value, "could not convert string to float: " + value_repr(x));
    }
    return ok(Value::from_float(v));
  }
  return fail(ErrCode::Type,
              std::string("float() argument must be a string or a real number, not '") + type_name(x) + "'");
}

BuiltinResult call_round(const std::vector<Value>& args) {
  if (args.empty() || args.size() > 2) {
    return fail(ErrCode::Type, "round() takes 1 or 2 arguments");
  }
  const Value x = as_number(args[0]);
  if (!is_numeric(x)) {
    return fail(ErrCode::Type, std::string("type ") + type_name(x) + " doesn't define __round__ method");
  }
  if (args.size() == 1 || args[1].tag == ValueTag::None) {
    if (x.tag == ValueTag::Int) {
      return ok(x);
    }
    std::int64_t out = 0;
    Err err{ErrCode::Value, ""};
    if (!float_to_int(std::nearbyint(x.f), out, err)) {
      return fail(err.code, err.message);
    }
    return ok(Value::from_int(out));
  }

  const Value nd = as_number(args[1]);
  if (nd.tag != ValueTag::Int) {
    return fail(ErrCode::Type, std::string("'") + type_name(nd) + "' object cannot be interpreted as an integer");
  }
  if (x.tag == ValueTag::Float) {
    if (!std::isfinite(x.f) || nd.i > 300 || nd.i < -300) {
      return ok(x);
    }
    const double scale = std::pow(10.0, static_cast<double>(nd.i));
    const double r = std::nearbyint(x.f * scale) / scale;
    return ok(Value::from_float(std::isfinite(r) ? r : x.f));
  }
  if (nd.i >= 0) {
    return ok(x);
  }
  // 10**19 no longer fits; halves of it still round away from zero.
  if (nd.i < -19) {
    return ok(Value::from_int(0));
  }
  if (nd.i == -19) {
    if (x.i > 5000000000000000000LL || x.i < -5000000000000000000LL) {
      return fail(ErrCode::Overflow, "integer overflow in round()");
    }
    return ok(Value::from_int(0));
  }
  std::int64_t p = 1;
  for (std::int64_t k = 0; k < -nd.i; ++k) p *= 10;
  const std::int64_t r = vm_semantics::py_int_mod(x.i, p);
  std::int64_t q = 0;
  if (__builtin_sub_overflow(x.i, r, &q)) {
    return fail(ErrCode::Overflow, "integer overflow in round()");
  }
  if (2 * r > p || (2 * r == p && vm_semantics::py_int_mod(q / p, 2) != 0)) {
    if (__builtin_add_overflow(q, p, &q)) {
      return fail(ErrCode::Overflow, "integer overflow in round()");
    }
  }
  return ok(Value::from_int(q));
}

}  // namespace

bool is_builtin(const std::string& name) {
  for (const char* b : kBuiltinNames) {
    if (name == b) {
      return true;
    }
  }
  return false;
}

BuiltinResult builtin_call(const std::string& name, const std::vector<Value>& args) {
  if (name == "abs") {
    return call_abs(args);
  }
  if (name == "min" || name == "max") {
    return call_min_max(name, args);
  }
  if (name == "clip") {
    return call_clip(args);
  }
  if (name == "int") {
    return call_int(args);
  }
  if (name == "float") {
    return call_float(args);
  }
  if (name == "round") {
    return call_round(args);
  }
  if (name == "str") {
    if (args.size() > 1) {
      return fail(ErrCode::Type, "str() takes at most 1 argument");
    }
    return ok(Value::from_str(args.empty() ? std::string() : value_to_string(args[0])));
  }
  if (name == "bool") {
    if (args.size() > 1) {
      return fail(ErrCode::Type, "bool() takes at most 1 argument");
    }
    return ok(Value::from_bool(!args.empty() && vm_semantics::is_truthy(args[0])));
  }
  if (name == "len") {
    if (args.size() != 1) {
      return fail(ErrCode::Type, "len() takes exactly one argument (" + std::to_string(args.size()) + " given)");
    }
    if (args[0].tag != ValueTag::Str) {
      return fail(ErrCode::Type, std::string("object of type '") + type_name(args[0]) + "' has no len()");
    }
    return ok(Value::from_int(static_cast<std::int64_t>(args[0].s.size())));
  }

  return fail(ErrCode::Name, "name '" + name + "' is not defined");
}

}  // namespace progeval
