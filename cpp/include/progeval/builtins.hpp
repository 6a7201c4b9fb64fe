#pragma once

#include <string>
#include <vector>

#include "progeval/errors.hpp"
#include "progeval/value.hpp"

namespace progeval {

struct BuiltinResult {
  bool is_error = false;
  Value value = Value::none();
  Err err{ErrCode::Value, ""};
};

bool is_builtin(const std::string& name);

// Unknown names fail with NameError.
BuiltinResult builtin_call(const std::string& name, const std::vector<Value>& args);

}  // namespace progeval
