#pragma once

#include <string>
#include <vector>

#include "progeval/bytecode.hpp"
#include "progeval/errors.hpp"
#include "progeval/value.hpp"

namespace progeval {

constexpr int kMaxCallDepth = 1000;

struct TraceEntry {
  int line = 0;
  std::string function;
};

struct VMResult {
  bool is_error = false;
  Value value = Value::none();
  Err err{ErrCode::Value, ""};
  std::vector<TraceEntry> traceback;  // outermost frame first
};

// Runs the module initialiser, then calls `function_name` with positional
// `args`. A negative fuel disables the instruction budget; otherwise running
// out of it fails with ErrCode::Timeout.
VMResult run_function(const CompiledModule& module, const std::string& function_name,
                      const std::vector<Value>& args, int fuel = -1);

// Python-style report of a failed run: traceback lines followed by
// "<ErrorName>: <message>".
std::string format_error(const VMResult& result);

}  // namespace progeval
