#pragma once

#include <string>

#include "progeval/value.hpp"

namespace progeval {

// Outcome of one isolated run. `value` is meaningful when ok, `diagnostic`
// when not.
struct RunResult {
  bool ok = false;
  Value value = Value::none();
  std::string diagnostic;
};

// Line protocol between a worker and its parent:
//   OK int 42 | OK float 0.5 | OK bool 1 | OK none | OK str <escaped>
//   ERR followed by one "MSG <line>" per diagnostic line
std::string encode_result(const RunResult& result);

// Never throws; a message that cannot be decoded becomes a failed result.
RunResult decode_result(const std::string& message);

}  // namespace progeval
