#include <iostream>
#include <string>

#include "progeval/result_codec.hpp"
#include "progeval/value.hpp"

namespace {

using progeval::RunResult;
using progeval::Value;
using progeval::ValueTag;

bool check(bool cond, const std::string& msg) {
  if (!cond) {
    std::cerr << "FAIL: " << msg << "\n";
    return false;
  }
  return true;
}

RunResult ok_with(const Value& v) {
  RunResult r;
  r.ok = true;
  r.value = v;
  return r;
}

bool test_wire_format() {
  if (!check(progeval::encode_result(ok_with(Value::from_int(-42))) == "OK int -42\n", "int line")) return false;
  if (!check(progeval::encode_result(ok_with(Value::from_bool(true))) == "OK bool 1\n", "bool line")) return false;
  if (!check(progeval::encode_result(ok_with(Value::none())) == "OK none\n", "none line")) return false;
  return check(progeval::encode_result(ok_with(Value::from_str("a\\b\nc"))) == "OK str a\\\\b\\nc\n", "str line");
}

bool test_float_is_exact() {
  const double x = 0.1 + 0.2;
  const RunResult back = progeval::decode_result(progeval::encode_result(ok_with(Value::from_float(x))));
  return check(back.ok && back.value.tag == ValueTag::Float && back.value.f == x, "float should survive exactly");
}

bool test_multiline_diagnostic() {
  RunResult err;
  err.ok = false;
  err.diagnostic = "Error: division by zero\nTraceback (most recent call last):\n  line 2, in f\nZeroDivisionError: x";
  const std::string wire = progeval::encode_result(err);
  if (!check(wire.compare(0, 8, "ERR\nMSG ") == 0, "error report header")) return false;
  const RunResult back = progeval::decode_result(wire);
  return check(!back.ok && back.diagnostic == err.diagnostic, "diagnostic lines should be preserved");
}

bool test_corrupt_messages() {
  const char* bad[] = {"", "OK int\n", "OK int 12x\n", "OK float abc\n", "OK str bad\\q\n", "OK list 1\n",
                       "ERR\nnope\n", "OK int 1"};
  for (const char* m : bad) {
    const RunResult r = progeval::decode_result(m);
    if (!check(!r.ok, std::string("corrupt message should fail: ") + m)) return false;
    if (!check(r.diagnostic.find("corrupt worker message") != std::string::npos, "corrupt diagnostic")) return false;
  }
  return true;
}

}  // namespace

int main() {
  if (!test_wire_format()) return 1;
  if (!test_float_is_exact()) return 1;
  if (!test_multiline_diagnostic()) return 1;
  if (!test_corrupt_messages()) return 1;
  std::cout << "progeval_test_result_codec: OK\n";
  return 0;
}
