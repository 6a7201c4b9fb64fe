#include <iostream>
#include <string>
#include <vector>

#include "progeval/bytecode.hpp"
#include "progeval/errors.hpp"
#include "progeval/parser.hpp"
#include "progeval/value.hpp"
#include "progeval/vm.hpp"

namespace {

using progeval::BytecodeProgram;
using progeval::CompiledModule;
using progeval::Instr;
using progeval::VMResult;
using progeval::Value;
using progeval::ValueTag;

Instr ins(const std::string& op) { return Instr{op, 0, 0, false, false}; }

Instr ins_a(const std::string& op, int a) { return Instr{op, a, 0, true, false}; }

bool check(bool cond, const std::string& msg) {
  if (!cond) {
    std::cerr << "FAIL: " << msg << "\n";
    return false;
  }
  return true;
}

CompiledModule single_function(BytecodeProgram p) {
  CompiledModule m;
  m.init.name = "<module>";
  m.init.consts = {Value::none()};
  m.init.code = {ins_a("PUSH_CONST", 0), ins("RETURN")};
  p.name = "f";
  m.functions.push_back(std::move(p));
  m.function_index["f"] = 0;
  return m;
}

VMResult run_source(const std::string& src, const std::vector<Value>& args) {
  const CompiledModule m = progeval::compile_module(progeval::parse_module(src));
  return progeval::run_function(m, "f", args);
}

bool test_basic_arithmetic() {
  BytecodeProgram p;
  p.consts = {Value::from_int(1), Value::from_int(2)};
  p.code = {
      ins_a("PUSH_CONST", 0),
      ins_a("PUSH_CONST", 1),
      ins("ADD"),
      ins("RETURN"),
  };
  VMResult out = progeval::run_function(single_function(p), "f", {}, 100);
  if (!check(!out.is_error, "basic arithmetic should return")) return false;
  if (!check(out.value.tag == ValueTag::Int, "basic arithmetic result should be int")) return false;
  if (!check(out.value.i == 3, "basic arithmetic result should be 3")) return false;
  return true;
}

bool test_loop_like_control_flow() {
  BytecodeProgram p;
  p.n_locals = 1;
  p.consts = {Value::from_int(0), Value::from_int(1), Value::from_int(5)};
  p.code = {
      ins_a("PUSH_CONST", 0),   // x = 0
      ins_a("STORE", 0),
      ins_a("LOAD", 0),         // loop_head:
      ins_a("PUSH_CONST", 2),   // x < 5 ?
      ins("LT"),
      ins_a("JMP_IF_FALSE", 12),
      ins_a("LOAD", 0),
      ins_a("PUSH_CONST", 1),
      ins("ADD"),               // x = x + 1
      ins_a("STORE", 0),
      ins_a("JMP", 2),
      ins_a("PUSH_CONST", 0),   // unreachable padding
      ins_a("LOAD", 0),
      ins("RETURN"),
  };
  VMResult out = progeval::run_function(single_function(p), "f", {}, 1000);
  if (!check(!out.is_error, "control-flow program should return")) return false;
  if (!check(out.value.tag == ValueTag::Int, "control-flow result should be int")) return false;
  if (!check(out.value.i == 5, "control-flow result should be 5")) return false;
  return true;
}

bool test_source_passthrough() {
  VMResult out = run_source("def f(x):\n    return x * 2\n", {Value::from_int(21)});
  if (!check(!out.is_error, "x * 2 should return")) return false;
  if (!check(out.value.tag == ValueTag::Int && out.value.i == 42, "21 * 2 should be 42")) return false;
  return true;
}

bool test_helpers_and_globals() {
  const std::string src =
      "SCALE = 3\n"
      "\n"
      "def helper(a, b=4):\n"
      "    return a * SCALE + b\n"
      "\n"
      "def f(x):\n"
      "    total = 0\n"
      "    for i in range(x):\n"
      "        if i % 2 == 0:\n"
      "            continue\n"
      "        total += helper(i)\n"
      "    return total\n";
  VMResult out = run_source(src, {Value::from_int(5)});
  // odd i in [0, 5): 1, 3 -> (3 + 4) + (9 + 4)
  if (!check(!out.is_error, "helper program should return")) return false;
  if (!check(out.value.tag == ValueTag::Int && out.value.i == 20, "helper program result should be 20")) return false;
  return true;
}

bool test_while_break_and_float() {
  const std::string src =
      "def f(x):\n"
      "    y = 0.5\n"
      "    while True:\n"
      "        if y > x:\n"
      "            break\n"
      "        y = y * 2\n"
      "    return y\n";
  VMResult out = run_source(src, {Value::from_int(3)});
  if (!check(!out.is_error, "while loop should return")) return false;
  if (!check(out.value.tag == ValueTag::Float && out.value.f == 4.0, "while loop result should be 4.0")) return false;
  return true;
}

bool test_implicit_none() {
  VMResult out = run_source("def f(x):\n    y = x\n", {Value::from_int(1)});
  if (!check(!out.is_error, "function without return should succeed")) return false;
  if (!check(out.value.tag == ValueTag::None, "function without return should give None")) return false;
  return true;
}

}  // namespace

int main() {
  if (!test_basic_arithmetic()) return 1;
  if (!test_loop_like_control_flow()) return 1;
  if (!test_source_passthrough()) return 1;
  if (!test_helpers_and_globals()) return 1;
  if (!test_while_break_and_float()) return 1;
  if (!test_implicit_none()) return 1;
  std::cout << "progeval_test_vm_smoke: OK\n";
  return 0;
}
