#pragma once

#include <string>
#include <unordered_map>
#include <vector>

#include "progeval/ast.hpp"
#include "progeval/value.hpp"

namespace progeval {

struct Instr {
  std::string op;
  int a = 0;
  int b = 0;
  bool has_a = false;
  bool has_b = false;
  int line = 0;
};

// One compiled function (or the module initialiser). Locals 0..n_params-1 are the
// parameters; `defaults` fills the trailing parameters a call leaves out.
// LOAD_GLOBAL, STORE_GLOBAL and CALL index into `names`.
struct BytecodeProgram {
  std::string name;
  std::vector<Value> consts;
  std::vector<Instr> code;
  std::vector<std::string> names;
  int n_locals = 0;
  int n_params = 0;
  std::vector<Value> defaults;
  std::unordered_map<std::string, int> var2idx;
  int line = 0;
};

struct CompiledModule {
  BytecodeProgram init;
  std::vector<BytecodeProgram> functions;
  std::unordered_map<std::string, int> function_index;
};

// Throws ParseError for constructs that parse but cannot be compiled, such as a
// non-constant parameter default.
CompiledModule compile_module(const Module& module);

}  // namespace progeval
