#pragma once

#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "progeval/program.hpp"
#include "progeval/sandbox.hpp"
#include "progeval/value.hpp"

namespace progeval {

// Test-input key (value_to_string of the input) to score.
using ScoreMap = std::unordered_map<std::string, double>;

// Receiver of admitted programs. Implementations must tolerate concurrent calls
// when evaluators run in parallel.
class ProgramsDatabase {
 public:
  virtual ~ProgramsDatabase() = default;
  virtual void register_program(const Function& program, std::optional<int> island_id, const ScoreMap& scores) = 0;
};

// True when `program` calls `<function_to_evolve>_v<digits>`, i.e. a named
// earlier version of the function being evolved.
bool calls_ancestor(const std::string& program, const std::string& function_to_evolve);

class Evaluator {
 public:
  Evaluator(std::shared_ptr<ProgramsDatabase> database, std::shared_ptr<const Program> template_program,
            std::string function_to_evolve, std::string function_to_run, std::vector<Value> inputs,
            int timeout_seconds = 30);

  // Assembles `sample` into the template, runs it on every input and registers
  // the admitted scores, if any. Throws ContractError when the function to run
  // returns something other than a number or None, and ConfigError when the
  // template lacks the function to evolve.
  void analyse(const std::string& sample, std::optional<int> island_id, std::optional<int> version_generated);

 private:
  std::shared_ptr<ProgramsDatabase> database_;
  std::shared_ptr<const Program> template_;
  std::string function_to_evolve_;
  std::string function_to_run_;
  std::vector<Value> inputs_;
  int timeout_seconds_;
  Sandbox sandbox_;
};

}  // namespace progeval
