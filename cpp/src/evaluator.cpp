#include "progeval/evaluator.hpp"

#include <cctype>
#include <utility>

#include "progeval/assembler.hpp"
#include "progeval/errors.hpp"

namespace progeval {

namespace {

bool score_of(const Value& v, double& out) {
  switch (v.tag) {
    case ValueTag::Int:
      out = static_cast<double>(v.i);
      return true;
    case ValueTag::Float:
      out = v.f;
      return true;
    case ValueTag::Bool:
      out = v.b ? 1.0 : 0.0;
      return true;
    default:
      return false;
  }
}

}  // namespace

bool calls_ancestor(const std::string& program, const std::string& function_to_evolve) {
  const std::string prefix = function_to_evolve + "_v";
  for (const std::string& name : get_functions_called(program)) {
    if (name.size() <= prefix.size() || name.compare(0, prefix.size(), prefix) != 0) {
      continue;
    }
    bool all_digits = true;
    for (std::size_t i = prefix.size(); i < name.size(); ++i) {
      if (!std::isdigit(static_cast<unsigned char>(name[i]))) {
        all_digits = false;
        break;
      }
    }
    if (all_digits) {
      return true;
    }
  }
  return false;
}

Evaluator::Evaluator(std::shared_ptr<ProgramsDatabase> database, std::shared_ptr<const Program> template_program,
                     std::string function_to_evolve, std::string function_to_run, std::vector<Value> inputs,
                     int timeout_seconds)
    : database_(std::move(database)),
      template_(std::move(template_program)),
      function_to_evolve_(std::move(function_to_evolve)),
      function_to_run_(std::move(function_to_run)),
      inputs_(std::move(inputs)),
      timeout_seconds_(timeout_seconds) {
  if (!database_ || !template_) {
    throw ConfigError("evaluator needs a database and a template program");
  }
}

void Evaluator::analyse(const std::string& sample, std::optional<int> island_id,
                        std::optional<int> version_generated) {
  const AssembledProgram assembled = sample_to_program(sample, version_generated, *template_, function_to_evolve_);

  // Computed on the first successful run; a program that never runs is never parsed here.
  std::optional<bool> contaminated;
  ScoreMap scores;
  for (const Value& input : inputs_) {
    const RunResult result = sandbox_.run(assembled.program_text, function_to_run_, input, timeout_seconds_);
    if (!result.ok || result.value.tag == ValueTag::None) {
      continue;
    }
    if (!contaminated) {
      contaminated = calls_ancestor(assembled.program_text, function_to_evolve_);
    }
    if (*contaminated) {
      continue;
    }
    double score = 0.0;
    if (!score_of(result.value, score)) {
      throw ContractError("function to run did not return an int/float score (got " +
                          std::string(type_name(result.value)) + ")");
    }
    scores[value_to_string(input)] = score;
  }

  if (!scores.empty()) {
    database_->register_program(assembled.evolved_function, island_id, scores);
  }
}

}  // namespace progeval
