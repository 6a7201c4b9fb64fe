#pragma once

#include <optional>
#include <string>

#include "progeval/program.hpp"

namespace progeval {

struct AssembledProgram {
  Function evolved_function;
  std::string program_text;
};

// Recovers a body from `sample`, points calls to `<function_to_evolve>_v<version>`
// back at `function_to_evolve`, and splices the body into a copy of the
// template. The template itself is left untouched. Throws ConfigError when the
// template has no `function_to_evolve`.
AssembledProgram sample_to_program(const std::string& sample, std::optional<int> version_generated,
                                   const Program& template_program, const std::string& function_to_evolve);

}  // namespace progeval
