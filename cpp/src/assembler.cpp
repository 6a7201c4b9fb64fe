#include "progeval/assembler.hpp"

#include "progeval/body_recovery.hpp"

namespace progeval {

AssembledProgram sample_to_program(const std::string& sample, std::optional<int> version_generated,
                                   const Program& template_program, const std::string& function_to_evolve) {
  std::string body = trim_function_body(sample);
  if (version_generated) {
    body = rename_function_calls(body, function_to_evolve + "_v" + std::to_string(*version_generated),
                                 function_to_evolve);
  }

  Program program = template_program.clone();
  Function& evolved = program.get_function(function_to_evolve);
  evolved.body = body;

  AssembledProgram out;
  out.evolved_function = evolved;
  out.program_text = program.to_string();
  return out;
}

}  // namespace progeval
