#pragma once

#include <optional>
#include <string>

#include "progeval/ast.hpp"

namespace progeval {

// Parses a whole program. Throws ParseError carrying the offending line.
Module parse_module(const std::string& text);

// Last source line of the top-level function `function_name`, or nullopt if the
// module defines no such function. When a name is defined twice the later
// definition wins, as it would at run time.
std::optional<int> find_function_end_line(const Module& module, const std::string& function_name);

}  // namespace progeval
