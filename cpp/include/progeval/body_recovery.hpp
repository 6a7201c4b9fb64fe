#pragma once

#include <string>

namespace progeval {

// Longest prefix of `generated_code` that parses as the body of a function,
// followed by a blank separator line. Lines are dropped from the end, starting
// at the line a parse error points to, until the rest parses. Returns "" when
// nothing can be salvaged.
std::string trim_function_body(const std::string& generated_code);

}  // namespace progeval
