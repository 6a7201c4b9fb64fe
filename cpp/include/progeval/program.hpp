#pragma once

#include <set>
#include <string>
#include <vector>

namespace progeval {

constexpr const char* kDefaultIndent = "    ";

// A top-level function as text. `body` holds the indented statement lines
// without the header or docstring and without a trailing newline. `indent` is
// the block indent of the source function; it places the docstring and any
// body that arrives at column 0.
struct Function {
  std::string name;
  std::string args;
  std::string return_type;
  std::string docstring;
  std::string body;
  std::string indent = kDefaultIndent;

  std::string to_string() const;
};

struct Program {
  std::string preface;
  std::vector<Function> functions;

  // Throws ConfigError when the program has no function called `name`.
  Function& get_function(const std::string& name);
  const Function& get_function(const std::string& name) const;

  // Independent deep copy; evaluations mutate clones only.
  Program clone() const { return *this; }

  std::string to_string() const;
};

// Splits a program into its preface and functions. Throws ParseError for text
// that does not parse and ConfigError for layouts the model cannot represent.
Program text_to_program(const std::string& text);

// Rewrites calls `source_name(...)` into `target_name(...)`. Only a name
// immediately followed by '(' is touched; all other text is kept byte for byte.
std::string rename_function_calls(const std::string& code, const std::string& source_name,
                                  const std::string& target_name);

// Names of all functions called anywhere in `code`. Throws ParseError.
std::set<std::string> get_functions_called(const std::string& code);

}  // namespace progeval
