#pragma once

#include <stdexcept>
#include <string>

namespace progeval {

enum class ErrCode {
  Name,
  Type,
  ZeroDiv,
  Value,
  Timeout,
  Recursion,
  Overflow,
  Syntax,
};

inline const char* err_code_name(ErrCode code) {
  switch (code) {
    case ErrCode::Name:
      return "NameError";
    case ErrCode::Type:
      return "TypeError";
    case ErrCode::ZeroDiv:
      return "ZeroDivisionError";
    case ErrCode::Value:
      return "ValueError";
    case ErrCode::Timeout:
      return "Timeout";
    case ErrCode::Recursion:
      return "RecursionError";
    case ErrCode::Overflow:
      return "OverflowError";
    case ErrCode::Syntax:
      return "SyntaxError";
  }
  return "ValueError";
}

struct Err {
  ErrCode code;
  std::string message;
};

// Malformed program text. line() is 1-based and may point one past the last line
// when the text ends in the middle of a construct.
class ParseError : public std::runtime_error {
 public:
  ParseError(int line, const std::string& message)
      : std::runtime_error("line " + std::to_string(line) + ": " + message), line_(line) {}

  int line() const { return line_; }

 private:
  int line_;
};

// The harness was set up with something that cannot work, e.g. a template without
// the function to evolve.
class ConfigError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// A program broke the scoring contract of the harness.
class ContractError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

}  // namespace progeval
