#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace progeval {

enum class TokKind {
  Name,
  Int,
  Float,
  Str,
  Op,
  Newline,
  Indent,
  Dedent,
  End,
};

struct Token {
  TokKind kind = TokKind::End;
  std::string text;  // decoded contents for Str, source spelling otherwise
  int line = 0;
  int end_line = 0;
  std::size_t offset = 0;
  std::size_t end_offset = 0;
};

// Splits program text into tokens, producing NEWLINE/INDENT/DEDENT for the
// block structure. Throws ParseError.
std::vector<Token> tokenize(const std::string& text);

// Same tokens without any layout tokens and without indentation checks. Used for
// token-level rewriting of text that is not a complete module, e.g. a bare body.
std::vector<Token> tokenize_flat(const std::string& text);

bool is_keyword(const std::string& word);

}  // namespace progeval
