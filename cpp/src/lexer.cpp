#include "progeval/lexer.hpp"

#include <cctype>
#include <cstring>
#include <utility>

#include "progeval/errors.hpp"

namespace progeval {

namespace {

constexpr const char* kKeywords[] = {
    "def", "return", "if",  "elif", "else", "while", "for",  "in",    "pass",
    "break", "continue", "and", "or",   "not",  "True",  "False", "None",
};

constexpr const char* kThreeCharOps[] = {"//=", "**="};
constexpr const char* kTwoCharOps[] = {"**", "//", "==", "!=", "<=", ">=", "->", "+=", "-=", "*=", "/=", "%="};
constexpr const char kOneCharOps[] = "+-*/%<>=()[]{},:.;";

bool is_name_start(char c) {
  return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
}

bool is_name_char(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

bool is_digit(char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; }

class Lexer {
 public:
  Lexer(const std::string& text, bool layout) : text_(text), layout_(layout) {}

  std::vector<Token> run() {
    while (true) {
      if (at_line_start_) {
        if (layout_ && brackets_.empty()) {
          if (!start_line()) break;
          continue;
        }
        at_line_start_ = false;
      }
      if (pos_ >= text_.size()) break;

      const char c = text_[pos_];
      if (c == ' ' || c == '\t' || c == '\r' || c == '\f') {
        pos_++;
        continue;
      }
      if (c == '#') {
        while (pos_ < text_.size() && text_[pos_] != '\n') pos_++;
        continue;
      }
      if (c == '\\' && peek_at(1) == '\n') {
        pos_ += 2;
        line_++;
        continue;
      }
      if (c == '\\' && peek_at(1) == '\r' && peek_at(2) == '\n') {
        pos_ += 3;
        line_++;
        continue;
      }
      if (c == '\n') {
        if (brackets_.empty()) {
          emit_newline(pos_);
          at_line_start_ = true;
        }
        pos_++;
        line_++;
        continue;
      }
      if (is_digit(c) || (c == '.' && is_digit(peek_at(1)))) {
        lex_number();
        continue;
      }
      if (is_name_start(c)) {
        lex_name();
        continue;
      }
      if (c == '"' || c == '\'') {
        lex_string();
        continue;
      }
      lex_op();
    }

    if (!brackets_.empty()) {
      throw ParseError(brackets_.back().second,
                       std::string("'") + brackets_.back().first + "' was never closed");
    }
    if (layout_) {
      emit_newline(pos_);
      while (indents_.size() > 1) {
        indents_.pop_back();
        emit(TokKind::Dedent, "", pos_, line_);
      }
    }
    emit(TokKind::End, "", pos_, line_);
    return std::move(out_);
  }

 private:
  char peek_at(std::size_t ahead) const {
    const std::size_t p = pos_ + ahead;
    return p < text_.size() ? text_[p] : '\0';
  }

  void emit(TokKind kind, std::string text, std::size_t start, int line) {
    Token t;
    t.kind = kind;
    t.text = std::move(text);
    t.line = line;
    t.end_line = line_;
    t.offset = start;
    t.end_offset = pos_;
    out_.push_back(std::move(t));
  }

  void emit_newline(std::size_t at) {
    if (!layout_) return;
    if (out_.empty() || out_.back().kind == TokKind::Newline || out_.back().kind == TokKind::Dedent ||
        out_.back().kind == TokKind::Indent) {
      return;
    }
    emit(TokKind::Newline, "", at, line_);
  }

  // Measures the indentation of a new logical line. Blank and comment-only lines
  // are consumed whole and leave the lexer at a line start. Returns false at EOF.
  bool start_line() {
    int col = 0;
    std::size_t p = pos_;
    while (p < text_.size()) {
      const char c = text_[p];
      if (c == ' ') {
        col += 1;
      } else if (c == '\t') {
        col = (col / 8 + 1) * 8;
      } else if (c == '\f') {
        col = 0;
      } else {
        break;
      }
      p++;
    }
    if (p >= text_.size()) {
      pos_ = p;
      return false;
    }
    if (text_[p] == '\n' || text_[p] == '\r' || text_[p] == '#') {
      while (p < text_.size() && text_[p] != '\n') p++;
      if (p < text_.size()) {
        p++;
        line_++;
      }
      pos_ = p;
      return true;
    }

    pos_ = p;
    at_line_start_ = false;
    if (col > indents_.back()) {
      indents_.push_back(col);
      emit(TokKind::Indent, "", pos_, line_);
      return true;
    }
    while (col < indents_.back()) {
      indents_.pop_back();
      emit(TokKind::Dedent, "", pos_, line_);
    }
    if (col != indents_.back()) {
      throw ParseError(line_, "unindent does not match any outer indentation level");
    }
    return true;
  }

  void lex_number() {
    const std::size_t start = pos_;
    bool is_float = false;
    while (pos_ < text_.size() && is_digit(text_[pos_])) pos_++;
    if (pos_ < text_.size() && text_[pos_] == '.') {
      is_float = true;
      pos_++;
      while (pos_ < text_.size() && is_digit(text_[pos_])) pos_++;
    }
    if (pos_ < text_.size() && (text_[pos_] == 'e' || text_[pos_] == 'E')) {
      std::size_t p = pos_ + 1;
      if (p < text_.size() && (text_[p] == '+' || text_[p] == '-')) p++;
      if (p < text_.size() && is_digit(text_[p])) {
        is_float = true;
        pos_ = p;
        while (pos_ < text_.size() && is_digit(text_[pos_])) pos_++;
      }
    }
    if (pos_ < text_.size() && is_name_char(text_[pos_])) {
      throw ParseError(line_, "invalid decimal literal");
    }
    emit(is_float ? TokKind::Float : TokKind::Int, text_.substr(start, pos_ - start), start, line_);
  }

  void lex_name() {
    const std::size_t start = pos_;
    while (pos_ < text_.size() && is_name_char(text_[pos_])) pos_++;
    emit(TokKind::Name, text_.substr(start, pos_ - start), start, line_);
  }

  void lex_string() {
    const std::size_t start = pos_;
    const int start_line = line_;
    const char quote = text_[pos_];
    const bool triple = peek_at(1) == quote && peek_at(2) == quote;
    pos_ += triple ? 3 : 1;

    std::string value;
    while (true) {
      if (pos_ >= text_.size()) {
        throw ParseError(start_line, triple ? "unterminated triple-quoted string literal"
                                            : "unterminated string literal");
      }
      const char c = text_[pos_];
      if (c == quote) {
        if (!triple) {
          pos_++;
          break;
        }
        if (peek_at(1) == quote && peek_at(2) == quote) {
          pos_ += 3;
          break;
        }
      }
      if (c == '\n') {
        if (!triple) {
          throw ParseError(start_line, "unterminated string literal");
        }
        line_++;
      }
      if (c == '\\' && pos_ + 1 < text_.size()) {
        const char e = text_[pos_ + 1];
        pos_ += 2;
        if (e == 'n') value.push_back('\n');
        else if (e == 't') value.push_back('\t');
        else if (e == 'r') value.push_back('\r');
        else if (e == '0') value.push_back('\0');
        else if (e == '\\' || e == '\'' || e == '"') value.push_back(e);
        else if (e == '\n') line_++;
        else {
          value.push_back('\\');
          value.push_back(e);
        }
        continue;
      }
      value.push_back(c);
      pos_++;
    }
    emit(TokKind::Str, std::move(value), start, start_line);
  }

  void lex_op() {
    const std::size_t start = pos_;
    for (const char* op : kThreeCharOps) {
      if (text_.compare(pos_, 3, op) == 0) {
        pos_ += 3;
        emit(TokKind::Op, op, start, line_);
        return;
      }
    }
    for (const char* op : kTwoCharOps) {
      if (text_.compare(pos_, 2, op) == 0) {
        pos_ += 2;
        emit(TokKind::Op, op, start, line_);
        return;
      }
    }
    const char c = text_[pos_];
    if (c == '\0' || std::strchr(kOneCharOps, c) == nullptr) {
      throw ParseError(line_, std::string("invalid character '") + c + "'");
    }
    if (c == '(' || c == '[' || c == '{') {
      brackets_.push_back({c, line_});
    } else if (c == ')' || c == ']' || c == '}') {
      const char open = (c == ')') ? '(' : (c == ']') ? '[' : '{';
      if (brackets_.empty() || brackets_.back().first != open) {
        throw ParseError(line_, std::string("unmatched '") + c + "'");
      }
      brackets_.pop_back();
    }
    pos_++;
    emit(TokKind::Op, std::string(1, c), start, line_);
  }

  const std::string& text_;
  bool layout_;
  std::size_t pos_ = 0;
  int line_ = 1;
  bool at_line_start_ = true;
  std::vector<int> indents_{0};
  std::vector<std::pair<char, int>> brackets_;
  std::vector<Token> out_;
};

}  // namespace

std::vector<Token> tokenize(const std::string& text) {
  Lexer lexer(text, true);
  return lexer.run();
}

std::vector<Token> tokenize_flat(const std::string& text) {
  Lexer lexer(text, false);
  return lexer.run();
}

bool is_keyword(const std::string& word) {
  for (const char* kw : kKeywords) {
    if (word == kw) {
      return true;
    }
  }
  return false;
}

}  // namespace progeval
