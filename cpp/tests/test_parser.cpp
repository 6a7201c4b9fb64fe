#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "progeval/ast.hpp"
#include "progeval/errors.hpp"
#include "progeval/lexer.hpp"
#include "progeval/parser.hpp"

namespace {

using progeval::ParseError;
using progeval::TokKind;
using progeval::Token;

bool check(bool cond, const std::string& msg) {
  if (!cond) {
    std::cerr << "FAIL: " << msg << "\n";
    return false;
  }
  return true;
}

bool expect_parse_error(const std::string& src, int line, const std::string& what, const std::string& msg) {
  try {
    (void)progeval::parse_module(src);
  } catch (const ParseError& e) {
    if (!check(e.line() == line, msg + " (line " + std::to_string(e.line()) + ", expected " +
                                     std::to_string(line) + ")")) {
      return false;
    }
    return check(std::string(e.what()).find(what) != std::string::npos, msg + " (message: " + e.what() + ")");
  }
  return check(false, msg + " (expected ParseError)");
}

int count_kind(const std::vector<Token>& tokens, TokKind kind) {
  int n = 0;
  for (const Token& t : tokens) {
    if (t.kind == kind) n++;
  }
  return n;
}

bool test_layout_tokens() {
  const std::string src = "def f(x):\n    if x:\n        return 1\n    return 2\n";
  const std::vector<Token> tokens = progeval::tokenize(src);
  if (!check(count_kind(tokens, TokKind::Indent) == 2, "two indents expected")) return false;
  if (!check(count_kind(tokens, TokKind::Dedent) == 2, "two dedents expected")) return false;
  if (!check(tokens.back().kind == TokKind::End, "token stream should end with End")) return false;

  const std::vector<Token> flat = progeval::tokenize_flat(src);
  if (!check(count_kind(flat, TokKind::Indent) == 0 && count_kind(flat, TokKind::Newline) == 0,
             "flat tokens should carry no layout")) {
    return false;
  }
  return check(flat[0].text == "def" && flat[0].offset == 0 && flat[1].text == "f" && flat[1].offset == 4,
               "flat tokens should keep source offsets");
}

bool test_string_tokens() {
  const std::vector<Token> tokens = progeval::tokenize_flat("x = 'a\\nb' + \"\"\"c\nd\"\"\"\n");
  if (!check(tokens.size() >= 5, "expected string tokens")) return false;
  if (!check(tokens[2].kind == TokKind::Str && tokens[2].text == "a\nb", "escape should be decoded")) return false;
  return check(tokens[4].kind == TokKind::Str && tokens[4].text == "c\nd" && tokens[4].end_line == 2,
               "triple-quoted string should span two lines");
}

bool test_comments_and_brackets() {
  const std::string src =
      "def f(x):  # header\n"
      "    # a comment line\n"
      "    y = (x +\n"
      "         1)\n"
      "    return y\n";
  const progeval::Module m = progeval::parse_module(src);
  if (!check(m.body.stmts.size() == 1, "one top-level statement expected")) return false;
  const auto* def = progeval::as<progeval::FunctionDefStmt>(m.body.stmts[0]);
  if (!check(def != nullptr && def->body.stmts.size() == 2, "function should hold two statements")) return false;
  return check(def->end_line == 5, "function should end on line 5");
}

bool test_syntax_errors_carry_lines() {
  if (!expect_parse_error("def f(x):\n    y = 1\n    return )\n", 3, "')'", "unmatched bracket")) return false;
  if (!expect_parse_error("def f(x):\n    return 1 < x < 3\n", 2, "chained", "chained comparison")) return false;
  if (!expect_parse_error("x = 1\nbreak\n", 2, "outside loop", "break at module level")) return false;
  if (!expect_parse_error("return 1\n", 1, "outside function", "return at module level")) return false;
  if (!expect_parse_error("def f(x):\nreturn x\n", 2, "indented block", "missing body")) return false;
  if (!expect_parse_error("def f(x):\n    if x:\n        return 1\n  return 2\n", 4, "unindent",
                          "inconsistent dedent")) {
    return false;
  }
  if (!expect_parse_error("def f(x):\n    def g():\n        pass\n", 2, "nested", "nested def")) return false;
  if (!expect_parse_error("def f(x):\n    for a in x:\n        pass\n", 2, "range", "for over non-range")) {
    return false;
  }
  if (!expect_parse_error("def f(x=1, y):\n    pass\n", 1, "non-default", "default ordering")) return false;
  return expect_parse_error("def f(x):\n    s = 'abc\n", 2, "unterminated", "open string");
}

bool test_function_end_line() {
  const std::string src =
      "SCALE = 2\n"
      "\n"
      "def f(x):\n"
      "    y = x\n"
      "\n"
      "    return y\n"
      "\n"
      "\n"
      "def g():\n"
      "    pass\n";
  const progeval::Module m = progeval::parse_module(src);
  const std::optional<int> f_end = progeval::find_function_end_line(m, "f");
  const std::optional<int> g_end = progeval::find_function_end_line(m, "g");
  if (!check(f_end && *f_end == 6, "f should end on its last statement line")) return false;
  if (!check(g_end && *g_end == 10, "g should end on line 10")) return false;
  return check(!progeval::find_function_end_line(m, "h"), "missing function has no end line");
}

bool test_function_end_line_redefinition() {
  const std::string src =
      "def f():\n"
      "    return 1\n"
      "\n"
      "def f():\n"
      "    x = 1\n"
      "    return x\n";
  const progeval::Module m = progeval::parse_module(src);
  const std::optional<int> end = progeval::find_function_end_line(m, "f");
  return check(end && *end == 6, "the later definition should win");
}

bool test_augmented_assignment_and_elif() {
  const std::string src =
      "def f(x):\n"
      "    x **= 2\n"
      "    if x > 10:\n"
      "        x //= 3\n"
      "    elif x > 5:\n"
      "        x -= 1\n"
      "    else:\n"
      "        pass\n"
      "    return x if x else -1\n";
  const progeval::Module m = progeval::parse_module(src);
  const auto* def = progeval::as<progeval::FunctionDefStmt>(m.body.stmts[0]);
  if (!check(def != nullptr && def->body.stmts.size() == 3, "three statements in f")) return false;
  const auto* assign = progeval::as<progeval::AssignStmt>(def->body.stmts[0]);
  if (!check(assign != nullptr && assign->name == "x", "augmented assignment should become an assignment")) {
    return false;
  }
  const auto* pow = progeval::as<progeval::BinaryExpr>(assign->e);
  if (!check(pow != nullptr && pow->op == progeval::BOp::POW, "**= should desugar to POW")) return false;
  const auto* ifs = progeval::as<progeval::IfStmtNode>(def->body.stmts[1]);
  if (!check(ifs != nullptr && ifs->else_block.stmts.size() == 1, "elif should nest in the else block")) return false;
  return check(progeval::as<progeval::IfStmtNode>(ifs->else_block.stmts[0]) != nullptr, "nested if expected");
}

bool test_nesting_limits() {
  const std::string deep_parens = std::string(100000, '(') + "1" + std::string(100000, ')');
  if (!expect_parse_error("def f(x):\n    return " + deep_parens + "\n", 2, "nesting", "deep brackets")) return false;

  std::string nots;
  for (int i = 0; i < 50000; ++i) nots += "not ";
  if (!expect_parse_error("x = " + nots + "1\n", 1, "nesting", "long not chain")) return false;
  if (!expect_parse_error("x = " + std::string(50000, '-') + "1\n", 1, "nesting", "long unary minus chain")) {
    return false;
  }

  std::string sum = "x = 1";
  for (int i = 0; i < 100000; ++i) sum += " + 1";
  if (!expect_parse_error(sum + "\n", 1, "deeply nested", "long operator chain")) return false;

  const std::string fine = std::string(150, '(') + "2" + std::string(150, ')');
  const progeval::Module m = progeval::parse_module("x = " + fine + " * 3\n");
  const auto* assign = progeval::as<progeval::AssignStmt>(m.body.stmts[0]);
  if (!check(assign != nullptr && assign->e->depth == 2, "redundant brackets add no tree depth")) return false;

  std::string chain = "x = 1";
  for (int i = 0; i < 500; ++i) chain += " + 1";
  const progeval::Module sums = progeval::parse_module(chain + "\n");
  return check(progeval::as<progeval::AssignStmt>(sums.body.stmts[0])->e->depth == 501,
               "a 501-term sum is a left-leaning tree");
}

}  // namespace

int main() {
  if (!test_layout_tokens()) return 1;
  if (!test_string_tokens()) return 1;
  if (!test_comments_and_brackets()) return 1;
  if (!test_syntax_errors_carry_lines()) return 1;
  if (!test_function_end_line()) return 1;
  if (!test_function_end_line_redefinition()) return 1;
  if (!test_augmented_assignment_and_elif()) return 1;
  if (!test_nesting_limits()) return 1;
  std::cout << "progeval_test_parser: OK\n";
  return 0;
}
