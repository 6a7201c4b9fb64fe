#include "progeval/parser.hpp"

#include <algorithm>
#include <cstddef>
#include <memory>
#include <stdexcept>
#include <utility>
#include <vector>

#include "progeval/errors.hpp"
#include "progeval/lexer.hpp"

namespace progeval {

namespace {

std::string trim(const std::string& s) {
  std::size_t begin = 0;
  std::size_t end = s.size();
  while (begin < end && (s[begin] == ' ' || s[begin] == '\t' || s[begin] == '\n' || s[begin] == '\r')) begin++;
  while (end > begin && (s[end - 1] == ' ' || s[end - 1] == '\t' || s[end - 1] == '\n' || s[end - 1] == '\r')) end--;
  return s.substr(begin, end - begin);
}

// Brackets, unary operators, blocks and nested expressions share one budget.
constexpr int kMaxNesting = 200;
// Operator chains fold into left-leaning trees; this caps their height.
constexpr int kMaxExprDepth = 2000;

class NestingGuard {
 public:
  explicit NestingGuard(int& level) : level_(level) { ++level_; }
  ~NestingGuard() { --level_; }
  NestingGuard(const NestingGuard&) = delete;
  NestingGuard& operator=(const NestingGuard&) = delete;

 private:
  int& level_;
};

bool is_layout(TokKind kind) {
  return kind == TokKind::Newline || kind == TokKind::Indent || kind == TokKind::Dedent || kind == TokKind::End;
}

class Parser {
 public:
  Parser(const std::string& text, std::vector<Token> tokens) : text_(text), tokens_(std::move(tokens)) {}

  Module parse() {
    Module m;
    while (!at(TokKind::End)) {
      if (at(TokKind::Newline)) {
        advance();
        continue;
      }
      if (at(TokKind::Indent)) {
        fail(peek().line, "unexpected indent");
      }
      parse_statement(m.body.stmts);
    }
    return m;
  }

 private:
  [[noreturn]] void fail(int line, const std::string& message) const { throw ParseError(line, message); }

  void check_nesting(int line) const {
    if (nesting_ > kMaxNesting) {
      fail(line, "too many nesting levels");
    }
  }

  ExprPtr with_depth(ExprPtr e, int child_depth) const {
    e->depth = child_depth + 1;
    if (e->depth > kMaxExprDepth) {
      fail(e->line, "expression too deeply nested");
    }
    return e;
  }

  ExprPtr unary(UOp op, ExprPtr operand, int line) const {
    const int d = operand->depth;
    return with_depth(std::make_shared<UnaryExpr>(op, std::move(operand), line), d);
  }

  ExprPtr binary(BOp op, ExprPtr a, ExprPtr b, int line) const {
    const int d = std::max(a->depth, b->depth);
    return with_depth(std::make_shared<BinaryExpr>(op, std::move(a), std::move(b), line), d);
  }

  const Token& peek(std::size_t ahead = 0) const {
    const std::size_t p = pos_ + ahead;
    return p < tokens_.size() ? tokens_[p] : tokens_.back();
  }

  const Token& advance() {
    const Token& t = tokens_[pos_];
    if (pos_ + 1 < tokens_.size()) pos_++;
    if (!is_layout(t.kind)) {
      prev_end_line_ = t.end_line;
      prev_end_offset_ = t.end_offset;
    }
    return t;
  }

  bool at(TokKind kind) const { return peek().kind == kind; }

  bool at_op(const char* op) const { return peek().kind == TokKind::Op && peek().text == op; }

  bool at_name(const char* word) const { return peek().kind == TokKind::Name && peek().text == word; }

  bool at_simple_end() const { return at(TokKind::Newline) || at(TokKind::End) || at_op(";"); }

  void expect_op(const char* op) {
    if (!at_op(op)) {
      fail(peek().line, std::string("expected '") + op + "'");
    }
    advance();
  }

  void expect_keyword(const char* word) {
    if (!at_name(word)) {
      fail(peek().line, std::string("expected '") + word + "'");
    }
    advance();
  }

  std::string expect_name() {
    if (!at(TokKind::Name) || is_keyword(peek().text)) {
      fail(peek().line, "invalid syntax");
    }
    return advance().text;
  }

  void parse_statement(std::vector<StmtPtr>& out) {
    if (at(TokKind::Name)) {
      const std::string& word = peek().text;
      if (word == "def") {
        out.push_back(parse_def());
        return;
      }
      if (word == "if") {
        out.push_back(parse_if());
        return;
      }
      if (word == "while") {
        out.push_back(parse_while());
        return;
      }
      if (word == "for") {
        out.push_back(parse_for());
        return;
      }
    }
    parse_simple_statements(out);
  }

  void parse_simple_statements(std::vector<StmtPtr>& out) {
    while (true) {
      out.push_back(parse_small_statement());
      if (!at_op(";")) break;
      advance();
      if (at(TokKind::Newline) || at(TokKind::End)) break;
    }
    if (at(TokKind::Newline)) {
      advance();
    } else if (!at(TokKind::End)) {
      fail(peek().line, "invalid syntax");
    }
  }

  StmtPtr parse_small_statement() {
    const Token& t = peek();
    const int line = t.line;
    if (t.kind == TokKind::Name) {
      if (t.text == "pass") {
        advance();
        return std::make_shared<PassStmt>(line);
      }
      if (t.text == "break" || t.text == "continue") {
        if (loop_depth_ == 0) {
          fail(line, "'" + t.text + "' outside loop");
        }
        const bool is_break = t.text == "break";
        advance();
        if (is_break) return std::make_shared<BreakStmt>(line);
        return std::make_shared<ContinueStmt>(line);
      }
      if (t.text == "return") {
        if (function_depth_ == 0) {
          fail(line, "'return' outside function");
        }
        advance();
        if (at_simple_end()) {
          return std::make_shared<ReturnStmt>(nullptr, line);
        }
        return std::make_shared<ReturnStmt>(parse_expr(), line);
      }
      if (!is_keyword(t.text) && peek(1).kind == TokKind::Op) {
        const std::string& op = peek(1).text;
        if (op == "=") {
          const std::string name = advance().text;
          advance();
          return std::make_shared<AssignStmt>(name, parse_expr(), line);
        }
        BOp aug = BOp::ADD;
        if (augmented_op(op, aug)) {
          const std::string name = advance().text;
          advance();
          ExprPtr rhs = parse_expr();
          ExprPtr value = binary(aug, std::make_shared<VarExpr>(name, line), rhs, line);
          return std::make_shared<AssignStmt>(name, value, line);
        }
      }
    }

    ExprPtr e = parse_expr();
    if (at_op("=")) {
      fail(peek().line, "cannot assign to expression");
    }
    return std::make_shared<ExprStmt>(e, line);
  }

  static bool augmented_op(const std::string& op, BOp& out) {
    if (op == "+=") out = BOp::ADD;
    else if (op == "-=") out = BOp::SUB;
    else if (op == "*=") out = BOp::MUL;
    else if (op == "/=") out = BOp::DIV;
    else if (op == "//=") out = BOp::FLOORDIV;
    else if (op == "%=") out = BOp::MOD;
    else if (op == "**=") out = BOp::POW;
    else return false;
    return true;
  }

  // Parses `: suite`. body_offset receives the offset of the first body token.
  Block parse_block(std::size_t* body_offset = nullptr, std::size_t* body_token = nullptr) {
    const NestingGuard guard(nesting_);
    check_nesting(peek().line);
    expect_op(":");
    Block b;
    if (!at(TokKind::Newline)) {
      if (body_offset != nullptr) *body_offset = peek().offset;
      if (body_token != nullptr) *body_token = pos_;
      parse_simple_statements(b.stmts);
      return b;
    }
    advance();
    if (!at(TokKind::Indent)) {
      fail(peek().line, "expected an indented block");
    }
    advance();
    if (body_offset != nullptr) *body_offset = peek().offset;
    if (body_token != nullptr) *body_token = pos_;
    while (!at(TokKind::Dedent) && !at(TokKind::End)) {
      parse_statement(b.stmts);
    }
    if (at(TokKind::Dedent)) {
      advance();
    }
    return b;
  }

  // Skips a type annotation up to one of the stop operators at bracket depth 0.
  void skip_annotation(const std::vector<std::string>& stops) {
    int depth = 0;
    bool any = false;
    while (true) {
      const Token& t = peek();
      if (t.kind == TokKind::Newline || t.kind == TokKind::End || t.kind == TokKind::Indent ||
          t.kind == TokKind::Dedent) {
        fail(t.line, "invalid syntax");
      }
      if (t.kind == TokKind::Op) {
        if (depth == 0) {
          for (const std::string& s : stops) {
            if (t.text == s) {
              if (!any) fail(t.line, "invalid syntax");
              return;
            }
          }
        }
        if (t.text == "(" || t.text == "[" || t.text == "{") depth++;
        if (t.text == ")" || t.text == "]" || t.text == "}") depth--;
      }
      any = true;
      advance();
    }
  }

  StmtPtr parse_def() {
    const int line = advance().line;
    if (function_depth_ > 0) {
      fail(line, "nested function definitions are not supported");
    }
    const std::string name = expect_name();
    expect_op("(");
    const std::size_t params_start = peek().offset;
    std::vector<Param> params;
    while (!at_op(")")) {
      Param p;
      p.name = expect_name();
      for (const Param& other : params) {
        if (other.name == p.name) {
          fail(line, "duplicate argument '" + p.name + "' in function definition");
        }
      }
      if (at_op(":")) {
        advance();
        skip_annotation({",", ")", "="});
      }
      if (at_op("=")) {
        advance();
        p.default_value = parse_expr();
      } else if (!params.empty() && params.back().default_value) {
        fail(line, "non-default argument follows default argument");
      }
      params.push_back(std::move(p));
      if (!at_op(",")) break;
      advance();
    }
    const std::size_t params_end = peek().offset;
    expect_op(")");

    std::string return_annotation;
    if (at_op("->")) {
      advance();
      const std::size_t ann_start = peek().offset;
      skip_annotation({":"});
      return_annotation = trim(text_.substr(ann_start, peek().offset - ann_start));
    }

    function_depth_++;
    const bool inline_body = !at_op(":") || peek(1).kind != TokKind::Newline;
    std::size_t body_offset = 0;
    std::size_t body_token = 0;
    Block body = parse_block(&body_offset, &body_token);
    function_depth_--;

    auto def = std::make_shared<FunctionDefStmt>(name, std::move(params), std::move(body), line);
    def->params_text = trim(text_.substr(params_start, params_end - params_start));
    def->return_annotation = return_annotation;
    def->end_line = prev_end_line_;
    def->end_offset = prev_end_offset_;
    def->body_offset = body_offset;
    def->inline_body = inline_body;
    if (!def->body.stmts.empty()) {
      const auto* first = as<ExprStmt>(def->body.stmts.front());
      if (first != nullptr) {
        const auto* c = as<ConstExpr>(first->e);
        if (c != nullptr && c->value.tag == ValueTag::Str && tokens_[body_token].kind == TokKind::Str) {
          std::size_t last = body_token;
          while (last + 1 < tokens_.size() && tokens_[last + 1].kind == TokKind::Str) last++;
          def->docstring_end_line = tokens_[last].end_line;
        }
      }
    }
    return def;
  }

  StmtPtr parse_if() {
    const int line = advance().line;
    ExprPtr cond = parse_expr();
    Block then_block = parse_block();
    Block else_block;
    if (at_name("elif")) {
      const NestingGuard guard(nesting_);
      check_nesting(peek().line);
      else_block.stmts.push_back(parse_if());
    } else if (at_name("else")) {
      advance();
      else_block = parse_block();
    }
    return std::make_shared<IfStmtNode>(cond, std::move(then_block), std::move(else_block), line);
  }

  StmtPtr parse_while() {
    const int line = advance().line;
    ExprPtr cond = parse_expr();
    loop_depth_++;
    Block body = parse_block();
    loop_depth_--;
    return std::make_shared<WhileStmt>(cond, std::move(body), line);
  }

  StmtPtr parse_for() {
    const int line = advance().line;
    const std::string var = expect_name();
    expect_keyword("in");
    if (!at_name("range")) {
      fail(peek().line, "only 'for ... in range(...)' loops are supported");
    }
    advance();
    expect_op("(");
    ExprPtr first = parse_expr();
    ExprPtr second;
    if (at_op(",")) {
      advance();
      second = parse_expr();
    }
    expect_op(")");
    loop_depth_++;
    Block body = parse_block();
    loop_depth_--;
    if (second) {
      return std::make_shared<ForRangeStmt>(var, first, second, std::move(body), line);
    }
    return std::make_shared<ForRangeStmt>(var, nullptr, first, std::move(body), line);
  }

  ExprPtr parse_expr() {
    const NestingGuard guard(nesting_);
    check_nesting(peek().line);
    ExprPtr e = parse_or();
    if (at_name("if")) {
      const int line = advance().line;
      ExprPtr cond = parse_or();
      expect_keyword("else");
      ExprPtr else_e = parse_expr();
      const int d = std::max({e->depth, cond->depth, else_e->depth});
      return with_depth(std::make_shared<IfExprNode>(cond, e, else_e, line), d);
    }
    return e;
  }

  ExprPtr parse_or() {
    ExprPtr e = parse_and();
    while (at_name("or")) {
      const int line = advance().line;
      e = binary(BOp::OR, e, parse_and(), line);
    }
    return e;
  }

  ExprPtr parse_and() {
    ExprPtr e = parse_not();
    while (at_name("and")) {
      const int line = advance().line;
      e = binary(BOp::AND, e, parse_not(), line);
    }
    return e;
  }

  ExprPtr parse_not() {
    if (at_name("not")) {
      const NestingGuard guard(nesting_);
      const int line = advance().line;
      check_nesting(line);
      return unary(UOp::NOT, parse_not(), line);
    }
    return parse_comparison();
  }

  bool comparison_op(BOp& out) const {
    if (peek().kind != TokKind::Op) return false;
    const std::string& op = peek().text;
    if (op == "<") out = BOp::LT;
    else if (op == "<=") out = BOp::LE;
    else if (op == ">") out = BOp::GT;
    else if (op == ">=") out = BOp::GE;
    else if (op == "==") out = BOp::EQ;
    else if (op == "!=") out = BOp::NE;
    else return false;
    return true;
  }

  ExprPtr parse_comparison() {
    ExprPtr a = parse_arith();
    BOp op = BOp::EQ;
    if (!comparison_op(op)) {
      return a;
    }
    const int line = advance().line;
    ExprPtr b = parse_arith();
    if (comparison_op(op)) {
      fail(peek().line, "chained comparisons are not supported");
    }
    return binary(op, a, b, line);
  }

  ExprPtr parse_arith() {
    ExprPtr e = parse_term();
    while (at_op("+") || at_op("-")) {
      const BOp op = at_op("+") ? BOp::ADD : BOp::SUB;
      const int line = advance().line;
      e = binary(op, e, parse_term(), line);
    }
    return e;
  }

  ExprPtr parse_term() {
    ExprPtr e = parse_factor();
    while (true) {
      BOp op = BOp::MUL;
      if (at_op("*")) op = BOp::MUL;
      else if (at_op("/")) op = BOp::DIV;
      else if (at_op("//")) op = BOp::FLOORDIV;
      else if (at_op("%")) op = BOp::MOD;
      else break;
      const int line = advance().line;
      e = binary(op, e, parse_factor(), line);
    }
    return e;
  }

  ExprPtr parse_factor() {
    if (at_op("-") || at_op("+")) {
      const NestingGuard guard(nesting_);
      const UOp op = at_op("-") ? UOp::NEG : UOp::POS;
      const int line = advance().line;
      check_nesting(line);
      return unary(op, parse_factor(), line);
    }
    return parse_power();
  }

  ExprPtr parse_power() {
    ExprPtr base = parse_atom();
    if (at_op("**")) {
      const int line = advance().line;
      const NestingGuard guard(nesting_);
      check_nesting(line);
      return binary(BOp::POW, base, parse_factor(), line);
    }
    return base;
  }

  ExprPtr parse_atom() {
    const Token& t = peek();
    const int line = t.line;
    if (t.kind == TokKind::Int) {
      const std::string spelling = advance().text;
      try {
        return std::make_shared<ConstExpr>(Value::from_int(std::stoll(spelling)), line);
      } catch (const std::out_of_range&) {
        fail(line, "integer literal too large");
      }
    }
    if (t.kind == TokKind::Float) {
      const std::string spelling = advance().text;
      try {
        return std::make_shared<ConstExpr>(Value::from_float(std::stod(spelling)), line);
      } catch (const std::out_of_range&) {
        fail(line, "float literal out of range");
      }
    }
    if (t.kind == TokKind::Str) {
      std::string s = advance().text;
      while (at(TokKind::Str)) {
        s += advance().text;
      }
      return std::make_shared<ConstExpr>(Value::from_str(std::move(s)), line);
    }
    if (t.kind == TokKind::Name) {
      if (t.text == "True" || t.text == "False") {
        const bool v = t.text == "True";
        advance();
        return std::make_shared<ConstExpr>(Value::from_bool(v), line);
      }
      if (t.text == "None") {
        advance();
        return std::make_shared<ConstExpr>(Value::none(), line);
      }
      if (is_keyword(t.text)) {
        fail(line, "invalid syntax");
      }
      const std::string name = advance().text;
      if (!at_op("(")) {
        return std::make_shared<VarExpr>(name, line);
      }
      advance();
      std::vector<ExprPtr> args;
      int d = 0;
      while (!at_op(")")) {
        args.push_back(parse_expr());
        d = std::max(d, args.back()->depth);
        if (at_op("=")) {
          fail(peek().line, "keyword arguments are not supported");
        }
        if (!at_op(",")) break;
        advance();
      }
      expect_op(")");
      return with_depth(std::make_shared<CallExpr>(name, std::move(args), line), d);
    }
    if (t.kind == TokKind::Op && t.text == "(") {
      advance();
      ExprPtr e = parse_expr();
      expect_op(")");
      return e;
    }
    fail(line, "invalid syntax");
  }

  const std::string& text_;
  std::vector<Token> tokens_;
  std::size_t pos_ = 0;
  int prev_end_line_ = 0;
  std::size_t prev_end_offset_ = 0;
  int function_depth_ = 0;
  int loop_depth_ = 0;
  int nesting_ = 0;
};

}  // namespace

Module parse_module(const std::string& text) {
  Parser parser(text, tokenize(text));
  return parser.parse();
}

std::optional<int> find_function_end_line(const Module& module, const std::string& function_name) {
  std::optional<int> out;
  for (const StmtPtr& st : module.body.stmts) {
    if (const auto* def = as<FunctionDefStmt>(st)) {
      if (def->name == function_name) {
        out = def->end_line;
      }
    }
  }
  return out;
}

}  // namespace progeval
