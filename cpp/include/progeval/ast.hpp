#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "progeval/value.hpp"

namespace progeval {

enum class UOp {
  NEG,
  POS,
  NOT,
};

enum class BOp {
  ADD,
  SUB,
  MUL,
  DIV,
  FLOORDIV,
  MOD,
  POW,
  LT,
  LE,
  GT,
  GE,
  EQ,
  NE,
  AND,
  OR,
};

struct Expr;
struct Stmt;

using ExprPtr = std::shared_ptr<Expr>;
using StmtPtr = std::shared_ptr<Stmt>;

struct Block {
  std::vector<StmtPtr> stmts;
};

struct Expr {
  enum class Kind {
    Const,
    Var,
    Unary,
    Binary,
    IfExpr,
    Call,
  };

  Expr(Kind kind, int line) : kind(kind), line(line) {}
  virtual ~Expr() = default;

  Kind kind;
  int line;
  // Height of the subtree rooted here; leaves are 1.
  int depth = 1;
};

struct Stmt {
  enum class Kind {
    Assign,
    IfStmt,
    While,
    ForRange,
    Return,
    ExprStmt,
    Pass,
    Break,
    Continue,
    FunctionDef,
  };

  Stmt(Kind kind, int line) : kind(kind), line(line) {}
  virtual ~Stmt() = default;

  Kind kind;
  int line;
};

struct ConstExpr final : Expr {
  ConstExpr(Value value, int line) : Expr(Kind::Const, line), value(std::move(value)) {}
  Value value;
};

struct VarExpr final : Expr {
  VarExpr(std::string name, int line) : Expr(Kind::Var, line), name(std::move(name)) {}
  std::string name;
};

struct UnaryExpr final : Expr {
  UnaryExpr(UOp op, ExprPtr e, int line) : Expr(Kind::Unary, line), op(op), e(std::move(e)) {}
  UOp op;
  ExprPtr e;
};

struct BinaryExpr final : Expr {
  BinaryExpr(BOp op, ExprPtr a, ExprPtr b, int line)
      : Expr(Kind::Binary, line), op(op), a(std::move(a)), b(std::move(b)) {}
  BOp op;
  ExprPtr a;
  ExprPtr b;
};

struct IfExprNode final : Expr {
  IfExprNode(ExprPtr cond, ExprPtr then_e, ExprPtr else_e, int line)
      : Expr(Kind::IfExpr, line), cond(std::move(cond)), then_e(std::move(then_e)), else_e(std::move(else_e)) {}
  ExprPtr cond;
  ExprPtr then_e;
  ExprPtr else_e;
};

// Calls are by name only; the callee is resolved at run time against the module
// functions first and the builtins second.
struct CallExpr final : Expr {
  CallExpr(std::string name, std::vector<ExprPtr> args, int line)
      : Expr(Kind::Call, line), name(std::move(name)), args(std::move(args)) {}
  std::string name;
  std::vector<ExprPtr> args;
};

struct AssignStmt final : Stmt {
  AssignStmt(std::string name, ExprPtr e, int line) : Stmt(Kind::Assign, line), name(std::move(name)), e(std::move(e)) {}
  std::string name;
  ExprPtr e;
};

struct IfStmtNode final : Stmt {
  IfStmtNode(ExprPtr cond, Block then_block, Block else_block, int line)
      : Stmt(Kind::IfStmt, line), cond(std::move(cond)), then_block(std::move(then_block)), else_block(std::move(else_block)) {}
  ExprPtr cond;
  Block then_block;
  Block else_block;
};

struct WhileStmt final : Stmt {
  WhileStmt(ExprPtr cond, Block body, int line) : Stmt(Kind::While, line), cond(std::move(cond)), body(std::move(body)) {}
  ExprPtr cond;
  Block body;
};

// for var in range(start, stop); start is null for the one-argument form.
struct ForRangeStmt final : Stmt {
  ForRangeStmt(std::string var, ExprPtr start, ExprPtr stop, Block body, int line)
      : Stmt(Kind::ForRange, line), var(std::move(var)), start(std::move(start)), stop(std::move(stop)), body(std::move(body)) {}
  std::string var;
  ExprPtr start;
  ExprPtr stop;
  Block body;
};

// e is null for a bare `return`.
struct ReturnStmt final : Stmt {
  ReturnStmt(ExprPtr e, int line) : Stmt(Kind::Return, line), e(std::move(e)) {}
  ExprPtr e;
};

struct ExprStmt final : Stmt {
  ExprStmt(ExprPtr e, int line) : Stmt(Kind::ExprStmt, line), e(std::move(e)) {}
  ExprPtr e;
};

struct PassStmt final : Stmt {
  explicit PassStmt(int line) : Stmt(Kind::Pass, line) {}
};

struct BreakStmt final : Stmt {
  explicit BreakStmt(int line) : Stmt(Kind::Break, line) {}
};

struct ContinueStmt final : Stmt {
  explicit ContinueStmt(int line) : Stmt(Kind::Continue, line) {}
};

struct Param {
  std::string name;
  ExprPtr default_value;
};

// Besides the parsed body, a definition remembers where its pieces sit in the
// source so the program model can slice the original text back out.
struct FunctionDefStmt final : Stmt {
  FunctionDefStmt(std::string name, std::vector<Param> params, Block body, int line)
      : Stmt(Kind::FunctionDef, line), name(std::move(name)), params(std::move(params)), body(std::move(body)) {}
  std::string name;
  std::vector<Param> params;
  Block body;
  std::string params_text;
  std::string return_annotation;
  int end_line = 0;
  int docstring_end_line = 0;
  std::size_t body_offset = 0;
  std::size_t end_offset = 0;
  bool inline_body = false;
};

struct Module {
  Block body;
};

template <typename T>
const T* as(const ExprPtr& e) {
  return dynamic_cast<const T*>(e.get());
}

template <typename T>
const T* as(const StmtPtr& s) {
  return dynamic_cast<const T*>(s.get());
}

}  // namespace progeval
