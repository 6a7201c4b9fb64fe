#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "progeval/bytecode.hpp"
#include "progeval/errors.hpp"

namespace progeval {

namespace {

const char* bop_name(BOp op) {
  switch (op) {
    case BOp::ADD:
      return "ADD";
    case BOp::SUB:
      return "SUB";
    case BOp::MUL:
      return "MUL";
    case BOp::DIV:
      return "DIV";
    case BOp::FLOORDIV:
      return "FLOORDIV";
    case BOp::MOD:
      return "MOD";
    case BOp::POW:
      return "POW";
    case BOp::LT:
      return "LT";
    case BOp::LE:
      return "LE";
    case BOp::GT:
      return "GT";
    case BOp::GE:
      return "GE";
    case BOp::EQ:
      return "EQ";
    case BOp::NE:
      return "NE";
    case BOp::AND:
      return "AND";
    case BOp::OR:
      return "OR";
  }
  return "ADD";
}

const char* uop_name(UOp op) {
  if (op == UOp::NEG) return "NEG";
  if (op == UOp::POS) return "POS";
  return "NOT";
}

void collect_assigned(const Block& b, std::vector<std::string>& out) {
  for (const StmtPtr& st : b.stmts) {
    if (const auto* assign = as<AssignStmt>(st)) {
      out.push_back(assign->name);
    } else if (const auto* fr = as<ForRangeStmt>(st)) {
      out.push_back(fr->var);
      collect_assigned(fr->body, out);
    } else if (const auto* ifs = as<IfStmtNode>(st)) {
      collect_assigned(ifs->then_block, out);
      collect_assigned(ifs->else_block, out);
    } else if (const auto* wh = as<WhileStmt>(st)) {
      collect_assigned(wh->body, out);
    }
  }
}

// Parameter defaults are evaluated once at definition time; only literals and
// signed numeric literals are accepted.
Value constant_default(const ExprPtr& e, int line) {
  if (const auto* c = as<ConstExpr>(e)) {
    return c->value;
  }
  if (const auto* u = as<UnaryExpr>(e)) {
    const auto* c = as<ConstExpr>(u->e);
    if (c != nullptr && is_numeric(c->value) && u->op != UOp::NOT) {
      if (u->op == UOp::POS) return c->value;
      if (c->value.tag == ValueTag::Float) return Value::from_float(-c->value.f);
      return Value::from_int(-c->value.i);
    }
  }
  throw ParseError(line, "parameter defaults must be constants");
}

class Compiler {
 public:
  // is_function selects local-variable scoping; the module initialiser stores
  // every name as a global.
  Compiler(std::string name, bool is_function) : name_(std::move(name)), is_function_(is_function) {}

  BytecodeProgram build_function(const FunctionDefStmt& def) {
    line_ = def.line;
    for (const Param& p : def.params) {
      local(p.name);
      if (p.default_value) {
        defaults_.push_back(constant_default(p.default_value, def.line));
      }
    }
    std::vector<std::string> assigned;
    collect_assigned(def.body, assigned);
    for (const std::string& name : assigned) {
      local(name);
    }
    compile_block(def.body);
    emit_implicit_return();
    patch_jumps();
    BytecodeProgram out = finalize();
    out.n_params = static_cast<int>(def.params.size());
    out.line = def.line;
    return out;
  }

  BytecodeProgram build_init(const Block& b) {
    for (const StmtPtr& st : b.stmts) {
      if (as<FunctionDefStmt>(st) == nullptr) {
        compile_stmt(st);
      }
    }
    emit_implicit_return();
    patch_jumps();
    return finalize();
  }

 private:
  struct UnresolvedJump {
    int index = 0;
    std::string label;
  };

  struct LoopLabels {
    std::string continue_label;
    std::string break_label;
  };

  BytecodeProgram finalize() {
    BytecodeProgram out;
    out.name = name_;
    out.consts = consts_;
    out.code = code_;
    out.names = names_;
    out.n_locals = static_cast<int>(var2idx_.size());
    out.defaults = defaults_;
    out.var2idx = var2idx_;
    return out;
  }

  int add_const(const Value& v) {
    consts_.push_back(v);
    return static_cast<int>(consts_.size()) - 1;
  }

  int add_name(const std::string& name) {
    auto it = name_index_.find(name);
    if (it != name_index_.end()) {
      return it->second;
    }
    const int idx = static_cast<int>(names_.size());
    names_.push_back(name);
    name_index_[name] = idx;
    return idx;
  }

  int local(const std::string& name) {
    auto it = var2idx_.find(name);
    if (it != var2idx_.end()) {
      return it->second;
    }
    const int idx = static_cast<int>(var2idx_.size());
    var2idx_[name] = idx;
    return idx;
  }

  bool is_local(const std::string& name) const { return is_function_ && var2idx_.count(name) != 0; }

  std::string new_label(const std::string& prefix) {
    return prefix + "_" + std::to_string(label_counter_++);
  }

  // Hidden loop slots; '$' keeps them apart from every source identifier.
  std::string new_temp() { return "$for_" + std::to_string(tmp_counter_++); }

  void emit(const std::string& op, int a = 0, bool has_a = false, int b = 0, bool has_b = false) {
    code_.push_back(Instr{op, a, b, has_a, has_b, line_});
  }

  void emit_jump(const std::string& op, const std::string& label) {
    emit(op, 0, true, 0, false);
    unresolved_.push_back({static_cast<int>(code_.size()) - 1, label});
  }

  void mark_label(const std::string& name) { labels_[name] = static_cast<int>(code_.size()); }

  void patch_jumps() {
    for (const auto& j : unresolved_) {
      auto it = labels_.find(j.label);
      if (it == labels_.end()) {
        throw std::runtime_error("undefined label");
      }
      code_[static_cast<std::size_t>(j.index)].a = it->second;
      code_[static_cast<std::size_t>(j.index)].has_a = true;
    }
  }

  void emit_implicit_return() {
    emit("PUSH_CONST", add_const(Value::none()), true);
    emit("RETURN");
  }

  void emit_load(const std::string& name) {
    if (is_local(name)) {
      emit("LOAD", local(name), true);
    } else {
      emit("LOAD_GLOBAL", add_name(name), true);
    }
  }

  void emit_store(const std::string& name) {
    if (is_function_) {
      emit("STORE", local(name), true);
    } else {
      emit("STORE_GLOBAL", add_name(name), true);
    }
  }

  void compile_block(const Block& b) {
    for (const StmtPtr& st : b.stmts) {
      compile_stmt(st);
    }
  }

  void compile_expr(const ExprPtr& e) {
    line_ = e->line;
    if (const auto* c = as<ConstExpr>(e)) {
      emit("PUSH_CONST", add_const(c->value), true);
      return;
    }
    if (const auto* v = as<VarExpr>(e)) {
      emit_load(v->name);
      return;
    }
    if (const auto* u = as<UnaryExpr>(e)) {
      compile_expr(u->e);
      line_ = u->line;
      emit(uop_name(u->op));
      return;
    }
    if (const auto* b = as<BinaryExpr>(e)) {
      if (b->op == BOp::AND || b->op == BOp::OR) {
        // Short-circuit: the result is the deciding operand itself.
        const std::string end_l = new_label(b->op == BOp::AND ? "and_end" : "or_end");
        compile_expr(b->a);
        emit("DUP");
        emit_jump(b->op == BOp::AND ? "JMP_IF_FALSE" : "JMP_IF_TRUE", end_l);
        emit("POP");
        compile_expr(b->b);
        mark_label(end_l);
        return;
      }
      compile_expr(b->a);
      compile_expr(b->b);
      line_ = b->line;
      emit(bop_name(b->op));
      return;
    }
    if (const auto* ife = as<IfExprNode>(e)) {
      const std::string else_l = new_label("ifexpr_else");
      const std::string end_l = new_label("ifexpr_end");
      compile_expr(ife->cond);
      emit_jump("JMP_IF_FALSE", else_l);
      compile_expr(ife->then_e);
      emit_jump("JMP", end_l);
      mark_label(else_l);
      compile_expr(ife->else_e);
      mark_label(end_l);
      return;
    }
    if (const auto* call = as<CallExpr>(e)) {
      for (const ExprPtr& arg : call->args) {
        compile_expr(arg);
      }
      line_ = call->line;
      emit("CALL", add_name(call->name), true, static_cast<int>(call->args.size()), true);
      return;
    }

    throw std::runtime_error("unknown Expr node");
  }

  void compile_stmt(const StmtPtr& st) {
    line_ = st->line;
    if (const auto* assign = as<AssignStmt>(st)) {
      compile_expr(assign->e);
      line_ = st->line;
      emit_store(assign->name);
      return;
    }
    if (const auto* ret = as<ReturnStmt>(st)) {
      if (ret->e) {
        compile_expr(ret->e);
      } else {
        emit("PUSH_CONST", add_const(Value::none()), true);
      }
      line_ = st->line;
      emit("RETURN");
      return;
    }
    if (const auto* es = as<ExprStmt>(st)) {
      compile_expr(es->e);
      emit("POP");
      return;
    }
    if (as<PassStmt>(st) != nullptr) {
      return;
    }
    if (as<BreakStmt>(st) != nullptr) {
      if (loops_.empty()) {
        throw ParseError(st->line, "'break' outside loop");
      }
      emit_jump("JMP", loops_.back().break_label);
      return;
    }
    if (as<ContinueStmt>(st) != nullptr) {
      if (loops_.empty()) {
        throw ParseError(st->line, "'continue' outside loop");
      }
      emit_jump("JMP", loops_.back().continue_label);
      return;
    }
    if (const auto* ifs = as<IfStmtNode>(st)) {
      const std::string else_l = new_label("if_else");
      const std::string end_l = new_label("if_end");
      compile_expr(ifs->cond);
      emit_jump("JMP_IF_FALSE", else_l);
      compile_block(ifs->then_block);
      emit_jump("JMP", end_l);
      mark_label(else_l);
      compile_block(ifs->else_block);
      mark_label(end_l);
      return;
    }
    if (const auto* wh = as<WhileStmt>(st)) {
      const std::string loop_l = new_label("while_loop");
      const std::string end_l = new_label("while_end");
      mark_label(loop_l);
      compile_expr(wh->cond);
      emit_jump("JMP_IF_FALSE", end_l);
      loops_.push_back({loop_l, end_l});
      compile_block(wh->body);
      loops_.pop_back();
      emit_jump("JMP", loop_l);
      mark_label(end_l);
      return;
    }
    if (const auto* fr = as<ForRangeStmt>(st)) {
      const int idx_1 = add_const(Value::from_int(1));
      const std::string counter = new_temp();
      const std::string stop = new_temp();

      const std::string loop_l = new_label("for_loop");
      const std::string next_l = new_label("for_next");
      const std::string end_l = new_label("for_end");

      if (fr->start) {
        compile_expr(fr->start);
      } else {
        emit("PUSH_CONST", add_const(Value::from_int(0)), true);
      }
      line_ = st->line;
      emit("RANGE_ARG");
      emit_store(counter);
      compile_expr(fr->stop);
      line_ = st->line;
      emit("RANGE_ARG");
      emit_store(stop);

      mark_label(loop_l);
      emit_load(counter);
      emit_load(stop);
      emit("LT");
      emit_jump("JMP_IF_FALSE", end_l);

      emit_load(counter);
      emit_store(fr->var);

      loops_.push_back({next_l, end_l});
      compile_block(fr->body);
      loops_.pop_back();

      mark_label(next_l);
      line_ = st->line;
      emit_load(counter);
      emit("PUSH_CONST", idx_1, true);
      emit("ADD");
      emit_store(counter);
      emit_jump("JMP", loop_l);
      mark_label(end_l);
      return;
    }

    throw std::runtime_error("unknown Stmt node");
  }

  std::string name_;
  bool is_function_;
  int line_ = 0;
  std::vector<Value> consts_;
  std::vector<Instr> code_;
  std::vector<std::string> names_;
  std::unordered_map<std::string, int> name_index_;
  std::vector<Value> defaults_;
  std::vector<UnresolvedJump> unresolved_;
  std::vector<LoopLabels> loops_;
  std::unordered_map<std::string, int> labels_;
  std::unordered_map<std::string, int> var2idx_;
  int label_counter_ = 0;
  int tmp_counter_ = 0;
};

}  // namespace

CompiledModule compile_module(const Module& module) {
  CompiledModule out;
  for (const StmtPtr& st : module.body.stmts) {
    const auto* def = as<FunctionDefStmt>(st);
    if (def == nullptr) {
      continue;
    }
    Compiler compiler(def->name, true);
    BytecodeProgram fn = compiler.build_function(*def);
    auto it = out.function_index.find(def->name);
    if (it != out.function_index.end()) {
      out.functions[static_cast<std::size_t>(it->second)] = std::move(fn);
    } else {
      out.function_index[def->name] = static_cast<int>(out.functions.size());
      out.functions.push_back(std::move(fn));
    }
  }
  Compiler init("<module>", false);
  out.init = init.build_init(module.body);
  return out;
}

}  // namespace progeval
