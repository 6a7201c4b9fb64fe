#include "progeval/program.hpp"

#include <cstddef>
#include <sstream>
#include <utility>

#include "progeval/ast.hpp"
#include "progeval/errors.hpp"
#include "progeval/lexer.hpp"
#include "progeval/parser.hpp"

namespace progeval {

namespace {

std::vector<std::string> split_lines(const std::string& text) {
  std::vector<std::string> lines;
  std::istringstream in(text);
  std::string line;
  while (std::getline(in, line)) {
    lines.push_back(line);
  }
  return lines;
}

std::string join_lines(const std::vector<std::string>& lines, std::size_t begin, std::size_t end) {
  std::string out;
  for (std::size_t i = begin; i < end && i < lines.size(); ++i) {
    if (i > begin) out += "\n";
    out += lines[i];
  }
  return out;
}

std::string rstrip(std::string s) {
  while (!s.empty() && (s.back() == '\n' || s.back() == ' ' || s.back() == '\t' || s.back() == '\r')) {
    s.pop_back();
  }
  return s;
}

// Leading whitespace of the first non-blank line; empty when that line starts
// at column 0 or there is no such line.
std::string leading_indent(const std::string& body) {
  for (const std::string& line : split_lines(body)) {
    const std::size_t first = line.find_first_not_of(" \t\r");
    if (first == std::string::npos) continue;
    return line.substr(0, first);
  }
  return std::string();
}

std::string indent_lines(const std::string& body, const std::string& indent) {
  std::string out;
  std::size_t start = 0;
  while (start <= body.size()) {
    std::size_t end = body.find('\n', start);
    const bool last = end == std::string::npos;
    if (last) end = body.size();
    const std::string line = body.substr(start, end - start);
    if (!line.empty()) out += indent;
    out += line;
    if (last) break;
    out += "\n";
    start = end + 1;
  }
  return out;
}

void collect_calls(const ExprPtr& e, std::set<std::string>& out);

void collect_calls(const Block& b, std::set<std::string>& out) {
  for (const StmtPtr& st : b.stmts) {
    if (const auto* assign = as<AssignStmt>(st)) {
      collect_calls(assign->e, out);
    } else if (const auto* ret = as<ReturnStmt>(st)) {
      if (ret->e) collect_calls(ret->e, out);
    } else if (const auto* es = as<ExprStmt>(st)) {
      collect_calls(es->e, out);
    } else if (const auto* ifs = as<IfStmtNode>(st)) {
      collect_calls(ifs->cond, out);
      collect_calls(ifs->then_block, out);
      collect_calls(ifs->else_block, out);
    } else if (const auto* wh = as<WhileStmt>(st)) {
      collect_calls(wh->cond, out);
      collect_calls(wh->body, out);
    } else if (const auto* fr = as<ForRangeStmt>(st)) {
      if (fr->start) collect_calls(fr->start, out);
      collect_calls(fr->stop, out);
      collect_calls(fr->body, out);
    } else if (const auto* def = as<FunctionDefStmt>(st)) {
      for (const Param& p : def->params) {
        if (p.default_value) collect_calls(p.default_value, out);
      }
      collect_calls(def->body, out);
    }
  }
}

void collect_calls(const ExprPtr& e, std::set<std::string>& out) {
  if (const auto* u = as<UnaryExpr>(e)) {
    collect_calls(u->e, out);
  } else if (const auto* b = as<BinaryExpr>(e)) {
    collect_calls(b->a, out);
    collect_calls(b->b, out);
  } else if (const auto* ife = as<IfExprNode>(e)) {
    collect_calls(ife->cond, out);
    collect_calls(ife->then_e, out);
    collect_calls(ife->else_e, out);
  } else if (const auto* call = as<CallExpr>(e)) {
    out.insert(call->name);
    for (const ExprPtr& arg : call->args) {
      collect_calls(arg, out);
    }
  }
}

}  // namespace

std::string Function::to_string() const {
  std::string out = "def " + name + "(" + args + ")";
  if (!return_type.empty()) {
    out += " -> " + return_type;
  }
  out += ":\n";
  // The docstring sits at the body's own indent; a body at column 0 is shifted
  // to the indent recorded from the source.
  std::string block_indent = leading_indent(body);
  std::string block = body;
  if (block_indent.empty()) {
    block_indent = indent.empty() ? std::string(kDefaultIndent) : indent;
    block = indent_lines(body, block_indent);
  }
  if (!docstring.empty()) {
    out += block_indent + "\"\"\"" + docstring + "\"\"\"";
    if (!body.empty()) out += "\n";
  }
  out += block;
  out += "\n\n";
  return out;
}

Function& Program::get_function(const std::string& name) {
  for (Function& f : functions) {
    if (f.name == name) {
      return f;
    }
  }
  throw ConfigError("function '" + name + "' does not exist in the program");
}

const Function& Program::get_function(const std::string& name) const {
  for (const Function& f : functions) {
    if (f.name == name) {
      return f;
    }
  }
  throw ConfigError("function '" + name + "' does not exist in the program");
}

std::string Program::to_string() const {
  std::string out = preface.empty() ? std::string() : preface + "\n\n";
  for (std::size_t i = 0; i < functions.size(); ++i) {
    if (i > 0) out += "\n";
    out += functions[i].to_string();
  }
  return out;
}

Program text_to_program(const std::string& text) {
  const Module module = parse_module(text);
  const std::vector<std::string> lines = split_lines(text);

  Program program;
  bool seen_function = false;
  for (const StmtPtr& st : module.body.stmts) {
    const auto* def = as<FunctionDefStmt>(st);
    if (def == nullptr) {
      if (seen_function) {
        throw ConfigError("line " + std::to_string(st->line) +
                          ": module-level statements after the first function are not supported");
      }
      continue;
    }
    if (!seen_function) {
      program.preface = rstrip(join_lines(lines, 0, static_cast<std::size_t>(def->line - 1)));
      seen_function = true;
    }
    for (const Function& existing : program.functions) {
      if (existing.name == def->name) {
        throw ConfigError("function '" + def->name + "' is defined more than once");
      }
    }

    Function f;
    f.name = def->name;
    f.args = def->params_text;
    f.return_type = def->return_annotation;

    if (!def->inline_body) {
      const std::size_t first_line = static_cast<std::size_t>(def->body.stmts.front()->line);
      if (first_line >= 1 && first_line <= lines.size()) {
        const std::string indent = leading_indent(lines[first_line - 1]);
        if (!indent.empty()) f.indent = indent;
      }
    }

    int body_start_line = 0;
    if (def->docstring_end_line > 0) {
      const auto* first = as<ExprStmt>(def->body.stmts.front());
      f.docstring = as<ConstExpr>(first->e)->value.s;
      body_start_line = def->docstring_end_line;
    } else {
      const int first_line = def->body.stmts.front()->line;
      body_start_line = first_line - 1;
    }

    if (def->inline_body) {
      if (def->docstring_end_line == 0) {
        f.body = text.substr(def->body_offset, def->end_offset - def->body_offset);
      }
    } else {
      f.body = join_lines(lines, static_cast<std::size_t>(body_start_line), static_cast<std::size_t>(def->end_line));
    }
    program.functions.push_back(std::move(f));
  }
  if (!seen_function) {
    program.preface = rstrip(text);
  }
  return program;
}

std::string rename_function_calls(const std::string& code, const std::string& source_name,
                                  const std::string& target_name) {
  if (code.find(source_name) == std::string::npos) {
    return code;
  }
  const std::vector<Token> tokens = tokenize_flat(code);
  std::string out;
  std::size_t copied = 0;
  for (std::size_t i = 0; i + 1 < tokens.size(); ++i) {
    const Token& t = tokens[i];
    const Token& next = tokens[i + 1];
    if (t.kind == TokKind::Name && t.text == source_name && next.kind == TokKind::Op && next.text == "(") {
      out.append(code, copied, t.offset - copied);
      out += target_name;
      copied = t.end_offset;
    }
  }
  out.append(code, copied, std::string::npos);
  return out;
}

std::set<std::string> get_functions_called(const std::string& code) {
  const Module module = parse_module(code);
  std::set<std::string> out;
  collect_calls(module.body, out);
  return out;
}

}  // namespace progeval
