#include "progeval/vm.hpp"

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <sstream>
#include <string>
#include <unordered_map>
#include <vector>

#include "progeval/builtins.hpp"
#include "progeval/value_semantics.hpp"

namespace progeval {

namespace {

using vm_semantics::CmpOp;
using vm_semantics::CompareStatus;

constexpr std::size_t kMaxStringLength = std::size_t{1} << 24;

struct LocalSlot {
  bool is_set = false;
  Value value = Value::none();
};

Value as_number(const Value& v) {
  if (v.tag == ValueTag::Bool) {
    return Value::from_int(v.b ? 1 : 0);
  }
  return v;
}

const char* op_symbol(const std::string& op) {
  if (op == "ADD") return "+";
  if (op == "SUB") return "-";
  if (op == "MUL") return "*";
  if (op == "DIV") return "/";
  if (op == "FLOORDIV") return "//";
  if (op == "MOD") return "%";
  if (op == "POW") return "**";
  if (op == "LT") return "<";
  if (op == "LE") return "<=";
  if (op == "GT") return ">";
  if (op == "GE") return ">=";
  if (op == "EQ") return "==";
  if (op == "NE") return "!=";
  return "?";
}

bool cmp_op_from_name(const std::string& op, CmpOp& out) {
  if (op == "LT") out = CmpOp::LT;
  else if (op == "LE") out = CmpOp::LE;
  else if (op == "GT") out = CmpOp::GT;
  else if (op == "GE") out = CmpOp::GE;
  else if (op == "EQ") out = CmpOp::EQ;
  else if (op == "NE") out = CmpOp::NE;
  else return false;
  return true;
}

bool int_pow(std::int64_t base, std::int64_t exp, std::int64_t& out) {
  std::int64_t result = 1;
  while (exp > 0) {
    if (exp & 1) {
      if (__builtin_mul_overflow(result, base, &result)) return false;
    }
    exp >>= 1;
    if (exp > 0 && __builtin_mul_overflow(base, base, &base)) return false;
  }
  out = result;
  return true;
}

bool float_pow(double a, double b, Value& out, Err& err) {
  if (a == 0.0 && b < 0.0) {
    err = Err{ErrCode::ZeroDiv, "0.0 cannot be raised to a negative power"};
    return false;
  }
  if (a < 0.0 && std::isfinite(b) && std::floor(b) != b) {
    err = Err{ErrCode::Value, "math domain error"};
    return false;
  }
  const double r = std::pow(a, b);
  if (std::isinf(r) && std::isfinite(a) && std::isfinite(b)) {
    err = Err{ErrCode::Overflow, "Numerical result out of range"};
    return false;
  }
  out = Value::from_float(r);
  return true;
}

bool string_arith(const std::string& op, const Value& a, const Value& b, Value& out, Err& err, bool& handled) {
  handled = false;
  if (op == "ADD" && a.tag == ValueTag::Str && b.tag == ValueTag::Str) {
    handled = true;
    if (a.s.size() + b.s.size() > kMaxStringLength) {
      err = Err{ErrCode::Value, "string is too long"};
      return false;
    }
    out = Value::from_str(a.s + b.s);
    return true;
  }
  if (op == "MUL" && ((a.tag == ValueTag::Str) != (b.tag == ValueTag::Str))) {
    const Value& s = a.tag == ValueTag::Str ? a : b;
    const Value n = as_number(a.tag == ValueTag::Str ? b : a);
    if (n.tag != ValueTag::Int) {
      return true;
    }
    handled = true;
    if (n.i <= 0 || s.s.empty()) {
      out = Value::from_str("");
      return true;
    }
    if (static_cast<std::uint64_t>(n.i) > kMaxStringLength / s.s.size()) {
      err = Err{ErrCode::Value, "repeated string is too long"};
      return false;
    }
    std::string r;
    r.reserve(s.s.size() * static_cast<std::size_t>(n.i));
    for (std::int64_t k = 0; k < n.i; ++k) r += s.s;
    out = Value::from_str(std::move(r));
    return true;
  }
  return true;
}

bool binary_arith(const std::string& op, const Value& a_in, const Value& b_in, Value& out, Err& err) {
  bool handled = false;
  if (!string_arith(op, a_in, b_in, out, err, handled)) {
    return false;
  }
  if (handled) {
    return true;
  }

  const Value a = as_number(a_in);
  const Value b = as_number(b_in);
  double a_num = 0.0;
  double b_num = 0.0;
  bool any_float = false;
  if (!vm_semantics::to_numeric_pair(a, b, a_num, b_num, any_float)) {
    err = Err{ErrCode::Type, std::string("unsupported operand type(s) for ") + op_symbol(op) + ": '" +
                                 type_name(a_in) + "' and '" + type_name(b_in) + "'"};
    return false;
  }

  if (!any_float) {
    const std::int64_t x = a.i;
    const std::int64_t y = b.i;
    std::int64_t r = 0;
    if (op == "ADD" || op == "SUB" || op == "MUL") {
      bool overflow = false;
      if (op == "ADD") overflow = __builtin_add_overflow(x, y, &r);
      else if (op == "SUB") overflow = __builtin_sub_overflow(x, y, &r);
      else overflow = __builtin_mul_overflow(x, y, &r);
      if (overflow) {
        err = Err{ErrCode::Overflow, "integer overflow"};
        return false;
      }
      out = Value::from_int(r);
      return true;
    }
    if (op == "DIV") {
      if (y == 0) {
        err = Err{ErrCode::ZeroDiv, "division by zero"};
        return false;
      }
      out = Value::from_float(a_num / b_num);
      return true;
    }
    if (op == "FLOORDIV" || op == "MOD") {
      if (y == 0) {
        err = Err{ErrCode::ZeroDiv, op == "MOD" ? "integer modulo by zero" : "integer division or modulo by zero"};
        return false;
      }
      if (y == -1) {
        if (op == "MOD") {
          out = Value::from_int(0);
          return true;
        }
        if (x == std::numeric_limits<std::int64_t>::min()) {
          err = Err{ErrCode::Overflow, "integer overflow"};
          return false;
        }
        out = Value::from_int(-x);
        return true;
      }
      out = Value::from_int(op == "MOD" ? vm_semantics::py_int_mod(x, y) : vm_semantics::py_int_floordiv(x, y));
      return true;
    }
    if (op == "POW") {
      if (y < 0) {
        return float_pow(a_num, b_num, out, err);
      }
      if (!int_pow(x, y, r)) {
        err = Err{ErrCode::Overflow, "integer overflow"};
        return false;
      }
      out = Value::from_int(r);
      return true;
    }
  } else {
    if (op == "ADD") out = Value::from_float(a_num + b_num);
    else if (op == "SUB") out = Value::from_float(a_num - b_num);
    else if (op == "MUL") out = Value::from_float(a_num * b_num);
    else if (op == "POW") return float_pow(a_num, b_num, out, err);
    else if (b_num == 0.0) {
      if (op == "DIV") err = Err{ErrCode::ZeroDiv, "float division by zero"};
      else if (op == "FLOORDIV") err = Err{ErrCode::ZeroDiv, "float floor division by zero"};
      else err = Err{ErrCode::ZeroDiv, "float modulo"};
      return false;
    } else if (op == "DIV") out = Value::from_float(a_num / b_num);
    else if (op == "FLOORDIV") out = Value::from_float(std::floor(a_num / b_num));
    else if (op == "MOD") out = Value::from_float(vm_semantics::py_float_mod(a_num, b_num));
    else {
      err = Err{ErrCode::Type, "unknown arithmetic op: " + op};
      return false;
    }
    return true;
  }

  err = Err{ErrCode::Type, "unknown arithmetic op: " + op};
  return false;
}

bool is_arith(const std::string& op) {
  return op == "ADD" || op == "SUB" || op == "MUL" || op == "DIV" || op == "FLOORDIV" || op == "MOD" ||
         op == "POW";
}

class Machine {
 public:
  Machine(const CompiledModule& module, int fuel) : module_(module), fuel_(fuel) {}

  // Runs `entry` to completion with the given arguments; module globals persist
  // across calls on the same machine.
  VMResult run(const BytecodeProgram& entry, const std::vector<Value>& args) {
    frames_.clear();
    stack_.clear();
    Err err{ErrCode::Value, ""};
    if (!push_frame(entry, args, err)) {
      return fault(err);
    }

    while (true) {
      Frame& frame = frames_.back();
      const BytecodeProgram& program = *frame.program;
      if (frame.ip < 0 || frame.ip >= static_cast<int>(program.code.size())) {
        return fault(Err{ErrCode::Value, "program finished without return"});
      }
      if (fuel_ >= 0) {
        if (fuel_ == 0) {
          frame.ip += 1;
          return fault(Err{ErrCode::Timeout, "out of fuel"});
        }
        fuel_ -= 1;
      }

      const Instr& ins = program.code[static_cast<std::size_t>(frame.ip)];
      frame.ip += 1;
      const std::string& op = ins.op;

      if (op == "PUSH_CONST") {
        if (!ins.has_a || ins.a < 0 || ins.a >= static_cast<int>(program.consts.size())) {
          return fault(Err{ErrCode::Value, "const index out of range"});
        }
        stack_.push_back(program.consts[static_cast<std::size_t>(ins.a)]);
        continue;
      }

      if (op == "LOAD") {
        if (!ins.has_a || ins.a < 0 || ins.a >= static_cast<int>(frame.locals.size())) {
          return fault(Err{ErrCode::Name, "local index out of range"});
        }
        const LocalSlot& slot = frame.locals[static_cast<std::size_t>(ins.a)];
        if (!slot.is_set) {
          return fault(Err{ErrCode::Name, "local variable '" + local_name(program, ins.a) +
                                              "' referenced before assignment"});
        }
        stack_.push_back(slot.value);
        continue;
      }

      if (op == "STORE") {
        if (!ins.has_a || ins.a < 0 || ins.a >= static_cast<int>(frame.locals.size())) {
          return fault(Err{ErrCode::Name, "local index out of range"});
        }
        if (stack_.empty()) {
          return fault(Err{ErrCode::Value, "stack underflow"});
        }
        LocalSlot& slot = frame.locals[static_cast<std::size_t>(ins.a)];
        slot.is_set = true;
        slot.value = std::move(stack_.back());
        stack_.pop_back();
        continue;
      }

      if (op == "LOAD_GLOBAL" || op == "STORE_GLOBAL") {
        if (!ins.has_a || ins.a < 0 || ins.a >= static_cast<int>(program.names.size())) {
          return fault(Err{ErrCode::Name, "name index out of range"});
        }
        const std::string& name = program.names[static_cast<std::size_t>(ins.a)];
        if (op == "STORE_GLOBAL") {
          if (stack_.empty()) {
            return fault(Err{ErrCode::Value, "stack underflow"});
          }
          globals_[name] = std::move(stack_.back());
          stack_.pop_back();
          continue;
        }
        auto it = globals_.find(name);
        if (it == globals_.end()) {
          return fault(Err{ErrCode::Name, "name '" + name + "' is not defined"});
        }
        stack_.push_back(it->second);
        continue;
      }

      if (op == "POP") {
        if (stack_.empty()) {
          return fault(Err{ErrCode::Value, "stack underflow"});
        }
        stack_.pop_back();
        continue;
      }

      if (op == "DUP") {
        if (stack_.empty()) {
          return fault(Err{ErrCode::Value, "stack underflow"});
        }
        stack_.push_back(stack_.back());
        continue;
      }

      if (op == "NEG" || op == "POS" || op == "NOT") {
        if (stack_.empty()) {
          return fault(Err{ErrCode::Value, "stack underflow"});
        }
        const Value x = stack_.back();
        stack_.pop_back();
        if (op == "NOT") {
          stack_.push_back(Value::from_bool(!vm_semantics::is_truthy(x)));
          continue;
        }
        const Value n = as_number(x);
        if (!is_numeric(n)) {
          return fault(Err{ErrCode::Type, std::string("bad operand type for unary ") + (op == "NEG" ? "-" : "+") +
                                              ": '" + type_name(x) + "'"});
        }
        if (op == "POS") {
          stack_.push_back(n);
        } else if (n.tag == ValueTag::Float) {
          stack_.push_back(Value::from_float(-n.f));
        } else if (n.i == std::numeric_limits<std::int64_t>::min()) {
          return fault(Err{ErrCode::Overflow, "integer overflow"});
        } else {
          stack_.push_back(Value::from_int(-n.i));
        }
        continue;
      }

      if (is_arith(op)) {
        if (stack_.size() < 2) {
          return fault(Err{ErrCode::Value, "stack underflow"});
        }
        const Value b = stack_.back();
        stack_.pop_back();
        const Value a = stack_.back();
        stack_.pop_back();
        Value out;
        if (!binary_arith(op, a, b, out, err)) {
          return fault(err);
        }
        stack_.push_back(std::move(out));
        continue;
      }

      CmpOp cmp = CmpOp::EQ;
      if (cmp_op_from_name(op, cmp)) {
        if (stack_.size() < 2) {
          return fault(Err{ErrCode::Value, "stack underflow"});
        }
        const Value b = stack_.back();
        stack_.pop_back();
        const Value a = stack_.back();
        stack_.pop_back();
        bool result = false;
        if (vm_semantics::compare_values(cmp, as_number(a), as_number(b), result) != CompareStatus::Ok) {
          return fault(Err{ErrCode::Type, std::string("'") + op_symbol(op) + "' not supported between instances of '" +
                                              type_name(a) + "' and '" + type_name(b) + "'"});
        }
        stack_.push_back(Value::from_bool(result));
        continue;
      }

      if (op == "JMP") {
        if (!ins.has_a || ins.a < 0 || ins.a > static_cast<int>(program.code.size())) {
          return fault(Err{ErrCode::Value, "jump target out of range"});
        }
        frame.ip = ins.a;
        continue;
      }

      if (op == "JMP_IF_FALSE" || op == "JMP_IF_TRUE") {
        if (stack_.empty()) {
          return fault(Err{ErrCode::Value, "stack underflow"});
        }
        if (!ins.has_a || ins.a < 0 || ins.a > static_cast<int>(program.code.size())) {
          return fault(Err{ErrCode::Value, "jump target out of range"});
        }
        const bool cond = vm_semantics::is_truthy(stack_.back());
        stack_.pop_back();
        if (op == "JMP_IF_FALSE" && !cond) frame.ip = ins.a;
        if (op == "JMP_IF_TRUE" && cond) frame.ip = ins.a;
        continue;
      }

      if (op == "RANGE_ARG") {
        if (stack_.empty()) {
          return fault(Err{ErrCode::Value, "stack underflow"});
        }
        const Value n = as_number(stack_.back());
        if (n.tag != ValueTag::Int) {
          return fault(Err{ErrCode::Type, std::string("'") + type_name(stack_.back()) +
                                              "' object cannot be interpreted as an integer"});
        }
        stack_.back() = n;
        continue;
      }

      if (op == "CALL") {
        const int argc = ins.has_b ? ins.b : -1;
        if (!ins.has_a || ins.a < 0 || ins.a >= static_cast<int>(program.names.size()) || argc < 0) {
          return fault(Err{ErrCode::Type, "invalid call instruction"});
        }
        if (static_cast<int>(stack_.size()) < argc) {
          return fault(Err{ErrCode::Value, "stack underflow"});
        }
        const std::string& name = program.names[static_cast<std::size_t>(ins.a)];
        const std::size_t start = stack_.size() - static_cast<std::size_t>(argc);
        std::vector<Value> args(stack_.begin() + static_cast<std::ptrdiff_t>(start), stack_.end());
        stack_.resize(start);

        auto fn = module_.function_index.find(name);
        if (fn != module_.function_index.end()) {
          // `frame` is invalidated once the new frame is pushed.
          if (!push_frame(module_.functions[static_cast<std::size_t>(fn->second)], args, err)) {
            return fault(err);
          }
          continue;
        }
        auto global = globals_.find(name);
        if (global != globals_.end()) {
          return fault(Err{ErrCode::Type, std::string("'") + type_name(global->second) + "' object is not callable"});
        }
        BuiltinResult out = builtin_call(name, args);
        if (out.is_error) {
          return fault(out.err);
        }
        stack_.push_back(std::move(out.value));
        continue;
      }

      if (op == "RETURN") {
        if (stack_.empty()) {
          return fault(Err{ErrCode::Value, "return requires value on stack"});
        }
        Value value = std::move(stack_.back());
        stack_.resize(frame.stack_base);
        frames_.pop_back();
        if (frames_.empty()) {
          VMResult out;
          out.value = std::move(value);
          return out;
        }
        stack_.push_back(std::move(value));
        continue;
      }

      return fault(Err{ErrCode::Type, "unknown opcode: " + op});
    }
  }

 private:
  struct Frame {
    const BytecodeProgram* program = nullptr;
    int ip = 0;
    std::vector<LocalSlot> locals;
    std::size_t stack_base = 0;
  };

  bool push_frame(const BytecodeProgram& program, const std::vector<Value>& args, Err& err) {
    const int argc = static_cast<int>(args.size());
    const int n_defaults = static_cast<int>(program.defaults.size());
    const int required = program.n_params - n_defaults;
    if (argc > program.n_params) {
      err = Err{ErrCode::Type, program.name + "() takes " + std::to_string(program.n_params) +
                                   " positional arguments but " + std::to_string(argc) + " were given"};
      return false;
    }
    if (argc < required) {
      err = Err{ErrCode::Type, program.name + "() missing " + std::to_string(required - argc) +
                                   " required positional argument(s)"};
      return false;
    }
    if (static_cast<int>(frames_.size()) >= kMaxCallDepth) {
      err = Err{ErrCode::Recursion, "maximum recursion depth exceeded"};
      return false;
    }

    Frame frame;
    frame.program = &program;
    frame.stack_base = stack_.size();
    frame.locals.resize(static_cast<std::size_t>(program.n_locals));
    for (int i = 0; i < program.n_params; ++i) {
      LocalSlot& slot = frame.locals[static_cast<std::size_t>(i)];
      slot.is_set = true;
      slot.value = i < argc ? args[static_cast<std::size_t>(i)]
                            : program.defaults[static_cast<std::size_t>(i - required)];
    }
    frames_.push_back(std::move(frame));
    return true;
  }

  static std::string local_name(const BytecodeProgram& program, int idx) {
    for (const auto& item : program.var2idx) {
      if (item.second == idx) {
        return item.first;
      }
    }
    return "?";
  }

  VMResult fault(const Err& err) const {
    VMResult out;
    out.is_error = true;
    out.err = err;
    for (const Frame& frame : frames_) {
      TraceEntry entry;
      entry.function = frame.program->name;
      const int at = frame.ip - 1;
      if (at >= 0 && at < static_cast<int>(frame.program->code.size())) {
        entry.line = frame.program->code[static_cast<std::size_t>(at)].line;
      } else {
        entry.line = frame.program->line;
      }
      out.traceback.push_back(std::move(entry));
    }
    return out;
  }

  const CompiledModule& module_;
  int fuel_;
  std::unordered_map<std::string, Value> globals_;
  std::vector<Value> stack_;
  std::vector<Frame> frames_;
};

}  // namespace

VMResult run_function(const CompiledModule& module, const std::string& function_name,
                      const std::vector<Value>& args, int fuel) {
  Machine machine(module, fuel);
  VMResult init = machine.run(module.init, {});
  if (init.is_error) {
    return init;
  }
  auto it = module.function_index.find(function_name);
  if (it == module.function_index.end()) {
    VMResult out;
    out.is_error = true;
    out.err = Err{ErrCode::Name, "name '" + function_name + "' is not defined"};
    return out;
  }
  return machine.run(module.functions[static_cast<std::size_t>(it->second)], args);
}

std::string format_error(const VMResult& result) {
  std::ostringstream oss;
  if (!result.traceback.empty()) {
    oss << "Traceback (most recent call last):\n";
    for (const TraceEntry& entry : result.traceback) {
      oss << "  line " << entry.line << ", in " << entry.function << "\n";
    }
  }
  oss << err_code_name(result.err.code) << ": " << result.err.message;
  return oss.str();
}

}  // namespace progeval
