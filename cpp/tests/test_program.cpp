#include <iostream>
#include <set>
#include <string>

#include "progeval/errors.hpp"
#include "progeval/program.hpp"

namespace {

using progeval::ConfigError;
using progeval::Function;
using progeval::Program;

bool check(bool cond, const std::string& msg) {
  if (!cond) {
    std::cerr << "FAIL: " << msg << "\n";
    return false;
  }
  return true;
}

const char* kTemplate =
    "SCALE = 2\n"
    "\n"
    "def priority(x: int) -> float:\n"
    "  \"\"\"Returns a priority.\"\"\"\n"
    "  return x * SCALE\n"
    "\n"
    "\n"
    "def evaluate(x):\n"
    "  return priority(x)\n";

bool test_split_template() {
  const Program p = progeval::text_to_program(kTemplate);
  if (!check(p.preface == "SCALE = 2", "preface should hold the module statements")) return false;
  if (!check(p.functions.size() == 2, "two functions expected")) return false;
  const Function& pr = p.functions[0];
  if (!check(pr.name == "priority" && pr.args == "x: int" && pr.return_type == "float",
             "priority header fields")) {
    return false;
  }
  if (!check(pr.docstring == "Returns a priority.", "priority docstring")) return false;
  if (!check(pr.body == "  return x * SCALE", "priority body: [" + pr.body + "]")) return false;
  const Function& ev = p.functions[1];
  return check(ev.name == "evaluate" && ev.docstring.empty() && ev.body == "  return priority(x)",
               "evaluate fields");
}

bool test_render_is_stable() {
  const Program p = progeval::text_to_program(kTemplate);
  const std::string text = p.to_string();
  const std::string expected =
      "SCALE = 2\n"
      "\n"
      "def priority(x: int) -> float:\n"
      "  \"\"\"Returns a priority.\"\"\"\n"
      "  return x * SCALE\n"
      "\n"
      "\n"
      "def evaluate(x):\n"
      "  return priority(x)\n"
      "\n";
  if (!check(text == expected, "rendered program:\n" + text)) return false;
  return check(progeval::text_to_program(text).to_string() == text, "rendering should be a fixpoint");
}

bool test_inline_body_and_reindent() {
  const Program p = progeval::text_to_program("def f(x): return x\n");
  if (!check(p.functions.size() == 1 && p.functions[0].body == "return x", "inline body")) return false;
  return check(p.functions[0].to_string() == "def f(x):\n    return x\n\n", "inline body should be re-indented");
}

bool test_docstring_follows_block_indent() {
  const std::string four =
      "def priority(x):\n"
      "    \"\"\"Scores x.\"\"\"\n"
      "    return x\n";
  Program p = progeval::text_to_program(four);
  if (!check(p.functions[0].indent == "    ", "four-space block indent recorded")) return false;
  const std::string kept = p.to_string();
  if (!check(kept == "def priority(x):\n    \"\"\"Scores x.\"\"\"\n    return x\n\n", "kept render:\n" + kept)) {
    return false;
  }

  p.get_function("priority").body = "return x * 2";
  const std::string shifted = p.to_string();
  if (!check(shifted == "def priority(x):\n    \"\"\"Scores x.\"\"\"\n    return x * 2\n\n",
             "column-0 body under a docstring:\n" + shifted)) {
    return false;
  }
  if (!check(progeval::text_to_program(shifted).functions[0].body == "    return x * 2", "render should parse back")) {
    return false;
  }

  Program two = progeval::text_to_program(kTemplate);
  two.get_function("priority").body = "if x:\n    return 1\nreturn 0";
  const std::string text = two.to_string();
  if (!check(text.find("  \"\"\"Returns a priority.\"\"\"\n  if x:\n      return 1\n  return 0\n") != std::string::npos,
             "two-space template keeps its indent:\n" + text)) {
    return false;
  }
  if (!check(progeval::text_to_program(text).get_function("priority").body == "  if x:\n      return 1\n  return 0",
             "two-space render should parse back")) {
    return false;
  }

  two.get_function("priority").body = "      return -x";
  return check(two.get_function("priority").to_string() ==
                   "def priority(x: int) -> float:\n      \"\"\"Returns a priority.\"\"\"\n      return -x\n\n",
               "an indented body carries the docstring to its own indent");
}

bool test_get_function_and_clone() {
  Program p = progeval::text_to_program(kTemplate);
  bool threw = false;
  try {
    (void)p.get_function("missing");
  } catch (const ConfigError&) {
    threw = true;
  }
  if (!check(threw, "missing function should throw ConfigError")) return false;

  Program copy = p.clone();
  copy.get_function("priority").body = "  return 0";
  if (!check(p.get_function("priority").body == "  return x * SCALE", "clone must not alias the original")) {
    return false;
  }
  return check(copy.get_function("priority").body == "  return 0", "clone should take the new body");
}

bool test_layouts_rejected() {
  bool late_statement = false;
  try {
    (void)progeval::text_to_program("def f():\n    pass\nX = 1\n");
  } catch (const ConfigError&) {
    late_statement = true;
  }
  if (!check(late_statement, "statements after the first function are rejected")) return false;

  bool duplicate = false;
  try {
    (void)progeval::text_to_program("def f():\n    pass\n\ndef f():\n    pass\n");
  } catch (const ConfigError&) {
    duplicate = true;
  }
  return check(duplicate, "duplicate function names are rejected");
}

bool test_rename_function_calls() {
  const std::string code =
      "  a = priority_v1(x) + priority_v10(x)\n"
      "  b = priority_v1\n"
      "  s = 'priority_v1(x)'\n"
      "  return priority_v1 (a)\n";
  const std::string expected =
      "  a = priority(x) + priority_v10(x)\n"
      "  b = priority_v1\n"
      "  s = 'priority_v1(x)'\n"
      "  return priority (a)\n";
  const std::string out = progeval::rename_function_calls(code, "priority_v1", "priority");
  if (!check(out == expected, "renamed code:\n" + out)) return false;
  return check(progeval::rename_function_calls(code, "other", "priority") == code,
               "absent name should leave the text untouched");
}

bool test_get_functions_called() {
  const std::string code =
      "def f(x, y=1):\n"
      "    if g(x):\n"
      "        return h(abs(x)) if x else 0\n"
      "    for i in range(k(y)):\n"
      "        x = x + i\n"
      "    return x\n";
  const std::set<std::string> called = progeval::get_functions_called(code);
  const std::set<std::string> expected = {"abs", "g", "h", "k"};
  return check(called == expected, "calls should include nested and builtin calls but not range");
}

}  // namespace

int main() {
  if (!test_split_template()) return 1;
  if (!test_render_is_stable()) return 1;
  if (!test_inline_body_and_reindent()) return 1;
  if (!test_docstring_follows_block_indent()) return 1;
  if (!test_get_function_and_clone()) return 1;
  if (!test_layouts_rejected()) return 1;
  if (!test_rename_function_calls()) return 1;
  if (!test_get_functions_called()) return 1;
  std::cout << "progeval_test_program: OK\n";
  return 0;
}
