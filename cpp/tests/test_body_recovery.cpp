#include <iostream>
#include <optional>
#include <string>

#include "progeval/assembler.hpp"
#include "progeval/body_recovery.hpp"
#include "progeval/errors.hpp"
#include "progeval/program.hpp"

namespace {

using progeval::trim_function_body;

bool check(bool cond, const std::string& msg) {
  if (!cond) {
    std::cerr << "FAIL: " << msg << "\n";
    return false;
  }
  return true;
}

bool expect_trim(const std::string& in, const std::string& expected, const std::string& msg) {
  const std::string out = trim_function_body(in);
  return check(out == expected, msg + ": got [" + out + "]");
}

bool test_valid_body_is_kept() {
  if (!expect_trim("  return x + 1\n", "  return x + 1\n\n", "single line body")) return false;
  return expect_trim("  y = x * 2\n  if y > 3:\n    y = 3\n  return y", "  y = x * 2\n  if y > 3:\n    y = 3\n  return y\n\n",
                     "multi line body without trailing newline");
}

bool test_recovery_is_idempotent() {
  const char* inputs[] = {
      "  y = x * 2\n  return y\n",
      "  y = x * 2\n  return y\n\ndef priority_v2(x):\n  return 0\n",
      "return 1\nif True\n",
      "  a = 1\n  b = (a +\n",
  };
  for (const char* in : inputs) {
    const std::string once = trim_function_body(in);
    if (!check(trim_function_body(once) == once, std::string("recovery should be idempotent for: ") + in)) {
      return false;
    }
  }
  return true;
}

bool test_trailing_definition_is_cut() {
  return expect_trim("  y = x * 2\n  return y\n\ndef priority_v2(x):\n  return 0\n", "  y = x * 2\n  return y\n\n",
                     "code after the body is dropped");
}

bool test_malformed_trailing_fragment() {
  return expect_trim("return 1\nif True\n", "return 1\n\n", "invalid second line");
}

bool test_truncated_expression() {
  return expect_trim("  a = 1\n  b = (a +\n", "  a = 1\n\n", "open bracket at the end");
}

bool test_shrinks_to_empty() {
  if (!expect_trim("", "", "empty input")) return false;
  if (!expect_trim("  )))\n", "", "nothing salvageable")) return false;
  // Every line is broken, so each parse error must cost at least one line.
  return expect_trim("  x = = 1\n  y = = 2\n  z = = 3\n", "", "all lines broken");
}

bool test_shrink_is_monotonic() {
  const std::string in = "  a = 1\n  b = 2\n  c = (\n  d = 4\n";
  const std::string out = trim_function_body(in);
  if (!check(out.size() <= in.size() + 1, "output should not grow beyond the separator")) return false;
  return check(out == "  a = 1\n  b = 2\n\n", "recovered prefix: [" + out + "]");
}

const char* kTemplate =
    "def priority(x):\n"
    "  return x\n"
    "\n"
    "\n"
    "def evaluate(x):\n"
    "  return priority(x)\n";

bool test_deeply_nested_fragment() {
  const std::string deep = std::string(100000, '(') + "1" + std::string(100000, ')');
  if (!expect_trim("    return " + deep + "\n", "", "unparseable nesting shrinks to nothing")) return false;
  return expect_trim("    y = x + 1\n    return " + deep + "\n", "    y = x + 1\n\n",
                     "lines before the deep line survive");
}

bool test_assemble_with_version() {
  const progeval::Program tmpl = progeval::text_to_program(kTemplate);
  const std::string before = tmpl.to_string();
  const progeval::AssembledProgram out =
      progeval::sample_to_program("  return priority_v1(x - 1) + 1\n", 1, tmpl, "priority");
  if (!check(out.evolved_function.name == "priority", "evolved function keeps its name")) return false;
  if (!check(out.evolved_function.body == "  return priority(x - 1) + 1\n\n",
             "self calls renamed: [" + out.evolved_function.body + "]")) {
    return false;
  }
  if (!check(out.program_text.find("def evaluate(x):\n  return priority(x)\n") != std::string::npos,
             "other functions are kept")) {
    return false;
  }
  return check(tmpl.to_string() == before, "template must be left untouched");
}

bool test_assemble_without_version() {
  const progeval::Program tmpl = progeval::text_to_program(kTemplate);
  const progeval::AssembledProgram out =
      progeval::sample_to_program("  return priority_v1(x)\n", std::nullopt, tmpl, "priority");
  return check(out.evolved_function.body == "  return priority_v1(x)\n\n", "no version means no rename");
}

bool test_assemble_missing_function() {
  const progeval::Program tmpl = progeval::text_to_program(kTemplate);
  try {
    (void)progeval::sample_to_program("  return 0\n", std::nullopt, tmpl, "missing");
  } catch (const progeval::ConfigError&) {
    return true;
  }
  return check(false, "missing function should throw ConfigError");
}

}  // namespace

int main() {
  if (!test_valid_body_is_kept()) return 1;
  if (!test_recovery_is_idempotent()) return 1;
  if (!test_trailing_definition_is_cut()) return 1;
  if (!test_malformed_trailing_fragment()) return 1;
  if (!test_truncated_expression()) return 1;
  if (!test_shrinks_to_empty()) return 1;
  if (!test_shrink_is_monotonic()) return 1;
  if (!test_deeply_nested_fragment()) return 1;
  if (!test_assemble_with_version()) return 1;
  if (!test_assemble_without_version()) return 1;
  if (!test_assemble_missing_function()) return 1;
  std::cout << "progeval_test_body_recovery: OK\n";
  return 0;
}
