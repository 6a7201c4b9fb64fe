#include "progeval/body_recovery.hpp"

#include <algorithm>
#include <cstddef>
#include <optional>
#include <sstream>
#include <vector>

#include "progeval/errors.hpp"
#include "progeval/parser.hpp"

namespace progeval {

namespace {

constexpr const char* kHeaderName = "fake_function_header";

std::vector<std::string> split_lines(const std::string& text) {
  std::vector<std::string> lines;
  std::istringstream in(text);
  std::string line;
  while (std::getline(in, line)) {
    lines.push_back(line);
  }
  return lines;
}

bool is_blank(const std::string& line) {
  return line.find_first_not_of(" \t\r\f") == std::string::npos;
}

// A fragment whose first statement sits at column 0 is already at body level;
// it is shifted right for parsing only.
bool needs_indent(const std::vector<std::string>& lines) {
  for (const std::string& line : lines) {
    if (is_blank(line)) continue;
    return line[0] != ' ' && line[0] != '\t';
  }
  return false;
}

std::string wrap(const std::vector<std::string>& lines, std::size_t count, bool indent) {
  std::string code = std::string("def ") + kHeaderName + "():\n";
  for (std::size_t i = 0; i < count; ++i) {
    if (indent && !lines[i].empty()) code += "    ";
    code += lines[i];
    code += "\n";
  }
  return code;
}

}  // namespace

std::string trim_function_body(const std::string& generated_code) {
  if (generated_code.empty()) {
    return "";
  }
  const std::vector<std::string> lines = split_lines(generated_code);
  const bool indent = needs_indent(lines);

  // Body line i is line i + 2 of the wrapped code.
  std::size_t count = lines.size();
  std::optional<int> end_line;
  while (count > 0) {
    try {
      const Module module = parse_module(wrap(lines, count, indent));
      end_line = find_function_end_line(module, kHeaderName);
      break;
    } catch (const ParseError& e) {
      const int keep = std::max(0, e.line() - 2);
      count = std::min(static_cast<std::size_t>(keep), count - 1);
    }
  }
  if (count == 0 || !end_line) {
    return "";
  }

  const std::size_t body_end = std::min(count, static_cast<std::size_t>(std::max(0, *end_line - 1)));
  std::string out;
  for (std::size_t i = 0; i < body_end; ++i) {
    if (i > 0) out += "\n";
    out += lines[i];
  }
  return out + "\n\n";
}

}  // namespace progeval
