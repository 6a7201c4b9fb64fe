#include "progeval/result_codec.hpp"

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <sstream>
#include <utility>

namespace progeval {

namespace {

std::string escape(const std::string& s) {
  std::string out;
  for (char c : s) {
    if (c == '\\') out += "\\\\";
    else if (c == '\n') out += "\\n";
    else if (c == '\r') out += "\\r";
    else out.push_back(c);
  }
  return out;
}

bool unescape(const std::string& s, std::string& out) {
  out.clear();
  for (std::size_t i = 0; i < s.size(); ++i) {
    if (s[i] != '\\') {
      out.push_back(s[i]);
      continue;
    }
    if (i + 1 >= s.size()) return false;
    const char e = s[++i];
    if (e == '\\') out.push_back('\\');
    else if (e == 'n') out.push_back('\n');
    else if (e == 'r') out.push_back('\r');
    else return false;
  }
  return true;
}

RunResult corrupt(const std::string& why) {
  RunResult out;
  out.ok = false;
  out.diagnostic = "Error: corrupt worker message: " + why;
  return out;
}

}  // namespace

std::string encode_result(const RunResult& result) {
  if (!result.ok) {
    std::string out = "ERR\n";
    std::istringstream in(result.diagnostic);
    std::string line;
    while (std::getline(in, line)) {
      out += "MSG " + line + "\n";
    }
    return out;
  }

  const Value& v = result.value;
  switch (v.tag) {
    case ValueTag::Int:
      return "OK int " + std::to_string(v.i) + "\n";
    case ValueTag::Float: {
      char buf[40];
      std::snprintf(buf, sizeof(buf), "%.17g", v.f);
      return std::string("OK float ") + buf + "\n";
    }
    case ValueTag::Bool:
      return std::string("OK bool ") + (v.b ? "1" : "0") + "\n";
    case ValueTag::None:
      return "OK none\n";
    case ValueTag::Str:
      return "OK str " + escape(v.s) + "\n";
  }
  return "OK none\n";
}

RunResult decode_result(const std::string& message) {
  if (message.empty()) {
    return corrupt("empty message");
  }

  if (message.compare(0, 4, "ERR\n") == 0) {
    RunResult out;
    out.ok = false;
    std::istringstream in(message.substr(4));
    std::string line;
    bool first = true;
    while (std::getline(in, line)) {
      if (line.compare(0, 4, "MSG ") != 0) {
        return corrupt("unexpected line in error report");
      }
      if (!first) out.diagnostic += "\n";
      out.diagnostic += line.substr(4);
      first = false;
    }
    return out;
  }

  if (message.compare(0, 3, "OK ") != 0 || message.back() != '\n') {
    return corrupt("unknown header");
  }
  const std::string body = message.substr(3, message.size() - 4);
  const std::size_t space = body.find(' ');
  const std::string type = body.substr(0, space);
  const std::string payload = space == std::string::npos ? std::string() : body.substr(space + 1);

  RunResult out;
  out.ok = true;
  if (type == "none" && space == std::string::npos) {
    out.value = Value::none();
    return out;
  }
  if (type == "bool" && (payload == "0" || payload == "1")) {
    out.value = Value::from_bool(payload == "1");
    return out;
  }
  if (type == "int" && !payload.empty()) {
    char* end = nullptr;
    errno = 0;
    const long long i = std::strtoll(payload.c_str(), &end, 10);
    if (errno != 0 || end != payload.c_str() + payload.size()) {
      return corrupt("bad int payload");
    }
    out.value = Value::from_int(i);
    return out;
  }
  if (type == "float" && !payload.empty()) {
    char* end = nullptr;
    const double f = std::strtod(payload.c_str(), &end);
    if (end != payload.c_str() + payload.size()) {
      return corrupt("bad float payload");
    }
    out.value = Value::from_float(f);
    return out;
  }
  if (type == "str" && space != std::string::npos) {
    std::string s;
    if (!unescape(payload, s)) {
      return corrupt("bad string escape");
    }
    out.value = Value::from_str(std::move(s));
    return out;
  }
  return corrupt("unknown value type '" + type + "'");
}

}  // namespace progeval
