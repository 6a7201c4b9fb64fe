#include <fstream>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "eval_cli/config.hpp"
#include "eval_cli/json.hpp"
#include "eval_cli/options.hpp"
#include "progeval/database.hpp"
#include "progeval/errors.hpp"
#include "progeval/evaluator.hpp"
#include "progeval/program.hpp"
#include "progeval/value.hpp"

namespace {

using progeval::Registration;
using progeval::cli_detail::json_quote;

std::string format_score(double score) { return progeval::value_to_string(progeval::Value::from_float(score)); }

std::string island_text(const std::optional<int>& island_id) {
  return island_id ? std::to_string(*island_id) : std::string("none");
}

void print_registrations(const std::vector<Registration>& regs) {
  if (regs.empty()) {
    std::cout << "NOT_REGISTERED\n";
    return;
  }
  for (const Registration& r : regs) {
    std::cout << "REGISTERED island " << island_text(r.island_id) << " scores " << r.scores.size() << "\n";
    const std::map<std::string, double> sorted(r.scores.begin(), r.scores.end());
    for (const auto& item : sorted) {
      std::cout << "SCORE " << item.first << " " << format_score(item.second) << "\n";
    }
  }
}

std::string report_json(const std::vector<Registration>& regs) {
  std::ostringstream oss;
  oss << "{\"registered\": " << (regs.empty() ? "false" : "true") << ", \"registrations\": [";
  for (std::size_t i = 0; i < regs.size(); ++i) {
    const Registration& r = regs[i];
    if (i > 0) oss << ", ";
    oss << "{\"island\": " << (r.island_id ? std::to_string(*r.island_id) : std::string("null"))
        << ", \"function\": " << json_quote(r.program.name) << ", \"body\": " << json_quote(r.program.body)
        << ", \"scores\": {";
    const std::map<std::string, double> sorted(r.scores.begin(), r.scores.end());
    bool first = true;
    for (const auto& item : sorted) {
      if (!first) oss << ", ";
      oss << json_quote(item.first) << ": " << format_score(item.second);
      first = false;
    }
    oss << "}}";
  }
  oss << "]}\n";
  return oss.str();
}

}  // namespace

int main(int argc, char** argv) {
  std::ios::sync_with_stdio(false);

  try {
    const progeval::cli_detail::CliOptions opts = progeval::cli_detail::parse_cli_options(argc, argv);
    progeval::cli_detail::EvalConfig cfg = progeval::cli_detail::load_config(opts.config_path);
    if (opts.timeout_seconds) {
      cfg.timeout_seconds = *opts.timeout_seconds;
    }

    auto template_program = std::make_shared<const progeval::Program>(
        progeval::text_to_program(progeval::cli_detail::read_file(cfg.template_path)));
    const progeval::Function& target = template_program->get_function(cfg.function_to_evolve);
    const std::string sample = progeval::cli_detail::read_file(opts.sample_path);

    std::cerr << "progeval_eval: evolving " << target.name << ", running " << cfg.function_to_run << " on "
              << cfg.inputs.size() << " inputs (timeout " << cfg.timeout_seconds << "s)\n";

    auto database = std::make_shared<progeval::InMemoryDatabase>();
    progeval::Evaluator evaluator(database, template_program, cfg.function_to_evolve, cfg.function_to_run,
                                  cfg.inputs, cfg.timeout_seconds);
    evaluator.analyse(sample, opts.island_id, opts.version_generated);

    const std::vector<Registration> regs = database->registrations();
    print_registrations(regs);

    if (!opts.out_json_path.empty()) {
      std::ofstream out(opts.out_json_path);
      if (!out) {
        throw std::runtime_error("cannot write " + opts.out_json_path);
      }
      out << report_json(regs);
    }
    return 0;
  } catch (const progeval::ConfigError& e) {
    std::cerr << "progeval_eval: " << e.what() << "\n" << progeval::cli_detail::usage() << "\n";
    return 2;
  } catch (const std::exception& e) {
    std::cerr << "progeval_eval: " << e.what() << "\n";
    return 2;
  }
}
