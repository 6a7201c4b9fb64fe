#include <iostream>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "progeval/database.hpp"

namespace {

using progeval::Function;
using progeval::InMemoryDatabase;
using progeval::Registration;
using progeval::ScoreMap;

bool check(bool cond, const std::string& msg) {
  if (!cond) {
    std::cerr << "FAIL: " << msg << "\n";
    return false;
  }
  return true;
}

Function named(const std::string& body) {
  Function f;
  f.name = "priority";
  f.args = "x";
  f.body = body;
  return f;
}

bool test_mean_score() {
  if (!check(progeval::mean_score({}) == 0.0, "empty map has mean 0")) return false;
  return check(progeval::mean_score({{"1", 1.0}, {"2", 4.0}}) == 2.5, "mean of 1 and 4 is 2.5");
}

bool test_best_prefers_earliest_on_ties() {
  InMemoryDatabase db;
  if (!check(!db.best(), "empty database has no best")) return false;
  db.register_program(named("  return 1"), 0, {{"1", 3.0}});
  db.register_program(named("  return 2"), 1, {{"1", 5.0}, {"2", 1.0}});
  db.register_program(named("  return 3"), std::nullopt, {{"1", 2.0}});
  const std::optional<Registration> best = db.best();
  if (!check(best && best->program.body == "  return 1", "tie on mean 3 goes to the earliest")) return false;
  const std::vector<Registration> regs = db.registrations();
  if (!check(regs.size() == 3 && regs[1].island_id && *regs[1].island_id == 1, "arrival order and islands kept")) {
    return false;
  }
  return check(!regs[2].island_id, "missing island id is kept as empty");
}

bool test_concurrent_registration() {
  InMemoryDatabase db;
  std::vector<std::thread> workers;
  for (int t = 0; t < 4; ++t) {
    workers.emplace_back([&db, t]() {
      for (int i = 0; i < 50; ++i) {
        db.register_program(named("  return " + std::to_string(i)), t, {{std::to_string(i), 1.0 * i}});
      }
    });
  }
  for (std::thread& w : workers) {
    w.join();
  }
  return check(db.registrations().size() == 200, "every concurrent registration should be kept");
}

}  // namespace

int main() {
  if (!test_mean_score()) return 1;
  if (!test_best_prefers_earliest_on_ties()) return 1;
  if (!test_concurrent_registration()) return 1;
  std::cout << "progeval_test_database: OK\n";
  return 0;
}
