#pragma once

#include <mutex>
#include <optional>
#include <vector>

#include "progeval/evaluator.hpp"

namespace progeval {

struct Registration {
  Function program;
  std::optional<int> island_id;
  ScoreMap scores;
};

double mean_score(const ScoreMap& scores);

// Keeps every registered program in arrival order.
class InMemoryDatabase : public ProgramsDatabase {
 public:
  void register_program(const Function& program, std::optional<int> island_id, const ScoreMap& scores) override;

  std::vector<Registration> registrations() const;

  // Registration with the highest mean score; the earliest wins ties.
  std::optional<Registration> best() const;

 private:
  mutable std::mutex mu_;
  std::vector<Registration> registrations_;
};

}  // namespace progeval
