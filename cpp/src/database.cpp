#include "progeval/database.hpp"

namespace progeval {

double mean_score(const ScoreMap& scores) {
  if (scores.empty()) {
    return 0.0;
  }
  double total = 0.0;
  for (const auto& item : scores) {
    total += item.second;
  }
  return total / static_cast<double>(scores.size());
}

void InMemoryDatabase::register_program(const Function& program, std::optional<int> island_id,
                                        const ScoreMap& scores) {
  std::lock_guard<std::mutex> lock(mu_);
  registrations_.push_back(Registration{program, island_id, scores});
}

std::vector<Registration> InMemoryDatabase::registrations() const {
  std::lock_guard<std::mutex> lock(mu_);
  return registrations_;
}

std::optional<Registration> InMemoryDatabase::best() const {
  std::lock_guard<std::mutex> lock(mu_);
  std::optional<Registration> out;
  double best_mean = 0.0;
  for (const Registration& r : registrations_) {
    const double m = mean_score(r.scores);
    if (!out || m > best_mean) {
      out = r;
      best_mean = m;
    }
  }
  return out;
}

}  // namespace progeval
