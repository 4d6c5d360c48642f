#include "server/allocator.hpp"

#include <algorithm>
#include <deque>

namespace trivia::server {

namespace {

std::size_t index_of(Difficulty d) {
  return static_cast<std::size_t>(d);
}

}  // namespace

Allocation allocate(int team_count, int round_count, const std::vector<Question>& pool,
                    std::mt19937& rng) {
  Allocation out;
  if (team_count <= 0 || round_count <= 0) return out;

  std::array<std::vector<Question>, kDifficultyCount> shuffled;
  for (const auto& q : pool) {
    shuffled[index_of(q.difficulty)].push_back(q);
  }
  std::array<std::deque<Question>, kDifficultyCount> buckets;
  for (std::size_t d = 0; d < shuffled.size(); ++d) {
    std::shuffle(shuffled[d].begin(), shuffled[d].end(), rng);
    buckets[d].assign(shuffled[d].begin(), shuffled[d].end());
  }

  std::vector<DifficultyCounts> drawn(static_cast<std::size_t>(team_count), DifficultyCounts{});
  out.reserve(static_cast<std::size_t>(team_count) * static_cast<std::size_t>(round_count));

  for (int round = 0; round < round_count; ++round) {
    for (int team = 0; team < team_count; ++team) {
      auto& counts = drawn[static_cast<std::size_t>(team)];
      int best = -1;
      // Buckets are scanned easy -> insane, so a strict '<' keeps the easier one on ties.
      for (int d = 0; d < kDifficultyCount; ++d) {
        if (buckets[d].empty()) continue;
        if (best < 0 || counts[d] < counts[best]) best = d;
      }
      if (best < 0) return out;

      out.push_back({team, std::move(buckets[best].front())});
      buckets[best].pop_front();
      ++counts[best];
    }
  }
  return out;
}

DifficultyCounts count_by_difficulty(const std::vector<Question>& pool) {
  DifficultyCounts counts{};
  for (const auto& q : pool) {
    ++counts[index_of(q.difficulty)];
  }
  return counts;
}

std::vector<std::string> validate_supply(const Quiz& quiz, const DifficultyCounts& available) {
  std::vector<std::string> problems;
  const int needed = quiz.num_teams * quiz.num_rounds;
  int total = 0;
  for (int c : available) total += c;
  if (total < needed) {
    problems.push_back("Total questions: " + std::to_string(total) + "/" + std::to_string(needed) +
                       " (need " + std::to_string(needed - total) + " more)");
  }

  const std::array<std::pair<Difficulty, int>, kDifficultyCount> configured = {{
      {Difficulty::Easy, quiz.easy_count},
      {Difficulty::Medium, quiz.medium_count},
      {Difficulty::Hard, quiz.hard_count},
      {Difficulty::Insane, quiz.insane_count},
  }};
  for (const auto& [difficulty, minimum] : configured) {
    int have = available[index_of(difficulty)];
    if (have < minimum) {
      problems.push_back(to_string(difficulty) + " questions: " + std::to_string(have) + "/" +
                         std::to_string(minimum) + " (need " + std::to_string(minimum - have) +
                         " more)");
    }
  }
  return problems;
}

}  // namespace trivia::server
