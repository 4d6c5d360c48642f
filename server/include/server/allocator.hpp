#pragma once

#include <array>
#include <random>
#include <string>
#include <vector>

#include "server/model.hpp"

namespace trivia::server {

struct AllocationEntry {
  int team_index{};
  Question question;
};

using Allocation = std::vector<AllocationEntry>;
using DifficultyCounts = std::array<int, kDifficultyCount>;

// Pre-computes the team <-> question order for a whole game.
//
// The pool is split into difficulty buckets, each bucket is shuffled, then for
// every (round, team) the bucket this team has drawn least from is chosen
// (ties go to the easier bucket). Allocation ends early once every bucket is
// empty, so the result may be shorter than team_count * round_count.
Allocation allocate(int team_count, int round_count, const std::vector<Question>& pool,
                    std::mt19937& rng);

DifficultyCounts count_by_difficulty(const std::vector<Question>& pool);

// Lists every way the pool falls short of the quiz configuration; empty means
// the quiz can be played to the end.
std::vector<std::string> validate_supply(const Quiz& quiz, const DifficultyCounts& available);

}  // namespace trivia::server
