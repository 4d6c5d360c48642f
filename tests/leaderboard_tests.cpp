#include <iostream>
#include <string>
#include <vector>

#include "server/leaderboard.hpp"

using trivia::server::leaderboard_to_json;
using trivia::server::rank;
using trivia::server::Team;

namespace {

struct TestRunner {
  int failures{0};

  void expect(bool condition, const std::string& msg) {
    if (!condition) {
      ++failures;
      std::cerr << "[FAIL] " << msg << "\n";
    }
  }

  int exit_code() const {
    if (failures == 0) {
      std::cout << "[PASS] all leaderboard tests\n";
      return 0;
    }
    std::cerr << "[FAILURES] total: " << failures << "\n";
    return 1;
  }
};

Team team(int id, const std::string& name, int position, int score, int join_order) {
  Team t;
  t.id = id;
  t.session_id = 1;
  t.name = name;
  t.position = position;
  t.score = score;
  t.join_order = join_order;
  return t;
}

}  // namespace

int main() {
  TestRunner tr;

  // Position first, then score, then whoever joined earlier.
  {
    std::vector<Team> teams = {
        team(1, "Alpha", 4, 4, 1),
        team(2, "Bravo", 6, 6, 2),
        team(3, "Charlie", 4, 6, 3),
        team(4, "Delta", 4, 4, 0),
    };
    auto board = rank(teams);
    tr.expect(board.size() == 4, "every team ranked");
    if (board.size() == 4) {
      tr.expect(board[0].id == 2, "furthest position leads");
      tr.expect(board[1].id == 3, "higher score breaks a position tie");
      tr.expect(board[2].id == 4, "earlier join breaks a full tie");
      tr.expect(board[3].id == 1, "later join ranks last");
    }
  }

  // Input order does not matter.
  {
    std::vector<Team> a = {team(1, "A", 2, 2, 1), team(2, "B", 3, 3, 2)};
    std::vector<Team> b = {team(2, "B", 3, 3, 2), team(1, "A", 2, 2, 1)};
    auto ra = rank(a);
    auto rb = rank(b);
    tr.expect(ra[0].id == rb[0].id && ra[1].id == rb[1].id, "ranking is deterministic");
  }

  // Fresh game: all zero, join order decides.
  {
    std::vector<Team> teams = {team(9, "Late", 0, 0, 3), team(7, "Early", 0, 0, 1),
                               team(8, "Middle", 0, 0, 2)};
    auto board = rank(teams);
    tr.expect(board[0].name == "Early" && board[1].name == "Middle" && board[2].name == "Late",
              "zero scores ranked by join order");
  }

  {
    tr.expect(rank({}).empty(), "empty session gives empty board");
    auto j = leaderboard_to_json(rank({team(5, "Solo", 3, 3, 1)}));
    tr.expect(j.is_array() && j.size() == 1, "json is an array");
    tr.expect(j[0]["name"] == "Solo" && j[0]["position"] == 3 && j[0]["score"] == 3,
              "json carries name, position and score");
  }

  return tr.exit_code();
}
