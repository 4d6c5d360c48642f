#include "server/leaderboard.hpp"

#include <algorithm>
#include <tuple>

namespace trivia::server {

std::vector<Standing> rank(const std::vector<Team>& teams) {
  std::vector<Standing> out;
  out.reserve(teams.size());
  for (const auto& t : teams) {
    out.push_back({t.id, t.name, t.position, t.score, t.join_order});
  }
  std::sort(out.begin(), out.end(), [](const Standing& a, const Standing& b) {
    return std::make_tuple(-a.position, -a.score, a.join_order) <
           std::make_tuple(-b.position, -b.score, b.join_order);
  });
  return out;
}

nlohmann::json leaderboard_to_json(const std::vector<Standing>& standings) {
  nlohmann::json arr = nlohmann::json::array();
  for (const auto& s : standings) {
    arr.push_back({{"id", s.id},
                   {"name", s.name},
                   {"position", s.position},
                   {"score", s.score},
                   {"join_order", s.join_order}});
  }
  return arr;
}

}  // namespace trivia::server
