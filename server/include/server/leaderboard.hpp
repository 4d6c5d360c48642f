#pragma once

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "server/model.hpp"

namespace trivia::server {

struct Standing {
  int id{};
  std::string name;
  int position{};
  int score{};
  int join_order{};
};

// Orders by position (tiles moved) desc, then score desc, then join order asc.
std::vector<Standing> rank(const std::vector<Team>& teams);

nlohmann::json leaderboard_to_json(const std::vector<Standing>& standings);

}  // namespace trivia::server
