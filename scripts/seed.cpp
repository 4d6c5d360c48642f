#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

#include "server/auth.hpp"
#include "server/model.hpp"
#include "server/sqlite_store.hpp"

namespace fs = std::filesystem;

using trivia::server::AuthService;
using trivia::server::Difficulty;
using trivia::server::Question;
using trivia::server::QuestionType;
using trivia::server::Quiz;
using trivia::server::SqliteStore;

namespace {

const char* kFacilitator = "host";
const char* kFacilitatorPass = "host123";

Question mcq(const std::string& text, Difficulty difficulty, std::vector<std::string> options,
             const std::string& correct) {
  Question q;
  q.text = text;
  q.type = QuestionType::MultipleChoice;
  q.difficulty = difficulty;
  q.option_a = options.at(0);
  q.option_b = options.at(1);
  q.option_c = options.at(2);
  q.option_d = options.at(3);
  q.correct_answer = correct;
  return q;
}

Question open(const std::string& text, Difficulty difficulty, QuestionType type,
              const std::string& model_answer) {
  Question q;
  q.text = text;
  q.type = type;
  q.difficulty = difficulty;
  q.time_limit = 60;
  q.model_answer = model_answer;
  return q;
}

std::vector<Question> demo_questions() {
  using D = Difficulty;
  using T = QuestionType;
  return {
      mcq("Which layer does TCP belong to?", D::Easy, {"Link", "Transport", "Session", "Network"},
          "B"),
      mcq("How many bits are in an IPv4 address?", D::Easy, {"16", "64", "32", "128"}, "C"),
      open("The default HTTP port is ____.", D::Easy, T::FillInTheBlanks, "80"),
      mcq("Which planet is known as the red planet?", D::Easy, {"Mars", "Venus", "Jupiter", "Mercury"},
          "A"),
      mcq("What does DNS resolve?", D::Medium,
          {"MAC to IP", "Names to addresses", "Ports to services", "Routes to hops"}, "B"),
      open("The chemical symbol for gold is ____.", D::Medium, T::FillInTheBlanks, "Au"),
      mcq("Which year did the first moon landing happen?", D::Medium, {"1965", "1972", "1969", "1959"},
          "C"),
      open("A teammate freezes during a live demo. What would you do?", D::Medium,
           T::WhatWouldYouDo, "Take over calmly, narrate, and hand back once they are ready."),
      mcq("Which algorithm does TCP use to avoid congestion collapse?", D::Hard,
          {"Dijkstra", "Slow start", "Round robin", "Bellman-Ford"}, "B"),
      open("The speed of light is roughly ____ km/s.", D::Hard, T::FillInTheBlanks, "300000"),
      open("You find a colleague's password on a sticky note. What would you do?", D::Hard,
           T::WhatWouldYouDo, "Tell them privately and ask them to rotate it."),
      mcq("Which number is prime?", D::Hard, {"91", "221", "97", "87"}, "C"),
      mcq("What is the time complexity of building a binary heap?", D::Insane,
          {"O(n log n)", "O(n)", "O(log n)", "O(n^2)"}, "B"),
      open("The smallest perfect number is ____.", D::Insane, T::FillInTheBlanks, "6"),
      open("Production is down and the on-call is unreachable. What would you do?", D::Insane,
           T::WhatWouldYouDo, "Follow the runbook, escalate, and keep a timeline."),
      mcq("Which sorting algorithm is stable?", D::Insane, {"Quicksort", "Heapsort", "Merge sort",
                                                            "Selection sort"},
          "C"),
  };
}

}  // namespace

int main(int argc, char** argv) {
  fs::path db_path = "data/trivia.db";
  bool reset = false;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--reset") {
      reset = true;
    } else {
      db_path = arg;
    }
  }

  std::error_code ec;
  if (reset && fs::exists(db_path)) {
    fs::remove(db_path, ec);
    if (ec) {
      std::cerr << "Cannot remove " << db_path << ": " << ec.message() << "\n";
      return 1;
    }
  }
  if (db_path.has_parent_path()) {
    fs::create_directories(db_path.parent_path(), ec);
    if (ec) {
      std::cerr << "Cannot create " << db_path.parent_path() << ": " << ec.message() << "\n";
      return 1;
    }
  }

  SqliteStore store(db_path.string());
  if (!store.is_open()) {
    std::cerr << "Cannot open database " << db_path << "\n";
    return 1;
  }
  AuthService auth(db_path.string());

  std::string error;
  auto facilitator_id = auth.register_facilitator(kFacilitator, kFacilitatorPass, &error);
  if (!facilitator_id) {
    std::cout << "Facilitator not created (" << error << "), run with --reset to reseed.\n";
    return 0;
  }

  Quiz quiz;
  quiz.name = "Pub Night";
  quiz.facilitator_id = *facilitator_id;
  quiz.num_teams = 3;
  quiz.num_rounds = 4;
  quiz.easy_count = 2;
  quiz.medium_count = 2;
  quiz.hard_count = 2;
  quiz.insane_count = 2;
  auto created = store.create_quiz(quiz, &error);
  if (!created) {
    std::cerr << "Seed error: " << error << "\n";
    return 1;
  }

  int added = 0;
  for (auto q : demo_questions()) {
    q.quiz_id = created->id;
    if (!store.add_question(q, &error)) {
      std::cerr << "Skip question: " << error << "\n";
      continue;
    }
    ++added;
  }

  std::cout << "Seed completed. facilitator=" << kFacilitator << "/" << kFacilitatorPass
            << " quiz_id=" << created->id << " questions=" << added << "\n";
  return 0;
}
