#include <iostream>
#include <string>
#include <variant>
#include <vector>

#include "server/session_state.hpp"

using namespace trivia::server;

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
      std::cout << "[PASS] all session state tests\n";
      return 0;
    }
    std::cerr << "[FAILURES] total: " << failures << "\n";
    return 1;
  }
};

Question mcq(int id, Difficulty difficulty, const std::string& key) {
  Question q;
  q.id = id;
  q.quiz_id = 1;
  q.text = "Question " + std::to_string(id);
  q.type = QuestionType::MultipleChoice;
  q.difficulty = difficulty;
  q.option_a = "Oslo";
  q.option_b = "Paris";
  q.option_c = "Rome";
  q.option_d = "Bern";
  q.correct_answer = key;
  return q;
}

std::vector<Team> teams_of(int n) {
  std::vector<Team> out;
  for (int i = 0; i < n; ++i) {
    Team t;
    t.id = 100 + i;
    t.session_id = 1;
    t.name = "Team " + std::to_string(i + 1);
    t.join_order = i + 1;
    out.push_back(t);
  }
  return out;
}

// Two rounds for two teams, in team order.
GameState two_by_two() {
  Allocation alloc;
  for (int i = 0; i < 4; ++i) {
    alloc.push_back({i % 2, mcq(i + 1, Difficulty::Easy, "B")});
  }
  return GameState(1, 2, 2, alloc);
}

}  // namespace

int main() {
  TestRunner tr;

  {
    tr.expect(round_for(0, 3) == 1, "cursor 0 is round 1");
    tr.expect(round_for(2, 3) == 1, "cursor 2 of 3 teams is still round 1");
    tr.expect(round_for(3, 3) == 2, "cursor 3 of 3 teams is round 2");
    tr.expect(round_for(11, 3) == 4, "cursor 11 of 3 teams is round 4");
    tr.expect(round_for(5, 0) == 1, "no teams falls back to round 1");
  }

  {
    std::string err;
    tr.expect(can_start(SessionStatus::Waiting, 3, 3, &err), "full waiting session can start");
    tr.expect(!can_start(SessionStatus::Waiting, 2, 3, &err), "short session cannot start");
    tr.expect(err == "Need exactly 3 teams to start. Currently have 2 teams.",
              "short session message");
    tr.expect(!can_start(SessionStatus::InProgress, 3, 3, &err), "running session cannot restart");
    tr.expect(err == "Game has already started", "restart message");
  }

  // Serve, roll, reveal, resolve.
  {
    auto game = two_by_two();
    auto teams = teams_of(2);
    tr.expect(game.phase() == SlotPhase::Idle, "fresh game is idle");
    tr.expect(game.current() == nullptr, "no current question when idle");

    ServeError serve_err = ServeError::None;
    auto first = game.serve_next(teams, &serve_err);
    tr.expect(first.has_value(), "first serve succeeds");
    tr.expect(game.phase() == SlotPhase::AwaitingDice, "serve waits for dice");
    tr.expect(first->team.id == 100 && first->round_number == 1, "first slot is team 1, round 1");
    tr.expect(game.cursor() == 1 && game.remaining() == 3, "cursor advanced by one");

    tr.expect(!game.reveal(first->generation).has_value(), "no reveal before the roll");

    std::string err;
    tr.expect(game.mark_rolled(first->generation, &err), "roll accepted");
    tr.expect(!game.mark_rolled(first->generation, &err), "second roll refused");
    tr.expect(err == "Dice already rolled for this question", "second roll message");

    auto shown = game.reveal(first->generation);
    tr.expect(shown.has_value(), "reveal after the roll");
    tr.expect(game.phase() == SlotPhase::Active, "revealed slot is active");
    tr.expect(!game.mark_rolled(first->generation, &err), "active slot cannot be rolled");

    PendingAnswer a;
    a.answer_id = 1;
    a.team_id = 100;
    PendingAnswer b;
    b.answer_id = 2;
    b.team_id = 101;
    tr.expect(game.add_pending(a) && game.add_pending(b), "two answers pending");
    tr.expect(!game.add_pending(a), "duplicate answer ignored");
    tr.expect(game.resolve_pending(1), "first answer resolved");
    tr.expect(game.phase() == SlotPhase::Active, "still active while answers remain");
    tr.expect(!game.resolve_pending(1), "resolving twice reports false");
    tr.expect(game.resolve_pending(2), "last answer resolved");
    tr.expect(game.phase() == SlotPhase::Idle, "last answer returns the slot to idle");

    auto second = game.serve_next(teams, &serve_err);
    tr.expect(second && second->team.id == 101 && second->round_number == 1,
              "second slot is team 2, round 1");
    auto third = game.serve_next(teams, &serve_err);
    tr.expect(third && third->team.id == 100 && third->round_number == 2,
              "third slot is team 1, round 2");
  }

  // A reveal scheduled for a superseded slot is a no-op.
  {
    auto game = two_by_two();
    auto teams = teams_of(2);
    ServeError serve_err = ServeError::None;
    std::string err;
    auto first = game.serve_next(teams, &serve_err);
    tr.expect(game.mark_rolled(first->generation, &err), "roll first slot");
    auto second = game.serve_next(teams, &serve_err);
    tr.expect(second->generation != first->generation, "new slot gets a new generation");
    tr.expect(!game.reveal(first->generation).has_value(), "stale reveal suppressed");
    tr.expect(game.phase() == SlotPhase::AwaitingDice, "newer slot still waiting for dice");
    tr.expect(game.current()->question.id == second->question.id, "current is the newer slot");
  }

  // Exhaustion.
  {
    auto game = two_by_two();
    auto teams = teams_of(2);
    ServeError serve_err = ServeError::None;
    for (int i = 0; i < 4; ++i) game.serve_next(teams, &serve_err);
    auto none = game.serve_next(teams, &serve_err);
    tr.expect(!none.has_value() && serve_err == ServeError::Exhausted,
              "fifth serve reports exhaustion");
    tr.expect(game.cursor() == 4, "cursor stops at the end");

    auto short_teams = teams_of(1);
    auto fresh = two_by_two();
    fresh.serve_next(short_teams, &serve_err);
    auto missing = fresh.serve_next(short_teams, &serve_err);
    tr.expect(!missing && serve_err == ServeError::UnknownTeam, "missing team reported");
  }

  // Multiple-choice auto grading.
  {
    auto q = mcq(7, Difficulty::Hard, "B");
    tr.expect(check_multiple_choice(q, "B"), "exact letter");
    tr.expect(check_multiple_choice(q, " b "), "case and whitespace ignored");
    tr.expect(!check_multiple_choice(q, "C"), "wrong letter");
    tr.expect(!check_multiple_choice(q, ""), "empty answer");

    Team t = teams_of(1)[0];
    AnswerRecord rec;
    rec.id = 11;
    rec.submitted_answer = "B";
    rec.round_number = 2;
    auto p = make_pending_answer(rec, t, q);
    tr.expect(p.auto_graded && p.auto_is_correct, "correct MCQ auto graded");
    tr.expect(p.auto_points == 3, "hard question is worth 3");
    tr.expect(p.correct_answer == "B: Paris", "correct answer label");

    rec.submitted_answer = "A";
    auto wrong = make_pending_answer(rec, t, q);
    tr.expect(wrong.auto_graded && !wrong.auto_is_correct && wrong.auto_points == 0,
              "wrong MCQ gets no points");

    Question open = q;
    open.type = QuestionType::WhatWouldYouDo;
    open.correct_answer.clear();
    open.model_answer = "Stay calm";
    auto manual = make_pending_answer(rec, t, open);
    tr.expect(!manual.auto_graded && manual.auto_points == 0, "open question needs a grader");
    auto j = pending_answer_to_json(manual);
    tr.expect(j["correct_answer"].is_null(), "open question has no answer key in json");
    tr.expect(j["question_type"] == "WHAT_WOULD_YOU_DO", "question type in json");
  }

  return tr.exit_code();
}
