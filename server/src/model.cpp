#include "server/model.hpp"

#include <algorithm>
#include <cctype>

namespace trivia::server {

namespace {

std::string upper(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  return value;
}

}  // namespace

int points_for(Difficulty difficulty) {
  switch (difficulty) {
    case Difficulty::Easy:
    case Difficulty::Medium:
      return 2;
    case Difficulty::Hard:
    case Difficulty::Insane:
      return 3;
  }
  return 2;
}

std::string to_string(QuestionType type) {
  switch (type) {
    case QuestionType::MultipleChoice:
      return "MCQ";
    case QuestionType::FillInTheBlanks:
      return "FILL_IN_THE_BLANKS";
    case QuestionType::WhatWouldYouDo:
      return "WHAT_WOULD_YOU_DO";
  }
  return "MCQ";
}

std::string to_string(Difficulty difficulty) {
  switch (difficulty) {
    case Difficulty::Easy:
      return "EASY";
    case Difficulty::Medium:
      return "MEDIUM";
    case Difficulty::Hard:
      return "HARD";
    case Difficulty::Insane:
      return "INSANE";
  }
  return "EASY";
}

std::string to_string(SessionStatus status) {
  switch (status) {
    case SessionStatus::Waiting:
      return "waiting";
    case SessionStatus::InProgress:
      return "in_progress";
    case SessionStatus::Completed:
      return "completed";
  }
  return "waiting";
}

std::string to_string(Role role) {
  return role == Role::Facilitator ? "facilitator" : "player";
}

std::optional<QuestionType> question_type_from_string(const std::string& value) {
  auto v = upper(value);
  if (v == "MCQ") return QuestionType::MultipleChoice;
  if (v == "FILL_IN_THE_BLANKS") return QuestionType::FillInTheBlanks;
  if (v == "WHAT_WOULD_YOU_DO") return QuestionType::WhatWouldYouDo;
  return std::nullopt;
}

std::optional<Difficulty> difficulty_from_string(const std::string& value) {
  auto v = upper(value);
  if (v == "EASY") return Difficulty::Easy;
  if (v == "MEDIUM") return Difficulty::Medium;
  if (v == "HARD") return Difficulty::Hard;
  if (v == "INSANE") return Difficulty::Insane;
  return std::nullopt;
}

std::optional<SessionStatus> session_status_from_string(const std::string& value) {
  if (value == "waiting") return SessionStatus::Waiting;
  if (value == "in_progress") return SessionStatus::InProgress;
  if (value == "completed") return SessionStatus::Completed;
  return std::nullopt;
}

std::optional<Role> role_from_string(const std::string& value) {
  if (value == "facilitator") return Role::Facilitator;
  if (value == "player") return Role::Player;
  return std::nullopt;
}

nlohmann::json team_to_json(const Team& team) {
  return {{"id", team.id},
          {"name", team.name},
          {"position", team.position},
          {"score", team.score},
          {"join_order", team.join_order}};
}

nlohmann::json team_ref_to_json(const Team& team) {
  return {{"id", team.id}, {"name", team.name}};
}

nlohmann::json question_to_json(const Question& q, bool include_answer_key) {
  nlohmann::json j = {{"id", q.id},
                      {"question_text", q.text},
                      {"question_type", to_string(q.type)},
                      {"difficulty", to_string(q.difficulty)},
                      {"time_limit", q.time_limit},
                      {"points", points_for(q.difficulty)}};
  if (q.type == QuestionType::MultipleChoice) {
    j["option_a"] = q.option_a;
    j["option_b"] = q.option_b;
    j["option_c"] = q.option_c;
    j["option_d"] = q.option_d;
  }
  if (include_answer_key) {
    j["correct_answer"] = q.correct_answer;
    j["model_answer"] = q.model_answer;
  }
  return j;
}

nlohmann::json session_to_json(const SessionRecord& session) {
  return {{"id", session.id},
          {"quiz_id", session.quiz_id},
          {"room_code", session.room_code},
          {"status", to_string(session.status)},
          {"created_at", session.created_at},
          {"started_at", session.started_at},
          {"completed_at", session.completed_at}};
}

std::string correct_answer_label(const Question& q) {
  if (q.type != QuestionType::MultipleChoice || q.correct_answer.empty()) return {};
  auto letter = upper(q.correct_answer);
  std::string text;
  if (letter == "A") text = q.option_a;
  else if (letter == "B") text = q.option_b;
  else if (letter == "C") text = q.option_c;
  else if (letter == "D") text = q.option_d;
  return letter + ": " + text;
}

}  // namespace trivia::server
