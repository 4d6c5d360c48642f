#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace trivia::server {

enum class QuestionType { MultipleChoice, FillInTheBlanks, WhatWouldYouDo };
enum class Difficulty { Easy = 0, Medium = 1, Hard = 2, Insane = 3 };
enum class SessionStatus { Waiting, InProgress, Completed };
enum class Role { Facilitator, Player };

constexpr int kDifficultyCount = 4;

// Points a correct answer is worth: easy/medium 2, hard/insane 3.
int points_for(Difficulty difficulty);

std::string to_string(QuestionType type);
std::string to_string(Difficulty difficulty);
std::string to_string(SessionStatus status);
std::string to_string(Role role);

std::optional<QuestionType> question_type_from_string(const std::string& value);
std::optional<Difficulty> difficulty_from_string(const std::string& value);
std::optional<SessionStatus> session_status_from_string(const std::string& value);
std::optional<Role> role_from_string(const std::string& value);

struct Quiz {
  int id{};
  std::string name;
  int facilitator_id{};
  int num_teams{};
  int num_rounds{};
  int easy_count{1};
  int medium_count{1};
  int hard_count{1};
  int insane_count{1};
};

struct Question {
  int id{};
  int quiz_id{};
  std::string text;
  QuestionType type{QuestionType::MultipleChoice};
  Difficulty difficulty{Difficulty::Easy};
  int time_limit{30};  // seconds
  std::string option_a;
  std::string option_b;
  std::string option_c;
  std::string option_d;
  std::string correct_answer;  // "A".."D" for multiple choice
  std::string model_answer;
};

struct SessionRecord {
  int id{};
  int quiz_id{};
  std::string room_code;
  SessionStatus status{SessionStatus::Waiting};
  std::uint64_t created_at{0};
  std::uint64_t started_at{0};
  std::uint64_t completed_at{0};
};

struct Team {
  int id{};
  int session_id{};
  std::string name;
  int position{0};
  int score{0};
  int join_order{0};
};

struct AnswerRecord {
  int id{};
  int session_id{};
  int team_id{};
  int question_id{};
  std::string submitted_answer;
  int round_number{1};
  std::optional<bool> is_correct;  // unset until graded
  int points_awarded{0};
  std::uint64_t submitted_at{0};
  std::uint64_t graded_at{0};
};

// Payload shapes shared by responses and events.
nlohmann::json team_to_json(const Team& team);
nlohmann::json team_ref_to_json(const Team& team);
// Facilitator view carries the answer key and model answer; players never see them.
nlohmann::json question_to_json(const Question& q, bool include_answer_key);
nlohmann::json session_to_json(const SessionRecord& session);

// "B: Paris" style label for the correct multiple-choice option, empty otherwise.
std::string correct_answer_label(const Question& q);

}  // namespace trivia::server
