#include "server/session_state.hpp"

#include <algorithm>
#include <cctype>

namespace trivia::server {

namespace {

std::string normalize_letter(const std::string& value) {
  auto begin = std::find_if_not(value.begin(), value.end(),
                                [](unsigned char c) { return std::isspace(c); });
  auto end = std::find_if_not(value.rbegin(), value.rend(),
                              [](unsigned char c) { return std::isspace(c); })
                 .base();
  std::string out;
  if (begin >= end) return out;
  out.reserve(static_cast<std::size_t>(end - begin));
  for (auto it = begin; it != end; ++it) {
    out.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(*it))));
  }
  return out;
}

}  // namespace

std::string to_string(SlotPhase phase) {
  switch (phase) {
    case SlotPhase::Idle:
      return "idle";
    case SlotPhase::AwaitingDice:
      return "awaiting_dice";
    case SlotPhase::Active:
      return "active";
  }
  return "idle";
}

nlohmann::json pending_answer_to_json(const PendingAnswer& answer) {
  nlohmann::json j = {{"answer_id", answer.answer_id},
                      {"team_id", answer.team_id},
                      {"team_name", answer.team_name},
                      {"question_id", answer.question_id},
                      {"question_type", to_string(answer.question_type)},
                      {"submitted_answer", answer.submitted_answer},
                      {"round_number", answer.round_number},
                      {"auto_graded", answer.auto_graded},
                      {"auto_is_correct", answer.auto_is_correct},
                      {"auto_points", answer.auto_points}};
  if (answer.correct_answer.empty()) {
    j["correct_answer"] = nullptr;
  } else {
    j["correct_answer"] = answer.correct_answer;
  }
  return j;
}

bool check_multiple_choice(const Question& question, const std::string& submitted) {
  auto key = normalize_letter(question.correct_answer);
  if (key.empty()) return false;
  return normalize_letter(submitted) == key;
}

PendingAnswer make_pending_answer(const AnswerRecord& record, const Team& team,
                                  const Question& question) {
  PendingAnswer p;
  p.answer_id = record.id;
  p.team_id = team.id;
  p.team_name = team.name;
  p.question_id = question.id;
  p.question_type = question.type;
  p.submitted_answer = record.submitted_answer;
  p.round_number = record.round_number;
  if (question.type == QuestionType::MultipleChoice) {
    p.auto_graded = true;
    p.auto_is_correct = check_multiple_choice(question, record.submitted_answer);
    p.auto_points = p.auto_is_correct ? points_for(question.difficulty) : 0;
    p.correct_answer = correct_answer_label(question);
  }
  return p;
}

bool can_start(SessionStatus status, int joined_teams, int configured_teams, std::string* error) {
  if (status != SessionStatus::Waiting) {
    if (error) *error = "Game has already started";
    return false;
  }
  if (joined_teams != configured_teams) {
    if (error) {
      *error = "Need exactly " + std::to_string(configured_teams) + " teams to start. Currently have " +
               std::to_string(joined_teams) + " teams.";
    }
    return false;
  }
  return true;
}

int round_for(std::size_t cursor, int team_count) {
  if (team_count <= 0) return 1;
  return static_cast<int>(cursor / static_cast<std::size_t>(team_count)) + 1;
}

GameState::GameState(int quiz_id, int team_count, int round_count, Allocation allocation)
    : quiz_id_(quiz_id),
      team_count_(team_count),
      round_count_(round_count),
      allocation_(std::move(allocation)) {}

SlotPhase GameState::phase() const {
  if (std::holds_alternative<AwaitingDiceSlot>(slot_)) return SlotPhase::AwaitingDice;
  if (std::holds_alternative<ActiveSlot>(slot_)) return SlotPhase::Active;
  return SlotPhase::Idle;
}

const SlotQuestion* GameState::current() const {
  if (auto* waiting = std::get_if<AwaitingDiceSlot>(&slot_)) return &waiting->current;
  if (auto* active = std::get_if<ActiveSlot>(&slot_)) return &active->current;
  return nullptr;
}

std::optional<SlotQuestion> GameState::serve_next(const std::vector<Team>& teams, ServeError* error) {
  if (cursor_ >= allocation_.size()) {
    if (error) *error = ServeError::Exhausted;
    return std::nullopt;
  }
  const auto& entry = allocation_[cursor_];
  if (entry.team_index < 0 || static_cast<std::size_t>(entry.team_index) >= teams.size()) {
    if (error) *error = ServeError::UnknownTeam;
    return std::nullopt;
  }

  SlotQuestion next;
  next.question = entry.question;
  next.team = teams[static_cast<std::size_t>(entry.team_index)];
  next.round_number = round_for(cursor_, team_count_);
  next.generation = ++generation_;
  ++cursor_;

  slot_ = AwaitingDiceSlot{next, false};
  if (error) *error = ServeError::None;
  return next;
}

bool GameState::mark_rolled(std::uint64_t generation, std::string* error) {
  auto* waiting = std::get_if<AwaitingDiceSlot>(&slot_);
  if (!waiting || waiting->current.generation != generation) {
    if (error) *error = "No question is waiting for a dice roll";
    return false;
  }
  if (waiting->rolled) {
    if (error) *error = "Dice already rolled for this question";
    return false;
  }
  waiting->rolled = true;
  return true;
}

std::optional<SlotQuestion> GameState::reveal(std::uint64_t generation) {
  auto* waiting = std::get_if<AwaitingDiceSlot>(&slot_);
  if (!waiting || !waiting->rolled || waiting->current.generation != generation) {
    return std::nullopt;
  }
  SlotQuestion revealed = waiting->current;
  slot_ = ActiveSlot{revealed};
  return revealed;
}

bool GameState::add_pending(PendingAnswer answer) {
  if (has_pending(answer.answer_id)) return false;
  pending_.push_back(std::move(answer));
  return true;
}

bool GameState::resolve_pending(int answer_id) {
  auto it = std::remove_if(pending_.begin(), pending_.end(),
                           [answer_id](const PendingAnswer& p) { return p.answer_id == answer_id; });
  if (it == pending_.end()) return false;
  pending_.erase(it, pending_.end());
  if (pending_.empty() && std::holds_alternative<ActiveSlot>(slot_)) {
    slot_ = IdleSlot{};
  }
  return true;
}

bool GameState::has_pending(int answer_id) const {
  return std::any_of(pending_.begin(), pending_.end(),
                     [answer_id](const PendingAnswer& p) { return p.answer_id == answer_id; });
}

}  // namespace trivia::server
