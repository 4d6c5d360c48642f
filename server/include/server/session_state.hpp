#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

#include "server/allocator.hpp"
#include "server/model.hpp"

namespace trivia::server {

// The question occupying the in-flight slot, with whoever must answer it.
struct SlotQuestion {
  Question question;
  Team team;
  int round_number{1};
  std::uint64_t generation{0};
};

struct IdleSlot {};

struct AwaitingDiceSlot {
  SlotQuestion current;
  bool rolled{false};
};

struct ActiveSlot {
  SlotQuestion current;
};

using Slot = std::variant<IdleSlot, AwaitingDiceSlot, ActiveSlot>;

enum class SlotPhase { Idle, AwaitingDice, Active };

std::string to_string(SlotPhase phase);

// A submitted answer waiting for the facilitator's decision.
struct PendingAnswer {
  int answer_id{};
  int team_id{};
  std::string team_name;
  int question_id{};
  QuestionType question_type{QuestionType::MultipleChoice};
  std::string submitted_answer;
  int round_number{1};
  bool auto_graded{false};
  bool auto_is_correct{false};
  int auto_points{0};
  std::string correct_answer;
};

nlohmann::json pending_answer_to_json(const PendingAnswer& answer);

// Case-insensitive comparison of the submitted option letter against the key.
bool check_multiple_choice(const Question& question, const std::string& submitted);

// Snapshot of a new submission; multiple-choice answers carry an auto-grading hint.
PendingAnswer make_pending_answer(const AnswerRecord& record, const Team& team,
                                  const Question& question);

// Rules for waiting -> in_progress. The joined team count must equal the
// configured count exactly.
bool can_start(SessionStatus status, int joined_teams, int configured_teams, std::string* error);

// One full pass over all teams is a round.
int round_for(std::size_t cursor, int team_count);

enum class ServeError { None, Exhausted, UnknownTeam };

class GameState {
 public:
  GameState(int quiz_id, int team_count, int round_count, Allocation allocation);

  int quiz_id() const { return quiz_id_; }
  int team_count() const { return team_count_; }
  int round_count() const { return round_count_; }
  const Allocation& allocation() const { return allocation_; }
  std::size_t cursor() const { return cursor_; }
  std::size_t remaining() const { return allocation_.size() - cursor_; }
  std::uint64_t generation() const { return generation_; }

  const Slot& slot() const { return slot_; }
  SlotPhase phase() const;
  // Question in the slot regardless of phase, nullptr when idle.
  const SlotQuestion* current() const;

  // Consumes the next allocation entry and parks it awaiting the dice roll.
  // Anything already in the slot is superseded. `teams` must be in join order.
  std::optional<SlotQuestion> serve_next(const std::vector<Team>& teams, ServeError* error);

  // Records the roll for the slot of `generation`; a slot can be rolled once.
  bool mark_rolled(std::uint64_t generation, std::string* error);

  // Promotes a rolled slot to active. Returns nothing when the slot moved on
  // since the roll, which suppresses stale reveals.
  std::optional<SlotQuestion> reveal(std::uint64_t generation);

  // Returns false if the answer is already pending.
  bool add_pending(PendingAnswer answer);
  // Removes the answer; clearing the last one returns an active slot to idle.
  bool resolve_pending(int answer_id);
  bool has_pending(int answer_id) const;
  const std::vector<PendingAnswer>& pending() const { return pending_; }

 private:
  int quiz_id_;
  int team_count_;
  int round_count_;
  Allocation allocation_;
  std::size_t cursor_{0};
  std::uint64_t generation_{0};
  Slot slot_{IdleSlot{}};
  std::vector<PendingAnswer> pending_;
};

}  // namespace trivia::server
