#pragma once

#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "server/connection_registry.hpp"
#include "server/leaderboard.hpp"
#include "server/model.hpp"
#include "server/scheduler.hpp"
#include "server/session_state.hpp"
#include "server/store.hpp"

namespace trivia::server {

enum class ErrorKind { Validation, NotFound, Unauthorized, Exhausted, Internal };

struct ActionError {
  ErrorKind kind{ErrorKind::Internal};
  std::string message;
};

// Wire error code for an error kind, e.g. "NO_MORE_QUESTIONS".
std::string error_code(ErrorKind kind);

struct CoordinatorOptions {
  // Pause between the dice_rolled broadcast and the question reveal.
  std::chrono::milliseconds reveal_delay{3000};
  int min_team_name = 2;
  int max_team_name = 50;
};

struct AnswerSubmission {
  int session_id{};
  int team_id{};
  int question_id{};
  std::string submitted_answer;
  int round_number{0};  // 0 means "the round of the question in the slot"
};

struct GradeDecision {
  int answer_id{};
  bool is_correct{false};
  int points_awarded{0};
};

struct GradeResult {
  AnswerRecord answer;
  Team team;
  std::vector<Standing> leaderboard;
};

struct DiceResult {
  int value{};
  SlotQuestion slot;
};

// Everything a client needs to resynchronise after a reconnect.
struct SessionSnapshot {
  SessionRecord session;
  std::vector<Team> teams;
  std::vector<Standing> leaderboard;
  SlotPhase phase{SlotPhase::Idle};
  std::optional<SlotQuestion> current;
  std::vector<PendingAnswer> pending_answers;
};

// Facilitator view includes the answer key of the in-flight question.
nlohmann::json snapshot_to_json(const SessionSnapshot& snapshot, bool facilitator_view);

// Single authority for every live session in the process. Actions on one
// session are serialised by that session's mutex; sessions never share a lock.
// Events are issued while that mutex is held, so every connection sees them in
// transition order.
//
// The scheduler must be shut down before the coordinator is destroyed.
class SessionCoordinator {
 public:
  SessionCoordinator(GameStore& store, ConnectionRegistry& registry, Scheduler& scheduler,
                     CoordinatorOptions options = {});
  ~SessionCoordinator();

  SessionCoordinator(const SessionCoordinator&) = delete;
  SessionCoordinator& operator=(const SessionCoordinator&) = delete;

  std::optional<SessionRecord> launch_session(int actor_id, int quiz_id, ActionError* error);

  std::optional<Team> join_session(const std::string& room_code, const std::string& team_name,
                                   ActionError* error);

  bool start_game(int actor_id, int session_id, ActionError* error);

  // Fails with ErrorKind::Exhausted once the allocation is used up; the caller
  // decides whether that ends the game.
  std::optional<SlotQuestion> serve_next_question(int actor_id, int session_id,
                                                  ActionError* error);

  // `value` is the client's roll; the server rolls when it is absent.
  std::optional<DiceResult> roll_dice(int session_id, std::optional<int> value,
                                      ActionError* error);

  std::optional<PendingAnswer> submit_answer(const AnswerSubmission& submission,
                                             ActionError* error);

  std::optional<GradeResult> grade_answer(int actor_id, int session_id,
                                          const GradeDecision& decision, ActionError* error);

  std::optional<SessionSnapshot> get_state(int session_id, ActionError* error);

  std::optional<std::vector<Standing>> leaderboard(int session_id, ActionError* error);

  bool end_game(int actor_id, int session_id, ActionError* error);

  // Players must name a team of the session; facilitators must own its quiz.
  std::optional<ConnectionId> subscribe(std::shared_ptr<ClientChannel> channel, int session_id,
                                        Role role, std::optional<int> team_id,
                                        std::optional<int> actor_id, ActionError* error);
  void disconnect(const ClientChannel* channel);

  bool has_live_state(int session_id) const;
  // Sessions with an entry in the live table.
  std::size_t tracked_sessions() const;
  std::optional<SlotPhase> slot_phase(int session_id) const;

 private:
  struct SessionEntry {
    std::mutex mtx;
    std::optional<GameState> game;
    Scheduler::TaskId reveal_task{0};
  };

  std::shared_ptr<SessionEntry> entry(int session_id);
  // Entry for a stored session; nullptr with NotFound when there is none.
  std::shared_ptr<SessionEntry> entry_for(int session_id, ActionError* error);
  std::shared_ptr<SessionEntry> find_entry(int session_id) const;
  void drop_entry(int session_id, const std::shared_ptr<SessionEntry>& expected);

  bool load_session(int session_id, SessionRecord& session, Quiz& quiz, ActionError* error);
  bool load_owned(int actor_id, int session_id, SessionRecord& session, Quiz& quiz,
                  ActionError* error);
  // Returns the live game, rebuilding it from storage if the process lost it.
  GameState* ensure_game(SessionEntry& e, const SessionRecord& session, const Quiz& quiz,
                         ActionError* error);
  GameState build_game(const Quiz& quiz, const std::vector<Question>& questions);

  void cancel_reveal(SessionEntry& e);
  void reveal(int session_id, std::uint64_t generation);

  GameStore& store_;
  ConnectionRegistry& registry_;
  Scheduler& scheduler_;
  CoordinatorOptions options_;

  mutable std::mutex entries_mtx_;
  std::map<int, std::shared_ptr<SessionEntry>> entries_;

  std::mutex rng_mtx_;
  std::mt19937 rng_;
};

}  // namespace trivia::server
