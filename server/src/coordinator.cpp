#include "server/coordinator.hpp"

#include <algorithm>
#include <cctype>

#include <spdlog/spdlog.h>

#include "common/crypto.hpp"
#include "server/allocator.hpp"
#include "server/events.hpp"

namespace trivia::server {

namespace {

constexpr int kRoomCodeAttempts = 16;

void set_error(ActionError* error, ErrorKind kind, std::string message) {
  if (error) {
    error->kind = kind;
    error->message = std::move(message);
  }
}

std::string lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

std::string trim(const std::string& value) {
  auto begin = value.find_first_not_of(" \t\r\n");
  if (begin == std::string::npos) return {};
  auto end = value.find_last_not_of(" \t\r\n");
  return value.substr(begin, end - begin + 1);
}

const Team* find_team(const std::vector<Team>& teams, int team_id) {
  auto it = std::find_if(teams.begin(), teams.end(),
                         [team_id](const Team& t) { return t.id == team_id; });
  return it == teams.end() ? nullptr : &*it;
}

nlohmann::json slot_payload(const SlotQuestion& slot, bool include_answer_key) {
  return {{"question", question_to_json(slot.question, include_answer_key)},
          {"current_team", team_ref_to_json(slot.team)},
          {"round_number", slot.round_number}};
}

}  // namespace

std::string error_code(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::Validation:
      return "VALIDATION_FAILED";
    case ErrorKind::NotFound:
      return "NOT_FOUND";
    case ErrorKind::Unauthorized:
      return "UNAUTHORIZED";
    case ErrorKind::Exhausted:
      return "NO_MORE_QUESTIONS";
    case ErrorKind::Internal:
      return "INTERNAL_ERROR";
  }
  return "INTERNAL_ERROR";
}

nlohmann::json snapshot_to_json(const SessionSnapshot& snapshot, bool facilitator_view) {
  nlohmann::json teams = nlohmann::json::array();
  for (const auto& t : snapshot.teams) {
    teams.push_back(team_to_json(t));
  }
  nlohmann::json pending = nlohmann::json::array();
  for (const auto& p : snapshot.pending_answers) {
    auto j = pending_answer_to_json(p);
    if (!facilitator_view) j.erase("correct_answer");
    pending.push_back(std::move(j));
  }

  nlohmann::json out = {
      {"session",
       {{"id", snapshot.session.id},
        {"status", to_string(snapshot.session.status)},
        {"room_code", snapshot.session.room_code}}},
      {"teams", teams},
      {"leaderboard", leaderboard_to_json(snapshot.leaderboard)},
      {"slot_phase", to_string(snapshot.phase)},
      {"waiting_for_dice", snapshot.phase == SlotPhase::AwaitingDice},
      {"pending_answers", pending},
  };
  if (snapshot.current) {
    out["current_question"] = question_to_json(snapshot.current->question, facilitator_view);
    out["current_team"] = team_ref_to_json(snapshot.current->team);
    out["round_number"] = snapshot.current->round_number;
  } else {
    out["current_question"] = nullptr;
    out["current_team"] = nullptr;
    out["round_number"] = 1;
  }
  return out;
}

SessionCoordinator::SessionCoordinator(GameStore& store, ConnectionRegistry& registry,
                                       Scheduler& scheduler, CoordinatorOptions options)
    : store_(store),
      registry_(registry),
      scheduler_(scheduler),
      options_(options),
      rng_(std::random_device{}()) {}

SessionCoordinator::~SessionCoordinator() {
  std::lock_guard<std::mutex> lock(entries_mtx_);
  for (auto& [id, e] : entries_) {
    std::lock_guard<std::mutex> session_lock(e->mtx);
    cancel_reveal(*e);
  }
}

std::shared_ptr<SessionCoordinator::SessionEntry> SessionCoordinator::entry(int session_id) {
  std::lock_guard<std::mutex> lock(entries_mtx_);
  auto& slot = entries_[session_id];
  if (!slot) slot = std::make_shared<SessionEntry>();
  return slot;
}

std::shared_ptr<SessionCoordinator::SessionEntry> SessionCoordinator::entry_for(
    int session_id, ActionError* error) {
  std::string err;
  auto session = store_.get_session(session_id, &err);
  if (!session) {
    set_error(error, ErrorKind::NotFound, "Game session not found");
    return nullptr;
  }
  // Finished sessions are never tracked again; callers still get a lock to
  // report their status error under.
  if (session->status == SessionStatus::Completed) {
    auto existing = find_entry(session_id);
    return existing ? existing : std::make_shared<SessionEntry>();
  }
  return entry(session_id);
}

std::shared_ptr<SessionCoordinator::SessionEntry> SessionCoordinator::find_entry(
    int session_id) const {
  std::lock_guard<std::mutex> lock(entries_mtx_);
  auto it = entries_.find(session_id);
  return it == entries_.end() ? nullptr : it->second;
}

void SessionCoordinator::drop_entry(int session_id, const std::shared_ptr<SessionEntry>& expected) {
  std::lock_guard<std::mutex> lock(entries_mtx_);
  auto it = entries_.find(session_id);
  if (it != entries_.end() && it->second == expected) entries_.erase(it);
}

bool SessionCoordinator::load_session(int session_id, SessionRecord& session, Quiz& quiz,
                                      ActionError* error) {
  std::string err;
  auto s = store_.get_session(session_id, &err);
  if (!s) {
    set_error(error, ErrorKind::NotFound, "Game session not found");
    return false;
  }
  auto q = store_.get_quiz(s->quiz_id, &err);
  if (!q) {
    set_error(error, ErrorKind::NotFound, "Quiz not found");
    return false;
  }
  session = *s;
  quiz = *q;
  return true;
}

bool SessionCoordinator::load_owned(int actor_id, int session_id, SessionRecord& session,
                                    Quiz& quiz, ActionError* error) {
  if (!load_session(session_id, session, quiz, error)) return false;
  if (quiz.facilitator_id != actor_id) {
    set_error(error, ErrorKind::Unauthorized, "Not authorized to manage this game");
    return false;
  }
  return true;
}

GameState SessionCoordinator::build_game(const Quiz& quiz, const std::vector<Question>& questions) {
  Allocation allocation;
  {
    std::lock_guard<std::mutex> lock(rng_mtx_);
    allocation = allocate(quiz.num_teams, quiz.num_rounds, questions, rng_);
  }
  const auto expected = static_cast<std::size_t>(quiz.num_teams * quiz.num_rounds);
  if (allocation.size() < expected) {
    spdlog::warn("quiz {} allocation short: {} of {} entries", quiz.id, allocation.size(),
                 expected);
  }
  return GameState(quiz.id, quiz.num_teams, quiz.num_rounds, std::move(allocation));
}

GameState* SessionCoordinator::ensure_game(SessionEntry& e, const SessionRecord& session,
                                           const Quiz& quiz, ActionError* error) {
  if (e.game) return &*e.game;
  std::string err;
  auto questions = store_.get_questions_by_quiz(quiz.id, &err);
  if (questions.empty()) {
    set_error(error, ErrorKind::Validation, "No questions found for this quiz");
    return nullptr;
  }
  // The original question order is not recoverable; a fresh shuffle is used.
  e.game.emplace(build_game(quiz, questions));
  spdlog::warn("session {}: live state rebuilt from storage with a new allocation", session.id);
  return &*e.game;
}

void SessionCoordinator::cancel_reveal(SessionEntry& e) {
  if (e.reveal_task != 0) {
    scheduler_.cancel(e.reveal_task);
    e.reveal_task = 0;
  }
}

std::optional<SessionRecord> SessionCoordinator::launch_session(int actor_id, int quiz_id,
                                                                ActionError* error) {
  std::string err;
  auto quiz = store_.get_quiz(quiz_id, &err);
  if (!quiz) {
    set_error(error, ErrorKind::NotFound, "Quiz not found");
    return std::nullopt;
  }
  if (quiz->facilitator_id != actor_id) {
    set_error(error, ErrorKind::Unauthorized, "Not authorized to launch this quiz");
    return std::nullopt;
  }
  if (quiz->num_teams <= 0 || quiz->num_rounds <= 0) {
    set_error(error, ErrorKind::Validation, "Quiz must have at least one team and one round");
    return std::nullopt;
  }

  auto questions = store_.get_questions_by_quiz(quiz_id, &err);
  auto problems = validate_supply(*quiz, count_by_difficulty(questions));
  if (!problems.empty()) {
    std::string msg = "Quiz validation failed:";
    for (const auto& p : problems) msg += "\n" + p;
    set_error(error, ErrorKind::Validation, msg);
    return std::nullopt;
  }

  for (int attempt = 0; attempt < kRoomCodeAttempts; ++attempt) {
    auto code = random_room_code();
    if (code.empty()) break;
    if (store_.get_session_by_room_code(code)) continue;
    auto session = store_.create_session(quiz_id, code, &err);
    if (session) {
      spdlog::info("quiz {} launched as session {} (room {})", quiz_id, session->id, code);
      return session;
    }
  }
  set_error(error, ErrorKind::Internal, "Could not allocate a room code: " + err);
  return std::nullopt;
}

std::optional<Team> SessionCoordinator::join_session(const std::string& room_code,
                                                     const std::string& team_name,
                                                     ActionError* error) {
  std::string err;
  auto found = store_.get_session_by_room_code(room_code, &err);
  if (!found) {
    set_error(error, ErrorKind::NotFound, "Game session not found. Please check the room code.");
    return std::nullopt;
  }

  auto name = trim(team_name);
  if (static_cast<int>(name.size()) < options_.min_team_name ||
      static_cast<int>(name.size()) > options_.max_team_name) {
    set_error(error, ErrorKind::Validation,
              "Team name must be between " + std::to_string(options_.min_team_name) + " and " +
                  std::to_string(options_.max_team_name) + " characters");
    return std::nullopt;
  }

  auto e = entry_for(found->id, error);
  if (!e) return std::nullopt;
  std::lock_guard<std::mutex> lock(e->mtx);

  SessionRecord session;
  Quiz quiz;
  if (!load_session(found->id, session, quiz, error)) return std::nullopt;
  if (session.status != SessionStatus::Waiting) {
    set_error(error, ErrorKind::Validation, "Game has already started. Cannot join now.");
    return std::nullopt;
  }

  auto teams = store_.get_teams_by_session(session.id, &err);
  if (static_cast<int>(teams.size()) >= quiz.num_teams) {
    set_error(error, ErrorKind::Validation,
              "Game is full. Maximum " + std::to_string(quiz.num_teams) + " teams allowed.");
    return std::nullopt;
  }
  auto wanted = lower(name);
  for (const auto& t : teams) {
    if (lower(t.name) == wanted) {
      set_error(error, ErrorKind::Validation,
                "Team name already taken. Please choose a different name.");
      return std::nullopt;
    }
  }

  auto team = store_.create_team(session.id, name, &err);
  if (!team) {
    set_error(error, ErrorKind::Internal, "Could not create team: " + err);
    return std::nullopt;
  }
  spdlog::info("session {}: team {} '{}' joined (order {})", session.id, team->id, team->name,
               team->join_order);

  auto payload = team_to_json(*team);
  payload["session_id"] = session.id;
  registry_.broadcast(session.id, make_notification(events::kTeamJoined, payload));
  return team;
}

bool SessionCoordinator::start_game(int actor_id, int session_id, ActionError* error) {
  auto e = entry_for(session_id, error);
  if (!e) return false;
  std::lock_guard<std::mutex> lock(e->mtx);

  SessionRecord session;
  Quiz quiz;
  if (!load_owned(actor_id, session_id, session, quiz, error)) return false;

  std::string err;
  auto teams = store_.get_teams_by_session(session_id, &err);
  if (!can_start(session.status, static_cast<int>(teams.size()), quiz.num_teams, &err)) {
    set_error(error, ErrorKind::Validation, err);
    return false;
  }

  auto questions = store_.get_questions_by_quiz(quiz.id, &err);
  if (questions.empty()) {
    set_error(error, ErrorKind::Validation, "No questions found for this quiz");
    return false;
  }
  if (!store_.update_session_status(session_id, SessionStatus::InProgress, &err)) {
    set_error(error, ErrorKind::Internal, "Could not start game: " + err);
    return false;
  }

  cancel_reveal(*e);
  e->game.emplace(build_game(quiz, questions));
  spdlog::info("session {}: game started, {} questions allocated", session_id,
               e->game->allocation().size());

  registry_.broadcast(session_id, make_notification(events::kGameStarted,
                                                    {{"session_id", session_id},
                                                     {"num_rounds", quiz.num_rounds},
                                                     {"num_teams", quiz.num_teams}}));
  return true;
}

std::optional<SlotQuestion> SessionCoordinator::serve_next_question(int actor_id, int session_id,
                                                                    ActionError* error) {
  auto e = entry_for(session_id, error);
  if (!e) return std::nullopt;
  std::lock_guard<std::mutex> lock(e->mtx);

  SessionRecord session;
  Quiz quiz;
  if (!load_owned(actor_id, session_id, session, quiz, error)) return std::nullopt;
  if (session.status != SessionStatus::InProgress) {
    set_error(error, ErrorKind::Validation, "Game is not in progress");
    return std::nullopt;
  }

  GameState* game = ensure_game(*e, session, quiz, error);
  if (!game) return std::nullopt;

  std::string err;
  auto teams = store_.get_teams_by_session(session_id, &err);
  if (teams.empty()) {
    set_error(error, ErrorKind::Validation, "No teams found in game");
    return std::nullopt;
  }

  ServeError serve_error = ServeError::None;
  auto served = game->serve_next(teams, &serve_error);
  if (!served) {
    if (serve_error == ServeError::Exhausted) {
      set_error(error, ErrorKind::Exhausted, "No more questions available - game complete");
    } else {
      set_error(error, ErrorKind::Validation, "Allocated team is not part of this game");
    }
    return std::nullopt;
  }

  // A reveal still pending belongs to the superseded slot.
  cancel_reveal(*e);
  spdlog::info("session {}: question {} served to team {} (round {}, slot {})", session_id,
               served->question.id, served->team.id, served->round_number, served->generation);

  registry_.broadcast(session_id,
                      make_notification(events::kQuestionReadyForDice,
                                        {{"team_id", served->team.id},
                                         {"team_name", served->team.name},
                                         {"round_number", served->round_number}}));
  return served;
}

std::optional<DiceResult> SessionCoordinator::roll_dice(int session_id, std::optional<int> value,
                                                        ActionError* error) {
  if (value && (*value < 1 || *value > 6)) {
    set_error(error, ErrorKind::Validation, "Dice value must be between 1 and 6");
    return std::nullopt;
  }

  auto e = entry_for(session_id, error);
  if (!e) return std::nullopt;
  std::lock_guard<std::mutex> lock(e->mtx);

  SessionRecord session;
  Quiz quiz;
  if (!load_session(session_id, session, quiz, error)) return std::nullopt;
  if (session.status != SessionStatus::InProgress) {
    set_error(error, ErrorKind::Validation, "Game is not in progress");
    return std::nullopt;
  }
  GameState* game = ensure_game(*e, session, quiz, error);
  if (!game) return std::nullopt;

  const SlotQuestion* current = game->current();
  if (!current || game->phase() != SlotPhase::AwaitingDice) {
    set_error(error, ErrorKind::Validation, "No question is waiting for a dice roll");
    return std::nullopt;
  }
  DiceResult result;
  result.slot = *current;

  std::string err;
  if (!game->mark_rolled(result.slot.generation, &err)) {
    set_error(error, ErrorKind::Validation, err);
    return std::nullopt;
  }

  if (value) {
    result.value = *value;
  } else {
    std::lock_guard<std::mutex> rng_lock(rng_mtx_);
    result.value = std::uniform_int_distribution<int>(1, 6)(rng_);
  }

  registry_.broadcast(session_id, make_notification(events::kDiceRolled,
                                                    {{"value", result.value},
                                                     {"team_id", result.slot.team.id},
                                                     {"team_name", result.slot.team.name},
                                                     {"round_number", result.slot.round_number}}));

  const auto generation = result.slot.generation;
  cancel_reveal(*e);
  e->reveal_task = scheduler_.schedule_after(
      options_.reveal_delay, [this, session_id, generation] { reveal(session_id, generation); });
  if (e->reveal_task == 0) {
    spdlog::warn("session {}: scheduler stopped, slot {} will not be revealed", session_id,
                 generation);
  }
  spdlog::info("session {}: team {} rolled {}", session_id, result.slot.team.id, result.value);
  return result;
}

void SessionCoordinator::reveal(int session_id, std::uint64_t generation) {
  auto e = find_entry(session_id);
  if (!e) {
    spdlog::info("session {}: reveal of slot {} dropped, session closed", session_id, generation);
    return;
  }
  std::lock_guard<std::mutex> lock(e->mtx);
  if (!e->game) return;
  auto revealed = e->game->reveal(generation);
  if (!revealed) {
    spdlog::info("session {}: stale reveal of slot {} suppressed", session_id, generation);
    return;
  }
  e->reveal_task = 0;
  registry_.broadcast(session_id,
                      make_notification(events::kQuestionServed, slot_payload(*revealed, false)));
}

std::optional<PendingAnswer> SessionCoordinator::submit_answer(const AnswerSubmission& submission,
                                                               ActionError* error) {
  auto e = entry_for(submission.session_id, error);
  if (!e) return std::nullopt;
  std::lock_guard<std::mutex> lock(e->mtx);

  SessionRecord session;
  Quiz quiz;
  if (!load_session(submission.session_id, session, quiz, error)) return std::nullopt;
  if (session.status != SessionStatus::InProgress) {
    set_error(error, ErrorKind::Validation, "Game is not in progress");
    return std::nullopt;
  }

  std::string err;
  auto teams = store_.get_teams_by_session(session.id, &err);
  const Team* team = find_team(teams, submission.team_id);
  if (!team) {
    set_error(error, ErrorKind::Validation, "Team is not part of this game");
    return std::nullopt;
  }
  auto question = store_.get_question(submission.question_id, &err);
  if (!question || question->quiz_id != quiz.id) {
    set_error(error, ErrorKind::Validation, "Question is not part of this quiz");
    return std::nullopt;
  }

  GameState* game = ensure_game(*e, session, quiz, error);
  if (!game) return std::nullopt;

  AnswerRecord record;
  record.session_id = session.id;
  record.team_id = team->id;
  record.question_id = question->id;
  record.submitted_answer = submission.submitted_answer;
  record.round_number = submission.round_number;
  if (record.round_number <= 0) {
    const SlotQuestion* current = game->current();
    record.round_number = current ? current->round_number : 1;
  }

  auto stored = store_.create_answer(record, &err);
  if (!stored) {
    set_error(error, ErrorKind::Internal, "Could not record answer: " + err);
    return std::nullopt;
  }

  auto pending = make_pending_answer(*stored, *team, *question);
  game->add_pending(pending);
  spdlog::info("session {}: answer {} from team {} for question {}", session.id, stored->id,
               team->id, question->id);

  registry_.broadcast(session.id, make_notification(events::kAnswerSubmitted,
                                                    {{"team_id", team->id},
                                                     {"team_name", team->name}}));
  registry_.send_to_facilitators(
      session.id, make_notification(events::kAnswerSubmittedDetails, pending_answer_to_json(pending)));
  return pending;
}

std::optional<GradeResult> SessionCoordinator::grade_answer(int actor_id, int session_id,
                                                            const GradeDecision& decision,
                                                            ActionError* error) {
  if (decision.points_awarded < 0) {
    set_error(error, ErrorKind::Validation, "Points awarded cannot be negative");
    return std::nullopt;
  }

  auto e = entry_for(session_id, error);
  if (!e) return std::nullopt;
  std::lock_guard<std::mutex> lock(e->mtx);

  SessionRecord session;
  Quiz quiz;
  if (!load_owned(actor_id, session_id, session, quiz, error)) return std::nullopt;
  if (session.status != SessionStatus::InProgress) {
    set_error(error, ErrorKind::Validation, "Game is not in progress");
    return std::nullopt;
  }

  std::string err;
  auto answer = store_.get_answer(decision.answer_id, &err);
  if (!answer || answer->session_id != session_id) {
    set_error(error, ErrorKind::NotFound, "Answer not found");
    return std::nullopt;
  }
  if (answer->is_correct.has_value()) {
    set_error(error, ErrorKind::Validation, "Answer already graded");
    return std::nullopt;
  }

  GameState* game = ensure_game(*e, session, quiz, error);
  if (!game) return std::nullopt;

  // The grade and the score move are stored together or not at all, so a
  // failed grade leaves the answer pending and can be retried.
  const int points = decision.is_correct ? decision.points_awarded : 0;
  auto graded = store_.grade_answer(decision.answer_id, decision.is_correct, points, &err);
  if (!graded) {
    set_error(error, ErrorKind::Internal, "Could not grade answer: " + err);
    return std::nullopt;
  }

  auto teams = store_.get_teams_by_session(session_id, &err);
  GradeResult result;
  result.answer = *graded;
  if (const Team* team = find_team(teams, graded->team_id)) result.team = *team;
  result.leaderboard = rank(teams);

  std::string correct_answer;
  if (auto question = store_.get_question(graded->question_id, &err)) {
    correct_answer = question->model_answer.empty() ? correct_answer_label(*question)
                                                    : question->model_answer;
  }

  game->resolve_pending(decision.answer_id);
  spdlog::info("session {}: answer {} graded {} (+{}), {} still pending", session_id,
               decision.answer_id, decision.is_correct ? "correct" : "incorrect", points,
               game->pending().size());

  nlohmann::json graded_payload = {{"answer_id", graded->id},
                                   {"team_id", graded->team_id},
                                   {"team_name", result.team.name},
                                   {"is_correct", decision.is_correct},
                                   {"points_awarded", points}};
  if (correct_answer.empty()) {
    graded_payload["correct_answer"] = nullptr;
  } else {
    graded_payload["correct_answer"] = correct_answer;
  }
  registry_.broadcast(session_id, make_notification(events::kAnswerGraded, graded_payload));
  registry_.broadcast(session_id,
                      make_notification(events::kLeaderboardUpdate,
                                        {{"leaderboard", leaderboard_to_json(result.leaderboard)}}));
  return result;
}

std::optional<SessionSnapshot> SessionCoordinator::get_state(int session_id, ActionError* error) {
  auto e = find_entry(session_id);
  std::unique_lock<std::mutex> lock;
  if (e) lock = std::unique_lock<std::mutex>(e->mtx);

  std::string err;
  auto session = store_.get_session(session_id, &err);
  if (!session) {
    set_error(error, ErrorKind::NotFound, "Game session not found");
    return std::nullopt;
  }

  SessionSnapshot snap;
  snap.session = *session;
  snap.teams = store_.get_teams_by_session(session_id, &err);
  snap.leaderboard = rank(snap.teams);
  if (e && e->game) {
    snap.phase = e->game->phase();
    if (const SlotQuestion* current = e->game->current()) snap.current = *current;
    snap.pending_answers = e->game->pending();
  }
  return snap;
}

std::optional<std::vector<Standing>> SessionCoordinator::leaderboard(int session_id,
                                                                    ActionError* error) {
  std::string err;
  if (!store_.get_session(session_id, &err)) {
    set_error(error, ErrorKind::NotFound, "Game session not found");
    return std::nullopt;
  }
  return rank(store_.get_teams_by_session(session_id, &err));
}

bool SessionCoordinator::end_game(int actor_id, int session_id, ActionError* error) {
  auto e = entry_for(session_id, error);
  if (!e) return false;
  {
    std::lock_guard<std::mutex> lock(e->mtx);

    SessionRecord session;
    Quiz quiz;
    if (!load_owned(actor_id, session_id, session, quiz, error)) return false;
    if (session.status == SessionStatus::Completed) {
      set_error(error, ErrorKind::Validation, "Game has already ended");
      return false;
    }

    std::string err;
    if (!store_.update_session_status(session_id, SessionStatus::Completed, &err)) {
      set_error(error, ErrorKind::Internal, "Could not end game: " + err);
      return false;
    }
    cancel_reveal(*e);
    e->game.reset();

    auto standings = rank(store_.get_teams_by_session(session_id, &err));
    nlohmann::json winner = nullptr;
    if (!standings.empty()) {
      winner = {{"id", standings.front().id},
                {"name", standings.front().name},
                {"position", standings.front().position},
                {"score", standings.front().score}};
    }
    spdlog::info("session {}: game ended", session_id);
    registry_.broadcast(session_id,
                        make_notification(events::kGameEnded,
                                          {{"winner", winner},
                                           {"leaderboard", leaderboard_to_json(standings)}}));
  }
  drop_entry(session_id, e);
  return true;
}

std::optional<ConnectionId> SessionCoordinator::subscribe(std::shared_ptr<ClientChannel> channel,
                                                          int session_id, Role role,
                                                          std::optional<int> team_id,
                                                          std::optional<int> actor_id,
                                                          ActionError* error) {
  SessionRecord session;
  Quiz quiz;
  if (!load_session(session_id, session, quiz, error)) return std::nullopt;

  if (role == Role::Facilitator) {
    if (!actor_id || *actor_id != quiz.facilitator_id) {
      set_error(error, ErrorKind::Unauthorized, "Not authorized to facilitate this game");
      return std::nullopt;
    }
    team_id.reset();
  } else {
    std::string err;
    auto teams = store_.get_teams_by_session(session_id, &err);
    if (!team_id || !find_team(teams, *team_id)) {
      set_error(error, ErrorKind::Validation, "Players must subscribe with a team of this game");
      return std::nullopt;
    }
  }
  return registry_.add(std::move(channel), session_id, role, team_id);
}

void SessionCoordinator::disconnect(const ClientChannel* channel) {
  registry_.remove_channel(channel);
}

std::size_t SessionCoordinator::tracked_sessions() const {
  std::lock_guard<std::mutex> lock(entries_mtx_);
  return entries_.size();
}

bool SessionCoordinator::has_live_state(int session_id) const {
  auto e = find_entry(session_id);
  if (!e) return false;
  std::lock_guard<std::mutex> lock(e->mtx);
  return e->game.has_value();
}

std::optional<SlotPhase> SessionCoordinator::slot_phase(int session_id) const {
  auto e = find_entry(session_id);
  if (!e) return std::nullopt;
  std::lock_guard<std::mutex> lock(e->mtx);
  if (!e->game) return std::nullopt;
  return e->game->phase();
}

}  // namespace trivia::server
