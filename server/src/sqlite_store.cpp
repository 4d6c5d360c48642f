#include "server/sqlite_store.hpp"

#include <spdlog/spdlog.h>

#include "common/message.hpp"

namespace trivia::server {

namespace {

const char* kSchema = R"SQL(
CREATE TABLE IF NOT EXISTS quizzes (
  id INTEGER PRIMARY KEY AUTOINCREMENT,
  name TEXT NOT NULL,
  facilitator_id INTEGER NOT NULL,
  num_teams INTEGER NOT NULL,
  num_rounds INTEGER NOT NULL,
  easy_count INTEGER NOT NULL DEFAULT 1,
  medium_count INTEGER NOT NULL DEFAULT 1,
  hard_count INTEGER NOT NULL DEFAULT 1,
  insane_count INTEGER NOT NULL DEFAULT 1,
  created_at INTEGER NOT NULL
);
CREATE TABLE IF NOT EXISTS questions (
  id INTEGER PRIMARY KEY AUTOINCREMENT,
  quiz_id INTEGER NOT NULL REFERENCES quizzes(id),
  text TEXT NOT NULL,
  question_type TEXT NOT NULL,
  difficulty TEXT NOT NULL,
  time_limit INTEGER NOT NULL,
  option_a TEXT, option_b TEXT, option_c TEXT, option_d TEXT,
  correct_answer TEXT,
  model_answer TEXT,
  created_at INTEGER NOT NULL
);
CREATE TABLE IF NOT EXISTS game_sessions (
  id INTEGER PRIMARY KEY AUTOINCREMENT,
  quiz_id INTEGER NOT NULL REFERENCES quizzes(id),
  room_code TEXT NOT NULL UNIQUE,
  status TEXT NOT NULL DEFAULT 'waiting',
  created_at INTEGER NOT NULL,
  started_at INTEGER NOT NULL DEFAULT 0,
  completed_at INTEGER NOT NULL DEFAULT 0
);
CREATE TABLE IF NOT EXISTS teams (
  id INTEGER PRIMARY KEY AUTOINCREMENT,
  session_id INTEGER NOT NULL REFERENCES game_sessions(id),
  team_name TEXT NOT NULL,
  position INTEGER NOT NULL DEFAULT 0,
  score INTEGER NOT NULL DEFAULT 0,
  join_order INTEGER NOT NULL,
  created_at INTEGER NOT NULL
);
CREATE TABLE IF NOT EXISTS answers (
  id INTEGER PRIMARY KEY AUTOINCREMENT,
  session_id INTEGER NOT NULL REFERENCES game_sessions(id),
  team_id INTEGER NOT NULL REFERENCES teams(id),
  question_id INTEGER NOT NULL REFERENCES questions(id),
  submitted_answer TEXT,
  round_number INTEGER NOT NULL,
  is_correct INTEGER,
  points_awarded INTEGER NOT NULL DEFAULT 0,
  submitted_at INTEGER NOT NULL,
  graded_at INTEGER NOT NULL DEFAULT 0
);
CREATE INDEX IF NOT EXISTS idx_questions_quiz ON questions(quiz_id);
CREATE INDEX IF NOT EXISTS idx_teams_session ON teams(session_id);
CREATE INDEX IF NOT EXISTS idx_answers_session ON answers(session_id);
)SQL";

std::string column_text(sqlite3_stmt* stmt, int col) {
  const unsigned char* ptr = sqlite3_column_text(stmt, col);
  return ptr ? reinterpret_cast<const char*>(ptr) : "";
}

Question read_question(sqlite3_stmt* stmt) {
  Question q;
  q.id = sqlite3_column_int(stmt, 0);
  q.quiz_id = sqlite3_column_int(stmt, 1);
  q.text = column_text(stmt, 2);
  q.type = question_type_from_string(column_text(stmt, 3)).value_or(QuestionType::MultipleChoice);
  q.difficulty = difficulty_from_string(column_text(stmt, 4)).value_or(Difficulty::Easy);
  q.time_limit = sqlite3_column_int(stmt, 5);
  q.option_a = column_text(stmt, 6);
  q.option_b = column_text(stmt, 7);
  q.option_c = column_text(stmt, 8);
  q.option_d = column_text(stmt, 9);
  q.correct_answer = column_text(stmt, 10);
  q.model_answer = column_text(stmt, 11);
  return q;
}

Team read_team(sqlite3_stmt* stmt) {
  Team t;
  t.id = sqlite3_column_int(stmt, 0);
  t.session_id = sqlite3_column_int(stmt, 1);
  t.name = column_text(stmt, 2);
  t.position = sqlite3_column_int(stmt, 3);
  t.score = sqlite3_column_int(stmt, 4);
  t.join_order = sqlite3_column_int(stmt, 5);
  return t;
}

AnswerRecord read_answer(sqlite3_stmt* stmt) {
  AnswerRecord a;
  a.id = sqlite3_column_int(stmt, 0);
  a.session_id = sqlite3_column_int(stmt, 1);
  a.team_id = sqlite3_column_int(stmt, 2);
  a.question_id = sqlite3_column_int(stmt, 3);
  a.submitted_answer = column_text(stmt, 4);
  a.round_number = sqlite3_column_int(stmt, 5);
  if (sqlite3_column_type(stmt, 6) != SQLITE_NULL) {
    a.is_correct = sqlite3_column_int(stmt, 6) != 0;
  }
  a.points_awarded = sqlite3_column_int(stmt, 7);
  a.submitted_at = static_cast<std::uint64_t>(sqlite3_column_int64(stmt, 8));
  a.graded_at = static_cast<std::uint64_t>(sqlite3_column_int64(stmt, 9));
  return a;
}

constexpr const char* kQuestionColumns =
    "SELECT id, quiz_id, text, question_type, difficulty, time_limit, option_a, option_b, "
    "option_c, option_d, correct_answer, model_answer FROM questions ";
constexpr const char* kTeamColumns =
    "SELECT id, session_id, team_name, position, score, join_order FROM teams ";
constexpr const char* kAnswerColumns =
    "SELECT id, session_id, team_id, question_id, submitted_answer, round_number, is_correct, "
    "points_awarded, submitted_at, graded_at FROM answers ";
constexpr const char* kSessionColumns =
    "SELECT id, quiz_id, room_code, status, created_at, started_at, completed_at "
    "FROM game_sessions ";

}  // namespace

SqliteStore::SqliteStore(std::string db_path) : db_path_(std::move(db_path)) {
  std::string error;
  if (!open_db()) {
    spdlog::error("cannot open database {}", db_path_);
  } else if (!ensure_schema(&error)) {
    spdlog::error("schema setup failed for {}: {}", db_path_, error);
  }
}

SqliteStore::~SqliteStore() {
  if (db_) sqlite3_close(db_);
}

bool SqliteStore::open_db() {
  if (db_) return true;
  if (sqlite3_open(db_path_.c_str(), &db_) != SQLITE_OK) {
    sqlite3_close(db_);
    db_ = nullptr;
    return false;
  }
  sqlite3_busy_timeout(db_, 2000);
  return true;
}

bool SqliteStore::ensure_schema(std::string* error) {
  std::lock_guard<std::recursive_mutex> lock(db_mutex_);
  return exec(kSchema, error);
}

bool SqliteStore::exec(const char* sql, std::string* error) {
  std::lock_guard<std::recursive_mutex> lock(db_mutex_);
  char* errmsg = nullptr;
  if (sqlite3_exec(db_, sql, nullptr, nullptr, &errmsg) != SQLITE_OK) {
    if (error) *error = errmsg ? errmsg : sqlite3_errmsg(db_);
    sqlite3_free(errmsg);
    return false;
  }
  return true;
}

std::optional<Quiz> SqliteStore::create_quiz(const Quiz& quiz, std::string* error) {
  std::lock_guard<std::recursive_mutex> lock(db_mutex_);
  if (!open_db()) {
    if (error) *error = "DB open failed";
    return std::nullopt;
  }
  const char* sql =
      "INSERT INTO quizzes(name, facilitator_id, num_teams, num_rounds, easy_count, medium_count, "
      "hard_count, insane_count, created_at) VALUES(?,?,?,?,?,?,?,?,?);";
  sqlite3_stmt* stmt = nullptr;
  if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
    if (error) *error = sqlite3_errmsg(db_);
    return std::nullopt;
  }
  sqlite3_bind_text(stmt, 1, quiz.name.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_int(stmt, 2, quiz.facilitator_id);
  sqlite3_bind_int(stmt, 3, quiz.num_teams);
  sqlite3_bind_int(stmt, 4, quiz.num_rounds);
  sqlite3_bind_int(stmt, 5, quiz.easy_count);
  sqlite3_bind_int(stmt, 6, quiz.medium_count);
  sqlite3_bind_int(stmt, 7, quiz.hard_count);
  sqlite3_bind_int(stmt, 8, quiz.insane_count);
  sqlite3_bind_int64(stmt, 9, static_cast<sqlite3_int64>(unix_now()));
  if (sqlite3_step(stmt) != SQLITE_DONE) {
    if (error) *error = sqlite3_errmsg(db_);
    sqlite3_finalize(stmt);
    return std::nullopt;
  }
  sqlite3_finalize(stmt);

  Quiz out = quiz;
  out.id = static_cast<int>(sqlite3_last_insert_rowid(db_));
  return out;
}

std::optional<Question> SqliteStore::add_question(const Question& question, std::string* error) {
  std::lock_guard<std::recursive_mutex> lock(db_mutex_);
  if (!open_db()) {
    if (error) *error = "DB open failed";
    return std::nullopt;
  }
  const char* sql =
      "INSERT INTO questions(quiz_id, text, question_type, difficulty, time_limit, option_a, "
      "option_b, option_c, option_d, correct_answer, model_answer, created_at) "
      "VALUES(?,?,?,?,?,?,?,?,?,?,?,?);";
  sqlite3_stmt* stmt = nullptr;
  if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
    if (error) *error = sqlite3_errmsg(db_);
    return std::nullopt;
  }
  auto type = to_string(question.type);
  auto difficulty = to_string(question.difficulty);
  sqlite3_bind_int(stmt, 1, question.quiz_id);
  sqlite3_bind_text(stmt, 2, question.text.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 3, type.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 4, difficulty.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_int(stmt, 5, question.time_limit);
  sqlite3_bind_text(stmt, 6, question.option_a.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 7, question.option_b.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 8, question.option_c.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 9, question.option_d.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 10, question.correct_answer.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 11, question.model_answer.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_int64(stmt, 12, static_cast<sqlite3_int64>(unix_now()));
  if (sqlite3_step(stmt) != SQLITE_DONE) {
    if (error) *error = sqlite3_errmsg(db_);
    sqlite3_finalize(stmt);
    return std::nullopt;
  }
  sqlite3_finalize(stmt);

  Question out = question;
  out.id = static_cast<int>(sqlite3_last_insert_rowid(db_));
  return out;
}

std::optional<Quiz> SqliteStore::get_quiz(int quiz_id, std::string* error) {
  std::lock_guard<std::recursive_mutex> lock(db_mutex_);
  if (!open_db()) {
    if (error) *error = "DB open failed";
    return std::nullopt;
  }
  const char* sql =
      "SELECT id, name, facilitator_id, num_teams, num_rounds, easy_count, medium_count, "
      "hard_count, insane_count FROM quizzes WHERE id = ?;";
  sqlite3_stmt* stmt = nullptr;
  if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
    if (error) *error = sqlite3_errmsg(db_);
    return std::nullopt;
  }
  sqlite3_bind_int(stmt, 1, quiz_id);
  if (sqlite3_step(stmt) != SQLITE_ROW) {
    if (error) *error = "Quiz not found";
    sqlite3_finalize(stmt);
    return std::nullopt;
  }
  Quiz q;
  q.id = sqlite3_column_int(stmt, 0);
  q.name = column_text(stmt, 1);
  q.facilitator_id = sqlite3_column_int(stmt, 2);
  q.num_teams = sqlite3_column_int(stmt, 3);
  q.num_rounds = sqlite3_column_int(stmt, 4);
  q.easy_count = sqlite3_column_int(stmt, 5);
  q.medium_count = sqlite3_column_int(stmt, 6);
  q.hard_count = sqlite3_column_int(stmt, 7);
  q.insane_count = sqlite3_column_int(stmt, 8);
  sqlite3_finalize(stmt);
  return q;
}

std::vector<Question> SqliteStore::get_questions_by_quiz(int quiz_id, std::string* error) {
  std::lock_guard<std::recursive_mutex> lock(db_mutex_);
  std::vector<Question> out;
  if (!open_db()) {
    if (error) *error = "DB open failed";
    return out;
  }
  std::string sql = std::string(kQuestionColumns) + "WHERE quiz_id = ? ORDER BY id;";
  sqlite3_stmt* stmt = nullptr;
  if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
    if (error) *error = sqlite3_errmsg(db_);
    return out;
  }
  sqlite3_bind_int(stmt, 1, quiz_id);
  while (sqlite3_step(stmt) == SQLITE_ROW) {
    out.push_back(read_question(stmt));
  }
  sqlite3_finalize(stmt);
  return out;
}

std::optional<Question> SqliteStore::get_question(int question_id, std::string* error) {
  std::lock_guard<std::recursive_mutex> lock(db_mutex_);
  if (!open_db()) {
    if (error) *error = "DB open failed";
    return std::nullopt;
  }
  std::string sql = std::string(kQuestionColumns) + "WHERE id = ?;";
  sqlite3_stmt* stmt = nullptr;
  if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
    if (error) *error = sqlite3_errmsg(db_);
    return std::nullopt;
  }
  sqlite3_bind_int(stmt, 1, question_id);
  if (sqlite3_step(stmt) != SQLITE_ROW) {
    if (error) *error = "Question not found";
    sqlite3_finalize(stmt);
    return std::nullopt;
  }
  auto q = read_question(stmt);
  sqlite3_finalize(stmt);
  return q;
}

std::optional<SessionRecord> SqliteStore::create_session(int quiz_id, const std::string& room_code,
                                                         std::string* error) {
  std::lock_guard<std::recursive_mutex> lock(db_mutex_);
  if (!open_db()) {
    if (error) *error = "DB open failed";
    return std::nullopt;
  }
  const char* sql =
      "INSERT INTO game_sessions(quiz_id, room_code, status, created_at) "
      "VALUES(?, ?, 'waiting', ?);";
  sqlite3_stmt* stmt = nullptr;
  if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
    if (error) *error = sqlite3_errmsg(db_);
    return std::nullopt;
  }
  const auto now = unix_now();
  sqlite3_bind_int(stmt, 1, quiz_id);
  sqlite3_bind_text(stmt, 2, room_code.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_int64(stmt, 3, static_cast<sqlite3_int64>(now));
  if (sqlite3_step(stmt) != SQLITE_DONE) {
    if (error) *error = sqlite3_errmsg(db_);
    sqlite3_finalize(stmt);
    return std::nullopt;
  }
  sqlite3_finalize(stmt);

  SessionRecord s;
  s.id = static_cast<int>(sqlite3_last_insert_rowid(db_));
  s.quiz_id = quiz_id;
  s.room_code = room_code;
  s.status = SessionStatus::Waiting;
  s.created_at = now;
  return s;
}

std::optional<SessionRecord> SqliteStore::load_session(const char* where, int id,
                                                       const std::string* code,
                                                       std::string* error) {
  std::lock_guard<std::recursive_mutex> lock(db_mutex_);
  if (!open_db()) {
    if (error) *error = "DB open failed";
    return std::nullopt;
  }
  std::string sql = std::string(kSessionColumns) + where;
  sqlite3_stmt* stmt = nullptr;
  if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
    if (error) *error = sqlite3_errmsg(db_);
    return std::nullopt;
  }
  if (code) {
    sqlite3_bind_text(stmt, 1, code->c_str(), -1, SQLITE_TRANSIENT);
  } else {
    sqlite3_bind_int(stmt, 1, id);
  }
  if (sqlite3_step(stmt) != SQLITE_ROW) {
    if (error) *error = "Game session not found";
    sqlite3_finalize(stmt);
    return std::nullopt;
  }
  SessionRecord s;
  s.id = sqlite3_column_int(stmt, 0);
  s.quiz_id = sqlite3_column_int(stmt, 1);
  s.room_code = column_text(stmt, 2);
  s.status = session_status_from_string(column_text(stmt, 3)).value_or(SessionStatus::Waiting);
  s.created_at = static_cast<std::uint64_t>(sqlite3_column_int64(stmt, 4));
  s.started_at = static_cast<std::uint64_t>(sqlite3_column_int64(stmt, 5));
  s.completed_at = static_cast<std::uint64_t>(sqlite3_column_int64(stmt, 6));
  sqlite3_finalize(stmt);
  return s;
}

std::optional<SessionRecord> SqliteStore::get_session(int session_id, std::string* error) {
  return load_session("WHERE id = ?;", session_id, nullptr, error);
}

std::optional<SessionRecord> SqliteStore::get_session_by_room_code(const std::string& room_code,
                                                                   std::string* error) {
  return load_session("WHERE room_code = ?;", 0, &room_code, error);
}

bool SqliteStore::update_session_status(int session_id, SessionStatus status, std::string* error) {
  std::lock_guard<std::recursive_mutex> lock(db_mutex_);
  if (!open_db()) {
    if (error) *error = "DB open failed";
    return false;
  }
  const char* sql = nullptr;
  switch (status) {
    case SessionStatus::InProgress:
      sql = "UPDATE game_sessions SET status = ?, "
            "started_at = CASE WHEN started_at = 0 THEN ? ELSE started_at END WHERE id = ?;";
      break;
    case SessionStatus::Completed:
      sql = "UPDATE game_sessions SET status = ?, completed_at = ? WHERE id = ?;";
      break;
    case SessionStatus::Waiting:
      sql = "UPDATE game_sessions SET status = ? WHERE id = ?;";
      break;
  }
  sqlite3_stmt* stmt = nullptr;
  if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
    if (error) *error = sqlite3_errmsg(db_);
    return false;
  }
  auto value = to_string(status);
  sqlite3_bind_text(stmt, 1, value.c_str(), -1, SQLITE_TRANSIENT);
  if (status == SessionStatus::Waiting) {
    sqlite3_bind_int(stmt, 2, session_id);
  } else {
    sqlite3_bind_int64(stmt, 2, static_cast<sqlite3_int64>(unix_now()));
    sqlite3_bind_int(stmt, 3, session_id);
  }
  bool ok = sqlite3_step(stmt) == SQLITE_DONE;
  if (!ok && error) *error = sqlite3_errmsg(db_);
  sqlite3_finalize(stmt);
  if (ok && sqlite3_changes(db_) == 0) {
    if (error) *error = "Game session not found";
    return false;
  }
  return ok;
}

std::vector<Team> SqliteStore::get_teams_by_session(int session_id, std::string* error) {
  std::lock_guard<std::recursive_mutex> lock(db_mutex_);
  std::vector<Team> out;
  if (!open_db()) {
    if (error) *error = "DB open failed";
    return out;
  }
  std::string sql = std::string(kTeamColumns) + "WHERE session_id = ? ORDER BY join_order;";
  sqlite3_stmt* stmt = nullptr;
  if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
    if (error) *error = sqlite3_errmsg(db_);
    return out;
  }
  sqlite3_bind_int(stmt, 1, session_id);
  while (sqlite3_step(stmt) == SQLITE_ROW) {
    out.push_back(read_team(stmt));
  }
  sqlite3_finalize(stmt);
  return out;
}

std::optional<Team> SqliteStore::get_team(int team_id, std::string* error) {
  std::lock_guard<std::recursive_mutex> lock(db_mutex_);
  std::string sql = std::string(kTeamColumns) + "WHERE id = ?;";
  sqlite3_stmt* stmt = nullptr;
  if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
    if (error) *error = sqlite3_errmsg(db_);
    return std::nullopt;
  }
  sqlite3_bind_int(stmt, 1, team_id);
  if (sqlite3_step(stmt) != SQLITE_ROW) {
    if (error) *error = "Team not found";
    sqlite3_finalize(stmt);
    return std::nullopt;
  }
  auto t = read_team(stmt);
  sqlite3_finalize(stmt);
  return t;
}

std::optional<Team> SqliteStore::create_team(int session_id, const std::string& name,
                                             std::string* error) {
  std::lock_guard<std::recursive_mutex> lock(db_mutex_);
  if (!open_db()) {
    if (error) *error = "DB open failed";
    return std::nullopt;
  }
  // join_order is the number of teams already present.
  const char* sql =
      "INSERT INTO teams(session_id, team_name, position, score, join_order, created_at) "
      "VALUES(?, ?, 0, 0, (SELECT COUNT(*) FROM teams WHERE session_id = ?), ?);";
  sqlite3_stmt* stmt = nullptr;
  if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
    if (error) *error = sqlite3_errmsg(db_);
    return std::nullopt;
  }
  sqlite3_bind_int(stmt, 1, session_id);
  sqlite3_bind_text(stmt, 2, name.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_int(stmt, 3, session_id);
  sqlite3_bind_int64(stmt, 4, static_cast<sqlite3_int64>(unix_now()));
  if (sqlite3_step(stmt) != SQLITE_DONE) {
    if (error) *error = sqlite3_errmsg(db_);
    sqlite3_finalize(stmt);
    return std::nullopt;
  }
  sqlite3_finalize(stmt);
  return get_team(static_cast<int>(sqlite3_last_insert_rowid(db_)), error);
}

std::optional<Team> SqliteStore::update_team_score(int team_id, int delta, std::string* error) {
  std::lock_guard<std::recursive_mutex> lock(db_mutex_);
  if (!open_db()) {
    if (error) *error = "DB open failed";
    return std::nullopt;
  }
  const char* sql = "UPDATE teams SET score = score + ?, position = position + ? WHERE id = ?;";
  sqlite3_stmt* stmt = nullptr;
  if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
    if (error) *error = sqlite3_errmsg(db_);
    return std::nullopt;
  }
  sqlite3_bind_int(stmt, 1, delta);
  sqlite3_bind_int(stmt, 2, delta);
  sqlite3_bind_int(stmt, 3, team_id);
  if (sqlite3_step(stmt) != SQLITE_DONE) {
    if (error) *error = sqlite3_errmsg(db_);
    sqlite3_finalize(stmt);
    return std::nullopt;
  }
  sqlite3_finalize(stmt);
  if (sqlite3_changes(db_) == 0) {
    if (error) *error = "Team not found";
    return std::nullopt;
  }
  return get_team(team_id, error);
}

std::optional<AnswerRecord> SqliteStore::create_answer(const AnswerRecord& answer,
                                                       std::string* error) {
  std::lock_guard<std::recursive_mutex> lock(db_mutex_);
  if (!open_db()) {
    if (error) *error = "DB open failed";
    return std::nullopt;
  }
  const char* sql =
      "INSERT INTO answers(session_id, team_id, question_id, submitted_answer, round_number, "
      "is_correct, points_awarded, submitted_at) VALUES(?, ?, ?, ?, ?, NULL, 0, ?);";
  sqlite3_stmt* stmt = nullptr;
  if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
    if (error) *error = sqlite3_errmsg(db_);
    return std::nullopt;
  }
  const auto now = unix_now();
  sqlite3_bind_int(stmt, 1, answer.session_id);
  sqlite3_bind_int(stmt, 2, answer.team_id);
  sqlite3_bind_int(stmt, 3, answer.question_id);
  sqlite3_bind_text(stmt, 4, answer.submitted_answer.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_int(stmt, 5, answer.round_number);
  sqlite3_bind_int64(stmt, 6, static_cast<sqlite3_int64>(now));
  if (sqlite3_step(stmt) != SQLITE_DONE) {
    if (error) *error = sqlite3_errmsg(db_);
    sqlite3_finalize(stmt);
    return std::nullopt;
  }
  sqlite3_finalize(stmt);

  AnswerRecord out = answer;
  out.id = static_cast<int>(sqlite3_last_insert_rowid(db_));
  out.is_correct.reset();
  out.points_awarded = 0;
  out.submitted_at = now;
  out.graded_at = 0;
  return out;
}

std::optional<AnswerRecord> SqliteStore::get_answer(int answer_id, std::string* error) {
  std::lock_guard<std::recursive_mutex> lock(db_mutex_);
  if (!open_db()) {
    if (error) *error = "DB open failed";
    return std::nullopt;
  }
  std::string sql = std::string(kAnswerColumns) + "WHERE id = ?;";
  sqlite3_stmt* stmt = nullptr;
  if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
    if (error) *error = sqlite3_errmsg(db_);
    return std::nullopt;
  }
  sqlite3_bind_int(stmt, 1, answer_id);
  if (sqlite3_step(stmt) != SQLITE_ROW) {
    if (error) *error = "Answer not found";
    sqlite3_finalize(stmt);
    return std::nullopt;
  }
  auto a = read_answer(stmt);
  sqlite3_finalize(stmt);
  return a;
}

std::optional<AnswerRecord> SqliteStore::grade_answer(int answer_id, bool is_correct,
                                                      int points_awarded, std::string* error) {
  std::lock_guard<std::recursive_mutex> lock(db_mutex_);
  if (!open_db()) {
    if (error) *error = "DB open failed";
    return std::nullopt;
  }
  auto answer = get_answer(answer_id, error);
  if (!answer) return std::nullopt;
  if (answer->is_correct.has_value()) {
    if (error) *error = "Answer already graded";
    return std::nullopt;
  }

  if (!exec("BEGIN IMMEDIATE;", error)) return std::nullopt;
  auto rollback = [this] {
    std::string ignored;
    if (!exec("ROLLBACK;", &ignored)) {
      spdlog::error("rollback failed on {}: {}", db_path_, ignored);
    }
  };

  const char* sql =
      "UPDATE answers SET is_correct = ?, points_awarded = ?, graded_at = ? "
      "WHERE id = ? AND is_correct IS NULL;";
  sqlite3_stmt* stmt = nullptr;
  if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
    if (error) *error = sqlite3_errmsg(db_);
    rollback();
    return std::nullopt;
  }
  sqlite3_bind_int(stmt, 1, is_correct ? 1 : 0);
  sqlite3_bind_int(stmt, 2, points_awarded);
  sqlite3_bind_int64(stmt, 3, static_cast<sqlite3_int64>(unix_now()));
  sqlite3_bind_int(stmt, 4, answer_id);
  if (sqlite3_step(stmt) != SQLITE_DONE) {
    if (error) *error = sqlite3_errmsg(db_);
    sqlite3_finalize(stmt);
    rollback();
    return std::nullopt;
  }
  sqlite3_finalize(stmt);
  if (sqlite3_changes(db_) == 0) {
    if (error) *error = "Answer already graded";
    rollback();
    return std::nullopt;
  }

  if (points_awarded != 0 && !update_team_score(answer->team_id, points_awarded, error)) {
    rollback();
    return std::nullopt;
  }
  if (!exec("COMMIT;", error)) {
    rollback();
    return std::nullopt;
  }
  return get_answer(answer_id, error);
}

}  // namespace trivia::server
