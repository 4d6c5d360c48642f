#pragma once

#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <sqlite3.h>

#include "server/store.hpp"

namespace trivia::server {

class SqliteStore : public GameStore {
 public:
  // ":memory:" gives a private in-memory database.
  explicit SqliteStore(std::string db_path);
  ~SqliteStore() override;

  SqliteStore(const SqliteStore&) = delete;
  SqliteStore& operator=(const SqliteStore&) = delete;

  bool is_open() const { return db_ != nullptr; }

  // Authoring helpers used by the seeder and tests.
  std::optional<Quiz> create_quiz(const Quiz& quiz, std::string* error = nullptr);
  std::optional<Question> add_question(const Question& question, std::string* error = nullptr);

  std::optional<Quiz> get_quiz(int quiz_id, std::string* error = nullptr) override;
  std::vector<Question> get_questions_by_quiz(int quiz_id, std::string* error = nullptr) override;
  std::optional<Question> get_question(int question_id, std::string* error = nullptr) override;

  std::optional<SessionRecord> create_session(int quiz_id, const std::string& room_code,
                                              std::string* error = nullptr) override;
  std::optional<SessionRecord> get_session(int session_id, std::string* error = nullptr) override;
  std::optional<SessionRecord> get_session_by_room_code(const std::string& room_code,
                                                        std::string* error = nullptr) override;
  bool update_session_status(int session_id, SessionStatus status,
                             std::string* error = nullptr) override;

  std::vector<Team> get_teams_by_session(int session_id, std::string* error = nullptr) override;
  std::optional<Team> create_team(int session_id, const std::string& name,
                                  std::string* error = nullptr) override;
  std::optional<Team> update_team_score(int team_id, int delta,
                                        std::string* error = nullptr) override;

  std::optional<AnswerRecord> create_answer(const AnswerRecord& answer,
                                            std::string* error = nullptr) override;
  std::optional<AnswerRecord> get_answer(int answer_id, std::string* error = nullptr) override;
  std::optional<AnswerRecord> grade_answer(int answer_id, bool is_correct, int points_awarded,
                                           std::string* error = nullptr) override;

 private:
  bool open_db();
  bool ensure_schema(std::string* error);
  bool exec(const char* sql, std::string* error);
  std::optional<Team> get_team(int team_id, std::string* error);
  std::optional<SessionRecord> load_session(const char* sql, int id, const std::string* code,
                                            std::string* error);

  std::string db_path_;
  sqlite3* db_{nullptr};
  mutable std::recursive_mutex db_mutex_;
};

}  // namespace trivia::server
