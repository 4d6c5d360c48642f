#pragma once

#include <optional>
#include <string>
#include <vector>

#include "server/model.hpp"

namespace trivia::server {

// Durable storage the coordinator reads and writes through. Each call is
// atomic: it either applies every row it touches or none of them.
class GameStore {
 public:
  virtual ~GameStore() = default;

  virtual std::optional<Quiz> get_quiz(int quiz_id, std::string* error = nullptr) = 0;
  virtual std::vector<Question> get_questions_by_quiz(int quiz_id,
                                                      std::string* error = nullptr) = 0;
  virtual std::optional<Question> get_question(int question_id, std::string* error = nullptr) = 0;

  virtual std::optional<SessionRecord> create_session(int quiz_id, const std::string& room_code,
                                                      std::string* error = nullptr) = 0;
  virtual std::optional<SessionRecord> get_session(int session_id,
                                                   std::string* error = nullptr) = 0;
  virtual std::optional<SessionRecord> get_session_by_room_code(const std::string& room_code,
                                                                std::string* error = nullptr) = 0;
  // Stamps started_at on the first move to in_progress and completed_at on completion.
  virtual bool update_session_status(int session_id, SessionStatus status,
                                     std::string* error = nullptr) = 0;

  // Ordered by join order.
  virtual std::vector<Team> get_teams_by_session(int session_id, std::string* error = nullptr) = 0;
  virtual std::optional<Team> create_team(int session_id, const std::string& name,
                                          std::string* error = nullptr) = 0;
  // Adds `delta` to both score and position.
  virtual std::optional<Team> update_team_score(int team_id, int delta,
                                                std::string* error = nullptr) = 0;

  virtual std::optional<AnswerRecord> create_answer(const AnswerRecord& answer,
                                                    std::string* error = nullptr) = 0;
  virtual std::optional<AnswerRecord> get_answer(int answer_id, std::string* error = nullptr) = 0;
  // Marks an ungraded answer and, when points_awarded is non-zero, adds it to
  // the answering team's score and position. Fails with "Answer already graded"
  // for an answer that carries a grade.
  virtual std::optional<AnswerRecord> grade_answer(int answer_id, bool is_correct,
                                                   int points_awarded,
                                                   std::string* error = nullptr) = 0;
};

}  // namespace trivia::server
