#pragma once

namespace trivia::server::events {

// Notification actions pushed to subscribed connections.
constexpr const char* kTeamJoined = "team_joined";
constexpr const char* kGameStarted = "game_started";
constexpr const char* kQuestionReadyForDice = "question_ready_for_dice";
constexpr const char* kDiceRolled = "dice_rolled";
constexpr const char* kQuestionServed = "question_served";
constexpr const char* kAnswerSubmitted = "answer_submitted";
constexpr const char* kAnswerSubmittedDetails = "answer_submitted_details";  // facilitators only
constexpr const char* kAnswerGraded = "answer_graded";
constexpr const char* kLeaderboardUpdate = "leaderboard_update";
constexpr const char* kGameEnded = "game_ended";

}  // namespace trivia::server::events
