#include "server/handlers.hpp"

#include <optional>
#include <string>

#include <spdlog/spdlog.h>

namespace trivia::server {

namespace {

Message make_response(const Message& req) {
  Message resp;
  resp.type = MessageType::Response;
  resp.action = req.action;
  resp.timestamp = unix_now();
  resp.status = Status::Success;
  return resp;
}

Message error_response(const Message& req, const std::string& code, const std::string& msg) {
  Message resp = make_response(req);
  resp.status = Status::Error;
  resp.error_code = code;
  resp.error_message = msg;
  return resp;
}

Message action_failed(const Message& req, const ActionError& err) {
  spdlog::info("{} rejected: {}", req.action, err.message);
  return error_response(req, error_code(err.kind), err.message);
}

Message invalid(const Message& req, const std::string& msg) {
  return error_response(req, "INVALID_REQUEST", msg);
}

std::optional<int> int_field(const nlohmann::json& data, const char* key) {
  auto it = data.find(key);
  if (it == data.end() || !it->is_number_integer()) return std::nullopt;
  return it->get<int>();
}

std::optional<std::string> string_field(const nlohmann::json& data, const char* key) {
  auto it = data.find(key);
  if (it == data.end() || !it->is_string()) return std::nullopt;
  return it->get<std::string>();
}

// Resolves the bearer token carried in the envelope to a facilitator.
std::optional<FacilitatorSession> authenticate(HandlerContext& ctx, const Message& req,
                                               std::string* error) {
  return ctx.auth.validate(req.session_id, error);
}

bool owns_session(HandlerContext& ctx, int facilitator_id, int game_session_id) {
  std::string err;
  auto session = ctx.store.get_session(game_session_id, &err);
  if (!session) return false;
  auto quiz = ctx.store.get_quiz(session->quiz_id, &err);
  return quiz && quiz->facilitator_id == facilitator_id;
}

}  // namespace

void register_handlers(Server& server, HandlerContext& ctx) {
  server.on_close([&ctx](const Connection& conn) { ctx.coordinator.disconnect(&conn); });

  server.register_handler("PING", [](const std::shared_ptr<Connection>&, const Message& req) {
    Message resp = make_response(req);
    resp.data = {{"pong", true}, {"server_time", unix_now()}};
    return resp;
  });

  server.register_handler(
      "REGISTER_FACILITATOR", [&ctx](const std::shared_ptr<Connection>&, const Message& req) {
        auto username = string_field(req.data, "username");
        auto password = string_field(req.data, "password");
        if (!username || !password) return invalid(req, "Missing username/password");
        std::string error;
        auto id = ctx.auth.register_facilitator(*username, *password, &error);
        if (!id) return error_response(req, "VALIDATION_FAILED", error);
        Message resp = make_response(req);
        resp.data = {{"facilitator_id", *id}, {"username", *username}};
        return resp;
      });

  server.register_handler("LOGIN", [&ctx](const std::shared_ptr<Connection>&, const Message& req) {
    auto username = string_field(req.data, "username");
    auto password = string_field(req.data, "password");
    if (!username || !password) return invalid(req, "Missing username/password");
    std::string error;
    auto session = ctx.auth.login(*username, *password, ctx.token_ttl_seconds, &error);
    if (!session) return error_response(req, "UNAUTHORIZED", error);
    Message resp = make_response(req);
    resp.session_id = session->token;
    resp.data = {{"facilitator_id", session->facilitator_id},
                 {"username", session->username},
                 {"expires_at", session->expires_at},
                 {"session_id", session->token}};
    return resp;
  });

  server.register_handler("LOGOUT", [&ctx](const std::shared_ptr<Connection>&, const Message& req) {
    std::string token = req.session_id;
    if (token.empty()) token = string_field(req.data, "session_id").value_or("");
    if (token.empty()) return invalid(req, "Missing session_id");
    std::string error;
    if (!ctx.auth.logout(token, &error)) return error_response(req, "INTERNAL_ERROR", error);
    Message resp = make_response(req);
    resp.data = {{"message", "Logged out"}};
    return resp;
  });

  server.register_handler(
      "LAUNCH_SESSION", [&ctx](const std::shared_ptr<Connection>&, const Message& req) {
        std::string error;
        auto actor = authenticate(ctx, req, &error);
        if (!actor) return error_response(req, "UNAUTHORIZED", error);
        auto quiz_id = int_field(req.data, "quiz_id");
        if (!quiz_id) return invalid(req, "quiz_id required");

        ActionError err;
        auto session = ctx.coordinator.launch_session(actor->facilitator_id, *quiz_id, &err);
        if (!session) return action_failed(req, err);
        Message resp = make_response(req);
        resp.data = session_to_json(*session);
        return resp;
      });

  server.register_handler(
      "JOIN_SESSION", [&ctx](const std::shared_ptr<Connection>& conn, const Message& req) {
        auto room_code = string_field(req.data, "room_code");
        auto team_name = string_field(req.data, "team_name");
        if (!room_code || !team_name) return invalid(req, "room_code and team_name required");

        ActionError err;
        auto team = ctx.coordinator.join_session(*room_code, *team_name, &err);
        if (!team) return action_failed(req, err);

        // The joining connection follows its own team from here on.
        if (!ctx.coordinator.subscribe(conn, team->session_id, Role::Player, team->id,
                                       std::nullopt, &err)) {
          spdlog::warn("team {} joined but could not subscribe: {}", team->id, err.message);
        }
        Message resp = make_response(req);
        resp.data = {{"team", team_to_json(*team)}, {"game_session_id", team->session_id}};
        return resp;
      });

  server.register_handler(
      "SUBSCRIBE", [&ctx](const std::shared_ptr<Connection>& conn, const Message& req) {
        auto game_id = int_field(req.data, "game_session_id");
        auto role_name = string_field(req.data, "role");
        if (!game_id || !role_name) return invalid(req, "game_session_id and role required");
        auto role = role_from_string(*role_name);
        if (!role) return invalid(req, "role must be facilitator or player");

        std::optional<int> actor_id;
        if (*role == Role::Facilitator) {
          std::string error;
          auto actor = authenticate(ctx, req, &error);
          if (!actor) return error_response(req, "UNAUTHORIZED", error);
          actor_id = actor->facilitator_id;
        }

        ActionError err;
        auto id = ctx.coordinator.subscribe(conn, *game_id, *role, int_field(req.data, "team_id"),
                                            actor_id, &err);
        if (!id) return action_failed(req, err);
        Message resp = make_response(req);
        resp.data = {{"connection_id", *id}, {"game_session_id", *game_id}};
        return resp;
      });

  server.register_handler(
      "START_GAME", [&ctx](const std::shared_ptr<Connection>&, const Message& req) {
        std::string error;
        auto actor = authenticate(ctx, req, &error);
        if (!actor) return error_response(req, "UNAUTHORIZED", error);
        auto game_id = int_field(req.data, "game_session_id");
        if (!game_id) return invalid(req, "game_session_id required");

        ActionError err;
        if (!ctx.coordinator.start_game(actor->facilitator_id, *game_id, &err)) {
          return action_failed(req, err);
        }
        Message resp = make_response(req);
        resp.data = {{"game_session_id", *game_id}, {"status", "in_progress"}};
        return resp;
      });

  server.register_handler(
      "SERVE_QUESTION", [&ctx](const std::shared_ptr<Connection>&, const Message& req) {
        std::string error;
        auto actor = authenticate(ctx, req, &error);
        if (!actor) return error_response(req, "UNAUTHORIZED", error);
        auto game_id = int_field(req.data, "game_session_id");
        if (!game_id) return invalid(req, "game_session_id required");

        ActionError err;
        auto served = ctx.coordinator.serve_next_question(actor->facilitator_id, *game_id, &err);
        if (!served) return action_failed(req, err);
        Message resp = make_response(req);
        resp.data = {{"question", question_to_json(served->question, true)},
                     {"current_team", team_ref_to_json(served->team)},
                     {"round_number", served->round_number}};
        return resp;
      });

  server.register_handler(
      "ROLL_DICE", [&ctx](const std::shared_ptr<Connection>&, const Message& req) {
        auto game_id = int_field(req.data, "game_session_id");
        if (!game_id) return invalid(req, "game_session_id required");
        std::optional<int> value;
        if (req.data.contains("value")) {
          value = int_field(req.data, "value");
          if (!value) return invalid(req, "value must be an integer");
        }

        ActionError err;
        auto rolled = ctx.coordinator.roll_dice(*game_id, value, &err);
        if (!rolled) return action_failed(req, err);
        Message resp = make_response(req);
        resp.data = {{"value", rolled->value},
                     {"team_id", rolled->slot.team.id},
                     {"round_number", rolled->slot.round_number}};
        return resp;
      });

  server.register_handler(
      "SUBMIT_ANSWER", [&ctx](const std::shared_ptr<Connection>&, const Message& req) {
        auto game_id = int_field(req.data, "game_session_id");
        auto team_id = int_field(req.data, "team_id");
        auto question_id = int_field(req.data, "question_id");
        auto answer = string_field(req.data, "answer");
        if (!game_id || !team_id || !question_id || !answer) {
          return invalid(req, "game_session_id, team_id, question_id and answer required");
        }

        AnswerSubmission submission;
        submission.session_id = *game_id;
        submission.team_id = *team_id;
        submission.question_id = *question_id;
        submission.submitted_answer = *answer;
        submission.round_number = int_field(req.data, "round_number").value_or(0);

        ActionError err;
        auto pending = ctx.coordinator.submit_answer(submission, &err);
        if (!pending) return action_failed(req, err);
        Message resp = make_response(req);
        resp.data = {{"answer_id", pending->answer_id}, {"round_number", pending->round_number}};
        return resp;
      });

  server.register_handler(
      "GRADE_ANSWER", [&ctx](const std::shared_ptr<Connection>&, const Message& req) {
        std::string error;
        auto actor = authenticate(ctx, req, &error);
        if (!actor) return error_response(req, "UNAUTHORIZED", error);
        auto game_id = int_field(req.data, "game_session_id");
        auto answer_id = int_field(req.data, "answer_id");
        auto points = int_field(req.data, "points_awarded");
        auto is_correct = req.data.find("is_correct");
        if (!game_id || !answer_id || !points || is_correct == req.data.end() ||
            !is_correct->is_boolean()) {
          return invalid(req,
                         "game_session_id, answer_id, is_correct and points_awarded required");
        }

        GradeDecision decision;
        decision.answer_id = *answer_id;
        decision.is_correct = is_correct->get<bool>();
        decision.points_awarded = *points;

        ActionError err;
        auto graded = ctx.coordinator.grade_answer(actor->facilitator_id, *game_id, decision, &err);
        if (!graded) return action_failed(req, err);
        Message resp = make_response(req);
        resp.data = {{"answer_id", graded->answer.id},
                     {"team", team_to_json(graded->team)},
                     {"leaderboard", leaderboard_to_json(graded->leaderboard)}};
        return resp;
      });

  server.register_handler(
      "GET_STATE", [&ctx](const std::shared_ptr<Connection>&, const Message& req) {
        auto game_id = int_field(req.data, "game_session_id");
        if (!game_id) return invalid(req, "game_session_id required");

        ActionError err;
        auto snapshot = ctx.coordinator.get_state(*game_id, &err);
        if (!snapshot) return action_failed(req, err);

        bool facilitator_view = false;
        if (!req.session_id.empty()) {
          std::string error;
          auto actor = authenticate(ctx, req, &error);
          facilitator_view = actor && owns_session(ctx, actor->facilitator_id, *game_id);
        }
        Message resp = make_response(req);
        resp.data = snapshot_to_json(*snapshot, facilitator_view);
        return resp;
      });

  server.register_handler(
      "REQUEST_LEADERBOARD", [&ctx](const std::shared_ptr<Connection>&, const Message& req) {
        auto game_id = int_field(req.data, "game_session_id");
        if (!game_id) return invalid(req, "game_session_id required");
        ActionError err;
        auto standings = ctx.coordinator.leaderboard(*game_id, &err);
        if (!standings) return action_failed(req, err);
        Message resp = make_response(req);
        resp.data = {{"leaderboard", leaderboard_to_json(*standings)}};
        return resp;
      });

  server.register_handler(
      "END_GAME", [&ctx](const std::shared_ptr<Connection>&, const Message& req) {
        std::string error;
        auto actor = authenticate(ctx, req, &error);
        if (!actor) return error_response(req, "UNAUTHORIZED", error);
        auto game_id = int_field(req.data, "game_session_id");
        if (!game_id) return invalid(req, "game_session_id required");

        ActionError err;
        if (!ctx.coordinator.end_game(actor->facilitator_id, *game_id, &err)) {
          return action_failed(req, err);
        }
        Message resp = make_response(req);
        resp.data = {{"game_session_id", *game_id}, {"status", "completed"}};
        return resp;
      });
}

}  // namespace trivia::server
