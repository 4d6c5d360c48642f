#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <chrono>
#include <cstdint>
#include <iostream>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "common/codec.hpp"
#include "server/auth.hpp"
#include "server/connection_registry.hpp"
#include "server/coordinator.hpp"
#include "server/handlers.hpp"
#include "server/scheduler.hpp"
#include "server/server.hpp"
#include "server/sqlite_store.hpp"

using namespace std::chrono_literals;
using namespace trivia::server;
using trivia::Message;
using trivia::MessageType;
using trivia::Status;

namespace {

struct TestRunner {
  int failures{0};

  void expect(bool condition, const std::string& msg) {
    if (!condition) {
      ++failures;
      std::cerr << "[FAIL] " << msg << "\n";
    }
  }

  int exit_code() const {
    if (failures == 0) {
      std::cout << "[PASS] all handler tests\n";
      return 0;
    }
    std::cerr << "[FAILURES] total: " << failures << "\n";
    return 1;
  }
};

// Blocking test client speaking the framed protocol over loopback.
class WireClient {
 public:
  explicit WireClient(uint16_t port) {
    fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
    if (fd_ < 0) return;
    timeval tv{};
    tv.tv_sec = 2;
    ::setsockopt(fd_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    ::inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr);
    if (::connect(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) close();
  }
  ~WireClient() { close(); }

  WireClient(const WireClient&) = delete;
  WireClient& operator=(const WireClient&) = delete;

  bool connected() const { return fd_ >= 0; }

  void close() {
    if (fd_ >= 0) {
      ::shutdown(fd_, SHUT_RDWR);
      ::close(fd_);
      fd_ = -1;
    }
  }

  // Sends one request and returns the response carrying its request_id.
  // Notifications read on the way are kept in `events`.
  std::optional<Message> call(const std::string& action, nlohmann::json data,
                              const std::string& token = "") {
    if (fd_ < 0) return std::nullopt;
    Message req;
    req.type = MessageType::Request;
    req.action = action;
    req.timestamp = trivia::unix_now();
    req.request_id = ++next_id_;
    req.session_id = token;
    req.data = std::move(data);

    std::string error;
    if (!trivia::send_message(fd_, req, error)) return std::nullopt;
    while (true) {
      Message in;
      if (!trivia::receive_message(fd_, in, error)) {
        std::cerr << action << ": " << error << "\n";
        return std::nullopt;
      }
      if (in.type == MessageType::Notification) {
        events.push_back(in.action);
        continue;
      }
      if (in.request_id == req.request_id) return in;
    }
  }

  std::vector<std::string> events;

 private:
  int fd_{-1};
  std::uint64_t next_id_{0};
};

bool ok(const std::optional<Message>& resp) {
  return resp && resp->status == Status::Success && resp->data.is_object();
}

bool rejected(const std::optional<Message>& resp, const std::string& code) {
  return resp && resp->status == Status::Error && resp->error_code == code &&
         !resp->error_message.empty() && resp->data.is_object();
}

template <typename Pred>
bool wait_for(Pred done, std::chrono::milliseconds limit = 2000ms) {
  auto deadline = std::chrono::steady_clock::now() + limit;
  while (std::chrono::steady_clock::now() < deadline) {
    if (done()) return true;
    std::this_thread::sleep_for(5ms);
  }
  return done();
}

int make_quiz(SqliteStore& store, int facilitator_id) {
  Quiz quiz;
  quiz.name = "Loopback Quiz";
  quiz.facilitator_id = facilitator_id;
  quiz.num_teams = 2;
  quiz.num_rounds = 2;
  quiz.easy_count = 1;
  quiz.medium_count = 1;
  quiz.hard_count = 1;
  quiz.insane_count = 1;
  auto created = store.create_quiz(quiz);
  if (!created) return 0;
  for (int d = 0; d < kDifficultyCount; ++d) {
    Question q;
    q.quiz_id = created->id;
    q.text = "Capital of France? (" + std::to_string(d) + ")";
    q.type = QuestionType::MultipleChoice;
    q.difficulty = static_cast<Difficulty>(d);
    q.option_a = "Oslo";
    q.option_b = "Paris";
    q.option_c = "Rome";
    q.option_d = "Bern";
    q.correct_answer = "B";
    store.add_question(q);
  }
  return created->id;
}

}  // namespace

int main() {
  TestRunner tr;

  SqliteStore store(":memory:");
  AuthService auth(":memory:");
  ConnectionRegistry registry;
  Scheduler scheduler;
  CoordinatorOptions options;
  options.reveal_delay = 20ms;
  SessionCoordinator coordinator(store, registry, scheduler, options);
  HandlerContext ctx{coordinator, auth, store};

  Server server("127.0.0.1", 0, 2);
  register_handlers(server, ctx);
  if (!server.start()) {
    tr.expect(false, "server starts on an ephemeral port");
    scheduler.shutdown();
    return tr.exit_code();
  }
  tr.expect(server.port() != 0, "bound port reported");

  WireClient host(server.port());
  WireClient rival(server.port());
  tr.expect(host.connected() && rival.connected(), "clients connect");

  // Basic envelope handling.
  auto pong = host.call("PING", nlohmann::json::object());
  tr.expect(ok(pong) && pong->data["pong"] == true, "PING answered");
  tr.expect(pong && pong->request_id == 1 && pong->action == "PING", "request_id echoed");
  tr.expect(rejected(host.call("TELEPORT", nlohmann::json::object()), "UNKNOWN_ACTION"),
            "unknown action rejected with a readable error");

  // Accounts.
  auto reg = host.call("REGISTER_FACILITATOR", {{"username", "host"}, {"password", "host123"}});
  tr.expect(ok(reg), "facilitator registered");
  tr.expect(rejected(host.call("REGISTER_FACILITATOR",
                               {{"username", "host"}, {"password", "another1"}}),
                     "VALIDATION_FAILED"),
            "duplicate facilitator rejected");
  tr.expect(rejected(host.call("REGISTER_FACILITATOR", {{"username", "host"}}), "INVALID_REQUEST"),
            "registration without password rejected");
  tr.expect(ok(rival.call("REGISTER_FACILITATOR",
                          {{"username", "rival"}, {"password", "rival123"}})),
            "second facilitator registered");

  tr.expect(rejected(host.call("LOGIN", {{"username", "host"}, {"password", "nope123"}}),
                     "UNAUTHORIZED"),
            "bad login rejected");
  auto login = host.call("LOGIN", {{"username", "host"}, {"password", "host123"}});
  tr.expect(ok(login) && !login->session_id.empty(), "login returns a token");
  auto rival_login = rival.call("LOGIN", {{"username", "rival"}, {"password", "rival123"}});
  if (!ok(reg) || !ok(login) || !ok(rival_login)) {
    server.stop();
    scheduler.shutdown();
    return tr.exit_code();
  }
  const std::string token = login->session_id;
  const std::string rival_token = rival_login->session_id;
  const int quiz_id = make_quiz(store, reg->data["facilitator_id"].get<int>());

  // Launch.
  tr.expect(rejected(host.call("LAUNCH_SESSION", {{"quiz_id", quiz_id}}), "UNAUTHORIZED"),
            "launch without a token rejected");
  tr.expect(rejected(host.call("LAUNCH_SESSION", nlohmann::json::object(), token),
                     "INVALID_REQUEST"),
            "launch without quiz_id rejected");
  tr.expect(rejected(rival.call("LAUNCH_SESSION", {{"quiz_id", quiz_id}}, rival_token),
                     "UNAUTHORIZED"),
            "launch of another facilitator's quiz rejected");
  auto launched = host.call("LAUNCH_SESSION", {{"quiz_id", quiz_id}}, token);
  tr.expect(ok(launched), "launch succeeds");
  if (!ok(launched)) {
    server.stop();
    scheduler.shutdown();
    return tr.exit_code();
  }
  const int sid = launched->data["id"].get<int>();
  const std::string room = launched->data["room_code"].get<std::string>();

  // Subscribing as facilitator.
  tr.expect(rejected(host.call("SUBSCRIBE", {{"game_session_id", sid}, {"role", "facilitator"}}),
                     "UNAUTHORIZED"),
            "facilitator subscribe without a token rejected");
  tr.expect(rejected(host.call("SUBSCRIBE", {{"game_session_id", sid}, {"role", "judge"}}, token),
                     "INVALID_REQUEST"),
            "unknown role rejected");
  tr.expect(ok(host.call("SUBSCRIBE", {{"game_session_id", sid}, {"role", "facilitator"}}, token)),
            "owner subscribes");

  // Joining.
  WireClient owls(server.port());
  WireClient foxes(server.port());
  tr.expect(rejected(owls.call("JOIN_SESSION", {{"room_code", room}}), "INVALID_REQUEST"),
            "join without a team name rejected");
  tr.expect(rejected(owls.call("JOIN_SESSION", {{"room_code", "ZZZZZZ"}, {"team_name", "Owls"}}),
                     "NOT_FOUND"),
            "join with an unknown room rejected");
  auto owls_join = owls.call("JOIN_SESSION", {{"room_code", room}, {"team_name", "Owls"}});
  auto foxes_join = foxes.call("JOIN_SESSION", {{"room_code", room}, {"team_name", "Foxes"}});
  tr.expect(ok(owls_join) && ok(foxes_join), "two teams join");
  if (!ok(owls_join) || !ok(foxes_join)) {
    server.stop();
    scheduler.shutdown();
    return tr.exit_code();
  }
  const int owls_id = owls_join->data["team"]["id"].get<int>();
  tr.expect(owls_join->data["game_session_id"] == sid, "join reports the game session");
  tr.expect(registry.count(sid) == 3, "joining connections are subscribed");

  // Start.
  tr.expect(rejected(rival.call("START_GAME", {{"game_session_id", sid}}, rival_token),
                     "UNAUTHORIZED"),
            "start by another facilitator rejected");
  tr.expect(ok(host.call("START_GAME", {{"game_session_id", sid}}, token)), "owner starts");
  tr.expect(rejected(host.call("START_GAME", {{"game_session_id", sid}}, token),
                     "VALIDATION_FAILED"),
            "second start rejected");

  // Serve and roll.
  tr.expect(rejected(owls.call("SERVE_QUESTION", {{"game_session_id", sid}}), "UNAUTHORIZED"),
            "players cannot serve");
  auto served = host.call("SERVE_QUESTION", {{"game_session_id", sid}}, token);
  tr.expect(ok(served) && served->data["question"]["correct_answer"] == "B",
            "facilitator gets the served question with its key");
  tr.expect(rejected(owls.call("ROLL_DICE", {{"game_session_id", sid}, {"value", 9}}),
                     "VALIDATION_FAILED"),
            "out of range roll rejected");
  tr.expect(rejected(owls.call("ROLL_DICE", {{"game_session_id", sid}, {"value", "four"}}),
                     "INVALID_REQUEST"),
            "non-integer roll rejected");
  tr.expect(rejected(owls.call("ROLL_DICE", {{"game_session_id", 9999}, {"value", 3}}),
                     "NOT_FOUND"),
            "roll for an unknown game rejected");
  auto rolled = owls.call("ROLL_DICE", {{"game_session_id", sid}, {"value", 4}});
  tr.expect(ok(rolled) && rolled->data["value"] == 4, "roll accepted");

  // Answer and grade.
  const int question_id = served ? served->data["question"]["id"].get<int>() : 0;
  tr.expect(rejected(owls.call("SUBMIT_ANSWER", {{"game_session_id", sid}, {"team_id", owls_id}}),
                     "INVALID_REQUEST"),
            "answer without question rejected");
  auto submitted = owls.call("SUBMIT_ANSWER", {{"game_session_id", sid},
                                               {"team_id", owls_id},
                                               {"question_id", question_id},
                                               {"answer", "B"}});
  tr.expect(ok(submitted), "answer recorded");
  const int answer_id = ok(submitted) ? submitted->data["answer_id"].get<int>() : 0;

  // State while the slot is still in play.
  auto player_view = owls.call("GET_STATE", {{"game_session_id", sid}});
  tr.expect(ok(player_view) && player_view->data["current_question"].is_object() &&
                !player_view->data["current_question"].contains("correct_answer"),
            "player state hides the answer key");
  auto host_view = host.call("GET_STATE", {{"game_session_id", sid}}, token);
  tr.expect(ok(host_view) && host_view->data["current_question"]["correct_answer"] == "B",
            "facilitator state shows the answer key");

  tr.expect(rejected(host.call("GRADE_ANSWER",
                               {{"game_session_id", sid}, {"answer_id", answer_id},
                                {"is_correct", true}},
                               token),
                     "INVALID_REQUEST"),
            "grade without points_awarded rejected");
  tr.expect(rejected(rival.call("GRADE_ANSWER",
                                {{"game_session_id", sid}, {"answer_id", answer_id},
                                 {"is_correct", true}, {"points_awarded", 3}},
                                rival_token),
                     "UNAUTHORIZED"),
            "grade by another facilitator rejected");
  auto graded = host.call("GRADE_ANSWER",
                          {{"game_session_id", sid}, {"answer_id", answer_id},
                           {"is_correct", true}, {"points_awarded", 3}},
                          token);
  tr.expect(ok(graded) && graded->data["team"]["score"] == 3, "grade applied");
  tr.expect(rejected(host.call("GRADE_ANSWER",
                               {{"game_session_id", sid}, {"answer_id", answer_id},
                                {"is_correct", true}, {"points_awarded", 3}},
                               token),
                     "VALIDATION_FAILED"),
            "regrade rejected");

  // Reads.
  tr.expect(rejected(owls.call("GET_STATE", {{"game_session_id", 9999}}), "NOT_FOUND"),
            "state of an unknown game rejected");
  auto board = foxes.call("REQUEST_LEADERBOARD", {{"game_session_id", sid}});
  tr.expect(ok(board) && board->data["leaderboard"].size() == 2 &&
                board->data["leaderboard"][0]["id"] == owls_id,
            "leaderboard ranks the scoring team first");

  // Exhaustion: 2 teams x 2 rounds, one slot used.
  for (int i = 0; i < 3; ++i) host.call("SERVE_QUESTION", {{"game_session_id", sid}}, token);
  tr.expect(rejected(host.call("SERVE_QUESTION", {{"game_session_id", sid}}, token),
                     "NO_MORE_QUESTIONS"),
            "exhausted game reports NO_MORE_QUESTIONS");

  // Events reached the subscribers in order.
  tr.expect(ok(owls.call("PING", nlohmann::json::object())), "player ping flushes events");
  auto seen = [&](const std::string& name) {
    for (std::size_t i = 0; i < owls.events.size(); ++i) {
      if (owls.events[i] == name) return static_cast<int>(i);
    }
    return -1;
  };
  tr.expect(seen("game_started") >= 0, "player saw game_started");
  tr.expect(seen("dice_rolled") >= 0 && seen("answer_graded") > seen("dice_rolled"),
            "player saw dice_rolled before answer_graded");

  // End.
  tr.expect(rejected(rival.call("END_GAME", {{"game_session_id", sid}}, rival_token),
                     "UNAUTHORIZED"),
            "end by another facilitator rejected");
  tr.expect(ok(host.call("END_GAME", {{"game_session_id", sid}}, token)), "owner ends the game");
  tr.expect(rejected(host.call("END_GAME", {{"game_session_id", sid}}, token),
                     "VALIDATION_FAILED"),
            "second end rejected");

  // Logout invalidates the token.
  tr.expect(ok(host.call("LOGOUT", nlohmann::json::object(), token)), "logout succeeds");
  tr.expect(rejected(host.call("LAUNCH_SESSION", {{"quiz_id", quiz_id}}, token), "UNAUTHORIZED"),
            "token refused after logout");

  // A closed connection is released without waiting for another accept.
  const std::size_t before = server.connection_count();
  tr.expect(before == 4, "four live connections");
  foxes.close();
  tr.expect(wait_for([&] { return server.connection_count() == before - 1; }),
            "closed connection released");
  tr.expect(wait_for([&] { return registry.count(sid) == 2; }),
            "closed connection unsubscribed");

  owls.close();
  host.close();
  rival.close();
  server.stop();
  scheduler.shutdown();
  return tr.exit_code();
}
