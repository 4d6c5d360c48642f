#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <atomic>
#include <cctype>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>

#include "common/codec.hpp"

using trivia::Message;
using trivia::MessageType;
using trivia::Status;

namespace {

std::mutex g_out_mtx;

int connect_to(const std::string& host, uint16_t port) {
  int fd = ::socket(AF_INET, SOCK_STREAM, 0);
  if (fd < 0) {
    std::perror("socket");
    return -1;
  }
  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(port);
  if (::inet_pton(AF_INET, host.c_str(), &addr.sin_addr) <= 0) {
    std::cerr << "Invalid host\n";
    ::close(fd);
    return -1;
  }
  if (::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
    std::perror("connect");
    ::close(fd);
    return -1;
  }
  return fd;
}

bool is_number(const std::string& s) {
  if (s.empty()) return false;
  for (char c : s) {
    if (!std::isdigit(static_cast<unsigned char>(c))) return false;
  }
  return true;
}

void print(const Message& msg) {
  std::lock_guard<std::mutex> lock(g_out_mtx);
  if (msg.type == MessageType::Notification) {
    std::cout << "[event] " << msg.action << " " << msg.data.dump() << "\n";
  } else if (msg.status == Status::Success) {
    std::cout << "[" << msg.action << " #" << msg.request_id << "] ok " << msg.data.dump() << "\n";
  } else {
    std::cout << "[" << msg.action << " #" << msg.request_id << "] " << msg.error_code << ": "
              << msg.error_message << "\n";
  }
}

class Client {
 public:
  Client(int fd, std::string token) : fd_(fd), token_(std::move(token)) {}

  bool request(const std::string& action, nlohmann::json data) {
    Message req;
    req.type = MessageType::Request;
    req.action = action;
    req.timestamp = trivia::unix_now();
    req.request_id = ++next_id_;
    req.session_id = token_;
    req.data = std::move(data);
    std::string err;
    if (!trivia::send_message(fd_, req, err)) {
      std::cerr << "send error: " << err << "\n";
      return false;
    }
    return true;
  }

 private:
  int fd_;
  std::string token_;
  std::atomic<std::uint64_t> next_id_{0};
};

void usage(const char* prog) {
  std::cerr << "Usage: " << prog << " <host> <port> <room_code|session_id> <role> [team_id|team_name|token]\n"
            << "  player with a room code joins as a new team named by the last argument\n"
            << "  player with a session id follows an existing team id\n"
            << "  facilitator with a session id needs a login token\n"
            << "Commands: roll [n] | answer <question_id> <text> | serve | start | state | board |\n"
            << "          grade <answer_id> <yes|no> [points] | end | quit\n";
}

}  // namespace

int main(int argc, char** argv) {
  if (argc < 5) {
    usage(argv[0]);
    return 1;
  }
  std::string host = argv[1];
  uint16_t port = 0;
  try {
    port = static_cast<uint16_t>(std::stoi(argv[2]));
  } catch (const std::exception&) {
    std::cerr << "Invalid port\n";
    return 1;
  }
  std::string target = argv[3];
  std::string role = argv[4];
  std::string extra = argc > 5 ? argv[5] : "";
  if (role != "player" && role != "facilitator") {
    usage(argv[0]);
    return 1;
  }

  int fd = connect_to(host, port);
  if (fd < 0) return 1;

  std::atomic<int> game_id{is_number(target) ? std::stoi(target) : 0};
  std::atomic<int> team_id{role == "player" && is_number(extra) ? std::stoi(extra) : 0};
  std::atomic<bool> done{false};

  std::thread reader([&] {
    while (!done.load()) {
      Message msg;
      std::string err;
      if (!trivia::receive_message(fd, msg, err)) {
        if (!done.load()) std::cerr << "connection closed: " << err << "\n";
        break;
      }
      if (msg.action == "JOIN_SESSION" && msg.status == Status::Success) {
        game_id.store(msg.data.value("game_session_id", 0));
        team_id.store(msg.data["team"].value("id", 0));
      }
      print(msg);
    }
    done.store(true);
  });

  Client client(fd, role == "facilitator" ? extra : "");
  bool ok = true;
  if (!is_number(target)) {
    ok = client.request("JOIN_SESSION", {{"room_code", target}, {"team_name", extra}});
  } else if (role == "facilitator") {
    ok = client.request("SUBSCRIBE", {{"game_session_id", game_id.load()}, {"role", role}});
  } else {
    ok = client.request("SUBSCRIBE", {{"game_session_id", game_id.load()},
                                      {"role", role},
                                      {"team_id", team_id.load()}});
  }

  std::string line;
  while (ok && !done.load() && std::getline(std::cin, line)) {
    std::istringstream in(line);
    std::string cmd;
    in >> cmd;
    nlohmann::json data = {{"game_session_id", game_id.load()}};
    if (cmd.empty()) continue;
    if (cmd == "quit") break;
    if (cmd == "roll") {
      int value = 0;
      if (in >> value) data["value"] = value;
      ok = client.request("ROLL_DICE", data);
    } else if (cmd == "answer") {
      int question_id = 0;
      std::string text;
      in >> question_id;
      std::getline(in >> std::ws, text);
      data["team_id"] = team_id.load();
      data["question_id"] = question_id;
      data["answer"] = text;
      ok = client.request("SUBMIT_ANSWER", data);
    } else if (cmd == "grade") {
      int answer_id = 0;
      std::string verdict;
      int points = 0;
      in >> answer_id >> verdict >> points;
      data["answer_id"] = answer_id;
      data["is_correct"] = verdict == "yes";
      data["points_awarded"] = points;
      ok = client.request("GRADE_ANSWER", data);
    } else if (cmd == "serve") {
      ok = client.request("SERVE_QUESTION", data);
    } else if (cmd == "start") {
      ok = client.request("START_GAME", data);
    } else if (cmd == "state") {
      ok = client.request("GET_STATE", data);
    } else if (cmd == "board") {
      ok = client.request("REQUEST_LEADERBOARD", data);
    } else if (cmd == "end") {
      ok = client.request("END_GAME", data);
    } else {
      usage(argv[0]);
    }
  }

  done.store(true);
  ::shutdown(fd, SHUT_RDWR);
  if (reader.joinable()) reader.join();
  ::close(fd);
  return ok ? 0 : 1;
}
