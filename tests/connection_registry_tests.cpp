#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "server/connection_registry.hpp"

using trivia::Message;
using trivia::server::ClientChannel;
using trivia::server::ConnectionRegistry;
using trivia::server::Role;

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
      std::cout << "[PASS] all connection registry tests\n";
      return 0;
    }
    std::cerr << "[FAILURES] total: " << failures << "\n";
    return 1;
  }
};

class RecordingChannel : public ClientChannel {
 public:
  explicit RecordingChannel(std::string name) : name_(std::move(name)) {}

  bool send(const Message& msg) override {
    std::lock_guard<std::mutex> lock(mtx_);
    if (!open_) return false;
    actions_.push_back(msg.action);
    return true;
  }
  bool is_open() const override { return open_; }
  std::string peer() const override { return name_; }

  void close() { open_ = false; }
  std::vector<std::string> actions() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return actions_;
  }

 private:
  std::string name_;
  bool open_{true};
  mutable std::mutex mtx_;
  std::vector<std::string> actions_;
};

Message event(const std::string& action) {
  return trivia::make_notification(action, nlohmann::json::object());
}

}  // namespace

int main() {
  TestRunner tr;

  // Routing by session, team and role.
  {
    ConnectionRegistry registry;
    auto host = std::make_shared<RecordingChannel>("host");
    auto red = std::make_shared<RecordingChannel>("red");
    auto blue = std::make_shared<RecordingChannel>("blue");
    auto other = std::make_shared<RecordingChannel>("other-session");

    registry.add(host, 1, Role::Facilitator, std::nullopt);
    auto red_id = registry.add(red, 1, Role::Player, 10);
    registry.add(blue, 1, Role::Player, 11);
    registry.add(other, 2, Role::Player, 20);

    tr.expect(registry.count(1) == 3, "three connections watch session 1");
    tr.expect(registry.session_count() == 2, "two sessions tracked");

    tr.expect(registry.broadcast(1, event("team_joined")) == 3, "broadcast reaches session 1 only");
    tr.expect(other->actions().empty(), "other session untouched");

    tr.expect(registry.send_to_facilitators(1, event("answer_submitted_details")) == 1,
              "details go to the facilitator only");
    tr.expect(red->actions().size() == 1 && blue->actions().size() == 1,
              "players did not get facilitator details");

    tr.expect(registry.send_to_team(1, 11, event("your_turn")) == 1, "team message to blue");
    tr.expect(blue->actions().back() == "your_turn", "blue received its team message");
    tr.expect(red->actions().size() == 1, "red did not receive blue's message");

    tr.expect(registry.send_to(red_id, event("direct")), "direct send");
    auto info = registry.find(red_id);
    tr.expect(info && info->team_id == 10 && info->role == Role::Player, "find returns the entry");
  }

  // Per-connection order follows issue order.
  {
    ConnectionRegistry registry;
    auto a = std::make_shared<RecordingChannel>("a");
    auto b = std::make_shared<RecordingChannel>("b");
    registry.add(a, 5, Role::Player, 1);
    registry.add(b, 5, Role::Player, 2);
    registry.broadcast(5, event("dice_rolled"));
    registry.broadcast(5, event("question_served"));
    registry.broadcast(5, event("answer_graded"));
    registry.broadcast(5, event("leaderboard_update"));
    std::vector<std::string> expected = {"dice_rolled", "question_served", "answer_graded",
                                         "leaderboard_update"};
    tr.expect(a->actions() == expected, "a sees events in order");
    tr.expect(b->actions() == expected, "b sees events in order");
  }

  // A closed channel is skipped without affecting the rest.
  {
    ConnectionRegistry registry;
    auto gone = std::make_shared<RecordingChannel>("gone");
    auto live = std::make_shared<RecordingChannel>("live");
    registry.add(gone, 3, Role::Player, 1);
    registry.add(live, 3, Role::Player, 2);
    gone->close();
    tr.expect(registry.broadcast(3, event("game_started")) == 1, "one delivery counted");
    tr.expect(live->actions().size() == 1, "live channel still served");
    tr.expect(registry.count(3) == 2, "closed channel stays until removed");
  }

  // Removal cleans up every index.
  {
    ConnectionRegistry registry;
    auto ch = std::make_shared<RecordingChannel>("multi");
    auto solo = std::make_shared<RecordingChannel>("solo");
    registry.add(ch, 1, Role::Player, 1);
    registry.add(ch, 2, Role::Facilitator, std::nullopt);
    auto solo_id = registry.add(solo, 2, Role::Player, 4);

    tr.expect(registry.find_by_channel(ch.get()).size() == 2, "channel watches two sessions");
    tr.expect(registry.remove_channel(ch.get()) == 2, "both registrations removed");
    tr.expect(registry.count(1) == 0, "session 1 now empty");
    tr.expect(registry.session_count() == 1, "empty session index dropped");
    tr.expect(registry.broadcast(1, event("ghost")) == 0, "nothing to deliver to");

    tr.expect(registry.remove(solo_id), "remove by id");
    tr.expect(!registry.remove(solo_id), "second remove reports false");
    tr.expect(registry.session_count() == 0, "all sessions gone");
    tr.expect(!registry.send_to(solo_id, event("late")), "send to removed id fails");
  }

  return tr.exit_code();
}
