#include <arpa/inet.h>

#include <cstring>
#include <iostream>
#include <string>
#include <vector>

#include "common/codec.hpp"

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
      std::cout << "[PASS] all codec tests\n";
      return 0;
    }
    std::cerr << "[FAILURES] total: " << failures << "\n";
    return 1;
  }
};

}  // namespace

int main() {
  TestRunner tr;

  // Round-trip basic message.
  {
    Message msg;
    msg.type = MessageType::Request;
    msg.action = "JOIN_SESSION";
    msg.timestamp = 1700000000;
    msg.request_id = 42;
    msg.data = {{"room_code", "K3Q9ZD"}, {"team_name", "Quizzly Bears"}};

    std::string err;
    auto frame = trivia::encode_frame(msg, err);
    tr.expect(!frame.empty(), "encode basic message");

    Message decoded;
    bool ok = trivia::decode_frame(frame, decoded, err);
    tr.expect(ok, "decode basic message");
    tr.expect(decoded.action == msg.action, "action preserved");
    tr.expect(decoded.type == msg.type, "message_type preserved");
    tr.expect(decoded.data == msg.data, "data preserved");
    tr.expect(decoded.request_id == 42, "request_id preserved");
  }

  // Large payload near limit.
  {
    Message msg;
    msg.type = MessageType::Request;
    msg.action = "SUBMIT_ANSWER";
    msg.timestamp = 1700000001;
    msg.data["blob"] = std::string(900'000, 'a');  // under 1MiB

    std::string err;
    auto frame = trivia::encode_frame(msg, err);
    tr.expect(!frame.empty(), "encode large payload");

    Message decoded;
    bool ok = trivia::decode_frame(frame, decoded, err);
    tr.expect(ok, "decode large payload");
    tr.expect(decoded.data["blob"].get<std::string>().size() ==
                  msg.data["blob"].get<std::string>().size(),
              "blob size preserved");
  }

  // Invalid UTF-8 payload.
  {
    std::string bad;
    bad.push_back(static_cast<char>(0xC3));  // Invalid lead without continuation.
    bad.push_back(static_cast<char>(0x28));
    std::uint32_t len = static_cast<std::uint32_t>(bad.size());
    std::uint32_t be = htonl(len);
    std::vector<std::uint8_t> frame(trivia::kFramePrefixBytes + bad.size());
    std::memcpy(frame.data(), &be, sizeof(be));
    std::memcpy(frame.data() + trivia::kFramePrefixBytes, bad.data(), bad.size());

    trivia::Message decoded;
    std::string err;
    bool ok = trivia::decode_frame(frame, decoded, err);
    tr.expect(!ok, "detect invalid UTF-8");
  }

  // Length mismatch detection.
  {
    Message msg;
    msg.type = MessageType::Request;
    msg.action = "PING";
    msg.timestamp = 1700000002;
    msg.data = {{"ping", true}};

    std::string err;
    auto frame = trivia::encode_frame(msg, err);
    tr.expect(!frame.empty(), "encode for length mismatch test");
    if (!frame.empty()) {
      frame[3] = static_cast<std::uint8_t>(frame[3] - 1);  // corrupt length
    }
    Message decoded;
    bool ok = trivia::decode_frame(frame, decoded, err);
    tr.expect(!ok, "detect length mismatch");
  }

  // Requests may omit the timestamp; responses may not.
  {
    std::string err;
    auto req = trivia::message_from_json(
        {{"message_type", "REQUEST"}, {"action", "PING"}, {"data", nlohmann::json::object()}}, err);
    tr.expect(req.has_value(), "request without timestamp accepted");
    if (req) tr.expect(req->request_id == 0, "request_id defaults to 0");

    auto resp = trivia::message_from_json(
        {{"message_type", "RESPONSE"}, {"action", "PING"}, {"status", "SUCCESS"}}, err);
    tr.expect(!resp.has_value(), "response without timestamp rejected");

    auto no_status = trivia::message_from_json(
        {{"message_type", "RESPONSE"}, {"action", "PING"}, {"timestamp", 1700000003}}, err);
    tr.expect(!no_status.has_value(), "response without status rejected");

    auto bad_id = trivia::message_from_json(
        {{"message_type", "REQUEST"}, {"action", "PING"}, {"request_id", "seven"}}, err);
    tr.expect(!bad_id.has_value(), "string request_id rejected");
  }

  // Notifications carry the event name as the action and never a status.
  {
    auto note = trivia::make_notification("dice_rolled", {{"value", 4}});
    auto j = trivia::message_to_json(note);
    tr.expect(j["message_type"] == "NOTIFICATION", "notification type on the wire");
    tr.expect(j["action"] == "dice_rolled", "notification action is the event");
    tr.expect(!j.contains("status"), "notification has no status");
    tr.expect(!j.contains("request_id"), "notification has no request_id");
    tr.expect(j["data"]["value"] == 4, "notification data kept");

    auto not_object = trivia::make_notification("leaderboard_update", nlohmann::json::array());
    tr.expect(not_object.data.is_object(), "non-object notification data replaced");
  }

  // An error response that never sets data still decodes on the client.
  {
    Message resp;
    resp.type = MessageType::Response;
    resp.action = "ROLL_DICE";
    resp.timestamp = 1700000004;
    resp.request_id = 9;
    resp.status = Status::Error;
    resp.error_code = "VALIDATION_FAILED";
    resp.error_message = "Dice value must be between 1 and 6";
    tr.expect(resp.data.is_object() && resp.data.empty(), "default data is an empty object");

    std::string err;
    auto frame = trivia::encode_frame(resp, err);
    tr.expect(!frame.empty(), "encode default error response");
    Message decoded;
    bool ok = trivia::decode_frame(frame, decoded, err);
    tr.expect(ok, "decode default error response: " + err);
    tr.expect(decoded.status == Status::Error, "error status preserved");
    tr.expect(decoded.error_code == "VALIDATION_FAILED", "error code preserved");
    tr.expect(decoded.error_message == resp.error_message, "error message preserved");
    tr.expect(decoded.request_id == 9, "request_id echoed through the frame");
    tr.expect(decoded.data.is_object(), "decoded data is an object");
  }

  // Oversized frame prefix is refused before reading the body.
  {
    std::uint32_t be = htonl(static_cast<std::uint32_t>(trivia::kMaxPayloadSize + 1));
    std::vector<std::uint8_t> frame(trivia::kFramePrefixBytes + 2, '{');
    std::memcpy(frame.data(), &be, sizeof(be));
    Message decoded;
    std::string err;
    tr.expect(!trivia::decode_frame(frame, decoded, err), "oversized prefix rejected");
  }

  return tr.exit_code();
}
