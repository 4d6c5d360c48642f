#include "common/codec.hpp"

#include <array>
#include <cerrno>
#include <chrono>
#include <cstring>

#include <arpa/inet.h>
#include <sys/socket.h>

#include <nlohmann/json.hpp>

namespace trivia {
namespace {

bool is_valid_utf8(const std::string& s) {
  const unsigned char* bytes =
      reinterpret_cast<const unsigned char*>(s.data());
  std::size_t len = s.size();
  std::size_t i = 0;
  while (i < len) {
    unsigned char c = bytes[i];
    std::size_t remaining = 0;
    if (c <= 0x7F) {
      remaining = 0;
    } else if ((c >> 5) == 0x6) {
      remaining = 1;
      if ((c & 0x1E) == 0) return false;
    } else if ((c >> 4) == 0xE) {
      remaining = 2;
    } else if ((c >> 3) == 0x1E) {
      remaining = 3;
    } else {
      return false;
    }
    if (i + remaining >= len) return false;
    for (std::size_t j = 1; j <= remaining; ++j) {
      if ((bytes[i + j] >> 6) != 0x2) return false;
    }
    i += remaining + 1;
  }
  return true;
}

std::uint32_t read_prefix(const std::uint8_t* data) {
  std::uint32_t be_len = 0;
  std::memcpy(&be_len, data, sizeof(be_len));
  return ntohl(be_len);
}

bool take_string(const nlohmann::json& j, const char* key, bool required, std::string& out,
                 std::string& error) {
  auto it = j.find(key);
  if (it == j.end()) {
    if (required) error = std::string(key) + " missing";
    return !required;
  }
  if (!it->is_string()) {
    error = std::string(key) + " must be string";
    return false;
  }
  out = it->get<std::string>();
  return true;
}

bool take_unsigned(const nlohmann::json& j, const char* key, bool required, std::uint64_t& out,
                   std::string& error) {
  auto it = j.find(key);
  if (it == j.end()) {
    if (required) error = std::string(key) + " missing";
    return !required;
  }
  if (!it->is_number_unsigned()) {
    error = std::string(key) + " must be unsigned number";
    return false;
  }
  out = it->get<std::uint64_t>();
  return true;
}

}  // namespace

std::uint64_t unix_now() {
  using namespace std::chrono;
  return static_cast<std::uint64_t>(
      duration_cast<seconds>(system_clock::now().time_since_epoch()).count());
}

Message make_notification(const std::string& action, nlohmann::json data) {
  Message msg;
  msg.type = MessageType::Notification;
  msg.action = action;
  msg.timestamp = unix_now();
  msg.data = data.is_object() ? std::move(data) : nlohmann::json::object();
  return msg;
}

std::string to_string(MessageType type) {
  switch (type) {
    case MessageType::Request:
      return "REQUEST";
    case MessageType::Response:
      return "RESPONSE";
    case MessageType::Notification:
      return "NOTIFICATION";
  }
  return "REQUEST";
}

std::string to_string(Status status) {
  switch (status) {
    case Status::None:
      return "";
    case Status::Success:
      return "SUCCESS";
    case Status::Error:
      return "ERROR";
  }
  return "";
}

std::optional<MessageType> message_type_from_string(const std::string& value) {
  if (value == "REQUEST") return MessageType::Request;
  if (value == "RESPONSE") return MessageType::Response;
  if (value == "NOTIFICATION") return MessageType::Notification;
  return std::nullopt;
}

std::optional<Status> status_from_string(const std::string& value) {
  if (value.empty()) return Status::None;
  if (value == "SUCCESS") return Status::Success;
  if (value == "ERROR") return Status::Error;
  return std::nullopt;
}

std::optional<Message> message_from_json(const nlohmann::json& j, std::string& error) {
  if (!j.is_object()) {
    error = "Message must be a JSON object";
    return std::nullopt;
  }

  Message msg;
  std::string type_name;
  if (!take_string(j, "message_type", true, type_name, error)) return std::nullopt;
  auto mt = message_type_from_string(type_name);
  if (!mt) {
    error = "invalid message_type: " + type_name;
    return std::nullopt;
  }
  msg.type = *mt;

  if (!take_string(j, "action", true, msg.action, error)) return std::nullopt;
  if (msg.action.empty()) {
    error = "action missing or empty";
    return std::nullopt;
  }

  // Clients may leave the timestamp to the server; server messages always carry one.
  bool need_timestamp = msg.type != MessageType::Request;
  if (!take_unsigned(j, "timestamp", need_timestamp, msg.timestamp, error)) return std::nullopt;
  if (!take_unsigned(j, "request_id", false, msg.request_id, error)) return std::nullopt;
  if (!take_string(j, "session_id", false, msg.session_id, error)) return std::nullopt;

  auto data = j.find("data");
  if (data != j.end() && !data->is_null()) {
    if (!data->is_object()) {
      error = "data must be JSON object";
      return std::nullopt;
    }
    msg.data = *data;
  }

  std::string status_name;
  if (!take_string(j, "status", false, status_name, error)) return std::nullopt;
  auto st = status_from_string(status_name);
  if (!st) {
    error = "invalid status: " + status_name;
    return std::nullopt;
  }
  msg.status = *st;
  if (msg.type == MessageType::Response && msg.status == Status::None) {
    error = "response requires status";
    return std::nullopt;
  }

  if (!take_string(j, "error_code", false, msg.error_code, error)) return std::nullopt;
  if (!take_string(j, "error_message", false, msg.error_message, error)) return std::nullopt;
  return msg;
}

nlohmann::json message_to_json(const Message& msg) {
  nlohmann::json j;
  j["message_type"] = to_string(msg.type);
  j["action"] = msg.action;
  j["timestamp"] = msg.timestamp;
  if (msg.request_id != 0) j["request_id"] = msg.request_id;
  if (!msg.session_id.empty()) j["session_id"] = msg.session_id;
  j["data"] = msg.data.is_null() ? nlohmann::json::object() : msg.data;
  if (msg.status != Status::None) j["status"] = to_string(msg.status);
  if (!msg.error_code.empty()) j["error_code"] = msg.error_code;
  if (!msg.error_message.empty()) j["error_message"] = msg.error_message;
  return j;
}

ssize_t read_exact(int fd, void* buffer, std::size_t length) {
  auto* out = static_cast<std::uint8_t*>(buffer);
  std::size_t total = 0;
  while (total < length) {
    ssize_t n = ::recv(fd, out + total, length - total, 0);
    if (n == 0) break;  // peer closed
    if (n < 0) {
      if (errno == EINTR) continue;
      return -1;
    }
    total += static_cast<std::size_t>(n);
  }
  return static_cast<ssize_t>(total);
}

ssize_t write_exact(int fd, const void* buffer, std::size_t length) {
  const auto* in = static_cast<const std::uint8_t*>(buffer);
  std::size_t total = 0;
  while (total < length) {
    // MSG_NOSIGNAL: a vanished peer is an error return, not SIGPIPE.
    ssize_t n = ::send(fd, in + total, length - total, MSG_NOSIGNAL);
    if (n < 0) {
      if (errno == EINTR) continue;
      return -1;
    }
    total += static_cast<std::size_t>(n);
  }
  return static_cast<ssize_t>(total);
}

std::vector<std::uint8_t> encode_frame(const Message& msg, std::string& error) {
  nlohmann::json payload = message_to_json(msg);
  std::string json_str = payload.dump();
  if (json_str.size() > kMaxPayloadSize) {
    error = "payload too large";
    return {};
  }
  if (!is_valid_utf8(json_str)) {
    error = "payload not valid UTF-8";
    return {};
  }

  std::vector<std::uint8_t> frame;
  frame.resize(kFramePrefixBytes + json_str.size());
  const std::uint32_t be_len = htonl(static_cast<std::uint32_t>(json_str.size()));
  std::memcpy(frame.data(), &be_len, sizeof(be_len));
  std::memcpy(frame.data() + kFramePrefixBytes, json_str.data(),
              json_str.size());
  return frame;
}

bool decode_frame(const std::vector<std::uint8_t>& frame, Message& out,
                  std::string& error) {
  if (frame.size() < kFramePrefixBytes) {
    error = "frame too small";
    return false;
  }
  const std::uint32_t payload_len = read_prefix(frame.data());
  if (payload_len > kMaxPayloadSize) {
    error = "payload too large";
    return false;
  }
  if (frame.size() != kFramePrefixBytes + payload_len) {
    error = "payload length mismatch";
    return false;
  }

  std::string payload(reinterpret_cast<const char*>(frame.data() + kFramePrefixBytes),
                      payload_len);
  if (!is_valid_utf8(payload)) {
    error = "payload not valid UTF-8";
    return false;
  }

  nlohmann::json j;
  try {
    j = nlohmann::json::parse(payload);
  } catch (const std::exception& ex) {
    error = std::string("JSON parse error: ") + ex.what();
    return false;
  }

  auto msg = message_from_json(j, error);
  if (!msg) return false;
  out = *msg;
  return true;
}

bool read_frame(int fd, std::vector<std::uint8_t>& frame, std::string& error) {
  std::array<std::uint8_t, kFramePrefixBytes> prefix{};
  ssize_t n = read_exact(fd, prefix.data(), prefix.size());
  if (n == 0) {
    error = "EOF";
    return false;
  }
  if (n != static_cast<ssize_t>(prefix.size())) {
    error = "failed to read length prefix";
    return false;
  }
  const std::uint32_t payload_len = read_prefix(prefix.data());
  if (payload_len > kMaxPayloadSize) {
    error = "payload too large";
    return false;
  }

  frame.resize(kFramePrefixBytes + payload_len);
  std::memcpy(frame.data(), prefix.data(), kFramePrefixBytes);
  if (payload_len == 0) {
    return true;
  }

  ssize_t r = read_exact(fd, frame.data() + kFramePrefixBytes, payload_len);
  if (r != static_cast<ssize_t>(payload_len)) {
    error = "failed to read payload";
    return false;
  }
  return true;
}

bool write_frame(int fd, const std::vector<std::uint8_t>& frame,
                 std::string& error) {
  if (frame.size() < kFramePrefixBytes) {
    error = "frame too small to write";
    return false;
  }
  ssize_t n = write_exact(fd, frame.data(), frame.size());
  if (n != static_cast<ssize_t>(frame.size())) {
    error = "failed to write full frame";
    return false;
  }
  return true;
}

bool send_message(int fd, const Message& msg, std::string& error) {
  auto frame = encode_frame(msg, error);
  if (frame.empty()) return false;
  return write_frame(fd, frame, error);
}

bool receive_message(int fd, Message& out, std::string& error) {
  std::vector<std::uint8_t> frame;
  if (!read_frame(fd, frame, error)) return false;
  return decode_frame(frame, out, error);
}

}  // namespace trivia
