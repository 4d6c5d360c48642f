#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "common/message.hpp"
#include "server/model.hpp"

namespace trivia::server {

// Outbound side of a client connection. send() must not block on the peer:
// it queues the message and reports false only if the channel is closed.
class ClientChannel {
 public:
  virtual ~ClientChannel() = default;

  virtual bool send(const Message& msg) = 0;
  virtual bool is_open() const = 0;
  virtual std::string peer() const = 0;
};

using ConnectionId = std::uint64_t;

struct ConnectionInfo {
  ConnectionId id{};
  int session_id{};
  Role role{Role::Player};
  std::optional<int> team_id;
  std::shared_ptr<ClientChannel> channel;
};

// Tracks which connections watch which session and delivers events to them.
// Delivery is best effort: a refused send is logged and the rest still get it.
class ConnectionRegistry {
 public:
  ConnectionId add(std::shared_ptr<ClientChannel> channel, int session_id, Role role,
                   std::optional<int> team_id);
  bool remove(ConnectionId id);
  // Drops every registration held by `channel`; returns how many were removed.
  std::size_t remove_channel(const ClientChannel* channel);

  std::optional<ConnectionInfo> find(ConnectionId id) const;
  std::vector<ConnectionInfo> find_by_channel(const ClientChannel* channel) const;

  bool send_to(ConnectionId id, const Message& msg);
  std::size_t send_to_team(int session_id, int team_id, const Message& msg);
  std::size_t send_to_facilitators(int session_id, const Message& msg);
  std::size_t broadcast(int session_id, const Message& msg);

  std::size_t count(int session_id) const;
  std::size_t session_count() const;

 private:
  // Snapshot of the targets taken under the lock; sends happen outside it.
  template <typename Pred>
  std::vector<ConnectionInfo> select(int session_id, Pred pred) const;
  std::size_t deliver(const std::vector<ConnectionInfo>& targets, const Message& msg);

  mutable std::mutex mtx_;
  ConnectionId next_id_{1};
  std::map<int, std::set<ConnectionId>> by_session_;
  std::map<ConnectionId, ConnectionInfo> connections_;
};

}  // namespace trivia::server
