#include "server/connection_registry.hpp"

#include <spdlog/spdlog.h>

namespace trivia::server {

ConnectionId ConnectionRegistry::add(std::shared_ptr<ClientChannel> channel, int session_id,
                                     Role role, std::optional<int> team_id) {
  std::lock_guard<std::mutex> lock(mtx_);
  ConnectionId id = next_id_++;
  ConnectionInfo info{id, session_id, role, team_id, std::move(channel)};
  spdlog::info("connection {} ({}) joined session {} as {}", id,
               info.channel ? info.channel->peer() : "detached", session_id, to_string(role));
  connections_.emplace(id, std::move(info));
  by_session_[session_id].insert(id);
  return id;
}

bool ConnectionRegistry::remove(ConnectionId id) {
  std::lock_guard<std::mutex> lock(mtx_);
  auto it = connections_.find(id);
  if (it == connections_.end()) return false;
  int session_id = it->second.session_id;
  connections_.erase(it);

  auto sit = by_session_.find(session_id);
  if (sit != by_session_.end()) {
    sit->second.erase(id);
    if (sit->second.empty()) by_session_.erase(sit);
  }
  spdlog::info("connection {} left session {}", id, session_id);
  return true;
}

std::size_t ConnectionRegistry::remove_channel(const ClientChannel* channel) {
  std::vector<ConnectionId> ids;
  {
    std::lock_guard<std::mutex> lock(mtx_);
    for (const auto& [id, info] : connections_) {
      if (info.channel.get() == channel) ids.push_back(id);
    }
  }
  std::size_t removed = 0;
  for (auto id : ids) {
    if (remove(id)) ++removed;
  }
  return removed;
}

std::optional<ConnectionInfo> ConnectionRegistry::find(ConnectionId id) const {
  std::lock_guard<std::mutex> lock(mtx_);
  auto it = connections_.find(id);
  if (it == connections_.end()) return std::nullopt;
  return it->second;
}

std::vector<ConnectionInfo> ConnectionRegistry::find_by_channel(const ClientChannel* channel) const {
  std::lock_guard<std::mutex> lock(mtx_);
  std::vector<ConnectionInfo> out;
  for (const auto& [id, info] : connections_) {
    if (info.channel.get() == channel) out.push_back(info);
  }
  return out;
}

template <typename Pred>
std::vector<ConnectionInfo> ConnectionRegistry::select(int session_id, Pred pred) const {
  std::lock_guard<std::mutex> lock(mtx_);
  std::vector<ConnectionInfo> out;
  auto sit = by_session_.find(session_id);
  if (sit == by_session_.end()) return out;
  out.reserve(sit->second.size());
  for (auto id : sit->second) {
    auto it = connections_.find(id);
    if (it != connections_.end() && pred(it->second)) out.push_back(it->second);
  }
  return out;
}

std::size_t ConnectionRegistry::deliver(const std::vector<ConnectionInfo>& targets,
                                        const Message& msg) {
  std::size_t delivered = 0;
  for (const auto& target : targets) {
    if (!target.channel || !target.channel->send(msg)) {
      spdlog::warn("dropping {} for connection {} in session {}: channel closed", msg.action,
                   target.id, target.session_id);
      continue;
    }
    ++delivered;
  }
  return delivered;
}

bool ConnectionRegistry::send_to(ConnectionId id, const Message& msg) {
  auto info = find(id);
  if (!info) return false;
  return deliver({*info}, msg) == 1;
}

std::size_t ConnectionRegistry::send_to_team(int session_id, int team_id, const Message& msg) {
  return deliver(select(session_id,
                        [team_id](const ConnectionInfo& c) {
                          return c.team_id && *c.team_id == team_id;
                        }),
                 msg);
}

std::size_t ConnectionRegistry::send_to_facilitators(int session_id, const Message& msg) {
  return deliver(
      select(session_id, [](const ConnectionInfo& c) { return c.role == Role::Facilitator; }),
      msg);
}

std::size_t ConnectionRegistry::broadcast(int session_id, const Message& msg) {
  return deliver(select(session_id, [](const ConnectionInfo&) { return true; }), msg);
}

std::size_t ConnectionRegistry::count(int session_id) const {
  std::lock_guard<std::mutex> lock(mtx_);
  auto it = by_session_.find(session_id);
  return it == by_session_.end() ? 0 : it->second.size();
}

std::size_t ConnectionRegistry::session_count() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return by_session_.size();
}

}  // namespace trivia::server
