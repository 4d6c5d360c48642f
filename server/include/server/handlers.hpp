#pragma once

#include <cstdint>

#include "server/auth.hpp"
#include "server/coordinator.hpp"
#include "server/server.hpp"
#include "server/store.hpp"

namespace trivia::server {

struct HandlerContext {
  SessionCoordinator& coordinator;
  AuthService& auth;
  GameStore& store;
  std::uint64_t token_ttl_seconds{3600};
};

// Registers every request action on `server` and unsubscribes connections
// from the coordinator when they close. `ctx` must outlive the server.
void register_handlers(Server& server, HandlerContext& ctx);

}  // namespace trivia::server
