#include "server/server.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <sstream>

#include <spdlog/spdlog.h>

#include "common/codec.hpp"

namespace trivia::server {

namespace {

int create_listen_socket(const std::string& host, uint16_t port) {
  int fd = ::socket(AF_INET, SOCK_STREAM, 0);
  if (fd < 0) {
    spdlog::error("socket: {}", std::strerror(errno));
    return -1;
  }
  int opt = 1;
  ::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(port);
  if (::inet_pton(AF_INET, host.c_str(), &addr.sin_addr) <= 0) {
    spdlog::error("invalid host: {}", host);
    ::close(fd);
    return -1;
  }
  if (::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
    spdlog::error("bind {}:{}: {}", host, port, std::strerror(errno));
    ::close(fd);
    return -1;
  }
  if (::listen(fd, 64) < 0) {
    spdlog::error("listen: {}", std::strerror(errno));
    ::close(fd);
    return -1;
  }
  return fd;
}

std::string peer_addr(int fd) {
  sockaddr_in addr{};
  socklen_t len = sizeof(addr);
  if (::getpeername(fd, reinterpret_cast<sockaddr*>(&addr), &len) == 0) {
    char buf[64];
    ::inet_ntop(AF_INET, &addr.sin_addr, buf, sizeof(buf));
    std::ostringstream oss;
    oss << buf << ":" << ntohs(addr.sin_port);
    return oss.str();
  }
  return "unknown";
}

Message make_error(const Message& req, const std::string& code, const std::string& msg) {
  Message resp;
  resp.type = MessageType::Response;
  resp.action = req.action;
  resp.timestamp = unix_now();
  resp.status = Status::Error;
  resp.error_code = code;
  resp.error_message = msg;
  return resp;
}

}  // namespace

Server::Server(std::string host, uint16_t port, std::size_t workers)
    : host_(std::move(host)), port_(port), workers_(workers) {}

Server::~Server() {
  stop();
}

void Server::register_handler(const std::string& action, HandlerFn handler) {
  std::lock_guard<std::mutex> lock(handlers_mtx_);
  handlers_[action] = std::move(handler);
}

void Server::on_close(CloseFn callback) {
  std::lock_guard<std::mutex> lock(handlers_mtx_);
  close_callback_ = std::move(callback);
}

bool Server::start() {
  if (running_.load()) return true;
  listen_fd_ = create_listen_socket(host_, port_);
  if (listen_fd_ < 0) return false;
  sockaddr_in bound{};
  socklen_t len = sizeof(bound);
  if (::getsockname(listen_fd_, reinterpret_cast<sockaddr*>(&bound), &len) == 0) {
    port_ = ntohs(bound.sin_port);
  }
  running_.store(true);
  accept_thread_ = std::thread(&Server::accept_loop, this);
  spdlog::info("listening on {}:{}", host_, port_);
  return true;
}

void Server::stop() {
  if (!running_.exchange(false)) return;
  if (listen_fd_ >= 0) {
    ::shutdown(listen_fd_, SHUT_RDWR);
    ::close(listen_fd_);
    listen_fd_ = -1;
  }
  if (accept_thread_.joinable()) accept_thread_.join();
  workers_.shutdown();
  close_all_connections();
  spdlog::info("server stopped");
}

void Server::accept_loop() {
  while (running_.load()) {
    sockaddr_in addr{};
    socklen_t len = sizeof(addr);
    int client_fd = ::accept(listen_fd_, reinterpret_cast<sockaddr*>(&addr), &len);
    if (client_fd < 0) {
      if (errno == EINTR) continue;
      if (!running_.load()) break;
      spdlog::warn("accept: {}", std::strerror(errno));
      continue;
    }
    prune_closed();
    auto conn = std::make_shared<Connection>(client_fd, this, peer_addr(client_fd));
    {
      std::lock_guard<std::mutex> lock(conns_mtx_);
      connections_.push_back(conn);
    }
    conn->start();
    spdlog::info("new connection from {}", conn->peer());
  }
}

void Server::handle_message(const std::shared_ptr<Connection>& conn, const Message& msg) {
  bool queued = workers_.enqueue([this, conn, msg] {
    HandlerFn handler;
    {
      std::lock_guard<std::mutex> lock(handlers_mtx_);
      auto it = handlers_.find(msg.action);
      if (it != handlers_.end()) {
        handler = it->second;
      }
    }

    Message resp;
    if (!handler) {
      spdlog::warn("unknown action {} from {}", msg.action, conn->peer());
      resp = make_error(msg, "UNKNOWN_ACTION", "Action not supported");
    } else {
      try {
        resp = handler(conn, msg);
      } catch (const std::exception& ex) {
        spdlog::error("handler {} failed: {}", msg.action, ex.what());
        resp = make_error(msg, "HANDLER_ERROR", ex.what());
      }
    }
    resp.type = MessageType::Response;
    if (resp.action.empty()) resp.action = msg.action;
    resp.request_id = msg.request_id;
    resp.timestamp = unix_now();
    if (!conn->send(resp)) {
      spdlog::warn("response {} to {} dropped, connection closed", msg.action, conn->peer());
    }
  });
  if (!queued) {
    spdlog::warn("{} from {} ignored, server is stopping", msg.action, conn->peer());
  }
}

void Server::connection_closed(const Connection& conn) {
  CloseFn callback;
  {
    std::lock_guard<std::mutex> lock(handlers_mtx_);
    callback = close_callback_;
  }
  if (callback) callback(conn);
  spdlog::info("connection from {} closed", conn.peer());

  // The reader thread cannot join itself; a worker releases the socket.
  if (!workers_.enqueue([this] { prune_closed(); })) {
    spdlog::debug("server stopping, {} released on shutdown", conn.peer());
  }
}

std::size_t Server::connection_count() {
  std::lock_guard<std::mutex> lock(conns_mtx_);
  return connections_.size();
}

void Server::prune_closed() {
  std::vector<std::shared_ptr<Connection>> closed;
  {
    std::lock_guard<std::mutex> lock(conns_mtx_);
    auto it = connections_.begin();
    while (it != connections_.end()) {
      if (!(*it)->is_open()) {
        closed.push_back(std::move(*it));
        it = connections_.erase(it);
      } else {
        ++it;
      }
    }
  }
  for (auto& c : closed) c->stop();
}

void Server::close_all_connections() {
  std::vector<std::shared_ptr<Connection>> to_close;
  {
    std::lock_guard<std::mutex> lock(conns_mtx_);
    to_close.swap(connections_);
  }
  for (auto& c : to_close) {
    if (c) c->stop();
  }
}

Connection::Connection(int fd, Server* server, std::string peer)
    : fd_(fd), server_(server), peer_(std::move(peer)) {}

Connection::~Connection() {
  stop();
}

void Connection::start() {
  writer_ = std::thread(&Connection::write_loop, this);
  reader_ = std::thread(&Connection::read_loop, this);
}

void Connection::stop() {
  if (stopped_.exchange(true)) return;
  alive_.store(false);
  if (fd_ >= 0) ::shutdown(fd_, SHUT_RDWR);
  close_outbox();

  const auto self = std::this_thread::get_id();
  for (auto* t : {&reader_, &writer_}) {
    if (!t->joinable()) continue;
    if (t->get_id() == self) {
      t->detach();
    } else {
      t->join();
    }
  }
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }
}

bool Connection::send(const Message& msg) {
  if (!alive_.load()) return false;
  std::string error;
  auto frame = encode_frame(msg, error);
  if (frame.empty()) {
    spdlog::error("encode error to {}: {}", peer_, error);
    return false;
  }
  {
    std::lock_guard<std::mutex> lock(out_mtx_);
    if (closing_) return false;
    if (outbox_.size() >= kMaxQueuedFrames) {
      spdlog::warn("outbound queue full for {}, dropping {}", peer_, msg.action);
      return false;
    }
    outbox_.push_back(std::move(frame));
  }
  out_cv_.notify_one();
  return true;
}

void Connection::close_outbox() {
  {
    std::lock_guard<std::mutex> lock(out_mtx_);
    closing_ = true;
  }
  out_cv_.notify_all();
}

void Connection::write_loop() {
  while (true) {
    std::vector<std::uint8_t> frame;
    {
      std::unique_lock<std::mutex> lock(out_mtx_);
      out_cv_.wait(lock, [this] { return closing_ || !outbox_.empty(); });
      if (closing_) return;
      frame = std::move(outbox_.front());
      outbox_.pop_front();
    }
    std::string error;
    if (!write_frame(fd_, frame, error)) {
      if (alive_.exchange(false)) {
        spdlog::warn("send error to {}: {}", peer_, error);
      }
      // Wakes the reader so the close path runs once.
      ::shutdown(fd_, SHUT_RDWR);
      return;
    }
  }
}

void Connection::read_loop() {
  while (true) {
    std::vector<std::uint8_t> frame;
    std::string error;
    if (!read_frame(fd_, frame, error)) {
      if (alive_.load() && !error.empty()) {
        spdlog::info("read from {} ended: {}", peer_, error);
      }
      break;
    }
    Message msg;
    if (!decode_frame(frame, msg, error)) {
      spdlog::warn("decode error from {}: {}", peer_, error);
      Message resp = make_error(msg, "INVALID_REQUEST", error);
      if (!send(resp)) break;
      continue;
    }
    server_->handle_message(shared_from_this(), msg);
  }
  alive_.store(false);
  close_outbox();
  server_->connection_closed(*this);
}

}  // namespace trivia::server
