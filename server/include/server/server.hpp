#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "common/message.hpp"
#include "server/connection_registry.hpp"
#include "server/thread_pool.hpp"

namespace trivia::server {

class Connection;

using HandlerFn = std::function<Message(const std::shared_ptr<Connection>&, const Message&)>;
using CloseFn = std::function<void(const Connection&)>;

class Server {
 public:
  Server(std::string host, uint16_t port, std::size_t workers = 4);
  ~Server();

  void register_handler(const std::string& action, HandlerFn handler);
  // Runs on the connection's reader thread once the peer is gone. The
  // connection is released on a worker afterwards.
  void on_close(CloseFn callback);

  bool start();
  void stop();
  bool running() const { return running_.load(); }
  // Bound port; differs from the requested one when that was 0.
  uint16_t port() const { return port_; }
  std::size_t connection_count();

  void handle_message(const std::shared_ptr<Connection>& conn, const Message& msg);
  void connection_closed(const Connection& conn);

 private:
  void accept_loop();
  void prune_closed();
  void close_all_connections();

  std::string host_;
  uint16_t port_;
  std::atomic<bool> running_{false};
  int listen_fd_{-1};
  std::thread accept_thread_;

  std::mutex conns_mtx_;
  std::vector<std::shared_ptr<Connection>> connections_;

  ThreadPool workers_;
  std::mutex handlers_mtx_;
  std::map<std::string, HandlerFn> handlers_;
  CloseFn close_callback_;
};

// One client socket. Reads on its own thread; writes are queued and drained
// in order by a writer thread so send() never waits on the peer.
class Connection : public ClientChannel, public std::enable_shared_from_this<Connection> {
 public:
  static constexpr std::size_t kMaxQueuedFrames = 1024;

  Connection(int fd, Server* server, std::string peer);
  ~Connection() override;

  void start();
  void stop();

  bool send(const Message& msg) override;
  bool is_open() const override { return alive_.load(); }
  std::string peer() const override { return peer_; }

 private:
  void read_loop();
  void write_loop();
  void close_outbox();

  int fd_;
  Server* server_;
  std::string peer_;
  std::atomic<bool> alive_{true};
  std::atomic<bool> stopped_{false};
  std::thread reader_;
  std::thread writer_;

  std::mutex out_mtx_;
  std::condition_variable out_cv_;
  std::deque<std::vector<std::uint8_t>> outbox_;
  bool closing_{false};
};

}  // namespace trivia::server
