#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <thread>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/rotating_file_sink.h>

#include "server/auth.hpp"
#include "server/connection_registry.hpp"
#include "server/coordinator.hpp"
#include "server/handlers.hpp"
#include "server/scheduler.hpp"
#include "server/server.hpp"
#include "server/sqlite_store.hpp"

using trivia::server::AuthService;
using trivia::server::ConnectionRegistry;
using trivia::server::CoordinatorOptions;
using trivia::server::HandlerContext;
using trivia::server::Scheduler;
using trivia::server::Server;
using trivia::server::SessionCoordinator;
using trivia::server::SqliteStore;

namespace {
std::atomic<bool> g_stop{false};

void signal_handler(int) {
  g_stop.store(true);
}

struct ServerConfig {
  std::string host = "0.0.0.0";
  uint16_t port = 5555;
  std::string db_path = "data/trivia.db";
  int reveal_delay_ms = 3000;
  std::size_t workers = 4;
};

std::optional<ServerConfig> parse_config(int argc, char** argv, std::string& error) {
  ServerConfig cfg;
  try {
    if (argc > 1) {
      int port = std::stoi(argv[1]);
      if (port <= 0 || port > 65535) {
        error = "port out of range";
        return std::nullopt;
      }
      cfg.port = static_cast<uint16_t>(port);
    }
    if (argc > 2) cfg.db_path = argv[2];
    if (argc > 3) {
      cfg.reveal_delay_ms = std::stoi(argv[3]);
      if (cfg.reveal_delay_ms < 0) {
        error = "reveal delay must not be negative";
        return std::nullopt;
      }
    }
    if (argc > 4) {
      int workers = std::stoi(argv[4]);
      if (workers <= 0) {
        error = "worker count must be positive";
        return std::nullopt;
      }
      cfg.workers = static_cast<std::size_t>(workers);
    }
  } catch (const std::exception& ex) {
    error = std::string("invalid number: ") + ex.what();
    return std::nullopt;
  }
  return cfg;
}

}  // namespace

int main(int argc, char** argv) {
  std::string error;
  auto cfg = parse_config(argc, argv, error);
  if (!cfg) {
    std::cerr << "usage: trivia_server [port] [db_path] [reveal_delay_ms] [workers]\n"
              << error << "\n";
    return 2;
  }

  // Ensure logs dir exists and set up rotating logger.
  std::filesystem::create_directories("logs");
  auto logger = spdlog::rotating_logger_mt("server", "logs/server.log", 1024 * 1024 * 5, 3);
  spdlog::set_default_logger(logger);
  spdlog::set_level(spdlog::level::info);
  spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
  spdlog::flush_every(std::chrono::seconds(2));

  auto db_dir = std::filesystem::path(cfg->db_path).parent_path();
  if (!db_dir.empty()) {
    std::error_code ec;
    std::filesystem::create_directories(db_dir, ec);
    if (ec) {
      spdlog::error("cannot create {}: {}", db_dir.string(), ec.message());
      return 1;
    }
  }

  SqliteStore store(cfg->db_path);
  if (!store.is_open()) {
    spdlog::error("cannot open database {}", cfg->db_path);
    std::cerr << "[server] cannot open database " << cfg->db_path << "\n";
    return 1;
  }
  AuthService auth(cfg->db_path);
  ConnectionRegistry registry;
  Scheduler scheduler;

  CoordinatorOptions options;
  options.reveal_delay = std::chrono::milliseconds(cfg->reveal_delay_ms);
  SessionCoordinator coordinator(store, registry, scheduler, options);

  HandlerContext ctx{coordinator, auth, store};
  Server server(cfg->host, cfg->port, cfg->workers);
  trivia::server::register_handlers(server, ctx);

  std::signal(SIGINT, signal_handler);
  std::signal(SIGTERM, signal_handler);
  std::signal(SIGPIPE, SIG_IGN);

  if (!server.start()) {
    std::cerr << "[server] failed to start\n";
    return 1;
  }
  spdlog::info("trivia server up: db={} reveal_delay={}ms workers={}", cfg->db_path,
               cfg->reveal_delay_ms, cfg->workers);
  std::cout << "[server] listening on " << cfg->host << ":" << cfg->port
            << ". Press Ctrl+C to stop.\n";

  while (!g_stop.load()) {
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
  }

  // Connections first so no handler runs against a stopped scheduler.
  server.stop();
  scheduler.shutdown();
  spdlog::info("shutdown complete");
  std::cout << "[server] stopped.\n";
  return 0;
}
