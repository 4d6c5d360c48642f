#pragma once

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>

#include <sqlite3.h>

namespace trivia::server {

struct FacilitatorSession {
  int facilitator_id{};
  std::string username;
  std::string token;
  std::uint64_t expires_at{};
};

// Facilitator accounts and bearer tokens. Players never authenticate.
class AuthService {
 public:
  explicit AuthService(std::string db_path);
  ~AuthService();

  AuthService(const AuthService&) = delete;
  AuthService& operator=(const AuthService&) = delete;

  std::optional<int> register_facilitator(const std::string& username,
                                          const std::string& password,
                                          std::string* error = nullptr);

  std::optional<FacilitatorSession> login(const std::string& username,
                                          const std::string& password,
                                          std::uint64_t ttl_seconds,
                                          std::string* error = nullptr);

  bool logout(const std::string& token, std::string* error = nullptr);

  std::optional<FacilitatorSession> validate(const std::string& token,
                                             std::string* error = nullptr);

 private:
  bool open_db();
  bool ensure_schema();

  std::string db_path_;
  sqlite3* db_{nullptr};
  std::mutex mtx_;
};

}  // namespace trivia::server
