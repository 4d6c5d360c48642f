#include "server/auth.hpp"

#include <spdlog/spdlog.h>

#include "common/crypto.hpp"
#include "common/message.hpp"

namespace trivia::server {

namespace {

const char* kAuthSchema =
    "CREATE TABLE IF NOT EXISTS facilitators ("
    "  id INTEGER PRIMARY KEY AUTOINCREMENT,"
    "  username TEXT NOT NULL UNIQUE,"
    "  pass_hash TEXT NOT NULL,"
    "  salt TEXT NOT NULL,"
    "  created_at INTEGER NOT NULL);"
    "CREATE TABLE IF NOT EXISTS auth_tokens ("
    "  token TEXT PRIMARY KEY,"
    "  facilitator_id INTEGER NOT NULL REFERENCES facilitators(id),"
    "  expires_at INTEGER NOT NULL,"
    "  created_at INTEGER NOT NULL);";

std::string column_text(sqlite3_stmt* stmt, int col) {
  const unsigned char* ptr = sqlite3_column_text(stmt, col);
  return ptr ? reinterpret_cast<const char*>(ptr) : "";
}

}  // namespace

AuthService::AuthService(std::string db_path) : db_path_(std::move(db_path)) {
  if (!open_db() || !ensure_schema()) {
    spdlog::error("auth store unavailable at {}", db_path_);
  }
}

AuthService::~AuthService() {
  if (db_) sqlite3_close(db_);
}

bool AuthService::open_db() {
  std::lock_guard<std::mutex> lock(mtx_);
  if (db_) return true;
  if (sqlite3_open(db_path_.c_str(), &db_) != SQLITE_OK) {
    sqlite3_close(db_);
    db_ = nullptr;
    return false;
  }
  sqlite3_busy_timeout(db_, 2000);
  return true;
}

bool AuthService::ensure_schema() {
  std::lock_guard<std::mutex> lock(mtx_);
  char* errmsg = nullptr;
  if (sqlite3_exec(db_, kAuthSchema, nullptr, nullptr, &errmsg) != SQLITE_OK) {
    spdlog::error("auth schema: {}", errmsg ? errmsg : "unknown error");
    sqlite3_free(errmsg);
    return false;
  }
  return true;
}

std::optional<int> AuthService::register_facilitator(const std::string& username,
                                                     const std::string& password,
                                                     std::string* error) {
  if (username.empty() || password.size() < 6) {
    if (error) *error = "Username required and password must be at least 6 characters";
    return std::nullopt;
  }
  if (!open_db()) {
    if (error) *error = "DB open failed";
    return std::nullopt;
  }
  std::lock_guard<std::mutex> lock(mtx_);
  const char* sql =
      "INSERT INTO facilitators(username, pass_hash, salt, created_at) VALUES(?,?,?,?);";
  sqlite3_stmt* stmt = nullptr;
  if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
    if (error) *error = sqlite3_errmsg(db_);
    return std::nullopt;
  }
  auto salt = random_hex(16);
  auto hashed = hash_password(password, salt);
  if (salt.empty() || hashed.empty()) {
    if (error) *error = "Password hashing failed";
    sqlite3_finalize(stmt);
    return std::nullopt;
  }
  sqlite3_bind_text(stmt, 1, username.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 2, hashed.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 3, salt.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_int64(stmt, 4, static_cast<sqlite3_int64>(unix_now()));

  int rc = sqlite3_step(stmt);
  if (rc != SQLITE_DONE) {
    if (error) {
      *error = rc == SQLITE_CONSTRAINT ? "Username already registered" : sqlite3_errmsg(db_);
    }
    sqlite3_finalize(stmt);
    return std::nullopt;
  }
  int new_id = static_cast<int>(sqlite3_last_insert_rowid(db_));
  sqlite3_finalize(stmt);
  spdlog::info("registered facilitator {} ({})", new_id, username);
  return new_id;
}

std::optional<FacilitatorSession> AuthService::login(const std::string& username,
                                                     const std::string& password,
                                                     std::uint64_t ttl_seconds,
                                                     std::string* error) {
  if (!open_db()) {
    if (error) *error = "DB open failed";
    return std::nullopt;
  }
  std::lock_guard<std::mutex> lock(mtx_);

  const char* sql_user = "SELECT id, pass_hash, salt FROM facilitators WHERE username = ?;";
  sqlite3_stmt* stmt = nullptr;
  if (sqlite3_prepare_v2(db_, sql_user, -1, &stmt, nullptr) != SQLITE_OK) {
    if (error) *error = sqlite3_errmsg(db_);
    return std::nullopt;
  }
  sqlite3_bind_text(stmt, 1, username.c_str(), -1, SQLITE_TRANSIENT);
  if (sqlite3_step(stmt) != SQLITE_ROW) {
    if (error) *error = "Invalid credentials";
    sqlite3_finalize(stmt);
    return std::nullopt;
  }
  int fid = sqlite3_column_int(stmt, 0);
  std::string stored_hash = column_text(stmt, 1);
  std::string salt = column_text(stmt, 2);
  sqlite3_finalize(stmt);

  if (!verify_password(password, stored_hash, salt)) {
    if (error) *error = "Invalid credentials";
    return std::nullopt;
  }

  std::string token = random_hex(32);
  if (token.empty()) {
    if (error) *error = "Token generation failed";
    return std::nullopt;
  }
  std::uint64_t now = unix_now();
  std::uint64_t expires = now + ttl_seconds;

  const char* sql_tok =
      "INSERT INTO auth_tokens(token, facilitator_id, expires_at, created_at) VALUES(?,?,?,?);";
  if (sqlite3_prepare_v2(db_, sql_tok, -1, &stmt, nullptr) != SQLITE_OK) {
    if (error) *error = sqlite3_errmsg(db_);
    return std::nullopt;
  }
  sqlite3_bind_text(stmt, 1, token.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_int(stmt, 2, fid);
  sqlite3_bind_int64(stmt, 3, static_cast<sqlite3_int64>(expires));
  sqlite3_bind_int64(stmt, 4, static_cast<sqlite3_int64>(now));
  if (sqlite3_step(stmt) != SQLITE_DONE) {
    if (error) *error = sqlite3_errmsg(db_);
    sqlite3_finalize(stmt);
    return std::nullopt;
  }
  sqlite3_finalize(stmt);

  return FacilitatorSession{fid, username, token, expires};
}

bool AuthService::logout(const std::string& token, std::string* error) {
  if (!open_db()) {
    if (error) *error = "DB open failed";
    return false;
  }
  std::lock_guard<std::mutex> lock(mtx_);
  const char* sql = "DELETE FROM auth_tokens WHERE token = ?;";
  sqlite3_stmt* stmt = nullptr;
  if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
    if (error) *error = sqlite3_errmsg(db_);
    return false;
  }
  sqlite3_bind_text(stmt, 1, token.c_str(), -1, SQLITE_TRANSIENT);
  bool ok = sqlite3_step(stmt) == SQLITE_DONE;
  if (!ok && error) *error = sqlite3_errmsg(db_);
  sqlite3_finalize(stmt);
  return ok;
}

std::optional<FacilitatorSession> AuthService::validate(const std::string& token,
                                                        std::string* error) {
  if (token.empty()) {
    if (error) *error = "Missing session token";
    return std::nullopt;
  }
  if (!open_db()) {
    if (error) *error = "DB open failed";
    return std::nullopt;
  }
  std::lock_guard<std::mutex> lock(mtx_);

  const char* sql =
      "SELECT t.facilitator_id, f.username, t.expires_at "
      "FROM auth_tokens t JOIN facilitators f ON t.facilitator_id = f.id "
      "WHERE t.token = ?;";
  sqlite3_stmt* stmt = nullptr;
  if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
    if (error) *error = sqlite3_errmsg(db_);
    return std::nullopt;
  }
  sqlite3_bind_text(stmt, 1, token.c_str(), -1, SQLITE_TRANSIENT);
  if (sqlite3_step(stmt) != SQLITE_ROW) {
    if (error) *error = "Session not found";
    sqlite3_finalize(stmt);
    return std::nullopt;
  }
  int fid = sqlite3_column_int(stmt, 0);
  std::string username = column_text(stmt, 1);
  std::uint64_t exp = static_cast<std::uint64_t>(sqlite3_column_int64(stmt, 2));
  sqlite3_finalize(stmt);

  if (unix_now() > exp) {
    if (error) *error = "Session expired";
    sqlite3_stmt* del = nullptr;
    const char* del_sql = "DELETE FROM auth_tokens WHERE token = ?;";
    if (sqlite3_prepare_v2(db_, del_sql, -1, &del, nullptr) == SQLITE_OK) {
      sqlite3_bind_text(del, 1, token.c_str(), -1, SQLITE_TRANSIENT);
      if (sqlite3_step(del) != SQLITE_DONE) {
        spdlog::warn("could not purge expired token: {}", sqlite3_errmsg(db_));
      }
      sqlite3_finalize(del);
    }
    return std::nullopt;
  }

  return FacilitatorSession{fid, username, token, exp};
}

}  // namespace trivia::server
