#include <iostream>
#include <string>

#include "common/crypto.hpp"
#include "server/auth.hpp"

using trivia::server::AuthService;

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
      std::cout << "[PASS] all auth tests\n";
      return 0;
    }
    std::cerr << "[FAILURES] total: " << failures << "\n";
    return 1;
  }
};

}  // namespace

int main() {
  TestRunner tr;

  // Hashing helpers.
  {
    auto salt = trivia::random_hex(16);
    tr.expect(salt.size() == 32, "16 random bytes give 32 hex chars");
    auto hash = trivia::hash_password("secret1", salt);
    tr.expect(hash.size() == 64, "sha-256 hex digest");
    tr.expect(trivia::verify_password("secret1", hash, salt), "right password verifies");
    tr.expect(!trivia::verify_password("secret2", hash, salt), "wrong password rejected");
    tr.expect(hash != trivia::hash_password("secret1", trivia::random_hex(16)),
              "salt changes the hash");

    auto code = trivia::random_room_code();
    bool alnum = code.size() == 6;
    for (char c : code) {
      if (!((c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9'))) alnum = false;
    }
    tr.expect(alnum, "room code is 6 upper-case alphanumerics");
  }

  // Accounts and tokens.
  {
    AuthService auth(":memory:");
    std::string err;
    tr.expect(!auth.register_facilitator("quizmaster", "123", &err), "short password refused");

    auto id = auth.register_facilitator("quizmaster", "letmein", &err);
    tr.expect(id.has_value(), "facilitator registered");
    tr.expect(!auth.register_facilitator("quizmaster", "another1", &err),
              "duplicate username refused");
    tr.expect(err == "Username already registered", "duplicate username message");

    tr.expect(!auth.login("quizmaster", "wrongpass", 3600, &err), "bad password refused");
    tr.expect(err == "Invalid credentials", "bad password message");
    tr.expect(!auth.login("nobody", "letmein", 3600, &err), "unknown user refused");

    auto session = auth.login("quizmaster", "letmein", 3600, &err);
    tr.expect(session.has_value(), "login succeeds");
    if (session) {
      tr.expect(session->token.size() == 64, "token is 32 random bytes in hex");
      auto who = auth.validate(session->token, &err);
      tr.expect(who && who->facilitator_id == *id, "token resolves to the facilitator");

      tr.expect(auth.logout(session->token, &err), "logout succeeds");
      tr.expect(!auth.validate(session->token, &err), "token invalid after logout");
    }

    tr.expect(!auth.validate("", &err), "empty token rejected");
    tr.expect(err == "Missing session token", "empty token message");
  }

  return tr.exit_code();
}
