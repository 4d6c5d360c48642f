#include "common/crypto.hpp"

#include <iomanip>
#include <sstream>
#include <string>
#include <vector>

#include <openssl/evp.h>
#include <openssl/rand.h>

namespace trivia {

namespace {

std::string to_hex(const unsigned char* data, std::size_t len) {
  std::ostringstream oss;
  oss << std::hex << std::setfill('0');
  for (std::size_t i = 0; i < len; ++i) {
    oss << std::setw(2) << static_cast<int>(data[i]);
  }
  return oss.str();
}

constexpr char kRoomAlphabet[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789";
constexpr unsigned kRoomAlphabetSize = sizeof(kRoomAlphabet) - 1;

}  // namespace

std::string hash_password(const std::string& password, const std::string& salt) {
  EVP_MD_CTX* ctx = EVP_MD_CTX_new();
  if (!ctx) return {};

  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int digest_len = 0;
  bool ok = EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) == 1 &&
            EVP_DigestUpdate(ctx, salt.data(), salt.size()) == 1 &&
            EVP_DigestUpdate(ctx, password.data(), password.size()) == 1 &&
            EVP_DigestFinal_ex(ctx, digest, &digest_len) == 1;
  EVP_MD_CTX_free(ctx);
  if (!ok) return {};
  return to_hex(digest, digest_len);
}

bool verify_password(const std::string& password, const std::string& stored_hash,
                     const std::string& salt) {
  auto computed = hash_password(password, salt);
  return !computed.empty() && computed == stored_hash;
}

std::string random_hex(std::size_t bytes) {
  std::vector<unsigned char> buf(bytes);
  if (RAND_bytes(buf.data(), static_cast<int>(buf.size())) != 1) return {};
  return to_hex(buf.data(), buf.size());
}

std::string random_room_code(std::size_t length) {
  std::string code;
  code.reserve(length);
  // Reject bytes above the largest multiple of the alphabet size to stay uniform.
  const unsigned limit = 256 - (256 % kRoomAlphabetSize);
  unsigned char buf[32];
  while (code.size() < length) {
    if (RAND_bytes(buf, sizeof(buf)) != 1) return {};
    for (unsigned char b : buf) {
      if (b >= limit) continue;
      code.push_back(kRoomAlphabet[b % kRoomAlphabetSize]);
      if (code.size() == length) break;
    }
  }
  return code;
}

}  // namespace trivia
