#pragma once

#include <cstddef>
#include <string>

namespace trivia {

// Salted SHA-256, hex encoded. Returns an empty string if OpenSSL fails.
std::string hash_password(const std::string& password, const std::string& salt);

bool verify_password(const std::string& password, const std::string& stored_hash,
                     const std::string& salt);

// Hex string of `bytes` random bytes from the OpenSSL CSPRNG.
std::string random_hex(std::size_t bytes);

// Room codes are drawn from [A-Z0-9].
std::string random_room_code(std::size_t length = 6);

}  // namespace trivia
