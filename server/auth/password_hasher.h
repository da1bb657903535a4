#pragma once

#include <string>

namespace parley {

// PBKDF2-HMAC-SHA256 password hashing. Encoded form:
//   pbkdf2_sha256$<iterations>$<salt_hex>$<hash_hex>
class PasswordHasher {
 public:
  static constexpr int kDefaultIterations = 310000;

  explicit PasswordHasher(int iterations = kDefaultIterations);

  // Derives a hash with a fresh random 16-byte salt. Throws
  // std::runtime_error if the RNG or KDF fails.
  std::string Hash(const std::string& password) const;

  // Recomputes with the salt and iteration count stored in `encoded` and
  // compares in constant time. Malformed encodings never verify.
  static bool Verify(const std::string& password, const std::string& encoded);

 private:
  int iterations_;
};

}  // namespace parley
