#include "server/auth/password_hasher.h"

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/rand.h>

#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace parley {

namespace {

constexpr const char* kScheme = "pbkdf2_sha256";
constexpr int kSaltBytes = 16;
constexpr int kKeyBytes = 32;

std::string ToHex(const unsigned char* data, std::size_t len) {
  std::ostringstream hex;
  hex << std::hex << std::setfill('0');
  for (std::size_t i = 0; i < len; ++i) {
    hex << std::setw(2) << static_cast<int>(data[i]);
  }
  return hex.str();
}

bool FromHex(const std::string& hex, std::vector<unsigned char>* out) {
  if (hex.size() % 2 != 0) {
    return false;
  }
  auto nibble = [](char c) -> int {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
  };
  out->clear();
  out->reserve(hex.size() / 2);
  for (std::size_t i = 0; i < hex.size(); i += 2) {
    int hi = nibble(hex[i]);
    int lo = nibble(hex[i + 1]);
    if (hi < 0 || lo < 0) {
      return false;
    }
    out->push_back(static_cast<unsigned char>((hi << 4) | lo));
  }
  return true;
}

bool Derive(const std::string& password,
            const std::vector<unsigned char>& salt,
            int iterations,
            std::size_t key_len,
            std::vector<unsigned char>* key) {
  key->assign(key_len, 0);
  return PKCS5_PBKDF2_HMAC(password.data(), static_cast<int>(password.size()), salt.data(),
                           static_cast<int>(salt.size()), iterations, EVP_sha256(),
                           static_cast<int>(key_len), key->data()) == 1;
}

}  // namespace

PasswordHasher::PasswordHasher(int iterations)
    : iterations_(iterations > 0 ? iterations : kDefaultIterations) {}

std::string PasswordHasher::Hash(const std::string& password) const {
  std::vector<unsigned char> salt(kSaltBytes);
  if (RAND_bytes(salt.data(), kSaltBytes) != 1) {
    throw std::runtime_error("RAND_bytes failed while salting password");
  }
  std::vector<unsigned char> key;
  if (!Derive(password, salt, iterations_, kKeyBytes, &key)) {
    throw std::runtime_error("PBKDF2 derivation failed");
  }
  return std::string(kScheme) + "$" + std::to_string(iterations_) + "$" +
         ToHex(salt.data(), salt.size()) + "$" + ToHex(key.data(), key.size());
}

bool PasswordHasher::Verify(const std::string& password, const std::string& encoded) {
  std::vector<std::string> parts;
  std::size_t start = 0;
  while (true) {
    auto pos = encoded.find('$', start);
    parts.push_back(encoded.substr(start, pos - start));
    if (pos == std::string::npos) break;
    start = pos + 1;
  }
  if (parts.size() != 4 || parts[0] != kScheme) {
    return false;
  }
  int iterations = 0;
  try {
    iterations = std::stoi(parts[1]);
  } catch (const std::exception&) {
    return false;
  }
  std::vector<unsigned char> salt;
  std::vector<unsigned char> expected;
  if (iterations <= 0 || !FromHex(parts[2], &salt) || !FromHex(parts[3], &expected) ||
      salt.empty() || expected.empty()) {
    return false;
  }
  std::vector<unsigned char> actual;
  if (!Derive(password, salt, iterations, expected.size(), &actual)) {
    return false;
  }
  return CRYPTO_memcmp(actual.data(), expected.data(), expected.size()) == 0;
}

}  // namespace parley
