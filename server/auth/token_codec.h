#pragma once

#include <cstdint>
#include <functional>
#include <string>

namespace parley {

// HS256-signed bearer tokens carrying `sub` (username) and `exp` (seconds
// since epoch). Stateless: there is no revocation list, a token stays valid
// until it expires.
class TokenCodec {
 public:
  using Clock = std::function<std::int64_t()>;

  // An empty secret is rejected with std::invalid_argument.
  explicit TokenCodec(std::string secret, Clock clock = {});

  // Returns the compact JWS for `subject` expiring at `expires_at`.
  std::string Encode(const std::string& subject, std::int64_t expires_at) const;

  // True when the token is well formed, HS256, correctly signed, not
  // expired, and carries a non-empty `sub`.
  bool Verify(const std::string& token, std::string* subject_out) const;

  std::int64_t Now() const;

  static std::string Base64UrlEncode(const std::string& input);
  static std::string Base64UrlDecode(const std::string& input);

 private:
  std::string Sign(const std::string& header_payload) const;

  std::string secret_;
  Clock clock_;
};

}  // namespace parley
