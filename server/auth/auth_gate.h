#pragma once

#include "server/auth/identity_policy.h"
#include "server/auth/token_codec.h"
#include "server/auth/user.h"
#include "storage/user_store.h"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace parley {

struct AccessToken {
  std::string token;
  std::int64_t expires_at{0};
};

struct IdentityResolution {
  User user;
  // True when the request resolved to the default identity.
  bool anonymous{false};
  // True when a token was presented but rejected; the transport should
  // expire the session cookie.
  bool clear_cookie{false};
};

// AuthGate turns credentials into identities: it issues tokens after a
// successful login and maps presented tokens back to users, falling back to
// the injected default identity when no usable token is present.
class AuthGate {
 public:
  AuthGate(UserStore* users,
           TokenCodec codec,
           std::shared_ptr<DefaultIdentityPolicy> fallback,
           int session_expiry_minutes);

  AccessToken IssueToken(const std::string& username) const;

  // Throws ServiceError(kInvalidCredential) on a malformed, forged or expired
  // token, or one whose subject no longer exists.
  User ResolveIdentity(const std::string& token) const;

  // Never throws.
  IdentityResolution ResolveIdentityOrAnonymous(const std::optional<std::string>& token) const;

  // Passwordless credentials grant access outright, then the password
  // credential is checked; reserved credentials never grant access. Returns
  // nullopt for an unknown user and for a failed check alike.
  std::optional<User> Authenticate(const std::string& username,
                                   const std::string& password) const;

  int session_expiry_minutes() const { return session_expiry_minutes_; }

 private:
  User Fallback() const;

  UserStore* users_;
  TokenCodec codec_;
  std::shared_ptr<DefaultIdentityPolicy> fallback_;
  int session_expiry_minutes_;
};

}  // namespace parley
