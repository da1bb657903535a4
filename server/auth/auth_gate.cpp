#include "server/auth/auth_gate.h"

#include "server/auth/password_hasher.h"
#include "server/logging/logger.h"
#include "server/service_error.h"

namespace parley {

AuthGate::AuthGate(UserStore* users,
                   TokenCodec codec,
                   std::shared_ptr<DefaultIdentityPolicy> fallback,
                   int session_expiry_minutes)
    : users_(users),
      codec_(std::move(codec)),
      fallback_(std::move(fallback)),
      session_expiry_minutes_(session_expiry_minutes > 0 ? session_expiry_minutes : 60) {}

AccessToken AuthGate::IssueToken(const std::string& username) const {
  AccessToken out;
  out.expires_at = codec_.Now() + static_cast<std::int64_t>(session_expiry_minutes_) * 60;
  out.token = codec_.Encode(username, out.expires_at);
  return out;
}

User AuthGate::ResolveIdentity(const std::string& token) const {
  std::string subject;
  if (!codec_.Verify(token, &subject)) {
    throw ServiceError(ErrorCode::kInvalidCredential, "Could not validate credentials");
  }
  auto user = users_ ? users_->GetUser(subject) : std::nullopt;
  if (!user) {
    throw ServiceError(ErrorCode::kInvalidCredential, "Could not validate credentials");
  }
  return *user;
}

User AuthGate::Fallback() const {
  std::string name = fallback_ ? fallback_->Username() : "system";
  if (fallback_) {
    try {
      return fallback_->Resolve();
    } catch (const std::exception& e) {
      log::Warn("auth", "default identity lookup failed, using synthesized user",
                "username=" + name + " error=" + e.what());
    }
  }
  User user;
  user.username = name;
  user.credentials.push_back({AuthType::kPasswordless, {}});
  return user;
}

IdentityResolution AuthGate::ResolveIdentityOrAnonymous(
    const std::optional<std::string>& token) const {
  IdentityResolution out;
  if (token && !token->empty()) {
    try {
      out.user = ResolveIdentity(*token);
      return out;
    } catch (const ServiceError& e) {
      log::Debug("auth", "token rejected, falling back to default identity", e.what());
    } catch (const std::exception& e) {
      log::Warn("auth", "identity lookup failed, falling back to default identity", e.what());
    }
    out.clear_cookie = true;
  }
  out.user = Fallback();
  out.anonymous = true;
  return out;
}

std::optional<User> AuthGate::Authenticate(const std::string& username,
                                           const std::string& password) const {
  if (!users_) {
    return std::nullopt;
  }
  auto user = users_->GetUser(username);
  if (!user) {
    return std::nullopt;
  }
  for (const auto& cred : user->credentials) {
    if (cred.type == AuthType::kPasswordless) {
      return user;
    }
  }
  for (const auto& cred : user->credentials) {
    if (cred.type == AuthType::kPassword) {
      if (PasswordHasher::Verify(password, cred.secret)) {
        return user;
      }
      break;
    }
  }
  return std::nullopt;
}

}  // namespace parley
