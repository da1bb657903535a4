#pragma once

#include "server/auth/user.h"
#include "storage/user_store.h"

#include <string>
#include <utility>

namespace parley {

// DefaultIdentityPolicy decides who a request is when it carries no usable
// credential. AuthGate calls it on every anonymous or invalid-token request,
// so implementations must be cheap.
//
// Implementations may throw; AuthGate degrades to a synthesized passwordless
// user with the policy's username in that case.
// Thread safety: Resolve() must be safe to call concurrently.
class DefaultIdentityPolicy {
 public:
  virtual ~DefaultIdentityPolicy() = default;

  virtual User Resolve() = 0;

  // Username of the anonymous identity.
  virtual std::string Username() const = 0;
};

// Resolves to a well-known user loaded from the UserStore (normally the
// passwordless "system" account bootstrapped at startup).
class StoreBackedIdentityPolicy : public DefaultIdentityPolicy {
 public:
  StoreBackedIdentityPolicy(UserStore* users, std::string username)
      : users_(users), username_(std::move(username)) {}

  User Resolve() override {
    if (users_) {
      auto user = users_->GetUser(username_);
      if (user) {
        return *user;
      }
    }
    User synthesized;
    synthesized.username = username_;
    synthesized.credentials.push_back({AuthType::kPasswordless, {}});
    return synthesized;
  }

  std::string Username() const override { return username_; }

 private:
  UserStore* users_;
  std::string username_;
};

}  // namespace parley
