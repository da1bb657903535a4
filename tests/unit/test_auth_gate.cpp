#include <catch2/catch_all.hpp>

#include "server/auth/auth_gate.h"
#include "server/auth/password_hasher.h"
#include "server/service_error.h"
#include "storage/sqlite_user_store.h"

#include <cstdint>
#include <memory>
#include <stdexcept>

using parley::AuthCredential;
using parley::AuthType;

namespace {

struct AuthFixture {
  AuthFixture()
      : users(":memory:"),
        policy(std::make_shared<parley::StoreBackedIdentityPolicy>(&users, "system")),
        gate(&users, parley::TokenCodec("test-secret", [this] { return now; }), policy, 30) {
    users.EnsureUser("system", {{AuthType::kPasswordless, {}}});
  }

  std::string Hash(const std::string& password) {
    return parley::PasswordHasher(1000).Hash(password);
  }

  std::int64_t now{1'700'000'000};
  parley::SqliteUserStore users;
  std::shared_ptr<parley::StoreBackedIdentityPolicy> policy;
  parley::AuthGate gate;
};

class ThrowingPolicy : public parley::DefaultIdentityPolicy {
 public:
  parley::User Resolve() override { throw std::runtime_error("store down"); }
  std::string Username() const override { return "guest"; }
};

}  // namespace

TEST_CASE_METHOD(AuthFixture, "Issued tokens resolve to their user", "[auth]") {
  users.CreateUser("alice", {{AuthType::kPassword, Hash("pw")}});
  auto token = gate.IssueToken("alice");
  REQUIRE(token.expires_at == now + 30 * 60);

  auto user = gate.ResolveIdentity(token.token);
  REQUIRE(user.username == "alice");
}

TEST_CASE_METHOD(AuthFixture, "Expired or foreign tokens are invalid credentials", "[auth]") {
  users.CreateUser("alice", {{AuthType::kPassword, Hash("pw")}});
  auto token = gate.IssueToken("alice");
  now += 30 * 60;
  try {
    gate.ResolveIdentity(token.token);
    FAIL("expected InvalidCredential");
  } catch (const parley::ServiceError& e) {
    REQUIRE(e.code() == parley::ErrorCode::kInvalidCredential);
  }

  parley::TokenCodec other("other-secret", [this] { return now; });
  REQUIRE_THROWS_AS(gate.ResolveIdentity(other.Encode("alice", now + 60)),
                    parley::ServiceError);
}

TEST_CASE_METHOD(AuthFixture, "Tokens for removed users are rejected", "[auth]") {
  users.CreateUser("bob", {{AuthType::kPasswordless, {}}});
  auto token = gate.IssueToken("bob");
  REQUIRE(users.RemoveUser("bob"));
  REQUIRE_THROWS_AS(gate.ResolveIdentity(token.token), parley::ServiceError);
}

TEST_CASE_METHOD(AuthFixture, "Anonymous fallback never fails", "[auth]") {
  SECTION("no token") {
    auto resolved = gate.ResolveIdentityOrAnonymous(std::nullopt);
    REQUIRE(resolved.anonymous);
    REQUIRE_FALSE(resolved.clear_cookie);
    REQUIRE(resolved.user.username == "system");
  }
  SECTION("empty token") {
    auto resolved = gate.ResolveIdentityOrAnonymous(std::string());
    REQUIRE(resolved.anonymous);
    REQUIRE_FALSE(resolved.clear_cookie);
  }
  SECTION("garbage token clears the cookie") {
    auto resolved = gate.ResolveIdentityOrAnonymous(std::string("not.a.jwt"));
    REQUIRE(resolved.anonymous);
    REQUIRE(resolved.clear_cookie);
    REQUIRE(resolved.user.username == "system");
  }
  SECTION("valid token") {
    users.CreateUser("alice", {{AuthType::kPasswordless, {}}});
    auto resolved = gate.ResolveIdentityOrAnonymous(gate.IssueToken("alice").token);
    REQUIRE_FALSE(resolved.anonymous);
    REQUIRE(resolved.user.username == "alice");
  }
}

TEST_CASE("Anonymous fallback survives a failing identity policy", "[auth]") {
  parley::SqliteUserStore users(":memory:");
  parley::AuthGate gate(&users, parley::TokenCodec("k"), std::make_shared<ThrowingPolicy>(), 60);
  auto resolved = gate.ResolveIdentityOrAnonymous(std::string("bogus"));
  REQUIRE(resolved.anonymous);
  REQUIRE(resolved.user.username == "guest");
  REQUIRE(resolved.user.credentials.size() == 1);
  REQUIRE(resolved.user.credentials[0].type == AuthType::kPasswordless);
}

TEST_CASE_METHOD(AuthFixture, "Passwordless credentials grant access outright", "[auth]") {
  users.CreateUser("carol", {{AuthType::kPassword, Hash("pw")}, {AuthType::kPasswordless, {}}});
  REQUIRE(gate.Authenticate("carol", "anything"));
  REQUIRE(gate.Authenticate("carol", ""));
}

TEST_CASE_METHOD(AuthFixture, "Password credentials check the password", "[auth]") {
  users.CreateUser("dave", {{AuthType::kPassword, Hash("hunter2")}});
  auto ok = gate.Authenticate("dave", "hunter2");
  REQUIRE(ok);
  REQUIRE(ok->username == "dave");
  REQUIRE_FALSE(gate.Authenticate("dave", "hunter3"));
}

TEST_CASE_METHOD(AuthFixture, "Reserved credentials never grant access", "[auth]") {
  users.CreateUser("erin", {{AuthType::kReserved, {}}});
  REQUIRE_FALSE(gate.Authenticate("erin", ""));
  REQUIRE_FALSE(gate.Authenticate("erin", "anything"));
}

TEST_CASE_METHOD(AuthFixture, "Unknown users and wrong passwords look the same", "[auth]") {
  users.CreateUser("frank", {{AuthType::kPassword, Hash("pw")}});
  REQUIRE_FALSE(gate.Authenticate("nobody", "pw"));
  REQUIRE_FALSE(gate.Authenticate("frank", "nope"));
}

TEST_CASE("Non-positive session expiry falls back to an hour", "[auth]") {
  parley::SqliteUserStore users(":memory:");
  parley::AuthGate gate(&users, parley::TokenCodec("k"), nullptr, 0);
  REQUIRE(gate.session_expiry_minutes() == 60);
}
