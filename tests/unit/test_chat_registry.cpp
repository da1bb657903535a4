#include <catch2/catch_all.hpp>

#include "chat/chat_registry.h"
#include "fake_inference_engine.h"
#include "server/service_error.h"
#include "storage/memory_kv_store.h"
#include "storage/sqlite_user_store.h"

#include <chrono>
#include <functional>
#include <set>
#include <string>
#include <vector>

using parley::AuthType;
using parley::ErrorCode;
using parley::MessageType;

namespace {

struct RegistryFixture {
  RegistryFixture()
      : users(":memory:"),
        history(&kv, &locks),
        registry(&kv, &users, &history, &locks, &engine, "system", [this] { return now; }) {
    users.EnsureUser("system", {{AuthType::kPasswordless, {}}});
    users.CreateUser("alice", {{AuthType::kPasswordless, {}}});
    users.CreateUser("bob", {{AuthType::kPasswordless, {}}});
    alice = *users.GetUser("alice");
    bob = *users.GetUser("bob");
  }

  parley::ChatParameters Params(const std::string& model = "7B",
                                const std::string& init_prompt = "X") {
    parley::ChatParameters p;
    p.model_path = model;
    p.init_prompt = init_prompt;
    return p;
  }

  parley::Timestamp now{std::chrono::seconds(1'700'000'000)};
  parley::MemoryKvStore kv;
  parley::SqliteUserStore users;
  parley::ChatLockTable locks;
  parley::ChatHistoryLog history;
  parley::testing::FakeInferenceEngine engine;
  parley::ChatRegistry registry;
  parley::User alice;
  parley::User bob;
};

ErrorCode CodeOf(const std::function<void()>& fn) {
  try {
    fn();
  } catch (const parley::ServiceError& e) {
    return e.code();
  }
  FAIL("expected ServiceError");
  return ErrorCode::kGenerationFailure;
}

}  // namespace

TEST_CASE_METHOD(RegistryFixture, "CreateSession seeds the transcript and ownership", "[registry]") {
  auto session = registry.CreateSession(alice, Params("7B", "X"));

  REQUIRE(session.id.size() == 36);
  REQUIRE(session.id[14] == '4');
  REQUIRE(session.owner == "alice");
  REQUIRE(session.created == now);

  REQUIRE(kv.SIsMember(parley::ChatRegistry::kChatSetKey, session.id));
  REQUIRE(kv.Get(parley::ChatRegistry::SessionKey(session.id)));
  REQUIRE(history.ReadAll(session.id) ==
          std::vector<parley::Message>{{MessageType::kSystem, "X"}});

  // Both the caller's copy and the relational store learn about the chat.
  REQUIRE(alice.OwnsChat(session.id));
  REQUIRE(users.GetUser("alice")->OwnsChat(session.id));

  auto loaded = registry.GetSession(session.id);
  REQUIRE(loaded.params.model_path == "7B");
  REQUIRE(loaded.params.init_prompt == "X");
}

TEST_CASE_METHOD(RegistryFixture, "Chat ids are unique", "[registry]") {
  std::set<std::string> ids;
  for (int i = 0; i < 20; ++i) {
    ids.insert(registry.CreateSession(alice, Params()).id);
  }
  REQUIRE(ids.size() == 20);
}

TEST_CASE_METHOD(RegistryFixture, "CreateSession rejects a missing model", "[registry]") {
  try {
    registry.CreateSession(alice, Params("13B"));
    FAIL("expected ModelUnavailable");
  } catch (const parley::ServiceError& e) {
    REQUIRE(e.code() == ErrorCode::kModelUnavailable);
    REQUIRE(std::string(e.what()) == "Model can't be found: weights/13B.bin");
  }
  REQUIRE(alice.chats.empty());
  REQUIRE(kv.KeyCount() == 0);
}

TEST_CASE_METHOD(RegistryFixture, "GetSession reports unknown chats as NotFound", "[registry]") {
  REQUIRE(CodeOf([&] { registry.GetSession("nope"); }) == ErrorCode::kNotFound);
}

TEST_CASE_METHOD(RegistryFixture, "Access requires a ChatRef", "[registry]") {
  auto session = registry.CreateSession(alice, Params());
  REQUIRE_NOTHROW(registry.AuthorizeAccess(alice, session.id));
  REQUIRE(CodeOf([&] { registry.AuthorizeAccess(bob, session.id); }) == ErrorCode::kUnauthorized);
  REQUIRE(CodeOf([&] { registry.GetAuthorizedSession(bob, session.id); }) ==
          ErrorCode::kUnauthorized);
  REQUIRE(registry.GetAuthorizedSession(alice, session.id).id == session.id);
}

TEST_CASE_METHOD(RegistryFixture, "Owner mismatch is Unauthorized, not NotFound", "[registry]") {
  auto session = registry.CreateSession(alice, Params());
  // A forged ref on bob's side must still be refused.
  bob.chats.push_back({session.id, "bob"});
  REQUIRE(CodeOf([&] { registry.GetAuthorizedSession(bob, session.id); }) ==
          ErrorCode::kUnauthorized);
}

TEST_CASE_METHOD(RegistryFixture, "DeleteSession removes every trace and is idempotent", "[registry]") {
  auto session = registry.CreateSession(alice, Params());
  history.Append(session.id, {MessageType::kHuman, "hi"});

  registry.DeleteSession(alice, session.id);
  REQUIRE_FALSE(alice.OwnsChat(session.id));
  REQUIRE_FALSE(users.GetUser("alice")->OwnsChat(session.id));
  REQUIRE(kv.KeyCount() == 0);
  REQUIRE(CodeOf([&] { registry.GetSession(session.id); }) == ErrorCode::kNotFound);

  REQUIRE_NOTHROW(registry.DeleteSession(alice, session.id));
  REQUIRE_NOTHROW(registry.DeleteSession(alice, "never-existed"));
}

TEST_CASE_METHOD(RegistryFixture, "Deleting someone else's chat is refused", "[registry]") {
  auto session = registry.CreateSession(alice, Params());
  REQUIRE(CodeOf([&] { registry.DeleteSession(bob, session.id); }) == ErrorCode::kUnauthorized);
  REQUIRE(registry.GetSession(session.id).owner == "alice");
}

TEST_CASE_METHOD(RegistryFixture, "Deleting a chat mid-generation is a conflict", "[registry]") {
  auto session = registry.CreateSession(alice, Params());
  auto generation = locks.TryAcquire(session.id);
  REQUIRE(CodeOf([&] { registry.DeleteSession(alice, session.id); }) == ErrorCode::kConflict);
  REQUIRE(alice.OwnsChat(session.id));
  generation.Release();
  registry.DeleteSession(alice, session.id);
  REQUIRE(alice.chats.empty());
}

TEST_CASE_METHOD(RegistryFixture, "DeleteAllSessions reports per-chat failures", "[registry]") {
  auto c1 = registry.CreateSession(alice, Params());
  auto c2 = registry.CreateSession(alice, Params());
  auto c3 = registry.CreateSession(alice, Params());
  auto busy = locks.TryAcquire(c2.id);

  auto report = registry.DeleteAllSessions(alice);
  REQUIRE_FALSE(report.ok());
  REQUIRE(report.deleted == std::vector<std::string>{c1.id, c3.id});
  REQUIRE(report.failures.size() == 1);
  REQUIRE(report.failures[0].chat_id == c2.id);
  REQUIRE(alice.chats.size() == 1);

  busy.Release();
  auto retry = registry.DeleteAllSessions(alice);
  REQUIRE(retry.ok());
  REQUIRE(alice.chats.empty());
  REQUIRE(kv.KeyCount() == 0);
}

TEST_CASE_METHOD(RegistryFixture, "ListSessions orders newest first", "[registry]") {
  auto t1 = registry.CreateSession(alice, Params("7B", "first"));
  now += std::chrono::seconds(10);
  auto t2 = registry.CreateSession(alice, Params("7B", "second"));
  history.Append(t2.id, {MessageType::kHuman, "latest question"});

  auto summaries = registry.ListSessions(alice);
  REQUIRE(summaries.size() == 2);
  REQUIRE(summaries[0].id == t2.id);
  REQUIRE(summaries[1].id == t1.id);
  REQUIRE(summaries[0].subtitle == "latest question");
  REQUIRE(summaries[1].subtitle == "first");
  REQUIRE(summaries[0].model == "7B");
}

TEST_CASE_METHOD(RegistryFixture, "ListSessions skips refs without a session", "[registry]") {
  auto live = registry.CreateSession(alice, Params());
  users.AddChat({"orphan", "alice"});
  alice.chats.push_back({"orphan", "alice"});

  auto summaries = registry.ListSessions(alice);
  REQUIRE(summaries.size() == 1);
  REQUIRE(summaries[0].id == live.id);
}

TEST_CASE_METHOD(RegistryFixture, "A corrupt session blob is a storage error", "[registry]") {
  auto session = registry.CreateSession(alice, Params());
  kv.Set(parley::ChatRegistry::SessionKey(session.id), "{not json");
  REQUIRE_THROWS_AS(registry.GetSession(session.id), parley::StorageError);
}

TEST_CASE_METHOD(RegistryFixture, "ListSessions skips a corrupt blob and keeps the rest", "[registry]") {
  auto good = registry.CreateSession(alice, Params());
  now += std::chrono::seconds(10);
  auto bad = registry.CreateSession(alice, Params());
  kv.Set(parley::ChatRegistry::SessionKey(bad.id), "{not json");

  std::vector<parley::ChatSummary> summaries;
  REQUIRE_NOTHROW(summaries = registry.ListSessions(alice));
  REQUIRE(summaries.size() == 1);
  REQUIRE(summaries[0].id == good.id);
}
