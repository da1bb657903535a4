#include <catch2/catch_all.hpp>

#include "chat/chat_registry.h"
#include "fake_inference_engine.h"
#include "runtime/prompt/prompt_assembler.h"
#include "runtime/streaming_orchestrator.h"
#include "server/service_error.h"
#include "storage/memory_kv_store.h"
#include "storage/sqlite_user_store.h"

#include <nlohmann/json.hpp>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <functional>
#include <limits>
#include <optional>
#include <string>
#include <vector>

using parley::ErrorCode;
using parley::GenerationState;
using parley::Message;
using parley::MessageType;
using parley::StreamEvent;

namespace {

struct OrchestratorFixture {
  OrchestratorFixture()
      : users(":memory:"),
        history(&kv, &locks),
        registry(&kv, &users, &history, &locks, &engine, "system"),
        orchestrator(&registry, &history, &locks, &engine, &assembler) {
    users.EnsureUser("system", {{parley::AuthType::kPasswordless, {}}});
    users.CreateUser("alice", {{parley::AuthType::kPasswordless, {}}});
    alice = *users.GetUser("alice");
  }

  std::string NewChat(const std::string& model = "7B", const std::string& init_prompt = "X") {
    parley::ChatParameters params;
    params.model_path = model;
    params.init_prompt = init_prompt;
    return registry.CreateSession(alice, params).id;
  }

  // Collects every event; returns true (client connected) unless told otherwise.
  parley::EventSink Collect(std::vector<StreamEvent>* events, int disconnect_after = -1) {
    return [events, disconnect_after](const StreamEvent& event) {
      events->push_back(event);
      return disconnect_after < 0 || static_cast<int>(events->size()) < disconnect_after;
    };
  }

  static int CountTerminal(const std::vector<StreamEvent>& events) {
    int n = 0;
    for (const auto& e : events) {
      if (e.type != StreamEvent::Type::kMessage) {
        ++n;
      }
    }
    return n;
  }

  parley::MemoryKvStore kv;
  parley::SqliteUserStore users;
  parley::ChatLockTable locks;
  parley::ChatHistoryLog history;
  parley::testing::FakeInferenceEngine engine;
  parley::InstructPromptAssembler assembler;
  parley::ChatRegistry registry;
  parley::StreamingInferenceOrchestrator orchestrator;
  parley::User alice;
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

TEST_CASE_METHOD(OrchestratorFixture, "Asking a fresh chat streams and commits the answer", "[orchestrator]") {
  auto chat_id = NewChat("7B", "X");
  REQUIRE(history.ReadAll(chat_id) == std::vector<Message>{{MessageType::kSystem, "X"}});

  std::vector<StreamEvent> events;
  auto state = orchestrator.Stream(alice, chat_id, "hello", Collect(&events));

  REQUIRE(state == GenerationState::kCommitted);
  REQUIRE(events.size() == 4);
  REQUIRE(events[0].type == StreamEvent::Type::kMessage);
  REQUIRE(events[0].data == "Hello");
  REQUIRE(events[1].data == ",");
  REQUIRE(events[2].data == " world");
  REQUIRE(events[3].type == StreamEvent::Type::kClose);
  REQUIRE(CountTerminal(events) == 1);

  REQUIRE(history.ReadAll(chat_id) == std::vector<Message>{{MessageType::kSystem, "X"},
                                                           {MessageType::kHuman, "hello"},
                                                           {MessageType::kAi, "Hello, world"}});
  REQUIRE_FALSE(locks.IsHeld(chat_id));
}

TEST_CASE_METHOD(OrchestratorFixture, "The engine sees the assembled prompt and widened context", "[orchestrator]") {
  auto chat_id = NewChat("7B", "X");
  std::vector<StreamEvent> events;
  orchestrator.Stream(alice, chat_id, "hello", Collect(&events));

  REQUIRE(engine.prompts.size() == 1);
  REQUIRE(engine.prompts[0] == "X\n\n### Instruction:\nhello\n### Response:\n");
  REQUIRE(engine.last_params.model == "7B");
  REQUIRE(engine.last_params.n_ctx == 1 + 2048);
  REQUIRE(engine.last_params.repeat_last_n == 64);
}

TEST_CASE_METHOD(OrchestratorFixture, "A follow-up question carries the previous turn", "[orchestrator]") {
  auto chat_id = NewChat();
  std::vector<StreamEvent> events;
  orchestrator.Stream(alice, chat_id, "first", Collect(&events));
  orchestrator.Stream(alice, chat_id, "second", Collect(&events));
  REQUIRE(engine.prompts[1] ==
          "X\n\n### Instruction:\nfirst\n### Response:\nHello, world\n"
          "### Instruction:\nsecond\n### Response:\n");
  REQUIRE(history.Length(chat_id) == 5);
}

TEST_CASE_METHOD(OrchestratorFixture, "An empty prompt regenerates without a new human turn", "[orchestrator]") {
  auto chat_id = NewChat();
  std::vector<StreamEvent> events;
  orchestrator.Stream(alice, chat_id, "", Collect(&events));
  auto transcript = history.ReadAll(chat_id);
  REQUIRE(transcript.size() == 2);
  REQUIRE(transcript[1].type == MessageType::kAi);
}

TEST_CASE_METHOD(OrchestratorFixture, "A missing model yields one error event and one diagnostic", "[orchestrator]") {
  auto chat_id = NewChat("7B");
  engine.RemoveModel("7B");

  SECTION("without a new question") {
    std::vector<StreamEvent> events;
    auto state = orchestrator.Stream(alice, chat_id, "", Collect(&events));
    REQUIRE(state == GenerationState::kFailed);
    REQUIRE(events.size() == 1);
    REQUIRE(events[0].type == StreamEvent::Type::kError);
    REQUIRE(events[0].data == "Model can't be found: weights/7B.bin");

    auto transcript = history.ReadAll(chat_id);
    REQUIRE(transcript.size() == 2);
    REQUIRE(transcript[1] == Message{MessageType::kSystem, "Model can't be found: weights/7B.bin"});
  }
  SECTION("with a question") {
    std::vector<StreamEvent> events;
    orchestrator.Stream(alice, chat_id, "hello", Collect(&events));
    REQUIRE(CountTerminal(events) == 1);
    auto transcript = history.ReadAll(chat_id);
    REQUIRE(transcript.size() == 3);
    REQUIRE(transcript[1].type == MessageType::kHuman);
    REQUIRE(transcript[2].type == MessageType::kSystem);
    for (const auto& m : transcript) {
      REQUIRE(m.type != MessageType::kAi);
    }
  }
}

TEST_CASE_METHOD(OrchestratorFixture, "A mid-stream engine failure records the error instead of an answer", "[orchestrator]") {
  auto chat_id = NewChat();
  engine.fail_with = "decode failed";
  std::vector<StreamEvent> events;
  auto state = orchestrator.Stream(alice, chat_id, "hello", Collect(&events));

  REQUIRE(state == GenerationState::kFailed);
  REQUIRE(events.size() == 4);
  REQUIRE(events.back().type == StreamEvent::Type::kError);
  REQUIRE(events.back().data == "decode failed");
  REQUIRE(CountTerminal(events) == 1);
  REQUIRE(history.Last(chat_id) == Message{MessageType::kSystem, "decode failed"});
  REQUIRE(history.Length(chat_id) == 3);
}

TEST_CASE_METHOD(OrchestratorFixture, "A split multi-byte tail is not an error", "[orchestrator]") {
  auto chat_id = NewChat();
  engine.split_tail = true;
  std::vector<StreamEvent> events;
  auto state = orchestrator.Stream(alice, chat_id, "hello", Collect(&events));
  REQUIRE(state == GenerationState::kCommitted);
  REQUIRE(events.back().type == StreamEvent::Type::kClose);
  REQUIRE(history.Last(chat_id) == Message{MessageType::kAi, "Hello, world"});
}

TEST_CASE_METHOD(OrchestratorFixture, "A disconnected client still gets its partial answer committed", "[orchestrator]") {
  auto chat_id = NewChat();
  std::vector<StreamEvent> events;
  auto state = orchestrator.Stream(alice, chat_id, "hello", Collect(&events, 2));
  REQUIRE(state == GenerationState::kCommitted);
  REQUIRE(history.Last(chat_id) == Message{MessageType::kAi, "Hello,"});
  REQUIRE(history.Length(chat_id) == 3);
}

TEST_CASE_METHOD(OrchestratorFixture, "Authorization failures throw before any event", "[orchestrator]") {
  auto chat_id = NewChat();
  users.CreateUser("bob", {{parley::AuthType::kPasswordless, {}}});
  auto bob = *users.GetUser("bob");
  std::vector<StreamEvent> events;
  REQUIRE(CodeOf([&] { orchestrator.Stream(bob, chat_id, "hi", Collect(&events)); }) ==
          ErrorCode::kUnauthorized);
  REQUIRE(events.empty());
  REQUIRE(history.Length(chat_id) == 1);

  alice.chats.push_back({"ghost", "alice"});
  REQUIRE(CodeOf([&] { orchestrator.Stream(alice, "ghost", "hi", Collect(&events)); }) ==
          ErrorCode::kNotFound);
  REQUIRE(events.empty());
}

TEST_CASE_METHOD(OrchestratorFixture, "A second generation on a busy chat is a conflict", "[orchestrator]") {
  auto chat_id = NewChat();
  std::vector<StreamEvent> nested;
  ErrorCode nested_code = ErrorCode::kGenerationFailure;
  engine.on_start = [&] {
    nested_code = CodeOf([&] { orchestrator.Stream(alice, chat_id, "again", Collect(&nested)); });
  };

  std::vector<StreamEvent> events;
  auto state = orchestrator.Stream(alice, chat_id, "hello", Collect(&events));
  REQUIRE(state == GenerationState::kCommitted);
  REQUIRE(nested_code == ErrorCode::kConflict);
  REQUIRE(nested.empty());
  // Only the winning turn reached the transcript.
  REQUIRE(history.Length(chat_id) == 3);
}

TEST_CASE_METHOD(OrchestratorFixture, "Truncating past the end during a generation is a conflict", "[orchestrator]") {
  auto chat_id = NewChat();
  ErrorCode truncate_code = ErrorCode::kGenerationFailure;
  engine.on_start = [&] {
    // The answer is not committed yet and the generation holds the chat.
    truncate_code = CodeOf([&] { history.TruncateBefore(chat_id, 5); });
  };
  std::vector<StreamEvent> events;
  orchestrator.Stream(alice, chat_id, "hello", Collect(&events));

  REQUIRE(truncate_code == ErrorCode::kConflict);
  REQUIRE(history.ReadAll(chat_id) == std::vector<Message>{{MessageType::kSystem, "X"},
                                                           {MessageType::kHuman, "hello"},
                                                           {MessageType::kAi, "Hello, world"}});
}

TEST_CASE_METHOD(OrchestratorFixture, "Ask returns the full answer or the error text", "[orchestrator]") {
  auto chat_id = NewChat();
  auto ok = orchestrator.Ask(alice, chat_id, "hello");
  REQUIRE(ok.ok);
  REQUIRE(ok.text == "Hello, world");

  engine.fail_with = "out of memory";
  auto failed = orchestrator.Ask(alice, chat_id, "again");
  REQUIRE_FALSE(failed.ok);
  REQUIRE(failed.text == "out of memory");
  REQUIRE(history.Last(chat_id) == Message{MessageType::kSystem, "out of memory"});
}

namespace {

// Runs `on_get` once, on the first read of a session blob.
class HookedKvStore : public parley::MemoryKvStore {
 public:
  std::optional<std::string> Get(const std::string& key) override {
    if (on_get && key.rfind("chat:", 0) == 0) {
      auto hook = std::move(on_get);
      on_get = nullptr;
      hook();
    }
    return parley::MemoryKvStore::Get(key);
  }

  std::function<void()> on_get;
};

}  // namespace

TEST_CASE("A delete racing the session read cannot orphan the transcript", "[orchestrator]") {
  HookedKvStore kv;
  parley::SqliteUserStore users(":memory:");
  parley::ChatLockTable locks;
  parley::ChatHistoryLog history(&kv, &locks);
  parley::testing::FakeInferenceEngine engine;
  parley::InstructPromptAssembler assembler;
  parley::ChatRegistry registry(&kv, &users, &history, &locks, &engine);
  parley::StreamingInferenceOrchestrator orchestrator(&registry, &history, &locks, &engine,
                                                      &assembler);
  users.CreateUser("alice", {{parley::AuthType::kPasswordless, {}}});
  auto alice = *users.GetUser("alice");
  auto chat_id = registry.CreateSession(alice, {}).id;
  auto deleter = alice;

  ErrorCode delete_code = ErrorCode::kGenerationFailure;
  kv.on_get = [&] { delete_code = CodeOf([&] { registry.DeleteSession(deleter, chat_id); }); };

  std::vector<StreamEvent> events;
  auto state = orchestrator.Stream(alice, chat_id, "hello", [&](const StreamEvent& event) {
    events.push_back(event);
    return true;
  });

  REQUIRE(delete_code == ErrorCode::kConflict);
  REQUIRE(state == GenerationState::kCommitted);
  REQUIRE(kv.SIsMember(parley::ChatRegistry::kChatSetKey, chat_id));
  REQUIRE(history.Length(chat_id) == 3);

  // Once the generation is done the delete goes through and leaves nothing.
  registry.DeleteSession(deleter, chat_id);
  REQUIRE(history.Length(chat_id) == 0);
  REQUIRE_FALSE(kv.Get(parley::ChatRegistry::SessionKey(chat_id)).has_value());
}

TEST_CASE("A chat deleted before the generation starts gets no transcript", "[orchestrator]") {
  parley::MemoryKvStore kv;
  parley::SqliteUserStore users(":memory:");
  parley::ChatLockTable locks;
  parley::ChatHistoryLog history(&kv, &locks);
  parley::testing::FakeInferenceEngine engine;
  parley::InstructPromptAssembler assembler;
  parley::ChatRegistry registry(&kv, &users, &history, &locks, &engine);
  parley::StreamingInferenceOrchestrator orchestrator(&registry, &history, &locks, &engine,
                                                      &assembler);
  users.CreateUser("alice", {{parley::AuthType::kPasswordless, {}}});
  auto alice = *users.GetUser("alice");
  auto chat_id = registry.CreateSession(alice, {}).id;

  // `stale` still carries the ChatRef, as a request resolved before the delete would.
  auto stale = alice;
  registry.DeleteSession(alice, chat_id);

  REQUIRE(CodeOf([&] { orchestrator.Ask(stale, chat_id, "hello"); }) == ErrorCode::kNotFound);
  REQUIRE(history.Length(chat_id) == 0);
  REQUIRE(kv.KeyCount() == 0);
}

TEST_CASE("Context widening saturates instead of overflowing", "[orchestrator]") {
  parley::ChatParameters params;
  params.init_prompt = std::string(105, 'x');
  params.n_ctx = std::numeric_limits<int>::max();
  auto widened = parley::StreamingInferenceOrchestrator::ToGenerationParams(params);
  REQUIRE(widened.n_ctx == std::numeric_limits<int>::max());

  params.n_ctx = 2048;
  REQUIRE(parley::StreamingInferenceOrchestrator::ToGenerationParams(params).n_ctx == 105 + 2048);
}

TEST_CASE("Generations are audited with hashed content", "[orchestrator][audit]") {
  auto path = std::filesystem::temp_directory_path() / "parley_orchestrator_audit.jsonl";
  std::filesystem::remove(path);
  {
    parley::MemoryKvStore kv;
    parley::SqliteUserStore users(":memory:");
    parley::ChatLockTable locks;
    parley::ChatHistoryLog history(&kv, &locks);
    parley::testing::FakeInferenceEngine engine;
    parley::InstructPromptAssembler assembler;
    parley::ChatRegistry registry(&kv, &users, &history, &locks, &engine);
    parley::AuditLogger audit(path.string());
    parley::StreamingInferenceOrchestrator orchestrator(&registry, &history, &locks, &engine,
                                                        &assembler, &audit);
    users.CreateUser("alice", {{parley::AuthType::kPasswordless, {}}});
    auto alice = *users.GetUser("alice");
    auto chat_id = registry.CreateSession(alice, {}).id;
    REQUIRE(orchestrator.Ask(alice, chat_id, "secret question").ok);
  }
  std::ifstream in(path);
  std::string line;
  REQUIRE(std::getline(in, line));
  auto j = nlohmann::json::parse(line);
  REQUIRE(j["action"] == "generate");
  REQUIRE(j["subject"] == "alice");
  REQUIRE(j["prompt_sha256"] == parley::AuditLogger::HashContent("secret question"));
  REQUIRE(line.find("secret question") == std::string::npos);
  std::filesystem::remove(path);
}

TEST_CASE("GenerationStateName covers every state", "[orchestrator]") {
  REQUIRE(std::string(parley::GenerationStateName(GenerationState::kIdle)) == "idle");
  REQUIRE(std::string(parley::GenerationStateName(GenerationState::kCommitted)) == "committed");
  REQUIRE(std::string(parley::GenerationStateName(GenerationState::kFailed)) == "failed");
}
