#pragma once

#include "chat/chat_history.h"
#include "chat/chat_lock.h"
#include "chat/chat_registry.h"
#include "runtime/inference_engine.h"
#include "runtime/prompt/prompt_assembler.h"
#include "server/auth/user.h"
#include "server/logging/audit_logger.h"

#include <functional>
#include <string>

namespace parley {

struct StreamEvent {
  enum class Type { kMessage, kClose, kError };
  Type type{Type::kMessage};
  std::string data;
};

// Delivers one event to the caller. Returning false means the caller is
// gone; generation stops at the next token and whatever was produced is
// committed.
using EventSink = std::function<bool(const StreamEvent &)>;

enum class GenerationState { kIdle, kPromptReady, kGenerating, kCommitted, kFailed };

const char *GenerationStateName(GenerationState state);

struct AskResult {
  bool ok{false};
  // The full answer on success, the error text otherwise.
  std::string text;
};

// Drives one question/answer turn against a chat:
//
//   Idle -> PromptReady   human prompt appended (if non-empty), prompt built
//   PromptReady -> Generating   engine started with the chat's parameters
//   Generating -> Committed     answer appended as one `ai` message
//   Generating -> Failed        error appended as one `system` message
//
// Every streaming call that gets past authorization and the per-chat lock
// emits exactly one terminal event (close or error), after all message
// events. Authorization, missing chats and a busy chat are reported by
// throwing ServiceError before any event is emitted.
class StreamingInferenceOrchestrator {
public:
  StreamingInferenceOrchestrator(ChatRegistry *registry,
                                 ChatHistoryLog *history, ChatLockTable *locks,
                                 InferenceEngine *engine,
                                 const PromptAssembler *assembler,
                                 AuditLogger *audit = nullptr);

  GenerationState Stream(const User &user, const std::string &chat_id,
                         const std::string &prompt, const EventSink &sink);

  // Blocking variant with the same transitions and no incremental events.
  AskResult Ask(const User &user, const std::string &chat_id,
                const std::string &prompt);

  // n_ctx is widened by the init prompt length, which the assembled prompt
  // always carries in addition to the turn budget.
  static GenerationParams ToGenerationParams(const ChatParameters &params);

private:
  struct Outcome {
    GenerationState state{GenerationState::kIdle};
    std::string answer;
    std::string error;
  };

  ChatLockTable::Guard AcquireOrThrow(const std::string &chat_id);
  Outcome Execute(const User &user, const ChatSession &session,
                  const std::string &prompt,
                  const FragmentCallback &on_fragment);

  ChatRegistry *registry_;
  ChatHistoryLog *history_;
  ChatLockTable *locks_;
  InferenceEngine *engine_;
  const PromptAssembler *assembler_;
  AuditLogger *audit_;
};

} // namespace parley
