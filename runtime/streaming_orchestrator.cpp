#include "runtime/streaming_orchestrator.h"

#include "server/logging/logger.h"
#include "server/service_error.h"

#include <algorithm>
#include <cstdint>
#include <limits>

namespace parley {

namespace {

// Emits the single terminal event of a stream. If neither Close() nor Fail()
// ran, for instance because the transcript write threw, the destructor
// reports an error so the caller's stream still terminates.
class TerminalEvent {
public:
  TerminalEvent(const EventSink &sink, std::string chat_id)
      : sink_(sink), chat_id_(std::move(chat_id)) {}
  TerminalEvent(const TerminalEvent &) = delete;
  TerminalEvent &operator=(const TerminalEvent &) = delete;

  ~TerminalEvent() {
    if (emitted_) {
      return;
    }
    try {
      Emit({StreamEvent::Type::kError, "generation aborted"});
    } catch (const std::exception &e) {
      log::Error("orchestrator", "failed to emit terminal event",
                 "chat_id=" + chat_id_ + " error=" + e.what());
    }
  }

  void Close() { Emit({StreamEvent::Type::kClose, {}}); }
  void Fail(const std::string &error) {
    Emit({StreamEvent::Type::kError, error});
  }

private:
  void Emit(const StreamEvent &event) {
    if (emitted_) {
      return;
    }
    emitted_ = true;
    if (!sink_(event)) {
      log::Debug("orchestrator", "client gone before terminal event",
                 "chat_id=" + chat_id_);
    }
  }

  const EventSink &sink_;
  std::string chat_id_;
  bool emitted_{false};
};

} // namespace

const char *GenerationStateName(GenerationState state) {
  switch (state) {
  case GenerationState::kIdle:
    return "idle";
  case GenerationState::kPromptReady:
    return "prompt_ready";
  case GenerationState::kGenerating:
    return "generating";
  case GenerationState::kCommitted:
    return "committed";
  case GenerationState::kFailed:
    return "failed";
  }
  return "unknown";
}

StreamingInferenceOrchestrator::StreamingInferenceOrchestrator(
    ChatRegistry *registry, ChatHistoryLog *history, ChatLockTable *locks,
    InferenceEngine *engine, const PromptAssembler *assembler,
    AuditLogger *audit)
    : registry_(registry), history_(history), locks_(locks), engine_(engine),
      assembler_(assembler), audit_(audit) {}

GenerationParams
StreamingInferenceOrchestrator::ToGenerationParams(const ChatParameters &params) {
  GenerationParams out;
  out.model = params.model_path;
  std::int64_t widened = static_cast<std::int64_t>(params.init_prompt.size()) +
                         std::max(params.n_ctx, 0);
  out.n_ctx = static_cast<int>(std::min<std::int64_t>(
      widened, std::numeric_limits<int>::max()));
  out.temperature = params.temperature;
  out.top_k = params.top_k;
  out.top_p = params.top_p;
  out.repeat_penalty = params.repeat_penalty;
  out.repeat_last_n = params.last_n_tokens_size;
  out.max_tokens = params.max_tokens;
  out.n_threads = params.n_threads;
  out.n_gpu_layers = params.n_gpu_layers;
  return out;
}

ChatLockTable::Guard
StreamingInferenceOrchestrator::AcquireOrThrow(const std::string &chat_id) {
  auto guard = locks_->TryAcquire(chat_id);
  if (!guard) {
    log::Warn("orchestrator", "rejecting concurrent generation",
              "chat_id=" + chat_id);
    throw ServiceError(ErrorCode::kConflict,
                       "A generation is already in progress for this chat");
  }
  return guard;
}

StreamingInferenceOrchestrator::Outcome StreamingInferenceOrchestrator::Execute(
    const User &user, const ChatSession &session, const std::string &prompt,
    const FragmentCallback &on_fragment) {
  Outcome outcome;
  const std::string &chat_id = session.id;

  if (!prompt.empty()) {
    history_->Append(chat_id, {MessageType::kHuman, prompt});
  }
  std::string assembled =
      assembler_->Assemble(history_->ReadAll(chat_id), session.params);
  outcome.state = GenerationState::kPromptReady;
  log::Debug("orchestrator", "prompt ready",
             "chat_id=" + chat_id +
                 " chars=" + std::to_string(assembled.size()));

  GenerationParams params = ToGenerationParams(session.params);
  bool client_gone = false;
  outcome.state = GenerationState::kGenerating;
  try {
    engine_->Generate(assembled, params, [&](const std::string &fragment) {
      outcome.answer += fragment;
      if (on_fragment && !on_fragment(fragment)) {
        client_gone = true;
        return false;
      }
      return true;
    });
  } catch (const DecodeArtifactError &e) {
    log::Debug("orchestrator", "absorbed partial multi-byte output",
               "chat_id=" + chat_id + " detail=" + e.what());
  } catch (const ModelUnavailableError &e) {
    outcome.error = e.what();
    log::Error("orchestrator", "model unavailable",
               "chat_id=" + chat_id + " model=" + params.model +
                   " error=" + outcome.error);
  } catch (const std::exception &e) {
    outcome.error = e.what();
    if (outcome.error.empty()) {
      outcome.error = "generation failed";
    }
    log::Error("orchestrator", "generation failed",
               "chat_id=" + chat_id + " error=" + outcome.error);
  }

  if (!outcome.error.empty()) {
    history_->Append(chat_id, {MessageType::kSystem, outcome.error});
    outcome.answer.clear();
    outcome.state = GenerationState::kFailed;
  } else {
    history_->Append(chat_id, {MessageType::kAi, outcome.answer});
    outcome.state = GenerationState::kCommitted;
    if (client_gone) {
      log::Info("orchestrator", "client disconnected, committed partial answer",
                "chat_id=" + chat_id);
    }
  }

  if (audit_) {
    audit_->LogGeneration(user.username, chat_id, params.model, prompt,
                          outcome.state == GenerationState::kCommitted
                              ? outcome.answer
                              : outcome.error,
                          outcome.state == GenerationState::kCommitted);
  }
  log::Info("orchestrator", "generation finished",
            "chat_id=" + chat_id +
                " state=" + GenerationStateName(outcome.state) +
                " chars=" + std::to_string(outcome.answer.size()));
  return outcome;
}

GenerationState StreamingInferenceOrchestrator::Stream(
    const User &user, const std::string &chat_id, const std::string &prompt,
    const EventSink &sink) {
  // The session is read under the chat's slot so a delete cannot slip in
  // between the lookup and the first transcript write.
  registry_->AuthorizeAccess(user, chat_id);
  auto guard = AcquireOrThrow(chat_id);
  ChatSession session = registry_->GetAuthorizedSession(user, chat_id);

  TerminalEvent terminal(sink, chat_id);
  Outcome outcome =
      Execute(user, session, prompt, [&](const std::string &fragment) {
        return sink({StreamEvent::Type::kMessage, fragment});
      });
  if (outcome.state == GenerationState::kCommitted) {
    terminal.Close();
  } else {
    terminal.Fail(outcome.error);
  }
  return outcome.state;
}

AskResult StreamingInferenceOrchestrator::Ask(const User &user,
                                              const std::string &chat_id,
                                              const std::string &prompt) {
  registry_->AuthorizeAccess(user, chat_id);
  auto guard = AcquireOrThrow(chat_id);
  ChatSession session = registry_->GetAuthorizedSession(user, chat_id);

  Outcome outcome = Execute(user, session, prompt, {});
  AskResult result;
  result.ok = outcome.state == GenerationState::kCommitted;
  result.text = result.ok ? outcome.answer : outcome.error;
  return result;
}

} // namespace parley
