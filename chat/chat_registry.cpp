#include "chat/chat_registry.h"

#include "server/logging/logger.h"
#include "server/service_error.h"

#include <openssl/rand.h>

#include <algorithm>
#include <cstdio>
#include <stdexcept>

using json = nlohmann::json;

namespace parley {

ChatRegistry::ChatRegistry(KvStore* store,
                           UserStore* users,
                           ChatHistoryLog* history,
                           ChatLockTable* locks,
                           const InferenceEngine* engine,
                           std::string default_owner,
                           Clock clock)
    : store_(store),
      users_(users),
      history_(history),
      locks_(locks),
      engine_(engine),
      default_owner_(std::move(default_owner)),
      clock_(std::move(clock)) {
  if (!clock_) {
    clock_ = [] { return std::chrono::system_clock::now(); };
  }
}

std::string ChatRegistry::SessionKey(const std::string& chat_id) { return "chat:" + chat_id; }

std::string ChatRegistry::NewChatId() {
  unsigned char bytes[16];
  if (RAND_bytes(bytes, sizeof(bytes)) != 1) {
    throw std::runtime_error("RAND_bytes failed while allocating chat id");
  }
  bytes[6] = static_cast<unsigned char>((bytes[6] & 0x0F) | 0x40);  // version 4
  bytes[8] = static_cast<unsigned char>((bytes[8] & 0x3F) | 0x80);  // RFC 4122 variant
  char buf[37];
  std::snprintf(buf, sizeof(buf),
                "%02x%02x%02x%02x-%02x%02x-%02x%02x-%02x%02x-%02x%02x%02x%02x%02x%02x",
                bytes[0], bytes[1], bytes[2], bytes[3], bytes[4], bytes[5], bytes[6], bytes[7],
                bytes[8], bytes[9], bytes[10], bytes[11], bytes[12], bytes[13], bytes[14],
                bytes[15]);
  return buf;
}

ChatSession ChatRegistry::CreateSession(User& owner, const ChatParameters& params) {
  if (engine_ && !engine_->HasModel(params.model_path)) {
    std::string path = engine_->ResolveModelPath(params.model_path);
    log::Warn("registry", "rejecting chat for missing model",
              "model=" + params.model_path + " path=" + path);
    throw ServiceError(ErrorCode::kModelUnavailable, "Model can't be found: " + path);
  }

  ChatSession session;
  session.id = NewChatId();
  session.owner = owner.username;
  session.created = clock_();
  session.params = params;

  store_->Set(SessionKey(session.id), SessionToJson(session).dump());
  history_->Append(session.id, {MessageType::kSystem, params.init_prompt});
  store_->SAdd(kChatSetKey, session.id);

  ChatRef ref{session.id, owner.username};
  users_->AddChat(ref);
  owner.chats.push_back(ref);

  log::Info("registry", "chat created",
            "chat_id=" + session.id + " owner=" + owner.username + " model=" + params.model_path);
  return session;
}

ChatSession ChatRegistry::GetSession(const std::string& chat_id) {
  if (!store_->SIsMember(kChatSetKey, chat_id)) {
    throw ServiceError(ErrorCode::kNotFound, "Chat does not exist");
  }
  auto raw = store_->Get(SessionKey(chat_id));
  if (!raw) {
    log::Warn("registry", "live chat has no session blob", "chat_id=" + chat_id);
    throw ServiceError(ErrorCode::kNotFound, "Chat does not exist");
  }
  try {
    return SessionFromJson(json::parse(*raw), default_owner_);
  } catch (const std::exception& e) {
    log::Error("registry", "unreadable session blob", "chat_id=" + chat_id + " error=" + e.what());
    throw StorageError("session " + chat_id + " is corrupt");
  }
}

void ChatRegistry::AuthorizeAccess(const User& user, const std::string& chat_id) const {
  if (!user.OwnsChat(chat_id)) {
    throw ServiceError(ErrorCode::kUnauthorized, "Unauthorized");
  }
}

ChatSession ChatRegistry::GetAuthorizedSession(const User& user, const std::string& chat_id) {
  AuthorizeAccess(user, chat_id);
  ChatSession session = GetSession(chat_id);
  if (session.owner != user.username) {
    log::Warn("registry", "chat ref and session owner disagree",
              "chat_id=" + chat_id + " ref_owner=" + user.username + " owner=" + session.owner);
    throw ServiceError(ErrorCode::kUnauthorized, "Unauthorized");
  }
  return session;
}

void ChatRegistry::DeleteSession(User& owner, const std::string& chat_id) {
  if (!owner.OwnsChat(chat_id)) {
    if (!store_->SIsMember(kChatSetKey, chat_id)) {
      return;
    }
    auto raw = store_->Get(SessionKey(chat_id));
    std::string blob_owner = default_owner_;
    if (raw) {
      try {
        blob_owner = SessionFromJson(json::parse(*raw), default_owner_).owner;
      } catch (const std::exception& e) {
        log::Warn("registry", "unreadable session blob", "chat_id=" + chat_id + " error=" + e.what());
        blob_owner.clear();
      }
    }
    if (blob_owner != owner.username) {
      throw ServiceError(ErrorCode::kUnauthorized, "Unauthorized");
    }
  }

  auto guard = locks_->TryAcquire(chat_id);
  if (!guard) {
    throw ServiceError(ErrorCode::kConflict, "Unable to delete chat, generation in progress");
  }

  users_->RemoveChat(owner.username, chat_id);
  owner.chats.erase(std::remove_if(owner.chats.begin(), owner.chats.end(),
                                   [&](const ChatRef& ref) { return ref.chat_id == chat_id; }),
                    owner.chats.end());
  history_->Clear(chat_id);
  store_->Del(SessionKey(chat_id));
  store_->SRem(kChatSetKey, chat_id);
  log::Info("registry", "chat deleted", "chat_id=" + chat_id + " owner=" + owner.username);
}

DeleteAllReport ChatRegistry::DeleteAllSessions(User& owner) {
  DeleteAllReport report;
  std::vector<ChatRef> refs = owner.chats;
  for (const auto& ref : refs) {
    try {
      DeleteSession(owner, ref.chat_id);
      report.deleted.push_back(ref.chat_id);
    } catch (const std::exception& e) {
      log::Warn("registry", "delete-all item failed", "chat_id=" + ref.chat_id + " error=" + e.what());
      report.failures.push_back({ref.chat_id, e.what()});
    }
  }
  return report;
}

std::vector<ChatSummary> ChatRegistry::ListSessions(const User& owner) {
  std::vector<ChatSummary> summaries;
  summaries.reserve(owner.chats.size());
  for (const auto& ref : owner.chats) {
    ChatSession session;
    try {
      session = GetSession(ref.chat_id);
    } catch (const ServiceError& e) {
      log::Warn("registry", "skipping chat ref without session",
                "chat_id=" + ref.chat_id + " owner=" + owner.username + " error=" + e.what());
      continue;
    } catch (const StorageError& e) {
      log::Warn("registry", "skipping unreadable session",
                "chat_id=" + ref.chat_id + " owner=" + owner.username + " error=" + e.what());
      continue;
    }
    ChatSummary summary;
    summary.id = session.id;
    summary.created = session.created;
    summary.model = session.params.model_path;
    auto last = history_->Last(session.id);
    summary.subtitle = last ? last->content : std::string();
    summaries.push_back(std::move(summary));
  }
  std::stable_sort(summaries.begin(), summaries.end(),
                   [](const ChatSummary& a, const ChatSummary& b) { return a.created > b.created; });
  return summaries;
}

}  // namespace parley
