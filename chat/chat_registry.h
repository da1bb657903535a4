#pragma once

#include "chat/chat_history.h"
#include "chat/chat_lock.h"
#include "chat/chat_types.h"
#include "runtime/inference_engine.h"
#include "server/auth/user.h"
#include "storage/kv_store.h"
#include "storage/user_store.h"

#include <functional>
#include <string>
#include <vector>

namespace parley {

struct DeleteFailure {
  std::string chat_id;
  std::string error;
};

struct DeleteAllReport {
  std::vector<std::string> deleted;
  std::vector<DeleteFailure> failures;

  bool ok() const { return failures.empty(); }
};

// Catalog of chat sessions. Session blobs live at `chat:<id>` and the set of
// live ids at `chats` in the KvStore; ownership lives in the UserStore as
// ChatRef rows.
//
// Multi-step operations are ordered so that a crash part way through leaves
// an unreachable record rather than a reference to a missing one.
class ChatRegistry {
 public:
  using Clock = std::function<Timestamp()>;

  // `engine` may be null, in which case model availability is not checked at
  // creation. `default_owner` is attributed to blobs written without one.
  ChatRegistry(KvStore* store,
               UserStore* users,
               ChatHistoryLog* history,
               ChatLockTable* locks,
               const InferenceEngine* engine,
               std::string default_owner = "system",
               Clock clock = {});

  static std::string SessionKey(const std::string& chat_id);
  static constexpr const char* kChatSetKey = "chats";

  // Throws ServiceError(kModelUnavailable) when the engine has no artifact
  // for params.model_path. Appends the new ChatRef to owner.chats.
  ChatSession CreateSession(User& owner, const ChatParameters& params);

  // Throws ServiceError(kNotFound) unless the id is in the live set.
  ChatSession GetSession(const std::string& chat_id);

  // Throws ServiceError(kUnauthorized) unless `user` holds a ChatRef for it.
  void AuthorizeAccess(const User& user, const std::string& chat_id) const;

  // AuthorizeAccess + GetSession, plus the owner-consistency check between
  // the ChatRef and the blob.
  ChatSession GetAuthorizedSession(const User& user, const std::string& chat_id);

  // Idempotent. Throws ServiceError(kUnauthorized) when the chat is live and
  // belongs to someone else, and ServiceError(kConflict) while a generation
  // holds it.
  void DeleteSession(User& owner, const std::string& chat_id);

  DeleteAllReport DeleteAllSessions(User& owner);

  // Newest first. ChatRefs whose session is gone or unreadable are skipped.
  std::vector<ChatSummary> ListSessions(const User& owner);

 private:
  static std::string NewChatId();

  KvStore* store_;
  UserStore* users_;
  ChatHistoryLog* history_;
  ChatLockTable* locks_;
  const InferenceEngine* engine_;
  std::string default_owner_;
  Clock clock_;
};

}  // namespace parley
