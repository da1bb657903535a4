#pragma once

#include "chat/chat_lock.h"
#include "chat/chat_types.h"
#include "storage/kv_store.h"

#include <optional>
#include <string>
#include <vector>

namespace parley {

// Ordered per-chat transcript stored as a KvStore list at
// `message_store:<chat_id>`. Position in the list is the message index used
// by TruncateBefore.
class ChatHistoryLog {
 public:
  ChatHistoryLog(KvStore* store, ChatLockTable* locks);

  static std::string Key(const std::string& chat_id);

  void Append(const std::string& chat_id, const Message& message);

  // Entries that fail to decode are skipped with a warning.
  std::vector<Message> ReadAll(const std::string& chat_id);

  std::optional<Message> Last(const std::string& chat_id);
  long long Length(const std::string& chat_id);

  // Keeps messages at positions < idx. Throws ServiceError(kConflict) when
  // idx is at or past the end, or when a generation holds the chat, and
  // ServiceError(kBadRequest) for a negative idx.
  void TruncateBefore(const std::string& chat_id, long long idx);

  void Clear(const std::string& chat_id);

 private:
  KvStore* store_;
  ChatLockTable* locks_;
};

}  // namespace parley
