#include "chat/chat_history.h"

#include "server/logging/logger.h"
#include "server/service_error.h"

using json = nlohmann::json;

namespace parley {

namespace {

constexpr const char* kInProgress = "Unable to delete message, chat in progress";

std::optional<Message> Decode(const std::string& chat_id, const std::string& raw) {
  try {
    return MessageFromJson(json::parse(raw));
  } catch (const std::exception& e) {
    log::Warn("history", "skipping unreadable transcript entry",
              "chat_id=" + chat_id + " error=" + e.what());
    return std::nullopt;
  }
}

}  // namespace

ChatHistoryLog::ChatHistoryLog(KvStore* store, ChatLockTable* locks)
    : store_(store), locks_(locks) {}

std::string ChatHistoryLog::Key(const std::string& chat_id) { return "message_store:" + chat_id; }

void ChatHistoryLog::Append(const std::string& chat_id, const Message& message) {
  store_->RPush(Key(chat_id), MessageToJson(message).dump());
}

std::vector<Message> ChatHistoryLog::ReadAll(const std::string& chat_id) {
  std::vector<Message> messages;
  for (const auto& raw : store_->LRange(Key(chat_id), 0, -1)) {
    auto message = Decode(chat_id, raw);
    if (message) {
      messages.push_back(std::move(*message));
    }
  }
  return messages;
}

std::optional<Message> ChatHistoryLog::Last(const std::string& chat_id) {
  auto tail = store_->LRange(Key(chat_id), -1, -1);
  if (tail.empty()) {
    return std::nullopt;
  }
  return Decode(chat_id, tail.front());
}

long long ChatHistoryLog::Length(const std::string& chat_id) { return store_->LLen(Key(chat_id)); }

void ChatHistoryLog::TruncateBefore(const std::string& chat_id, long long idx) {
  if (idx < 0) {
    throw ServiceError(ErrorCode::kBadRequest, "idx must be non-negative");
  }
  auto guard = locks_->TryAcquire(chat_id);
  if (!guard) {
    log::Warn("history", kInProgress, "chat_id=" + chat_id + " reason=generation_active");
    throw ServiceError(ErrorCode::kConflict, kInProgress);
  }
  long long length = store_->LLen(Key(chat_id));
  if (idx >= length) {
    log::Warn("history", kInProgress,
              "chat_id=" + chat_id + " idx=" + std::to_string(idx) +
                  " length=" + std::to_string(length));
    throw ServiceError(ErrorCode::kConflict, kInProgress);
  }
  if (idx == 0) {
    store_->Del(Key(chat_id));
  } else {
    store_->LTrim(Key(chat_id), 0, idx - 1);
  }
  log::Debug("history", "transcript truncated",
             "chat_id=" + chat_id + " kept=" + std::to_string(idx));
}

void ChatHistoryLog::Clear(const std::string& chat_id) { store_->Del(Key(chat_id)); }

}  // namespace parley
