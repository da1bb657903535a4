#include "chat/chat_lock.h"

namespace parley {

ChatLockTable::Guard::Guard(Guard&& other) noexcept
    : table_(other.table_), chat_id_(std::move(other.chat_id_)) {
  other.table_ = nullptr;
}

ChatLockTable::Guard& ChatLockTable::Guard::operator=(Guard&& other) noexcept {
  if (this != &other) {
    Release();
    table_ = other.table_;
    chat_id_ = std::move(other.chat_id_);
    other.table_ = nullptr;
  }
  return *this;
}

ChatLockTable::Guard::~Guard() { Release(); }

void ChatLockTable::Guard::Release() {
  if (table_) {
    table_->Unlock(chat_id_);
    table_ = nullptr;
  }
}

ChatLockTable::Guard ChatLockTable::TryAcquire(const std::string& chat_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!held_.insert(chat_id).second) {
    return Guard();
  }
  return Guard(this, chat_id);
}

bool ChatLockTable::IsHeld(const std::string& chat_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return held_.count(chat_id) > 0;
}

void ChatLockTable::Unlock(const std::string& chat_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  held_.erase(chat_id);
}

}  // namespace parley
