#pragma once

#include <mutex>
#include <string>
#include <unordered_set>
#include <utility>

namespace parley {

// Per-chat single-flight table. At most one holder per chat id: a
// generation holds the slot for its whole run, a truncation only while it
// trims. Acquisition never blocks; a busy chat is reported to the caller.
class ChatLockTable {
 public:
  class Guard {
   public:
    Guard() = default;
    Guard(Guard&& other) noexcept;
    Guard& operator=(Guard&& other) noexcept;
    Guard(const Guard&) = delete;
    Guard& operator=(const Guard&) = delete;
    ~Guard();

    bool owns() const { return table_ != nullptr; }
    explicit operator bool() const { return owns(); }

    void Release();

   private:
    friend class ChatLockTable;
    Guard(ChatLockTable* table, std::string chat_id)
        : table_(table), chat_id_(std::move(chat_id)) {}

    ChatLockTable* table_{nullptr};
    std::string chat_id_;
  };

  // Returns an owning guard, or an empty one if the chat is busy.
  Guard TryAcquire(const std::string& chat_id);

  bool IsHeld(const std::string& chat_id) const;

 private:
  void Unlock(const std::string& chat_id);

  mutable std::mutex mutex_;
  std::unordered_set<std::string> held_;
};

}  // namespace parley
