#pragma once

#include "server/auth/user.h"

#include <optional>
#include <string>
#include <vector>

namespace parley {

// UserStore is the relational collaborator owning users, their credentials
// and the ChatRef rows that bind chats to owners. ChatRef rows are the
// authorization boundary for every chat operation.
//
// Failures to reach or update the store throw StorageError.
// Thread safety: all methods must be safe to call concurrently.
class UserStore {
 public:
  virtual ~UserStore() = default;

  // Loads the user with credentials and chats; nullopt if absent.
  virtual std::optional<User> GetUser(const std::string& username) = 0;

  // Returns false when the username is already taken.
  virtual bool CreateUser(const std::string& username,
                          const std::vector<AuthCredential>& credentials) = 0;

  // Removes the user together with its credentials and ChatRefs. Returns
  // false when no such user existed.
  virtual bool RemoveUser(const std::string& username) = 0;

  virtual std::vector<std::string> ListUsernames() = 0;

  virtual void AddChat(const ChatRef& ref) = 0;
  // Returns true when a row was removed.
  virtual bool RemoveChat(const std::string& owner, const std::string& chat_id) = 0;

  // Creates `username` with the given credentials unless it already exists.
  virtual void EnsureUser(const std::string& username,
                          const std::vector<AuthCredential>& credentials) = 0;

  // Backend name for logging.
  virtual std::string Name() const = 0;
};

}  // namespace parley
