#pragma once

#include <string>
#include <vector>

namespace parley {

// Stored integer values match the `auth.auth_type` column.
enum class AuthType {
  kPasswordless = 0,
  kPassword = 1,
  kReserved = 2,
};

struct AuthCredential {
  AuthType type{AuthType::kPasswordless};
  // Encoded password hash for kPassword, empty otherwise.
  std::string secret;
};

struct ChatRef {
  std::string chat_id;
  std::string owner;
};

struct User {
  std::string username;
  std::vector<AuthCredential> credentials;
  std::vector<ChatRef> chats;

  bool OwnsChat(const std::string& chat_id) const {
    for (const auto& ref : chats) {
      if (ref.chat_id == chat_id) {
        return true;
      }
    }
    return false;
  }
};

}  // namespace parley
