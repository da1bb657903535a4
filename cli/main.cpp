#include "server/auth/password_hasher.h"
#include "server/auth/user.h"
#include "storage/kv_store.h"
#include "storage/sqlite_user_store.h"

#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

namespace {

void PrintUsage() {
  std::cout
      << "Usage:\n"
      << "  parleyctl add-user <username> [--password PW] [--db PATH]\n"
      << "      Creates a user. Without --password the account is "
         "passwordless\n"
      << "      (any password logs in).\n"
      << "  parleyctl list-users [--db PATH]\n"
      << "  parleyctl remove-user <username> [--db PATH]\n"
      << "      Removes the user, its credentials and its chat ownership "
         "rows.\n"
      << "\n"
      << "The database defaults to $PARLEY_SQLITE_PATH, else parley.db.\n";
}

int CmdAddUser(parley::SqliteUserStore &users, const std::string &username,
               const std::string *password) {
  std::vector<parley::AuthCredential> credentials;
  if (password) {
    parley::PasswordHasher hasher;
    credentials.push_back({parley::AuthType::kPassword, hasher.Hash(*password)});
  } else {
    credentials.push_back({parley::AuthType::kPasswordless, {}});
  }
  if (!users.CreateUser(username, credentials)) {
    std::cerr << "User already exists: " << username << "\n";
    return 1;
  }
  std::cout << "Created " << username
            << (password ? " (password)" : " (passwordless)") << "\n";
  return 0;
}

int CmdListUsers(parley::SqliteUserStore &users) {
  for (const auto &name : users.ListUsernames()) {
    auto user = users.GetUser(name);
    std::size_t chats = user ? user->chats.size() : 0;
    std::cout << name << "\tchats=" << chats << "\n";
  }
  return 0;
}

int CmdRemoveUser(parley::SqliteUserStore &users, const std::string &username) {
  if (!users.RemoveUser(username)) {
    std::cerr << "No such user: " << username << "\n";
    return 1;
  }
  std::cout << "Removed " << username << "\n";
  return 0;
}

} // namespace

int main(int argc, char **argv) {
  if (argc < 2) {
    PrintUsage();
    return 1;
  }
  std::string command = argv[1];
  if (command == "--help" || command == "-h" || command == "help") {
    PrintUsage();
    return 0;
  }

  std::string db_path = "parley.db";
  if (const char *env_db = std::getenv("PARLEY_SQLITE_PATH")) {
    db_path = env_db;
  }
  std::string password;
  bool has_password = false;
  std::vector<std::string> positional;
  for (int i = 2; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--db" && i + 1 < argc) {
      db_path = argv[++i];
    } else if (arg == "--password" && i + 1 < argc) {
      password = argv[++i];
      has_password = true;
    } else {
      positional.push_back(arg);
    }
  }

  try {
    parley::SqliteUserStore users(db_path);
    if (command == "add-user") {
      if (positional.size() != 1) {
        std::cerr << "Usage: parleyctl add-user <username> [--password PW]\n";
        return 1;
      }
      return CmdAddUser(users, positional[0], has_password ? &password : nullptr);
    }
    if (command == "list-users") {
      return CmdListUsers(users);
    }
    if (command == "remove-user") {
      if (positional.size() != 1) {
        std::cerr << "Usage: parleyctl remove-user <username>\n";
        return 1;
      }
      return CmdRemoveUser(users, positional[0]);
    }
  } catch (const parley::StorageError &e) {
    std::cerr << "Database error (" << db_path << "): " << e.what() << "\n";
    return 1;
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }

  std::cerr << "Unknown command: " << command << "\n";
  PrintUsage();
  return 1;
}
