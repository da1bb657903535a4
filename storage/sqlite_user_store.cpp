#include "storage/sqlite_user_store.h"

#include "server/logging/logger.h"
#include "storage/kv_store.h"

#include <sqlite3.h>

namespace parley {

namespace {

constexpr const char* kSchema = R"SQL(
CREATE TABLE IF NOT EXISTS users (
  username   TEXT PRIMARY KEY,
  created_at TEXT NOT NULL DEFAULT (strftime('%Y-%m-%dT%H:%M:%fZ', 'now'))
);
CREATE TABLE IF NOT EXISTS auth (
  id        INTEGER PRIMARY KEY AUTOINCREMENT,
  username  TEXT NOT NULL REFERENCES users(username) ON DELETE CASCADE,
  auth_type INTEGER NOT NULL,
  secret    TEXT NOT NULL DEFAULT ''
);
CREATE TABLE IF NOT EXISTS chats (
  chat_id TEXT PRIMARY KEY,
  owner   TEXT NOT NULL REFERENCES users(username) ON DELETE CASCADE
);
CREATE INDEX IF NOT EXISTS idx_auth_username ON auth(username);
CREATE INDEX IF NOT EXISTS idx_chats_owner ON chats(owner);
)SQL";

std::string ColumnText(sqlite3_stmt* stmt, int col) {
  const unsigned char* text = sqlite3_column_text(stmt, col);
  return text ? reinterpret_cast<const char*>(text) : std::string();
}

AuthType ToAuthType(int value) {
  switch (value) {
    case 0:
      return AuthType::kPasswordless;
    case 1:
      return AuthType::kPassword;
    default:
      return AuthType::kReserved;
  }
}

}  // namespace

void SqliteUserStore::DbCloser::operator()(sqlite3* db) const {
  if (db) {
    sqlite3_close(db);
  }
}

void SqliteUserStore::StmtFinalizer::operator()(sqlite3_stmt* stmt) const {
  if (stmt) {
    sqlite3_finalize(stmt);
  }
}

SqliteUserStore::SqliteUserStore(const std::string& path) : path_(path) {
  sqlite3* raw = nullptr;
  int rc = sqlite3_open_v2(path.c_str(), &raw,
                           SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
                           nullptr);
  db_.reset(raw);
  if (rc != SQLITE_OK) {
    std::string reason = raw ? sqlite3_errmsg(raw) : "out of memory";
    throw StorageError("failed to open user database " + path + ": " + reason);
  }
  sqlite3_busy_timeout(db_.get(), 5000);
  Exec("PRAGMA foreign_keys = ON;");
  Exec(kSchema);
  log::Info("user_store", "sqlite user store ready", "path=" + path_);
}

SqliteUserStore::~SqliteUserStore() = default;

void SqliteUserStore::Fail(const std::string& what) {
  std::string reason = sqlite3_errmsg(db_.get());
  log::Error("user_store", what, "path=" + path_ + " error=" + reason);
  throw StorageError(what + ": " + reason);
}

void SqliteUserStore::Exec(const std::string& sql) {
  char* err = nullptr;
  if (sqlite3_exec(db_.get(), sql.c_str(), nullptr, nullptr, &err) != SQLITE_OK) {
    std::string reason = err ? err : "unknown error";
    sqlite3_free(err);
    log::Error("user_store", "statement failed", "path=" + path_ + " error=" + reason);
    throw StorageError("SQLite error: " + reason);
  }
}

SqliteUserStore::Statement SqliteUserStore::Prepare(const std::string& sql) {
  sqlite3_stmt* raw = nullptr;
  if (sqlite3_prepare_v2(db_.get(), sql.c_str(), -1, &raw, nullptr) != SQLITE_OK) {
    Fail("prepare failed");
  }
  return Statement(raw);
}

std::optional<User> SqliteUserStore::GetUser(const std::string& username) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto find = Prepare("SELECT username FROM users WHERE username = ?1;");
  sqlite3_bind_text(find.get(), 1, username.c_str(), -1, SQLITE_TRANSIENT);
  int rc = sqlite3_step(find.get());
  if (rc == SQLITE_DONE) {
    return std::nullopt;
  }
  if (rc != SQLITE_ROW) {
    Fail("user lookup failed");
  }

  User user;
  user.username = ColumnText(find.get(), 0);

  auto creds = Prepare("SELECT auth_type, secret FROM auth WHERE username = ?1 ORDER BY id;");
  sqlite3_bind_text(creds.get(), 1, username.c_str(), -1, SQLITE_TRANSIENT);
  while ((rc = sqlite3_step(creds.get())) == SQLITE_ROW) {
    AuthCredential cred;
    cred.type = ToAuthType(sqlite3_column_int(creds.get(), 0));
    cred.secret = ColumnText(creds.get(), 1);
    user.credentials.push_back(std::move(cred));
  }
  if (rc != SQLITE_DONE) {
    Fail("credential lookup failed");
  }

  auto chats = Prepare("SELECT chat_id, owner FROM chats WHERE owner = ?1 ORDER BY rowid;");
  sqlite3_bind_text(chats.get(), 1, username.c_str(), -1, SQLITE_TRANSIENT);
  while ((rc = sqlite3_step(chats.get())) == SQLITE_ROW) {
    user.chats.push_back({ColumnText(chats.get(), 0), ColumnText(chats.get(), 1)});
  }
  if (rc != SQLITE_DONE) {
    Fail("chat lookup failed");
  }
  return user;
}

bool SqliteUserStore::InsertUserLocked(const std::string& username,
                                       const std::vector<AuthCredential>& credentials) {
  Exec("BEGIN IMMEDIATE;");
  try {
    auto insert = Prepare("INSERT OR IGNORE INTO users(username) VALUES (?1);");
    sqlite3_bind_text(insert.get(), 1, username.c_str(), -1, SQLITE_TRANSIENT);
    if (sqlite3_step(insert.get()) != SQLITE_DONE) {
      Fail("user insert failed");
    }
    if (sqlite3_changes(db_.get()) == 0) {
      Exec("ROLLBACK;");
      return false;
    }
    for (const auto& cred : credentials) {
      auto add = Prepare("INSERT INTO auth(username, auth_type, secret) VALUES (?1, ?2, ?3);");
      sqlite3_bind_text(add.get(), 1, username.c_str(), -1, SQLITE_TRANSIENT);
      sqlite3_bind_int(add.get(), 2, static_cast<int>(cred.type));
      sqlite3_bind_text(add.get(), 3, cred.secret.c_str(), -1, SQLITE_TRANSIENT);
      if (sqlite3_step(add.get()) != SQLITE_DONE) {
        Fail("credential insert failed");
      }
    }
    Exec("COMMIT;");
  } catch (const StorageError&) {
    if (sqlite3_exec(db_.get(), "ROLLBACK;", nullptr, nullptr, nullptr) != SQLITE_OK) {
      log::Warn("user_store", "rollback failed", "path=" + path_);
    }
    throw;
  }
  return true;
}

bool SqliteUserStore::CreateUser(const std::string& username,
                                 const std::vector<AuthCredential>& credentials) {
  std::lock_guard<std::mutex> lock(mutex_);
  bool created = InsertUserLocked(username, credentials);
  if (created) {
    log::Info("user_store", "user created",
              "username=" + username + " credentials=" + std::to_string(credentials.size()));
  }
  return created;
}

void SqliteUserStore::EnsureUser(const std::string& username,
                                 const std::vector<AuthCredential>& credentials) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (InsertUserLocked(username, credentials)) {
    log::Info("user_store", "bootstrapped user", "username=" + username);
  }
}

bool SqliteUserStore::RemoveUser(const std::string& username) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto remove = Prepare("DELETE FROM users WHERE username = ?1;");
  sqlite3_bind_text(remove.get(), 1, username.c_str(), -1, SQLITE_TRANSIENT);
  if (sqlite3_step(remove.get()) != SQLITE_DONE) {
    Fail("user delete failed");
  }
  return sqlite3_changes(db_.get()) > 0;
}

std::vector<std::string> SqliteUserStore::ListUsernames() {
  std::lock_guard<std::mutex> lock(mutex_);
  auto list = Prepare("SELECT username FROM users ORDER BY username;");
  std::vector<std::string> names;
  int rc;
  while ((rc = sqlite3_step(list.get())) == SQLITE_ROW) {
    names.push_back(ColumnText(list.get(), 0));
  }
  if (rc != SQLITE_DONE) {
    Fail("user listing failed");
  }
  return names;
}

void SqliteUserStore::AddChat(const ChatRef& ref) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto insert = Prepare("INSERT INTO chats(chat_id, owner) VALUES (?1, ?2);");
  sqlite3_bind_text(insert.get(), 1, ref.chat_id.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(insert.get(), 2, ref.owner.c_str(), -1, SQLITE_TRANSIENT);
  if (sqlite3_step(insert.get()) != SQLITE_DONE) {
    Fail("chat ref insert failed");
  }
}

bool SqliteUserStore::RemoveChat(const std::string& owner, const std::string& chat_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto remove = Prepare("DELETE FROM chats WHERE chat_id = ?1 AND owner = ?2;");
  sqlite3_bind_text(remove.get(), 1, chat_id.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(remove.get(), 2, owner.c_str(), -1, SQLITE_TRANSIENT);
  if (sqlite3_step(remove.get()) != SQLITE_DONE) {
    Fail("chat ref delete failed");
  }
  return sqlite3_changes(db_.get()) > 0;
}

}  // namespace parley
