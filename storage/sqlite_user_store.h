#pragma once

#include "storage/user_store.h"

#include <memory>
#include <mutex>
#include <string>

struct sqlite3;
struct sqlite3_stmt;

namespace parley {

// UserStore over a single SQLite database file (":memory:" for tests).
// One connection is shared by all callers and guarded by a mutex.
class SqliteUserStore : public UserStore {
 public:
  // Opens (creating if needed) the database and applies the schema.
  // Throws StorageError on failure.
  explicit SqliteUserStore(const std::string& path);
  ~SqliteUserStore() override;

  std::optional<User> GetUser(const std::string& username) override;
  bool CreateUser(const std::string& username,
                  const std::vector<AuthCredential>& credentials) override;
  bool RemoveUser(const std::string& username) override;
  std::vector<std::string> ListUsernames() override;

  void AddChat(const ChatRef& ref) override;
  bool RemoveChat(const std::string& owner, const std::string& chat_id) override;

  void EnsureUser(const std::string& username,
                  const std::vector<AuthCredential>& credentials) override;

  std::string Name() const override { return "sqlite"; }

 private:
  struct DbCloser {
    void operator()(sqlite3* db) const;
  };
  struct StmtFinalizer {
    void operator()(sqlite3_stmt* stmt) const;
  };
  using Statement = std::unique_ptr<sqlite3_stmt, StmtFinalizer>;

  void Exec(const std::string& sql);
  Statement Prepare(const std::string& sql);
  bool InsertUserLocked(const std::string& username,
                        const std::vector<AuthCredential>& credentials);
  [[noreturn]] void Fail(const std::string& what);

  std::string path_;
  std::unique_ptr<sqlite3, DbCloser> db_;
  std::mutex mutex_;
};

}  // namespace parley
