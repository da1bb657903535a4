#pragma once

#include "storage/kv_store.h"

#include <chrono>
#include <memory>
#include <string>

namespace sw {
namespace redis {
class Redis;
}  // namespace redis
}  // namespace sw

namespace parley {

struct RedisConfig {
  std::string host{"127.0.0.1"};
  int port{6379};
  std::string password;
  int db{0};
  std::size_t pool_size{8};
  std::chrono::milliseconds socket_timeout{2000};
  std::chrono::milliseconds pool_wait_timeout{1000};
  // Connections older than this are recycled by the pool; 0 keeps them
  // forever.
  std::chrono::minutes connection_lifetime{30};
};

// KvStore backed by Redis through one process-wide redis++ connection pool.
// Each call borrows a pooled connection for the duration of one command.
// sw::redis::Error is translated into StorageError.
class RedisKvStore : public KvStore {
 public:
  explicit RedisKvStore(const RedisConfig& config);
  ~RedisKvStore() override;

  std::optional<std::string> Get(const std::string& key) override;
  void Set(const std::string& key, const std::string& value) override;
  bool Del(const std::string& key) override;

  bool SAdd(const std::string& key, const std::string& member) override;
  bool SRem(const std::string& key, const std::string& member) override;
  bool SIsMember(const std::string& key, const std::string& member) override;

  long long RPush(const std::string& key, const std::string& value) override;
  std::vector<std::string> LRange(const std::string& key,
                                  long long start,
                                  long long stop) override;
  long long LLen(const std::string& key) override;
  void LTrim(const std::string& key, long long start, long long stop) override;

  bool Ping() override;
  std::string Name() const override { return "redis"; }

 private:
  std::string endpoint_;
  std::unique_ptr<sw::redis::Redis> redis_;
};

}  // namespace parley
