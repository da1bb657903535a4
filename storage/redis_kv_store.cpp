#include "storage/redis_kv_store.h"

#include "server/logging/logger.h"

#include <sw/redis++/redis++.h>

#include <iterator>

namespace parley {

namespace {

template <typename Fn>
auto Guarded(const std::string& endpoint, const char* op, Fn&& fn) -> decltype(fn()) {
  try {
    return fn();
  } catch (const sw::redis::Error& e) {
    log::Error("kv", std::string("redis ") + op + " failed", "endpoint=" + endpoint + " error=" + e.what());
    throw StorageError(std::string("key-value store unavailable: ") + e.what());
  }
}

}  // namespace

RedisKvStore::RedisKvStore(const RedisConfig& config)
    : endpoint_(config.host + ":" + std::to_string(config.port)) {
  sw::redis::ConnectionOptions connection;
  connection.host = config.host;
  connection.port = config.port;
  connection.db = config.db;
  if (!config.password.empty()) {
    connection.password = config.password;
  }
  connection.socket_timeout = config.socket_timeout;

  sw::redis::ConnectionPoolOptions pool;
  pool.size = config.pool_size > 0 ? config.pool_size : 1;
  pool.wait_timeout = config.pool_wait_timeout;
  pool.connection_lifetime = config.connection_lifetime;

  // Connections are opened lazily by the pool; construction does no I/O.
  redis_ = std::make_unique<sw::redis::Redis>(connection, pool);
  log::Info("kv", "redis pool configured",
            "endpoint=" + endpoint_ + " pool_size=" + std::to_string(pool.size));
}

RedisKvStore::~RedisKvStore() = default;

std::optional<std::string> RedisKvStore::Get(const std::string& key) {
  return Guarded(endpoint_, "GET", [&]() -> std::optional<std::string> {
    auto value = redis_->get(key);
    if (!value) {
      return std::nullopt;
    }
    return *value;
  });
}

void RedisKvStore::Set(const std::string& key, const std::string& value) {
  Guarded(endpoint_, "SET", [&]() { redis_->set(key, value); });
}

bool RedisKvStore::Del(const std::string& key) {
  return Guarded(endpoint_, "DEL", [&]() { return redis_->del(key) > 0; });
}

bool RedisKvStore::SAdd(const std::string& key, const std::string& member) {
  return Guarded(endpoint_, "SADD", [&]() { return redis_->sadd(key, member) > 0; });
}

bool RedisKvStore::SRem(const std::string& key, const std::string& member) {
  return Guarded(endpoint_, "SREM", [&]() { return redis_->srem(key, member) > 0; });
}

bool RedisKvStore::SIsMember(const std::string& key, const std::string& member) {
  return Guarded(endpoint_, "SISMEMBER", [&]() { return redis_->sismember(key, member); });
}

long long RedisKvStore::RPush(const std::string& key, const std::string& value) {
  return Guarded(endpoint_, "RPUSH", [&]() { return redis_->rpush(key, value); });
}

std::vector<std::string> RedisKvStore::LRange(const std::string& key,
                                              long long start,
                                              long long stop) {
  return Guarded(endpoint_, "LRANGE", [&]() {
    std::vector<std::string> out;
    redis_->lrange(key, start, stop, std::back_inserter(out));
    return out;
  });
}

long long RedisKvStore::LLen(const std::string& key) {
  return Guarded(endpoint_, "LLEN", [&]() { return redis_->llen(key); });
}

void RedisKvStore::LTrim(const std::string& key, long long start, long long stop) {
  Guarded(endpoint_, "LTRIM", [&]() { redis_->ltrim(key, start, stop); });
}

bool RedisKvStore::Ping() {
  try {
    redis_->ping();
    return true;
  } catch (const sw::redis::Error& e) {
    log::Warn("kv", "redis ping failed", "endpoint=" + endpoint_ + " error=" + e.what());
    return false;
  }
}

}  // namespace parley
