#pragma once

#include "storage/kv_store.h"

#include <mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace parley {

// Process-local KvStore used by unit tests and the `store.backend: memory`
// development mode. Nothing survives a restart.
class MemoryKvStore : public KvStore {
 public:
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

  bool Ping() override { return true; }
  std::string Name() const override { return "memory"; }

  // Total number of keys of any type. Tests use it to check that deletes
  // leave nothing behind.
  std::size_t KeyCount() const;

 private:
  mutable std::mutex mutex_;
  std::unordered_map<std::string, std::string> strings_;
  std::unordered_map<std::string, std::unordered_set<std::string>> sets_;
  std::unordered_map<std::string, std::vector<std::string>> lists_;
};

}  // namespace parley
