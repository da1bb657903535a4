#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace parley {

// Raised by storage adapters when the backing store is unreachable or
// rejects an operation.
class StorageError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// KvStore is the key-value collaborator holding session blobs, the set of
// live chat ids and per-chat transcripts. The operation set is the subset of
// Redis commands the chat layer needs; list indices follow Redis semantics
// (inclusive stop, negative values count from the tail).
//
// Every call is a single-key operation. There are no cross-key transactions.
// Thread safety: all methods must be safe to call concurrently.
class KvStore {
 public:
  virtual ~KvStore() = default;

  virtual std::optional<std::string> Get(const std::string& key) = 0;
  virtual void Set(const std::string& key, const std::string& value) = 0;
  // Returns true when the key existed.
  virtual bool Del(const std::string& key) = 0;

  // Returns true when the set changed.
  virtual bool SAdd(const std::string& key, const std::string& member) = 0;
  virtual bool SRem(const std::string& key, const std::string& member) = 0;
  virtual bool SIsMember(const std::string& key, const std::string& member) = 0;

  // Returns the list length after the push.
  virtual long long RPush(const std::string& key, const std::string& value) = 0;
  virtual std::vector<std::string> LRange(const std::string& key,
                                          long long start,
                                          long long stop) = 0;
  virtual long long LLen(const std::string& key) = 0;
  virtual void LTrim(const std::string& key, long long start, long long stop) = 0;

  // Cheap liveness probe used by /healthz.
  virtual bool Ping() = 0;

  // Backend name for logging.
  virtual std::string Name() const = 0;
};

}  // namespace parley
