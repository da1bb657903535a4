#include "storage/memory_kv_store.h"

#include <algorithm>

namespace parley {

namespace {
// Resolves Redis-style [start, stop] into a half-open [first, last) range
// over a list of `size` elements. Returns false when the range is empty.
bool ResolveRange(long long size, long long start, long long stop,
                  long long* first, long long* last) {
  if (start < 0) start += size;
  if (stop < 0) stop += size;
  start = std::max<long long>(start, 0);
  stop = std::min<long long>(stop, size - 1);
  if (size == 0 || start > stop || start >= size) {
    return false;
  }
  *first = start;
  *last = stop + 1;
  return true;
}
}  // namespace

std::optional<std::string> MemoryKvStore::Get(const std::string& key) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = strings_.find(key);
  if (it == strings_.end()) {
    return std::nullopt;
  }
  return it->second;
}

void MemoryKvStore::Set(const std::string& key, const std::string& value) {
  std::lock_guard<std::mutex> lock(mutex_);
  sets_.erase(key);
  lists_.erase(key);
  strings_[key] = value;
}

bool MemoryKvStore::Del(const std::string& key) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::size_t removed = strings_.erase(key) + sets_.erase(key) + lists_.erase(key);
  return removed > 0;
}

bool MemoryKvStore::SAdd(const std::string& key, const std::string& member) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (strings_.count(key) || lists_.count(key)) {
    throw StorageError("WRONGTYPE operation against key " + key);
  }
  return sets_[key].insert(member).second;
}

bool MemoryKvStore::SRem(const std::string& key, const std::string& member) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = sets_.find(key);
  if (it == sets_.end()) {
    return false;
  }
  bool removed = it->second.erase(member) > 0;
  if (it->second.empty()) {
    sets_.erase(it);
  }
  return removed;
}

bool MemoryKvStore::SIsMember(const std::string& key, const std::string& member) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = sets_.find(key);
  return it != sets_.end() && it->second.count(member) > 0;
}

long long MemoryKvStore::RPush(const std::string& key, const std::string& value) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (strings_.count(key) || sets_.count(key)) {
    throw StorageError("WRONGTYPE operation against key " + key);
  }
  auto& list = lists_[key];
  list.push_back(value);
  return static_cast<long long>(list.size());
}

std::vector<std::string> MemoryKvStore::LRange(const std::string& key,
                                               long long start,
                                               long long stop) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = lists_.find(key);
  if (it == lists_.end()) {
    return {};
  }
  long long first = 0;
  long long last = 0;
  if (!ResolveRange(static_cast<long long>(it->second.size()), start, stop, &first, &last)) {
    return {};
  }
  return std::vector<std::string>(it->second.begin() + first, it->second.begin() + last);
}

long long MemoryKvStore::LLen(const std::string& key) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = lists_.find(key);
  return it == lists_.end() ? 0 : static_cast<long long>(it->second.size());
}

void MemoryKvStore::LTrim(const std::string& key, long long start, long long stop) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = lists_.find(key);
  if (it == lists_.end()) {
    return;
  }
  long long first = 0;
  long long last = 0;
  if (!ResolveRange(static_cast<long long>(it->second.size()), start, stop, &first, &last)) {
    // Redis removes the key when the trimmed list is empty.
    lists_.erase(it);
    return;
  }
  std::vector<std::string> kept(it->second.begin() + first, it->second.begin() + last);
  it->second = std::move(kept);
}

std::size_t MemoryKvStore::KeyCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return strings_.size() + sets_.size() + lists_.size();
}

}  // namespace parley
