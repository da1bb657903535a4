#pragma once

#include <algorithm>
#include <cstdint>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace parley {

// Bounded LRU cache of loaded models keyed by string. Loads run outside the
// cache lock: a cold load only delays callers asking for the same key, who
// wait on the one in-flight load instead of starting another. A failed load
// is reported to every waiter and is not cached.
//
// Evicting an entry drops the cache's reference only; generations holding
// the shared_ptr keep the model alive until they finish.
template <typename Model> class ModelCache {
public:
  using Loader = std::function<std::shared_ptr<Model>()>;

  explicit ModelCache(std::size_t capacity)
      : capacity_(std::max<std::size_t>(capacity, 1)) {}

  std::shared_ptr<Model> Acquire(const std::string &key, const Loader &load) {
    std::promise<std::shared_ptr<Model>> promise;
    {
      std::unique_lock<std::mutex> lock(mutex_);
      for (auto &entry : entries_) {
        if (entry.key == key) {
          entry.last_used = ++use_counter_;
          return entry.model;
        }
      }
      auto pending = loading_.find(key);
      if (pending != loading_.end()) {
        auto future = pending->second;
        lock.unlock();
        return future.get();
      }
      loading_.emplace(key, promise.get_future().share());
    }

    std::shared_ptr<Model> model;
    try {
      model = load();
    } catch (...) {
      // Waiters get the same exception; the original is rethrown here.
      std::lock_guard<std::mutex> lock(mutex_);
      loading_.erase(key);
      promise.set_exception(std::current_exception());
      throw;
    }

    {
      std::lock_guard<std::mutex> lock(mutex_);
      while (entries_.size() >= capacity_) {
        auto oldest = std::min_element(
            entries_.begin(), entries_.end(),
            [](const Entry &a, const Entry &b) {
              return a.last_used < b.last_used;
            });
        entries_.erase(oldest);
      }
      entries_.push_back({key, model, ++use_counter_});
      loading_.erase(key);
    }
    promise.set_value(model);
    return model;
  }

  std::size_t Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
  }

  bool Contains(const std::string &key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto &entry : entries_) {
      if (entry.key == key) {
        return true;
      }
    }
    return false;
  }

  void Clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
  }

private:
  struct Entry {
    std::string key;
    std::shared_ptr<Model> model;
    std::uint64_t last_used{0};
  };

  std::size_t capacity_;
  mutable std::mutex mutex_;
  std::vector<Entry> entries_;
  std::map<std::string, std::shared_future<std::shared_ptr<Model>>> loading_;
  std::uint64_t use_counter_{0};
};

} // namespace parley
