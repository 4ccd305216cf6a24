#pragma once

#include <cstddef>
#include <list>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <utility>

namespace xpathq {

/// Bounded least-recently-used map shared by the parse and compile layers.
/// MUST refresh recency on every read and write and MUST evict exactly one
/// entry (the least recently touched) when an insert would exceed capacity.
/// Inputs are keys/values; outputs are copies of stored values.
template <typename Key, typename Value>
class LruCache {
 public:
  static constexpr size_t kDefaultCapacity = 1000;

  explicit LruCache(size_t capacity = kDefaultCapacity)
      : capacity_(capacity == 0 ? 1 : capacity) {}

  /// Returns the cached value for key, computing and storing it on a miss.
  /// MUST run compute outside the lock; a concurrent insert of the same key wins.
  /// Inputs are key/compute; outputs are the stored value or compute's exception.
  template <typename Compute>
  Value get_or_set(const Key& key, Compute compute) {
    {
      std::lock_guard<std::mutex> lock(mu_);
      auto it = index_.find(key);
      if (it != index_.end()) {
        touch(it->second);
        return it->second->second;
      }
    }

    Value value = compute();

    std::lock_guard<std::mutex> lock(mu_);
    auto it = index_.find(key);
    if (it != index_.end()) {
      touch(it->second);
      return it->second->second;
    }
    insert(key, value);
    return value;
  }

  void set(const Key& key, Value value) {
    std::lock_guard<std::mutex> lock(mu_);
    auto it = index_.find(key);
    if (it != index_.end()) {
      it->second->second = std::move(value);
      touch(it->second);
      return;
    }
    insert(key, std::move(value));
  }

  std::optional<Value> get(const Key& key) {
    std::lock_guard<std::mutex> lock(mu_);
    auto it = index_.find(key);
    if (it == index_.end()) return std::nullopt;
    touch(it->second);
    return it->second->second;
  }

  /// Tests membership; counts as an access and refreshes recency.
  bool contains(const Key& key) {
    std::lock_guard<std::mutex> lock(mu_);
    auto it = index_.find(key);
    if (it == index_.end()) return false;
    touch(it->second);
    return true;
  }

  void clear() {
    std::lock_guard<std::mutex> lock(mu_);
    entries_.clear();
    index_.clear();
  }

  size_t size() const {
    std::lock_guard<std::mutex> lock(mu_);
    return entries_.size();
  }

  size_t capacity() const { return capacity_; }

 private:
  using Entry = std::pair<Key, Value>;
  using Iterator = typename std::list<Entry>::iterator;

  // Front of entries_ is the most recently used entry.
  void touch(Iterator it) { entries_.splice(entries_.begin(), entries_, it); }

  void insert(const Key& key, Value value) {
    if (entries_.size() >= capacity_) {
      index_.erase(entries_.back().first);
      entries_.pop_back();
    }
    entries_.emplace_front(key, std::move(value));
    index_[key] = entries_.begin();
  }

  size_t capacity_;
  mutable std::mutex mu_;
  std::list<Entry> entries_;
  std::unordered_map<Key, Iterator> index_;
};

}  // namespace xpathq
