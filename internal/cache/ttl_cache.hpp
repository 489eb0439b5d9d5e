#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <unordered_map>
#include <utility>

#include "internal/util/time.hpp"

namespace tracelens::cache {

/*
  Cache interface.

  Analyses take a Cache pointer; nullptr disables caching. A miss only
  means the caller recomputes.
*/
template <typename Key, typename Value>
class Cache {
 public:
  virtual ~Cache() = default;

  virtual std::optional<Value> Get(const Key& key)                                             = 0;
  virtual void                 Put(const Key& key, Value value, std::chrono::milliseconds ttl) = 0;
  virtual void                 Erase(const Key& key)                                           = 0;
  virtual void                 Clear()                                                         = 0;
  virtual std::size_t          Size() const                                                    = 0;
};

/*
  Bounded in-memory cache with per-entry expiry.

  Expired entries are dropped lazily on access. When full, expired entries
  are purged first, then the entry closest to expiry is evicted.
*/
template <typename Key, typename Value, typename Hash = std::hash<Key>>
class TtlCache final : public Cache<Key, Value> {
 public:
  using ClockFn = std::function<util::TimePoint()>;

  explicit TtlCache(std::size_t max_entries, ClockFn clock = &util::Now) : max_entries_(max_entries), clock_(std::move(clock)) {
  }

  std::optional<Value> Get(const Key& key) override {
    const auto now = clock_();
    {
      std::shared_lock lock(mutex_);
      auto             it = entries_.find(key);
      if (it == entries_.end()) {
        return std::nullopt;
      }
      if (it->second.expires_at > now) {
        return it->second.value;
      }
    }

    std::unique_lock lock(mutex_);
    auto             it = entries_.find(key);
    if (it != entries_.end() && it->second.expires_at <= now) {
      entries_.erase(it);
    }
    return std::nullopt;
  }

  void Put(const Key& key, Value value, std::chrono::milliseconds ttl) override {
    if (max_entries_ == 0 || ttl <= std::chrono::milliseconds::zero()) {
      return;
    }
    const auto now = clock_();

    std::unique_lock lock(mutex_);
    auto             it = entries_.find(key);
    if (it == entries_.end() && entries_.size() >= max_entries_) {
      EvictLocked(now);
    }
    entries_[key] = Entry{std::move(value), now + std::chrono::duration_cast<util::Clock::duration>(ttl)};
  }

  void Erase(const Key& key) override {
    std::unique_lock lock(mutex_);
    entries_.erase(key);
  }

  void Clear() override {
    std::unique_lock lock(mutex_);
    entries_.clear();
  }

  std::size_t Size() const override {
    std::shared_lock lock(mutex_);
    return entries_.size();
  }

 private:
  struct Entry {
    Value           value;
    util::TimePoint expires_at;
  };

  void EvictLocked(util::TimePoint now) {
    for (auto it = entries_.begin(); it != entries_.end();) {
      if (it->second.expires_at <= now) {
        it = entries_.erase(it);
      } else {
        ++it;
      }
    }
    if (entries_.size() < max_entries_) {
      return;
    }

    auto oldest = entries_.begin();
    for (auto it = entries_.begin(); it != entries_.end(); ++it) {
      if (it->second.expires_at < oldest->second.expires_at) {
        oldest = it;
      }
    }
    if (oldest != entries_.end()) {
      entries_.erase(oldest);
    }
  }

  std::size_t max_entries_;
  ClockFn     clock_;

  mutable std::shared_mutex            mutex_;
  std::unordered_map<Key, Entry, Hash> entries_;
};

} // namespace tracelens::cache
