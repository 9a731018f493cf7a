#pragma once

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <utility>

namespace tollgate::shared {

using SteadyClock = std::function<std::chrono::steady_clock::time_point()>;

inline SteadyClock DefaultSteadyClock() {
  return [] { return std::chrono::steady_clock::now(); };
}

// Keyed cache with an absolute TTL per entry. Concurrent misses on the same
// key share a single factory invocation. Expired entries are refreshed on
// the next lookup. Once the map reaches `sweep_threshold` entries, inserting
// a new key first drops every expired entry; the threshold then moves to
// twice the surviving size.
template <typename Value>
class TimedCache {
 public:
  using Factory = std::function<Value(const std::string&)>;

  static constexpr size_t kDefaultSweepThreshold = 1024;

  explicit TimedCache(std::chrono::milliseconds ttl,
                      SteadyClock clock = DefaultSteadyClock(),
                      size_t sweep_threshold = kDefaultSweepThreshold)
      : ttl_(ttl),
        clock_(std::move(clock)),
        sweep_threshold_(sweep_threshold == 0 ? 1 : sweep_threshold),
        next_sweep_at_(sweep_threshold_) {}

  TimedCache(const TimedCache&) = delete;
  TimedCache& operator=(const TimedCache&) = delete;

  Value GetOrCreate(const std::string& key, const Factory& factory) {
    auto entry = FindOrInsertEntry(key);

    std::lock_guard<std::mutex> entry_lock(entry->mutex);
    if (entry->populated && clock_() - entry->created_at < ttl_) {
      return entry->value;
    }

    try {
      entry->value = factory(key);
    } catch (...) {
      entry->populated = false;
      EraseIfCurrent(key, entry);
      throw;
    }
    entry->created_at = clock_();
    entry->populated = true;
    return entry->value;
  }

  void Delete(const std::string& key) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    entries_.erase(key);
  }

  size_t Size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return entries_.size();
  }

 private:
  struct Entry {
    std::mutex mutex;
    bool populated = false;
    Value value{};
    std::chrono::steady_clock::time_point created_at{};
  };

  std::shared_ptr<Entry> FindOrInsertEntry(const std::string& key) {
    {
      std::shared_lock<std::shared_mutex> lock(mutex_);
      const auto it = entries_.find(key);
      if (it != entries_.end()) {
        return it->second;
      }
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);
    const auto it = entries_.find(key);
    if (it != entries_.end()) {
      return it->second;
    }
    if (entries_.size() >= next_sweep_at_) {
      SweepExpiredLocked();
    }
    auto entry = std::make_shared<Entry>();
    entries_.emplace(key, entry);
    return entry;
  }

  // Entries whose mutex is held are mid-refresh and are left alone.
  void SweepExpiredLocked() {
    const auto now = clock_();
    for (auto it = entries_.begin(); it != entries_.end();) {
      std::unique_lock<std::mutex> entry_lock(it->second->mutex, std::try_to_lock);
      if (entry_lock.owns_lock() && it->second->populated &&
          now - it->second->created_at >= ttl_) {
        entry_lock.unlock();
        it = entries_.erase(it);
      } else {
        ++it;
      }
    }
    next_sweep_at_ = std::max(sweep_threshold_, entries_.size() * 2);
  }

  void EraseIfCurrent(const std::string& key,
                      const std::shared_ptr<Entry>& entry) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    const auto it = entries_.find(key);
    if (it != entries_.end() && it->second == entry) {
      entries_.erase(it);
    }
  }

  std::chrono::milliseconds ttl_;
  SteadyClock clock_;
  size_t sweep_threshold_;
  size_t next_sweep_at_;
  mutable std::shared_mutex mutex_;
  std::unordered_map<std::string, std::shared_ptr<Entry>> entries_;
};

}  // namespace tollgate::shared
