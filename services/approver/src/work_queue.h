#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <unordered_set>

#include "tollgate/shared/timed_cache.h"

namespace tollgate::approver {

struct WorkQueueOptions {
  std::chrono::milliseconds base_delay{200};
  std::chrono::milliseconds max_delay = std::chrono::seconds(1000);
  double qps = 10.0;
  size_t burst = 100;
};

// Deduplicating work queue. A key is handed to at most one caller of Get()
// until it is marked Done; re-adding a key that is in flight marks it dirty
// and it is queued again on Done.
class RateLimitingQueue {
 public:
  explicit RateLimitingQueue(WorkQueueOptions options = {},
                             shared::SteadyClock clock = shared::DefaultSteadyClock());
  ~RateLimitingQueue();

  RateLimitingQueue(const RateLimitingQueue&) = delete;
  RateLimitingQueue& operator=(const RateLimitingQueue&) = delete;

  void Add(const std::string& key);
  void AddAfter(const std::string& key, std::chrono::milliseconds delay);
  void AddRateLimited(const std::string& key);

  // Blocks until a key is ready. Returns nullopt once the queue is shut down.
  std::optional<std::string> Get();
  void Done(const std::string& key);

  // Clears the failure history of `key`.
  void Forget(const std::string& key);
  size_t NumRequeues(const std::string& key);

  // Delay the limiter assigns to the next retry of `key`; counts as a
  // failure.
  std::chrono::milliseconds When(const std::string& key);

  void ShutDown();
  bool ShuttingDown();
  size_t Len();

 private:
  void AddLocked(const std::string& key);
  void WaitLoop(std::stop_token stop_token);

  WorkQueueOptions options_;
  shared::SteadyClock clock_;

  std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<std::string> queue_;
  std::unordered_set<std::string> dirty_;
  std::unordered_set<std::string> processing_;
  std::unordered_map<std::string, std::chrono::steady_clock::time_point> waiting_;
  bool shutting_down_ = false;

  std::unordered_map<std::string, size_t> failures_;
  double tokens_;
  std::chrono::steady_clock::time_point last_refill_;

  std::jthread waiter_;
};

}  // namespace tollgate::approver
