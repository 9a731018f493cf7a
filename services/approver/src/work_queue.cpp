#include "work_queue.h"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <stdexcept>

namespace tollgate::approver {
namespace {

constexpr auto kWaitPollInterval = std::chrono::milliseconds(25);

}  // namespace

RateLimitingQueue::RateLimitingQueue(WorkQueueOptions options,
                                     shared::SteadyClock clock)
    : options_(options),
      clock_(std::move(clock)),
      tokens_(static_cast<double>(options.burst)),
      last_refill_(clock_()) {
  if (options_.qps <= 0.0 || options_.burst == 0) {
    throw std::invalid_argument("work queue rate limit must be positive");
  }
  waiter_ = std::jthread([this](std::stop_token stop_token) { WaitLoop(stop_token); });
}

RateLimitingQueue::~RateLimitingQueue() { ShutDown(); }

void RateLimitingQueue::Add(const std::string& key) {
  std::lock_guard<std::mutex> lock(mutex_);
  AddLocked(key);
}

void RateLimitingQueue::AddLocked(const std::string& key) {
  if (shutting_down_ || dirty_.count(key) != 0) {
    return;
  }
  dirty_.insert(key);
  if (processing_.count(key) != 0) {
    return;
  }
  queue_.push_back(key);
  cv_.notify_one();
}

void RateLimitingQueue::AddAfter(const std::string& key,
                                 std::chrono::milliseconds delay) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (shutting_down_) {
    return;
  }
  if (delay.count() <= 0) {
    AddLocked(key);
    return;
  }
  const auto ready_at = clock_() + delay;
  const auto it = waiting_.find(key);
  if (it == waiting_.end()) {
    waiting_.emplace(key, ready_at);
  } else if (ready_at < it->second) {
    it->second = ready_at;
  }
}

void RateLimitingQueue::AddRateLimited(const std::string& key) {
  AddAfter(key, When(key));
}

std::optional<std::string> RateLimitingQueue::Get() {
  std::unique_lock<std::mutex> lock(mutex_);
  cv_.wait(lock, [this] { return shutting_down_ || !queue_.empty(); });
  if (shutting_down_) {
    return std::nullopt;
  }
  std::string key = std::move(queue_.front());
  queue_.pop_front();
  processing_.insert(key);
  dirty_.erase(key);
  return key;
}

void RateLimitingQueue::Done(const std::string& key) {
  std::lock_guard<std::mutex> lock(mutex_);
  processing_.erase(key);
  if (dirty_.count(key) != 0) {
    queue_.push_back(key);
    cv_.notify_one();
  }
}

void RateLimitingQueue::Forget(const std::string& key) {
  std::lock_guard<std::mutex> lock(mutex_);
  failures_.erase(key);
}

size_t RateLimitingQueue::NumRequeues(const std::string& key) {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = failures_.find(key);
  return it == failures_.end() ? 0 : it->second;
}

std::chrono::milliseconds RateLimitingQueue::When(const std::string& key) {
  std::lock_guard<std::mutex> lock(mutex_);

  const size_t exponent = failures_[key]++;
  const double item_ms = std::min(
      static_cast<double>(options_.base_delay.count()) *
          std::pow(2.0, static_cast<double>(exponent)),
      static_cast<double>(options_.max_delay.count()));

  const auto now = clock_();
  const double elapsed =
      std::chrono::duration<double>(now - last_refill_).count();
  last_refill_ = now;
  tokens_ = std::min(static_cast<double>(options_.burst),
                     tokens_ + elapsed * options_.qps);
  tokens_ -= 1.0;
  const double bucket_ms = tokens_ >= 0.0 ? 0.0 : -tokens_ / options_.qps * 1000.0;

  return std::chrono::milliseconds(
      static_cast<int64_t>(std::ceil(std::max(item_ms, bucket_ms))));
}

void RateLimitingQueue::ShutDown() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    shutting_down_ = true;
    waiting_.clear();
  }
  cv_.notify_all();
  if (waiter_.joinable()) {
    waiter_.request_stop();
    waiter_.join();
  }
}

bool RateLimitingQueue::ShuttingDown() {
  std::lock_guard<std::mutex> lock(mutex_);
  return shutting_down_;
}

size_t RateLimitingQueue::Len() {
  std::lock_guard<std::mutex> lock(mutex_);
  return queue_.size();
}

void RateLimitingQueue::WaitLoop(std::stop_token stop_token) {
  while (!stop_token.stop_requested()) {
    std::this_thread::sleep_for(kWaitPollInterval);
    std::lock_guard<std::mutex> lock(mutex_);
    const auto now = clock_();
    for (auto it = waiting_.begin(); it != waiting_.end();) {
      if (it->second <= now) {
        AddLocked(it->first);
        it = waiting_.erase(it);
      } else {
        ++it;
      }
    }
  }
}

}  // namespace tollgate::approver
