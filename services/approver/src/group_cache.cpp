#include "group_cache.h"

#include <algorithm>
#include <cctype>

namespace tollgate::approver {
namespace {

bool SleepWithStop(std::stop_token stop_token, std::chrono::milliseconds wait) {
  const auto chunk = std::chrono::milliseconds(25);
  std::chrono::milliseconds remaining = wait;
  while (remaining.count() > 0) {
    if (stop_token.stop_requested()) {
      return false;
    }
    const auto current = remaining > chunk ? chunk : remaining;
    std::this_thread::sleep_for(current);
    remaining -= current;
  }
  return !stop_token.stop_requested();
}

}  // namespace

std::string ToLowerAscii(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char ch) {
                   return static_cast<char>(std::tolower(ch));
                 });
  return value;
}

GroupCache::GroupCache(Loader loader, std::chrono::milliseconds negative_ttl,
                       shared::SteadyClock clock)
    : loader_(std::move(loader)),
      negative_ttl_(negative_ttl),
      clock_(std::move(clock)),
      snapshot_(std::make_shared<const GroupSnapshot>()) {}

GroupCache::~GroupCache() { StopPeriodicRefresh(); }

std::optional<GroupMember> GroupCache::Lookup(const std::string& node_name) const {
  std::shared_ptr<const GroupSnapshot> snapshot;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    snapshot = snapshot_;
  }
  const auto it = snapshot->find(ToLowerAscii(node_name));
  if (it == snapshot->end()) {
    return std::nullopt;
  }
  return it->second;
}

std::optional<GroupMember> GroupCache::LookupOrRefresh(
    const std::string& node_name) {
  const uint64_t seen_generation = generation();
  auto member = Lookup(node_name);
  if (member.has_value() || IsKnownAbsent(node_name)) {
    return member;
  }

  std::lock_guard<std::mutex> refresh_lock(refresh_mutex_);
  // Another caller may have refreshed while this one waited.
  if (generation() == seen_generation) {
    Refresh();
  }
  return Lookup(node_name);
}

void GroupCache::Refresh() {
  auto fresh = std::make_shared<const GroupSnapshot>(loader_());
  std::lock_guard<std::mutex> lock(mutex_);
  snapshot_ = std::move(fresh);
  ++generation_;
}

void GroupCache::MarkAbsent(const std::string& node_name) {
  std::lock_guard<std::mutex> lock(mutex_);
  absent_[ToLowerAscii(node_name)] = clock_();
}

bool GroupCache::IsKnownAbsent(const std::string& node_name) {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = absent_.find(ToLowerAscii(node_name));
  if (it == absent_.end()) {
    return false;
  }
  if (negative_ttl_.count() > 0 && clock_() - it->second >= negative_ttl_) {
    absent_.erase(it);
    return false;
  }
  return true;
}

void GroupCache::StartPeriodicRefresh(std::chrono::milliseconds interval,
                                      ErrorHandler on_error) {
  StopPeriodicRefresh();
  refresher_ = std::jthread(
      [this, interval, on_error = std::move(on_error)](std::stop_token token) {
        RefreshLoop(token, interval, on_error);
      });
}

void GroupCache::StopPeriodicRefresh() {
  if (refresher_.joinable()) {
    refresher_.request_stop();
    refresher_.join();
  }
}

uint64_t GroupCache::generation() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return generation_;
}

void GroupCache::RefreshLoop(std::stop_token stop_token,
                             std::chrono::milliseconds interval,
                             const ErrorHandler& on_error) {
  while (SleepWithStop(stop_token, interval)) {
    try {
      std::lock_guard<std::mutex> refresh_lock(refresh_mutex_);
      Refresh();
    } catch (const std::exception& ex) {
      if (on_error) {
        on_error(ex);
      }
    }
  }
}

}  // namespace tollgate::approver
