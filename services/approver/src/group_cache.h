#pragma once

#include <chrono>
#include <cstdint>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <stop_token>
#include <thread>
#include <unordered_map>

#include "tollgate/shared/timed_cache.h"

namespace tollgate::approver {

struct GroupMember {
  std::string instance_id;
  std::string node_name;
  std::string group_id;
  std::string group_name;
  // Set when the node name appears in more than one group.
  bool ambiguous = false;
};

// Keyed by lowercased node name.
using GroupSnapshot = std::unordered_map<std::string, GroupMember>;

// Snapshot of every group member, replaced wholesale on refresh. Nodes that
// were confirmed absent are remembered in a negative set so that repeated
// misses do not force a full refresh; a zero negative TTL keeps them for
// the life of the process.
class GroupCache {
 public:
  using Loader = std::function<GroupSnapshot()>;
  using ErrorHandler = std::function<void(const std::exception&)>;

  GroupCache(Loader loader, std::chrono::milliseconds negative_ttl,
             shared::SteadyClock clock = shared::DefaultSteadyClock());
  ~GroupCache();

  GroupCache(const GroupCache&) = delete;
  GroupCache& operator=(const GroupCache&) = delete;

  std::optional<GroupMember> Lookup(const std::string& node_name) const;

  // Looks up the current snapshot, then refreshes once on a miss unless the
  // node is in the negative set.
  std::optional<GroupMember> LookupOrRefresh(const std::string& node_name);

  // Builds a new snapshot and swaps it in. On failure the previous snapshot
  // stays in place and the loader's exception propagates.
  void Refresh();

  void MarkAbsent(const std::string& node_name);
  bool IsKnownAbsent(const std::string& node_name);

  void StartPeriodicRefresh(std::chrono::milliseconds interval,
                            ErrorHandler on_error);
  void StopPeriodicRefresh();

  uint64_t generation() const;

 private:
  void RefreshLoop(std::stop_token stop_token, std::chrono::milliseconds interval,
                   const ErrorHandler& on_error);

  Loader loader_;
  std::chrono::milliseconds negative_ttl_;
  shared::SteadyClock clock_;

  mutable std::mutex mutex_;
  std::shared_ptr<const GroupSnapshot> snapshot_;
  std::unordered_map<std::string, std::chrono::steady_clock::time_point> absent_;
  uint64_t generation_ = 0;

  std::mutex refresh_mutex_;
  std::jthread refresher_;
};

std::string ToLowerAscii(std::string value);

}  // namespace tollgate::approver
