#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <stop_token>
#include <string>

#include "tollgate/shared/store_error.h"

namespace tollgate::shared {

struct LeaderElectionConfig {
  std::string lease_name = "tollgate-approver";
  std::string identity;
  std::chrono::milliseconds lease_duration = std::chrono::seconds(90);
  std::chrono::milliseconds renew_deadline = std::chrono::seconds(60);
  std::chrono::milliseconds retry_period = std::chrono::seconds(30);
};

class LeaderElector {
 public:
  virtual ~LeaderElector() = default;

  virtual bool TryAcquire() = 0;
  // Extends a lease held by this identity. Returns false if the lease is
  // held by someone else or has lapsed.
  virtual bool Renew() = 0;
  virtual void Release() = 0;
};

enum class LeadershipOutcome {
  Stopped,
  Lost,
};

// Blocks until `stop` is requested or leadership is lost. `lead` runs on its
// own thread while the lease is held; its stop token fires when the lease
// is given up.
LeadershipOutcome RunWithLeaderElection(
    LeaderElector& elector, const LeaderElectionConfig& config,
    std::stop_token stop, const std::function<void(std::stop_token)>& lead);

std::shared_ptr<LeaderElector> CreateLeaderElector(
    const SharedStoreConfig& store_config, const LeaderElectionConfig& config);

}  // namespace tollgate::shared
