#include "tollgate/shared/leader_election.h"

#include <thread>

#include <sw/redis++/redis++.h>

namespace tollgate::shared {
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

class SingleProcessLeaderElector final : public LeaderElector {
 public:
  bool TryAcquire() override { return true; }
  bool Renew() override { return true; }
  void Release() override {}
};

// ARGV[1] = identity, ARGV[2] = lease milliseconds
constexpr const char* kRenewScript = R"lua(
if redis.call('GET', KEYS[1]) == ARGV[1] then
  return redis.call('PEXPIRE', KEYS[1], ARGV[2])
end
return 0
)lua";

constexpr const char* kReleaseScript = R"lua(
if redis.call('GET', KEYS[1]) == ARGV[1] then
  return redis.call('DEL', KEYS[1])
end
return 0
)lua";

class RedisLeaderElector final : public LeaderElector {
 public:
  RedisLeaderElector(const SharedStoreConfig& store_config,
                     LeaderElectionConfig config)
      : redis_(store_config.redis_uri),
        key_(store_config.key_prefix + ":lease:" + config.lease_name),
        config_(std::move(config)) {
    if (config_.identity.empty()) {
      throw SharedStoreError(SharedStoreError::Kind::InvalidArgument,
                             "leader election identity is required");
    }
  }

  bool TryAcquire() override {
    try {
      if (redis_.set(key_, config_.identity, config_.lease_duration,
                     sw::redis::UpdateType::NOT_EXIST)) {
        return true;
      }
      return Renew();
    } catch (const sw::redis::Error& ex) {
      throw SharedStoreError(SharedStoreError::Kind::Unavailable, ex.what());
    }
  }

  bool Renew() override {
    try {
      return redis_.eval<long long>(
                 kRenewScript, {key_},
                 {config_.identity,
                  std::to_string(config_.lease_duration.count())}) == 1;
    } catch (const sw::redis::Error& ex) {
      throw SharedStoreError(SharedStoreError::Kind::Unavailable, ex.what());
    }
  }

  void Release() override {
    try {
      redis_.eval<long long>(kReleaseScript, {key_}, {config_.identity});
    } catch (const sw::redis::Error& ex) {
      throw SharedStoreError(SharedStoreError::Kind::Unavailable, ex.what());
    }
  }

 private:
  sw::redis::Redis redis_;
  std::string key_;
  LeaderElectionConfig config_;
};

bool RenewQuietly(LeaderElector& elector) {
  try {
    return elector.Renew();
  } catch (const SharedStoreError& ex) {
    if (ex.kind() != SharedStoreError::Kind::Unavailable) {
      throw;
    }
    return false;
  }
}

}  // namespace

LeadershipOutcome RunWithLeaderElection(
    LeaderElector& elector, const LeaderElectionConfig& config,
    std::stop_token stop, const std::function<void(std::stop_token)>& lead) {
  while (true) {
    bool acquired = false;
    try {
      acquired = elector.TryAcquire();
    } catch (const SharedStoreError& ex) {
      if (ex.kind() != SharedStoreError::Kind::Unavailable) {
        throw;
      }
    }
    if (acquired) {
      break;
    }
    if (!SleepWithStop(stop, config.retry_period)) {
      return LeadershipOutcome::Stopped;
    }
  }

  std::jthread leader([&lead](std::stop_token token) { lead(token); });
  auto last_renewed = std::chrono::steady_clock::now();
  while (SleepWithStop(stop, config.retry_period)) {
    const auto now = std::chrono::steady_clock::now();
    if (RenewQuietly(elector)) {
      last_renewed = now;
      continue;
    }
    if (now - last_renewed >= config.renew_deadline) {
      leader.request_stop();
      leader.join();
      return LeadershipOutcome::Lost;
    }
  }

  leader.request_stop();
  leader.join();
  try {
    elector.Release();
  } catch (const SharedStoreError& ex) {
    if (ex.kind() != SharedStoreError::Kind::Unavailable) {
      throw;
    }
  }
  return LeadershipOutcome::Stopped;
}

std::shared_ptr<LeaderElector> CreateLeaderElector(
    const SharedStoreConfig& store_config, const LeaderElectionConfig& config) {
  switch (store_config.backend) {
    case SharedStoreBackend::InMemory:
      return std::make_shared<SingleProcessLeaderElector>();
    case SharedStoreBackend::Redis:
      if (store_config.redis_uri.empty()) {
        throw SharedStoreError(SharedStoreError::Kind::InvalidArgument,
                               "redis URI is required");
      }
      return std::make_shared<RedisLeaderElector>(store_config, config);
    default:
      throw SharedStoreError(SharedStoreError::Kind::InvalidArgument,
                             "unsupported backend");
  }
}

}  // namespace tollgate::shared
