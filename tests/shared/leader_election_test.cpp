#include "tollgate/shared/leader_election.h"

#include <atomic>
#include <chrono>
#include <stop_token>
#include <thread>

#include <gtest/gtest.h>

namespace tollgate::shared {
namespace {

using std::chrono::milliseconds;

class FakeElector final : public LeaderElector {
 public:
  bool TryAcquire() override {
    ++acquire_calls;
    return acquirable.load();
  }
  bool Renew() override {
    ++renew_calls;
    if (renew_unavailable.load()) {
      throw SharedStoreError(SharedStoreError::Kind::Unavailable, "redis down");
    }
    return renewable.load();
  }
  void Release() override { ++release_calls; }

  std::atomic<bool> acquirable{true};
  std::atomic<bool> renewable{true};
  std::atomic<bool> renew_unavailable{false};
  std::atomic<int> acquire_calls{0};
  std::atomic<int> renew_calls{0};
  std::atomic<int> release_calls{0};
};

LeaderElectionConfig FastConfig() {
  LeaderElectionConfig config;
  config.identity = "approver-0";
  config.lease_duration = milliseconds(200);
  config.renew_deadline = milliseconds(60);
  config.retry_period = milliseconds(10);
  return config;
}

TEST(LeaderElectionTest, RunsLeaderUntilStoppedThenReleases) {
  FakeElector elector;
  std::stop_source stop;
  std::atomic<bool> led{false};
  std::atomic<bool> leader_stopped{false};

  std::thread stopper([&] {
    while (!led.load()) {
      std::this_thread::sleep_for(milliseconds(5));
    }
    std::this_thread::sleep_for(milliseconds(40));
    stop.request_stop();
  });

  const auto outcome = RunWithLeaderElection(
      elector, FastConfig(), stop.get_token(), [&](std::stop_token token) {
        led = true;
        while (!token.stop_requested()) {
          std::this_thread::sleep_for(milliseconds(5));
        }
        leader_stopped = true;
      });
  stopper.join();

  EXPECT_EQ(outcome, LeadershipOutcome::Stopped);
  EXPECT_TRUE(leader_stopped.load());
  EXPECT_EQ(elector.release_calls.load(), 1);
  EXPECT_GT(elector.renew_calls.load(), 0);
}

TEST(LeaderElectionTest, ReportsLostWhenRenewalFailsPastDeadline) {
  FakeElector elector;
  elector.renewable = false;
  std::stop_source stop;
  std::atomic<bool> leader_stopped{false};

  const auto outcome = RunWithLeaderElection(
      elector, FastConfig(), stop.get_token(), [&](std::stop_token token) {
        while (!token.stop_requested()) {
          std::this_thread::sleep_for(milliseconds(5));
        }
        leader_stopped = true;
      });

  EXPECT_EQ(outcome, LeadershipOutcome::Lost);
  EXPECT_TRUE(leader_stopped.load());
  EXPECT_EQ(elector.release_calls.load(), 0);
}

TEST(LeaderElectionTest, UnavailableStoreDuringRenewCountsAsFailedRenewal) {
  FakeElector elector;
  elector.renew_unavailable = true;
  std::stop_source stop;

  const auto outcome = RunWithLeaderElection(
      elector, FastConfig(), stop.get_token(), [](std::stop_token token) {
        while (!token.stop_requested()) {
          std::this_thread::sleep_for(milliseconds(5));
        }
      });
  EXPECT_EQ(outcome, LeadershipOutcome::Lost);
}

TEST(LeaderElectionTest, StopWhileWaitingForLeaseNeverRunsLeader) {
  FakeElector elector;
  elector.acquirable = false;
  std::stop_source stop;
  std::atomic<bool> led{false};

  std::thread stopper([&] {
    std::this_thread::sleep_for(milliseconds(50));
    stop.request_stop();
  });
  const auto outcome = RunWithLeaderElection(
      elector, FastConfig(), stop.get_token(),
      [&](std::stop_token) { led = true; });
  stopper.join();

  EXPECT_EQ(outcome, LeadershipOutcome::Stopped);
  EXPECT_FALSE(led.load());
  EXPECT_GT(elector.acquire_calls.load(), 1);
}

TEST(LeaderElectionTest, InMemoryBackendAlwaysLeads) {
  SharedStoreConfig store_config;
  const auto elector = CreateLeaderElector(store_config, FastConfig());
  EXPECT_TRUE(elector->TryAcquire());
  EXPECT_TRUE(elector->Renew());
}

TEST(LeaderElectionTest, RedisBackendRequiresUri) {
  SharedStoreConfig store_config;
  store_config.backend = SharedStoreBackend::Redis;
  EXPECT_THROW(static_cast<void>(CreateLeaderElector(store_config, FastConfig())),
               SharedStoreError);
}

}  // namespace
}  // namespace tollgate::shared
