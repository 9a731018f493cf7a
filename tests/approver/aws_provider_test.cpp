#include "aws_provider.h"

#include <atomic>
#include <chrono>
#include <deque>
#include <map>
#include <mutex>

#include <gtest/gtest.h>

namespace tollgate::approver {
namespace {

using std::chrono::milliseconds;

class FakeEc2 final : public Ec2Api {
 public:
  DescribeInstancesPage DescribeInstances(const std::vector<Ec2Filter>& filters,
                                          const std::string& next_token) override {
    std::lock_guard<std::mutex> lock(mutex);
    ++calls;
    last_filters = filters;
    if (failures_remaining > 0) {
      --failures_remaining;
      throw CloudProviderError(CloudProviderError::Kind::Transient, "throttled");
    }
    const auto it = pages.find(next_token);
    if (it == pages.end()) {
      return {};
    }
    return it->second;
  }

  std::mutex mutex;
  std::map<std::string, DescribeInstancesPage> pages;
  std::vector<Ec2Filter> last_filters;
  int failures_remaining = 0;
  int calls = 0;
};

class FakeAutoScaling final : public AutoScalingApi {
 public:
  DescribeAutoScalingInstancesPage DescribeAutoScalingInstances(
      const std::vector<std::string>& instance_ids,
      const std::string& next_token) override {
    ++calls;
    last_ids = instance_ids;
    const auto it = pages.find(next_token);
    if (it == pages.end()) {
      return {};
    }
    return it->second;
  }

  std::map<std::string, DescribeAutoScalingInstancesPage> pages;
  std::vector<std::string> last_ids;
  int calls = 0;
};

class FakeClock {
 public:
  shared::SteadyClock AsClock() {
    return [this] { return std::chrono::steady_clock::time_point(now_); };
  }
  void Advance(milliseconds delta) { now_ += delta; }

 private:
  std::chrono::steady_clock::duration now_{};
};

class AwsProviderTest : public ::testing::Test {
 protected:
  AwsProviderTest()
      : ec2_(std::make_shared<FakeEc2>()),
        autoscaling_(std::make_shared<FakeAutoScaling>()) {}

  AwsCloudProvider MakeProvider(std::optional<shared::BackoffPolicy> backoff =
                                    std::nullopt) {
    AwsProviderConfig config;
    config.region = "us-west-1";
    config.backoff = backoff;
    return AwsCloudProvider(config, ec2_, autoscaling_,
                            [this](milliseconds wait) { sleeps_.push_back(wait); },
                            clock_.AsClock());
  }

  std::shared_ptr<FakeEc2> ec2_;
  std::shared_ptr<FakeAutoScaling> autoscaling_;
  std::vector<milliseconds> sleeps_;
  FakeClock clock_;
};

TEST_F(AwsProviderTest, InstanceIdFiltersOnPrivateDnsNameAndRunningState) {
  ec2_->pages[""] = {{{"i-123", "ip-10-0-0-1.ec2.internal", "running"}}, ""};
  auto provider = MakeProvider();

  EXPECT_EQ(provider.InstanceId("ip-10-0-0-1.ec2.internal"), "i-123");
  ASSERT_EQ(ec2_->last_filters.size(), 2U);
  EXPECT_EQ(ec2_->last_filters[0].name, "private-dns-name");
  EXPECT_EQ(ec2_->last_filters[0].values.front(), "ip-10-0-0-1.ec2.internal");
  EXPECT_EQ(ec2_->last_filters[1].name, "instance-state-name");
  EXPECT_EQ(ec2_->last_filters[1].values.front(), "running");
  EXPECT_EQ(provider.region(), "us-west-1");
}

TEST_F(AwsProviderTest, InstanceIdIsCachedForTtl) {
  ec2_->pages[""] = {{{"i-123", "node", "running"}}, ""};
  auto provider = MakeProvider();

  provider.InstanceId("node");
  clock_.Advance(std::chrono::seconds(10));
  provider.InstanceId("node");
  EXPECT_EQ(ec2_->calls, 1);

  clock_.Advance(std::chrono::seconds(6));
  provider.InstanceId("node");
  EXPECT_EQ(ec2_->calls, 2);
}

TEST_F(AwsProviderTest, FollowsPaginationAcrossPages) {
  ec2_->pages[""] = {{}, "page-2"};
  ec2_->pages["page-2"] = {{{"i-456", "node", "running"}}, ""};
  auto provider = MakeProvider();
  EXPECT_EQ(provider.InstanceId("node"), "i-456");
  EXPECT_EQ(ec2_->calls, 2);
}

TEST_F(AwsProviderTest, MissingInstanceIsNotFound) {
  auto provider = MakeProvider();
  try {
    provider.InstanceId("node");
    FAIL() << "expected CloudProviderError";
  } catch (const CloudProviderError& ex) {
    EXPECT_EQ(ex.kind(), CloudProviderError::Kind::InstanceNotFound);
  }
}

TEST_F(AwsProviderTest, DuplicateInstancesAreAmbiguous) {
  ec2_->pages[""] = {{{"i-1", "node", "running"}, {"i-2", "node", "running"}}, ""};
  auto provider = MakeProvider();
  try {
    provider.InstanceId("node");
    FAIL() << "expected CloudProviderError";
  } catch (const CloudProviderError& ex) {
    EXPECT_EQ(ex.kind(), CloudProviderError::Kind::Ambiguous);
  }
}

TEST_F(AwsProviderTest, TransientFailuresRetryWhenBackoffConfigured) {
  ec2_->pages[""] = {{{"i-123", "node", "running"}}, ""};
  ec2_->failures_remaining = 2;
  shared::BackoffPolicy policy;
  policy.steps = 4;
  auto provider = MakeProvider(policy);
  EXPECT_EQ(provider.InstanceId("node"), "i-123");
  EXPECT_EQ(ec2_->calls, 3);
  EXPECT_EQ(sleeps_.size(), 2U);
}

TEST_F(AwsProviderTest, TransientFailurePropagatesWithoutBackoff) {
  ec2_->failures_remaining = 1;
  auto provider = MakeProvider();
  EXPECT_THROW(provider.InstanceId("node"), CloudProviderError);
  EXPECT_EQ(ec2_->calls, 1);
}

TEST_F(AwsProviderTest, InstanceGroupResolvesAutoScalingGroup) {
  ec2_->pages[""] = {{{"i-123", "node", "running"}}, ""};
  autoscaling_->pages[""] = {{{"i-123", "nodes-us-west-1"}}, ""};
  auto provider = MakeProvider();
  EXPECT_EQ(provider.InstanceGroup("node"), "nodes-us-west-1");
  ASSERT_EQ(autoscaling_->last_ids.size(), 1U);
  EXPECT_EQ(autoscaling_->last_ids.front(), "i-123");
}

TEST_F(AwsProviderTest, GroupNotFoundEvictsCachedInstanceId) {
  ec2_->pages[""] = {{{"i-123", "node", "running"}}, ""};
  auto provider = MakeProvider();
  try {
    provider.InstanceGroup("node");
    FAIL() << "expected CloudProviderError";
  } catch (const CloudProviderError& ex) {
    EXPECT_EQ(ex.kind(), CloudProviderError::Kind::GroupNotFound);
  }
  provider.InstanceId("node");
  EXPECT_EQ(ec2_->calls, 2);
}

TEST_F(AwsProviderTest, MultipleGroupsAreAmbiguous) {
  ec2_->pages[""] = {{{"i-123", "node", "running"}}, ""};
  autoscaling_->pages[""] = {{{"i-123", "group-a"}}, "next"};
  autoscaling_->pages["next"] = {{{"i-123", "group-b"}}, ""};
  auto provider = MakeProvider();
  try {
    provider.InstanceGroup("node");
    FAIL() << "expected CloudProviderError";
  } catch (const CloudProviderError& ex) {
    EXPECT_EQ(ex.kind(), CloudProviderError::Kind::Ambiguous);
  }
}

TEST_F(AwsProviderTest, RequiresClients) {
  EXPECT_THROW(AwsCloudProvider(AwsProviderConfig{}, nullptr, autoscaling_),
               std::invalid_argument);
}

}  // namespace
}  // namespace tollgate::approver
