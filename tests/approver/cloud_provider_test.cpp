#include "cloud_provider.h"

#include <chrono>
#include <stdexcept>
#include <vector>

#include <gtest/gtest.h>

namespace tollgate::approver {
namespace {

TEST(CloudProviderTest, RegionFromZoneDropsTrailingLetter) {
  EXPECT_EQ(RegionFromZone("us-west-1a"), "us-west-1");
  EXPECT_EQ(RegionFromZone("eu-central-1b"), "eu-central-1");
  EXPECT_THROW(RegionFromZone(""), std::invalid_argument);
}

TEST(CloudProviderTest, OnlyTransientErrorsAreRetryable) {
  EXPECT_TRUE(IsTransient(
      CloudProviderError(CloudProviderError::Kind::Transient, "throttled")));
  EXPECT_FALSE(IsTransient(
      CloudProviderError(CloudProviderError::Kind::InstanceNotFound, "gone")));
  EXPECT_FALSE(IsTransient(
      CloudProviderError(CloudProviderError::Kind::Ambiguous, "two")));
  EXPECT_STREQ(CloudProviderErrorKindName(CloudProviderError::Kind::GroupNotFound),
               "group_not_found");
}

TEST(CloudProviderTest, CallCloudApiWithoutBackoffCallsOnce) {
  int calls = 0;
  EXPECT_THROW(CallCloudApi(std::nullopt, shared::DefaultSleeper(),
                            [&calls]() -> int {
                              ++calls;
                              throw CloudProviderError(
                                  CloudProviderError::Kind::Transient, "throttled");
                            }),
               CloudProviderError);
  EXPECT_EQ(calls, 1);
}

TEST(CloudProviderTest, CallCloudApiRetriesTransientFailures) {
  shared::BackoffPolicy policy;
  policy.steps = 3;
  std::vector<std::chrono::milliseconds> sleeps;
  int calls = 0;
  const int result = CallCloudApi(
      policy, [&sleeps](std::chrono::milliseconds wait) { sleeps.push_back(wait); },
      [&calls] {
        if (++calls < 3) {
          throw CloudProviderError(CloudProviderError::Kind::Transient, "throttled");
        }
        return 9;
      });
  EXPECT_EQ(result, 9);
  EXPECT_EQ(calls, 3);
  EXPECT_EQ(sleeps.size(), 2U);
}

TEST(CloudProviderTest, CallCloudApiDoesNotRetryNotFound) {
  shared::BackoffPolicy policy;
  policy.steps = 5;
  int calls = 0;
  EXPECT_THROW(CallCloudApi(policy, [](std::chrono::milliseconds) {},
                            [&calls]() -> int {
                              ++calls;
                              throw CloudProviderError(
                                  CloudProviderError::Kind::InstanceNotFound, "gone");
                            }),
               CloudProviderError);
  EXPECT_EQ(calls, 1);
}

}  // namespace
}  // namespace tollgate::approver
