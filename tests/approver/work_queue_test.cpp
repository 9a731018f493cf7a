#include "work_queue.h"

#include <atomic>
#include <chrono>
#include <thread>

#include <gtest/gtest.h>

namespace tollgate::approver {
namespace {

using std::chrono::milliseconds;

class FakeClock {
 public:
  shared::SteadyClock AsClock() {
    return [this] { return std::chrono::steady_clock::time_point(now_.load()); };
  }
  void Advance(milliseconds delta) { now_ = now_.load() + delta; }

 private:
  std::atomic<std::chrono::steady_clock::duration> now_{
      std::chrono::steady_clock::duration::zero()};
};

bool WaitForLen(RateLimitingQueue& queue, size_t want) {
  const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
  while (std::chrono::steady_clock::now() < deadline) {
    if (queue.Len() == want) {
      return true;
    }
    std::this_thread::sleep_for(milliseconds(5));
  }
  return false;
}

TEST(WorkQueueTest, DeduplicatesQueuedKeys) {
  RateLimitingQueue queue;
  queue.Add("csr-1");
  queue.Add("csr-1");
  queue.Add("csr-2");
  EXPECT_EQ(queue.Len(), 2U);
}

TEST(WorkQueueTest, KeyAddedWhileProcessingIsRequeuedOnDone) {
  RateLimitingQueue queue;
  queue.Add("csr-1");
  const auto key = queue.Get();
  ASSERT_TRUE(key.has_value());

  queue.Add("csr-1");
  EXPECT_EQ(queue.Len(), 0U);
  queue.Done(*key);
  EXPECT_EQ(queue.Len(), 1U);
}

TEST(WorkQueueTest, GetReturnsNulloptAfterShutDown) {
  RateLimitingQueue queue;
  std::thread consumer([&queue] { EXPECT_FALSE(queue.Get().has_value()); });
  std::this_thread::sleep_for(milliseconds(20));
  queue.ShutDown();
  consumer.join();
  EXPECT_TRUE(queue.ShuttingDown());

  queue.Add("late");
  EXPECT_EQ(queue.Len(), 0U);
}

TEST(WorkQueueTest, FailureDelayDoublesAndResetsOnForget) {
  WorkQueueOptions options;
  options.base_delay = milliseconds(5);
  options.max_delay = milliseconds(1000);
  RateLimitingQueue queue(options);

  EXPECT_EQ(queue.When("csr-1"), milliseconds(5));
  EXPECT_EQ(queue.When("csr-1"), milliseconds(10));
  EXPECT_EQ(queue.When("csr-1"), milliseconds(20));
  EXPECT_EQ(queue.NumRequeues("csr-1"), 3U);

  queue.Forget("csr-1");
  EXPECT_EQ(queue.NumRequeues("csr-1"), 0U);
  EXPECT_EQ(queue.When("csr-1"), milliseconds(5));
}

TEST(WorkQueueTest, FailureDelayIsCapped) {
  WorkQueueOptions options;
  options.base_delay = milliseconds(5);
  options.max_delay = milliseconds(30);
  RateLimitingQueue queue(options);
  for (int i = 0; i < 10; ++i) {
    queue.When("csr-1");
  }
  EXPECT_EQ(queue.When("csr-1"), milliseconds(30));
}

TEST(WorkQueueTest, TokenBucketDelaysOnceBurstIsSpent) {
  FakeClock clock;
  WorkQueueOptions options;
  options.base_delay = milliseconds(1);
  options.qps = 10.0;
  options.burst = 2;
  RateLimitingQueue queue(options, clock.AsClock());

  EXPECT_EQ(queue.When("a"), milliseconds(1));
  EXPECT_EQ(queue.When("b"), milliseconds(1));
  EXPECT_EQ(queue.When("c"), milliseconds(100));

  clock.Advance(std::chrono::seconds(1));
  EXPECT_EQ(queue.When("d"), milliseconds(1));
}

TEST(WorkQueueTest, AddAfterReleasesKeyOnceDelayElapses) {
  FakeClock clock;
  RateLimitingQueue queue(WorkQueueOptions{}, clock.AsClock());
  queue.AddAfter("csr-1", milliseconds(500));
  std::this_thread::sleep_for(milliseconds(60));
  EXPECT_EQ(queue.Len(), 0U);

  clock.Advance(milliseconds(500));
  EXPECT_TRUE(WaitForLen(queue, 1));
}

TEST(WorkQueueTest, AddRateLimitedEventuallyQueuesKey) {
  WorkQueueOptions options;
  options.base_delay = milliseconds(1);
  RateLimitingQueue queue(options);
  queue.AddRateLimited("csr-1");
  EXPECT_TRUE(WaitForLen(queue, 1));
  EXPECT_EQ(queue.NumRequeues("csr-1"), 1U);
}

TEST(WorkQueueTest, RejectsNonPositiveRate) {
  WorkQueueOptions options;
  options.qps = 0.0;
  EXPECT_THROW(RateLimitingQueue queue(options), std::invalid_argument);
}

}  // namespace
}  // namespace tollgate::approver
