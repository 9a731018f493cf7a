#pragma once

#include <chrono>
#include <functional>
#include <utility>

namespace tollgate::shared {

struct BackoffPolicy {
  int steps = 6;
  std::chrono::milliseconds duration = std::chrono::seconds(5);
  double factor = 1.5;
  double jitter = 1.0;
  // Zero disables the cap.
  std::chrono::milliseconds cap{0};
};

using Sleeper = std::function<void(std::chrono::milliseconds)>;

Sleeper DefaultSleeper();

double RandomUnit();

// Delay before retry number `retry` (1-based): duration * factor^(retry-1)
// plus up to jitter * that delay, scaled by `jitter_sample` in [0, 1].
std::chrono::milliseconds ComputeBackoffDelay(const BackoffPolicy& policy,
                                              int retry,
                                              double jitter_sample);

// Calls `fn` up to policy.steps times. Errors of type Error for which
// `should_retry` returns false are rethrown immediately; the last error is
// rethrown once steps are exhausted.
template <typename Error, typename Fn, typename ShouldRetry>
auto RetryWithBackoff(const BackoffPolicy& policy, Fn&& fn,
                      ShouldRetry&& should_retry,
                      const Sleeper& sleeper = DefaultSleeper())
    -> decltype(fn()) {
  const int steps = policy.steps < 1 ? 1 : policy.steps;
  for (int attempt = 1;; ++attempt) {
    try {
      return fn();
    } catch (const Error& ex) {
      if (attempt >= steps || !should_retry(ex)) {
        throw;
      }
    }
    sleeper(ComputeBackoffDelay(policy, attempt, RandomUnit()));
  }
}

}  // namespace tollgate::shared
