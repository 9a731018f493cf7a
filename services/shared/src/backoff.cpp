#include "tollgate/shared/backoff.h"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <random>
#include <thread>

namespace tollgate::shared {

Sleeper DefaultSleeper() {
  return [](std::chrono::milliseconds wait) {
    if (wait.count() > 0) {
      std::this_thread::sleep_for(wait);
    }
  };
}

double RandomUnit() {
  thread_local std::mt19937_64 generator(std::random_device{}());
  thread_local std::uniform_real_distribution<double> distribution(0.0, 1.0);
  return distribution(generator);
}

std::chrono::milliseconds ComputeBackoffDelay(const BackoffPolicy& policy,
                                              int retry,
                                              double jitter_sample) {
  if (retry < 1) {
    retry = 1;
  }
  const double factor = policy.factor < 1.0 ? 1.0 : policy.factor;
  const auto capped_retry = std::min(retry - 1, 64);

  double base = static_cast<double>(std::max<std::int64_t>(
      policy.duration.count(), 0));
  for (int i = 0; i < capped_retry; ++i) {
    base *= factor;
    if (policy.cap.count() > 0 && base >= static_cast<double>(policy.cap.count())) {
      base = static_cast<double>(policy.cap.count());
      break;
    }
  }

  const double jitter = std::max(policy.jitter, 0.0);
  const double sample = std::clamp(jitter_sample, 0.0, 1.0);
  double delay = base + base * jitter * sample;
  if (policy.cap.count() > 0) {
    delay = std::min(delay, static_cast<double>(policy.cap.count()));
  }
  return std::chrono::milliseconds(static_cast<std::int64_t>(std::llround(delay)));
}

}  // namespace tollgate::shared
