#pragma once

#include <chrono>
#include <cstddef>
#include <deque>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>

#include <grpcpp/server_context.h>

#include "tollgate/shared/timed_cache.h"

namespace tollgate::signer {

class RateLimiter {
 public:
  virtual ~RateLimiter() = default;
  virtual bool Allow(std::string_view key) = 0;
};

struct PeerRateLimiterConfig {
  size_t max_requests_per_window = 60;
  size_t max_keys = 10000;
  std::chrono::seconds window = std::chrono::minutes(1);
};

// Admits at most max_requests_per_window calls per key within any trailing
// window. Once max_keys keys are tracked, the least recently seen one is
// forgotten.
class PeerRateLimiter final : public RateLimiter {
 public:
  explicit PeerRateLimiter(PeerRateLimiterConfig config = {},
                           shared::SteadyClock clock = shared::DefaultSteadyClock());

  bool Allow(std::string_view key) override;

 private:
  using TimePoint = std::chrono::steady_clock::time_point;

  struct History {
    std::deque<TimePoint> admitted;
    TimePoint last_seen{};
  };

  void EvictStalestLocked();

  std::mutex mutex_;
  std::unordered_map<std::string, History> histories_;
  PeerRateLimiterConfig config_;
  shared::SteadyClock clock_;
};

// Rate limit key for a call: the verified client certificate common name
// when mutual TLS supplied one, the transport peer address otherwise.
std::string ExtractPeerIdentity(const grpc::ServerContext* context);

}  // namespace tollgate::signer
