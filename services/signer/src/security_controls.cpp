#include "security_controls.h"

#include <grpc/grpc_security_constants.h>
#include <grpcpp/security/auth_context.h>

namespace tollgate::signer {
namespace {

constexpr size_t kMaxPeerIdentityBytes = 256;

std::string Bounded(std::string value) {
  if (value.size() > kMaxPeerIdentityBytes) {
    value.resize(kMaxPeerIdentityBytes);
  }
  return value;
}

}  // namespace

PeerRateLimiter::PeerRateLimiter(PeerRateLimiterConfig config,
                                 shared::SteadyClock clock)
    : config_(std::move(config)), clock_(std::move(clock)) {}

void PeerRateLimiter::EvictStalestLocked() {
  auto stalest = histories_.end();
  for (auto it = histories_.begin(); it != histories_.end(); ++it) {
    if (stalest == histories_.end() || it->second.last_seen < stalest->second.last_seen) {
      stalest = it;
    }
  }
  if (stalest != histories_.end()) {
    histories_.erase(stalest);
  }
}

bool PeerRateLimiter::Allow(std::string_view key) {
  if (key.empty() || config_.max_requests_per_window == 0) {
    return false;
  }

  const auto now = clock_();
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = histories_.find(std::string(key));
  if (it == histories_.end()) {
    if (config_.max_keys > 0 && histories_.size() >= config_.max_keys) {
      EvictStalestLocked();
    }
    it = histories_.emplace(std::string(key), History{}).first;
  }

  auto& history = it->second;
  history.last_seen = now;
  while (!history.admitted.empty() && now - history.admitted.front() >= config_.window) {
    history.admitted.pop_front();
  }
  if (history.admitted.size() >= config_.max_requests_per_window) {
    return false;
  }
  history.admitted.push_back(now);
  return true;
}

std::string ExtractPeerIdentity(const grpc::ServerContext* context) {
  if (!context) {
    return "unknown";
  }
  const auto auth = context->auth_context();
  if (auth && auth->IsPeerAuthenticated()) {
    const auto names = auth->FindPropertyValues(GRPC_X509_CN_PROPERTY_NAME);
    if (!names.empty() && !names.front().empty()) {
      return Bounded("cn:" + std::string(names.front().data(), names.front().size()));
    }
  }
  const auto peer = context->peer();
  if (peer.empty()) {
    return "unknown";
  }
  return Bounded(peer);
}

}  // namespace tollgate::signer
