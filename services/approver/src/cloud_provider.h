#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

#include "tollgate/shared/backoff.h"

namespace tollgate::approver {

class CloudProviderError : public std::runtime_error {
 public:
  enum class Kind {
    InstanceNotFound,
    GroupNotFound,
    // More than one instance or group matched; never pick one.
    Ambiguous,
    // Network or API failure; the only kind worth retrying.
    Transient,
  };

  CloudProviderError(Kind kind, const std::string& message);

  Kind kind() const noexcept;

 private:
  Kind kind_;
};

const char* CloudProviderErrorKindName(CloudProviderError::Kind kind);

bool IsTransient(const CloudProviderError& error);

// Resolves cluster node names to cloud identities.
class CloudProvider {
 public:
  virtual ~CloudProvider() = default;

  virtual std::string InstanceId(const std::string& node_name) = 0;
  virtual std::string InstanceGroup(const std::string& node_name) = 0;
};

// Runs one cloud API call, retrying transient failures when a policy is
// configured.
template <typename Fn>
auto CallCloudApi(const std::optional<shared::BackoffPolicy>& backoff,
                  const shared::Sleeper& sleeper, Fn&& fn) -> decltype(fn()) {
  if (!backoff.has_value()) {
    return fn();
  }
  return shared::RetryWithBackoff<CloudProviderError>(
      *backoff, std::forward<Fn>(fn),
      [](const CloudProviderError& error) { return IsTransient(error); },
      sleeper);
}

// "us-west-1a" -> "us-west-1". Throws std::invalid_argument on empty input.
std::string RegionFromZone(const std::string& zone);

}  // namespace tollgate::approver
