#include "cloud_provider.h"

namespace tollgate::approver {

CloudProviderError::CloudProviderError(Kind kind, const std::string& message)
    : std::runtime_error(message), kind_(kind) {}

CloudProviderError::Kind CloudProviderError::kind() const noexcept {
  return kind_;
}

const char* CloudProviderErrorKindName(CloudProviderError::Kind kind) {
  switch (kind) {
    case CloudProviderError::Kind::InstanceNotFound:
      return "instance_not_found";
    case CloudProviderError::Kind::GroupNotFound:
      return "group_not_found";
    case CloudProviderError::Kind::Ambiguous:
      return "ambiguous";
    case CloudProviderError::Kind::Transient:
      return "transient";
  }
  return "unknown";
}

bool IsTransient(const CloudProviderError& error) {
  return error.kind() == CloudProviderError::Kind::Transient;
}

std::string RegionFromZone(const std::string& zone) {
  if (zone.empty()) {
    throw std::invalid_argument("availability zone is empty");
  }
  return zone.substr(0, zone.size() - 1);
}

}  // namespace tollgate::approver
