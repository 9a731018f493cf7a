#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "cloud_provider.h"
#include "group_cache.h"
#include "tollgate/shared/backoff.h"
#include "tollgate/shared/timed_cache.h"

namespace tollgate::approver {

struct AzureVirtualMachine {
  std::string id;
  std::string name;
  std::string availability_set_id;
};

struct AzureScaleSet {
  std::string id;
  std::string name;
};

struct AzureScaleSetVm {
  std::string id;
  std::string instance_id;
  std::string computer_name;
};

struct ListScaleSetsPage {
  std::vector<AzureScaleSet> scale_sets;
  std::string next_link;
};

struct ListScaleSetVmsPage {
  std::vector<AzureScaleSetVm> vms;
  std::string next_link;
};

// Implementations report API failures as CloudProviderError::Kind::Transient.
class ComputeApi {
 public:
  virtual ~ComputeApi() = default;

  // nullopt when the VM does not exist.
  virtual std::optional<AzureVirtualMachine> GetVirtualMachine(
      const std::string& resource_group, const std::string& vm_name) = 0;
  virtual ListScaleSetsPage ListScaleSets(const std::string& resource_group,
                                          const std::string& next_link) = 0;
  virtual ListScaleSetVmsPage ListScaleSetVms(const std::string& resource_group,
                                              const std::string& scale_set_name,
                                              const std::string& next_link) = 0;
};

enum class AzureVmType {
  Standard,
  ScaleSet,
};

struct AzureProviderConfig {
  std::string resource_group;
  AzureVmType vm_type = AzureVmType::ScaleSet;
  std::optional<shared::BackoffPolicy> backoff = shared::BackoffPolicy{};
  std::chrono::milliseconds vm_cache_ttl = std::chrono::seconds(15);
  std::chrono::milliseconds scale_set_refresh_interval = std::chrono::minutes(5);
  // Zero keeps confirmed-absent nodes for the life of the process.
  std::chrono::milliseconds negative_cache_ttl{0};
};

// Availability-set VMs, looked up one at a time behind a short TTL cache.
class AvailabilitySetResolver {
 public:
  AvailabilitySetResolver(const AzureProviderConfig& config,
                          std::shared_ptr<ComputeApi> compute,
                          shared::Sleeper sleeper, shared::SteadyClock clock);

  // nullopt when the VM does not exist.
  std::optional<AzureVirtualMachine> Find(const std::string& node_name);
  std::string InstanceId(const std::string& node_name);
  std::string InstanceGroup(const std::string& node_name);

 private:
  std::string resource_group_;
  std::optional<shared::BackoffPolicy> backoff_;
  std::shared_ptr<ComputeApi> compute_;
  shared::Sleeper sleeper_;
  shared::TimedCache<std::optional<AzureVirtualMachine>> vms_;
};

class AzureCloudProvider final : public CloudProvider {
 public:
  AzureCloudProvider(AzureProviderConfig config,
                     std::shared_ptr<ComputeApi> compute,
                     shared::Sleeper sleeper = shared::DefaultSleeper(),
                     shared::SteadyClock clock = shared::DefaultSteadyClock());

  std::string InstanceId(const std::string& node_name) override;
  std::string InstanceGroup(const std::string& node_name) override;

  // Starts the background scale-set refresher. No-op for standard VMs.
  void StartBackgroundRefresh(GroupCache::ErrorHandler on_error);
  void StopBackgroundRefresh();

 private:
  GroupSnapshot LoadScaleSets();
  std::optional<GroupMember> FindScaleSetMember(const std::string& node_name);

  AzureProviderConfig config_;
  std::shared_ptr<ComputeApi> compute_;
  shared::Sleeper sleeper_;
  AvailabilitySetResolver availability_sets_;
  GroupCache scale_sets_;
};

}  // namespace tollgate::approver
