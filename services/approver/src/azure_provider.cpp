#include "azure_provider.h"

#include <utility>

namespace tollgate::approver {

AvailabilitySetResolver::AvailabilitySetResolver(
    const AzureProviderConfig& config, std::shared_ptr<ComputeApi> compute,
    shared::Sleeper sleeper, shared::SteadyClock clock)
    : resource_group_(config.resource_group),
      backoff_(config.backoff),
      compute_(std::move(compute)),
      sleeper_(std::move(sleeper)),
      vms_(config.vm_cache_ttl, std::move(clock)) {}

std::optional<AzureVirtualMachine> AvailabilitySetResolver::Find(
    const std::string& node_name) {
  return vms_.GetOrCreate(node_name, [this](const std::string& key) {
    return CallCloudApi(backoff_, sleeper_, [&] {
      return compute_->GetVirtualMachine(resource_group_, key);
    });
  });
}

std::string AvailabilitySetResolver::InstanceId(const std::string& node_name) {
  const auto vm = Find(node_name);
  if (!vm.has_value()) {
    throw CloudProviderError(CloudProviderError::Kind::InstanceNotFound,
                             "virtual machine not found: " + node_name);
  }
  return vm->id;
}

std::string AvailabilitySetResolver::InstanceGroup(const std::string& node_name) {
  const auto vm = Find(node_name);
  if (!vm.has_value()) {
    throw CloudProviderError(CloudProviderError::Kind::InstanceNotFound,
                             "virtual machine not found: " + node_name);
  }
  if (vm->availability_set_id.empty()) {
    throw CloudProviderError(CloudProviderError::Kind::GroupNotFound,
                             "virtual machine has no availability set: " +
                                 node_name);
  }
  return vm->availability_set_id;
}

AzureCloudProvider::AzureCloudProvider(AzureProviderConfig config,
                                       std::shared_ptr<ComputeApi> compute,
                                       shared::Sleeper sleeper,
                                       shared::SteadyClock clock)
    : config_(std::move(config)),
      compute_(std::move(compute)),
      sleeper_(std::move(sleeper)),
      availability_sets_(config_, compute_, sleeper_, clock),
      scale_sets_([this] { return LoadScaleSets(); },
                  config_.negative_cache_ttl, clock) {
  if (!compute_) {
    throw std::invalid_argument("azure provider requires a compute client");
  }
  if (config_.resource_group.empty()) {
    throw std::invalid_argument("azure provider requires a resource group");
  }
}

std::string AzureCloudProvider::InstanceId(const std::string& node_name) {
  if (config_.vm_type == AzureVmType::Standard) {
    return availability_sets_.InstanceId(node_name);
  }
  const auto member = FindScaleSetMember(node_name);
  if (member.has_value()) {
    return member->instance_id;
  }
  return availability_sets_.InstanceId(node_name);
}

std::string AzureCloudProvider::InstanceGroup(const std::string& node_name) {
  if (config_.vm_type == AzureVmType::Standard) {
    return availability_sets_.InstanceGroup(node_name);
  }
  const auto member = FindScaleSetMember(node_name);
  if (member.has_value()) {
    return member->group_id;
  }
  return availability_sets_.InstanceGroup(node_name);
}

void AzureCloudProvider::StartBackgroundRefresh(
    GroupCache::ErrorHandler on_error) {
  if (config_.vm_type != AzureVmType::ScaleSet) {
    return;
  }
  scale_sets_.StartPeriodicRefresh(config_.scale_set_refresh_interval,
                                   std::move(on_error));
}

void AzureCloudProvider::StopBackgroundRefresh() {
  scale_sets_.StopPeriodicRefresh();
}

std::optional<GroupMember> AzureCloudProvider::FindScaleSetMember(
    const std::string& node_name) {
  auto member = scale_sets_.LookupOrRefresh(node_name);
  if (member.has_value() && member->ambiguous) {
    throw CloudProviderError(CloudProviderError::Kind::Ambiguous,
                             "node belongs to more than one scale set: " +
                                 node_name);
  }
  if (member.has_value() || scale_sets_.IsKnownAbsent(node_name)) {
    return member;
  }
  // Not a scale-set member. Remember it once the flat lookup also misses so
  // the next request for it skips the full scale-set listing.
  if (!availability_sets_.Find(node_name).has_value()) {
    scale_sets_.MarkAbsent(node_name);
  }
  return std::nullopt;
}

GroupSnapshot AzureCloudProvider::LoadScaleSets() {
  std::vector<AzureScaleSet> scale_sets;
  std::string next_link;
  do {
    auto page = CallCloudApi(config_.backoff, sleeper_, [&] {
      return compute_->ListScaleSets(config_.resource_group, next_link);
    });
    for (auto& scale_set : page.scale_sets) {
      scale_sets.push_back(std::move(scale_set));
    }
    next_link = std::move(page.next_link);
  } while (!next_link.empty());

  GroupSnapshot snapshot;
  for (const auto& scale_set : scale_sets) {
    next_link.clear();
    do {
      auto page = CallCloudApi(config_.backoff, sleeper_, [&] {
        return compute_->ListScaleSetVms(config_.resource_group, scale_set.name,
                                         next_link);
      });
      for (const auto& vm : page.vms) {
        if (vm.computer_name.empty()) {
          continue;
        }
        const std::string key = ToLowerAscii(vm.computer_name);
        const auto existing = snapshot.find(key);
        if (existing != snapshot.end()) {
          existing->second.ambiguous = true;
          continue;
        }
        snapshot.emplace(key, GroupMember{vm.id, key, scale_set.id,
                                          scale_set.name, false});
      }
      next_link = std::move(page.next_link);
    } while (!next_link.empty());
  }
  return snapshot;
}

}  // namespace tollgate::approver
