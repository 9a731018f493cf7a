#pragma once

#include <string>
#include <vector>

#include "aws_provider.h"
#include "azure_provider.h"

namespace tollgate::approver {

inline constexpr const char* kScaleSetGroupPrefix = "vmss:";

struct InventoryEntry {
  std::string node_name;
  std::string instance_id;
  // Auto scaling group or availability set id; "vmss:<name>" marks a
  // scale-set member. Empty when the instance belongs to no group.
  std::string group;
};

// Parses "node=instance[@group],node=instance[@group],...".
std::vector<InventoryEntry> ParseInventory(const std::string& text);

// Serves the cloud API interfaces from a fixed inventory, for clusters whose
// instance layout is known up front.
class InventoryCloudApi final : public Ec2Api,
                                public AutoScalingApi,
                                public ComputeApi {
 public:
  explicit InventoryCloudApi(std::vector<InventoryEntry> entries);

  DescribeInstancesPage DescribeInstances(
      const std::vector<Ec2Filter>& filters,
      const std::string& next_token) override;

  DescribeAutoScalingInstancesPage DescribeAutoScalingInstances(
      const std::vector<std::string>& instance_ids,
      const std::string& next_token) override;

  std::optional<AzureVirtualMachine> GetVirtualMachine(
      const std::string& resource_group, const std::string& vm_name) override;
  ListScaleSetsPage ListScaleSets(const std::string& resource_group,
                                  const std::string& next_link) override;
  ListScaleSetVmsPage ListScaleSetVms(const std::string& resource_group,
                                      const std::string& scale_set_name,
                                      const std::string& next_link) override;

 private:
  std::vector<InventoryEntry> entries_;
};

}  // namespace tollgate::approver
