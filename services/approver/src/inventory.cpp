#include "inventory.h"

#include <algorithm>
#include <set>
#include <sstream>
#include <stdexcept>

#include "group_cache.h"

namespace tollgate::approver {
namespace {

std::string Trim(const std::string& value) {
  const auto first = value.find_first_not_of(" \t\r\n");
  if (first == std::string::npos) {
    return {};
  }
  const auto last = value.find_last_not_of(" \t\r\n");
  return value.substr(first, last - first + 1);
}

bool IsScaleSetGroup(const std::string& group) {
  return group.rfind(kScaleSetGroupPrefix, 0) == 0;
}

std::string ScaleSetName(const std::string& group) {
  return group.substr(std::char_traits<char>::length(kScaleSetGroupPrefix));
}

std::string ScaleSetResourceId(const std::string& resource_group,
                               const std::string& name) {
  return "/resourceGroups/" + resource_group +
         "/providers/Microsoft.Compute/virtualMachineScaleSets/" + name;
}

const std::vector<std::string>* FilterValues(const std::vector<Ec2Filter>& filters,
                                             const std::string& name) {
  for (const auto& filter : filters) {
    if (filter.name == name) {
      return &filter.values;
    }
  }
  return nullptr;
}

bool Contains(const std::vector<std::string>& values, const std::string& value) {
  return std::find(values.begin(), values.end(), value) != values.end();
}

}  // namespace

std::vector<InventoryEntry> ParseInventory(const std::string& text) {
  std::vector<InventoryEntry> entries;
  std::set<std::string> seen;
  std::istringstream stream(text);
  std::string item;
  while (std::getline(stream, item, ',')) {
    item = Trim(item);
    if (item.empty()) {
      continue;
    }
    const auto eq = item.find('=');
    if (eq == std::string::npos || eq == 0 || eq + 1 == item.size()) {
      throw std::runtime_error("invalid inventory entry: " + item);
    }
    InventoryEntry entry;
    entry.node_name = Trim(item.substr(0, eq));
    std::string identity = Trim(item.substr(eq + 1));
    const auto at = identity.find('@');
    if (at != std::string::npos) {
      entry.group = Trim(identity.substr(at + 1));
      identity = Trim(identity.substr(0, at));
    }
    entry.instance_id = identity;
    if (entry.node_name.empty() || entry.instance_id.empty()) {
      throw std::runtime_error("invalid inventory entry: " + item);
    }
    if (IsScaleSetGroup(entry.group) && ScaleSetName(entry.group).empty()) {
      throw std::runtime_error("scale set name is empty: " + item);
    }
    if (!seen.insert(ToLowerAscii(entry.node_name)).second) {
      throw std::runtime_error("duplicate inventory node: " + entry.node_name);
    }
    entries.push_back(std::move(entry));
  }
  return entries;
}

InventoryCloudApi::InventoryCloudApi(std::vector<InventoryEntry> entries)
    : entries_(std::move(entries)) {}

DescribeInstancesPage InventoryCloudApi::DescribeInstances(
    const std::vector<Ec2Filter>& filters, const std::string& /*next_token*/) {
  DescribeInstancesPage page;
  const auto* dns_names = FilterValues(filters, "private-dns-name");
  const auto* states = FilterValues(filters, "instance-state-name");
  if (states && !Contains(*states, "running")) {
    return page;
  }
  for (const auto& entry : entries_) {
    if (dns_names && !Contains(*dns_names, entry.node_name)) {
      continue;
    }
    page.instances.push_back(
        Ec2Instance{entry.instance_id, entry.node_name, "running"});
  }
  return page;
}

DescribeAutoScalingInstancesPage InventoryCloudApi::DescribeAutoScalingInstances(
    const std::vector<std::string>& instance_ids,
    const std::string& /*next_token*/) {
  DescribeAutoScalingInstancesPage page;
  for (const auto& entry : entries_) {
    if (entry.group.empty() || !Contains(instance_ids, entry.instance_id)) {
      continue;
    }
    page.instances.push_back(AutoScalingInstance{entry.instance_id, entry.group});
  }
  return page;
}

std::optional<AzureVirtualMachine> InventoryCloudApi::GetVirtualMachine(
    const std::string& /*resource_group*/, const std::string& vm_name) {
  const std::string wanted = ToLowerAscii(vm_name);
  for (const auto& entry : entries_) {
    if (ToLowerAscii(entry.node_name) != wanted || IsScaleSetGroup(entry.group)) {
      continue;
    }
    return AzureVirtualMachine{entry.instance_id, entry.node_name, entry.group};
  }
  return std::nullopt;
}

ListScaleSetsPage InventoryCloudApi::ListScaleSets(
    const std::string& resource_group, const std::string& /*next_link*/) {
  ListScaleSetsPage page;
  std::set<std::string> names;
  for (const auto& entry : entries_) {
    if (IsScaleSetGroup(entry.group)) {
      names.insert(ScaleSetName(entry.group));
    }
  }
  for (const auto& name : names) {
    page.scale_sets.push_back(
        AzureScaleSet{ScaleSetResourceId(resource_group, name), name});
  }
  return page;
}

ListScaleSetVmsPage InventoryCloudApi::ListScaleSetVms(
    const std::string& /*resource_group*/, const std::string& scale_set_name,
    const std::string& /*next_link*/) {
  ListScaleSetVmsPage page;
  for (const auto& entry : entries_) {
    if (!IsScaleSetGroup(entry.group) ||
        ScaleSetName(entry.group) != scale_set_name) {
      continue;
    }
    page.vms.push_back(
        AzureScaleSetVm{entry.instance_id, entry.instance_id, entry.node_name});
  }
  return page;
}

}  // namespace tollgate::approver
