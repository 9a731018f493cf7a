#pragma once

#include <cstddef>
#include <set>
#include <string>
#include <vector>

#include "azure_provider.h"
#include "policies.h"
#include "tollgate/shared/leader_election.h"
#include "tollgate/shared/node_registry.h"
#include "tollgate/shared/store_error.h"

namespace tollgate::approver {

enum class CloudProviderKind {
  Aws,
  Azure,
};

struct ApproverConfig {
  size_t workers = 5;
  PolicyMode policy = PolicyMode::InstanceIdentity;
  std::set<std::string> allowed_groups;
  std::set<std::string> master_groups;
  std::set<std::string> worker_groups;
  size_t resync_seconds = 30;
  size_t max_invalid_retries = 5;

  shared::SharedStoreConfig store;

  CloudProviderKind cloud_provider = CloudProviderKind::Aws;
  std::string static_inventory;
  std::vector<shared::NodeRecord> static_nodes;
  std::string region;
  size_t instance_cache_ttl_seconds = 15;

  std::string azure_resource_group;
  AzureVmType azure_vm_type = AzureVmType::ScaleSet;
  bool azure_backoff_enabled = true;
  size_t azure_backoff_steps = 6;
  size_t azure_backoff_duration_seconds = 5;
  size_t azure_scale_set_refresh_seconds = 300;
  size_t azure_negative_cache_ttl_seconds = 0;

  bool leader_election_enabled = false;
  shared::LeaderElectionConfig leader_election;
};

ApproverConfig LoadConfig();

// Comma separated, whitespace trimmed, empty items dropped.
std::set<std::string> ParseList(const std::string& value);

// "name[=master|worker],..." describing ready nodes and their role label.
std::vector<shared::NodeRecord> ParseStaticNodes(const std::string& value);

}  // namespace tollgate::approver
