#include "config.h"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <limits>
#include <sstream>
#include <stdexcept>

#include <unistd.h>

#include "cloud_provider.h"

namespace tollgate::approver {
namespace {

std::string GetEnvOrEmpty(const char* name) {
  const char* value = std::getenv(name);
  return value ? std::string(value) : std::string();
}

bool GetEnvOrDefaultBool(const char* name, bool fallback) {
  const char* value = std::getenv(name);
  if (!value || value[0] == '\0') {
    return fallback;
  }
  const std::string normalized = ToLowerAscii(value);
  if (normalized == "1" || normalized == "true" || normalized == "yes") {
    return true;
  }
  if (normalized == "0" || normalized == "false" || normalized == "no") {
    return false;
  }
  return fallback;
}

size_t ParseCount(const char* name, const char* value, bool allow_zero) {
  errno = 0;
  char* end = nullptr;
  const unsigned long long parsed = std::strtoull(value, &end, 10);
  if (errno != 0 || end == value || (end && *end != '\0') ||
      (parsed == 0 && !allow_zero) ||
      parsed > std::numeric_limits<size_t>::max() || value[0] == '-') {
    throw std::runtime_error(std::string(name) +
                             (allow_zero ? " must be a non-negative integer"
                                         : " must be a positive integer"));
  }
  return static_cast<size_t>(parsed);
}

size_t GetEnvOrDefaultSize(const char* name, size_t fallback) {
  const char* value = std::getenv(name);
  if (!value || value[0] == '\0') {
    return fallback;
  }
  return ParseCount(name, value, false);
}

size_t GetEnvOrDefaultCount(const char* name, size_t fallback) {
  const char* value = std::getenv(name);
  if (!value || value[0] == '\0') {
    return fallback;
  }
  return ParseCount(name, value, true);
}

std::string Trim(const std::string& value) {
  const auto first = value.find_first_not_of(" \t\r\n");
  if (first == std::string::npos) {
    return {};
  }
  const auto last = value.find_last_not_of(" \t\r\n");
  return value.substr(first, last - first + 1);
}

shared::SharedStoreBackend ParseStoreBackend(const std::string& value) {
  if (value.empty() || value == "memory" || value == "in-memory") {
    return shared::SharedStoreBackend::InMemory;
  }
  if (value == "redis") {
    return shared::SharedStoreBackend::Redis;
  }
  throw std::runtime_error(
      "TOLLGATE_STORE_BACKEND must be one of: memory, in-memory, redis");
}

PolicyMode ParsePolicyMode(const std::string& value) {
  if (value.empty() || value == "instance-identity") {
    return PolicyMode::InstanceIdentity;
  }
  if (value == "node-role") {
    return PolicyMode::NodeRole;
  }
  throw std::runtime_error(
      "TOLLGATE_APPROVER_POLICY must be one of: instance-identity, node-role");
}

CloudProviderKind ParseCloudProvider(const std::string& value) {
  if (value.empty() || value == "aws") {
    return CloudProviderKind::Aws;
  }
  if (value == "azure") {
    return CloudProviderKind::Azure;
  }
  throw std::runtime_error("TOLLGATE_CLOUD_PROVIDER must be one of: aws, azure");
}

AzureVmType ParseVmType(const std::string& value) {
  if (value.empty() || value == "vmss") {
    return AzureVmType::ScaleSet;
  }
  if (value == "standard") {
    return AzureVmType::Standard;
  }
  throw std::runtime_error("TOLLGATE_AZURE_VM_TYPE must be one of: vmss, standard");
}

std::string DefaultIdentity() {
  char host[256] = {};
  if (gethostname(host, sizeof(host) - 1) != 0 || host[0] == '\0') {
    throw std::runtime_error(
        "TOLLGATE_LEADER_ELECTION_IDENTITY is required when the hostname is unavailable");
  }
  return host;
}

}  // namespace

std::set<std::string> ParseList(const std::string& value) {
  std::set<std::string> out;
  std::stringstream stream(value);
  std::string item;
  while (std::getline(stream, item, ',')) {
    item = Trim(item);
    if (!item.empty()) {
      out.insert(item);
    }
  }
  return out;
}

std::vector<shared::NodeRecord> ParseStaticNodes(const std::string& value) {
  std::vector<shared::NodeRecord> nodes;
  for (const auto& item : ParseList(value)) {
    shared::NodeRecord node;
    node.ready = true;
    const auto eq = item.find('=');
    node.name = Trim(item.substr(0, eq));
    if (node.name.empty()) {
      throw std::runtime_error("TOLLGATE_STATIC_NODES entry has an empty name");
    }
    if (eq != std::string::npos) {
      const std::string role = Trim(item.substr(eq + 1));
      if (role == "master") {
        node.labels[kMasterRoleLabel] = "";
      } else if (role == "worker") {
        node.labels[kWorkerRoleLabel] = "";
      } else {
        throw std::runtime_error("TOLLGATE_STATIC_NODES role must be master or worker: " +
                                 item);
      }
    }
    nodes.push_back(std::move(node));
  }
  return nodes;
}

ApproverConfig LoadConfig() {
  ApproverConfig config;
  config.workers = GetEnvOrDefaultSize("TOLLGATE_APPROVER_WORKERS", config.workers);
  config.policy = ParsePolicyMode(GetEnvOrEmpty("TOLLGATE_APPROVER_POLICY"));
  config.allowed_groups = ParseList(GetEnvOrEmpty("TOLLGATE_ALLOWED_GROUPS"));
  config.master_groups = ParseList(GetEnvOrEmpty("TOLLGATE_MASTER_GROUPS"));
  config.worker_groups = ParseList(GetEnvOrEmpty("TOLLGATE_WORKER_GROUPS"));
  config.resync_seconds =
      GetEnvOrDefaultSize("TOLLGATE_RESYNC_SECONDS", config.resync_seconds);
  config.max_invalid_retries = GetEnvOrDefaultCount(
      "TOLLGATE_MAX_INVALID_RETRIES", config.max_invalid_retries);

  config.store.backend = ParseStoreBackend(GetEnvOrEmpty("TOLLGATE_STORE_BACKEND"));
  config.store.redis_uri = GetEnvOrEmpty("TOLLGATE_STORE_URI");
  const std::string key_prefix = GetEnvOrEmpty("TOLLGATE_STORE_KEY_PREFIX");
  if (!key_prefix.empty()) {
    config.store.key_prefix = key_prefix;
  }

  config.cloud_provider = ParseCloudProvider(GetEnvOrEmpty("TOLLGATE_CLOUD_PROVIDER"));
  config.static_inventory = GetEnvOrEmpty("TOLLGATE_STATIC_INVENTORY");
  config.static_nodes = ParseStaticNodes(GetEnvOrEmpty("TOLLGATE_STATIC_NODES"));
  config.region = GetEnvOrEmpty("TOLLGATE_REGION");
  const std::string zone = GetEnvOrEmpty("TOLLGATE_ZONE");
  if (config.region.empty() && !zone.empty()) {
    config.region = RegionFromZone(zone);
  }
  config.instance_cache_ttl_seconds = GetEnvOrDefaultSize(
      "TOLLGATE_INSTANCE_CACHE_TTL_SECONDS", config.instance_cache_ttl_seconds);

  config.azure_resource_group = GetEnvOrEmpty("TOLLGATE_AZURE_RESOURCE_GROUP");
  config.azure_vm_type = ParseVmType(GetEnvOrEmpty("TOLLGATE_AZURE_VM_TYPE"));
  config.azure_backoff_enabled =
      GetEnvOrDefaultBool("TOLLGATE_AZURE_BACKOFF", config.azure_backoff_enabled);
  config.azure_backoff_steps = GetEnvOrDefaultSize(
      "TOLLGATE_AZURE_BACKOFF_STEPS", config.azure_backoff_steps);
  config.azure_backoff_duration_seconds = GetEnvOrDefaultSize(
      "TOLLGATE_AZURE_BACKOFF_DURATION_SECONDS",
      config.azure_backoff_duration_seconds);
  config.azure_scale_set_refresh_seconds = GetEnvOrDefaultSize(
      "TOLLGATE_AZURE_SCALE_SET_REFRESH_SECONDS",
      config.azure_scale_set_refresh_seconds);
  config.azure_negative_cache_ttl_seconds = GetEnvOrDefaultCount(
      "TOLLGATE_AZURE_NEGATIVE_CACHE_TTL_SECONDS",
      config.azure_negative_cache_ttl_seconds);

  config.leader_election_enabled =
      GetEnvOrDefaultBool("TOLLGATE_LEADER_ELECTION", false);
  const std::string lease_name = GetEnvOrEmpty("TOLLGATE_LEADER_ELECTION_LEASE");
  if (!lease_name.empty()) {
    config.leader_election.lease_name = lease_name;
  }
  config.leader_election.lease_duration = std::chrono::seconds(GetEnvOrDefaultSize(
      "TOLLGATE_LEADER_ELECTION_LEASE_SECONDS", 90));
  config.leader_election.renew_deadline = std::chrono::seconds(GetEnvOrDefaultSize(
      "TOLLGATE_LEADER_ELECTION_RENEW_DEADLINE_SECONDS", 60));
  config.leader_election.retry_period = std::chrono::seconds(GetEnvOrDefaultSize(
      "TOLLGATE_LEADER_ELECTION_RETRY_SECONDS", 30));

  if (config.store.backend == shared::SharedStoreBackend::Redis &&
      config.store.redis_uri.empty()) {
    throw std::runtime_error(
        "TOLLGATE_STORE_URI is required when TOLLGATE_STORE_BACKEND=redis");
  }
  if (config.static_inventory.empty()) {
    throw std::runtime_error("TOLLGATE_STATIC_INVENTORY is required");
  }
  if (config.cloud_provider == CloudProviderKind::Aws && config.region.empty()) {
    throw std::runtime_error(
        "TOLLGATE_REGION or TOLLGATE_ZONE is required when TOLLGATE_CLOUD_PROVIDER=aws");
  }
  if (config.cloud_provider == CloudProviderKind::Azure &&
      config.azure_resource_group.empty()) {
    throw std::runtime_error(
        "TOLLGATE_AZURE_RESOURCE_GROUP is required when TOLLGATE_CLOUD_PROVIDER=azure");
  }
  if (config.policy == PolicyMode::InstanceIdentity &&
      config.allowed_groups.empty()) {
    throw std::runtime_error(
        "TOLLGATE_ALLOWED_GROUPS is required when TOLLGATE_APPROVER_POLICY=instance-identity");
  }
  if (config.leader_election.renew_deadline >= config.leader_election.lease_duration) {
    throw std::runtime_error(
        "TOLLGATE_LEADER_ELECTION_RENEW_DEADLINE_SECONDS must be less than the lease duration");
  }
  if (config.leader_election.retry_period >= config.leader_election.renew_deadline) {
    throw std::runtime_error(
        "TOLLGATE_LEADER_ELECTION_RETRY_SECONDS must be less than the renew deadline");
  }
  if (config.leader_election_enabled) {
    config.leader_election.identity = GetEnvOrEmpty("TOLLGATE_LEADER_ELECTION_IDENTITY");
    if (config.leader_election.identity.empty()) {
      config.leader_election.identity = DefaultIdentity();
    }
  }

  return config;
}

}  // namespace tollgate::approver
