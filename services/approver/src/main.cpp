#include <csignal>
#include <exception>
#include <iostream>
#include <memory>
#include <stop_token>
#include <thread>

#include <pthread.h>

#include "approver.h"
#include "aws_provider.h"
#include "azure_provider.h"
#include "config.h"
#include "controller.h"
#include "informer.h"
#include "inventory.h"
#include "log_utils.h"
#include "policies.h"
#include "tollgate/shared/csr_store.h"
#include "tollgate/shared/leader_election.h"
#include "tollgate/shared/metrics.h"
#include "tollgate/shared/node_registry.h"

namespace {

using namespace tollgate;

std::shared_ptr<approver::CloudProvider> BuildCloudProvider(
    const approver::ApproverConfig& config,
    std::shared_ptr<approver::InventoryCloudApi> inventory,
    std::shared_ptr<approver::AzureCloudProvider>* azure) {
  if (config.cloud_provider == approver::CloudProviderKind::Aws) {
    approver::AwsProviderConfig aws_config;
    aws_config.region = config.region;
    aws_config.instance_cache_ttl =
        std::chrono::seconds(config.instance_cache_ttl_seconds);
    return std::make_shared<approver::AwsCloudProvider>(aws_config, inventory,
                                                        inventory);
  }

  approver::AzureProviderConfig azure_config;
  azure_config.resource_group = config.azure_resource_group;
  azure_config.vm_type = config.azure_vm_type;
  if (config.azure_backoff_enabled) {
    shared::BackoffPolicy policy;
    policy.steps = static_cast<int>(config.azure_backoff_steps);
    policy.duration = std::chrono::seconds(config.azure_backoff_duration_seconds);
    azure_config.backoff = policy;
  } else {
    azure_config.backoff.reset();
  }
  azure_config.vm_cache_ttl = std::chrono::seconds(config.instance_cache_ttl_seconds);
  azure_config.scale_set_refresh_interval =
      std::chrono::seconds(config.azure_scale_set_refresh_seconds);
  azure_config.negative_cache_ttl =
      std::chrono::seconds(config.azure_negative_cache_ttl_seconds);
  *azure = std::make_shared<approver::AzureCloudProvider>(azure_config, inventory);
  return *azure;
}

std::vector<approver::Recognizer> BuildRecognizers(
    const approver::ApproverConfig& config,
    const std::shared_ptr<approver::CloudProvider>& cloud,
    const std::shared_ptr<shared::NodeRegistry>& nodes) {
  if (config.policy == approver::PolicyMode::InstanceIdentity) {
    return approver::BuildInstanceIdentityRecognizers(cloud, nodes,
                                                      config.allowed_groups);
  }
  auto master_groups = config.master_groups;
  if (master_groups.empty()) {
    master_groups = approver::DiscoverRoleGroups(*cloud, *nodes,
                                                 approver::kMasterRoleLabel);
  }
  auto worker_groups = config.worker_groups;
  if (worker_groups.empty()) {
    worker_groups = approver::DiscoverRoleGroups(*cloud, *nodes,
                                                 approver::kWorkerRoleLabel);
  }
  return approver::BuildNodeRoleRecognizers(cloud, master_groups, worker_groups);
}

}  // namespace

int main() {
  try {
    const auto config = approver::LoadConfig();

    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &signals, nullptr);

    auto store = shared::CreateCsrStore(config.store);
    auto nodes = shared::CreateNodeRegistry(config.store);
    for (const auto& node : config.static_nodes) {
      nodes->Put(node);
    }

    auto inventory = std::make_shared<approver::InventoryCloudApi>(
        approver::ParseInventory(config.static_inventory));
    std::shared_ptr<approver::AzureCloudProvider> azure;
    auto cloud = BuildCloudProvider(config, inventory, &azure);

    auto recognizers = std::make_shared<const approver::RecognizerSet>(
        BuildRecognizers(config, cloud, nodes));
    auto metrics = std::make_shared<shared::InMemoryMetrics>();
    auto engine = std::make_shared<approver::Approver>(store, recognizers, metrics);

    const auto on_error = [](const char* action) {
      return [action](const std::exception& ex) {
        approver::LogApproverEvent(action, "error", {}, ex.what());
      };
    };

    const auto lead = [&](std::stop_token stop_token) {
      auto queue = std::make_shared<approver::RateLimitingQueue>();
      approver::ControllerOptions options;
      options.workers = config.workers;
      options.max_invalid_retries = config.max_invalid_retries;
      approver::Controller controller(
          [engine](const std::string& name) { return engine->Sync(name); }, queue,
          options);
      approver::CsrInformer informer(
          store, std::chrono::seconds(config.resync_seconds),
          [&controller](const approver::CsrEvent& event) {
            controller.Enqueue(event.name);
          });

      if (azure) {
        azure->StartBackgroundRefresh(on_error("RefreshScaleSets"));
      }
      informer.Start(on_error("List"));
      controller.Run(stop_token);
      informer.Stop();
      if (azure) {
        azure->StopBackgroundRefresh();
      }
    };

    std::stop_source stop;
    std::thread([signals, stop]() mutable {
      int signal_number = 0;
      sigwait(&signals, &signal_number);
      stop.request_stop();
    }).detach();

    approver::LogApproverEvent("Startup", "ok",
                               config.policy == approver::PolicyMode::NodeRole
                                   ? "policy=node-role"
                                   : "policy=instance-identity");
    if (!config.leader_election_enabled) {
      lead(stop.get_token());
      approver::LogApproverEvent("Shutdown", "ok", shared::FormatCounters(*metrics));
      return 0;
    }

    auto elector = shared::CreateLeaderElector(config.store, config.leader_election);
    const auto outcome = shared::RunWithLeaderElection(
        *elector, config.leader_election, stop.get_token(), lead);
    approver::LogApproverEvent("Shutdown",
                               outcome == shared::LeadershipOutcome::Lost ? "lost" : "ok",
                               shared::FormatCounters(*metrics));
    if (outcome == shared::LeadershipOutcome::Lost) {
      return 1;
    }
  } catch (const std::exception& ex) {
    std::cerr << "Approver startup failed: " << ex.what() << "\n";
    return 1;
  }
  return 0;
}
