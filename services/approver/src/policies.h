#pragma once

#include <memory>
#include <set>
#include <string>
#include <vector>

#include "cloud_provider.h"
#include "recognizer.h"
#include "tollgate/shared/node_registry.h"

namespace tollgate::approver {

inline constexpr const char* kMasterRoleLabel = "node-role.kubernetes.io/master";
inline constexpr const char* kWorkerRoleLabel = "node-role.kubernetes.io/node";

enum class PolicyMode {
  // Bootstrap identity must match the cloud instance backing the node.
  InstanceIdentity,
  // Bootstrap role group must match the node's instance group allow list.
  NodeRole,
};

std::vector<Recognizer> BuildInstanceIdentityRecognizers(
    std::shared_ptr<CloudProvider> cloud,
    std::shared_ptr<shared::NodeRegistry> nodes,
    std::set<std::string> allowed_groups);

std::vector<Recognizer> BuildNodeRoleRecognizers(
    std::shared_ptr<CloudProvider> cloud, std::set<std::string> master_groups,
    std::set<std::string> worker_groups);

// Instance groups of every registered node carrying `role_label`. Throws
// std::runtime_error when no such node resolves to a group.
std::set<std::string> DiscoverRoleGroups(CloudProvider& cloud,
                                         shared::NodeRegistry& nodes,
                                         const std::string& role_label);

}  // namespace tollgate::approver
