#include "policies.h"

#include <stdexcept>

#include "predicates.h"

namespace tollgate::approver {

std::vector<Recognizer> BuildInstanceIdentityRecognizers(
    std::shared_ptr<CloudProvider> cloud,
    std::shared_ptr<shared::NodeRegistry> nodes,
    std::set<std::string> allowed_groups) {
  std::vector<Recognizer> recognizers;
  recognizers.push_back(Recognizer{
      "self-node-client-cert",
      {
          {"node-client-cert", IsNodeClientCert()},
          {"self-request", IsSelfRequest()},
          {"existing-node", IsExistingNodeRequest(cloud, nodes)},
          {"allowed-group", IsInAllowedGroup(cloud, allowed_groups)},
      },
      "tollgate-approver approved self node client cert"});
  recognizers.push_back(Recognizer{
      "new-node-client-cert",
      {
          {"node-client-cert", IsNodeClientCert()},
          {"new-node", IsNewNodeRequest(cloud, nodes)},
          {"allowed-group", IsInAllowedGroup(cloud, allowed_groups)},
      },
      "tollgate-approver approved new node client cert"});
  return recognizers;
}

std::vector<Recognizer> BuildNodeRoleRecognizers(
    std::shared_ptr<CloudProvider> cloud, std::set<std::string> master_groups,
    std::set<std::string> worker_groups) {
  const auto self_chain = [](std::string name, std::string role,
                             Predicate allowed, std::string message) {
    return Recognizer{std::move(name),
                      {
                          {"node-client-cert", IsNodeClientCert()},
                          {"self-request", IsSelfRequest()},
                          {"role", IsRequestingRole(std::move(role))},
                          {"allowed-group", std::move(allowed)},
                      },
                      std::move(message)};
  };
  const auto client_chain = [](std::string name, std::string role,
                               Predicate allowed, std::string message) {
    return Recognizer{std::move(name),
                      {
                          {"node-client-cert", IsNodeClientCert()},
                          {"role", IsRequestingRole(std::move(role))},
                          {"allowed-group", std::move(allowed)},
                      },
                      std::move(message)};
  };

  std::vector<Recognizer> recognizers;
  recognizers.push_back(self_chain(
      "self-master-client-cert", kMasterRoleGroup,
      IsInAllowedGroup(cloud, master_groups),
      "tollgate-approver approved self client cert for master"));
  recognizers.push_back(self_chain(
      "self-worker-client-cert", kWorkerRoleGroup,
      IsInAllowedGroup(cloud, worker_groups),
      "tollgate-approver approved self client cert for worker"));
  recognizers.push_back(client_chain(
      "master-client-cert", kMasterRoleGroup,
      IsInAllowedGroup(cloud, master_groups),
      "tollgate-approver approved client cert for master"));
  recognizers.push_back(client_chain(
      "worker-client-cert", kWorkerRoleGroup,
      IsInAllowedGroup(cloud, worker_groups),
      "tollgate-approver approved client cert for worker"));
  return recognizers;
}

std::set<std::string> DiscoverRoleGroups(CloudProvider& cloud,
                                         shared::NodeRegistry& nodes,
                                         const std::string& role_label) {
  std::set<std::string> groups;
  for (const auto& node : nodes.List()) {
    if (node.labels.count(role_label) == 0) {
      continue;
    }
    try {
      groups.insert(cloud.InstanceGroup(node.name));
    } catch (const CloudProviderError& ex) {
      if (IsTransient(ex)) {
        throw;
      }
    }
  }
  if (groups.empty()) {
    throw std::runtime_error("no instance group found for nodes labeled " +
                             role_label);
  }
  return groups;
}

}  // namespace tollgate::approver
