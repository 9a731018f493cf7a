#include "policies.h"

#include <map>
#include <stdexcept>

#include <gtest/gtest.h>

#include "predicates.h"

namespace tollgate::approver {
namespace {

using certificates::v1::KEY_USAGE_CLIENT_AUTH;
using certificates::v1::KEY_USAGE_DIGITAL_SIGNATURE;
using certificates::v1::KEY_USAGE_KEY_ENCIPHERMENT;

class TableCloud final : public CloudProvider {
 public:
  std::string InstanceId(const std::string& node_name) override {
    return Lookup(instance_ids, node_name);
  }
  std::string InstanceGroup(const std::string& node_name) override {
    return Lookup(groups, node_name);
  }

  std::map<std::string, std::string> instance_ids;
  std::map<std::string, std::string> groups;

 private:
  static std::string Lookup(const std::map<std::string, std::string>& table,
                            const std::string& key) {
    const auto it = table.find(key);
    if (it == table.end()) {
      throw CloudProviderError(CloudProviderError::Kind::GroupNotFound, key);
    }
    return it->second;
  }
};

CertificateSigningRequest ClientRequest(const std::string& username,
                                        const std::string& group) {
  CertificateSigningRequest request;
  request.mutable_spec()->set_username(username);
  request.mutable_spec()->add_groups(group);
  request.mutable_spec()->add_usages(KEY_USAGE_KEY_ENCIPHERMENT);
  request.mutable_spec()->add_usages(KEY_USAGE_DIGITAL_SIGNATURE);
  request.mutable_spec()->add_usages(KEY_USAGE_CLIENT_AUTH);
  return request;
}

shared::ParsedCertificateRequest NodeClient(const std::string& node) {
  shared::ParsedCertificateRequest parsed;
  parsed.common_name = std::string(kNodeUserPrefix) + node;
  parsed.organizations = {kNodesGroup};
  return parsed;
}

TEST(PoliciesTest, InstanceIdentityChainsAreSelfThenNewNode) {
  const auto recognizers = BuildInstanceIdentityRecognizers(
      std::make_shared<TableCloud>(),
      shared::CreateNodeRegistry(shared::SharedStoreConfig{}), {"workers"});
  ASSERT_EQ(recognizers.size(), 2U);
  EXPECT_EQ(recognizers[0].name, "self-node-client-cert");
  EXPECT_EQ(recognizers[1].name, "new-node-client-cert");
  EXPECT_EQ(recognizers[0].predicates.front().name, "node-client-cert");
}

TEST(PoliciesTest, NodeRoleApprovesMasterFromMasterGroup) {
  auto cloud = std::make_shared<TableCloud>();
  cloud->groups["master-0"] = "masters-asg";
  cloud->groups["worker-0"] = "workers-asg";
  RecognizerSet set(BuildNodeRoleRecognizers(cloud, {"masters-asg"}, {"workers-asg"}));

  const auto* matched = set.Evaluate(
      ClientRequest("system:bootstrappers:id-1", kMasterRoleGroup),
      NodeClient("master-0"));
  ASSERT_NE(matched, nullptr);
  EXPECT_EQ(matched->name, "master-client-cert");
}

TEST(PoliciesTest, NodeRolePrefersSelfChainForRenewals) {
  auto cloud = std::make_shared<TableCloud>();
  cloud->groups["worker-0"] = "workers-asg";
  RecognizerSet set(BuildNodeRoleRecognizers(cloud, {"masters-asg"}, {"workers-asg"}));

  const auto* matched = set.Evaluate(
      ClientRequest("system:node:worker-0", kWorkerRoleGroup), NodeClient("worker-0"));
  ASSERT_NE(matched, nullptr);
  EXPECT_EQ(matched->name, "self-worker-client-cert");
}

TEST(PoliciesTest, NodeRoleRejectsWorkerClaimingMasterRole) {
  auto cloud = std::make_shared<TableCloud>();
  cloud->groups["worker-0"] = "workers-asg";
  RecognizerSet set(BuildNodeRoleRecognizers(cloud, {"masters-asg"}, {"workers-asg"}));

  std::vector<std::string> rejections;
  EXPECT_EQ(set.Evaluate(ClientRequest("system:bootstrappers:id-1", kMasterRoleGroup),
                         NodeClient("worker-0"), &rejections),
            nullptr);
  EXPECT_EQ(rejections.size(), 4U);
}

TEST(PoliciesTest, DiscoverRoleGroupsCollectsLabeledNodes) {
  TableCloud cloud;
  cloud.groups["master-0"] = "masters-a";
  cloud.groups["master-1"] = "masters-b";
  cloud.groups["worker-0"] = "workers";
  const auto nodes = shared::CreateNodeRegistry(shared::SharedStoreConfig{});
  nodes->Put(shared::NodeRecord{"master-0", true, {{kMasterRoleLabel, ""}}});
  nodes->Put(shared::NodeRecord{"master-1", true, {{kMasterRoleLabel, ""}}});
  nodes->Put(shared::NodeRecord{"master-2", true, {{kMasterRoleLabel, ""}}});
  nodes->Put(shared::NodeRecord{"worker-0", true, {{kWorkerRoleLabel, ""}}});

  const auto groups = DiscoverRoleGroups(cloud, *nodes, kMasterRoleLabel);
  EXPECT_EQ(groups, (std::set<std::string>{"masters-a", "masters-b"}));
}

TEST(PoliciesTest, DiscoverRoleGroupsFailsWhenNothingResolves) {
  TableCloud cloud;
  const auto nodes = shared::CreateNodeRegistry(shared::SharedStoreConfig{});
  nodes->Put(shared::NodeRecord{"worker-0", true, {{kWorkerRoleLabel, ""}}});
  EXPECT_THROW(DiscoverRoleGroups(cloud, *nodes, kWorkerRoleLabel),
               std::runtime_error);
}

}  // namespace
}  // namespace tollgate::approver
