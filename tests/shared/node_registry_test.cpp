#include "tollgate/shared/node_registry.h"

#include <gtest/gtest.h>

namespace tollgate::shared {
namespace {

NodeRecord MakeNode(const std::string& name, bool ready) {
  NodeRecord record;
  record.name = name;
  record.ready = ready;
  record.labels["node-role.kubernetes.io/worker"] = "";
  return record;
}

TEST(NodeRegistryTest, PutGetAndRemove) {
  const auto registry = CreateNodeRegistry(SharedStoreConfig{});
  registry->Put(MakeNode("worker-1", true));

  const auto found = registry->Get("worker-1");
  ASSERT_TRUE(found.has_value());
  EXPECT_TRUE(found->ready);
  EXPECT_EQ(found->labels.count("node-role.kubernetes.io/worker"), 1U);

  registry->Remove("worker-1");
  EXPECT_FALSE(registry->Get("worker-1").has_value());
}

TEST(NodeRegistryTest, PutReplacesExistingRecord) {
  const auto registry = CreateNodeRegistry(SharedStoreConfig{});
  registry->Put(MakeNode("worker-1", true));
  registry->Put(MakeNode("worker-1", false));
  const auto found = registry->Get("worker-1");
  ASSERT_TRUE(found.has_value());
  EXPECT_FALSE(found->ready);
  EXPECT_EQ(registry->List().size(), 1U);
}

TEST(NodeRegistryTest, RejectsEmptyName) {
  const auto registry = CreateNodeRegistry(SharedStoreConfig{});
  EXPECT_THROW(registry->Put(MakeNode("", true)), SharedStoreError);
}

TEST(NodeRegistryTest, RedisBackendRequiresUri) {
  SharedStoreConfig config;
  config.backend = SharedStoreBackend::Redis;
  EXPECT_THROW(static_cast<void>(CreateNodeRegistry(config)), SharedStoreError);
}

}  // namespace
}  // namespace tollgate::shared
