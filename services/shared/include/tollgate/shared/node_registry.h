#pragma once

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "tollgate/shared/store_error.h"

namespace tollgate::shared {

struct NodeRecord {
  std::string name;
  bool ready = false;
  std::map<std::string, std::string> labels;
};

// Cluster membership as seen by the approver. Get returns nullopt when the
// node is not registered and throws SharedStoreError on backend failures.
class NodeRegistry {
 public:
  virtual ~NodeRegistry() = default;

  virtual std::optional<NodeRecord> Get(const std::string& name) = 0;
  virtual std::vector<NodeRecord> List() = 0;
  virtual void Put(const NodeRecord& record) = 0;
  virtual void Remove(const std::string& name) = 0;
};

std::shared_ptr<NodeRegistry> CreateNodeRegistry(const SharedStoreConfig& config);

}  // namespace tollgate::shared
