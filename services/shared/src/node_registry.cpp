#include "tollgate/shared/node_registry.h"

#include <algorithm>
#include <iterator>
#include <mutex>
#include <string_view>
#include <unordered_map>
#include <unordered_set>

#include <sw/redis++/redis++.h>

namespace tollgate::shared {
namespace {

constexpr std::string_view kLabelFieldPrefix = "label:";

void ValidateRecord(const NodeRecord& record) {
  if (record.name.empty()) {
    throw SharedStoreError(SharedStoreError::Kind::InvalidArgument,
                           "node name is required");
  }
}

class InMemoryNodeRegistry final : public NodeRegistry {
 public:
  std::optional<NodeRecord> Get(const std::string& name) override {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = nodes_.find(name);
    if (it == nodes_.end()) {
      return std::nullopt;
    }
    return it->second;
  }

  std::vector<NodeRecord> List() override {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<NodeRecord> out;
    out.reserve(nodes_.size());
    for (const auto& [name, record] : nodes_) {
      out.push_back(record);
    }
    return out;
  }

  void Put(const NodeRecord& record) override {
    ValidateRecord(record);
    std::lock_guard<std::mutex> lock(mutex_);
    nodes_[record.name] = record;
  }

  void Remove(const std::string& name) override {
    std::lock_guard<std::mutex> lock(mutex_);
    nodes_.erase(name);
  }

 private:
  std::mutex mutex_;
  std::map<std::string, NodeRecord> nodes_;
};

class RedisNodeRegistry final : public NodeRegistry {
 public:
  RedisNodeRegistry(std::string redis_uri, std::string key_prefix)
      : redis_(std::move(redis_uri)), key_prefix_(std::move(key_prefix)) {}

  std::optional<NodeRecord> Get(const std::string& name) override {
    try {
      return Load(name);
    } catch (const sw::redis::Error& ex) {
      throw SharedStoreError(SharedStoreError::Kind::Unavailable, ex.what());
    }
  }

  std::vector<NodeRecord> List() override {
    try {
      std::unordered_set<std::string> names;
      redis_.smembers(IndexKey(), std::inserter(names, names.begin()));
      std::vector<NodeRecord> out;
      for (const auto& name : names) {
        auto record = Load(name);
        if (record.has_value()) {
          out.push_back(std::move(*record));
        }
      }
      std::sort(out.begin(), out.end(),
                [](const NodeRecord& a, const NodeRecord& b) {
                  return a.name < b.name;
                });
      return out;
    } catch (const sw::redis::Error& ex) {
      throw SharedStoreError(SharedStoreError::Kind::Unavailable, ex.what());
    }
  }

  void Put(const NodeRecord& record) override {
    ValidateRecord(record);
    std::unordered_map<std::string, std::string> fields;
    fields.emplace("ready", record.ready ? "true" : "false");
    for (const auto& [key, value] : record.labels) {
      fields.emplace(std::string(kLabelFieldPrefix) + key, value);
    }
    try {
      auto tx = redis_.transaction();
      tx.del(NodeKey(record.name))
          .hset(NodeKey(record.name), fields.begin(), fields.end())
          .sadd(IndexKey(), record.name)
          .exec();
    } catch (const sw::redis::Error& ex) {
      throw SharedStoreError(SharedStoreError::Kind::Unavailable, ex.what());
    }
  }

  void Remove(const std::string& name) override {
    try {
      redis_.del(NodeKey(name));
      redis_.srem(IndexKey(), name);
    } catch (const sw::redis::Error& ex) {
      throw SharedStoreError(SharedStoreError::Kind::Unavailable, ex.what());
    }
  }

 private:
  std::string NodeKey(const std::string& name) const {
    return key_prefix_ + ":node:" + name;
  }

  std::string IndexKey() const { return key_prefix_ + ":nodes"; }

  std::optional<NodeRecord> Load(const std::string& name) {
    std::unordered_map<std::string, std::string> fields;
    redis_.hgetall(NodeKey(name), std::inserter(fields, fields.begin()));
    if (fields.empty()) {
      return std::nullopt;
    }
    NodeRecord record;
    record.name = name;
    for (const auto& [field, value] : fields) {
      if (field == "ready") {
        record.ready = value == "true";
      } else if (field.rfind(kLabelFieldPrefix, 0) == 0) {
        record.labels.emplace(field.substr(kLabelFieldPrefix.size()), value);
      }
    }
    return record;
  }

  sw::redis::Redis redis_;
  std::string key_prefix_;
};

}  // namespace

std::shared_ptr<NodeRegistry> CreateNodeRegistry(const SharedStoreConfig& config) {
  switch (config.backend) {
    case SharedStoreBackend::InMemory:
      return std::make_shared<InMemoryNodeRegistry>();
    case SharedStoreBackend::Redis:
      if (config.redis_uri.empty()) {
        throw SharedStoreError(SharedStoreError::Kind::InvalidArgument,
                               "redis URI is required");
      }
      return std::make_shared<RedisNodeRegistry>(config.redis_uri,
                                                 config.key_prefix);
    default:
      throw SharedStoreError(SharedStoreError::Kind::InvalidArgument,
                             "unsupported backend");
  }
}

}  // namespace tollgate::shared
