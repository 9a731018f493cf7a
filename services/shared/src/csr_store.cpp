#include "tollgate/shared/csr_store.h"

#include <algorithm>
#include <cstdint>
#include <iterator>
#include <map>
#include <mutex>
#include <unordered_map>
#include <unordered_set>

#include <sw/redis++/redis++.h>

namespace tollgate::shared {
namespace {

using certificates::v1::CONDITION_TYPE_APPROVED;
using certificates::v1::CONDITION_TYPE_DENIED;

void ValidateName(const std::string& name) {
  if (name.empty()) {
    throw SharedStoreError(SharedStoreError::Kind::InvalidArgument,
                           "signing request name is required");
  }
}

void ApplyConditions(const CertificateSigningRequest& source,
                     CertificateSigningRequest* target) {
  *target->mutable_status()->mutable_conditions() = source.status().conditions();
}

void ApplyCertificate(const CertificateSigningRequest& source,
                      CertificateSigningRequest* target) {
  target->mutable_status()->set_certificate(source.status().certificate());
}

class InMemoryCsrStore final : public CsrStore {
 public:
  CertificateSigningRequest Create(
      const CertificateSigningRequest& request) override {
    ValidateName(request.metadata().name());
    std::lock_guard<std::mutex> lock(mutex_);
    if (requests_.count(request.metadata().name()) != 0) {
      throw SharedStoreError(SharedStoreError::Kind::Conflict,
                             "signing request already exists");
    }
    CertificateSigningRequest stored = request;
    stored.mutable_metadata()->set_resource_version(NextVersionLocked());
    requests_.emplace(stored.metadata().name(), stored);
    return stored;
  }

  std::optional<CertificateSigningRequest> Get(const std::string& name) override {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = requests_.find(name);
    if (it == requests_.end()) {
      return std::nullopt;
    }
    return it->second;
  }

  std::vector<CertificateSigningRequest> List() override {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<CertificateSigningRequest> out;
    out.reserve(requests_.size());
    for (const auto& [name, request] : requests_) {
      out.push_back(request);
    }
    return out;
  }

  CertificateSigningRequest UpdateApproval(
      const CertificateSigningRequest& request) override {
    return UpdateLocked(request, ApplyConditions);
  }

  CertificateSigningRequest UpdateCertificate(
      const CertificateSigningRequest& request) override {
    return UpdateLocked(request, ApplyCertificate);
  }

  void Delete(const std::string& name) override {
    std::lock_guard<std::mutex> lock(mutex_);
    if (requests_.erase(name) == 0) {
      throw SharedStoreError(SharedStoreError::Kind::NotFound,
                             "signing request not found");
    }
  }

 private:
  template <typename Apply>
  CertificateSigningRequest UpdateLocked(const CertificateSigningRequest& request,
                                         Apply apply) {
    ValidateName(request.metadata().name());
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = requests_.find(request.metadata().name());
    if (it == requests_.end()) {
      throw SharedStoreError(SharedStoreError::Kind::NotFound,
                             "signing request not found");
    }
    if (it->second.metadata().resource_version() !=
        request.metadata().resource_version()) {
      throw SharedStoreError(SharedStoreError::Kind::Conflict,
                             "signing request was modified concurrently");
    }
    apply(request, &it->second);
    it->second.mutable_metadata()->set_resource_version(NextVersionLocked());
    return it->second;
  }

  std::string NextVersionLocked() { return std::to_string(++version_); }

  std::mutex mutex_;
  std::map<std::string, CertificateSigningRequest> requests_;
  uint64_t version_ = 0;
};

// KEYS[1] = request hash, KEYS[2] = name index
// ARGV[1] = name, ARGV[2] = payload
constexpr const char* kCreateScript = R"lua(
if redis.call('EXISTS', KEYS[1]) == 1 then
  return 0
end
redis.call('HSET', KEYS[1], 'version', 1, 'payload', ARGV[2])
redis.call('SADD', KEYS[2], ARGV[1])
return 1
)lua";

// KEYS[1] = request hash
// ARGV[1] = expected version, ARGV[2] = payload
constexpr const char* kCompareAndSwapScript = R"lua(
local version = redis.call('HGET', KEYS[1], 'version')
if not version then
  return -1
end
if version ~= ARGV[1] then
  return 0
end
local next_version = redis.call('HINCRBY', KEYS[1], 'version', 1)
redis.call('HSET', KEYS[1], 'payload', ARGV[2])
return next_version
)lua";

class RedisCsrStore final : public CsrStore {
 public:
  RedisCsrStore(std::string redis_uri, std::string key_prefix)
      : redis_(std::move(redis_uri)), key_prefix_(std::move(key_prefix)) {}

  CertificateSigningRequest Create(
      const CertificateSigningRequest& request) override {
    const auto& name = request.metadata().name();
    ValidateName(name);
    CertificateSigningRequest stored = request;
    stored.mutable_metadata()->clear_resource_version();
    try {
      const auto created = redis_.eval<long long>(
          kCreateScript, {RequestKey(name), IndexKey()},
          {name, stored.SerializeAsString()});
      if (created == 0) {
        throw SharedStoreError(SharedStoreError::Kind::Conflict,
                               "signing request already exists");
      }
    } catch (const sw::redis::Error& ex) {
      throw SharedStoreError(SharedStoreError::Kind::Unavailable, ex.what());
    }
    stored.mutable_metadata()->set_resource_version("1");
    return stored;
  }

  std::optional<CertificateSigningRequest> Get(const std::string& name) override {
    try {
      return Load(name);
    } catch (const sw::redis::Error& ex) {
      throw SharedStoreError(SharedStoreError::Kind::Unavailable, ex.what());
    }
  }

  std::vector<CertificateSigningRequest> List() override {
    try {
      std::unordered_set<std::string> names;
      redis_.smembers(IndexKey(), std::inserter(names, names.begin()));
      std::vector<CertificateSigningRequest> out;
      out.reserve(names.size());
      for (const auto& name : names) {
        auto request = Load(name);
        if (request.has_value()) {
          out.push_back(std::move(*request));
        }
      }
      std::sort(out.begin(), out.end(),
                [](const CertificateSigningRequest& a,
                   const CertificateSigningRequest& b) {
                  return a.metadata().name() < b.metadata().name();
                });
      return out;
    } catch (const sw::redis::Error& ex) {
      throw SharedStoreError(SharedStoreError::Kind::Unavailable, ex.what());
    }
  }

  CertificateSigningRequest UpdateApproval(
      const CertificateSigningRequest& request) override {
    return CompareAndSwap(request, ApplyConditions);
  }

  CertificateSigningRequest UpdateCertificate(
      const CertificateSigningRequest& request) override {
    return CompareAndSwap(request, ApplyCertificate);
  }

  void Delete(const std::string& name) override {
    try {
      const auto removed = redis_.del(RequestKey(name));
      redis_.srem(IndexKey(), name);
      if (removed == 0) {
        throw SharedStoreError(SharedStoreError::Kind::NotFound,
                               "signing request not found");
      }
    } catch (const sw::redis::Error& ex) {
      throw SharedStoreError(SharedStoreError::Kind::Unavailable, ex.what());
    }
  }

 private:
  std::string RequestKey(const std::string& name) const {
    return key_prefix_ + ":csr:" + name;
  }

  std::string IndexKey() const { return key_prefix_ + ":csrs"; }

  std::optional<CertificateSigningRequest> Load(const std::string& name) {
    std::unordered_map<std::string, std::string> fields;
    redis_.hgetall(RequestKey(name), std::inserter(fields, fields.begin()));
    if (fields.empty()) {
      return std::nullopt;
    }
    CertificateSigningRequest request;
    if (!request.ParseFromString(fields["payload"])) {
      throw SharedStoreError(SharedStoreError::Kind::Unavailable,
                             "stored signing request is corrupt: " + name);
    }
    request.mutable_metadata()->set_resource_version(fields["version"]);
    return request;
  }

  template <typename Apply>
  CertificateSigningRequest CompareAndSwap(
      const CertificateSigningRequest& request, Apply apply) {
    const auto& name = request.metadata().name();
    ValidateName(name);
    try {
      auto current = Load(name);
      if (!current.has_value()) {
        throw SharedStoreError(SharedStoreError::Kind::NotFound,
                               "signing request not found");
      }
      const std::string expected = request.metadata().resource_version();
      if (current->metadata().resource_version() != expected) {
        throw SharedStoreError(SharedStoreError::Kind::Conflict,
                               "signing request was modified concurrently");
      }

      apply(request, &*current);
      current->mutable_metadata()->clear_resource_version();
      const auto result = redis_.eval<long long>(
          kCompareAndSwapScript, {RequestKey(name)},
          {expected, current->SerializeAsString()});
      if (result == -1) {
        throw SharedStoreError(SharedStoreError::Kind::NotFound,
                               "signing request not found");
      }
      if (result == 0) {
        throw SharedStoreError(SharedStoreError::Kind::Conflict,
                               "signing request was modified concurrently");
      }
      current->mutable_metadata()->set_resource_version(std::to_string(result));
      return *current;
    } catch (const sw::redis::Error& ex) {
      throw SharedStoreError(SharedStoreError::Kind::Unavailable, ex.what());
    }
  }

  sw::redis::Redis redis_;
  std::string key_prefix_;
};

}  // namespace

bool IsTerminal(const CertificateSigningRequest& request) {
  if (!request.status().certificate().empty()) {
    return true;
  }
  for (const auto& condition : request.status().conditions()) {
    if (condition.type() == CONDITION_TYPE_APPROVED ||
        condition.type() == CONDITION_TYPE_DENIED) {
      return true;
    }
  }
  return false;
}

std::shared_ptr<CsrStore> CreateCsrStore(const SharedStoreConfig& config) {
  switch (config.backend) {
    case SharedStoreBackend::InMemory:
      return std::make_shared<InMemoryCsrStore>();
    case SharedStoreBackend::Redis:
      if (config.redis_uri.empty()) {
        throw SharedStoreError(SharedStoreError::Kind::InvalidArgument,
                               "redis URI is required");
      }
      return std::make_shared<RedisCsrStore>(config.redis_uri, config.key_prefix);
    default:
      throw SharedStoreError(SharedStoreError::Kind::InvalidArgument,
                             "unsupported backend");
  }
}

}  // namespace tollgate::shared
