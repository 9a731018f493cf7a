#pragma once

#include <memory>
#include <set>
#include <string>
#include <vector>

#include "cloud_provider.h"
#include "recognizer.h"
#include "tollgate/shared/node_registry.h"

namespace tollgate::approver {

inline constexpr const char* kNodesGroup = "system:nodes";
inline constexpr const char* kNodeUserPrefix = "system:node:";
inline constexpr const char* kBootstrappersGroup = "system:bootstrappers";
inline constexpr const char* kBootstrapperUserPrefix = "system:bootstrappers:";
inline constexpr const char* kMasterRoleGroup = "system:bootstrappers:master";
inline constexpr const char* kWorkerRoleGroup = "system:bootstrappers:worker";

// Key encipherment, digital signature, client auth.
const std::vector<certificates::v1::KeyUsage>& NodeClientUsages();

// Order and duplicates are ignored; any missing or extra usage fails.
bool HasExactUsages(const CertificateSigningRequest& request,
                    const std::vector<certificates::v1::KeyUsage>& expected);

// "system:node:ip-10-0-0-1" -> "ip-10-0-0-1".
std::string NodeNameFromCommonName(const std::string& common_name);

bool HasGroup(const CertificateSigningRequest& request, const std::string& group);

Predicate IsNodeClientCert();
Predicate IsSelfRequest();
Predicate IsRequestingRole(std::string group);
Predicate IsNewNodeRequest(std::shared_ptr<CloudProvider> cloud,
                           std::shared_ptr<shared::NodeRegistry> nodes);
Predicate IsExistingNodeRequest(std::shared_ptr<CloudProvider> cloud,
                                std::shared_ptr<shared::NodeRegistry> nodes);
Predicate IsInAllowedGroup(std::shared_ptr<CloudProvider> cloud,
                           std::set<std::string> allowed_groups);

}  // namespace tollgate::approver
