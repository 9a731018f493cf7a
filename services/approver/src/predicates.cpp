#include "predicates.h"

#include <algorithm>

namespace tollgate::approver {
namespace {

using certificates::v1::KeyUsage;

void SetReason(std::string* reason, std::string value) {
  if (reason) {
    *reason = std::move(value);
  }
}

bool StartsWith(const std::string& value, const std::string& prefix) {
  return value.rfind(prefix, 0) == 0;
}

// Resolution failures other than transient ones reject the request.
bool ResolveOrReject(const std::function<std::string()>& resolve,
                     std::string* out, std::string* reason) {
  try {
    *out = resolve();
    return true;
  } catch (const CloudProviderError& ex) {
    if (IsTransient(ex)) {
      throw;
    }
    SetReason(reason, std::string(CloudProviderErrorKindName(ex.kind())) + ": " +
                          ex.what());
    return false;
  }
}

}  // namespace

const std::vector<KeyUsage>& NodeClientUsages() {
  static const std::vector<KeyUsage> usages = {
      certificates::v1::KEY_USAGE_KEY_ENCIPHERMENT,
      certificates::v1::KEY_USAGE_DIGITAL_SIGNATURE,
      certificates::v1::KEY_USAGE_CLIENT_AUTH,
  };
  return usages;
}

bool HasExactUsages(const CertificateSigningRequest& request,
                    const std::vector<KeyUsage>& expected) {
  std::set<int> requested;
  for (const int usage : request.spec().usages()) {
    requested.insert(usage);
  }
  std::set<int> wanted;
  for (const auto usage : expected) {
    wanted.insert(static_cast<int>(usage));
  }
  return requested == wanted;
}

std::string NodeNameFromCommonName(const std::string& common_name) {
  if (!StartsWith(common_name, kNodeUserPrefix)) {
    return common_name;
  }
  return common_name.substr(std::char_traits<char>::length(kNodeUserPrefix));
}

bool HasGroup(const CertificateSigningRequest& request, const std::string& group) {
  const auto& groups = request.spec().groups();
  return std::find(groups.begin(), groups.end(), group) != groups.end();
}

Predicate IsNodeClientCert() {
  return [](const CertificateSigningRequest& request,
            const shared::ParsedCertificateRequest& parsed,
            std::string* reason) {
    if (parsed.organizations != std::vector<std::string>{kNodesGroup}) {
      SetReason(reason, "organization must be exactly system:nodes");
      return false;
    }
    if (!parsed.dns_names.empty() || !parsed.email_addresses.empty() ||
        !parsed.ip_addresses.empty()) {
      SetReason(reason, "client certificates must not carry subject alternative names");
      return false;
    }
    if (!HasExactUsages(request, NodeClientUsages())) {
      SetReason(reason, "usages must be exactly key encipherment, digital signature, client auth");
      return false;
    }
    if (!StartsWith(parsed.common_name, kNodeUserPrefix)) {
      SetReason(reason, "common name must start with system:node:");
      return false;
    }
    return true;
  };
}

Predicate IsSelfRequest() {
  return [](const CertificateSigningRequest& request,
            const shared::ParsedCertificateRequest& parsed,
            std::string* reason) {
    if (request.spec().username() != parsed.common_name) {
      SetReason(reason, "requester does not match common name");
      return false;
    }
    return true;
  };
}

Predicate IsRequestingRole(std::string group) {
  return [group = std::move(group)](const CertificateSigningRequest& request,
                                    const shared::ParsedCertificateRequest&,
                                    std::string* reason) {
    if (!HasGroup(request, group)) {
      SetReason(reason, "requester is not in " + group);
      return false;
    }
    return true;
  };
}

Predicate IsNewNodeRequest(std::shared_ptr<CloudProvider> cloud,
                           std::shared_ptr<shared::NodeRegistry> nodes) {
  return [cloud = std::move(cloud), nodes = std::move(nodes)](
             const CertificateSigningRequest& request,
             const shared::ParsedCertificateRequest& parsed,
             std::string* reason) {
    if (!HasGroup(request, kBootstrappersGroup)) {
      SetReason(reason, "requester is not in system:bootstrappers");
      return false;
    }
    const auto& username = request.spec().username();
    if (!StartsWith(username, kBootstrapperUserPrefix)) {
      SetReason(reason, "requester is not a bootstrap identity");
      return false;
    }
    const std::string claimed_instance =
        username.substr(std::char_traits<char>::length(kBootstrapperUserPrefix));
    const std::string node_name = NodeNameFromCommonName(parsed.common_name);

    std::string resolved_instance;
    if (!ResolveOrReject([&] { return cloud->InstanceId(node_name); },
                         &resolved_instance, reason)) {
      return false;
    }
    if (claimed_instance.empty() || resolved_instance != claimed_instance) {
      SetReason(reason, "bootstrap instance " + claimed_instance +
                            " does not own node " + node_name);
      return false;
    }
    if (nodes->Get(node_name).has_value()) {
      SetReason(reason, "node " + node_name + " is already registered");
      return false;
    }
    return true;
  };
}

Predicate IsExistingNodeRequest(std::shared_ptr<CloudProvider> cloud,
                                std::shared_ptr<shared::NodeRegistry> nodes) {
  return [cloud = std::move(cloud), nodes = std::move(nodes)](
             const CertificateSigningRequest& request,
             const shared::ParsedCertificateRequest& parsed,
             std::string* reason) {
    if (!HasGroup(request, kNodesGroup)) {
      SetReason(reason, "requester is not in system:nodes");
      return false;
    }
    const std::string node_name = NodeNameFromCommonName(parsed.common_name);
    std::string instance_id;
    if (!ResolveOrReject([&] { return cloud->InstanceId(node_name); },
                         &instance_id, reason)) {
      return false;
    }
    const auto node = nodes->Get(node_name);
    if (!node.has_value()) {
      SetReason(reason, "node " + node_name + " is not registered");
      return false;
    }
    if (!node->ready) {
      SetReason(reason, "node " + node_name + " is not ready");
      return false;
    }
    return true;
  };
}

Predicate IsInAllowedGroup(std::shared_ptr<CloudProvider> cloud,
                           std::set<std::string> allowed_groups) {
  return [cloud = std::move(cloud), allowed_groups = std::move(allowed_groups)](
             const CertificateSigningRequest&,
             const shared::ParsedCertificateRequest& parsed,
             std::string* reason) {
    const std::string node_name = NodeNameFromCommonName(parsed.common_name);
    std::string group;
    if (!ResolveOrReject([&] { return cloud->InstanceGroup(node_name); },
                         &group, reason)) {
      return false;
    }
    if (allowed_groups.count(group) == 0) {
      SetReason(reason, "instance group " + group + " is not allowed");
      return false;
    }
    return true;
  };
}

}  // namespace tollgate::approver
