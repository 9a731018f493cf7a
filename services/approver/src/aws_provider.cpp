#include "aws_provider.h"

#include <utility>

namespace tollgate::approver {

AwsCloudProvider::AwsCloudProvider(AwsProviderConfig config,
                                   std::shared_ptr<Ec2Api> ec2,
                                   std::shared_ptr<AutoScalingApi> autoscaling,
                                   shared::Sleeper sleeper,
                                   shared::SteadyClock clock)
    : config_(std::move(config)),
      ec2_(std::move(ec2)),
      autoscaling_(std::move(autoscaling)),
      sleeper_(std::move(sleeper)),
      instance_ids_(config_.instance_cache_ttl, std::move(clock)) {
  if (!ec2_ || !autoscaling_) {
    throw std::invalid_argument("aws provider requires EC2 and AutoScaling clients");
  }
}

const std::string& AwsCloudProvider::region() const noexcept {
  return config_.region;
}

std::string AwsCloudProvider::InstanceId(const std::string& node_name) {
  return instance_ids_.GetOrCreate(
      node_name, [this](const std::string& key) { return LookupInstanceId(key); });
}

std::string AwsCloudProvider::InstanceGroup(const std::string& node_name) {
  const std::string instance_id = InstanceId(node_name);

  std::vector<AutoScalingInstance> matches;
  std::string next_token;
  do {
    auto page = DescribeAutoScalingPageWithRetry({instance_id}, next_token);
    for (auto& instance : page.instances) {
      matches.push_back(std::move(instance));
    }
    next_token = std::move(page.next_token);
  } while (!next_token.empty());

  if (matches.empty()) {
    // The cached instance may have been replaced under the same node name.
    instance_ids_.Delete(node_name);
    throw CloudProviderError(CloudProviderError::Kind::GroupNotFound,
                             "no auto scaling group for instance " + instance_id);
  }
  if (matches.size() > 1) {
    throw CloudProviderError(CloudProviderError::Kind::Ambiguous,
                             "multiple auto scaling groups for instance " +
                                 instance_id);
  }
  if (matches.front().group_name.empty()) {
    throw CloudProviderError(CloudProviderError::Kind::Transient,
                             "auto scaling group name is empty for instance " +
                                 instance_id);
  }
  return matches.front().group_name;
}

std::string AwsCloudProvider::LookupInstanceId(const std::string& node_name) {
  const std::vector<Ec2Filter> filters = {
      {"private-dns-name", {node_name}},
      {"instance-state-name", {"running"}},
  };

  std::vector<Ec2Instance> matches;
  std::string next_token;
  do {
    auto page = DescribeInstancesPageWithRetry(filters, next_token);
    for (auto& instance : page.instances) {
      matches.push_back(std::move(instance));
    }
    next_token = std::move(page.next_token);
  } while (!next_token.empty());

  if (matches.empty()) {
    throw CloudProviderError(CloudProviderError::Kind::InstanceNotFound,
                             "no running instance for node " + node_name);
  }
  if (matches.size() > 1) {
    throw CloudProviderError(CloudProviderError::Kind::Ambiguous,
                             "multiple running instances for node " + node_name);
  }
  if (matches.front().instance_id.empty()) {
    throw CloudProviderError(CloudProviderError::Kind::Transient,
                             "instance id is empty for node " + node_name);
  }
  return matches.front().instance_id;
}

DescribeInstancesPage AwsCloudProvider::DescribeInstancesPageWithRetry(
    const std::vector<Ec2Filter>& filters, const std::string& next_token) {
  return CallCloudApi(config_.backoff, sleeper_, [&] {
    return ec2_->DescribeInstances(filters, next_token);
  });
}

DescribeAutoScalingInstancesPage
AwsCloudProvider::DescribeAutoScalingPageWithRetry(
    const std::vector<std::string>& instance_ids,
    const std::string& next_token) {
  return CallCloudApi(config_.backoff, sleeper_, [&] {
    return autoscaling_->DescribeAutoScalingInstances(instance_ids, next_token);
  });
}

}  // namespace tollgate::approver
