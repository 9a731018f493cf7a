#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "cloud_provider.h"
#include "tollgate/shared/backoff.h"
#include "tollgate/shared/timed_cache.h"

namespace tollgate::approver {

struct Ec2Filter {
  std::string name;
  std::vector<std::string> values;
};

struct Ec2Instance {
  std::string instance_id;
  std::string private_dns_name;
  std::string state;
};

struct DescribeInstancesPage {
  std::vector<Ec2Instance> instances;
  std::string next_token;
};

// Implementations report API failures as CloudProviderError::Kind::Transient.
class Ec2Api {
 public:
  virtual ~Ec2Api() = default;

  virtual DescribeInstancesPage DescribeInstances(
      const std::vector<Ec2Filter>& filters, const std::string& next_token) = 0;
};

struct AutoScalingInstance {
  std::string instance_id;
  std::string group_name;
};

struct DescribeAutoScalingInstancesPage {
  std::vector<AutoScalingInstance> instances;
  std::string next_token;
};

class AutoScalingApi {
 public:
  virtual ~AutoScalingApi() = default;

  virtual DescribeAutoScalingInstancesPage DescribeAutoScalingInstances(
      const std::vector<std::string>& instance_ids,
      const std::string& next_token) = 0;
};

struct AwsProviderConfig {
  std::string region;
  std::chrono::milliseconds instance_cache_ttl = std::chrono::seconds(15);
  std::optional<shared::BackoffPolicy> backoff;
};

class AwsCloudProvider final : public CloudProvider {
 public:
  AwsCloudProvider(AwsProviderConfig config, std::shared_ptr<Ec2Api> ec2,
                   std::shared_ptr<AutoScalingApi> autoscaling,
                   shared::Sleeper sleeper = shared::DefaultSleeper(),
                   shared::SteadyClock clock = shared::DefaultSteadyClock());

  const std::string& region() const noexcept;

  std::string InstanceId(const std::string& node_name) override;
  std::string InstanceGroup(const std::string& node_name) override;

 private:
  std::string LookupInstanceId(const std::string& node_name);
  DescribeInstancesPage DescribeInstancesPageWithRetry(
      const std::vector<Ec2Filter>& filters, const std::string& next_token);
  DescribeAutoScalingInstancesPage DescribeAutoScalingPageWithRetry(
      const std::vector<std::string>& instance_ids,
      const std::string& next_token);

  AwsProviderConfig config_;
  std::shared_ptr<Ec2Api> ec2_;
  std::shared_ptr<AutoScalingApi> autoscaling_;
  shared::Sleeper sleeper_;
  shared::TimedCache<std::string> instance_ids_;
};

}  // namespace tollgate::approver
