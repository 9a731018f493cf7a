#include <chrono>
#include <exception>
#include <iostream>

#include <grpcpp/support/status.h>

#include "config.h"
#include "csr_directory.h"
#include "log_utils.h"
#include "security_controls.h"
#include "server.h"
#include "signer.h"
#include "signer_service.h"
#include "tollgate/shared/metrics.h"

int main() {
  try {
    const auto config = tollgate::signer::LoadConfig();

    auto signer = std::make_shared<tollgate::signer::ProfileSigner>(config.signer);
    auto directory = std::make_shared<tollgate::signer::CsrDirectory>(config.csr_dir);

    tollgate::signer::PeerRateLimiterConfig limiter_config;
    limiter_config.max_requests_per_window = config.rate_limit_max_requests;
    limiter_config.max_keys = config.rate_limit_max_keys;
    limiter_config.window = std::chrono::seconds(config.rate_limit_window_seconds);
    auto limiter =
        std::make_shared<tollgate::signer::PeerRateLimiter>(limiter_config);
    auto metrics = std::make_shared<tollgate::shared::InMemoryMetrics>();

    tollgate::signer::SignerServiceImpl service(signer, directory, limiter, metrics);
    auto runtime = tollgate::signer::StartSignerServer(config, &service);
    tollgate::signer::LogSignerEvent("Startup", grpc::Status::OK, runtime.bound_addr);
    if (runtime.health_server) {
      tollgate::signer::LogSignerEvent("HealthStartup", grpc::Status::OK,
                                       runtime.health_bound_addr);
    }
    runtime.server->Wait();
  } catch (const std::exception& ex) {
    std::cerr << "Signer startup failed: " << ex.what() << "\n";
    return 1;
  }
  return 0;
}
