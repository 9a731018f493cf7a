#pragma once

#include <memory>
#include <string>

#include <grpcpp/server.h>

#include "config.h"
#include "signer_service.h"

namespace tollgate::signer {

struct SignerRuntime {
  std::unique_ptr<grpc::Server> server;
  std::string bound_addr;
  // Null when no health listener is configured.
  std::unique_ptr<grpc::Server> health_server;
  std::string health_bound_addr;
};

inline constexpr const char* kSignerServiceName = "tollgate.certificates.v1.Signer";

std::string BuildBoundAddress(const std::string& bind_addr, int selected_port);

SignerRuntime StartSignerServer(const SignerServiceConfig& config,
                                SignerServiceImpl* service);

}  // namespace tollgate::signer
