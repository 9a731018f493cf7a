#include "server.h"

#include <stdexcept>
#include <vector>

#include <grpcpp/health_check_service_interface.h>
#include <grpcpp/security/server_credentials.h>
#include <grpcpp/security/tls_certificate_provider.h>
#include <grpcpp/security/tls_credentials_options.h>
#include <grpcpp/server_builder.h>

#include "tls_utils.h"

namespace tollgate::signer {
namespace {

void MarkServing(grpc::Server* server) {
  auto* health = server->GetHealthCheckService();
  if (health) {
    health->SetServingStatus("", true);
    health->SetServingStatus(kSignerServiceName, true);
  }
}

std::unique_ptr<grpc::Server> StartHealthServer(const std::string& health_addr,
                                                int* selected_port) {
  grpc::ServerBuilder builder;
  builder.AddListeningPort(health_addr, grpc::InsecureServerCredentials(),
                           selected_port);
  auto server = builder.BuildAndStart();
  if (!server) {
    throw std::runtime_error("failed to build signer health server");
  }
  MarkServing(server.get());
  return server;
}

}  // namespace

std::string BuildBoundAddress(const std::string& bind_addr, int selected_port) {
  if (selected_port <= 0) {
    return bind_addr;
  }
  const auto pos = bind_addr.rfind(':');
  if (pos == std::string::npos) {
    return bind_addr;
  }
  return bind_addr.substr(0, pos + 1) + std::to_string(selected_port);
}

SignerRuntime StartSignerServer(const SignerServiceConfig& config,
                                SignerServiceImpl* service) {
  const auto cert = ReadFile(config.tls_cert_path);
  const auto key = ReadFile(config.tls_key_path);
  std::string ca_bundle;
  if (!config.tls_ca_path.empty()) {
    ca_bundle = ReadFile(config.tls_ca_path);
  }
  ValidateServerTlsCredentials(cert, key, ca_bundle);

  grpc::EnableDefaultHealthCheckService(true);

  grpc::experimental::IdentityKeyCertPair key_cert_pair{key, cert};
  auto provider =
      std::make_shared<grpc::experimental::StaticDataCertificateProvider>(
          ca_bundle,
          std::vector<grpc::experimental::IdentityKeyCertPair>{key_cert_pair});

  grpc::experimental::TlsServerCredentialsOptions tls_opts(provider);
  tls_opts.watch_identity_key_cert_pairs();
  if (!ca_bundle.empty()) {
    tls_opts.watch_root_certs();
  }
  tls_opts.set_min_tls_version(grpc_tls_version::TLS1_2);
  tls_opts.set_max_tls_version(grpc_tls_version::TLS1_3);
  tls_opts.set_cert_request_type(
      config.tls_require_client_cert
          ? GRPC_SSL_REQUEST_AND_REQUIRE_CLIENT_CERTIFICATE_AND_VERIFY
          : GRPC_SSL_DONT_REQUEST_CLIENT_CERTIFICATE);

  grpc::ServerBuilder builder;
  int selected_port = 0;
  builder.AddListeningPort(config.bind_addr,
                           grpc::experimental::TlsServerCredentials(tls_opts),
                           &selected_port);
  builder.RegisterService(service);
  auto server = builder.BuildAndStart();
  if (!server) {
    throw std::runtime_error("failed to build signer gRPC server");
  }
  MarkServing(server.get());

  SignerRuntime runtime;
  runtime.bound_addr = BuildBoundAddress(config.bind_addr, selected_port);
  runtime.server = std::move(server);
  if (!config.health_addr.empty()) {
    int health_port = 0;
    runtime.health_server = StartHealthServer(config.health_addr, &health_port);
    runtime.health_bound_addr = BuildBoundAddress(config.health_addr, health_port);
  }
  return runtime;
}

}  // namespace tollgate::signer
