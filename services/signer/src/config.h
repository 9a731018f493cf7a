#pragma once

#include <chrono>
#include <cstddef>
#include <string>

#include "signer.h"

namespace tollgate::signer {

struct SignerServiceConfig {
  std::string bind_addr;
  // Optional plaintext listener serving only grpc.health.v1.
  std::string health_addr;
  std::string tls_cert_path;
  std::string tls_key_path;
  std::string tls_ca_path;
  bool tls_require_client_cert = false;

  SignerConfig signer;
  std::string csr_dir;

  size_t rate_limit_max_requests = 60;
  size_t rate_limit_max_keys = 10000;
  size_t rate_limit_window_seconds = 60;
};

SignerServiceConfig LoadConfig();
std::string ReadFile(const std::string& path);

// Parses durations such as "8760h", "90m", "30s" or "1h30m".
std::chrono::seconds ParseDuration(const std::string& value);

}  // namespace tollgate::signer
