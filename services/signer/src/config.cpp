#include "config.h"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace tollgate::signer {
namespace {

constexpr size_t kMaxNotBeforeSkewSeconds = 3600;

std::string GetEnvOrEmpty(const char* name) {
  const char* value = std::getenv(name);
  return value ? std::string(value) : std::string();
}

bool GetEnvOrDefaultBool(const char* name, bool fallback) {
  const char* value = std::getenv(name);
  if (!value || value[0] == '\0') {
    return fallback;
  }
  std::string normalized(value);
  std::transform(normalized.begin(), normalized.end(), normalized.begin(),
                 [](unsigned char ch) {
                   return static_cast<char>(std::tolower(ch));
                 });
  if (normalized == "1" || normalized == "true" || normalized == "yes") {
    return true;
  }
  if (normalized == "0" || normalized == "false" || normalized == "no") {
    return false;
  }
  return fallback;
}

size_t GetEnvOrDefaultSize(const char* name, size_t fallback) {
  const char* value = std::getenv(name);
  if (!value || value[0] == '\0') {
    return fallback;
  }

  errno = 0;
  char* end = nullptr;
  const unsigned long long parsed = std::strtoull(value, &end, 10);
  if (errno != 0 || end == value || (end && *end != '\0') || parsed == 0 ||
      parsed > std::numeric_limits<size_t>::max() || value[0] == '-') {
    throw std::runtime_error(std::string(name) + " must be a positive integer");
  }
  return static_cast<size_t>(parsed);
}

std::chrono::seconds GetEnvOrDefaultDuration(const char* name,
                                             std::chrono::seconds fallback) {
  const std::string value = GetEnvOrEmpty(name);
  if (value.empty()) {
    return fallback;
  }
  try {
    const auto parsed = ParseDuration(value);
    if (parsed.count() <= 0) {
      throw std::invalid_argument("duration must be positive");
    }
    return parsed;
  } catch (const std::invalid_argument& ex) {
    throw std::runtime_error(std::string(name) + " is not a valid duration: " +
                             ex.what());
  }
}

}  // namespace

std::chrono::seconds ParseDuration(const std::string& value) {
  if (value.empty()) {
    throw std::invalid_argument("empty duration");
  }
  std::chrono::seconds total{0};
  size_t pos = 0;
  while (pos < value.size()) {
    if (!std::isdigit(static_cast<unsigned char>(value[pos]))) {
      throw std::invalid_argument("expected a number in \"" + value + "\"");
    }
    long long amount = 0;
    while (pos < value.size() && std::isdigit(static_cast<unsigned char>(value[pos]))) {
      if (amount > std::numeric_limits<long long>::max() / 10) {
        throw std::invalid_argument("duration out of range");
      }
      amount = amount * 10 + (value[pos] - '0');
      ++pos;
    }
    if (pos == value.size()) {
      throw std::invalid_argument("missing unit in \"" + value + "\"");
    }
    switch (value[pos]) {
      case 'h':
        total += std::chrono::hours(amount);
        break;
      case 'm':
        total += std::chrono::minutes(amount);
        break;
      case 's':
        total += std::chrono::seconds(amount);
        break;
      default:
        throw std::invalid_argument("unknown unit in \"" + value + "\"");
    }
    ++pos;
  }
  return total;
}

SignerServiceConfig LoadConfig() {
  SignerServiceConfig config;
  config.bind_addr = GetEnvOrEmpty("TOLLGATE_SIGNER_BIND_ADDR");
  config.health_addr = GetEnvOrEmpty("TOLLGATE_SIGNER_HEALTH_ADDR");
  config.tls_cert_path = GetEnvOrEmpty("TOLLGATE_SIGNER_TLS_CERT");
  config.tls_key_path = GetEnvOrEmpty("TOLLGATE_SIGNER_TLS_KEY");
  config.tls_ca_path = GetEnvOrEmpty("TOLLGATE_SIGNER_TLS_CA_BUNDLE");
  config.tls_require_client_cert =
      GetEnvOrDefaultBool("TOLLGATE_SIGNER_TLS_REQUIRE_CLIENT_CERT", false);

  config.signer.ca_cert_path = GetEnvOrEmpty("TOLLGATE_SIGNER_CA_CERT");
  config.signer.ca_key_path = GetEnvOrEmpty("TOLLGATE_SIGNER_CA_KEY");
  config.signer.metric_ca_cert_path = GetEnvOrEmpty("TOLLGATE_SIGNER_METRIC_CA_CERT");
  config.signer.metric_ca_key_path = GetEnvOrEmpty("TOLLGATE_SIGNER_METRIC_CA_KEY");
  config.signer.peer_duration = GetEnvOrDefaultDuration(
      "TOLLGATE_SIGNER_PEER_CERT_DURATION", config.signer.peer_duration);
  config.signer.server_duration = GetEnvOrDefaultDuration(
      "TOLLGATE_SIGNER_SERVER_CERT_DURATION", config.signer.server_duration);
  config.signer.metric_duration = GetEnvOrDefaultDuration(
      "TOLLGATE_SIGNER_METRIC_CERT_DURATION", config.signer.metric_duration);
  const size_t skew_seconds = GetEnvOrDefaultSize(
      "TOLLGATE_SIGNER_NOT_BEFORE_SKEW_SECONDS",
      static_cast<size_t>(config.signer.not_before_skew.count()));
  config.csr_dir = GetEnvOrEmpty("TOLLGATE_SIGNER_CSR_DIR");

  config.rate_limit_max_requests = GetEnvOrDefaultSize(
      "TOLLGATE_SIGNER_RATE_LIMIT_MAX_REQUESTS", config.rate_limit_max_requests);
  config.rate_limit_max_keys = GetEnvOrDefaultSize(
      "TOLLGATE_SIGNER_RATE_LIMIT_MAX_KEYS", config.rate_limit_max_keys);
  config.rate_limit_window_seconds = GetEnvOrDefaultSize(
      "TOLLGATE_SIGNER_RATE_LIMIT_WINDOW_SECONDS", config.rate_limit_window_seconds);

  if (config.bind_addr.empty()) {
    throw std::runtime_error("TOLLGATE_SIGNER_BIND_ADDR is required");
  }
  if (config.tls_cert_path.empty()) {
    throw std::runtime_error("TOLLGATE_SIGNER_TLS_CERT is required");
  }
  if (config.tls_key_path.empty()) {
    throw std::runtime_error("TOLLGATE_SIGNER_TLS_KEY is required");
  }
  if (config.tls_require_client_cert && config.tls_ca_path.empty()) {
    throw std::runtime_error(
        "TOLLGATE_SIGNER_TLS_CA_BUNDLE is required when mTLS is enabled");
  }
  const bool has_main =
      !config.signer.ca_cert_path.empty() && !config.signer.ca_key_path.empty();
  const bool has_metric = !config.signer.metric_ca_cert_path.empty() &&
                          !config.signer.metric_ca_key_path.empty();
  if (!has_main && !has_metric) {
    throw std::runtime_error(
        "TOLLGATE_SIGNER_CA_CERT/KEY or TOLLGATE_SIGNER_METRIC_CA_CERT/KEY is required");
  }
  if (config.signer.ca_cert_path.empty() != config.signer.ca_key_path.empty()) {
    throw std::runtime_error(
        "TOLLGATE_SIGNER_CA_CERT and TOLLGATE_SIGNER_CA_KEY must be set together");
  }
  if (config.signer.metric_ca_cert_path.empty() !=
      config.signer.metric_ca_key_path.empty()) {
    throw std::runtime_error(
        "TOLLGATE_SIGNER_METRIC_CA_CERT and TOLLGATE_SIGNER_METRIC_CA_KEY must be set together");
  }
  if (skew_seconds > kMaxNotBeforeSkewSeconds) {
    throw std::runtime_error(
        "TOLLGATE_SIGNER_NOT_BEFORE_SKEW_SECONDS must be between 1 and 3600");
  }
  config.signer.not_before_skew = std::chrono::seconds(skew_seconds);
  if (config.csr_dir.empty()) {
    throw std::runtime_error("TOLLGATE_SIGNER_CSR_DIR is required");
  }

  return config;
}

std::string ReadFile(const std::string& path) {
  std::ifstream file(path, std::ios::in | std::ios::binary);
  if (!file) {
    throw std::runtime_error("Failed to open file: " + path);
  }
  std::ostringstream buffer;
  buffer << file.rdbuf();
  return buffer.str();
}

}  // namespace tollgate::signer
