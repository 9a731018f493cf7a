#pragma once

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include <openssl/x509.h>

namespace tollgate::shared {

class CertificateRequestError : public std::runtime_error {
 public:
  enum class Kind {
    Malformed,
    BadSignature,
  };

  CertificateRequestError(Kind kind, const std::string& message);

  Kind kind() const noexcept;

 private:
  Kind kind_;
};

struct ParsedCertificateRequest {
  std::string common_name;
  std::vector<std::string> organizations;
  std::vector<std::string> dns_names;
  std::vector<std::string> email_addresses;
  std::vector<std::string> ip_addresses;
  std::shared_ptr<X509_REQ> request;
};

// Accepts a PEM "CERTIFICATE REQUEST" block or raw DER and verifies the
// request's self-signature before returning.
ParsedCertificateRequest ParseCertificateRequest(const std::string& encoded);

}  // namespace tollgate::shared
