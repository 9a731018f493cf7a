#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "certificates.pb.h"
#include "tollgate/shared/store_error.h"

namespace tollgate::shared {

using certificates::v1::CertificateSigningRequest;

// Signing request storage. Writes carry the caller's resource_version and
// fail with SharedStoreError::Kind::Conflict when it is stale.
class CsrStore {
 public:
  virtual ~CsrStore() = default;

  virtual CertificateSigningRequest Create(
      const CertificateSigningRequest& request) = 0;
  virtual std::optional<CertificateSigningRequest> Get(
      const std::string& name) = 0;
  virtual std::vector<CertificateSigningRequest> List() = 0;

  // Replaces status.conditions only.
  virtual CertificateSigningRequest UpdateApproval(
      const CertificateSigningRequest& request) = 0;
  // Replaces status.certificate only.
  virtual CertificateSigningRequest UpdateCertificate(
      const CertificateSigningRequest& request) = 0;

  virtual void Delete(const std::string& name) = 0;
};

bool IsTerminal(const CertificateSigningRequest& request);

std::shared_ptr<CsrStore> CreateCsrStore(const SharedStoreConfig& config);

}  // namespace tollgate::shared
