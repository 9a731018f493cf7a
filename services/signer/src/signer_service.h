#pragma once

#include <memory>

#include <grpcpp/server_context.h>
#include <grpcpp/support/status.h>

#include "certificates.grpc.pb.h"
#include "csr_directory.h"
#include "security_controls.h"
#include "signer.h"
#include "tollgate/shared/metrics.h"

namespace tollgate::signer {

class SignerServiceImpl final : public certificates::v1::Signer::Service {
 public:
  SignerServiceImpl(std::shared_ptr<Signer> signer,
                    std::shared_ptr<CsrDirectory> directory,
                    std::shared_ptr<RateLimiter> rate_limiter = nullptr,
                    std::shared_ptr<shared::Metrics> metrics = nullptr);

  grpc::Status SubmitCertificateSigningRequest(
      grpc::ServerContext* context,
      const certificates::v1::SubmitCertificateSigningRequestRequest* request,
      certificates::v1::SubmitCertificateSigningRequestResponse* response) override;
  grpc::Status GetCertificateSigningRequest(
      grpc::ServerContext* context,
      const certificates::v1::GetCertificateSigningRequestRequest* request,
      certificates::v1::GetCertificateSigningRequestResponse* response) override;

 private:
  std::shared_ptr<Signer> signer_;
  std::shared_ptr<CsrDirectory> directory_;
  std::shared_ptr<RateLimiter> rate_limiter_;
  std::shared_ptr<shared::Metrics> metrics_;
};

}  // namespace tollgate::signer
