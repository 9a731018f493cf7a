#include "signer_service.h"

#include <stdexcept>
#include <string>
#include <string_view>

#include <grpcpp/support/status_code_enum.h>

#include "log_utils.h"

namespace tollgate::signer {
namespace {

using certificates::v1::SignerErrorCode;

constexpr size_t kMaxCsrBytes = 64 * 1024;

grpc::StatusCode TransportStatusForSignerCode(SignerErrorCode code) {
  switch (code) {
    case SignerErrorCode::SIGNER_ERROR_CODE_INVALID_REQUEST:
      return grpc::StatusCode::INVALID_ARGUMENT;
    case SignerErrorCode::SIGNER_ERROR_CODE_POLICY_DENIED:
      return grpc::StatusCode::PERMISSION_DENIED;
    case SignerErrorCode::SIGNER_ERROR_CODE_RATE_LIMITED:
      return grpc::StatusCode::RESOURCE_EXHAUSTED;
    case SignerErrorCode::SIGNER_ERROR_CODE_NOT_FOUND:
      return grpc::StatusCode::NOT_FOUND;
    case SignerErrorCode::SIGNER_ERROR_CODE_INTERNAL:
    case SignerErrorCode::SIGNER_ERROR_CODE_UNSPECIFIED:
    default:
      return grpc::StatusCode::INTERNAL;
  }
}

template <typename Response>
grpc::Status StatusWithSignerError(Response* response, SignerErrorCode code,
                                   std::string_view detail) {
  auto* error = response->mutable_error();
  error->set_code(code);
  error->set_detail(std::string(detail));
  return grpc::Status(TransportStatusForSignerCode(code), std::string(detail));
}

SignerErrorCode CodeForSigningError(SigningError::Kind kind) {
  switch (kind) {
    case SigningError::Kind::InvalidRequest:
      return SignerErrorCode::SIGNER_ERROR_CODE_INVALID_REQUEST;
    case SigningError::Kind::InvalidOrganization:
    case SigningError::Kind::InvalidCommonName:
    case SigningError::Kind::ProfileUnsupported:
      return SignerErrorCode::SIGNER_ERROR_CODE_POLICY_DENIED;
    case SigningError::Kind::Internal:
    default:
      return SignerErrorCode::SIGNER_ERROR_CODE_INTERNAL;
  }
}

}  // namespace

SignerServiceImpl::SignerServiceImpl(std::shared_ptr<Signer> signer,
                                     std::shared_ptr<CsrDirectory> directory,
                                     std::shared_ptr<RateLimiter> rate_limiter,
                                     std::shared_ptr<shared::Metrics> metrics)
    : signer_(std::move(signer)),
      directory_(std::move(directory)),
      rate_limiter_(std::move(rate_limiter)),
      metrics_(std::move(metrics)) {
  if (!signer_) {
    throw std::runtime_error("signer is required");
  }
  if (!directory_) {
    throw std::runtime_error("signer request directory is required");
  }
  if (!rate_limiter_) {
    rate_limiter_ = std::make_shared<PeerRateLimiter>();
  }
  if (!metrics_) {
    metrics_ = std::make_shared<shared::InMemoryMetrics>();
  }
}

grpc::Status SignerServiceImpl::SubmitCertificateSigningRequest(
    grpc::ServerContext* context,
    const certificates::v1::SubmitCertificateSigningRequestRequest* request,
    certificates::v1::SubmitCertificateSigningRequestResponse* response) {
  constexpr std::string_view kAction = "SubmitCertificateSigningRequest";
  const auto rate_key = std::string("submit:") + ExtractPeerIdentity(context);
  if (!rate_limiter_->Allow(rate_key)) {
    metrics_->Increment("rate_limited");
    const auto status = StatusWithSignerError(
        response, SignerErrorCode::SIGNER_ERROR_CODE_RATE_LIMITED,
        "request rate limit exceeded");
    LogSignerEvent(kAction, status, "rate_limited");
    return status;
  }

  const auto& csr = request->csr();
  try {
    ValidateRequestName(csr.metadata().name());
  } catch (const CsrDirectoryError& ex) {
    metrics_->Increment("validation_failure");
    const auto status = StatusWithSignerError(
        response, SignerErrorCode::SIGNER_ERROR_CODE_INVALID_REQUEST, ex.what());
    LogSignerEvent(kAction, status, "validation_failed");
    return status;
  }
  if (csr.spec().request().empty() || csr.spec().request().size() > kMaxCsrBytes) {
    metrics_->Increment("validation_failure");
    const auto status = StatusWithSignerError(
        response, SignerErrorCode::SIGNER_ERROR_CODE_INVALID_REQUEST,
        csr.spec().request().empty() ? "spec.request is required"
                                     : "spec.request exceeds size limit");
    LogSignerEvent(kAction, status, "validation_failed");
    return status;
  }

  certificates::v1::CertificateSigningRequest signed_request;
  try {
    signed_request = signer_->Sign(csr);
  } catch (const SigningError& ex) {
    metrics_->Increment("denied");
    *response->mutable_csr() = ex.denied();
    const auto status =
        StatusWithSignerError(response, CodeForSigningError(ex.kind()), ex.what());
    LogSignerEvent(kAction, status, csr.metadata().name());
    return status;
  }

  try {
    directory_->Write(signed_request);
  } catch (const CsrDirectoryError& ex) {
    const auto status = StatusWithSignerError(
        response, SignerErrorCode::SIGNER_ERROR_CODE_INTERNAL, ex.what());
    LogSignerEvent(kAction, status, "persist_failed");
    return status;
  }

  metrics_->Increment("signed");
  *response->mutable_csr() = std::move(signed_request);
  LogSignerEvent(kAction, grpc::Status::OK, csr.metadata().name());
  return grpc::Status::OK;
}

grpc::Status SignerServiceImpl::GetCertificateSigningRequest(
    grpc::ServerContext* context,
    const certificates::v1::GetCertificateSigningRequestRequest* request,
    certificates::v1::GetCertificateSigningRequestResponse* response) {
  constexpr std::string_view kAction = "GetCertificateSigningRequest";
  const auto rate_key = std::string("get:") + ExtractPeerIdentity(context);
  if (!rate_limiter_->Allow(rate_key)) {
    metrics_->Increment("rate_limited");
    const auto status = StatusWithSignerError(
        response, SignerErrorCode::SIGNER_ERROR_CODE_RATE_LIMITED,
        "request rate limit exceeded");
    LogSignerEvent(kAction, status, "rate_limited");
    return status;
  }

  std::optional<certificates::v1::CertificateSigningRequest> stored;
  try {
    stored = directory_->Read(request->name());
  } catch (const CsrDirectoryError& ex) {
    const auto code = ex.kind() == CsrDirectoryError::Kind::InvalidName
                          ? SignerErrorCode::SIGNER_ERROR_CODE_INVALID_REQUEST
                          : SignerErrorCode::SIGNER_ERROR_CODE_INTERNAL;
    const auto status = StatusWithSignerError(response, code, ex.what());
    LogSignerEvent(kAction, status, "read_failed");
    return status;
  }
  if (!stored.has_value()) {
    const auto status = StatusWithSignerError(
        response, SignerErrorCode::SIGNER_ERROR_CODE_NOT_FOUND,
        "signing request not found");
    LogSignerEvent(kAction, status, request->name());
    return status;
  }

  *response->mutable_csr() = std::move(*stored);
  LogSignerEvent(kAction, grpc::Status::OK, request->name());
  return grpc::Status::OK;
}

}  // namespace tollgate::signer
