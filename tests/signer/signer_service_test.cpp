#include "signer_service.h"

#include <atomic>
#include <filesystem>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

#include <grpcpp/server_context.h>
#include <gtest/gtest.h>

#include "pki_fixtures.h"

namespace tollgate::signer {
namespace {

using certificates::v1::CONDITION_TYPE_APPROVED;
using certificates::v1::CONDITION_TYPE_DENIED;
using certificates::v1::GetCertificateSigningRequestRequest;
using certificates::v1::GetCertificateSigningRequestResponse;
using certificates::v1::SignerErrorCode;
using certificates::v1::SubmitCertificateSigningRequestRequest;
using certificates::v1::SubmitCertificateSigningRequestResponse;

class FakeSigner final : public Signer {
 public:
  CertificateSigningRequest Sign(const CertificateSigningRequest& request) override {
    ++calls;
    CertificateSigningRequest result = request;
    if (failure.has_value()) {
      auto* denied = result.mutable_status()->add_conditions();
      denied->set_type(CONDITION_TYPE_DENIED);
      denied->set_message("denied by fake");
      throw SigningError(*failure, "fake signing failure", result);
    }
    auto* approved = result.mutable_status()->add_conditions();
    approved->set_type(CONDITION_TYPE_APPROVED);
    result.mutable_status()->set_certificate("issued-" + request.metadata().name());
    return result;
  }

  std::atomic<int> calls{0};
  std::optional<SigningError::Kind> failure;
};

class DenyAllRateLimiter final : public RateLimiter {
 public:
  bool Allow(std::string_view) override { return false; }
};

class SignerServiceTest : public ::testing::Test {
 protected:
  void SetUp() override {
    path_ = tollgate::testing::TempPath("signer_service_test");
    signer_ = std::make_shared<FakeSigner>();
    directory_ = std::make_shared<CsrDirectory>(path_);
    metrics_ = std::make_shared<shared::InMemoryMetrics>();
  }

  void TearDown() override {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }

  SignerServiceImpl MakeService(std::shared_ptr<RateLimiter> limiter = nullptr) {
    return SignerServiceImpl(signer_, directory_, std::move(limiter), metrics_);
  }

  static SubmitCertificateSigningRequestRequest Submission(const std::string& name) {
    SubmitCertificateSigningRequestRequest request;
    request.mutable_csr()->mutable_metadata()->set_name(name);
    request.mutable_csr()->mutable_spec()->set_request("pem");
    return request;
  }

  std::string path_;
  std::shared_ptr<FakeSigner> signer_;
  std::shared_ptr<CsrDirectory> directory_;
  std::shared_ptr<shared::InMemoryMetrics> metrics_;
};

TEST_F(SignerServiceTest, SubmitPersistsSignedRequest) {
  auto service = MakeService();
  grpc::ServerContext context;
  const auto request = Submission("etcd-0");
  SubmitCertificateSigningRequestResponse response;

  const auto status =
      service.SubmitCertificateSigningRequest(&context, &request, &response);
  ASSERT_TRUE(status.ok()) << status.error_message();
  EXPECT_FALSE(response.has_error());
  EXPECT_EQ(response.csr().status().certificate(), "issued-etcd-0");
  EXPECT_EQ(metrics_->Get("signed"), 1U);

  grpc::ServerContext get_context;
  GetCertificateSigningRequestRequest get_request;
  get_request.set_name("etcd-0");
  GetCertificateSigningRequestResponse get_response;
  ASSERT_TRUE(service.GetCertificateSigningRequest(&get_context, &get_request,
                                                   &get_response)
                  .ok());
  EXPECT_EQ(get_response.csr().status().certificate(), "issued-etcd-0");
  ASSERT_EQ(get_response.csr().status().conditions_size(), 1);
  EXPECT_EQ(get_response.csr().status().conditions(0).type(), CONDITION_TYPE_APPROVED);
}

TEST_F(SignerServiceTest, DeniedRequestIsReturnedButNotPersisted) {
  signer_->failure = SigningError::Kind::InvalidOrganization;
  auto service = MakeService();
  grpc::ServerContext context;
  const auto request = Submission("etcd-0");
  SubmitCertificateSigningRequestResponse response;

  const auto status =
      service.SubmitCertificateSigningRequest(&context, &request, &response);
  EXPECT_EQ(status.error_code(), grpc::StatusCode::PERMISSION_DENIED);
  EXPECT_EQ(response.error().code(), SignerErrorCode::SIGNER_ERROR_CODE_POLICY_DENIED);
  ASSERT_EQ(response.csr().status().conditions_size(), 1);
  EXPECT_EQ(response.csr().status().conditions(0).type(), CONDITION_TYPE_DENIED);
  EXPECT_EQ(metrics_->Get("denied"), 1U);
  EXPECT_FALSE(directory_->Read("etcd-0").has_value());
}

TEST_F(SignerServiceTest, MapsSigningFailuresToErrorCodes) {
  struct Case {
    SigningError::Kind kind;
    grpc::StatusCode status;
    SignerErrorCode code;
  };
  const Case cases[] = {
      {SigningError::Kind::InvalidRequest, grpc::StatusCode::INVALID_ARGUMENT,
       SignerErrorCode::SIGNER_ERROR_CODE_INVALID_REQUEST},
      {SigningError::Kind::InvalidCommonName, grpc::StatusCode::PERMISSION_DENIED,
       SignerErrorCode::SIGNER_ERROR_CODE_POLICY_DENIED},
      {SigningError::Kind::ProfileUnsupported, grpc::StatusCode::PERMISSION_DENIED,
       SignerErrorCode::SIGNER_ERROR_CODE_POLICY_DENIED},
      {SigningError::Kind::Internal, grpc::StatusCode::INTERNAL,
       SignerErrorCode::SIGNER_ERROR_CODE_INTERNAL},
  };
  auto service = MakeService();
  for (const auto& c : cases) {
    signer_->failure = c.kind;
    grpc::ServerContext context;
    const auto request = Submission("etcd-0");
    SubmitCertificateSigningRequestResponse response;
    const auto status =
        service.SubmitCertificateSigningRequest(&context, &request, &response);
    EXPECT_EQ(status.error_code(), c.status);
    EXPECT_EQ(response.error().code(), c.code);
  }
}

TEST_F(SignerServiceTest, RejectsInvalidSubmissionsWithoutSigning) {
  auto service = MakeService();

  auto bad_name = Submission("../etcd-0");
  auto empty = Submission("etcd-0");
  empty.mutable_csr()->mutable_spec()->clear_request();
  auto oversized = Submission("etcd-0");
  oversized.mutable_csr()->mutable_spec()->set_request(std::string(64 * 1024 + 1, 'x'));

  for (const auto* request : {&bad_name, &empty, &oversized}) {
    grpc::ServerContext context;
    SubmitCertificateSigningRequestResponse response;
    const auto status =
        service.SubmitCertificateSigningRequest(&context, request, &response);
    EXPECT_EQ(status.error_code(), grpc::StatusCode::INVALID_ARGUMENT);
    EXPECT_EQ(response.error().code(),
              SignerErrorCode::SIGNER_ERROR_CODE_INVALID_REQUEST);
  }
  EXPECT_EQ(signer_->calls.load(), 0);
  EXPECT_EQ(metrics_->Get("validation_failure"), 3U);
}

TEST_F(SignerServiceTest, RateLimitedCallsRecordMetric) {
  auto service = MakeService(std::make_shared<DenyAllRateLimiter>());
  grpc::ServerContext context;
  const auto request = Submission("etcd-0");
  SubmitCertificateSigningRequestResponse response;
  const auto status =
      service.SubmitCertificateSigningRequest(&context, &request, &response);
  EXPECT_EQ(status.error_code(), grpc::StatusCode::RESOURCE_EXHAUSTED);
  EXPECT_EQ(response.error().code(), SignerErrorCode::SIGNER_ERROR_CODE_RATE_LIMITED);

  grpc::ServerContext get_context;
  GetCertificateSigningRequestRequest get_request;
  get_request.set_name("etcd-0");
  GetCertificateSigningRequestResponse get_response;
  EXPECT_EQ(service.GetCertificateSigningRequest(&get_context, &get_request,
                                                 &get_response)
                .error_code(),
            grpc::StatusCode::RESOURCE_EXHAUSTED);
  EXPECT_EQ(metrics_->Get("rate_limited"), 2U);
  EXPECT_EQ(signer_->calls.load(), 0);
}

TEST_F(SignerServiceTest, GetReportsMissingAndInvalidNames) {
  auto service = MakeService();
  {
    grpc::ServerContext context;
    GetCertificateSigningRequestRequest request;
    request.set_name("absent");
    GetCertificateSigningRequestResponse response;
    EXPECT_EQ(service.GetCertificateSigningRequest(&context, &request, &response)
                  .error_code(),
              grpc::StatusCode::NOT_FOUND);
    EXPECT_EQ(response.error().code(), SignerErrorCode::SIGNER_ERROR_CODE_NOT_FOUND);
  }
  {
    grpc::ServerContext context;
    GetCertificateSigningRequestRequest request;
    request.set_name("a/b");
    GetCertificateSigningRequestResponse response;
    EXPECT_EQ(service.GetCertificateSigningRequest(&context, &request, &response)
                  .error_code(),
              grpc::StatusCode::INVALID_ARGUMENT);
  }
}

TEST_F(SignerServiceTest, SignsRealEtcdPeerRequest) {
  const auto ca = tollgate::testing::GenerateSelfSignedCa("service-etcd-ca");
  SignerConfig config;
  config.ca_cert_path = tollgate::testing::WriteTempFile("service_ca.crt", ca.cert_pem);
  config.ca_key_path = tollgate::testing::WriteTempFile("service_ca.key", ca.key_pem);
  SignerServiceImpl service(std::make_shared<ProfileSigner>(config), directory_,
                            nullptr, metrics_);

  SubmitCertificateSigningRequestRequest request;
  request.mutable_csr()->mutable_metadata()->set_name("etcd-2");
  request.mutable_csr()->mutable_spec()->set_request(tollgate::testing::GenerateCsrPem(
      {"system:etcd-peer:etcd-2", {"system:etcd-peers"}, {"etcd-2"}, {}, {}}));
  grpc::ServerContext context;
  SubmitCertificateSigningRequestResponse response;
  ASSERT_TRUE(
      service.SubmitCertificateSigningRequest(&context, &request, &response).ok());
  EXPECT_TRUE(tollgate::testing::VerifyCertificateAgainst(
      response.csr().status().certificate(), ca.cert_pem));

  const auto stored = directory_->Read("etcd-2");
  ASSERT_TRUE(stored.has_value());
  EXPECT_EQ(stored->status().certificate(), response.csr().status().certificate());
}

TEST(SignerServiceConstructionTest, RequiresSignerAndDirectory) {
  const auto path = tollgate::testing::TempPath("signer_service_ctor");
  auto directory = std::make_shared<CsrDirectory>(path);
  EXPECT_THROW(SignerServiceImpl(nullptr, directory), std::runtime_error);
  EXPECT_THROW(SignerServiceImpl(std::make_shared<FakeSigner>(), nullptr),
               std::runtime_error);
  std::error_code ec;
  std::filesystem::remove_all(path, ec);
}

}  // namespace
}  // namespace tollgate::signer
