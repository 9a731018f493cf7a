#include "tollgate/shared/certificate_request.h"

#include <string>

#include <gtest/gtest.h>

#include "pki_fixtures.h"

namespace tollgate::shared {
namespace {

using tollgate::testing::CsrOptions;
using tollgate::testing::GenerateCsrDer;
using tollgate::testing::GenerateCsrPem;

CsrOptions NodeRequest() {
  CsrOptions options;
  options.common_name = "system:node:ip-10-0-0-1.ec2.internal";
  options.organizations = {"system:nodes"};
  options.dns_names = {"ip-10-0-0-1.ec2.internal"};
  options.ip_addresses = {"10.0.0.1", "fd00::1"};
  options.email_addresses = {"ops@example.com"};
  return options;
}

TEST(CertificateRequestTest, ParsesPemSubjectAndAlternativeNames) {
  const auto parsed = ParseCertificateRequest(GenerateCsrPem(NodeRequest()));
  EXPECT_EQ(parsed.common_name, "system:node:ip-10-0-0-1.ec2.internal");
  ASSERT_EQ(parsed.organizations.size(), 1U);
  EXPECT_EQ(parsed.organizations.front(), "system:nodes");
  ASSERT_EQ(parsed.dns_names.size(), 1U);
  EXPECT_EQ(parsed.dns_names.front(), "ip-10-0-0-1.ec2.internal");
  ASSERT_EQ(parsed.ip_addresses.size(), 2U);
  EXPECT_EQ(parsed.ip_addresses[0], "10.0.0.1");
  EXPECT_EQ(parsed.ip_addresses[1], "fd00:0:0:0:0:0:0:1");
  ASSERT_EQ(parsed.email_addresses.size(), 1U);
  EXPECT_EQ(parsed.email_addresses.front(), "ops@example.com");
  EXPECT_NE(parsed.request, nullptr);
}

TEST(CertificateRequestTest, ParsesRawDer) {
  const auto parsed = ParseCertificateRequest(GenerateCsrDer(NodeRequest()));
  EXPECT_EQ(parsed.common_name, "system:node:ip-10-0-0-1.ec2.internal");
}

TEST(CertificateRequestTest, MultipleOrganizationsArePreserved) {
  CsrOptions options;
  options.common_name = "etcd";
  options.organizations = {"system:etcd-peers", "system:etcd-servers"};
  const auto parsed = ParseCertificateRequest(GenerateCsrPem(options));
  ASSERT_EQ(parsed.organizations.size(), 2U);
  EXPECT_EQ(parsed.organizations[1], "system:etcd-servers");
}

TEST(CertificateRequestTest, RejectsEmptyInput) {
  try {
    ParseCertificateRequest("");
    FAIL() << "expected CertificateRequestError";
  } catch (const CertificateRequestError& ex) {
    EXPECT_EQ(ex.kind(), CertificateRequestError::Kind::Malformed);
  }
}

TEST(CertificateRequestTest, RejectsWrongPemBlockType) {
  const std::string pem =
      "-----BEGIN CERTIFICATE-----\nMIIB\n-----END CERTIFICATE-----\n";
  EXPECT_THROW(ParseCertificateRequest(pem), CertificateRequestError);
}

TEST(CertificateRequestTest, RejectsGarbageDer) {
  EXPECT_THROW(ParseCertificateRequest(std::string("\x30\x03\x02\x01", 4)),
               CertificateRequestError);
}

TEST(CertificateRequestTest, RejectsTamperedSignature) {
  std::string der = GenerateCsrDer(NodeRequest());
  // The signature bit string is the trailing field.
  der[der.size() - 8] = static_cast<char>(der[der.size() - 8] ^ 0xFF);
  try {
    ParseCertificateRequest(der);
    FAIL() << "expected CertificateRequestError";
  } catch (const CertificateRequestError& ex) {
    EXPECT_EQ(ex.kind(), CertificateRequestError::Kind::BadSignature);
  }
}

}  // namespace
}  // namespace tollgate::shared
