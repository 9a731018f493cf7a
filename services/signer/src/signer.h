#pragma once

#include <chrono>
#include <stdexcept>
#include <string>

#include "certificates.pb.h"
#include "tollgate/shared/certificate_request.h"

namespace tollgate::signer {

using certificates::v1::CertificateSigningRequest;

enum class Profile {
  EtcdPeer,
  EtcdServer,
  EtcdMetric,
};

const char* ProfileName(Profile profile);

struct SignerConfig {
  // Issuer for the peer and server profiles.
  std::string ca_cert_path;
  std::string ca_key_path;
  // Issuer for the metric profile.
  std::string metric_ca_cert_path;
  std::string metric_ca_key_path;

  std::chrono::seconds peer_duration = std::chrono::hours(8760);
  std::chrono::seconds server_duration = std::chrono::hours(8760);
  std::chrono::seconds metric_duration = std::chrono::hours(8760);
  std::chrono::seconds not_before_skew = std::chrono::minutes(5);
};

enum class SignerConfigErrorCode {
  MissingIssuer,
  IncompleteIssuerPair,
  UnreadableIssuerCertificate,
  UnreadableIssuerPrivateKey,
  InvalidIssuerCertificate,
  InvalidIssuerPrivateKey,
  KeyCertificateMismatch,
  InvalidDuration,
};

class SignerConfigError : public std::runtime_error {
 public:
  SignerConfigError(SignerConfigErrorCode code, const std::string& message);

  SignerConfigErrorCode code() const noexcept;

 private:
  SignerConfigErrorCode code_;
};

class SigningError : public std::runtime_error {
 public:
  enum class Kind {
    InvalidRequest,
    InvalidOrganization,
    InvalidCommonName,
    ProfileUnsupported,
    Internal,
  };

  SigningError(Kind kind, const std::string& message,
               CertificateSigningRequest denied = {});

  Kind kind() const noexcept;
  // The request with its conditions replaced by a single DENIED entry.
  const CertificateSigningRequest& denied() const noexcept;

 private:
  Kind kind_;
  CertificateSigningRequest denied_;
};

// Picks the profile from the first subject organization; the common name
// must start with the organization minus its trailing character plus ':'.
Profile SelectProfile(const shared::ParsedCertificateRequest& parsed);

class Signer {
 public:
  virtual ~Signer() = default;

  // Returns a copy of `request` carrying the issued certificate and an
  // APPROVED condition. Failures throw SigningError carrying the denied copy.
  virtual CertificateSigningRequest Sign(
      const CertificateSigningRequest& request) = 0;
};

void ValidateSignerKeyMaterial(const SignerConfig& config);

class ProfileSigner final : public Signer {
 public:
  explicit ProfileSigner(SignerConfig config);

  const SignerConfig& config() const noexcept;
  bool Supports(Profile profile) const noexcept;

  CertificateSigningRequest Sign(const CertificateSigningRequest& request) override;

 private:
  std::string Issue(Profile profile,
                    const shared::ParsedCertificateRequest& parsed) const;

  SignerConfig config_;
};

}  // namespace tollgate::signer
