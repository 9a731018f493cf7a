#include "signer.h"

#include <array>
#include <memory>
#include <string_view>

#include <openssl/bn.h>
#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/rand.h>
#include <openssl/x509.h>
#include <openssl/x509v3.h>

namespace tollgate::signer {
namespace {

struct BioDeleter {
  void operator()(BIO* bio) const { BIO_free(bio); }
};

struct PkeyDeleter {
  void operator()(EVP_PKEY* key) const { EVP_PKEY_free(key); }
};

struct X509Deleter {
  void operator()(X509* cert) const { X509_free(cert); }
};

struct BnDeleter {
  void operator()(BIGNUM* bn) const { BN_free(bn); }
};

struct Asn1IntegerDeleter {
  void operator()(ASN1_INTEGER* integer) const { ASN1_INTEGER_free(integer); }
};

struct ExtensionsDeleter {
  void operator()(STACK_OF(X509_EXTENSION)* exts) const {
    sk_X509_EXTENSION_pop_free(exts, X509_EXTENSION_free);
  }
};

struct ProfilePolicy {
  Profile profile;
  std::string_view organization;
  const char* key_usage;
  const char* extended_key_usage;
};

constexpr std::array<ProfilePolicy, 3> kProfiles = {{
    {Profile::EtcdPeer, "system:etcd-peers",
     "critical,digitalSignature,keyEncipherment", "clientAuth,serverAuth"},
    {Profile::EtcdServer, "system:etcd-servers",
     "critical,digitalSignature,keyEncipherment", "serverAuth"},
    {Profile::EtcdMetric, "system:etcd-metrics",
     "critical,digitalSignature,keyEncipherment", "clientAuth,serverAuth"},
}};

const ProfilePolicy& PolicyFor(Profile profile) {
  for (const auto& policy : kProfiles) {
    if (policy.profile == profile) {
      return policy;
    }
  }
  throw SigningError(SigningError::Kind::Internal, "unknown signing profile");
}

std::unique_ptr<BIO, BioDeleter> OpenFileBio(const std::string& path,
                                             SignerConfigErrorCode error_code,
                                             const std::string& message) {
  std::unique_ptr<BIO, BioDeleter> bio(BIO_new_file(path.c_str(), "rb"));
  if (!bio) {
    throw SignerConfigError(error_code, message + ": " + path);
  }
  return bio;
}

void ValidateIssuerPair(const std::string& cert_path, const std::string& key_path) {
  auto cert_bio = OpenFileBio(cert_path,
                              SignerConfigErrorCode::UnreadableIssuerCertificate,
                              "failed to read issuer certificate");
  std::unique_ptr<X509, X509Deleter> cert(
      PEM_read_bio_X509(cert_bio.get(), nullptr, nullptr, nullptr));
  if (!cert) {
    throw SignerConfigError(SignerConfigErrorCode::InvalidIssuerCertificate,
                            "failed to parse issuer certificate: " + cert_path);
  }

  auto key_bio = OpenFileBio(key_path,
                             SignerConfigErrorCode::UnreadableIssuerPrivateKey,
                             "failed to read issuer private key");
  std::unique_ptr<EVP_PKEY, PkeyDeleter> key(
      PEM_read_bio_PrivateKey(key_bio.get(), nullptr, nullptr, nullptr));
  if (!key) {
    throw SignerConfigError(SignerConfigErrorCode::InvalidIssuerPrivateKey,
                            "failed to parse issuer private key: " + key_path);
  }

  if (X509_check_private_key(cert.get(), key.get()) != 1) {
    throw SignerConfigError(SignerConfigErrorCode::KeyCertificateMismatch,
                            "issuer private key does not match certificate: " +
                                cert_path);
  }
}

std::unique_ptr<X509, X509Deleter> LoadIssuerCertificate(const std::string& path) {
  std::unique_ptr<BIO, BioDeleter> bio(BIO_new_file(path.c_str(), "rb"));
  if (!bio) {
    throw SigningError(SigningError::Kind::Internal,
                       "error reading CA cert file " + path);
  }
  std::unique_ptr<X509, X509Deleter> cert(
      PEM_read_bio_X509(bio.get(), nullptr, nullptr, nullptr));
  if (!cert) {
    throw SigningError(SigningError::Kind::Internal,
                       "error parsing CA cert file " + path);
  }
  return cert;
}

std::unique_ptr<EVP_PKEY, PkeyDeleter> LoadIssuerPrivateKey(const std::string& path) {
  std::unique_ptr<BIO, BioDeleter> bio(BIO_new_file(path.c_str(), "rb"));
  if (!bio) {
    throw SigningError(SigningError::Kind::Internal,
                       "error reading CA key file " + path);
  }
  std::unique_ptr<EVP_PKEY, PkeyDeleter> key(
      PEM_read_bio_PrivateKey(bio.get(), nullptr, nullptr, nullptr));
  if (!key) {
    throw SigningError(SigningError::Kind::Internal,
                       "malformed CA private key " + path);
  }
  return key;
}

void AddExtension(X509* certificate, X509* issuer, int nid, const char* value) {
  X509V3_CTX ctx;
  X509V3_set_ctx(&ctx, issuer, certificate, nullptr, nullptr, 0);
  X509V3_set_ctx_nodb(&ctx);
  X509_EXTENSION* ext =
      X509V3_EXT_conf_nid(nullptr, &ctx, nid, const_cast<char*>(value));
  if (!ext) {
    throw SigningError(SigningError::Kind::Internal,
                       "failed to create certificate extension");
  }
  if (X509_add_ext(certificate, ext, -1) != 1) {
    X509_EXTENSION_free(ext);
    throw SigningError(SigningError::Kind::Internal,
                       "failed to add certificate extension");
  }
  X509_EXTENSION_free(ext);
}

// Subject alternative names are optional for etcd members; copy them when
// present.
void CopySubjectAltNames(X509_REQ* csr, X509* certificate) {
  std::unique_ptr<STACK_OF(X509_EXTENSION), ExtensionsDeleter> exts(
      X509_REQ_get_extensions(csr));
  if (!exts) {
    return;
  }
  for (int i = 0; i < sk_X509_EXTENSION_num(exts.get()); ++i) {
    X509_EXTENSION* ext = sk_X509_EXTENSION_value(exts.get(), i);
    if (OBJ_obj2nid(X509_EXTENSION_get_object(ext)) != NID_subject_alt_name) {
      continue;
    }
    if (X509_add_ext(certificate, ext, -1) != 1) {
      throw SigningError(SigningError::Kind::Internal,
                         "failed to copy SAN extension to certificate");
    }
  }
}

void GenerateAndSetSerial(X509* certificate) {
  std::array<unsigned char, 16> serial_bytes{};
  if (RAND_bytes(serial_bytes.data(), static_cast<int>(serial_bytes.size())) != 1) {
    throw SigningError(SigningError::Kind::Internal,
                       "failed to generate certificate serial");
  }
  serial_bytes[0] &= 0x7f;

  std::unique_ptr<BIGNUM, BnDeleter> bn(
      BN_bin2bn(serial_bytes.data(), static_cast<int>(serial_bytes.size()), nullptr));
  if (!bn) {
    throw SigningError(SigningError::Kind::Internal,
                       "failed to allocate serial bignum");
  }
  std::unique_ptr<ASN1_INTEGER, Asn1IntegerDeleter> asn1(
      BN_to_ASN1_INTEGER(bn.get(), nullptr));
  if (!asn1 || X509_set_serialNumber(certificate, asn1.get()) != 1) {
    throw SigningError(SigningError::Kind::Internal,
                       "failed to set certificate serial");
  }
}

std::string X509ToPem(X509* cert) {
  std::unique_ptr<BIO, BioDeleter> bio(BIO_new(BIO_s_mem()));
  if (!bio || PEM_write_bio_X509(bio.get(), cert) != 1) {
    throw SigningError(SigningError::Kind::Internal,
                       "failed to encode certificate PEM");
  }
  BUF_MEM* mem = nullptr;
  BIO_get_mem_ptr(bio.get(), &mem);
  if (!mem || !mem->data || mem->length == 0) {
    throw SigningError(SigningError::Kind::Internal,
                       "empty certificate PEM output");
  }
  return std::string(mem->data, mem->length);
}

void SetNow(certificates::v1::CertificateSigningRequestCondition* condition) {
  const auto now = std::chrono::system_clock::now().time_since_epoch();
  condition->mutable_last_update_time()->set_seconds(
      std::chrono::duration_cast<std::chrono::seconds>(now).count());
}

}  // namespace

const char* ProfileName(Profile profile) {
  switch (profile) {
    case Profile::EtcdPeer:
      return "EtcdPeer";
    case Profile::EtcdServer:
      return "EtcdServer";
    case Profile::EtcdMetric:
      return "EtcdMetric";
  }
  return "Unknown";
}

SignerConfigError::SignerConfigError(SignerConfigErrorCode code,
                                     const std::string& message)
    : std::runtime_error(message), code_(code) {}

SignerConfigErrorCode SignerConfigError::code() const noexcept { return code_; }

SigningError::SigningError(Kind kind, const std::string& message,
                           CertificateSigningRequest denied)
    : std::runtime_error(message), kind_(kind), denied_(std::move(denied)) {}

SigningError::Kind SigningError::kind() const noexcept { return kind_; }

const CertificateSigningRequest& SigningError::denied() const noexcept {
  return denied_;
}

Profile SelectProfile(const shared::ParsedCertificateRequest& parsed) {
  if (parsed.organizations.size() != 1) {
    throw SigningError(SigningError::Kind::InvalidOrganization,
                       "invalid organization");
  }
  const std::string& organization = parsed.organizations.front();
  for (const auto& policy : kProfiles) {
    if (organization != policy.organization) {
      continue;
    }
    const std::string prefix =
        organization.substr(0, organization.size() - 1) + ":";
    if (parsed.common_name.rfind(prefix, 0) != 0) {
      throw SigningError(SigningError::Kind::InvalidCommonName,
                         "invalid subject Common Name");
    }
    return policy.profile;
  }
  throw SigningError(SigningError::Kind::InvalidOrganization,
                     "invalid organization");
}

void ValidateSignerKeyMaterial(const SignerConfig& config) {
  const bool has_main = !config.ca_cert_path.empty() || !config.ca_key_path.empty();
  const bool has_metric =
      !config.metric_ca_cert_path.empty() || !config.metric_ca_key_path.empty();
  if (!has_main && !has_metric) {
    throw SignerConfigError(SignerConfigErrorCode::MissingIssuer,
                            "at least one signing CA is required");
  }
  if (has_main) {
    if (config.ca_cert_path.empty() || config.ca_key_path.empty()) {
      throw SignerConfigError(SignerConfigErrorCode::IncompleteIssuerPair,
                              "CA certificate and key must be set together");
    }
    ValidateIssuerPair(config.ca_cert_path, config.ca_key_path);
  }
  if (has_metric) {
    if (config.metric_ca_cert_path.empty() || config.metric_ca_key_path.empty()) {
      throw SignerConfigError(
          SignerConfigErrorCode::IncompleteIssuerPair,
          "metric CA certificate and key must be set together");
    }
    ValidateIssuerPair(config.metric_ca_cert_path, config.metric_ca_key_path);
  }
  for (const auto duration :
       {config.peer_duration, config.server_duration, config.metric_duration}) {
    if (duration.count() <= 0) {
      throw SignerConfigError(SignerConfigErrorCode::InvalidDuration,
                              "certificate duration must be positive");
    }
  }
}

ProfileSigner::ProfileSigner(SignerConfig config) : config_(std::move(config)) {
  ValidateSignerKeyMaterial(config_);
}

const SignerConfig& ProfileSigner::config() const noexcept { return config_; }

bool ProfileSigner::Supports(Profile profile) const noexcept {
  if (profile == Profile::EtcdMetric) {
    return !config_.metric_ca_cert_path.empty() &&
           !config_.metric_ca_key_path.empty();
  }
  return !config_.ca_cert_path.empty() && !config_.ca_key_path.empty();
}

CertificateSigningRequest ProfileSigner::Sign(
    const CertificateSigningRequest& request) {
  CertificateSigningRequest result = request;
  auto* status = result.mutable_status();

  std::string stage = "error parsing profile: ";
  try {
    shared::ParsedCertificateRequest parsed;
    try {
      parsed = shared::ParseCertificateRequest(request.spec().request());
    } catch (const shared::CertificateRequestError& ex) {
      throw SigningError(SigningError::Kind::InvalidRequest,
                         std::string("error parsing CSR: ") + ex.what());
    }
    const Profile profile = SelectProfile(parsed);

    stage = "certificate signing error: ";
    const std::string certificate = Issue(profile, parsed);

    status->clear_conditions();
    auto* approved = status->add_conditions();
    approved->set_type(certificates::v1::CONDITION_TYPE_APPROVED);
    SetNow(approved);
    status->set_certificate(certificate);
    return result;
  } catch (const SigningError& ex) {
    status->clear_conditions();
    status->clear_certificate();
    auto* denied = status->add_conditions();
    denied->set_type(certificates::v1::CONDITION_TYPE_DENIED);
    denied->set_message(stage + ex.what());
    SetNow(denied);
    throw SigningError(ex.kind(), ex.what(), std::move(result));
  }
}

std::string ProfileSigner::Issue(Profile profile,
                                 const shared::ParsedCertificateRequest& parsed) const {
  if (!Supports(profile)) {
    throw SigningError(SigningError::Kind::ProfileUnsupported,
                       "csr profile is not currently supported");
  }
  const auto& policy = PolicyFor(profile);
  const bool metric = profile == Profile::EtcdMetric;
  auto issuer_cert =
      LoadIssuerCertificate(metric ? config_.metric_ca_cert_path : config_.ca_cert_path);
  auto issuer_key =
      LoadIssuerPrivateKey(metric ? config_.metric_ca_key_path : config_.ca_key_path);
  const std::chrono::seconds duration =
      profile == Profile::EtcdPeer     ? config_.peer_duration
      : profile == Profile::EtcdServer ? config_.server_duration
                                       : config_.metric_duration;

  X509_REQ* csr = parsed.request.get();
  std::unique_ptr<X509, X509Deleter> leaf(X509_new());
  if (!leaf) {
    throw SigningError(SigningError::Kind::Internal,
                       "failed to allocate output certificate");
  }
  if (X509_set_version(leaf.get(), 2) != 1) {
    throw SigningError(SigningError::Kind::Internal,
                       "failed to set certificate version");
  }

  GenerateAndSetSerial(leaf.get());
  if (X509_set_issuer_name(leaf.get(), X509_get_subject_name(issuer_cert.get())) != 1 ||
      X509_set_subject_name(leaf.get(), X509_REQ_get_subject_name(csr)) != 1) {
    throw SigningError(SigningError::Kind::Internal,
                       "failed to set certificate names");
  }

  std::unique_ptr<EVP_PKEY, PkeyDeleter> subject_key(X509_REQ_get_pubkey(csr));
  if (!subject_key || X509_set_pubkey(leaf.get(), subject_key.get()) != 1) {
    throw SigningError(SigningError::Kind::InvalidRequest,
                       "failed to extract CSR public key");
  }

  if (!X509_gmtime_adj(X509_getm_notBefore(leaf.get()),
                       -static_cast<long>(config_.not_before_skew.count())) ||
      !X509_gmtime_adj(X509_getm_notAfter(leaf.get()),
                       static_cast<long>(duration.count()))) {
    throw SigningError(SigningError::Kind::Internal,
                       "failed to set certificate validity");
  }

  AddExtension(leaf.get(), issuer_cert.get(), NID_basic_constraints,
               "critical,CA:FALSE");
  AddExtension(leaf.get(), issuer_cert.get(), NID_key_usage, policy.key_usage);
  AddExtension(leaf.get(), issuer_cert.get(), NID_ext_key_usage,
               policy.extended_key_usage);
  AddExtension(leaf.get(), issuer_cert.get(), NID_subject_key_identifier, "hash");
  AddExtension(leaf.get(), issuer_cert.get(), NID_authority_key_identifier,
               "keyid,issuer");
  CopySubjectAltNames(csr, leaf.get());

  if (X509_sign(leaf.get(), issuer_key.get(), EVP_sha256()) <= 0) {
    throw SigningError(SigningError::Kind::Internal, "failed to sign certificate");
  }
  return X509ToPem(leaf.get());
}

}  // namespace tollgate::signer
