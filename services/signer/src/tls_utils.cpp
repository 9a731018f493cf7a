#include "tls_utils.h"

#include <memory>
#include <stdexcept>

#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/x509.h>

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

std::unique_ptr<BIO, BioDeleter> MemoryBio(const std::string& pem,
                                           const char* what) {
  std::unique_ptr<BIO, BioDeleter> bio(
      BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size())));
  if (!bio) {
    throw std::runtime_error(std::string("Failed to allocate ") + what + " BIO");
  }
  return bio;
}

}  // namespace

int CountPemCertificates(const std::string& bundle_pem) {
  auto bio = MemoryBio(bundle_pem, "CA bundle");
  int count = 0;
  while (true) {
    std::unique_ptr<X509, X509Deleter> cert(
        PEM_read_bio_X509(bio.get(), nullptr, nullptr, nullptr));
    if (!cert) {
      break;
    }
    ++count;
  }
  return count;
}

void ValidateServerTlsCredentials(const std::string& cert_pem,
                                  const std::string& key_pem,
                                  const std::string& ca_bundle_pem) {
  auto cert_bio = MemoryBio(cert_pem, "cert");
  std::unique_ptr<X509, X509Deleter> cert(
      PEM_read_bio_X509(cert_bio.get(), nullptr, nullptr, nullptr));
  if (!cert) {
    throw std::runtime_error("Invalid TLS certificate PEM");
  }
  auto key_bio = MemoryBio(key_pem, "key");
  std::unique_ptr<EVP_PKEY, PkeyDeleter> key(
      PEM_read_bio_PrivateKey(key_bio.get(), nullptr, nullptr, nullptr));
  if (!key) {
    throw std::runtime_error("Invalid TLS private key PEM");
  }
  if (X509_check_private_key(cert.get(), key.get()) != 1) {
    throw std::runtime_error("TLS private key does not match certificate");
  }

  if (X509_cmp_current_time(X509_get0_notBefore(cert.get())) > 0) {
    throw std::runtime_error("TLS certificate is not yet valid");
  }
  if (X509_cmp_current_time(X509_get0_notAfter(cert.get())) < 0) {
    throw std::runtime_error("TLS certificate has expired");
  }

  if (!ca_bundle_pem.empty() && CountPemCertificates(ca_bundle_pem) == 0) {
    throw std::runtime_error("TLS CA bundle does not contain any certificate");
  }
}

}  // namespace tollgate::signer
