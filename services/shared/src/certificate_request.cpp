#include "tollgate/shared/certificate_request.h"

#include <cstdio>
#include <string_view>

#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/x509v3.h>

namespace tollgate::shared {
namespace {

constexpr std::string_view kPemRequestHeader = "-----BEGIN CERTIFICATE REQUEST-----";
constexpr std::string_view kPemNewRequestHeader =
    "-----BEGIN NEW CERTIFICATE REQUEST-----";

struct BioDeleter {
  void operator()(BIO* bio) const { BIO_free(bio); }
};

struct PkeyDeleter {
  void operator()(EVP_PKEY* key) const { EVP_PKEY_free(key); }
};

struct X509ReqDeleter {
  void operator()(X509_REQ* req) const { X509_REQ_free(req); }
};

struct ExtensionsDeleter {
  void operator()(STACK_OF(X509_EXTENSION)* exts) const {
    sk_X509_EXTENSION_pop_free(exts, X509_EXTENSION_free);
  }
};

struct GeneralNamesDeleter {
  void operator()(GENERAL_NAMES* names) const { GENERAL_NAMES_free(names); }
};

std::unique_ptr<X509_REQ, X509ReqDeleter> DecodePem(const std::string& pem) {
  std::unique_ptr<BIO, BioDeleter> bio(
      BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size())));
  if (!bio) {
    throw CertificateRequestError(CertificateRequestError::Kind::Malformed,
                                  "failed to allocate request buffer");
  }
  std::unique_ptr<X509_REQ, X509ReqDeleter> req(
      PEM_read_bio_X509_REQ(bio.get(), nullptr, nullptr, nullptr));
  if (!req) {
    throw CertificateRequestError(CertificateRequestError::Kind::Malformed,
                                  "PEM block type must be CERTIFICATE REQUEST");
  }
  return req;
}

std::unique_ptr<X509_REQ, X509ReqDeleter> DecodeDer(const std::string& der) {
  const unsigned char* cursor =
      reinterpret_cast<const unsigned char*>(der.data());
  const unsigned char* end = cursor + der.size();
  std::unique_ptr<X509_REQ, X509ReqDeleter> req(
      d2i_X509_REQ(nullptr, &cursor, static_cast<long>(der.size())));
  if (!req || cursor != end) {
    throw CertificateRequestError(CertificateRequestError::Kind::Malformed,
                                  "invalid certificate request encoding");
  }
  return req;
}

std::string Asn1ToUtf8(const ASN1_STRING* data) {
  unsigned char* utf8 = nullptr;
  const int length = ASN1_STRING_to_UTF8(&utf8, data);
  if (length < 0) {
    throw CertificateRequestError(CertificateRequestError::Kind::Malformed,
                                  "invalid subject attribute encoding");
  }
  std::string value(reinterpret_cast<char*>(utf8), static_cast<size_t>(length));
  OPENSSL_free(utf8);
  return value;
}

std::vector<std::string> SubjectValues(X509_NAME* subject, int nid) {
  std::vector<std::string> values;
  int index = -1;
  while ((index = X509_NAME_get_index_by_NID(subject, nid, index)) >= 0) {
    X509_NAME_ENTRY* entry = X509_NAME_get_entry(subject, index);
    values.push_back(Asn1ToUtf8(X509_NAME_ENTRY_get_data(entry)));
  }
  return values;
}

std::string FormatIpAddress(const ASN1_OCTET_STRING* address) {
  const unsigned char* bytes = ASN1_STRING_get0_data(address);
  const int length = ASN1_STRING_length(address);
  if (length == 4) {
    char buffer[16];
    std::snprintf(buffer, sizeof(buffer), "%u.%u.%u.%u", bytes[0], bytes[1],
                  bytes[2], bytes[3]);
    return buffer;
  }
  if (length == 16) {
    std::string out;
    for (int i = 0; i < 16; i += 2) {
      char group[5];
      std::snprintf(group, sizeof(group), "%x",
                    static_cast<unsigned>((bytes[i] << 8) | bytes[i + 1]));
      if (!out.empty()) {
        out += ":";
      }
      out += group;
    }
    return out;
  }
  throw CertificateRequestError(CertificateRequestError::Kind::Malformed,
                                "invalid IP address in subject alternative name");
}

void CollectSubjectAltNames(X509_REQ* req, ParsedCertificateRequest* parsed) {
  std::unique_ptr<STACK_OF(X509_EXTENSION), ExtensionsDeleter> exts(
      X509_REQ_get_extensions(req));
  if (!exts) {
    return;
  }
  for (int i = 0; i < sk_X509_EXTENSION_num(exts.get()); ++i) {
    X509_EXTENSION* ext = sk_X509_EXTENSION_value(exts.get(), i);
    if (OBJ_obj2nid(X509_EXTENSION_get_object(ext)) != NID_subject_alt_name) {
      continue;
    }
    std::unique_ptr<GENERAL_NAMES, GeneralNamesDeleter> names(
        static_cast<GENERAL_NAMES*>(X509V3_EXT_d2i(ext)));
    if (!names) {
      throw CertificateRequestError(CertificateRequestError::Kind::Malformed,
                                    "failed to parse subject alternative names");
    }
    for (int n = 0; n < sk_GENERAL_NAME_num(names.get()); ++n) {
      GENERAL_NAME* name = sk_GENERAL_NAME_value(names.get(), n);
      switch (name->type) {
        case GEN_DNS:
          parsed->dns_names.emplace_back(
              reinterpret_cast<const char*>(ASN1_STRING_get0_data(name->d.dNSName)),
              static_cast<size_t>(ASN1_STRING_length(name->d.dNSName)));
          break;
        case GEN_EMAIL:
          parsed->email_addresses.emplace_back(
              reinterpret_cast<const char*>(
                  ASN1_STRING_get0_data(name->d.rfc822Name)),
              static_cast<size_t>(ASN1_STRING_length(name->d.rfc822Name)));
          break;
        case GEN_IPADD:
          parsed->ip_addresses.push_back(FormatIpAddress(name->d.iPAddress));
          break;
        default:
          break;
      }
    }
  }
}

}  // namespace

CertificateRequestError::CertificateRequestError(Kind kind,
                                                 const std::string& message)
    : std::runtime_error(message), kind_(kind) {}

CertificateRequestError::Kind CertificateRequestError::kind() const noexcept {
  return kind_;
}

ParsedCertificateRequest ParseCertificateRequest(const std::string& encoded) {
  if (encoded.empty()) {
    throw CertificateRequestError(CertificateRequestError::Kind::Malformed,
                                  "certificate request is empty");
  }

  const bool is_pem =
      encoded.find(kPemRequestHeader) != std::string::npos ||
      encoded.find(kPemNewRequestHeader) != std::string::npos;
  auto req = is_pem ? DecodePem(encoded) : DecodeDer(encoded);

  std::unique_ptr<EVP_PKEY, PkeyDeleter> key(X509_REQ_get_pubkey(req.get()));
  if (!key || X509_REQ_verify(req.get(), key.get()) != 1) {
    throw CertificateRequestError(CertificateRequestError::Kind::BadSignature,
                                  "certificate request signature verification failed");
  }

  ParsedCertificateRequest parsed;
  X509_NAME* subject = X509_REQ_get_subject_name(req.get());
  if (subject) {
    const auto common_names = SubjectValues(subject, NID_commonName);
    if (!common_names.empty()) {
      parsed.common_name = common_names.front();
    }
    parsed.organizations = SubjectValues(subject, NID_organizationName);
  }
  CollectSubjectAltNames(req.get(), &parsed);
  parsed.request = std::shared_ptr<X509_REQ>(req.release(), X509ReqDeleter{});
  return parsed;
}

}  // namespace tollgate::shared
