#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include <grpcpp/create_channel.h>
#include <grpcpp/security/credentials.h>

#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/x509.h>
#include <openssl/x509v3.h>

#include "certificates.grpc.pb.h"

namespace {

namespace v1 = tollgate::certificates::v1;

struct AgentArgs {
  std::string address = "127.0.0.1:6443";
  std::string ca_cert_path;
  std::string common_name;
  std::string org_name;
  std::string dns_names;
  std::string ip_addresses;
  std::string assets_dir;
  std::string csr_name;
  int submit_attempts = 30;
};

struct BioDeleter {
  void operator()(BIO* bio) const { BIO_free(bio); }
};

struct PkeyDeleter {
  void operator()(EVP_PKEY* key) const { EVP_PKEY_free(key); }
};

struct PkeyCtxDeleter {
  void operator()(EVP_PKEY_CTX* ctx) const { EVP_PKEY_CTX_free(ctx); }
};

struct X509ReqDeleter {
  void operator()(X509_REQ* req) const { X509_REQ_free(req); }
};

struct ExtensionsDeleter {
  void operator()(STACK_OF(X509_EXTENSION)* exts) const {
    sk_X509_EXTENSION_pop_free(exts, X509_EXTENSION_free);
  }
};

constexpr auto kSubmitRetryInterval = std::chrono::seconds(10);
constexpr auto kPollInterval = std::chrono::seconds(3);
constexpr auto kPollTimeout = std::chrono::seconds(10);

void PrintUsage(const char* name) {
  std::cout
      << "Usage: " << name
      << " --commonname CN --orgname ORG --assetsdir DIR --cacert PATH "
         "(--dnsnames LIST | --ipaddrs LIST) [options]\n"
      << "Options:\n"
      << "  --address ADDR     Signer address (default: 127.0.0.1:6443)\n"
      << "  --csrname NAME     Signing request name (default: common name)\n"
      << "  --attempts N       Submit attempts before giving up (default: 30)\n"
      << "  --help             Show this help\n";
}

bool ParseArgs(int argc, char** argv, AgentArgs* args) {
  for (int i = 1; i < argc; ++i) {
    const std::string_view arg(argv[i]);
    if (arg == "--help") {
      PrintUsage(argv[0]);
      return false;
    }
    if (i + 1 >= argc) {
      std::cerr << "missing value for " << arg << "\n";
      return false;
    }
    const std::string value = argv[++i];
    if (arg == "--address") {
      args->address = value;
    } else if (arg == "--cacert") {
      args->ca_cert_path = value;
    } else if (arg == "--commonname") {
      args->common_name = value;
    } else if (arg == "--orgname") {
      args->org_name = value;
    } else if (arg == "--dnsnames") {
      args->dns_names = value;
    } else if (arg == "--ipaddrs") {
      args->ip_addresses = value;
    } else if (arg == "--assetsdir") {
      args->assets_dir = value;
    } else if (arg == "--csrname") {
      args->csr_name = value;
    } else if (arg == "--attempts") {
      try {
        args->submit_attempts = std::stoi(value);
      } catch (const std::exception&) {
        std::cerr << "--attempts must be a positive integer\n";
        return false;
      }
      if (args->submit_attempts <= 0) {
        std::cerr << "--attempts must be a positive integer\n";
        return false;
      }
    } else {
      std::cerr << "unknown flag " << arg << "\n";
      return false;
    }
  }

  if (args->dns_names.empty() && args->ip_addresses.empty()) {
    std::cerr << "need to provide at least one of --ipaddrs and --dnsnames\n";
    return false;
  }
  for (const auto& [flag, value] :
       {std::pair<const char*, const std::string*>{"--commonname", &args->common_name},
        {"--orgname", &args->org_name},
        {"--assetsdir", &args->assets_dir},
        {"--cacert", &args->ca_cert_path}}) {
    if (value->empty()) {
      std::cerr << "missing required flag: " << flag << "\n";
      return false;
    }
  }
  if (args->csr_name.empty()) {
    args->csr_name = args->common_name;
  }
  return true;
}

std::vector<std::string> SplitList(const std::string& value) {
  std::vector<std::string> out;
  std::stringstream stream(value);
  std::string item;
  while (std::getline(stream, item, ',')) {
    if (!item.empty()) {
      out.push_back(item);
    }
  }
  return out;
}

// "[::1]" -> "::1"
std::string UnescapeIpv6Address(const std::string& address) {
  if (address.size() >= 2 && address.front() == '[' && address.back() == ']') {
    return address.substr(1, address.size() - 2);
  }
  return address;
}

std::string ReadFile(const std::string& path) {
  std::ifstream file(path, std::ios::in | std::ios::binary);
  if (!file) {
    throw std::runtime_error("failed to open file: " + path);
  }
  std::ostringstream buffer;
  buffer << file.rdbuf();
  return buffer.str();
}

void WriteFile(const std::filesystem::path& path, const std::string& contents,
               std::filesystem::perms perms) {
  std::ofstream file(path, std::ios::out | std::ios::binary | std::ios::trunc);
  if (!file) {
    throw std::runtime_error("unable to write to " + path.string());
  }
  file << contents;
  file.close();
  std::filesystem::permissions(path, perms, std::filesystem::perm_options::replace);
}

std::unique_ptr<EVP_PKEY, PkeyDeleter> GenerateRsaKey() {
  std::unique_ptr<EVP_PKEY_CTX, PkeyCtxDeleter> ctx(
      EVP_PKEY_CTX_new_id(EVP_PKEY_RSA, nullptr));
  if (!ctx || EVP_PKEY_keygen_init(ctx.get()) <= 0 ||
      EVP_PKEY_CTX_set_rsa_keygen_bits(ctx.get(), 2048) <= 0) {
    throw std::runtime_error("failed to initialize key generation");
  }
  EVP_PKEY* raw = nullptr;
  if (EVP_PKEY_keygen(ctx.get(), &raw) <= 0) {
    throw std::runtime_error("failed to generate private key");
  }
  return std::unique_ptr<EVP_PKEY, PkeyDeleter>(raw);
}

std::string PrivateKeyToPem(EVP_PKEY* key) {
  std::unique_ptr<BIO, BioDeleter> bio(BIO_new(BIO_s_mem()));
  if (!bio ||
      PEM_write_bio_PrivateKey(bio.get(), key, nullptr, nullptr, 0, nullptr,
                               nullptr) != 1) {
    throw std::runtime_error("failed to encode private key");
  }
  BUF_MEM* mem = nullptr;
  BIO_get_mem_ptr(bio.get(), &mem);
  return std::string(mem->data, mem->length);
}

std::string BuildCsrPem(const AgentArgs& args, EVP_PKEY* key) {
  std::unique_ptr<X509_REQ, X509ReqDeleter> req(X509_REQ_new());
  if (!req) {
    throw std::runtime_error("failed to allocate certificate request");
  }
  X509_NAME* name = X509_REQ_get_subject_name(req.get());
  if (X509_NAME_add_entry_by_txt(
          name, "O", MBSTRING_UTF8,
          reinterpret_cast<const unsigned char*>(args.org_name.c_str()), -1, -1,
          0) != 1 ||
      X509_NAME_add_entry_by_txt(
          name, "CN", MBSTRING_UTF8,
          reinterpret_cast<const unsigned char*>(args.common_name.c_str()), -1, -1,
          0) != 1) {
    throw std::runtime_error("failed to set certificate request subject");
  }

  std::string san;
  for (const auto& dns : SplitList(args.dns_names)) {
    san += (san.empty() ? "DNS:" : ",DNS:") + dns;
  }
  for (const auto& ip : SplitList(args.ip_addresses)) {
    san += (san.empty() ? "IP:" : ",IP:") + UnescapeIpv6Address(ip);
  }
  std::unique_ptr<STACK_OF(X509_EXTENSION), ExtensionsDeleter> exts(
      sk_X509_EXTENSION_new_null());
  X509_EXTENSION* ext = X509V3_EXT_conf_nid(nullptr, nullptr, NID_subject_alt_name,
                                            const_cast<char*>(san.c_str()));
  if (!exts || !ext) {
    X509_EXTENSION_free(ext);
    throw std::runtime_error("invalid subject alternative names: " + san);
  }
  sk_X509_EXTENSION_push(exts.get(), ext);
  if (X509_REQ_add_extensions(req.get(), exts.get()) != 1 ||
      X509_REQ_set_pubkey(req.get(), key) != 1 ||
      X509_REQ_sign(req.get(), key, EVP_sha256()) <= 0) {
    throw std::runtime_error("failed to sign certificate request");
  }

  std::unique_ptr<BIO, BioDeleter> bio(BIO_new(BIO_s_mem()));
  if (!bio || PEM_write_bio_X509_REQ(bio.get(), req.get()) != 1) {
    throw std::runtime_error("failed to encode certificate request");
  }
  BUF_MEM* mem = nullptr;
  BIO_get_mem_ptr(bio.get(), &mem);
  return std::string(mem->data, mem->length);
}

bool IsDecided(const v1::CertificateSigningRequest& csr, bool* denied) {
  for (const auto& condition : csr.status().conditions()) {
    if (condition.type() == v1::CONDITION_TYPE_DENIED) {
      *denied = true;
      return true;
    }
    if (condition.type() == v1::CONDITION_TYPE_APPROVED &&
        !csr.status().certificate().empty()) {
      return true;
    }
  }
  return false;
}

v1::CertificateSigningRequest WaitForCertificate(v1::Signer::Stub* stub,
                                                 const std::string& name) {
  const auto deadline = std::chrono::steady_clock::now() + kPollTimeout;
  while (true) {
    grpc::ClientContext context;
    v1::GetCertificateSigningRequestRequest request;
    request.set_name(name);
    v1::GetCertificateSigningRequestResponse response;
    const auto status = stub->GetCertificateSigningRequest(&context, request, &response);
    bool denied = false;
    if (status.ok() && IsDecided(response.csr(), &denied)) {
      return response.csr();
    }
    if (!status.ok()) {
      std::cerr << "unable to retrieve signing request: " << status.error_message()
                << ". Retrying.\n";
    }
    if (std::chrono::steady_clock::now() >= deadline) {
      throw std::runtime_error("timed out waiting for signed certificate");
    }
    std::this_thread::sleep_for(kPollInterval);
  }
}

}  // namespace

int main(int argc, char** argv) {
  AgentArgs args;
  if (!ParseArgs(argc, argv, &args)) {
    return 1;
  }

  try {
    std::filesystem::create_directories(args.assets_dir);
    const std::filesystem::path assets(args.assets_dir);

    auto key = GenerateRsaKey();
    WriteFile(assets / (args.common_name + ".key"), PrivateKeyToPem(key.get()),
              std::filesystem::perms::owner_read | std::filesystem::perms::owner_write);

    v1::SubmitCertificateSigningRequestRequest request;
    request.mutable_csr()->mutable_metadata()->set_name(args.csr_name);
    request.mutable_csr()->mutable_spec()->set_request(BuildCsrPem(args, key.get()));

    grpc::SslCredentialsOptions ssl_options;
    ssl_options.pem_root_certs = ReadFile(args.ca_cert_path);
    auto channel =
        grpc::CreateChannel(args.address, grpc::SslCredentials(ssl_options));
    auto stub = v1::Signer::NewStub(channel);

    v1::SubmitCertificateSigningRequestResponse response;
    grpc::Status status;
    for (int attempt = 1; attempt <= args.submit_attempts; ++attempt) {
      grpc::ClientContext context;
      response.Clear();
      status = stub->SubmitCertificateSigningRequest(&context, request, &response);
      if (status.error_code() != grpc::StatusCode::UNAVAILABLE) {
        break;
      }
      std::cerr << "error sending signing request to signer: "
                << status.error_message() << "\n";
      if (attempt < args.submit_attempts) {
        std::this_thread::sleep_for(kSubmitRetryInterval);
      }
    }
    if (!status.ok()) {
      std::cerr << "signing request rejected: " << status.error_message() << "\n";
      return 1;
    }

    v1::CertificateSigningRequest signed_csr = response.csr();
    bool denied = false;
    if (!IsDecided(signed_csr, &denied)) {
      signed_csr = WaitForCertificate(stub.get(), args.csr_name);
    }
    if (denied) {
      std::cerr << "signing request was denied\n";
      return 1;
    }

    WriteFile(assets / (args.common_name + ".crt"), signed_csr.status().certificate(),
              std::filesystem::perms::owner_read | std::filesystem::perms::owner_write |
                  std::filesystem::perms::group_read |
                  std::filesystem::perms::others_read);
    std::cout << "certificate written to "
              << (assets / (args.common_name + ".crt")).string() << "\n";
  } catch (const std::exception& ex) {
    std::cerr << "Signer agent failed: " << ex.what() << "\n";
    return 1;
  }
  return 0;
}
