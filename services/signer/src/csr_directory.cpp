#include "csr_directory.h"

#include <unistd.h>

#include <filesystem>
#include <fstream>
#include <functional>
#include <sstream>
#include <system_error>

#include <google/protobuf/util/json_util.h>

namespace tollgate::signer {
namespace {

constexpr size_t kMaxNameBytes = 253;

}  // namespace

CsrDirectoryError::CsrDirectoryError(Kind kind, const std::string& message)
    : std::runtime_error(message), kind_(kind) {}

CsrDirectoryError::Kind CsrDirectoryError::kind() const noexcept { return kind_; }

void ValidateRequestName(const std::string& name) {
  if (name.empty()) {
    throw CsrDirectoryError(CsrDirectoryError::Kind::InvalidName,
                            "request name is required");
  }
  if (name.size() > kMaxNameBytes) {
    throw CsrDirectoryError(CsrDirectoryError::Kind::InvalidName,
                            "request name exceeds size limit");
  }
  if (name.front() == '.' || name.find("..") != std::string::npos ||
      name.find('/') != std::string::npos || name.find('\\') != std::string::npos ||
      name.find('\0') != std::string::npos) {
    throw CsrDirectoryError(CsrDirectoryError::Kind::InvalidName,
                            "request name is not a valid file name");
  }
}

CsrDirectory::CsrDirectory(std::string directory) : directory_(std::move(directory)) {
  if (directory_.empty()) {
    throw CsrDirectoryError(CsrDirectoryError::Kind::Io,
                            "request directory is required");
  }
  std::error_code ec;
  std::filesystem::create_directories(directory_, ec);
  if (ec) {
    throw CsrDirectoryError(CsrDirectoryError::Kind::Io,
                            "failed to create request directory " + directory_ +
                                ": " + ec.message());
  }
}

const std::string& CsrDirectory::directory() const noexcept { return directory_; }

// Temp names start with '.', which ValidateRequestName never accepts, and are
// unique per process and write.
std::string CsrDirectory::NextTempPath() {
  const std::string file = ".tmp-" + std::to_string(::getpid()) + "-" +
                           std::to_string(temp_counter_.fetch_add(1));
  return (std::filesystem::path(directory_) / file).string();
}

std::mutex& CsrDirectory::WriteLockFor(const std::string& name) {
  return write_locks_[std::hash<std::string>{}(name) % write_locks_.size()];
}

std::string CsrDirectory::PathFor(const std::string& name) const {
  ValidateRequestName(name);
  return (std::filesystem::path(directory_) / name).string();
}

void CsrDirectory::Write(const CertificateSigningRequest& request) {
  const std::string path = PathFor(request.metadata().name());

  std::string json;
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace = true;
  const auto status =
      google::protobuf::util::MessageToJsonString(request, &json, options);
  if (!status.ok()) {
    throw CsrDirectoryError(CsrDirectoryError::Kind::Corrupt,
                            "failed to encode signing request: " +
                                std::string(status.message()));
  }

  std::lock_guard<std::mutex> lock(WriteLockFor(request.metadata().name()));
  const std::string temp_path = NextTempPath();
  {
    std::ofstream file(temp_path, std::ios::out | std::ios::binary | std::ios::trunc);
    if (!file) {
      throw CsrDirectoryError(CsrDirectoryError::Kind::Io,
                              "failed to open " + temp_path);
    }
    file << json;
    if (!file.flush()) {
      throw CsrDirectoryError(CsrDirectoryError::Kind::Io,
                              "failed to write " + temp_path);
    }
  }

  std::error_code ec;
  std::filesystem::permissions(temp_path,
                               std::filesystem::perms::owner_read |
                                   std::filesystem::perms::owner_write,
                               std::filesystem::perm_options::replace, ec);
  if (!ec) {
    std::filesystem::rename(temp_path, path, ec);
  }
  if (ec) {
    std::error_code ignored;
    std::filesystem::remove(temp_path, ignored);
    throw CsrDirectoryError(CsrDirectoryError::Kind::Io,
                            "failed to persist " + path + ": " + ec.message());
  }
}

std::optional<CertificateSigningRequest> CsrDirectory::Read(
    const std::string& name) const {
  const std::string path = PathFor(name);
  std::ifstream file(path, std::ios::in | std::ios::binary);
  if (!file) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec) && !ec) {
      return std::nullopt;
    }
    throw CsrDirectoryError(CsrDirectoryError::Kind::Io, "failed to open " + path);
  }
  std::ostringstream buffer;
  buffer << file.rdbuf();

  CertificateSigningRequest request;
  const auto status =
      google::protobuf::util::JsonStringToMessage(buffer.str(), &request);
  if (!status.ok()) {
    throw CsrDirectoryError(CsrDirectoryError::Kind::Corrupt,
                            "stored signing request is corrupt: " + name);
  }
  return request;
}

}  // namespace tollgate::signer
