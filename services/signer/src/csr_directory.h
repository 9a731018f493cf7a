#pragma once

#include <array>
#include <atomic>
#include <cstdint>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>

#include "certificates.pb.h"

namespace tollgate::signer {

using certificates::v1::CertificateSigningRequest;

class CsrDirectoryError : public std::runtime_error {
 public:
  enum class Kind {
    InvalidName,
    Io,
    Corrupt,
  };

  CsrDirectoryError(Kind kind, const std::string& message);

  Kind kind() const noexcept;

 private:
  Kind kind_;
};

// Rejects empty names, dot-prefixed names (reserved for in-flight writes) and
// anything that could escape the directory.
void ValidateRequestName(const std::string& name);

// Signed requests persisted as one JSON document per request name.
class CsrDirectory {
 public:
  explicit CsrDirectory(std::string directory);

  CsrDirectory(const CsrDirectory&) = delete;
  CsrDirectory& operator=(const CsrDirectory&) = delete;

  const std::string& directory() const noexcept;

  void Write(const CertificateSigningRequest& request);
  std::optional<CertificateSigningRequest> Read(const std::string& name) const;

 private:
  std::string PathFor(const std::string& name) const;
  std::string NextTempPath();
  std::mutex& WriteLockFor(const std::string& name);

  std::string directory_;
  std::atomic<uint64_t> temp_counter_{0};
  std::array<std::mutex, 32> write_locks_;
};

}  // namespace tollgate::signer
