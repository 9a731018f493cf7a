#pragma once

#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>

#include "recognizer.h"
#include "tollgate/shared/csr_store.h"
#include "tollgate/shared/metrics.h"

namespace tollgate::approver {

enum class SyncOutcome {
  // The request no longer exists.
  Deleted,
  // The request already carries a decision or a certificate.
  Skipped,
  Approved,
  // No recognizer matched; the request is left untouched.
  Pending,
};

const char* SyncOutcomeName(SyncOutcome outcome);

class SyncError : public std::runtime_error {
 public:
  enum class Kind {
    InvalidRequest,
    Transient,
    Conflict,
    Unavailable,
  };

  SyncError(Kind kind, const std::string& message);

  Kind kind() const noexcept;

 private:
  Kind kind_;
};

const char* SyncErrorKindName(SyncError::Kind kind);

inline constexpr const char* kAutoApprovedReason = "AutoApproved";

class Approver {
 public:
  Approver(std::shared_ptr<shared::CsrStore> store,
           std::shared_ptr<const RecognizerSet> recognizers,
           std::shared_ptr<shared::Metrics> metrics = nullptr);

  // Decides a single request by name. Retriable failures throw SyncError.
  SyncOutcome Sync(const std::string& name);

 private:
  void Count(std::string_view counter);

  std::shared_ptr<shared::CsrStore> store_;
  std::shared_ptr<const RecognizerSet> recognizers_;
  std::shared_ptr<shared::Metrics> metrics_;
};

}  // namespace tollgate::approver
