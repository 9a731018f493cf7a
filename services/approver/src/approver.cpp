#include "approver.h"

#include <chrono>
#include <vector>

#include "cloud_provider.h"
#include "log_utils.h"
#include "tollgate/shared/certificate_request.h"

namespace tollgate::approver {
namespace {

std::string Join(const std::vector<std::string>& lines) {
  std::string out;
  for (const auto& line : lines) {
    if (!out.empty()) {
      out += "; ";
    }
    out += line;
  }
  return out;
}

void FillTimestamp(std::chrono::system_clock::time_point tp,
                   google::protobuf::Timestamp* timestamp) {
  const auto since_epoch = tp.time_since_epoch();
  const auto seconds = std::chrono::duration_cast<std::chrono::seconds>(since_epoch);
  const auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(
      since_epoch - seconds);
  timestamp->set_seconds(seconds.count());
  timestamp->set_nanos(static_cast<int32_t>(nanos.count()));
}

}  // namespace

const char* SyncOutcomeName(SyncOutcome outcome) {
  switch (outcome) {
    case SyncOutcome::Deleted:
      return "deleted";
    case SyncOutcome::Skipped:
      return "skipped";
    case SyncOutcome::Approved:
      return "approved";
    case SyncOutcome::Pending:
      return "pending";
  }
  return "unknown";
}

SyncError::SyncError(Kind kind, const std::string& message)
    : std::runtime_error(message), kind_(kind) {}

SyncError::Kind SyncError::kind() const noexcept { return kind_; }

const char* SyncErrorKindName(SyncError::Kind kind) {
  switch (kind) {
    case SyncError::Kind::InvalidRequest:
      return "invalid_request";
    case SyncError::Kind::Transient:
      return "transient";
    case SyncError::Kind::Conflict:
      return "conflict";
    case SyncError::Kind::Unavailable:
      return "unavailable";
  }
  return "unknown";
}

Approver::Approver(std::shared_ptr<shared::CsrStore> store,
                   std::shared_ptr<const RecognizerSet> recognizers,
                   std::shared_ptr<shared::Metrics> metrics)
    : store_(std::move(store)),
      recognizers_(std::move(recognizers)),
      metrics_(std::move(metrics)) {
  if (!store_ || !recognizers_) {
    throw std::invalid_argument("approver requires a store and recognizers");
  }
}

SyncOutcome Approver::Sync(const std::string& name) {
  std::optional<CertificateSigningRequest> stored;
  try {
    stored = store_->Get(name);
  } catch (const shared::SharedStoreError& ex) {
    throw SyncError(SyncError::Kind::Unavailable, ex.what());
  }
  if (!stored.has_value()) {
    return SyncOutcome::Deleted;
  }
  if (shared::IsTerminal(*stored)) {
    Count("sync.skipped");
    return SyncOutcome::Skipped;
  }

  CertificateSigningRequest request = std::move(*stored);
  shared::ParsedCertificateRequest parsed;
  try {
    parsed = shared::ParseCertificateRequest(request.spec().request());
  } catch (const shared::CertificateRequestError& ex) {
    Count("sync.invalid_request");
    throw SyncError(SyncError::Kind::InvalidRequest,
                    "unable to parse certificate request: " +
                        std::string(ex.what()));
  }

  std::vector<std::string> rejections;
  const Recognizer* matched = nullptr;
  try {
    matched = recognizers_->Evaluate(request, parsed, &rejections);
  } catch (const CloudProviderError& ex) {
    Count("sync.transient");
    throw SyncError(SyncError::Kind::Transient, ex.what());
  } catch (const shared::SharedStoreError& ex) {
    Count("sync.transient");
    throw SyncError(SyncError::Kind::Unavailable, ex.what());
  }

  if (!matched) {
    Count("sync.pending");
    LogApproverEvent("Evaluate", SyncOutcomeName(SyncOutcome::Pending),
                     name + ": " + Join(rejections));
    return SyncOutcome::Pending;
  }

  auto* condition = request.mutable_status()->add_conditions();
  condition->set_type(certificates::v1::CONDITION_TYPE_APPROVED);
  condition->set_reason(kAutoApprovedReason);
  condition->set_message(matched->success_message);
  FillTimestamp(std::chrono::system_clock::now(),
                condition->mutable_last_update_time());

  try {
    store_->UpdateApproval(request);
  } catch (const shared::SharedStoreError& ex) {
    switch (ex.kind()) {
      case shared::SharedStoreError::Kind::Conflict:
        Count("sync.conflict");
        throw SyncError(SyncError::Kind::Conflict, ex.what());
      case shared::SharedStoreError::Kind::NotFound:
        return SyncOutcome::Deleted;
      default:
        throw SyncError(SyncError::Kind::Unavailable,
                        "error updating approval: " + std::string(ex.what()));
    }
  }

  Count("sync.approved");
  LogApproverEvent("Approve", SyncOutcomeName(SyncOutcome::Approved),
                   name + ": " + matched->success_message);
  return SyncOutcome::Approved;
}

void Approver::Count(std::string_view counter) {
  if (metrics_) {
    metrics_->Increment(counter);
  }
}

}  // namespace tollgate::approver
