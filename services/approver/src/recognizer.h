#pragma once

#include <functional>
#include <string>
#include <vector>

#include "certificates.pb.h"
#include "tollgate/shared/certificate_request.h"

namespace tollgate::approver {

using certificates::v1::CertificateSigningRequest;

// Returns true when the request satisfies the check. On false, `reason`
// (when non-null) receives a short explanation. Resolver-backed checks let
// transient cloud failures escape as exceptions.
using Predicate = std::function<bool(const CertificateSigningRequest& request,
                                     const shared::ParsedCertificateRequest& parsed,
                                     std::string* reason)>;

struct NamedPredicate {
  std::string name;
  Predicate check;
};

struct Recognizer {
  std::string name;
  std::vector<NamedPredicate> predicates;
  std::string success_message;
};

class RecognizerSet {
 public:
  explicit RecognizerSet(std::vector<Recognizer> recognizers);

  // First recognizer whose predicates all hold, or nullptr. Chains are tried
  // in order and each stops at its first failing predicate. When
  // `rejections` is given it collects one line per rejected chain.
  const Recognizer* Evaluate(const CertificateSigningRequest& request,
                             const shared::ParsedCertificateRequest& parsed,
                             std::vector<std::string>* rejections = nullptr) const;

  const std::vector<Recognizer>& recognizers() const noexcept;

 private:
  std::vector<Recognizer> recognizers_;
};

}  // namespace tollgate::approver
