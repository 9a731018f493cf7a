#include "recognizer.h"

#include <stdexcept>

namespace tollgate::approver {

RecognizerSet::RecognizerSet(std::vector<Recognizer> recognizers)
    : recognizers_(std::move(recognizers)) {
  for (const auto& recognizer : recognizers_) {
    if (recognizer.predicates.empty()) {
      throw std::invalid_argument("recognizer has no predicates: " +
                                  recognizer.name);
    }
    for (const auto& predicate : recognizer.predicates) {
      if (!predicate.check) {
        throw std::invalid_argument("recognizer has an empty predicate: " +
                                    recognizer.name);
      }
    }
  }
}

const Recognizer* RecognizerSet::Evaluate(
    const CertificateSigningRequest& request,
    const shared::ParsedCertificateRequest& parsed,
    std::vector<std::string>* rejections) const {
  for (const auto& recognizer : recognizers_) {
    bool matched = true;
    for (const auto& predicate : recognizer.predicates) {
      std::string reason;
      if (!predicate.check(request, parsed, &reason)) {
        if (rejections) {
          std::string line = recognizer.name + ": " + predicate.name;
          if (!reason.empty()) {
            line += ": " + reason;
          }
          rejections->push_back(std::move(line));
        }
        matched = false;
        break;
      }
    }
    if (matched) {
      return &recognizer;
    }
  }
  return nullptr;
}

const std::vector<Recognizer>& RecognizerSet::recognizers() const noexcept {
  return recognizers_;
}

}  // namespace tollgate::approver
