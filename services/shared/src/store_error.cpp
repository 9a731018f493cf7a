#include "tollgate/shared/store_error.h"

namespace tollgate::shared {

SharedStoreError::SharedStoreError(Kind kind, const std::string& message)
    : std::runtime_error(message), kind_(kind) {}

SharedStoreError::Kind SharedStoreError::kind() const noexcept { return kind_; }

}  // namespace tollgate::shared
