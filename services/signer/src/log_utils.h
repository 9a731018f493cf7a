#pragma once

#include <grpcpp/support/status.h>

#include <string_view>

namespace tollgate::signer {

void LogSignerEvent(std::string_view action, const grpc::Status& status,
                    std::string_view detail);

}  // namespace tollgate::signer
