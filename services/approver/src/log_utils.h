#pragma once

#include <string_view>

namespace tollgate::approver {

void LogApproverEvent(std::string_view action, std::string_view status,
                      std::string_view detail, std::string_view error = {});

}  // namespace tollgate::approver
