#pragma once

#include <string>
#include <string_view>

namespace tollgate::shared {

std::string JsonEscape(std::string_view input);

// RFC 3339 UTC timestamp with second precision.
std::string UtcTimestampNow();

}  // namespace tollgate::shared
