#include "log_utils.h"

#include <iostream>
#include <sstream>

#include "tollgate/shared/log_format.h"

namespace tollgate::signer {

void LogSignerEvent(std::string_view action, const grpc::Status& status,
                    std::string_view detail) {
  using shared::JsonEscape;
  std::ostringstream line;
  line << "{\"timestamp\":\"" << shared::UtcTimestampNow()
       << "\",\"component\":\"signer\""
       << ",\"action\":\"" << JsonEscape(action) << "\""
       << ",\"status\":\"" << status.error_code() << "\"";
  if (!detail.empty()) {
    line << ",\"detail\":\"" << JsonEscape(detail) << "\"";
  }
  if (!status.ok()) {
    line << ",\"error\":\"" << JsonEscape(status.error_message()) << "\"";
  }
  line << "}\n";
  std::cout << line.str() << std::flush;
}

}  // namespace tollgate::signer
