#include "log_utils.h"

#include <iostream>
#include <mutex>
#include <sstream>

#include "tollgate/shared/log_format.h"

namespace tollgate::approver {
namespace {

std::mutex& LogMutex() {
  static std::mutex mutex;
  return mutex;
}

}  // namespace

void LogApproverEvent(std::string_view action, std::string_view status,
                      std::string_view detail, std::string_view error) {
  using shared::JsonEscape;
  std::ostringstream line;
  line << "{\"timestamp\":\"" << shared::UtcTimestampNow()
       << "\",\"component\":\"approver\""
       << ",\"action\":\"" << JsonEscape(action) << "\""
       << ",\"status\":\"" << JsonEscape(status) << "\"";
  if (!detail.empty()) {
    line << ",\"detail\":\"" << JsonEscape(detail) << "\"";
  }
  if (!error.empty()) {
    line << ",\"error\":\"" << JsonEscape(error) << "\"";
  }
  line << "}\n";

  // Workers log concurrently; keep lines whole.
  std::lock_guard<std::mutex> lock(LogMutex());
  std::cout << line.str() << std::flush;
}

}  // namespace tollgate::approver
