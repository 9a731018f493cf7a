#include "tollgate/shared/metrics.h"

namespace tollgate::shared {

InMemoryMetrics::InMemoryMetrics(size_t max_keys) : max_keys_(max_keys) {}

void InMemoryMetrics::Increment(std::string_view counter) {
  if (counter.empty() || max_keys_ == 0) {
    return;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = counters_.find(std::string(counter));
  if (it != counters_.end()) {
    ++it->second;
    return;
  }

  if (counters_.size() >= max_keys_) {
    auto min_it = counters_.begin();
    for (auto entry_it = counters_.begin(); entry_it != counters_.end();
         ++entry_it) {
      if (entry_it->second < min_it->second) {
        min_it = entry_it;
      }
    }
    counters_.erase(min_it);
  }
  counters_.emplace(std::string(counter), 1U);
}

uint64_t InMemoryMetrics::Get(std::string_view counter) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = counters_.find(std::string(counter));
  if (it == counters_.end()) {
    return 0;
  }
  return it->second;
}

std::map<std::string, uint64_t> InMemoryMetrics::Snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return std::map<std::string, uint64_t>(counters_.begin(), counters_.end());
}

std::string FormatCounters(const Metrics& metrics) {
  std::string out;
  for (const auto& [name, value] : metrics.Snapshot()) {
    if (!out.empty()) {
      out += ' ';
    }
    out += name + "=" + std::to_string(value);
  }
  return out;
}

}  // namespace tollgate::shared
