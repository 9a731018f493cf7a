#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>

namespace tollgate::shared {

class Metrics {
 public:
  virtual ~Metrics() = default;
  virtual void Increment(std::string_view counter) = 0;
  virtual uint64_t Get(std::string_view counter) const = 0;
  virtual std::map<std::string, uint64_t> Snapshot() const = 0;
};

// Bounded counter set; once full, the smallest counter is evicted to make
// room for a new name.
class InMemoryMetrics final : public Metrics {
 public:
  explicit InMemoryMetrics(size_t max_keys = 64);

  void Increment(std::string_view counter) override;
  uint64_t Get(std::string_view counter) const override;
  std::map<std::string, uint64_t> Snapshot() const override;

 private:
  mutable std::mutex mutex_;
  std::unordered_map<std::string, uint64_t> counters_;
  size_t max_keys_;
};

// "name=value" pairs ordered by name, separated by spaces.
std::string FormatCounters(const Metrics& metrics);

}  // namespace tollgate::shared
