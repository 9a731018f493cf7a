#pragma once

#include <stdexcept>
#include <string>

namespace tollgate::shared {

enum class SharedStoreBackend {
  InMemory,
  Redis,
};

struct SharedStoreConfig {
  SharedStoreBackend backend = SharedStoreBackend::InMemory;
  std::string redis_uri;
  std::string key_prefix = "tollgate";
};

class SharedStoreError : public std::runtime_error {
 public:
  enum class Kind {
    InvalidArgument,
    Conflict,
    NotFound,
    Unavailable,
  };

  SharedStoreError(Kind kind, const std::string& message);

  Kind kind() const noexcept;

 private:
  Kind kind_;
};

}  // namespace tollgate::shared
