#pragma once

#include <chrono>
#include <exception>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <stop_token>
#include <thread>

#include "tollgate/shared/csr_store.h"

namespace tollgate::approver {

struct CsrEvent {
  enum class Type {
    Added,
    Updated,
    Deleted,
  };

  Type type;
  std::string name;
};

const char* CsrEventTypeName(CsrEvent::Type type);

// Polls the signing request store and turns list differences into events.
class CsrInformer {
 public:
  using Handler = std::function<void(const CsrEvent&)>;
  using ErrorHandler = std::function<void(const std::exception&)>;

  CsrInformer(std::shared_ptr<shared::CsrStore> store,
              std::chrono::milliseconds resync_period, Handler handler);
  ~CsrInformer();

  CsrInformer(const CsrInformer&) = delete;
  CsrInformer& operator=(const CsrInformer&) = delete;

  // Lists the store once. Changed names are emitted as Added, Updated or
  // Deleted; with `resync` set, unchanged names are emitted as Updated too.
  void PollOnce(bool resync = false);

  void Start(ErrorHandler on_error);
  void Stop();

 private:
  void Run(std::stop_token stop_token, const ErrorHandler& on_error);

  std::shared_ptr<shared::CsrStore> store_;
  std::chrono::milliseconds resync_period_;
  Handler handler_;

  std::mutex mutex_;
  std::map<std::string, std::string> known_versions_;
  std::jthread poller_;
};

}  // namespace tollgate::approver
