#include "informer.h"

#include <stdexcept>
#include <vector>

namespace tollgate::approver {
namespace {

bool SleepWithStop(std::stop_token stop_token, std::chrono::milliseconds wait) {
  const auto chunk = std::chrono::milliseconds(25);
  std::chrono::milliseconds remaining = wait;
  while (remaining.count() > 0) {
    if (stop_token.stop_requested()) {
      return false;
    }
    const auto current = remaining > chunk ? chunk : remaining;
    std::this_thread::sleep_for(current);
    remaining -= current;
  }
  return !stop_token.stop_requested();
}

}  // namespace

const char* CsrEventTypeName(CsrEvent::Type type) {
  switch (type) {
    case CsrEvent::Type::Added:
      return "added";
    case CsrEvent::Type::Updated:
      return "updated";
    case CsrEvent::Type::Deleted:
      return "deleted";
  }
  return "unknown";
}

CsrInformer::CsrInformer(std::shared_ptr<shared::CsrStore> store,
                         std::chrono::milliseconds resync_period,
                         Handler handler)
    : store_(std::move(store)),
      resync_period_(resync_period),
      handler_(std::move(handler)) {
  if (!store_ || !handler_) {
    throw std::invalid_argument("informer requires a store and a handler");
  }
  if (resync_period_.count() <= 0) {
    throw std::invalid_argument("informer resync period must be positive");
  }
}

CsrInformer::~CsrInformer() { Stop(); }

void CsrInformer::PollOnce(bool resync) {
  const auto listed = store_->List();

  std::vector<CsrEvent> events;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    std::map<std::string, std::string> current;
    for (const auto& request : listed) {
      const auto& name = request.metadata().name();
      const auto& version = request.metadata().resource_version();
      current.emplace(name, version);

      const auto it = known_versions_.find(name);
      if (it == known_versions_.end()) {
        events.push_back({CsrEvent::Type::Added, name});
      } else if (it->second != version || resync) {
        events.push_back({CsrEvent::Type::Updated, name});
      }
    }
    for (const auto& [name, version] : known_versions_) {
      if (current.count(name) == 0) {
        events.push_back({CsrEvent::Type::Deleted, name});
      }
    }
    known_versions_ = std::move(current);
  }

  for (const auto& event : events) {
    handler_(event);
  }
}

void CsrInformer::Start(ErrorHandler on_error) {
  if (poller_.joinable()) {
    return;
  }
  poller_ = std::jthread(
      [this, on_error = std::move(on_error)](std::stop_token stop_token) {
        Run(stop_token, on_error);
      });
}

void CsrInformer::Stop() {
  if (poller_.joinable()) {
    poller_.request_stop();
    poller_.join();
  }
}

void CsrInformer::Run(std::stop_token stop_token, const ErrorHandler& on_error) {
  bool resync = false;
  do {
    try {
      PollOnce(resync);
      resync = true;
    } catch (const shared::SharedStoreError& ex) {
      if (on_error) {
        on_error(ex);
      }
    }
  } while (SleepWithStop(stop_token, resync_period_));
}

}  // namespace tollgate::approver
