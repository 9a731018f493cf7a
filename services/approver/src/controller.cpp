#include "controller.h"

#include <stdexcept>
#include <thread>
#include <vector>

#include "log_utils.h"

namespace tollgate::approver {

Controller::Controller(SyncFunction sync, std::shared_ptr<RateLimitingQueue> queue,
                       ControllerOptions options)
    : sync_(std::move(sync)), queue_(std::move(queue)), options_(options) {
  if (!sync_ || !queue_) {
    throw std::invalid_argument("controller requires a sync function and a queue");
  }
  if (options_.workers == 0) {
    throw std::invalid_argument("controller requires at least one worker");
  }
}

void Controller::Enqueue(const std::string& name) { queue_->Add(name); }

void Controller::Run(std::stop_token stop) {
  std::stop_callback shutdown(stop, [this] { queue_->ShutDown(); });
  LogApproverEvent("Run", "started",
                   "workers=" + std::to_string(options_.workers));
  {
    std::vector<std::jthread> workers;
    workers.reserve(options_.workers);
    for (size_t i = 0; i < options_.workers; ++i) {
      workers.emplace_back([this] {
        while (ProcessNextItem()) {
        }
      });
    }
  }
  LogApproverEvent("Run", "stopped", {});
}

bool Controller::ProcessNextItem() {
  const auto name = queue_->Get();
  if (!name.has_value()) {
    return false;
  }

  try {
    sync_(*name);
    queue_->Forget(*name);
  } catch (const SyncError& ex) {
    if (ex.kind() == SyncError::Kind::InvalidRequest &&
        queue_->NumRequeues(*name) >= options_.max_invalid_retries) {
      LogApproverEvent("Sync", "dropped", *name, ex.what());
      queue_->Forget(*name);
    } else {
      Requeue(*name, std::string(SyncErrorKindName(ex.kind())) + ": " + ex.what());
    }
  } catch (const std::exception& ex) {
    Requeue(*name, ex.what());
  }

  queue_->Done(*name);
  return true;
}

void Controller::Requeue(const std::string& name, const std::string& error) {
  LogApproverEvent("Sync", "requeued", name, error);
  queue_->AddRateLimited(name);
}

}  // namespace tollgate::approver
