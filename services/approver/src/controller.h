#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <stop_token>
#include <string>

#include "approver.h"
#include "work_queue.h"

namespace tollgate::approver {

struct ControllerOptions {
  size_t workers = 5;
  // Unparseable requests are retried this many times before being dropped.
  size_t max_invalid_retries = 5;
};

class Controller {
 public:
  using SyncFunction = std::function<SyncOutcome(const std::string&)>;

  Controller(SyncFunction sync, std::shared_ptr<RateLimitingQueue> queue,
             ControllerOptions options = {});

  void Enqueue(const std::string& name);

  // Runs the worker pool until `stop` is requested. The queue is shut down
  // on stop; workers finish their current item before returning.
  void Run(std::stop_token stop);

  // Handles one queued key. Returns false once the queue is shut down.
  bool ProcessNextItem();

 private:
  void Requeue(const std::string& name, const std::string& error);

  SyncFunction sync_;
  std::shared_ptr<RateLimitingQueue> queue_;
  ControllerOptions options_;
};

}  // namespace tollgate::approver
