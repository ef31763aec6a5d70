/**
 * @file PollingScheduler.cpp
 * @author BacLink Development Team
 */

#include "Polling/PollingScheduler.h"
#include "Logging/LogManager.h"

namespace BacLink {
namespace Polling {

namespace {
constexpr const char *kCategory = "scheduler";
}

PollingScheduler::PollingScheduler(CapabilityPoller &poller,
                                   Registry::DeviceRegistry &registry,
                                   SchedulerOptions options)
    : poller_(poller), registry_(registry), options_(std::move(options)) {}

PollingScheduler::~PollingScheduler() { Stop(); }

void PollingScheduler::Start() {
  std::lock_guard<std::mutex> lock(lifecycle_mutex_);
  if (running_.load()) {
    return;
  }

  stop_requested_ = false;
  running_ = true;
  worker_ = std::thread(&PollingScheduler::Loop, this);

  LogManager::getInstance().log(
      kCategory, LogLevel::INFO, "Polling scheduler started (interval {}ms)",
      options_.interval.count());
}

void PollingScheduler::Stop() {
  std::lock_guard<std::mutex> lock(lifecycle_mutex_);
  if (!running_.load() && !worker_.joinable()) {
    return;
  }

  {
    std::lock_guard<std::mutex> wait_lock(wait_mutex_);
    stop_requested_ = true;
  }
  wait_cv_.notify_all();

  if (worker_.joinable()) {
    worker_.join();
  }
  running_ = false;

  LogManager::getInstance().log(kCategory, LogLevel::INFO,
                                "Polling scheduler stopped");
}

void PollingScheduler::Loop() {
  auto &logger = LogManager::getInstance();

  while (!StopRequested()) {
    try {
      RunCycle();
    } catch (const std::exception &e) {
      logger.log(kCategory, LogLevel::LOG_ERROR, "Polling cycle error: {}",
                 e.what());
    }

    std::unique_lock<std::mutex> lock(wait_mutex_);
    wait_cv_.wait_for(lock, options_.interval,
                      [this] { return stop_requested_.load(); });
  }
}

CycleReport PollingScheduler::RunCycle() {
  auto &logger = LogManager::getInstance();
  CycleReport report;

  const auto devices = registry_.Enabled();
  report.devices = devices.size();

  for (const auto &device : devices) {
    if (StopRequested()) {
      break;
    }

    const auto deadline = SteadyClock::now() + options_.device_timeout;
    try {
      PollOutcome outcome = poller_.PollDeviceObjects(
          device, options_.properties, deadline,
          [this] { return StopRequested(); });

      switch (outcome) {
      case PollOutcome::COMPLETED:
        ++report.completed;
        break;
      case PollOutcome::DEADLINE_EXCEEDED:
        ++report.timed_out;
        logger.log(kCategory, LogLevel::WARN,
                   "Device {} poll timed out after {}ms", device.device_id,
                   options_.device_timeout.count());
        break;
      case PollOutcome::CANCELLED:
        break;
      }
    } catch (const std::exception &e) {
      ++report.failed;
      logger.log(kCategory, LogLevel::LOG_ERROR, "Device {} poll failed: {}",
                 device.device_id, e.what());
    }
  }

  report.persisted = registry_.Persist();
  ++cycle_count_;

  logger.log(kCategory, LogLevel::DEBUG,
             "Poll cycle {}: {} devices, {} completed, {} timed out, {} failed",
             cycle_count_.load(), report.devices, report.completed,
             report.timed_out, report.failed);
  return report;
}

} // namespace Polling
} // namespace BacLink
