/**
 * @file PollingScheduler.h
 * @brief 활성 장치 주기 폴링 (장치별 시간 제한 격리)
 * @author BacLink Development Team
 */

#ifndef BACLINK_POLLING_POLLING_SCHEDULER_H
#define BACLINK_POLLING_POLLING_SCHEDULER_H

#include "Polling/CapabilityPoller.h"
#include "Registry/DeviceRegistry.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace BacLink {
namespace Polling {

struct SchedulerOptions {
  std::chrono::milliseconds interval{std::chrono::seconds(60)};
  std::chrono::milliseconds device_timeout{std::chrono::seconds(60)};
  std::vector<std::string> properties{"present-value", "status-flags"};
};

struct CycleReport {
  size_t devices = 0;
  size_t completed = 0;
  size_t timed_out = 0;
  size_t failed = 0;
  bool persisted = false;
};

class PollingScheduler {
public:
  PollingScheduler(CapabilityPoller &poller, Registry::DeviceRegistry &registry,
                   SchedulerOptions options = SchedulerOptions());
  ~PollingScheduler();

  PollingScheduler(const PollingScheduler &) = delete;
  PollingScheduler &operator=(const PollingScheduler &) = delete;

  /// 이미 실행 중이면 아무것도 하지 않음
  void Start();

  /// 루프 종료 신호 후 join. 실행 중이 아니면 아무것도 하지 않음
  void Stop();

  bool IsRunning() const { return running_.load(); }

  /**
   * @brief 한 주기 실행
   * @details 활성 장치 스냅샷을 장치마다 device_timeout 으로 제한해 폴링한 뒤
   *          결과와 관계없이 레지스트리를 저장한다.
   */
  CycleReport RunCycle();

  uint64_t GetCycleCount() const { return cycle_count_.load(); }
  const SchedulerOptions &GetOptions() const { return options_; }

private:
  void Loop();
  bool StopRequested() const { return stop_requested_.load(); }

  CapabilityPoller &poller_;
  Registry::DeviceRegistry &registry_;
  SchedulerOptions options_;

  std::thread worker_;
  std::mutex lifecycle_mutex_;
  std::atomic<bool> running_{false};
  std::atomic<bool> stop_requested_{false};
  std::mutex wait_mutex_;
  std::condition_variable wait_cv_;

  std::atomic<uint64_t> cycle_count_{0};
};

} // namespace Polling
} // namespace BacLink

#endif // BACLINK_POLLING_POLLING_SCHEDULER_H
