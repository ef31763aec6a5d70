/**
 * @file PublishBridge.h
 * @brief 레지스트리 상태를 MQTT 토픽/페이로드로 주기 발행
 * @author BacLink Development Team
 *
 * 토픽 결정: 활성 매핑이 있으면 그 토픽을 그대로 사용하고, 없으면
 * {prefix}/{device_id}/{object_type}/{instance}/{property_id} (object_type 의
 * '-' 와 공백은 '_' 로 치환).
 */

#ifndef BACLINK_PUBLISH_PUBLISH_BRIDGE_H
#define BACLINK_PUBLISH_PUBLISH_BRIDGE_H

#include "Models/DeviceModel.h"
#include "Publish/IMessageBus.h"
#include "Registry/DeviceRegistry.h"
#include "Registry/TopicMappingStore.h"

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>

namespace BacLink {
namespace Publish {

struct PublishOptions {
  std::string topic_prefix = "bacnet";
  int qos = 1;
  bool retain = true;
  std::chrono::milliseconds interval{std::chrono::seconds(5)};
};

struct PublishReport {
  bool skipped = false; // 버스 연결 끊김
  size_t messages = 0;
  size_t failures = 0;
  size_t status_messages = 0;
};

class PublishBridge {
public:
  PublishBridge(IMessageBus &bus, Registry::DeviceRegistry &registry,
                Registry::TopicMappingStore &mappings,
                PublishOptions options = PublishOptions());
  ~PublishBridge();

  PublishBridge(const PublishBridge &) = delete;
  PublishBridge &operator=(const PublishBridge &) = delete;

  /// 버스 연결 후 발행 루프 시작 (연결 실패여도 루프는 돈다)
  void Start();
  void Stop();
  bool IsRunning() const { return running_.load(); }

  /// 한 주기 발행. 연결이 끊겨 있으면 건너뛴다
  PublishReport RunCycle();

  std::string ResolveTopic(const Models::Device &device,
                           const Models::BacnetObject &object,
                           const std::string &property_id) const;

  std::string DefaultTopic(uint32_t device_id, const std::string &object_type,
                           uint32_t object_instance,
                           const std::string &property_id) const;

  std::string StatusTopic(uint32_t device_id) const;

  static nlohmann::json BuildPayload(const Models::Device &device,
                                     const Models::BacnetObject &object,
                                     const Models::Property &property);

  static nlohmann::json BuildStatusPayload(const Models::Device &device);

  uint64_t GetCycleCount() const { return cycle_count_.load(); }

private:
  void Loop();

  IMessageBus &bus_;
  Registry::DeviceRegistry &registry_;
  Registry::TopicMappingStore &mappings_;
  PublishOptions options_;

  std::thread worker_;
  std::mutex lifecycle_mutex_;
  std::atomic<bool> running_{false};
  std::atomic<bool> stop_requested_{false};
  std::mutex wait_mutex_;
  std::condition_variable wait_cv_;

  std::atomic<uint64_t> cycle_count_{0};
};

} // namespace Publish
} // namespace BacLink

#endif // BACLINK_PUBLISH_PUBLISH_BRIDGE_H
