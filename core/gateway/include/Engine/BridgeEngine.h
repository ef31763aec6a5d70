/**
 * @file BridgeEngine.h
 * @brief BACnet <-> MQTT 브리지 엔진 (구성 요소 소유 및 제어 API 용 연산)
 * @author BacLink Development Team
 *
 * 레지스트리, 매핑 저장소, 디스커버리, 폴러/스케줄러, BBMD 등록, 발행 브리지를
 * 소유한다. Transport 와 메시지 버스는 외부에서 주입된다.
 */

#ifndef BACLINK_ENGINE_BRIDGE_ENGINE_H
#define BACLINK_ENGINE_BRIDGE_ENGINE_H

#include "Core/GatewayConfig.h"
#include "Discovery/DiscoveryEngine.h"
#include "Polling/CapabilityPoller.h"
#include "Polling/PollingScheduler.h"
#include "Publish/IMessageBus.h"
#include "Publish/PublishBridge.h"
#include "Registration/RegistrationManager.h"
#include "Registry/DeviceRegistry.h"
#include "Registry/TopicMappingStore.h"
#include "Transport/ITransport.h"

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

namespace BacLink {
namespace Engine {

class BridgeEngine {
public:
  /**
   * @param bus nullptr 이면 발행 브리지를 만들지 않는다
   * @param strategies 비어 있으면 Transport 기반 기본 등록 전략 사용
   */
  BridgeEngine(const Core::GatewayConfig &config,
               Transport::ITransport &transport, Publish::IMessageBus *bus,
               Registration::StrategyList strategies = {});
  ~BridgeEngine();

  BridgeEngine(const BridgeEngine &) = delete;
  BridgeEngine &operator=(const BridgeEngine &) = delete;

  // ==========================================================================
  // 수명 주기
  // ==========================================================================

  /// 저장소 복원 후 등록, 폴링, 발행, 자동 디스커버리 순으로 시작
  void Start();

  /// 시작의 역순으로 정지 후 레지스트리 저장
  void Stop();

  bool IsRunning() const { return running_.load(); }

  // ==========================================================================
  // 제어 연산
  // ==========================================================================

  std::vector<Models::Device> Discover(std::optional<uint32_t> low_limit,
                                       std::optional<uint32_t> high_limit,
                                       std::chrono::milliseconds timeout);

  /// 객체 열거 후 레지스트리 저장. 실패 시 std::nullopt
  std::optional<size_t> DiscoverObjects(uint32_t device_id);

  /**
   * @brief 단발성 속성 읽기 (레지스트리에 값을 저장하지 않음)
   * @return 장치를 모르면 std::nullopt
   */
  std::optional<Transport::ReadResult>
  Read(uint32_t device_id, const std::string &object_type,
       uint32_t object_instance, const std::string &property,
       std::optional<uint32_t> array_index = std::nullopt);

  /// 장치를 모르거나 쓰기가 실패하면 false
  bool Write(uint32_t device_id, const std::string &object_type,
             uint32_t object_instance, const std::string &property,
             const Models::PropertyValue &value,
             std::optional<uint8_t> priority = std::nullopt,
             std::optional<uint32_t> array_index = std::nullopt);

  bool Enable(uint32_t device_id);
  bool Disable(uint32_t device_id);
  bool Remove(uint32_t device_id);
  bool TriggerRegistration();

  // ==========================================================================
  // 조회
  // ==========================================================================

  nlohmann::json Status() const;
  std::vector<Models::Device> Devices() const;
  std::optional<Models::Device> FindDevice(uint32_t device_id) const;
  std::optional<std::vector<Models::BacnetObject>> Objects(uint32_t device_id) const;

  // ==========================================================================
  // 토픽 매핑
  // ==========================================================================

  bool AddMapping(const Models::TopicMapping &mapping);
  bool RemoveMapping(uint32_t device_id, const std::string &object_type,
                     uint32_t object_instance);
  std::vector<Models::TopicMapping> Mappings() const;

  Registry::DeviceRegistry &GetRegistry() { return registry_; }
  const Core::GatewayConfig &GetConfig() const { return config_; }

private:
  void OnDeviceDiscovered(const Models::Device &device);
  void DiscoveryLoop();
  std::chrono::milliseconds ReadTimeout() const;
  void PersistRegistry();

  Core::GatewayConfig config_;
  Transport::ITransport &transport_;

  Registry::DeviceRegistry registry_;
  Registry::TopicMappingStore mappings_;
  Discovery::DiscoveryEngine discovery_;
  Polling::CapabilityPoller poller_;
  Polling::PollingScheduler scheduler_;
  Registration::RegistrationManager registration_;
  std::unique_ptr<Publish::PublishBridge> publisher_;

  std::mutex lifecycle_mutex_;
  std::atomic<bool> running_{false};

  std::thread discovery_thread_;
  std::atomic<bool> discovery_stop_{false};
  std::mutex discovery_wait_mutex_;
  std::condition_variable discovery_wait_cv_;
};

} // namespace Engine
} // namespace BacLink

#endif // BACLINK_ENGINE_BRIDGE_ENGINE_H
