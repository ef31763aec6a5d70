/**
 * @file DiscoveryEngine.h
 * @brief Who-Is / I-Am 기반 장치 디스커버리 및 객체 열거
 * @author BacLink Development Team
 *
 * 상태 전이: IDLE -> BROADCASTING -> LISTENING -> PROCESSING -> IDLE
 */

#ifndef BACLINK_DISCOVERY_DISCOVERY_ENGINE_H
#define BACLINK_DISCOVERY_DISCOVERY_ENGINE_H

#include "Models/DeviceModel.h"
#include "Registry/DeviceRegistry.h"
#include "Transport/ITransport.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace BacLink {
namespace Discovery {

enum class DiscoveryState { IDLE, BROADCASTING, LISTENING, PROCESSING };

const char *DiscoveryStateToString(DiscoveryState state);

class DiscoveryEngine {
public:
  using DiscoveryCallback = std::function<void(const Models::Device &)>;

  /// 인덱스 단위 object-list 열거 상한
  static constexpr uint32_t kMaxIndexedObjects = 500;

  DiscoveryEngine(Transport::ITransport &transport,
                  Registry::DeviceRegistry &registry,
                  std::chrono::milliseconds read_timeout =
                      std::chrono::milliseconds(5000));

  DiscoveryEngine(const DiscoveryEngine &) = delete;
  DiscoveryEngine &operator=(const DiscoveryEngine &) = delete;

  /// 병합 직후 장치마다 호출된다
  void SetDiscoveryCallback(DiscoveryCallback callback);

  /**
   * @brief Who-Is 브로드캐스트 후 timeout 동안 I-Am 수집, 장치 등록
   * @return 이번 호출에서 응답한 장치들 (레지스트리 전체가 아님)
   */
  std::vector<Models::Device> Discover(std::optional<uint32_t> low_limit,
                                       std::optional<uint32_t> high_limit,
                                       std::chrono::milliseconds timeout);

  /**
   * @brief 장치의 object-list 를 읽어 객체 등록
   * @details 일괄 읽기가 BUFFER_OVERFLOW 이면 인덱스 단위로 최대 500 개까지 읽는다.
   * @return 등록한 객체 수. 장치를 모르거나 목록을 읽지 못하면 std::nullopt
   */
  std::optional<size_t> DiscoverDeviceObjects(uint32_t device_id);

  /**
   * @brief 진행 중인 수신 대기와 열거를 끝낸다
   * @details ResetCancel() 전까지 유지된다. 이후 Discover 는 바로 빈 결과,
   *          DiscoverDeviceObjects 는 그때까지 등록한 개수를 돌려준다.
   */
  void Cancel();
  void ResetCancel();
  bool IsCancelled() const;

  DiscoveryState GetState() const { return state_.load(); }

  static const std::vector<std::string> &IdentificationProperties();

private:
  Models::Device BuildDevice(const Transport::IAmIndication &indication);
  void ReadIdentification(Models::Device &device);
  std::optional<std::vector<Models::ObjectId>>
  ReadObjectList(const Models::Device &device);
  std::vector<Models::ObjectId> ReadObjectListIndexed(const Models::Device &device);
  void NotifyDiscovered(const Models::Device &device);

  Transport::ITransport &transport_;
  Registry::DeviceRegistry &registry_;
  std::chrono::milliseconds read_timeout_;

  std::mutex discover_mutex_;
  std::atomic<DiscoveryState> state_{DiscoveryState::IDLE};

  mutable std::mutex wait_mutex_;
  std::condition_variable wait_cv_;
  bool cancel_requested_ = false;

  std::mutex callback_mutex_;
  DiscoveryCallback callback_;
};

} // namespace Discovery
} // namespace BacLink

#endif // BACLINK_DISCOVERY_DISCOVERY_ENGINE_H
