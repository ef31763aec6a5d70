/**
 * @file BacnetStackTransport.h
 * @brief bacnet-stack 기반 BACnet/IP Transport
 * @author BacLink Development Team
 *
 * bacnet-stack 은 전역 상태를 가진 C 라이브러리이므로 프로세스당 하나의
 * 인스턴스만 열 수 있다. 모든 스택 호출은 stack_mutex_ 로 직렬화된다.
 * 확인형 요청은 invoke id 별 promise 로 수신 스레드에서 완료된다.
 */

#ifndef BACLINK_TRANSPORT_BACNET_STACK_TRANSPORT_H
#define BACLINK_TRANSPORT_BACNET_STACK_TRANSPORT_H

#include "Transport/ITransport.h"

#include <atomic>
#include <cstdint>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace BacLink {
namespace Transport {

struct BacnetStackOptions {
  uint32_t device_id = 260001;
  std::string device_name = "BacLink Gateway";
  std::string interface_name; // 비어 있으면 기본 인터페이스
  uint16_t port = 47808;
  uint16_t apdu_timeout_ms = 3000;
};

class BacnetStackTransport : public ITransport {
public:
  explicit BacnetStackTransport(BacnetStackOptions options);
  ~BacnetStackTransport() override;

  BacnetStackTransport(const BacnetStackTransport &) = delete;
  BacnetStackTransport &operator=(const BacnetStackTransport &) = delete;

  /**
   * @brief 데이터링크 바인딩, 로컬 장치 객체 초기화, 수신 스레드 시작
   * @throws std::runtime_error 바인딩 실패 또는 다른 인스턴스가 이미 열려 있음
   */
  void Open();
  void Close();
  bool IsOpen() const { return open_.load(); }

  // ITransport
  bool SendWhoIs(std::optional<uint32_t> low_limit,
                 std::optional<uint32_t> high_limit) override;
  ReadResult ReadProperty(uint32_t device_id, const std::string &address,
                          const Models::ObjectId &object,
                          const std::string &property,
                          std::optional<uint32_t> array_index,
                          std::chrono::milliseconds timeout) override;
  ServiceStatus WriteProperty(uint32_t device_id, const std::string &address,
                              const Models::ObjectId &object,
                              const std::string &property,
                              const Models::PropertyValue &value,
                              std::optional<uint8_t> priority,
                              std::optional<uint32_t> array_index,
                              std::chrono::milliseconds timeout) override;
  bool RegisterForeignDevice(const RelayAddress &relay,
                             uint16_t ttl_seconds) override;
  bool SendBvll(const RelayAddress &relay,
                const std::vector<uint8_t> &message) override;
  IndicationHandler SetIndicationHandler(IndicationHandler handler) override;

private:
  // 스택 C 콜백 (구현 파일에 정의)
  friend struct StackCallbacks;

  struct PendingRequest {
    std::string property;
    std::promise<ReadResult> promise;
  };

  void ReceiveLoop();

  /// stack_mutex_ 보유 상태에서 호출
  bool BindAddressLocked(uint32_t device_id, const std::string &address);
  std::future<ReadResult> RegisterPendingLocked(uint8_t invoke_id,
                                                const std::string &property);
  ReadResult Await(uint8_t invoke_id, std::future<ReadResult> &future,
                   std::chrono::milliseconds timeout);

  // 수신 스레드에서 호출 (stack_mutex_ 보유)
  void CompleteRequest(uint8_t invoke_id, ReadResult result);
  std::string PendingProperty(uint8_t invoke_id);
  void QueueIndication(InboundMessage message);
  void DispatchIndications();

  BacnetStackOptions options_;

  std::mutex stack_mutex_;
  std::atomic<bool> open_{false};
  std::atomic<bool> stop_requested_{false};
  std::thread receive_thread_;

  std::mutex pending_mutex_;
  std::map<uint8_t, std::unique_ptr<PendingRequest>> pending_;

  std::mutex handler_mutex_;
  IndicationHandler indication_handler_;
  std::vector<InboundMessage> queued_indications_;
};

} // namespace Transport
} // namespace BacLink

#endif // BACLINK_TRANSPORT_BACNET_STACK_TRANSPORT_H
