/**
 * @file ITransport.h
 * @brief BACnet 전송 계층 인터페이스
 * @author BacLink Development Team
 *
 * PDU 인코딩/디코딩, 주소 지정, 세그먼테이션은 구현체(bacnet-stack 등)의 몫이다.
 * 엔진은 이 인터페이스의 기본 동작(Who-Is, ReadProperty, WriteProperty,
 * 외부 장치 등록)과 수신 훅만 사용한다.
 */

#ifndef BACLINK_TRANSPORT_ITRANSPORT_H
#define BACLINK_TRANSPORT_ITRANSPORT_H

#include "Models/PropertyValue.h"
#include "Transport/RelayAddress.h"

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace BacLink {
namespace Transport {

// =============================================================================
// 서비스 결과
// =============================================================================

enum class ServiceStatus {
  SUCCESS,
  NO_VALUE,            // 응답은 왔으나 값이 NULL
  UNKNOWN_PROPERTY,    // 객체가 해당 속성을 지원하지 않음
  UNKNOWN_OBJECT,
  INVALID_ARRAY_INDEX,
  BUFFER_OVERFLOW,     // 응답이 APDU 한 개에 담기지 않음 (segmentation 불가)
  TIMEOUT,
  NOT_CONNECTED,
  COMMUNICATION_ERROR
};

const char *ServiceStatusToString(ServiceStatus status);

struct ReadResult {
  ServiceStatus status = ServiceStatus::COMMUNICATION_ERROR;
  Models::PropertyValue value;
  std::string message;

  bool Ok() const { return status == ServiceStatus::SUCCESS; }

  static ReadResult Success(Models::PropertyValue v) {
    ReadResult r;
    r.status = ServiceStatus::SUCCESS;
    r.value = std::move(v);
    return r;
  }

  static ReadResult Failure(ServiceStatus s, std::string msg = {}) {
    ReadResult r;
    r.status = s;
    r.message = std::move(msg);
    return r;
  }
};

// =============================================================================
// 수신 메시지
// =============================================================================

/// I-Am 응답에서 얻은 장치 정보
struct IAmIndication {
  uint32_t device_id = 0;
  std::string address; // "ip:port"
  std::optional<uint16_t> network_number;
  uint32_t max_apdu = 1476;
  std::string segmentation = "segmented-both";
  std::optional<uint16_t> vendor_id;
};

struct InboundMessage {
  std::string source;
  std::optional<IAmIndication> i_am;
};

using IndicationHandler = std::function<void(const InboundMessage &)>;

// =============================================================================
// ITransport
// =============================================================================

class ITransport {
public:
  virtual ~ITransport() = default;

  /// 범위 지정 Who-Is 브로드캐스트. 양쪽 경계는 생략 가능
  virtual bool SendWhoIs(std::optional<uint32_t> low_limit,
                         std::optional<uint32_t> high_limit) = 0;

  virtual ReadResult ReadProperty(uint32_t device_id, const std::string &address,
                                  const Models::ObjectId &object,
                                  const std::string &property,
                                  std::optional<uint32_t> array_index,
                                  std::chrono::milliseconds timeout) = 0;

  virtual ServiceStatus WriteProperty(uint32_t device_id,
                                      const std::string &address,
                                      const Models::ObjectId &object,
                                      const std::string &property,
                                      const Models::PropertyValue &value,
                                      std::optional<uint8_t> priority,
                                      std::optional<uint32_t> array_index,
                                      std::chrono::milliseconds timeout) = 0;

  /// 상위 수준 Register-Foreign-Device. ttl 0 은 등록 해제
  virtual bool RegisterForeignDevice(const RelayAddress &relay,
                                     uint16_t ttl_seconds) = 0;

  /// BVLL 메시지를 전송 계층의 데이터링크로 직접 송신
  virtual bool SendBvll(const RelayAddress &relay,
                        const std::vector<uint8_t> &message) = 0;

  /**
   * @brief 수신 훅 교체
   * @return 이전 핸들러 (복원용)
   */
  virtual IndicationHandler SetIndicationHandler(IndicationHandler handler) = 0;
};

} // namespace Transport
} // namespace BacLink

#endif // BACLINK_TRANSPORT_ITRANSPORT_H
