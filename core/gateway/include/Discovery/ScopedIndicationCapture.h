/**
 * @file ScopedIndicationCapture.h
 * @brief 디스커버리 동안 I-Am 응답을 수집하는 RAII 가드
 * @author BacLink Development Team
 *
 * 생성 시 캡처 핸들러를 설치하고 (이전 핸들러로도 전달), 소멸 시 이전
 * 핸들러를 복원한다. 예외나 조기 반환에서도 복원이 보장된다.
 */

#ifndef BACLINK_DISCOVERY_SCOPED_INDICATION_CAPTURE_H
#define BACLINK_DISCOVERY_SCOPED_INDICATION_CAPTURE_H

#include "Transport/ITransport.h"

#include <memory>
#include <mutex>
#include <vector>

namespace BacLink {
namespace Discovery {

class ScopedIndicationCapture {
public:
  explicit ScopedIndicationCapture(Transport::ITransport &transport);
  ~ScopedIndicationCapture();

  ScopedIndicationCapture(const ScopedIndicationCapture &) = delete;
  ScopedIndicationCapture &operator=(const ScopedIndicationCapture &) = delete;

  /// 지금까지 수집된 I-Am 을 꺼낸다 (버퍼는 비워짐)
  std::vector<Transport::IAmIndication> Drain();

private:
  struct Buffer {
    std::mutex mutex;
    std::vector<Transport::IAmIndication> items;
    Transport::IndicationHandler chained;
  };

  Transport::ITransport &transport_;
  Transport::IndicationHandler previous_;
  // 수신 스레드가 핸들러 복사본을 들고 있을 수 있으므로 공유 소유
  std::shared_ptr<Buffer> buffer_;
};

} // namespace Discovery
} // namespace BacLink

#endif // BACLINK_DISCOVERY_SCOPED_INDICATION_CAPTURE_H
