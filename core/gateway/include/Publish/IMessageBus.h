/**
 * @file IMessageBus.h
 * @brief 발행 대상 메시지 버스 인터페이스
 * @author BacLink Development Team
 */

#ifndef BACLINK_PUBLISH_IMESSAGE_BUS_H
#define BACLINK_PUBLISH_IMESSAGE_BUS_H

#include <string>

namespace BacLink {
namespace Publish {

class IMessageBus {
public:
  virtual ~IMessageBus() = default;

  /// 연결 시작. 실패해도 구현체가 재연결을 계속할 수 있다
  virtual bool Connect() = 0;
  virtual void Disconnect() = 0;
  virtual bool IsConnected() const = 0;

  /// fire-and-forget 발행. 큐잉에 실패하면 false
  virtual bool Publish(const std::string &topic, const std::string &payload,
                       int qos, bool retain) = 0;
};

} // namespace Publish
} // namespace BacLink

#endif // BACLINK_PUBLISH_IMESSAGE_BUS_H
