/**
 * @file GatewayApplication.h
 * @brief BacLink 게이트웨이 메인 애플리케이션
 * @author BacLink Development Team
 *
 * 설정 로드, Transport / MQTT 버스 / 엔진 / 제어 API 구성 및 수명 주기 관리.
 */

#ifndef BACLINK_CORE_GATEWAY_APPLICATION_H
#define BACLINK_CORE_GATEWAY_APPLICATION_H

#include "Core/GatewayConfig.h"

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>

namespace BacLink {
namespace Transport {
class BacnetStackTransport;
}
namespace Publish {
class MqttMessageBus;
}
namespace Engine {
class BridgeEngine;
}
#if HAS_HTTPLIB
namespace Network {
class ControlApiServer;
}
#endif
} // namespace BacLink

namespace BacLink {
namespace Core {

class GatewayApplication {
public:
  GatewayApplication();
  ~GatewayApplication();

  GatewayApplication(const GatewayApplication &) = delete;
  GatewayApplication &operator=(const GatewayApplication &) = delete;

  /**
   * @brief 초기화 -> 메인 루프 -> 정리
   * @throws std::invalid_argument 잘못된 설정
   * @throws std::runtime_error Transport 바인딩 또는 저장 디렉터리 생성 실패
   */
  void Run();

  /// 시그널 핸들러에서 호출 가능
  void Stop();

  bool IsRunning() const { return is_running_.load(); }

private:
  void Initialize();
  void MainLoop();
  void Cleanup();
  void LogHealth();

  GatewayConfig config_;

  std::unique_ptr<Transport::BacnetStackTransport> transport_;
  std::unique_ptr<Publish::MqttMessageBus> bus_;
  std::unique_ptr<Engine::BridgeEngine> engine_;
#if HAS_HTTPLIB
  std::unique_ptr<Network::ControlApiServer> api_server_;
#endif

  std::atomic<bool> is_running_{false};
  std::atomic<bool> stop_requested_{false};
  std::mutex stop_mutex_;
  std::condition_variable stop_cv_;
};

} // namespace Core
} // namespace BacLink

#endif // BACLINK_CORE_GATEWAY_APPLICATION_H
