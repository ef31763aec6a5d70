/**
 * @file ControlApiServer.h
 * @brief 제어 API HTTP 서버 (cpp-httplib)
 * @author BacLink Development Team
 *
 * 라우트는 ControlApi 핸들러에 위임한다. 이 파일은 HAS_HTTPLIB 빌드에서만
 * 컴파일된다.
 */

#ifndef BACLINK_NETWORK_CONTROL_API_SERVER_H
#define BACLINK_NETWORK_CONTROL_API_SERVER_H

#include "Network/ControlApi.h"

#include <atomic>
#include <memory>
#include <string>
#include <thread>

namespace httplib {
class Server;
struct Request;
struct Response;
} // namespace httplib

namespace BacLink {
namespace Network {

class ControlApiServer {
public:
  ControlApiServer(Engine::BridgeEngine &engine, std::string host, int port);
  ~ControlApiServer();

  ControlApiServer(const ControlApiServer &) = delete;
  ControlApiServer &operator=(const ControlApiServer &) = delete;

  /// 포트 바인딩에 실패하면 false
  bool Start();
  void Stop();
  bool IsRunning() const { return running_.load(); }

private:
  void SetupRoutes();

  static void SetCorsHeaders(httplib::Response &res);
  static void Send(httplib::Response &res, const ApiResponse &response);

  ControlApi api_;
  std::string host_;
  int port_;
  std::unique_ptr<httplib::Server> server_;
  std::thread server_thread_;
  std::atomic<bool> running_{false};
};

} // namespace Network
} // namespace BacLink

#endif // BACLINK_NETWORK_CONTROL_API_SERVER_H
