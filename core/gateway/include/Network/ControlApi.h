/**
 * @file ControlApi.h
 * @brief 제어 API 요청 처리 (HTTP 서버와 무관한 JSON 핸들러)
 * @author BacLink Development Team
 *
 * 응답 형식: {success: true, timestamp, data} 또는
 *            {success: false, error, error_code, details, timestamp}
 */

#ifndef BACLINK_NETWORK_CONTROL_API_H
#define BACLINK_NETWORK_CONTROL_API_H

#include "Engine/BridgeEngine.h"

#include <nlohmann/json.hpp>

#include <string>

namespace BacLink {
namespace Network {

using json = nlohmann::json;

struct ApiResponse {
  int status = 200;
  json body;
};

class ControlApi {
public:
  explicit ControlApi(Engine::BridgeEngine &engine) : engine_(engine) {}

  // 상태
  ApiResponse GetStatus();

  // 장치
  ApiResponse GetDevices();
  ApiResponse GetDevice(const std::string &device_id);
  ApiResponse PostDiscover(const std::string &body);
  ApiResponse PostDiscoverObjects(const std::string &device_id);
  ApiResponse PutEnable(const std::string &device_id);
  ApiResponse PutDisable(const std::string &device_id);
  ApiResponse DeleteDevice(const std::string &device_id);

  // 객체
  ApiResponse GetObjects(const std::string &device_id);
  ApiResponse GetObject(const std::string &device_id,
                        const std::string &object_type,
                        const std::string &object_instance);

  // 단발성 읽기/쓰기
  ApiResponse PostRead(const std::string &body);
  ApiResponse PostWrite(const std::string &body);

  // BBMD
  ApiResponse PostRegister();

  // 토픽 매핑
  ApiResponse GetMappings();
  ApiResponse PostMapping(const std::string &body);
  ApiResponse DeleteMapping(const std::string &device_id,
                            const std::string &object_type,
                            const std::string &object_instance);

  static json CreateSuccessResponse(const json &data);
  static json CreateErrorResponse(const std::string &error,
                                  const std::string &error_code,
                                  const std::string &details = "");

private:
  Engine::BridgeEngine &engine_;
};

} // namespace Network
} // namespace BacLink

#endif // BACLINK_NETWORK_CONTROL_API_H
