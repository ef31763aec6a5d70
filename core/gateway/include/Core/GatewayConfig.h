/**
 * @file GatewayConfig.h
 * @brief 게이트웨이 설정 (ConfigManager 키 -> 타입 있는 구조체)
 * @author BacLink Development Team
 */

#ifndef BACLINK_CORE_GATEWAY_CONFIG_H
#define BACLINK_CORE_GATEWAY_CONFIG_H

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

class ConfigManager;

namespace BacLink {
namespace Core {

struct GatewayConfig {
  // BACnet 로컬 장치
  uint32_t bacnet_device_id = 999999;
  std::string bacnet_device_name = "BACnet-MQTT Gateway";
  std::string bacnet_interface;
  int bacnet_port = 47808;
  int bacnet_apdu_timeout_ms = 3000;

  // BBMD 외부 장치 등록
  bool bbmd_enabled = false;
  std::string bbmd_address;
  int bbmd_port = 47808;
  int bbmd_ttl = 30;

  // 디스커버리
  bool discovery_auto = true;
  int discovery_interval_sec = 300;
  int discovery_who_is_timeout_sec = 5;
  int discovery_max_timeout_sec = 60; // 제어 API 요청 timeout 상한
  std::optional<uint32_t> discovery_low_limit;
  std::optional<uint32_t> discovery_high_limit;

  // 폴링
  bool poll_enabled = true;
  int poll_interval_sec = 60;
  int poll_device_timeout_sec = 60;
  int poll_read_timeout_ms = 5000;
  std::vector<std::string> poll_properties{"present-value", "status-flags"};
  std::vector<std::string> unit_object_types;

  // MQTT
  bool mqtt_enabled = true;
  std::string mqtt_broker = "localhost";
  int mqtt_port = 1883;
  std::string mqtt_client_id = "bacnet_gateway";
  std::string mqtt_username;
  std::string mqtt_password;
  std::string mqtt_topic_prefix = "bacnet";
  int mqtt_qos = 1;
  bool mqtt_retain = true;
  int mqtt_keepalive_sec = 60;
  int mqtt_publish_interval_sec = 5;

  // 저장소
  std::string devices_file = "devices.json";
  std::string mappings_file = "mqtt_mappings.json";

  // 제어 API
  bool api_enabled = true;
  std::string api_host = "0.0.0.0";
  int api_port = 8080;

  GatewayConfig();

  /**
   * @brief ConfigManager 값으로 구성 (없는 키는 기본값)
   * @throws std::invalid_argument 디스커버리 범위 값이 숫자가 아닐 때
   */
  static GatewayConfig FromConfigManager(const ConfigManager &config);
  static GatewayConfig FromConfigManager();

  /**
   * @brief 값 범위 검증
   * @throws std::invalid_argument 첫 번째로 발견된 오류
   */
  void Validate() const;

  /// 비밀번호를 제외한 요약 (상태 API, 시작 로그용)
  nlohmann::json ToJson() const;
};

} // namespace Core
} // namespace BacLink

#endif // BACLINK_CORE_GATEWAY_CONFIG_H
