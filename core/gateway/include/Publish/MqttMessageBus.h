/**
 * @file MqttMessageBus.h
 * @brief Eclipse Paho MQTT C++ 기반 IMessageBus 구현
 * @author BacLink Development Team
 */

#ifndef BACLINK_PUBLISH_MQTT_MESSAGE_BUS_H
#define BACLINK_PUBLISH_MQTT_MESSAGE_BUS_H

#include "Publish/IMessageBus.h"

#include <mqtt/async_client.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>

namespace BacLink {
namespace Publish {

struct MqttOptions {
  std::string broker_host = "localhost";
  int broker_port = 1883;
  std::string client_id = "bacnet_gateway";
  std::string username;
  std::string password;
  int keepalive_seconds = 60;
  std::chrono::milliseconds connect_timeout{std::chrono::seconds(5)};

  std::string ServerUri() const {
    return "tcp://" + broker_host + ":" + std::to_string(broker_port);
  }
};

class MqttMessageBus : public IMessageBus {
public:
  explicit MqttMessageBus(MqttOptions options);
  ~MqttMessageBus() override;

  MqttMessageBus(const MqttMessageBus &) = delete;
  MqttMessageBus &operator=(const MqttMessageBus &) = delete;

  bool Connect() override;
  void Disconnect() override;
  bool IsConnected() const override;
  bool Publish(const std::string &topic, const std::string &payload, int qos,
               bool retain) override;

  // 콜백에서 호출
  void OnConnected(const std::string &cause);
  void OnConnectionLost(const std::string &cause);

private:
  class Callback;

  MqttOptions options_;
  std::unique_ptr<mqtt::async_client> client_;
  std::unique_ptr<Callback> callback_;
  std::mutex connect_mutex_;
  std::atomic<bool> connected_{false};
  std::atomic<bool> ever_connected_{false};
};

} // namespace Publish
} // namespace BacLink

#endif // BACLINK_PUBLISH_MQTT_MESSAGE_BUS_H
