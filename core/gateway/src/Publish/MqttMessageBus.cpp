/**
 * @file MqttMessageBus.cpp
 * @brief Paho async_client 연결 / 발행
 * @author BacLink Development Team
 */

#include "Publish/MqttMessageBus.h"
#include "Logging/LogManager.h"

#include <mqtt/callback.h>
#include <mqtt/connect_options.h>

namespace BacLink {
namespace Publish {

namespace {
constexpr const char *kCategory = "mqtt";
}

// =============================================================================
// Paho 콜백
// =============================================================================

class MqttMessageBus::Callback : public virtual mqtt::callback {
public:
  explicit Callback(MqttMessageBus *bus) : bus_(bus) {}

  void connected(const std::string &cause) override {
    if (bus_) {
      bus_->OnConnected(cause);
    }
  }

  void connection_lost(const std::string &cause) override {
    if (bus_) {
      bus_->OnConnectionLost(cause);
    }
  }

private:
  MqttMessageBus *bus_;
};

// =============================================================================
// 생성자/소멸자
// =============================================================================

MqttMessageBus::MqttMessageBus(MqttOptions options)
    : options_(std::move(options)) {
  client_ = std::make_unique<mqtt::async_client>(options_.ServerUri(),
                                                 options_.client_id);
  callback_ = std::make_unique<Callback>(this);
  client_->set_callback(*callback_);
}

MqttMessageBus::~MqttMessageBus() {
  Disconnect();
  client_.reset();
}

// =============================================================================
// IMessageBus
// =============================================================================

bool MqttMessageBus::Connect() {
  auto &logger = LogManager::getInstance();
  std::lock_guard<std::mutex> lock(connect_mutex_);

  if (client_->is_connected()) {
    connected_ = true;
    return true;
  }
  // 한 번 연결된 뒤에는 Paho 자동 재연결에 맡긴다
  if (ever_connected_.load()) {
    return false;
  }

  mqtt::connect_options conn_opts;
  conn_opts.set_keep_alive_interval(options_.keepalive_seconds);
  conn_opts.set_clean_session(true);
  conn_opts.set_automatic_reconnect(true);
  if (!options_.username.empty()) {
    conn_opts.set_user_name(options_.username);
  }
  if (!options_.password.empty()) {
    conn_opts.set_password(options_.password);
  }

  try {
    logger.log(kCategory, LogLevel::INFO, "Connecting to MQTT broker {}",
               options_.ServerUri());
    auto token = client_->connect(conn_opts);
    if (!token->wait_for(options_.connect_timeout)) {
      logger.log(kCategory, LogLevel::WARN,
                 "MQTT connect to {} did not complete within {}ms",
                 options_.ServerUri(), options_.connect_timeout.count());
      return false;
    }
  } catch (const mqtt::exception &e) {
    logger.log(kCategory, LogLevel::WARN, "MQTT connect to {} failed: {}",
               options_.ServerUri(), e.what());
    connected_ = false;
    return false;
  }

  connected_ = client_->is_connected();
  if (connected_.load()) {
    ever_connected_ = true;
  }
  return connected_.load();
}

void MqttMessageBus::Disconnect() {
  std::lock_guard<std::mutex> lock(connect_mutex_);
  if (!client_ || !client_->is_connected()) {
    connected_ = false;
    return;
  }

  try {
    client_->disconnect()->wait_for(options_.connect_timeout);
    LogManager::getInstance().log(kCategory, LogLevel::INFO,
                                  "Disconnected from MQTT broker");
  } catch (const mqtt::exception &e) {
    LogManager::getInstance().log(kCategory, LogLevel::WARN,
                                  "MQTT disconnect failed: {}", e.what());
  }
  connected_ = false;
  ever_connected_ = false;
}

bool MqttMessageBus::IsConnected() const {
  return connected_.load() && client_->is_connected();
}

bool MqttMessageBus::Publish(const std::string &topic, const std::string &payload,
                             int qos, bool retain) {
  if (!IsConnected()) {
    return false;
  }

  try {
    mqtt::message_ptr msg = mqtt::make_message(topic, payload);
    msg->set_qos(qos);
    msg->set_retained(retain);
    client_->publish(msg);
    return true;
  } catch (const mqtt::exception &e) {
    LogManager::getInstance().log(kCategory, LogLevel::WARN,
                                  "MQTT publish to {} failed: {}", topic,
                                  e.what());
    return false;
  }
}

// =============================================================================
// 콜백 처리
// =============================================================================

void MqttMessageBus::OnConnected(const std::string &cause) {
  connected_ = true;
  ever_connected_ = true;
  LogManager::getInstance().log(kCategory, LogLevel::INFO,
                                "Connected to MQTT broker {} {}",
                                options_.ServerUri(), cause);
}

void MqttMessageBus::OnConnectionLost(const std::string &cause) {
  connected_ = false;
  LogManager::getInstance().log(kCategory, LogLevel::WARN,
                                "MQTT connection lost: {}", cause);
}

} // namespace Publish
} // namespace BacLink
