/**
 * @file GatewayConfig.cpp
 * @author BacLink Development Team
 */

#include "Core/GatewayConfig.h"
#include "Polling/CapabilityPoller.h"
#include "Utils/ConfigManager.h"

#include <stdexcept>

namespace BacLink {
namespace Core {

namespace {

constexpr uint32_t kMaxDeviceInstance = 4194303;

std::optional<uint32_t> ParseLimit(const ConfigManager &config,
                                   const std::string &key) {
  const std::string text = config.get(key);
  if (text.empty()) {
    return std::nullopt;
  }
  try {
    size_t consumed = 0;
    unsigned long value = std::stoul(text, &consumed);
    if (consumed != text.size() || value > kMaxDeviceInstance) {
      throw std::out_of_range(key);
    }
    return static_cast<uint32_t>(value);
  } catch (const std::exception &) {
    throw std::invalid_argument(key + " must be a device instance (0.." +
                                std::to_string(kMaxDeviceInstance) +
                                "), got '" + text + "'");
  }
}

void RequirePort(int port, const char *key) {
  if (port <= 0 || port > 65535) {
    throw std::invalid_argument(std::string(key) + " must be 1..65535");
  }
}

void RequirePositive(int value, const char *key) {
  if (value <= 0) {
    throw std::invalid_argument(std::string(key) + " must be positive");
  }
}

} // namespace

GatewayConfig::GatewayConfig() {
  const auto &defaults = Polling::CapabilityPoller::DefaultUnitObjectTypes();
  unit_object_types.assign(defaults.begin(), defaults.end());
}

GatewayConfig GatewayConfig::FromConfigManager() {
  return FromConfigManager(ConfigManager::getInstance());
}

GatewayConfig GatewayConfig::FromConfigManager(const ConfigManager &config) {
  GatewayConfig c;

  const int device_id = config.getInt("BACNET_DEVICE_ID",
                                      static_cast<int>(c.bacnet_device_id));
  if (device_id < 0) {
    throw std::invalid_argument("BACNET_DEVICE_ID must not be negative");
  }
  c.bacnet_device_id = static_cast<uint32_t>(device_id);
  c.bacnet_device_name =
      config.getOrDefault("BACNET_DEVICE_NAME", c.bacnet_device_name);
  c.bacnet_interface = config.getOrDefault("BACNET_INTERFACE", "");
  c.bacnet_port = config.getInt("BACNET_PORT", c.bacnet_port);
  c.bacnet_apdu_timeout_ms =
      config.getInt("BACNET_APDU_TIMEOUT_MS", c.bacnet_apdu_timeout_ms);

  c.bbmd_enabled = config.getBool("BBMD_ENABLED", c.bbmd_enabled);
  c.bbmd_address = config.getOrDefault("BBMD_ADDRESS", "");
  c.bbmd_port = config.getInt("BBMD_PORT", c.bbmd_port);
  c.bbmd_ttl = config.getInt("BBMD_TTL", c.bbmd_ttl);

  c.discovery_auto = config.getBool("DISCOVERY_AUTO", c.discovery_auto);
  c.discovery_interval_sec =
      config.getInt("DISCOVERY_INTERVAL_SEC", c.discovery_interval_sec);
  c.discovery_who_is_timeout_sec =
      config.getInt("DISCOVERY_WHO_IS_TIMEOUT_SEC", c.discovery_who_is_timeout_sec);
  c.discovery_max_timeout_sec =
      config.getInt("DISCOVERY_MAX_TIMEOUT_SEC", c.discovery_max_timeout_sec);
  c.discovery_low_limit = ParseLimit(config, "DISCOVERY_LOW_LIMIT");
  c.discovery_high_limit = ParseLimit(config, "DISCOVERY_HIGH_LIMIT");

  c.poll_enabled = config.getBool("POLL_ENABLED", c.poll_enabled);
  c.poll_interval_sec = config.getInt("POLL_INTERVAL_SEC", c.poll_interval_sec);
  c.poll_device_timeout_sec =
      config.getInt("POLL_DEVICE_TIMEOUT_SEC", c.poll_device_timeout_sec);
  c.poll_read_timeout_ms =
      config.getInt("POLL_READ_TIMEOUT_MS", c.poll_read_timeout_ms);
  c.poll_properties = config.getList("POLL_PROPERTIES", c.poll_properties);
  c.unit_object_types = config.getList("UNIT_OBJECT_TYPES", c.unit_object_types);

  c.mqtt_enabled = config.getBool("MQTT_ENABLED", c.mqtt_enabled);
  c.mqtt_broker = config.getOrDefault("MQTT_BROKER", c.mqtt_broker);
  c.mqtt_port = config.getInt("MQTT_PORT", c.mqtt_port);
  c.mqtt_client_id = config.getOrDefault("MQTT_CLIENT_ID", c.mqtt_client_id);
  c.mqtt_username = config.getOrDefault("MQTT_USERNAME", "");
  c.mqtt_password = config.getOrDefault("MQTT_PASSWORD", "");
  c.mqtt_topic_prefix =
      config.getOrDefault("MQTT_TOPIC_PREFIX", c.mqtt_topic_prefix);
  c.mqtt_qos = config.getInt("MQTT_QOS", c.mqtt_qos);
  c.mqtt_retain = config.getBool("MQTT_RETAIN", c.mqtt_retain);
  c.mqtt_keepalive_sec = config.getInt("MQTT_KEEPALIVE_SEC", c.mqtt_keepalive_sec);
  c.mqtt_publish_interval_sec =
      config.getInt("MQTT_PUBLISH_INTERVAL_SEC", c.mqtt_publish_interval_sec);

  c.devices_file = config.getOrDefault("DEVICES_FILE", c.devices_file);
  c.mappings_file = config.getOrDefault("MAPPINGS_FILE", c.mappings_file);

  c.api_enabled = config.getBool("API_ENABLED", c.api_enabled);
  c.api_host = config.getOrDefault("API_HOST", c.api_host);
  c.api_port = config.getInt("API_PORT", c.api_port);

  return c;
}

void GatewayConfig::Validate() const {
  if (bacnet_device_id > kMaxDeviceInstance) {
    throw std::invalid_argument("BACNET_DEVICE_ID must be 0.." +
                                std::to_string(kMaxDeviceInstance));
  }
  RequirePort(bacnet_port, "BACNET_PORT");
  RequirePositive(bacnet_apdu_timeout_ms, "BACNET_APDU_TIMEOUT_MS");

  if (bbmd_enabled) {
    if (bbmd_address.empty()) {
      throw std::invalid_argument("BBMD_ENABLED requires BBMD_ADDRESS");
    }
    RequirePort(bbmd_port, "BBMD_PORT");
    if (bbmd_ttl <= 0 || bbmd_ttl > 65535) {
      throw std::invalid_argument("BBMD_TTL must be 1..65535");
    }
  }

  RequirePositive(discovery_interval_sec, "DISCOVERY_INTERVAL_SEC");
  RequirePositive(discovery_who_is_timeout_sec, "DISCOVERY_WHO_IS_TIMEOUT_SEC");
  RequirePositive(discovery_max_timeout_sec, "DISCOVERY_MAX_TIMEOUT_SEC");
  if (discovery_low_limit && discovery_high_limit &&
      *discovery_low_limit > *discovery_high_limit) {
    throw std::invalid_argument(
        "DISCOVERY_LOW_LIMIT must not exceed DISCOVERY_HIGH_LIMIT");
  }

  RequirePositive(poll_interval_sec, "POLL_INTERVAL_SEC");
  RequirePositive(poll_device_timeout_sec, "POLL_DEVICE_TIMEOUT_SEC");
  RequirePositive(poll_read_timeout_ms, "POLL_READ_TIMEOUT_MS");
  if (poll_properties.empty()) {
    throw std::invalid_argument("POLL_PROPERTIES must name at least one property");
  }

  if (mqtt_enabled) {
    RequirePort(mqtt_port, "MQTT_PORT");
    if (mqtt_qos < 0 || mqtt_qos > 2) {
      throw std::invalid_argument("MQTT_QOS must be 0, 1 or 2");
    }
    RequirePositive(mqtt_keepalive_sec, "MQTT_KEEPALIVE_SEC");
    RequirePositive(mqtt_publish_interval_sec, "MQTT_PUBLISH_INTERVAL_SEC");
  }

  if (api_enabled) {
    RequirePort(api_port, "API_PORT");
  }
}

nlohmann::json GatewayConfig::ToJson() const {
  auto limit = [](const std::optional<uint32_t> &v) {
    return v ? nlohmann::json(*v) : nlohmann::json(nullptr);
  };

  return {{"bacnet",
           {{"device_id", bacnet_device_id},
            {"device_name", bacnet_device_name},
            {"interface", bacnet_interface},
            {"port", bacnet_port}}},
          {"bbmd",
           {{"enabled", bbmd_enabled},
            {"address", bbmd_address},
            {"port", bbmd_port},
            {"ttl", bbmd_ttl}}},
          {"discovery",
           {{"auto", discovery_auto},
            {"interval", discovery_interval_sec},
            {"who_is_timeout", discovery_who_is_timeout_sec},
            {"max_timeout", discovery_max_timeout_sec},
            {"low_limit", limit(discovery_low_limit)},
            {"high_limit", limit(discovery_high_limit)}}},
          {"polling",
           {{"enabled", poll_enabled},
            {"interval", poll_interval_sec},
            {"device_timeout", poll_device_timeout_sec},
            {"read_timeout_ms", poll_read_timeout_ms},
            {"properties", poll_properties}}},
          {"mqtt",
           {{"enabled", mqtt_enabled},
            {"broker", mqtt_broker},
            {"port", mqtt_port},
            {"client_id", mqtt_client_id},
            {"topic_prefix", mqtt_topic_prefix},
            {"qos", mqtt_qos},
            {"retain", mqtt_retain},
            {"publish_interval", mqtt_publish_interval_sec}}},
          {"api", {{"enabled", api_enabled}, {"host", api_host}, {"port", api_port}}}};
}

} // namespace Core
} // namespace BacLink
