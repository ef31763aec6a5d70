/**
 * @file PublishBridge.cpp
 * @brief MQTT 발행 루프 구현
 * @author BacLink Development Team
 */

#include "Publish/PublishBridge.h"
#include "Logging/LogManager.h"

namespace BacLink {
namespace Publish {

using Models::BacnetObject;
using Models::Device;
using json = nlohmann::json;

namespace {
constexpr const char *kCategory = "publish";

std::string NormalizeObjectType(std::string object_type) {
  for (auto &c : object_type) {
    if (c == '-' || c == ' ') {
      c = '_';
    }
  }
  return object_type;
}
} // namespace

PublishBridge::PublishBridge(IMessageBus &bus, Registry::DeviceRegistry &registry,
                             Registry::TopicMappingStore &mappings,
                             PublishOptions options)
    : bus_(bus), registry_(registry), mappings_(mappings),
      options_(std::move(options)) {}

PublishBridge::~PublishBridge() { Stop(); }

// =============================================================================
// 수명 주기
// =============================================================================

void PublishBridge::Start() {
  std::lock_guard<std::mutex> lock(lifecycle_mutex_);
  if (running_.load()) {
    return;
  }

  auto &logger = LogManager::getInstance();
  if (!bus_.Connect()) {
    logger.log(kCategory, LogLevel::WARN,
               "Message bus not connected yet, cycles are skipped until it is");
  }

  stop_requested_ = false;
  running_ = true;
  worker_ = std::thread(&PublishBridge::Loop, this);
  logger.log(kCategory, LogLevel::INFO, "Publish bridge started (interval {}ms)",
             options_.interval.count());
}

void PublishBridge::Stop() {
  std::lock_guard<std::mutex> lock(lifecycle_mutex_);
  if (!running_.load() && !worker_.joinable()) {
    return;
  }

  {
    std::lock_guard<std::mutex> wait_lock(wait_mutex_);
    stop_requested_ = true;
  }
  wait_cv_.notify_all();
  if (worker_.joinable()) {
    worker_.join();
  }
  running_ = false;

  bus_.Disconnect();
  LogManager::getInstance().log(kCategory, LogLevel::INFO,
                                "Publish bridge stopped");
}

void PublishBridge::Loop() {
  auto &logger = LogManager::getInstance();

  while (!stop_requested_.load()) {
    try {
      RunCycle();
    } catch (const std::exception &e) {
      logger.log(kCategory, LogLevel::LOG_ERROR, "Publish cycle error: {}",
                 e.what());
    }

    std::unique_lock<std::mutex> lock(wait_mutex_);
    wait_cv_.wait_for(lock, options_.interval,
                      [this] { return stop_requested_.load(); });
  }
}

// =============================================================================
// 발행
// =============================================================================

PublishReport PublishBridge::RunCycle() {
  auto &logger = LogManager::getInstance();
  PublishReport report;

  if (!bus_.IsConnected()) {
    report.skipped = true;
    logger.log(kCategory, LogLevel::WARN,
               "Message bus not connected, skipping cycle");
    if (bus_.Connect()) {
      logger.log(kCategory, LogLevel::INFO,
                 "Message bus reconnected, publishing resumes next cycle");
    }
    return report;
  }

  for (const auto &device : registry_.Enabled()) {
    try {
      if (bus_.Publish(StatusTopic(device.device_id),
                       BuildStatusPayload(device).dump(), options_.qos, true)) {
        ++report.status_messages;
      } else {
        ++report.failures;
      }

      for (const auto &[object_key, object] : device.objects) {
        for (const auto &[property_id, property] : object.properties) {
          if (!Models::HasValue(property.value)) {
            continue;
          }
          const std::string topic = ResolveTopic(device, object, property_id);
          if (bus_.Publish(topic, BuildPayload(device, object, property).dump(),
                           options_.qos, options_.retain)) {
            ++report.messages;
          } else {
            ++report.failures;
            logger.log(kCategory, LogLevel::WARN, "Failed to publish to {}",
                       topic);
          }
        }
      }
    } catch (const std::exception &e) {
      logger.log(kCategory, LogLevel::LOG_ERROR, "Error publishing device {}: {}",
                 device.device_id, e.what());
    }
  }

  ++cycle_count_;
  if (report.messages > 0) {
    logger.log(kCategory, LogLevel::DEBUG, "Published {} properties",
               report.messages);
  }
  return report;
}

std::string PublishBridge::ResolveTopic(const Device &device,
                                        const BacnetObject &object,
                                        const std::string &property_id) const {
  auto mapping = mappings_.Get(device.device_id, object.object_type,
                               object.object_instance);
  if (mapping && mapping->enabled && !mapping->EffectiveTopic().empty()) {
    return mapping->EffectiveTopic();
  }
  return DefaultTopic(device.device_id, object.object_type,
                      object.object_instance, property_id);
}

std::string PublishBridge::DefaultTopic(uint32_t device_id,
                                        const std::string &object_type,
                                        uint32_t object_instance,
                                        const std::string &property_id) const {
  return options_.topic_prefix + "/" + std::to_string(device_id) + "/" +
         NormalizeObjectType(object_type) + "/" +
         std::to_string(object_instance) + "/" + property_id;
}

std::string PublishBridge::StatusTopic(uint32_t device_id) const {
  return options_.topic_prefix + "/" + std::to_string(device_id) + "/status";
}

json PublishBridge::BuildPayload(const Device &device, const BacnetObject &object,
                                 const Models::Property &property) {
  json payload = {
      {"value", Models::PropertyValueToJson(property.value)},
      {"timestamp", property.timestamp},
      {"device",
       {{"id", device.device_id},
        {"name", device.device_name},
        {"address", device.address}}},
      {"object",
       {{"type", object.object_type},
        {"instance", object.object_instance},
        {"name", object.object_name}}},
      {"property", property.property_id}};
  if (property.unit && !property.unit->empty()) {
    payload["unit"] = *property.unit;
  }
  return payload;
}

json PublishBridge::BuildStatusPayload(const Device &device) {
  return {{"device_id", device.device_id},
          {"device_name", device.device_name},
          {"address", device.address},
          {"online", device.enabled},
          {"last_seen", device.last_seen},
          {"object_count", device.objects.size()}};
}

} // namespace Publish
} // namespace BacLink
