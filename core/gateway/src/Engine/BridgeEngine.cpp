/**
 * @file BridgeEngine.cpp
 * @brief 브리지 엔진 구현
 * @author BacLink Development Team
 */

#include "Engine/BridgeEngine.h"
#include "Logging/LogManager.h"

namespace BacLink {
namespace Engine {

using Models::BacnetObject;
using Models::Device;
using Models::ObjectId;

namespace {

constexpr const char *kCategory = "engine";

Polling::PollerOptions MakePollerOptions(const Core::GatewayConfig &config) {
  Polling::PollerOptions options;
  options.read_timeout = std::chrono::milliseconds(config.poll_read_timeout_ms);
  options.unit_object_types.clear();
  options.unit_object_types.insert(config.unit_object_types.begin(),
                                   config.unit_object_types.end());
  return options;
}

Polling::SchedulerOptions MakeSchedulerOptions(const Core::GatewayConfig &config) {
  Polling::SchedulerOptions options;
  options.interval = std::chrono::seconds(config.poll_interval_sec);
  options.device_timeout = std::chrono::seconds(config.poll_device_timeout_sec);
  options.properties = config.poll_properties;
  return options;
}

Registration::RegistrationOptions
MakeRegistrationOptions(const Core::GatewayConfig &config) {
  Registration::RegistrationOptions options;
  options.enabled = config.bbmd_enabled;
  options.relay.host = config.bbmd_address;
  options.relay.port = static_cast<uint16_t>(config.bbmd_port);
  options.ttl_seconds = static_cast<uint16_t>(config.bbmd_ttl);
  return options;
}

Publish::PublishOptions MakePublishOptions(const Core::GatewayConfig &config) {
  Publish::PublishOptions options;
  options.topic_prefix = config.mqtt_topic_prefix;
  options.qos = config.mqtt_qos;
  options.retain = config.mqtt_retain;
  options.interval = std::chrono::seconds(config.mqtt_publish_interval_sec);
  return options;
}

} // namespace

BridgeEngine::BridgeEngine(const Core::GatewayConfig &config,
                           Transport::ITransport &transport,
                           Publish::IMessageBus *bus,
                           Registration::StrategyList strategies)
    : config_(config), transport_(transport), registry_(config.devices_file),
      mappings_(config.mappings_file),
      discovery_(transport, registry_,
                 std::chrono::milliseconds(config.poll_read_timeout_ms)),
      poller_(transport, registry_, MakePollerOptions(config)),
      scheduler_(poller_, registry_, MakeSchedulerOptions(config)),
      registration_(MakeRegistrationOptions(config),
                    strategies.empty()
                        ? Registration::RegistrationManager::DefaultStrategies(
                              transport)
                        : std::move(strategies)) {
  if (bus != nullptr && config_.mqtt_enabled) {
    publisher_ = std::make_unique<Publish::PublishBridge>(
        *bus, registry_, mappings_, MakePublishOptions(config_));
  }

  discovery_.SetDiscoveryCallback(
      [this](const Device &device) { OnDeviceDiscovered(device); });
}

BridgeEngine::~BridgeEngine() { Stop(); }

// =============================================================================
// 수명 주기
// =============================================================================

void BridgeEngine::Start() {
  auto &logger = LogManager::getInstance();
  std::lock_guard<std::mutex> lock(lifecycle_mutex_);
  if (running_.load()) {
    return;
  }

  logger.log(kCategory, LogLevel::INFO, "Starting bridge engine");
  registry_.Load();
  mappings_.Load();

  if (registration_.IsEnabled()) {
    registration_.Start();
  }
  if (config_.poll_enabled) {
    scheduler_.Start();
  }
  if (publisher_) {
    publisher_->Start();
  }
  discovery_.ResetCancel();
  if (config_.discovery_auto) {
    discovery_stop_ = false;
    discovery_thread_ = std::thread(&BridgeEngine::DiscoveryLoop, this);
  }

  running_ = true;
  logger.log(kCategory, LogLevel::INFO, "Bridge engine started ({} devices)",
             registry_.Size());
}

void BridgeEngine::Stop() {
  auto &logger = LogManager::getInstance();
  std::lock_guard<std::mutex> lock(lifecycle_mutex_);
  if (!running_.load()) {
    return;
  }

  logger.log(kCategory, LogLevel::INFO, "Stopping bridge engine");

  {
    std::lock_guard<std::mutex> wait_lock(discovery_wait_mutex_);
    discovery_stop_ = true;
  }
  discovery_wait_cv_.notify_all();
  discovery_.Cancel();
  if (discovery_thread_.joinable()) {
    discovery_thread_.join();
  }

  if (publisher_) {
    publisher_->Stop();
  }
  scheduler_.Stop();
  registration_.Stop();

  if (!registry_.Persist()) {
    logger.log(kCategory, LogLevel::LOG_ERROR,
               "Device registry could not be saved on shutdown");
  }
  running_ = false;
  logger.log(kCategory, LogLevel::INFO, "Bridge engine stopped");
}

void BridgeEngine::DiscoveryLoop() {
  auto &logger = LogManager::getInstance();
  const auto interval = std::chrono::seconds(config_.discovery_interval_sec);

  while (!discovery_stop_.load()) {
    try {
      Discover(config_.discovery_low_limit, config_.discovery_high_limit,
               std::chrono::seconds(config_.discovery_who_is_timeout_sec));
    } catch (const std::exception &e) {
      logger.log(kCategory, LogLevel::LOG_ERROR, "Periodic discovery error: {}",
                 e.what());
    }

    std::unique_lock<std::mutex> lock(discovery_wait_mutex_);
    discovery_wait_cv_.wait_for(lock, interval,
                                [this] { return discovery_stop_.load(); });
  }
}

void BridgeEngine::OnDeviceDiscovered(const Device &device) {
  if (discovery_stop_.load()) {
    return;
  }
  auto count = DiscoverObjects(device.device_id);
  if (!count) {
    LogManager::getInstance().log(kCategory, LogLevel::WARN,
                                  "Object enumeration failed for device {}",
                                  device.device_id);
  }
}

void BridgeEngine::PersistRegistry() {
  if (!registry_.Persist()) {
    LogManager::getInstance().log(kCategory, LogLevel::WARN,
                                  "Registry changes kept in memory only");
  }
}

std::chrono::milliseconds BridgeEngine::ReadTimeout() const {
  return std::chrono::milliseconds(config_.poll_read_timeout_ms);
}

// =============================================================================
// 제어 연산
// =============================================================================

std::vector<Device> BridgeEngine::Discover(std::optional<uint32_t> low_limit,
                                           std::optional<uint32_t> high_limit,
                                           std::chrono::milliseconds timeout) {
  return discovery_.Discover(low_limit, high_limit, timeout);
}

std::optional<size_t> BridgeEngine::DiscoverObjects(uint32_t device_id) {
  auto count = discovery_.DiscoverDeviceObjects(device_id);
  if (count) {
    PersistRegistry();
  }
  return count;
}

std::optional<Transport::ReadResult>
BridgeEngine::Read(uint32_t device_id, const std::string &object_type,
                   uint32_t object_instance, const std::string &property,
                   std::optional<uint32_t> array_index) {
  auto device = registry_.Get(device_id);
  if (!device) {
    return std::nullopt;
  }

  Transport::ReadResult result = transport_.ReadProperty(
      device_id, device->address, ObjectId(object_type, object_instance),
      property, array_index, ReadTimeout());
  if (result.Ok()) {
    registry_.TouchLastSeen(device_id);
  } else {
    LogManager::getInstance().log(
        kCategory, LogLevel::WARN, "Read {}:{}:{} {} failed: {}", device_id,
        object_type, object_instance, property,
        Transport::ServiceStatusToString(result.status));
  }
  return result;
}

bool BridgeEngine::Write(uint32_t device_id, const std::string &object_type,
                         uint32_t object_instance, const std::string &property,
                         const Models::PropertyValue &value,
                         std::optional<uint8_t> priority,
                         std::optional<uint32_t> array_index) {
  auto &logger = LogManager::getInstance();
  auto device = registry_.Get(device_id);
  if (!device) {
    logger.log(kCategory, LogLevel::WARN, "Write to unknown device {}",
               device_id);
    return false;
  }

  Transport::ServiceStatus status = transport_.WriteProperty(
      device_id, device->address, ObjectId(object_type, object_instance),
      property, value, priority, array_index, ReadTimeout());
  if (status != Transport::ServiceStatus::SUCCESS) {
    logger.log(kCategory, LogLevel::WARN, "Write {}:{}:{} {} failed: {}",
               device_id, object_type, object_instance, property,
               Transport::ServiceStatusToString(status));
    return false;
  }

  registry_.TouchLastSeen(device_id);
  logger.log(kCategory, LogLevel::INFO, "Wrote {} to {}:{}:{} {}",
             Models::PropertyValueToString(value), device_id, object_type,
             object_instance, property);
  return true;
}

bool BridgeEngine::Enable(uint32_t device_id) {
  if (!registry_.SetEnabled(device_id, true)) {
    return false;
  }
  PersistRegistry();
  return true;
}

bool BridgeEngine::Disable(uint32_t device_id) {
  if (!registry_.SetEnabled(device_id, false)) {
    return false;
  }
  PersistRegistry();
  return true;
}

bool BridgeEngine::Remove(uint32_t device_id) {
  if (!registry_.Remove(device_id)) {
    return false;
  }
  LogManager::getInstance().log(kCategory, LogLevel::INFO, "Removed device {}",
                                device_id);
  PersistRegistry();
  return true;
}

bool BridgeEngine::TriggerRegistration() {
  return registration_.TriggerRegistration();
}

// =============================================================================
// 조회
// =============================================================================

nlohmann::json BridgeEngine::Status() const {
  const auto devices = registry_.All();
  size_t enabled = 0;
  size_t objects = 0;
  for (const auto &device : devices) {
    if (device.enabled) {
      ++enabled;
    }
    objects += device.objects.size();
  }

  return {{"running", running_.load()},
          {"local_device_id", config_.bacnet_device_id},
          {"devices",
           {{"total", devices.size()},
            {"enabled", enabled},
            {"objects", objects}}},
          {"discovery",
           {{"auto", config_.discovery_auto},
            {"state", Discovery::DiscoveryStateToString(discovery_.GetState())}}},
          {"polling",
           {{"running", scheduler_.IsRunning()},
            {"cycles", scheduler_.GetCycleCount()}}},
          {"publishing",
           {{"enabled", publisher_ != nullptr},
            {"running", publisher_ ? publisher_->IsRunning() : false},
            {"cycles", publisher_ ? publisher_->GetCycleCount() : 0}}},
          {"registration", registration_.GetStatusJson()}};
}

std::vector<Device> BridgeEngine::Devices() const { return registry_.All(); }

std::optional<Device> BridgeEngine::FindDevice(uint32_t device_id) const {
  return registry_.Get(device_id);
}

std::optional<std::vector<BacnetObject>>
BridgeEngine::Objects(uint32_t device_id) const {
  auto device = registry_.Get(device_id);
  if (!device) {
    return std::nullopt;
  }
  std::vector<BacnetObject> objects;
  objects.reserve(device->objects.size());
  for (const auto &[key, object] : device->objects) {
    objects.push_back(object);
  }
  return objects;
}

// =============================================================================
// 토픽 매핑
// =============================================================================

bool BridgeEngine::AddMapping(const Models::TopicMapping &mapping) {
  return mappings_.Add(mapping);
}

bool BridgeEngine::RemoveMapping(uint32_t device_id, const std::string &object_type,
                                 uint32_t object_instance) {
  return mappings_.Remove(device_id, object_type, object_instance);
}

std::vector<Models::TopicMapping> BridgeEngine::Mappings() const {
  return mappings_.All();
}

} // namespace Engine
} // namespace BacLink
