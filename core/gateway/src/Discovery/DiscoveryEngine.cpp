/**
 * @file DiscoveryEngine.cpp
 * @brief 장치 디스커버리 구현
 * @author BacLink Development Team
 */

#include "Discovery/DiscoveryEngine.h"
#include "Common/TimeUtils.h"
#include "Discovery/ScopedIndicationCapture.h"
#include "Logging/LogManager.h"

#include <algorithm>
#include <limits>
#include <map>

namespace BacLink {
namespace Discovery {

using Models::BacnetObject;
using Models::Device;
using Models::ObjectId;
using Transport::IAmIndication;
using Transport::ReadResult;
using Transport::ServiceStatus;

namespace {

constexpr const char *kCategory = "discovery";

// index 0 을 읽지 못했을 때 가정하는 목록 길이
constexpr uint32_t kAssumedListLength = 500;

std::optional<int64_t> AsInteger(const Models::PropertyValue &value) {
  if (auto v = std::get_if<int64_t>(&value)) {
    return *v;
  }
  if (auto v = std::get_if<double>(&value)) {
    return static_cast<int64_t>(*v);
  }
  return std::nullopt;
}

} // namespace

const char *DiscoveryStateToString(DiscoveryState state) {
  switch (state) {
  case DiscoveryState::IDLE:
    return "IDLE";
  case DiscoveryState::BROADCASTING:
    return "BROADCASTING";
  case DiscoveryState::LISTENING:
    return "LISTENING";
  case DiscoveryState::PROCESSING:
    return "PROCESSING";
  }
  return "UNKNOWN";
}

const std::vector<std::string> &DiscoveryEngine::IdentificationProperties() {
  static const std::vector<std::string> properties = {
      "object-name",       "vendor-name",      "model-name",
      "firmware-revision", "protocol-version", "protocol-revision",
      "application-software-version"};
  return properties;
}

DiscoveryEngine::DiscoveryEngine(Transport::ITransport &transport,
                                 Registry::DeviceRegistry &registry,
                                 std::chrono::milliseconds read_timeout)
    : transport_(transport), registry_(registry), read_timeout_(read_timeout) {}

void DiscoveryEngine::SetDiscoveryCallback(DiscoveryCallback callback) {
  std::lock_guard<std::mutex> lock(callback_mutex_);
  callback_ = std::move(callback);
}

void DiscoveryEngine::Cancel() {
  {
    std::lock_guard<std::mutex> lock(wait_mutex_);
    cancel_requested_ = true;
  }
  wait_cv_.notify_all();
}

void DiscoveryEngine::ResetCancel() {
  std::lock_guard<std::mutex> lock(wait_mutex_);
  cancel_requested_ = false;
}

bool DiscoveryEngine::IsCancelled() const {
  std::lock_guard<std::mutex> lock(wait_mutex_);
  return cancel_requested_;
}

// =============================================================================
// Who-Is / I-Am
// =============================================================================

std::vector<Device>
DiscoveryEngine::Discover(std::optional<uint32_t> low_limit,
                          std::optional<uint32_t> high_limit,
                          std::chrono::milliseconds timeout) {
  auto &logger = LogManager::getInstance();
  std::lock_guard<std::mutex> discover_lock(discover_mutex_);

  if (IsCancelled()) {
    logger.log(kCategory, LogLevel::DEBUG, "Discovery cancelled, Who-Is skipped");
    return {};
  }

  std::vector<IAmIndication> responses;
  {
    // 캡처 가드는 이 블록을 벗어나는 모든 경로에서 원래 핸들러를 복원한다
    ScopedIndicationCapture capture(transport_);

    state_ = DiscoveryState::BROADCASTING;
    logger.log(kCategory, LogLevel::INFO,
               "Sending Who-Is (low={}, high={}, timeout={}ms)",
               low_limit ? std::to_string(*low_limit) : "*",
               high_limit ? std::to_string(*high_limit) : "*",
               timeout.count());

    if (!transport_.SendWhoIs(low_limit, high_limit)) {
      logger.log(kCategory, LogLevel::LOG_ERROR, "Failed to send Who-Is");
      state_ = DiscoveryState::IDLE;
      return {};
    }

    state_ = DiscoveryState::LISTENING;
    {
      std::unique_lock<std::mutex> lock(wait_mutex_);
      wait_cv_.wait_for(lock, timeout, [this] { return cancel_requested_; });
    }
    responses = capture.Drain();
  }

  state_ = DiscoveryState::PROCESSING;

  // 같은 장치의 중복 응답은 마지막 것만 사용
  std::map<uint32_t, IAmIndication> unique;
  for (auto &indication : responses) {
    unique[indication.device_id] = std::move(indication);
  }

  std::vector<Device> discovered;
  for (const auto &[device_id, indication] : unique) {
    if (IsCancelled()) {
      logger.log(kCategory, LogLevel::INFO,
                 "Discovery cancelled after {} of {} responses",
                 discovered.size(), unique.size());
      break;
    }
    try {
      Device device = BuildDevice(indication);
      ReadIdentification(device);
      Device merged = registry_.AddOrMerge(device);

      logger.log(kCategory, LogLevel::INFO, "Discovered device {} at {} ({})",
                 merged.device_id, merged.address, merged.device_name);
      NotifyDiscovered(merged);

      auto latest = registry_.Get(device_id);
      discovered.push_back(latest ? *latest : merged);
    } catch (const std::exception &e) {
      logger.log(kCategory, LogLevel::LOG_ERROR,
                 "Error processing I-Am from device {}: {}", device_id,
                 e.what());
    }
  }

  logger.log(kCategory, LogLevel::INFO,
             "Discovery complete: {} responses, {} devices", responses.size(),
             discovered.size());
  state_ = DiscoveryState::IDLE;
  return discovered;
}

Device DiscoveryEngine::BuildDevice(const IAmIndication &indication) {
  Device device;
  auto existing = registry_.Get(indication.device_id);
  if (existing) {
    // 식별 필드는 기존 값에서 출발, 객체 맵은 레지스트리가 보존한다
    device = *existing;
    device.objects.clear();
  } else {
    device.device_id = indication.device_id;
    device.discovered_at = TimeUtils::NowIsoString();
  }

  device.address = indication.address;
  device.max_apdu_length = indication.max_apdu;
  device.segmentation_supported = indication.segmentation;
  device.network_number = indication.network_number;
  if (indication.vendor_id) {
    device.vendor_identifier = indication.vendor_id;
  }
  device.last_seen = TimeUtils::NowIsoString();
  return device;
}

void DiscoveryEngine::ReadIdentification(Device &device) {
  auto &logger = LogManager::getInstance();
  const ObjectId device_object("device", device.device_id);

  for (const auto &property : IdentificationProperties()) {
    ReadResult result =
        transport_.ReadProperty(device.device_id, device.address, device_object,
                                property, std::nullopt, read_timeout_);
    if (!result.Ok() || !Models::HasValue(result.value)) {
      logger.log(kCategory, LogLevel::DEBUG, "Device {} {} not read: {} {}",
                 device.device_id, property,
                 Transport::ServiceStatusToString(result.status),
                 result.message);
      continue;
    }

    if (property == "protocol-version" || property == "protocol-revision") {
      auto number = AsInteger(result.value);
      if (!number) {
        continue;
      }
      if (property == "protocol-version") {
        device.protocol_version = static_cast<int>(*number);
      } else {
        device.protocol_revision = static_cast<int>(*number);
      }
      continue;
    }

    const std::string text = Models::PropertyValueToString(result.value);
    if (property == "object-name") {
      device.device_name = text;
    } else if (property == "vendor-name") {
      device.vendor_name = text;
    } else if (property == "model-name") {
      device.model_name = text;
    } else if (property == "firmware-revision") {
      device.firmware_revision = text;
    } else if (property == "application-software-version") {
      device.application_software_version = text;
    }
  }
}

void DiscoveryEngine::NotifyDiscovered(const Device &device) {
  DiscoveryCallback callback;
  {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    callback = callback_;
  }
  if (!callback) {
    return;
  }

  try {
    callback(device);
  } catch (const std::exception &e) {
    LogManager::getInstance().log(kCategory, LogLevel::LOG_ERROR,
                                  "Discovery callback failed for device {}: {}",
                                  device.device_id, e.what());
  }
}

// =============================================================================
// 객체 열거
// =============================================================================

std::optional<size_t> DiscoveryEngine::DiscoverDeviceObjects(uint32_t device_id) {
  auto &logger = LogManager::getInstance();

  auto device = registry_.Get(device_id);
  if (!device) {
    logger.log(kCategory, LogLevel::WARN,
               "Cannot enumerate objects: device {} not in registry", device_id);
    return std::nullopt;
  }

  auto object_ids = ReadObjectList(*device);
  if (!object_ids) {
    return std::nullopt;
  }

  size_t added = 0;
  for (const auto &id : *object_ids) {
    if (IsCancelled()) {
      logger.log(kCategory, LogLevel::INFO,
                 "Device {}: enumeration cancelled after {} objects", device_id,
                 added);
      return added;
    }
    if (id.type == "device") {
      continue;
    }

    BacnetObject object;
    object.object_type = id.type;
    object.object_instance = id.instance;

    ReadResult name = transport_.ReadProperty(device->device_id, device->address,
                                              id, "object-name", std::nullopt,
                                              read_timeout_);
    if (name.Ok() && Models::HasValue(name.value)) {
      object.object_name = Models::PropertyValueToString(name.value);
    }

    if (registry_.AddObject(device_id, object)) {
      ++added;
    }
  }

  logger.log(kCategory, LogLevel::INFO, "Device {}: {} objects enumerated",
             device_id, added);
  return added;
}

std::optional<std::vector<ObjectId>>
DiscoveryEngine::ReadObjectList(const Device &device) {
  auto &logger = LogManager::getInstance();
  const ObjectId device_object("device", device.device_id);

  ReadResult result =
      transport_.ReadProperty(device.device_id, device.address, device_object,
                              "object-list", std::nullopt, read_timeout_);

  if (result.Ok()) {
    if (auto list = std::get_if<std::vector<ObjectId>>(&result.value)) {
      return *list;
    }
    if (auto single = std::get_if<ObjectId>(&result.value)) {
      return std::vector<ObjectId>{*single};
    }
    logger.log(kCategory, LogLevel::WARN,
               "Device {} object-list has unexpected type", device.device_id);
    return std::nullopt;
  }

  if (result.status == ServiceStatus::BUFFER_OVERFLOW) {
    logger.log(kCategory, LogLevel::INFO,
               "Device {} object-list too large, reading by index",
               device.device_id);
    return ReadObjectListIndexed(device);
  }

  logger.log(kCategory, LogLevel::WARN, "Device {} object-list read failed: {} {}",
             device.device_id, Transport::ServiceStatusToString(result.status),
             result.message);
  return std::nullopt;
}

std::vector<ObjectId>
DiscoveryEngine::ReadObjectListIndexed(const Device &device) {
  auto &logger = LogManager::getInstance();
  const ObjectId device_object("device", device.device_id);

  uint32_t declared = kAssumedListLength;
  ReadResult length =
      transport_.ReadProperty(device.device_id, device.address, device_object,
                              "object-list", 0u, read_timeout_);
  if (length.Ok()) {
    auto number = AsInteger(length.value);
    if (number && *number >= 0) {
      declared = static_cast<uint32_t>(
          std::min<int64_t>(*number, std::numeric_limits<uint32_t>::max()));
    }
  }

  const uint32_t limit = std::min(declared, kMaxIndexedObjects);
  std::vector<ObjectId> result;

  for (uint32_t index = 1; index <= limit; ++index) {
    if (IsCancelled()) {
      break;
    }
    ReadResult element =
        transport_.ReadProperty(device.device_id, device.address, device_object,
                                "object-list", index, read_timeout_);
    if (element.Ok()) {
      if (auto id = std::get_if<ObjectId>(&element.value)) {
        result.push_back(*id);
      }
      continue;
    }

    if (element.status == ServiceStatus::INVALID_ARRAY_INDEX) {
      break;
    }
    if (element.status == ServiceStatus::TIMEOUT ||
        element.status == ServiceStatus::NOT_CONNECTED) {
      logger.log(kCategory, LogLevel::WARN,
                 "Device {} object-list[{}] {}, stopping enumeration",
                 device.device_id, index,
                 Transport::ServiceStatusToString(element.status));
      break;
    }
    logger.log(kCategory, LogLevel::DEBUG, "Device {} object-list[{}] {}",
               device.device_id, index,
               Transport::ServiceStatusToString(element.status));
  }

  return result;
}

} // namespace Discovery
} // namespace BacLink
