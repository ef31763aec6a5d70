/**
 * @file DeviceRegistry.cpp
 * @brief 장치 레지스트리 구현
 * @author BacLink Development Team
 */

#include "Registry/DeviceRegistry.h"
#include "Common/TimeUtils.h"
#include "Logging/LogManager.h"
#include "Registry/JsonFile.h"

#include <stdexcept>

namespace BacLink {
namespace Registry {

using Models::BacnetObject;
using Models::Device;
using Models::ObjectId;

namespace {

void MergeIdentity(Device &target, const Device &source) {
  target.address = source.address;
  target.max_apdu_length = source.max_apdu_length;
  target.segmentation_supported = source.segmentation_supported;
  target.network_number = source.network_number;
  if (source.vendor_identifier) {
    target.vendor_identifier = source.vendor_identifier;
  }
  target.protocol_version = source.protocol_version;
  target.protocol_revision = source.protocol_revision;

  // 재식별 시 읽기에 실패한 항목이 기존 값을 지우지 않도록
  auto keep = [](std::string &dst, const std::string &src) {
    if (!src.empty()) {
      dst = src;
    }
  };
  keep(target.device_name, source.device_name);
  keep(target.vendor_name, source.vendor_name);
  keep(target.model_name, source.model_name);
  keep(target.firmware_revision, source.firmware_revision);
  keep(target.application_software_version,
       source.application_software_version);

  target.last_seen = source.last_seen.empty() ? TimeUtils::NowIsoString()
                                              : source.last_seen;
}

void NormalizeTimestamp(std::string &value, const std::string &fallback) {
  if (value.empty() || !TimeUtils::FromIsoString(value)) {
    value = fallback;
  }
}

} // namespace

DeviceRegistry::DeviceRegistry(std::string persistence_file)
    : persistence_file_(std::move(persistence_file)) {}

// =============================================================================
// 장치 단위 조작
// =============================================================================

Device DeviceRegistry::AddOrMerge(const Device &device) {
  std::lock_guard<std::mutex> lock(mutex_);

  auto it = devices_.find(device.device_id);
  if (it == devices_.end()) {
    Device fresh = device;
    const std::string now = TimeUtils::NowIsoString();
    if (fresh.discovered_at.empty()) {
      fresh.discovered_at = now;
    }
    if (fresh.last_seen.empty()) {
      fresh.last_seen = now;
    }
    auto inserted = devices_.emplace(fresh.device_id, std::move(fresh));
    return inserted.first->second;
  }

  Device &existing = it->second;
  MergeIdentity(existing, device);
  for (const auto &[key, obj] : device.objects) {
    existing.objects.emplace(key, obj);
  }
  return existing;
}

std::optional<Device> DeviceRegistry::Get(uint32_t device_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = devices_.find(device_id);
  if (it == devices_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<Device> DeviceRegistry::All() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<Device> result;
  result.reserve(devices_.size());
  for (const auto &[id, device] : devices_) {
    result.push_back(device);
  }
  return result;
}

std::vector<Device> DeviceRegistry::Enabled() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<Device> result;
  for (const auto &[id, device] : devices_) {
    if (device.enabled) {
      result.push_back(device);
    }
  }
  return result;
}

bool DeviceRegistry::Remove(uint32_t device_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  return devices_.erase(device_id) > 0;
}

bool DeviceRegistry::SetEnabled(uint32_t device_id, bool enabled) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = devices_.find(device_id);
  if (it == devices_.end()) {
    return false;
  }
  it->second.enabled = enabled;
  return true;
}

bool DeviceRegistry::TouchLastSeen(uint32_t device_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = devices_.find(device_id);
  if (it == devices_.end()) {
    return false;
  }
  it->second.last_seen = TimeUtils::NowIsoString();
  return true;
}

size_t DeviceRegistry::Size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return devices_.size();
}

// =============================================================================
// 객체 / 속성 단위 조작
// =============================================================================

BacnetObject *DeviceRegistry::FindObjectLocked(uint32_t device_id,
                                               const ObjectId &object) {
  auto dev_it = devices_.find(device_id);
  if (dev_it == devices_.end()) {
    return nullptr;
  }
  auto obj_it = dev_it->second.objects.find(object.Key());
  return obj_it != dev_it->second.objects.end() ? &obj_it->second : nullptr;
}

bool DeviceRegistry::AddObject(uint32_t device_id, const BacnetObject &object) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto dev_it = devices_.find(device_id);
  if (dev_it == devices_.end()) {
    return false;
  }

  Device &device = dev_it->second;
  auto result = device.objects.emplace(object.Key(), object);
  if (!result.second) {
    BacnetObject &existing = result.first->second;
    if (!object.object_name.empty()) {
      existing.object_name = object.object_name;
    }
    if (!object.description.empty()) {
      existing.description = object.description;
    }
  }
  device.last_seen = TimeUtils::NowIsoString();
  return true;
}

bool DeviceRegistry::StoreProperty(uint32_t device_id, const ObjectId &object,
                                   const std::string &property_id,
                                   const Models::PropertyValue &value,
                                   const std::optional<std::string> &unit) {
  std::lock_guard<std::mutex> lock(mutex_);
  BacnetObject *obj = FindObjectLocked(device_id, object);
  if (!obj) {
    return false;
  }

  const std::string now = TimeUtils::NowIsoString();
  Models::Property &prop = obj->properties[property_id];
  prop.property_id = property_id;
  prop.value = value;
  prop.timestamp = now;
  if (unit) {
    prop.unit = unit;
  }
  obj->last_poll = now;
  return true;
}

bool DeviceRegistry::MarkUnsupported(uint32_t device_id, const ObjectId &object,
                                     const std::string &property_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  BacnetObject *obj = FindObjectLocked(device_id, object);
  if (!obj) {
    return false;
  }
  obj->unsupported_properties.insert(property_id);
  return true;
}

bool DeviceRegistry::IsUnsupported(uint32_t device_id, const ObjectId &object,
                                   const std::string &property_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto dev_it = devices_.find(device_id);
  if (dev_it == devices_.end()) {
    return false;
  }
  auto obj_it = dev_it->second.objects.find(object.Key());
  return obj_it != dev_it->second.objects.end() &&
         obj_it->second.IsUnsupported(property_id);
}

// =============================================================================
// 영속화
// =============================================================================

bool DeviceRegistry::Persist() const {
  // 스냅샷과 쓰기를 같은 persist_mutex_ 아래에서 해야 오래된 스냅샷이
  // 새 파일을 덮어쓰지 않는다 (잠금 순서: persist_mutex_ -> mutex_)
  std::lock_guard<std::mutex> persist_lock(persist_mutex_);

  nlohmann::json document = nlohmann::json::object();
  size_t count = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto &[id, device] : devices_) {
      document[std::to_string(id)] = device.to_json();
    }
    count = devices_.size();
  }

  std::string error;
  if (!WriteJsonFile(persistence_file_, document, error)) {
    LogManager::getInstance().log("registry", LogLevel::LOG_ERROR,
                                  "Error saving device registry: {}", error);
    return false;
  }

  LogManager::getInstance().log("registry", LogLevel::DEBUG,
                                "Saved {} devices to {}", count,
                                persistence_file_);
  return true;
}

size_t DeviceRegistry::Load() {
  auto &logger = LogManager::getInstance();

  nlohmann::json document;
  std::string error;
  JsonReadStatus status = ReadJsonFile(persistence_file_, document, error);
  if (status == JsonReadStatus::NOT_FOUND) {
    logger.log("registry", LogLevel::INFO,
               "No device registry at {}, starting empty", persistence_file_);
    return 0;
  }

  std::map<uint32_t, Device> loaded;
  if (status == JsonReadStatus::OK) {
    try {
      if (!document.is_object()) {
        throw std::invalid_argument("root is not an object");
      }
      const std::string now = TimeUtils::NowIsoString();
      for (const auto &[key, device_json] : document.items()) {
        Device device;
        device.from_json(device_json);
        device.device_id = static_cast<uint32_t>(std::stoul(key));
        NormalizeTimestamp(device.discovered_at, now);
        NormalizeTimestamp(device.last_seen, now);
        loaded[device.device_id] = std::move(device);
      }
    } catch (const std::exception &e) {
      error = e.what();
      status = JsonReadStatus::DECODE_ERROR;
      loaded.clear();
    }
  }

  if (status == JsonReadStatus::DECODE_ERROR) {
    logger.log("registry", LogLevel::LOG_ERROR,
               "Error loading device registry {}: {}", persistence_file_,
               error);
  }

  size_t count = loaded.size();
  {
    std::lock_guard<std::mutex> lock(mutex_);
    devices_ = std::move(loaded);
  }
  logger.log("registry", LogLevel::INFO, "Loaded {} devices from {}", count,
             persistence_file_);
  return count;
}

} // namespace Registry
} // namespace BacLink
