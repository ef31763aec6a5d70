/**
 * @file ControlApi.cpp
 * @brief 제어 API JSON 핸들러 구현
 * @author BacLink Development Team
 */

#include "Network/ControlApi.h"
#include "Logging/LogManager.h"

#include <cctype>
#include <chrono>
#include <limits>

namespace BacLink {
namespace Network {

using namespace std::chrono;

namespace {

constexpr const char *kCategory = "api";

std::optional<uint32_t> ParseUint(const std::string &text) {
  if (text.empty() || text.size() > 10) {
    return std::nullopt;
  }
  for (char c : text) {
    if (!std::isdigit(static_cast<unsigned char>(c))) {
      return std::nullopt;
    }
  }
  unsigned long long value = std::stoull(text);
  if (value > std::numeric_limits<uint32_t>::max()) {
    return std::nullopt;
  }
  return static_cast<uint32_t>(value);
}

ApiResponse Ok(const json &data) {
  return {200, ControlApi::CreateSuccessResponse(data)};
}

ApiResponse Fail(int status, const std::string &error, const std::string &code,
                 const std::string &details = "") {
  return {status, ControlApi::CreateErrorResponse(error, code, details)};
}

ApiResponse InvalidDeviceId(const std::string &text) {
  return Fail(400, "Invalid device id", "INVALID_DEVICE_ID", text);
}

ApiResponse DeviceNotFound(uint32_t device_id) {
  return Fail(404, "Device not found", "DEVICE_NOT_FOUND",
              std::to_string(device_id));
}

bool ParseBody(const std::string &body, json &out) {
  if (body.empty()) {
    out = json::object();
    return true;
  }
  out = json::parse(body, nullptr, false);
  return !out.is_discarded() && out.is_object();
}

/// 키가 없거나 null 이면 nullopt 유지. 값이 잘못되었으면 false
bool ReadOptionalUint(const json &j, const char *key,
                      std::optional<uint32_t> &out) {
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) {
    return true;
  }
  if (!it->is_number_unsigned() && !(it->is_number_integer() && it->get<int64_t>() >= 0)) {
    return false;
  }
  uint64_t value = it->get<uint64_t>();
  if (value > std::numeric_limits<uint32_t>::max()) {
    return false;
  }
  out = static_cast<uint32_t>(value);
  return true;
}

bool ReadRequiredUint(const json &j, const char *key, uint32_t &out) {
  std::optional<uint32_t> value;
  if (!ReadOptionalUint(j, key, value) || !value) {
    return false;
  }
  out = *value;
  return true;
}

bool ReadRequiredString(const json &j, const char *key, std::string &out) {
  auto it = j.find(key);
  if (it == j.end() || !it->is_string() || it->get<std::string>().empty()) {
    return false;
  }
  out = it->get<std::string>();
  return true;
}

struct PropertyTarget {
  uint32_t device_id = 0;
  std::string object_type;
  uint32_t object_instance = 0;
  std::string property_id;
  std::optional<uint32_t> array_index;
};

/// read / write 공통 필드. 실패 시 오류 응답을 채운다
bool ParseTarget(const json &j, PropertyTarget &target, ApiResponse &error) {
  if (!ReadRequiredUint(j, "device_id", target.device_id) ||
      !ReadRequiredString(j, "object_type", target.object_type) ||
      !ReadRequiredUint(j, "object_instance", target.object_instance) ||
      !ReadRequiredString(j, "property_id", target.property_id)) {
    error = Fail(400, "device_id, object_type, object_instance and property_id are required",
                 "MISSING_FIELDS");
    return false;
  }
  if (!ReadOptionalUint(j, "array_index", target.array_index)) {
    error = Fail(400, "array_index must be a non-negative integer",
                 "INVALID_ARRAY_INDEX");
    return false;
  }
  return true;
}

} // namespace

// =============================================================================
// 응답 헬퍼
// =============================================================================

json ControlApi::CreateSuccessResponse(const json &data) {
  json response = json::object();
  response["success"] = true;
  response["timestamp"] = static_cast<long>(
      duration_cast<milliseconds>(system_clock::now().time_since_epoch())
          .count());
  if (!data.is_null()) {
    response["data"] = data;
  }
  return response;
}

json ControlApi::CreateErrorResponse(const std::string &error,
                                     const std::string &error_code,
                                     const std::string &details) {
  json response = json::object();
  response["success"] = false;
  response["error"] = error;
  if (!error_code.empty()) {
    response["error_code"] = error_code;
  }
  if (!details.empty()) {
    response["details"] = details;
  }
  response["timestamp"] = static_cast<long>(
      duration_cast<milliseconds>(system_clock::now().time_since_epoch())
          .count());
  return response;
}

// =============================================================================
// 상태 / 장치
// =============================================================================

ApiResponse ControlApi::GetStatus() { return Ok(engine_.Status()); }

ApiResponse ControlApi::GetDevices() {
  json devices = json::array();
  for (const auto &device : engine_.Devices()) {
    devices.push_back(device.to_json(false));
  }
  return Ok(devices);
}

ApiResponse ControlApi::GetDevice(const std::string &device_id) {
  auto id = ParseUint(device_id);
  if (!id) {
    return InvalidDeviceId(device_id);
  }
  auto device = engine_.FindDevice(*id);
  if (!device) {
    return DeviceNotFound(*id);
  }
  return Ok(device->to_json(true));
}

ApiResponse ControlApi::PostDiscover(const std::string &body) {
  json request;
  if (!ParseBody(body, request)) {
    return Fail(400, "Request body must be a JSON object", "INVALID_JSON");
  }

  std::optional<uint32_t> low;
  std::optional<uint32_t> high;
  std::optional<uint32_t> timeout;
  if (!ReadOptionalUint(request, "low_limit", low) ||
      !ReadOptionalUint(request, "high_limit", high) ||
      !ReadOptionalUint(request, "timeout", timeout)) {
    return Fail(400, "low_limit, high_limit and timeout must be non-negative integers",
                "INVALID_PARAMETER");
  }
  if (low && high && *low > *high) {
    return Fail(400, "low_limit must not exceed high_limit", "INVALID_RANGE");
  }
  uint32_t timeout_sec = timeout.value_or(5);
  if (timeout_sec == 0) {
    return Fail(400, "timeout must be positive", "INVALID_PARAMETER");
  }
  const auto max_timeout =
      static_cast<uint32_t>(engine_.GetConfig().discovery_max_timeout_sec);
  if (timeout_sec > max_timeout) {
    LogManager::getInstance().log(kCategory, LogLevel::WARN,
                                  "Discovery timeout {}s clamped to {}s",
                                  timeout_sec, max_timeout);
    timeout_sec = max_timeout;
  }

  auto devices = engine_.Discover(low, high, seconds(timeout_sec));
  json list = json::array();
  for (const auto &device : devices) {
    list.push_back(device.to_json(false));
  }
  LogManager::getInstance().log(kCategory, LogLevel::INFO,
                                "Discovery request found {} devices",
                                devices.size());
  return Ok({{"count", devices.size()},
             {"timeout", timeout_sec},
             {"devices", list}});
}

ApiResponse ControlApi::PostDiscoverObjects(const std::string &device_id) {
  auto id = ParseUint(device_id);
  if (!id) {
    return InvalidDeviceId(device_id);
  }
  if (!engine_.FindDevice(*id)) {
    return DeviceNotFound(*id);
  }
  auto count = engine_.DiscoverObjects(*id);
  if (!count) {
    return Fail(502, "Object enumeration failed", "DISCOVERY_FAILED",
                std::to_string(*id));
  }
  return Ok({{"device_id", *id}, {"object_count", *count}});
}

ApiResponse ControlApi::PutEnable(const std::string &device_id) {
  auto id = ParseUint(device_id);
  if (!id) {
    return InvalidDeviceId(device_id);
  }
  if (!engine_.Enable(*id)) {
    return DeviceNotFound(*id);
  }
  return Ok({{"message", "Device " + std::to_string(*id) + " enabled"}});
}

ApiResponse ControlApi::PutDisable(const std::string &device_id) {
  auto id = ParseUint(device_id);
  if (!id) {
    return InvalidDeviceId(device_id);
  }
  if (!engine_.Disable(*id)) {
    return DeviceNotFound(*id);
  }
  return Ok({{"message", "Device " + std::to_string(*id) + " disabled"}});
}

ApiResponse ControlApi::DeleteDevice(const std::string &device_id) {
  auto id = ParseUint(device_id);
  if (!id) {
    return InvalidDeviceId(device_id);
  }
  if (!engine_.Remove(*id)) {
    return DeviceNotFound(*id);
  }
  return Ok({{"message", "Device " + std::to_string(*id) + " removed"}});
}

// =============================================================================
// 객체
// =============================================================================

ApiResponse ControlApi::GetObjects(const std::string &device_id) {
  auto id = ParseUint(device_id);
  if (!id) {
    return InvalidDeviceId(device_id);
  }
  auto objects = engine_.Objects(*id);
  if (!objects) {
    return DeviceNotFound(*id);
  }
  json list = json::array();
  for (const auto &object : *objects) {
    list.push_back(object.to_json());
  }
  return Ok({{"device_id", *id}, {"objects", list}});
}

ApiResponse ControlApi::GetObject(const std::string &device_id,
                                  const std::string &object_type,
                                  const std::string &object_instance) {
  auto id = ParseUint(device_id);
  if (!id) {
    return InvalidDeviceId(device_id);
  }
  auto instance = ParseUint(object_instance);
  if (!instance) {
    return Fail(400, "Invalid object instance", "INVALID_OBJECT_INSTANCE",
                object_instance);
  }
  auto device = engine_.FindDevice(*id);
  if (!device) {
    return DeviceNotFound(*id);
  }
  const Models::BacnetObject *object = device->FindObject(object_type, *instance);
  if (!object) {
    return Fail(404, "Object not found", "OBJECT_NOT_FOUND",
                object_type + ":" + object_instance);
  }
  return Ok(object->to_json());
}

// =============================================================================
// 읽기 / 쓰기
// =============================================================================

ApiResponse ControlApi::PostRead(const std::string &body) {
  json request;
  if (!ParseBody(body, request)) {
    return Fail(400, "Request body must be a JSON object", "INVALID_JSON");
  }

  PropertyTarget target;
  ApiResponse error;
  if (!ParseTarget(request, target, error)) {
    return error;
  }

  auto result = engine_.Read(target.device_id, target.object_type,
                             target.object_instance, target.property_id,
                             target.array_index);
  if (!result) {
    return DeviceNotFound(target.device_id);
  }
  if (!result->Ok()) {
    return Fail(502, "Read failed", "READ_FAILED",
                std::string(Transport::ServiceStatusToString(result->status)) +
                    (result->message.empty() ? "" : ": " + result->message));
  }

  return Ok({{"device_id", target.device_id},
             {"object_type", target.object_type},
             {"object_instance", target.object_instance},
             {"property_id", target.property_id},
             {"value", Models::PropertyValueToJson(result->value)}});
}

ApiResponse ControlApi::PostWrite(const std::string &body) {
  json request;
  if (!ParseBody(body, request)) {
    return Fail(400, "Request body must be a JSON object", "INVALID_JSON");
  }

  PropertyTarget target;
  ApiResponse error;
  if (!ParseTarget(request, target, error)) {
    return error;
  }
  if (!request.contains("value")) {
    return Fail(400, "value is required", "MISSING_FIELDS");
  }

  std::optional<uint32_t> priority;
  if (!ReadOptionalUint(request, "priority", priority) ||
      (priority && (*priority < 1 || *priority > 16))) {
    return Fail(400, "priority must be 1..16", "INVALID_PRIORITY");
  }
  if (!engine_.FindDevice(target.device_id)) {
    return DeviceNotFound(target.device_id);
  }

  const Models::PropertyValue value = Models::PropertyValueFromJson(request["value"]);
  std::optional<uint8_t> write_priority;
  if (priority) {
    write_priority = static_cast<uint8_t>(*priority);
  }

  if (!engine_.Write(target.device_id, target.object_type,
                     target.object_instance, target.property_id, value,
                     write_priority, target.array_index)) {
    return Fail(502, "Write failed", "WRITE_FAILED");
  }
  return Ok({{"message", "Property written"},
             {"device_id", target.device_id},
             {"object_type", target.object_type},
             {"object_instance", target.object_instance},
             {"property_id", target.property_id}});
}

// =============================================================================
// BBMD
// =============================================================================

ApiResponse ControlApi::PostRegister() {
  if (!engine_.GetConfig().bbmd_enabled) {
    return Fail(400, "BBMD not enabled in configuration", "BBMD_DISABLED");
  }
  if (!engine_.TriggerRegistration()) {
    return Fail(502, "BBMD registration failed", "REGISTRATION_FAILED");
  }
  return Ok({{"message", "BBMD registration triggered"},
             {"registration", engine_.Status()["registration"]}});
}

// =============================================================================
// 토픽 매핑
// =============================================================================

ApiResponse ControlApi::GetMappings() {
  json list = json::array();
  for (const auto &mapping : engine_.Mappings()) {
    list.push_back(mapping.to_json());
  }
  return Ok(list);
}

ApiResponse ControlApi::PostMapping(const std::string &body) {
  json request;
  if (!ParseBody(body, request)) {
    return Fail(400, "Request body must be a JSON object", "INVALID_JSON");
  }

  Models::TopicMapping mapping;
  try {
    mapping.from_json(request);
  } catch (const json::exception &e) {
    return Fail(400, "Invalid mapping", "INVALID_MAPPING", e.what());
  }
  if (mapping.object_type.empty() || mapping.EffectiveTopic().empty()) {
    return Fail(400, "object_type and a topic are required", "INVALID_MAPPING");
  }

  if (!engine_.AddMapping(mapping)) {
    return Fail(500, "Mapping could not be saved", "MAPPING_SAVE_FAILED");
  }
  return Ok(mapping.to_json());
}

ApiResponse ControlApi::DeleteMapping(const std::string &device_id,
                                      const std::string &object_type,
                                      const std::string &object_instance) {
  auto id = ParseUint(device_id);
  auto instance = ParseUint(object_instance);
  if (!id || !instance) {
    return Fail(400, "Invalid mapping key", "INVALID_MAPPING",
                device_id + ":" + object_type + ":" + object_instance);
  }
  if (!engine_.RemoveMapping(*id, object_type, *instance)) {
    return Fail(404, "Mapping not found", "MAPPING_NOT_FOUND",
                Models::TopicMapping::MakeKey(*id, object_type, *instance));
  }
  return Ok({{"message", "Mapping removed"}});
}

} // namespace Network
} // namespace BacLink
