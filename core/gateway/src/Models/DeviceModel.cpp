/**
 * @file DeviceModel.cpp
 * @brief 장치 모델 직렬화 구현
 * @author BacLink Development Team
 */

#include "Models/DeviceModel.h"

namespace BacLink {
namespace Models {

namespace {

json OptionalString(const std::optional<std::string> &value) {
  return value ? json(*value) : json(nullptr);
}

std::optional<std::string> ReadOptionalString(const json &j,
                                              const char *key) {
  if (!j.contains(key) || j[key].is_null()) {
    return std::nullopt;
  }
  return j[key].get<std::string>();
}

template <typename T>
std::optional<T> ReadOptionalNumber(const json &j, const char *key) {
  if (!j.contains(key) || j[key].is_null()) {
    return std::nullopt;
  }
  return j[key].get<T>();
}

} // namespace

// =============================================================================
// Property
// =============================================================================

json Property::to_json() const {
  return json{{"property_id", property_id},
              {"value", PropertyValueToJson(value)},
              {"timestamp", timestamp},
              {"unit", OptionalString(unit)}};
}

void Property::from_json(const json &j) {
  property_id = j.at("property_id").get<std::string>();
  value = PropertyValueFromJson(j.value("value", json()));
  timestamp = j.value("timestamp", std::string());
  unit = ReadOptionalString(j, "unit");
}

// =============================================================================
// BacnetObject
// =============================================================================

const Property *BacnetObject::FindProperty(const std::string &property_id) const {
  auto it = properties.find(property_id);
  return it != properties.end() ? &it->second : nullptr;
}

json BacnetObject::to_json() const {
  json props = json::object();
  for (const auto &[id, prop] : properties) {
    props[id] = prop.to_json();
  }
  return json{{"object_type", object_type},
              {"object_instance", object_instance},
              {"object_name", object_name},
              {"description", description},
              {"properties", props},
              {"poll_interval", poll_interval},
              {"last_poll", OptionalString(last_poll)}};
}

void BacnetObject::from_json(const json &j) {
  object_type = j.at("object_type").get<std::string>();
  object_instance = j.at("object_instance").get<uint32_t>();
  object_name = j.value("object_name", std::string());
  description = j.value("description", std::string());
  poll_interval = j.value("poll_interval", 60);
  last_poll = ReadOptionalString(j, "last_poll");

  properties.clear();
  if (j.contains("properties")) {
    for (const auto &[id, prop_json] : j.at("properties").items()) {
      Property prop;
      prop.from_json(prop_json);
      properties[id] = std::move(prop);
    }
  }
  unsupported_properties.clear();
}

// =============================================================================
// Device
// =============================================================================

const BacnetObject *Device::FindObject(const std::string &object_type,
                                       uint32_t object_instance) const {
  auto it = objects.find(ObjectId(object_type, object_instance).Key());
  return it != objects.end() ? &it->second : nullptr;
}

json Device::to_json(bool include_objects) const {
  json j = {{"device_id", device_id},
            {"address", address},
            {"device_name", device_name},
            {"vendor_name", vendor_name},
            {"model_name", model_name},
            {"firmware_revision", firmware_revision},
            {"application_software_version", application_software_version},
            {"protocol_version", protocol_version},
            {"protocol_revision", protocol_revision},
            {"max_apdu_length", max_apdu_length},
            {"segmentation_supported", segmentation_supported},
            {"network_number",
             network_number ? json(*network_number) : json(nullptr)},
            {"vendor_identifier",
             vendor_identifier ? json(*vendor_identifier) : json(nullptr)},
            {"discovered_at", discovered_at},
            {"last_seen", last_seen},
            {"enabled", enabled}};

  if (include_objects) {
    json objs = json::object();
    for (const auto &[key, obj] : objects) {
      objs[key] = obj.to_json();
    }
    j["objects"] = objs;
  } else {
    j["object_count"] = objects.size();
  }
  return j;
}

void Device::from_json(const json &j) {
  device_id = j.at("device_id").get<uint32_t>();
  address = j.at("address").get<std::string>();
  device_name = j.value("device_name", std::string());
  vendor_name = j.value("vendor_name", std::string());
  model_name = j.value("model_name", std::string());
  firmware_revision = j.value("firmware_revision", std::string());
  application_software_version =
      j.value("application_software_version", std::string());
  protocol_version = j.value("protocol_version", 1);
  protocol_revision = j.value("protocol_revision", 0);
  max_apdu_length = j.value("max_apdu_length", 1476u);
  segmentation_supported =
      j.value("segmentation_supported", std::string("segmented-both"));
  network_number = ReadOptionalNumber<uint16_t>(j, "network_number");
  vendor_identifier = ReadOptionalNumber<uint16_t>(j, "vendor_identifier");
  discovered_at = j.value("discovered_at", std::string());
  last_seen = j.value("last_seen", std::string());
  enabled = j.value("enabled", true);

  objects.clear();
  if (j.contains("objects")) {
    for (const auto &[key, obj_json] : j.at("objects").items()) {
      BacnetObject obj;
      obj.from_json(obj_json);
      objects[key] = std::move(obj);
    }
  }
}

} // namespace Models
} // namespace BacLink
