/**
 * @file DeviceModel.h
 * @brief BACnet 장치 / 객체 / 속성 모델
 * @author BacLink Development Team
 *
 * 모든 타임스탬프는 ISO-8601 UTC 문자열 (TimeUtils::ToIsoString).
 */

#ifndef BACLINK_MODELS_DEVICE_MODEL_H
#define BACLINK_MODELS_DEVICE_MODEL_H

#include "Models/PropertyValue.h"

#include <map>
#include <optional>
#include <set>
#include <string>

namespace BacLink {
namespace Models {

/**
 * @brief 마지막으로 성공한 속성 읽기 결과
 */
struct Property {
  std::string property_id;
  PropertyValue value;
  std::optional<std::string> unit;
  std::string timestamp;

  json to_json() const;
  void from_json(const json &j);
};

/**
 * @brief 장치 내 BACnet 객체 (데이터 포인트)
 */
struct BacnetObject {
  std::string object_type;
  uint32_t object_instance = 0;
  std::string object_name;
  std::string description;
  std::map<std::string, Property> properties;

  // 지원하지 않는 것으로 확인된 속성 (메모리 전용, 직렬화하지 않음)
  std::set<std::string> unsupported_properties;

  int poll_interval = 60;
  std::optional<std::string> last_poll;

  ObjectId Id() const { return ObjectId(object_type, object_instance); }
  std::string Key() const { return Id().Key(); }

  bool IsUnsupported(const std::string &property_id) const {
    return unsupported_properties.count(property_id) > 0;
  }

  const Property *FindProperty(const std::string &property_id) const;

  json to_json() const;
  void from_json(const json &j);
};

/**
 * @brief 디스커버리로 등록된 BACnet 장치
 */
struct Device {
  uint32_t device_id = 0;
  std::string address;
  std::string device_name;
  std::string vendor_name;
  std::string model_name;
  std::string firmware_revision;
  std::string application_software_version;
  int protocol_version = 1;
  int protocol_revision = 0;
  uint32_t max_apdu_length = 1476;
  std::string segmentation_supported = "segmented-both";
  std::optional<uint16_t> network_number;
  std::optional<uint16_t> vendor_identifier;

  // "type:instance" -> 객체
  std::map<std::string, BacnetObject> objects;

  std::string discovered_at;
  std::string last_seen;
  bool enabled = true;

  const BacnetObject *FindObject(const std::string &object_type,
                                 uint32_t object_instance) const;

  /**
   * @brief 저장 문서 형식
   * @param include_objects false 이면 objects 대신 object_count 만 기록 (API 목록용)
   */
  json to_json(bool include_objects = true) const;

  /**
   * @brief 저장 문서에서 복원
   * @throws nlohmann::json::exception 필수 필드 누락 또는 타입 불일치
   */
  void from_json(const json &j);
};

// nlohmann::json support
inline void to_json(json &j, const Property &p) { j = p.to_json(); }
inline void from_json(const json &j, Property &p) { p.from_json(j); }
inline void to_json(json &j, const BacnetObject &o) { j = o.to_json(); }
inline void from_json(const json &j, BacnetObject &o) { o.from_json(j); }
inline void to_json(json &j, const Device &d) { j = d.to_json(); }
inline void from_json(const json &j, Device &d) { d.from_json(j); }

} // namespace Models
} // namespace BacLink

#endif // BACLINK_MODELS_DEVICE_MODEL_H
