/**
 * @file TopicMapping.h
 * @brief 객체별 MQTT 토픽 오버라이드
 * @author BacLink Development Team
 */

#ifndef BACLINK_MODELS_TOPIC_MAPPING_H
#define BACLINK_MODELS_TOPIC_MAPPING_H

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace BacLink {
namespace Models {

using json = nlohmann::json;

struct TopicMapping {
  uint32_t device_id = 0;
  std::string object_type;
  uint32_t object_instance = 0;
  std::string mqtt_topic;
  std::optional<std::string> custom_topic;
  bool enabled = true;

  /// "device_id:object_type:object_instance"
  std::string Key() const {
    return MakeKey(device_id, object_type, object_instance);
  }

  static std::string MakeKey(uint32_t device_id,
                             const std::string &object_type,
                             uint32_t object_instance) {
    return std::to_string(device_id) + ":" + object_type + ":" +
           std::to_string(object_instance);
  }

  /// custom_topic 이 비어있지 않으면 우선 사용
  const std::string &EffectiveTopic() const {
    return (custom_topic && !custom_topic->empty()) ? *custom_topic
                                                    : mqtt_topic;
  }

  json to_json() const;

  /**
   * @throws nlohmann::json::exception 필수 필드 누락
   */
  void from_json(const json &j);
};

inline void to_json(json &j, const TopicMapping &m) { j = m.to_json(); }
inline void from_json(const json &j, TopicMapping &m) { m.from_json(j); }

} // namespace Models
} // namespace BacLink

#endif // BACLINK_MODELS_TOPIC_MAPPING_H
