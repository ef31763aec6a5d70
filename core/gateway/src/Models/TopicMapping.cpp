/**
 * @file TopicMapping.cpp
 * @author BacLink Development Team
 */

#include "Models/TopicMapping.h"

namespace BacLink {
namespace Models {

json TopicMapping::to_json() const {
  return json{{"device_id", device_id},
              {"object_type", object_type},
              {"object_instance", object_instance},
              {"mqtt_topic", mqtt_topic},
              {"custom_topic", custom_topic ? json(*custom_topic) : json(nullptr)},
              {"enabled", enabled}};
}

void TopicMapping::from_json(const json &j) {
  device_id = j.at("device_id").get<uint32_t>();
  object_type = j.at("object_type").get<std::string>();
  object_instance = j.at("object_instance").get<uint32_t>();
  mqtt_topic = j.value("mqtt_topic", std::string());
  if (j.contains("custom_topic") && !j["custom_topic"].is_null()) {
    custom_topic = j["custom_topic"].get<std::string>();
  } else {
    custom_topic.reset();
  }
  enabled = j.value("enabled", true);
}

} // namespace Models
} // namespace BacLink
