/**
 * @file TopicMappingStore.h
 * @brief MQTT 토픽 매핑 저장소 (추가/삭제 시 즉시 저장)
 * @author BacLink Development Team
 */

#ifndef BACLINK_REGISTRY_TOPIC_MAPPING_STORE_H
#define BACLINK_REGISTRY_TOPIC_MAPPING_STORE_H

#include "Models/TopicMapping.h"

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace BacLink {
namespace Registry {

class TopicMappingStore {
public:
  explicit TopicMappingStore(std::string persistence_file = "mqtt_mappings.json");

  TopicMappingStore(const TopicMappingStore &) = delete;
  TopicMappingStore &operator=(const TopicMappingStore &) = delete;

  /// 추가 또는 교체 후 저장. 저장 실패 시 false (메모리에는 반영됨)
  bool Add(const Models::TopicMapping &mapping);
  bool Remove(uint32_t device_id, const std::string &object_type,
              uint32_t object_instance);

  std::optional<Models::TopicMapping> Get(uint32_t device_id,
                                          const std::string &object_type,
                                          uint32_t object_instance) const;
  std::vector<Models::TopicMapping> All() const;
  std::vector<Models::TopicMapping> Enabled() const;

  bool Save() const;
  size_t Load();

private:
  mutable std::mutex mutex_;
  mutable std::mutex persist_mutex_;
  std::map<std::string, Models::TopicMapping> mappings_;
  std::string persistence_file_;
};

} // namespace Registry
} // namespace BacLink

#endif // BACLINK_REGISTRY_TOPIC_MAPPING_STORE_H
