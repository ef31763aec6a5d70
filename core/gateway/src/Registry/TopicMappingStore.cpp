/**
 * @file TopicMappingStore.cpp
 * @author BacLink Development Team
 */

#include "Registry/TopicMappingStore.h"
#include "Logging/LogManager.h"
#include "Registry/JsonFile.h"

#include <stdexcept>

namespace BacLink {
namespace Registry {

using Models::TopicMapping;

TopicMappingStore::TopicMappingStore(std::string persistence_file)
    : persistence_file_(std::move(persistence_file)) {}

bool TopicMappingStore::Add(const TopicMapping &mapping) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    mappings_[mapping.Key()] = mapping;
  }
  LogManager::getInstance().log("registry", LogLevel::INFO,
                                "Topic mapping {} -> {}", mapping.Key(),
                                mapping.EffectiveTopic());
  return Save();
}

bool TopicMappingStore::Remove(uint32_t device_id,
                               const std::string &object_type,
                               uint32_t object_instance) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (mappings_.erase(TopicMapping::MakeKey(device_id, object_type,
                                              object_instance)) == 0) {
      return false;
    }
  }
  return Save();
}

std::optional<TopicMapping>
TopicMappingStore::Get(uint32_t device_id, const std::string &object_type,
                       uint32_t object_instance) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it =
      mappings_.find(TopicMapping::MakeKey(device_id, object_type, object_instance));
  if (it == mappings_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<TopicMapping> TopicMappingStore::All() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<TopicMapping> result;
  for (const auto &[key, mapping] : mappings_) {
    result.push_back(mapping);
  }
  return result;
}

std::vector<TopicMapping> TopicMappingStore::Enabled() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<TopicMapping> result;
  for (const auto &[key, mapping] : mappings_) {
    if (mapping.enabled) {
      result.push_back(mapping);
    }
  }
  return result;
}

bool TopicMappingStore::Save() const {
  nlohmann::json document = nlohmann::json::object();
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto &[key, mapping] : mappings_) {
      document[key] = mapping.to_json();
    }
  }

  std::lock_guard<std::mutex> persist_lock(persist_mutex_);
  std::string error;
  if (!WriteJsonFile(persistence_file_, document, error)) {
    LogManager::getInstance().log("registry", LogLevel::LOG_ERROR,
                                  "Error saving topic mappings: {}", error);
    return false;
  }
  return true;
}

size_t TopicMappingStore::Load() {
  nlohmann::json document;
  std::string error;
  JsonReadStatus status = ReadJsonFile(persistence_file_, document, error);
  if (status == JsonReadStatus::NOT_FOUND) {
    return 0;
  }

  std::map<std::string, TopicMapping> loaded;
  if (status == JsonReadStatus::OK) {
    try {
      if (!document.is_object()) {
        throw std::invalid_argument("root is not an object");
      }
      for (const auto &[key, mapping_json] : document.items()) {
        TopicMapping mapping;
        mapping.from_json(mapping_json);
        loaded[mapping.Key()] = std::move(mapping);
      }
    } catch (const std::exception &e) {
      error = e.what();
      status = JsonReadStatus::DECODE_ERROR;
      loaded.clear();
    }
  }

  if (status == JsonReadStatus::DECODE_ERROR) {
    LogManager::getInstance().log("registry", LogLevel::LOG_ERROR,
                                  "Error loading topic mappings {}: {}",
                                  persistence_file_, error);
  }

  std::lock_guard<std::mutex> lock(mutex_);
  mappings_ = std::move(loaded);
  return mappings_.size();
}

} // namespace Registry
} // namespace BacLink
