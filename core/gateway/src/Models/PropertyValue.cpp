/**
 * @file PropertyValue.cpp
 * @brief PropertyValue JSON 변환 구현
 * @author BacLink Development Team
 */

#include "Models/PropertyValue.h"

#include <sstream>

namespace BacLink {
namespace Models {

namespace {

json ObjectIdToJson(const ObjectId &id) {
  return json{{"type", id.type}, {"instance", id.instance}};
}

bool IsObjectIdJson(const json &j) {
  return j.is_object() && j.contains("type") && j.contains("instance") &&
         j["type"].is_string() && j["instance"].is_number_unsigned();
}

// variant 방문자
struct ToJsonVisitor {
  json operator()(const std::monostate &) const { return nullptr; }
  json operator()(bool v) const { return v; }
  json operator()(int64_t v) const { return v; }
  json operator()(double v) const { return v; }
  json operator()(const std::string &v) const { return v; }
  json operator()(const ObjectId &v) const { return ObjectIdToJson(v); }
  json operator()(const BitString &v) const {
    json arr = json::array();
    for (bool bit : v) {
      arr.push_back(bit);
    }
    return arr;
  }
  json operator()(const std::vector<ObjectId> &v) const {
    json arr = json::array();
    for (const auto &id : v) {
      arr.push_back(ObjectIdToJson(id));
    }
    return arr;
  }
};

struct ToStringVisitor {
  std::string operator()(const std::monostate &) const { return ""; }
  std::string operator()(bool v) const { return v ? "true" : "false"; }
  std::string operator()(int64_t v) const { return std::to_string(v); }
  std::string operator()(double v) const {
    std::ostringstream oss;
    oss << v;
    return oss.str();
  }
  std::string operator()(const std::string &v) const { return v; }
  std::string operator()(const ObjectId &v) const { return v.Key(); }
  std::string operator()(const BitString &v) const {
    std::string bits = "{";
    for (size_t i = 0; i < v.size(); ++i) {
      bits += (i ? "," : "");
      bits += v[i] ? "1" : "0";
    }
    return bits + "}";
  }
  std::string operator()(const std::vector<ObjectId> &v) const {
    std::string out = "[";
    for (size_t i = 0; i < v.size(); ++i) {
      out += (i ? ", " : "") + v[i].Key();
    }
    return out + "]";
  }
};

} // namespace

std::optional<ObjectId> ObjectId::Parse(const std::string &key) {
  size_t pos = key.rfind(':');
  if (pos == std::string::npos || pos == 0 || pos + 1 >= key.size()) {
    return std::nullopt;
  }
  std::string instance_text = key.substr(pos + 1);
  if (instance_text.find_first_not_of("0123456789") != std::string::npos) {
    return std::nullopt;
  }
  try {
    unsigned long instance = std::stoul(instance_text);
    if (instance > UINT32_MAX) {
      return std::nullopt;
    }
    return ObjectId(key.substr(0, pos), static_cast<uint32_t>(instance));
  } catch (const std::exception &) {
    return std::nullopt;
  }
}

json PropertyValueToJson(const PropertyValue &value) {
  return std::visit(ToJsonVisitor{}, value);
}

PropertyValue PropertyValueFromJson(const json &j) {
  if (j.is_null()) {
    return std::monostate{};
  }
  if (j.is_boolean()) {
    return j.get<bool>();
  }
  if (j.is_number_integer()) {
    return j.get<int64_t>();
  }
  if (j.is_number_float()) {
    return j.get<double>();
  }
  if (j.is_string()) {
    return j.get<std::string>();
  }
  if (IsObjectIdJson(j)) {
    return ObjectId(j["type"].get<std::string>(), j["instance"].get<uint32_t>());
  }
  if (j.is_array()) {
    bool all_bool = true;
    bool all_ids = true;
    for (const auto &item : j) {
      all_bool = all_bool && item.is_boolean();
      all_ids = all_ids && IsObjectIdJson(item);
    }
    if (all_bool) {
      BitString bits;
      for (const auto &item : j) {
        bits.push_back(item.get<bool>());
      }
      return bits;
    }
    if (all_ids) {
      std::vector<ObjectId> ids;
      for (const auto &item : j) {
        ids.emplace_back(item["type"].get<std::string>(),
                         item["instance"].get<uint32_t>());
      }
      return ids;
    }
  }
  // 구조화된 기타 값은 문자열로 보존
  return j.dump();
}

std::string PropertyValueToString(const PropertyValue &value) {
  return std::visit(ToStringVisitor{}, value);
}

} // namespace Models
} // namespace BacLink
