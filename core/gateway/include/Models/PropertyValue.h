/**
 * @file PropertyValue.h
 * @brief BACnet 객체 식별자 및 동적 타입 속성 값
 * @author BacLink Development Team
 */

#ifndef BACLINK_MODELS_PROPERTY_VALUE_H
#define BACLINK_MODELS_PROPERTY_VALUE_H

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace BacLink {
namespace Models {

using json = nlohmann::json;

/**
 * @brief (object_type, object_instance) 복합 키
 * @details object_type 은 "analog-input" 같은 하이픈 표기 이름을 사용한다.
 */
struct ObjectId {
  std::string type;
  uint32_t instance = 0;

  ObjectId() = default;
  ObjectId(std::string object_type, uint32_t object_instance)
      : type(std::move(object_type)), instance(object_instance) {}

  /// "type:instance"
  std::string Key() const { return type + ":" + std::to_string(instance); }

  /**
   * @brief "type:instance" 문자열 파싱
   * @return 형식 오류 시 std::nullopt
   */
  static std::optional<ObjectId> Parse(const std::string &key);

  bool operator==(const ObjectId &other) const {
    return type == other.type && instance == other.instance;
  }
  bool operator!=(const ObjectId &other) const { return !(*this == other); }
  bool operator<(const ObjectId &other) const {
    return type != other.type ? type < other.type : instance < other.instance;
  }
};

using BitString = std::vector<bool>;

/**
 * @brief 읽기 결과 값
 * @details monostate 는 "값 없음"(BACnet NULL) 을 나타낸다.
 */
using PropertyValue =
    std::variant<std::monostate, bool, int64_t, double, std::string, ObjectId,
                 BitString, std::vector<ObjectId>>;

json PropertyValueToJson(const PropertyValue &value);
PropertyValue PropertyValueFromJson(const json &j);

/// 로그 및 식별 문자열 필드용 표현
std::string PropertyValueToString(const PropertyValue &value);

inline bool HasValue(const PropertyValue &value) {
  return !std::holds_alternative<std::monostate>(value);
}

} // namespace Models
} // namespace BacLink

#endif // BACLINK_MODELS_PROPERTY_VALUE_H
