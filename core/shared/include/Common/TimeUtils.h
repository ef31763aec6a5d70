/**
 * @file TimeUtils.h
 * @brief ISO-8601 (UTC) 시간 문자열 변환 유틸리티
 * @author BacLink Development Team
 */

#ifndef BACLINK_COMMON_TIME_UTILS_H
#define BACLINK_COMMON_TIME_UTILS_H

#include <chrono>
#include <optional>
#include <string>

namespace BacLink {
namespace TimeUtils {

using Timestamp = std::chrono::system_clock::time_point;

/**
 * @brief time_point -> "YYYY-MM-DDTHH:MM:SS.ffffffZ"
 */
std::string ToIsoString(const Timestamp &tp);

/**
 * @brief ISO-8601 문자열 파싱
 * @details 소수점 이하 초와 끝의 'Z' 는 생략 가능. 시간대 오프셋은 지원하지 않음.
 * @return 형식이 맞지 않으면 std::nullopt
 */
std::optional<Timestamp> FromIsoString(const std::string &text);

inline std::string NowIsoString() {
  return ToIsoString(std::chrono::system_clock::now());
}

} // namespace TimeUtils
} // namespace BacLink

#endif // BACLINK_COMMON_TIME_UTILS_H
