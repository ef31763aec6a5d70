// core/shared/include/Common/Enums.h
#ifndef BACLINK_COMMON_ENUMS_H
#define BACLINK_COMMON_ENUMS_H

#include <cstdint>
#include <string>

// 일부 시스템 헤더가 INFO/DEBUG/WARN 을 매크로로 정의하는 경우 충돌 방지
#ifdef INFO
#undef INFO
#endif

#ifdef DEBUG
#undef DEBUG
#endif

#ifdef WARN
#undef WARN
#endif

namespace BacLink {
namespace Enums {

// =========================================================================
// 로그 레벨 (LogLib::LogLevel 과 값이 1:1 대응)
// =========================================================================
enum class LogLevel : uint8_t {
  TRACE = 0,
  DEBUG = 1,
  INFO = 2,
  WARN = 3,
  LOG_ERROR = 4,
  LOG_FATAL = 5,
  OFF = 255
};

} // namespace Enums
} // namespace BacLink

#endif // BACLINK_COMMON_ENUMS_H
