#ifndef BACLINK_LOG_TYPES_HPP
#define BACLINK_LOG_TYPES_HPP

/**
 * @file LogTypes.hpp
 * @brief LogLib 레벨과 통계 타입
 */

#include <array>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace LogLib {

/**
 * @brief 로그 레벨
 * @details ERROR/FATAL 은 시스템 헤더 매크로와 겹치므로 LOG_ 접두사를 사용
 */
enum class LogLevel : uint8_t {
  TRACE = 0,
  DEBUG = 1,
  INFO = 2,
  WARN = 3,
  LOG_ERROR = 4,
  LOG_FATAL = 5,
  OFF = 255
};

constexpr size_t kLevelCount = 6;

struct LogStatistics {
  uint64_t total_logs = 0;
  std::array<uint64_t, kLevelCount> per_level{};
  uint64_t frames = 0;
  uint64_t write_failures = 0; // 파일 열기/쓰기 실패
  std::chrono::system_clock::time_point last_log_time;

  uint64_t count(LogLevel level) const {
    const auto index = static_cast<size_t>(level);
    return index < kLevelCount ? per_level[index] : 0;
  }
};

const char *LogLevelToString(LogLevel level);

/// 대소문자 무시. WARNING, ERR 같은 별칭 허용. 알 수 없으면 std::nullopt
std::optional<LogLevel> ParseLogLevel(const std::string &text);

} // namespace LogLib

#endif // BACLINK_LOG_TYPES_HPP
