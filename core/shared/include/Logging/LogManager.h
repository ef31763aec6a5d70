#ifndef BACLINK_LOG_MANAGER_H
#define BACLINK_LOG_MANAGER_H

/**
 * @file LogManager.h
 * @brief 게이트웨이 로그 진입점 - LogLib::LoggerEngine 위임 + "{}" 포맷
 * @details
 * ConfigManager 의 LOG_* 키를 처음 사용할 때 한 번 엔진에 반영한다.
 *   LOG_LEVEL              전체 최소 레벨
 *   LOG_LEVEL_<CATEGORY>   카테고리별 레벨 (예: LOG_LEVEL_BACNET=DEBUG)
 *   LOG_FRAMES             BVLL 프레임 hex 덤프 on/off
 * @author BacLink Development Team
 */

#include "Common/Enums.h"

#include "LoggerEngine.hpp"

#include <atomic>
#include <cstdint>
#include <mutex>
#include <sstream>
#include <string>
#include <vector>

using LogLevel = BacLink::Enums::LogLevel;

class LogManager {
public:
  static LogManager &getInstance() {
    static LogManager instance;
    instance.ensureInitialized();
    return instance;
  }

  // =============================================================================
  // 기록
  // =============================================================================
  void log(const std::string &category, LogLevel level,
           const std::string &message);

  template <typename T, typename... Args>
  void log(const std::string &category, LogLevel level,
           const std::string &format, T &&first, Args &&...args) {
    if (!isEnabled(category, level)) {
      return;
    }
    log(category, level,
        formatString(format, std::forward<T>(first),
                     std::forward<Args>(args)...));
  }

  /// 카테고리 없는 INFO 로그 (기동/종료 단계 안내용)
  template <typename... Args>
  void Info(const std::string &format, Args &&...args) {
    log("", LogLevel::INFO, formatString(format, std::forward<Args>(args)...));
  }

  bool isEnabled(const std::string &category, LogLevel level) const;

  /// LOG_FRAMES 가 켜져 있을 때만 기록된다
  void logFrame(const std::string &channel, const std::string &peer,
                const std::vector<uint8_t> &frame, const std::string &summary);

  // =============================================================================
  // 설정
  // =============================================================================
  LogLevel getLogLevel() const;

  /// ConfigManager 값을 다시 읽어 엔진에 반영
  void reloadSettings();

  void setConsoleOutput(bool enabled);
  void setFileOutput(bool enabled);
  size_t cleanupOldLogs(int retentionDays);

  LogLib::LogStatistics getStatistics() const;
  void resetStatistics();
  void flushAll();

  template <typename... Args>
  static std::string formatString(const std::string &format, Args &&...args) {
    std::ostringstream out;
    size_t pos = 0;
    (appendArgument(out, format, pos, args), ...);
    if (pos < format.size()) {
      out << format.substr(pos);
    }
    return out.str();
  }

private:
  LogManager() = default;
  ~LogManager() = default;

  LogManager(const LogManager &) = delete;
  LogManager &operator=(const LogManager &) = delete;

  void ensureInitialized();
  void applyConfig();

  // 다음 "{}" 까지 복사하고 값을 넣는다. 자리가 없으면 값은 버린다
  template <typename T>
  static void appendArgument(std::ostringstream &out, const std::string &format,
                             size_t &pos, const T &value) {
    const size_t slot = format.find("{}", pos);
    if (slot == std::string::npos) {
      return;
    }
    out << format.substr(pos, slot - pos) << value;
    pos = slot + 2;
  }

  std::atomic<bool> initialized_{false};
  std::mutex init_mutex_;
};

#endif // BACLINK_LOG_MANAGER_H
