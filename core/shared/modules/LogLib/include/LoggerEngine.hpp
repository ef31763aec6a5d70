#ifndef BACLINK_LOGGER_ENGINE_HPP
#define BACLINK_LOGGER_ENGINE_HPP

/**
 * @file LoggerEngine.hpp
 * @brief 콘솔/파일 출력, 카테고리별 레벨, 프레임 덤프, 로테이션
 * @details 게이트웨이 코드에 의존하지 않는 독립 모듈.
 *
 * 파일 배치:
 *   <base>/<YYYYMMDD>/<category>.log          일반 로그
 *   <base>/frames/<YYYYMMDD>/<channel>.log    프레임 hex 덤프
 * 크기 초과 시 <category>.1.log, <category>.2.log ... 로 밀어내고
 * 최대 개수를 넘는 백업은 삭제한다.
 */

#include "LogExport.hpp"
#include "LogTypes.hpp"

#include <cstdint>
#include <fstream>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace LogLib {

class LOGLIB_API LoggerEngine {
public:
  static LoggerEngine &getInstance();

  // ==========================================================================
  // 레벨
  // ==========================================================================
  void setLogLevel(LogLevel level);
  LogLevel getLogLevel() const;

  /// 특정 카테고리만 다른 레벨로 (예: bacnet 만 DEBUG)
  void setCategoryLevel(const std::string &category, LogLevel level);
  void clearCategoryLevels();
  LogLevel getEffectiveLevel(const std::string &category) const;
  bool isEnabled(const std::string &category, LogLevel level) const;

  // ==========================================================================
  // 출력 대상
  // ==========================================================================
  void setLogBasePath(const std::string &path);
  void setConsoleOutput(bool enabled);
  void setFileOutput(bool enabled);
  void setFrameLogging(bool enabled);
  void setMaxLogSizeMB(size_t size_mb);
  void setMaxLogFiles(int count);

  // ==========================================================================
  // 기록
  // ==========================================================================
  void log(const std::string &category, LogLevel level,
           const std::string &message);

  /**
   * @brief 송수신 프레임 hex 덤프 (프레임 로깅이 켜진 경우에만)
   * @param channel 파일 이름 (예: "bvll")
   * @param peer 상대 주소 "ip:port"
   */
  void logFrame(const std::string &channel, const std::string &peer,
                const std::vector<uint8_t> &frame, const std::string &summary);

  void flushAll();

  /// 수정 시각이 retentionDays 보다 오래된 .log 파일 삭제. 삭제한 개수 반환
  size_t cleanupOldLogs(int retentionDays);

  LogStatistics getStatistics() const;
  void resetStatistics();

  static LogLevel stringToLogLevel(const std::string &level,
                                   LogLevel fallback = LogLevel::INFO);
  static std::string hexDump(const std::vector<uint8_t> &bytes);

private:
  struct OpenFile {
    std::ofstream stream;
    std::string path;
    std::string date;
    uintmax_t size = 0;
  };

  enum class Console { NONE, OUT, ERR };

  LoggerEngine() = default;
  ~LoggerEngine();

  LoggerEngine(const LoggerEngine &) = delete;
  LoggerEngine &operator=(const LoggerEngine &) = delete;

  void emit(const std::string &directory, const std::string &name,
            const std::string &line, Console console);
  bool openLocked(OpenFile &file, const std::string &path);
  void rotateLocked(OpenFile &file);
  void closeAllLocked();

  static std::string currentDate();
  static std::string currentTimestamp();

  mutable std::mutex mutex_;
  std::map<std::string, OpenFile> files_;
  std::map<std::string, LogLevel> category_levels_;

  LogLevel min_level_ = LogLevel::INFO;
  std::string base_path_ = "./logs/";
  bool console_enabled_ = true;
  bool file_enabled_ = true;
  bool frames_enabled_ = false;
  uintmax_t max_file_bytes_ = 100ull * 1024 * 1024;
  int max_backups_ = 30;

  LogStatistics statistics_;
};

} // namespace LogLib

#endif // BACLINK_LOGGER_ENGINE_HPP
