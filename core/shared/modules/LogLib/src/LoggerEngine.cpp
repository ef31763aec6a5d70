/**
 * @file LoggerEngine.cpp
 * @brief LogLib 로깅 엔진 구현
 */

#include "LoggerEngine.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace fs = std::filesystem;

namespace LogLib {

// =============================================================================
// 레벨 변환
// =============================================================================

const char *LogLevelToString(LogLevel level) {
  switch (level) {
  case LogLevel::TRACE:
    return "TRACE";
  case LogLevel::DEBUG:
    return "DEBUG";
  case LogLevel::INFO:
    return "INFO";
  case LogLevel::WARN:
    return "WARN";
  case LogLevel::LOG_ERROR:
    return "ERROR";
  case LogLevel::LOG_FATAL:
    return "FATAL";
  case LogLevel::OFF:
    return "OFF";
  }
  return "UNKNOWN";
}

std::optional<LogLevel> ParseLogLevel(const std::string &text) {
  std::string s;
  for (char c : text) {
    if (!std::isspace(static_cast<unsigned char>(c))) {
      s.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
    }
  }

  if (s == "TRACE") {
    return LogLevel::TRACE;
  }
  if (s == "DEBUG") {
    return LogLevel::DEBUG;
  }
  if (s == "INFO") {
    return LogLevel::INFO;
  }
  if (s == "WARN" || s == "WARNING") {
    return LogLevel::WARN;
  }
  if (s == "ERROR" || s == "ERR" || s == "LOG_ERROR") {
    return LogLevel::LOG_ERROR;
  }
  if (s == "FATAL" || s == "CRITICAL" || s == "LOG_FATAL") {
    return LogLevel::LOG_FATAL;
  }
  if (s == "OFF" || s == "NONE") {
    return LogLevel::OFF;
  }
  return std::nullopt;
}

LogLevel LoggerEngine::stringToLogLevel(const std::string &level,
                                        LogLevel fallback) {
  return ParseLogLevel(level).value_or(fallback);
}

std::string LoggerEngine::hexDump(const std::vector<uint8_t> &bytes) {
  std::ostringstream oss;
  oss << std::hex << std::setfill('0');
  for (size_t i = 0; i < bytes.size(); ++i) {
    if (i > 0) {
      oss << ' ';
    }
    oss << std::setw(2) << static_cast<unsigned>(bytes[i]);
  }
  return oss.str();
}

// =============================================================================
// 설정
// =============================================================================

LoggerEngine &LoggerEngine::getInstance() {
  static LoggerEngine instance;
  return instance;
}

LoggerEngine::~LoggerEngine() {
  std::lock_guard<std::mutex> lock(mutex_);
  closeAllLocked();
}

void LoggerEngine::setLogLevel(LogLevel level) {
  std::lock_guard<std::mutex> lock(mutex_);
  min_level_ = level;
}

LogLevel LoggerEngine::getLogLevel() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return min_level_;
}

void LoggerEngine::setCategoryLevel(const std::string &category,
                                    LogLevel level) {
  std::lock_guard<std::mutex> lock(mutex_);
  category_levels_[category] = level;
}

void LoggerEngine::clearCategoryLevels() {
  std::lock_guard<std::mutex> lock(mutex_);
  category_levels_.clear();
}

LogLevel LoggerEngine::getEffectiveLevel(const std::string &category) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = category_levels_.find(category);
  return it != category_levels_.end() ? it->second : min_level_;
}

bool LoggerEngine::isEnabled(const std::string &category, LogLevel level) const {
  const LogLevel threshold = getEffectiveLevel(category);
  return level != LogLevel::OFF && threshold != LogLevel::OFF &&
         static_cast<int>(level) >= static_cast<int>(threshold);
}

void LoggerEngine::setLogBasePath(const std::string &path) {
  std::lock_guard<std::mutex> lock(mutex_);
  closeAllLocked();
  base_path_ = path.empty() ? "./" : path;
}

void LoggerEngine::setConsoleOutput(bool enabled) {
  std::lock_guard<std::mutex> lock(mutex_);
  console_enabled_ = enabled;
}

void LoggerEngine::setFileOutput(bool enabled) {
  std::lock_guard<std::mutex> lock(mutex_);
  file_enabled_ = enabled;
  if (!enabled) {
    closeAllLocked();
  }
}

void LoggerEngine::setFrameLogging(bool enabled) {
  std::lock_guard<std::mutex> lock(mutex_);
  frames_enabled_ = enabled;
}

void LoggerEngine::setMaxLogSizeMB(size_t size_mb) {
  std::lock_guard<std::mutex> lock(mutex_);
  max_file_bytes_ = static_cast<uintmax_t>(std::max<size_t>(size_mb, 1)) * 1024 * 1024;
}

void LoggerEngine::setMaxLogFiles(int count) {
  std::lock_guard<std::mutex> lock(mutex_);
  max_backups_ = std::max(count, 0);
}

// =============================================================================
// 기록
// =============================================================================

void LoggerEngine::log(const std::string &category, LogLevel level,
                       const std::string &message) {
  if (!isEnabled(category, level)) {
    return;
  }

  std::ostringstream line;
  line << '[' << currentTimestamp() << "][" << LogLevelToString(level) << ']';
  if (!category.empty()) {
    line << '[' << category << ']';
  }
  line << ' ' << message;

  {
    std::lock_guard<std::mutex> lock(mutex_);
    ++statistics_.total_logs;
    const auto index = static_cast<size_t>(level);
    if (index < kLevelCount) {
      ++statistics_.per_level[index];
    }
    statistics_.last_log_time = std::chrono::system_clock::now();
  }

  std::string name = category.empty() ? "gateway" : category;
  std::replace(name.begin(), name.end(), '/', '_');
  emit("", name, line.str(),
       level >= LogLevel::WARN ? Console::ERR : Console::OUT);
}

void LoggerEngine::logFrame(const std::string &channel, const std::string &peer,
                            const std::vector<uint8_t> &frame,
                            const std::string &summary) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!frames_enabled_) {
      return;
    }
    ++statistics_.frames;
  }

  std::ostringstream line;
  line << '[' << currentTimestamp() << "][" << peer << "] " << summary << " ("
       << frame.size() << " bytes)\n    " << hexDump(frame);
  emit("frames", channel.empty() ? "frames" : channel, line.str(), Console::NONE);
}

void LoggerEngine::emit(const std::string &directory, const std::string &name,
                        const std::string &line, Console console) {
  std::lock_guard<std::mutex> lock(mutex_);

  if (console_enabled_ && console != Console::NONE) {
    (console == Console::ERR ? std::cerr : std::cout) << line << '\n';
  }
  if (!file_enabled_) {
    return;
  }

  const std::string date = currentDate();
  OpenFile &file = files_[directory + "/" + name];
  if (!file.stream.is_open() || file.date != date) {
    fs::path path = fs::path(base_path_);
    if (!directory.empty()) {
      path /= directory;
    }
    path /= date;
    path /= name + ".log";
    if (!openLocked(file, path.string())) {
      ++statistics_.write_failures;
      return;
    }
    file.date = date;
  }

  file.stream << line << '\n';
  file.stream.flush();
  if (!file.stream) {
    ++statistics_.write_failures;
    file.stream.close();
    return;
  }

  file.size += line.size() + 1;
  if (file.size >= max_file_bytes_) {
    rotateLocked(file);
  }
}

bool LoggerEngine::openLocked(OpenFile &file, const std::string &path) {
  if (file.stream.is_open()) {
    file.stream.close();
  }

  std::error_code ec;
  fs::create_directories(fs::path(path).parent_path(), ec);
  file.stream.clear();
  file.stream.open(path, std::ios::app);
  if (!file.stream.is_open()) {
    return false;
  }

  file.path = path;
  const auto existing = fs::file_size(path, ec);
  file.size = ec ? 0 : existing;
  return true;
}

// category.log -> category.1.log -> category.2.log ... (max_backups_ 초과분 삭제)
void LoggerEngine::rotateLocked(OpenFile &file) {
  file.stream.close();

  const fs::path current(file.path);
  auto backup = [&current](int index) {
    return current.parent_path() / (current.stem().string() + "." +
                                    std::to_string(index) +
                                    current.extension().string());
  };

  std::error_code ec;
  if (max_backups_ == 0) {
    fs::remove(current, ec);
  } else {
    fs::remove(backup(max_backups_), ec);
    for (int i = max_backups_ - 1; i >= 1; --i) {
      if (fs::exists(backup(i), ec)) {
        fs::rename(backup(i), backup(i + 1), ec);
      }
    }
    fs::rename(current, backup(1), ec);
  }
  if (ec && console_enabled_) {
    std::cerr << "[LoggerEngine] rotation of " << file.path
              << " failed: " << ec.message() << '\n';
  }

  if (!openLocked(file, current.string())) {
    ++statistics_.write_failures;
  }
}

void LoggerEngine::closeAllLocked() {
  for (auto &[key, file] : files_) {
    if (file.stream.is_open()) {
      file.stream.flush();
      file.stream.close();
    }
  }
  files_.clear();
}

void LoggerEngine::flushAll() {
  std::lock_guard<std::mutex> lock(mutex_);
  closeAllLocked();
}

// =============================================================================
// 보관 기간 정리
// =============================================================================

size_t LoggerEngine::cleanupOldLogs(int retentionDays) {
  if (retentionDays <= 0) {
    return 0;
  }

  std::lock_guard<std::mutex> lock(mutex_);
  const fs::path base(base_path_);
  std::error_code ec;
  if (!fs::is_directory(base, ec)) {
    return 0;
  }

  const auto cutoff = fs::file_time_type::clock::now() -
                      std::chrono::hours(24 * retentionDays);
  std::vector<fs::path> expired;
  for (fs::recursive_directory_iterator it(
           base, fs::directory_options::skip_permission_denied, ec),
       end;
       !ec && it != end; it.increment(ec)) {
    if (it->is_regular_file(ec) && it->path().extension() == ".log" &&
        it->last_write_time(ec) < cutoff) {
      expired.push_back(it->path());
    }
  }
  if (ec && console_enabled_) {
    std::cerr << "[LoggerEngine] log cleanup scan stopped: " << ec.message()
              << '\n';
  }

  size_t removed = 0;
  for (const auto &path : expired) {
    for (auto it = files_.begin(); it != files_.end(); ++it) {
      if (it->second.path == path.string()) {
        it->second.stream.close();
        files_.erase(it);
        break;
      }
    }
    std::error_code remove_ec;
    if (fs::remove(path, remove_ec)) {
      ++removed;
      // 비어 버린 날짜 디렉터리 정리
      if (fs::is_empty(path.parent_path(), remove_ec)) {
        fs::remove(path.parent_path(), remove_ec);
      }
    }
  }
  return removed;
}

LogStatistics LoggerEngine::getStatistics() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return statistics_;
}

void LoggerEngine::resetStatistics() {
  std::lock_guard<std::mutex> lock(mutex_);
  statistics_ = LogStatistics{};
}

// =============================================================================
// 시간
// =============================================================================

std::string LoggerEngine::currentDate() {
  const std::time_t now =
      std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
  std::tm local{};
  localtime_r(&now, &local);
  char buffer[16];
  std::strftime(buffer, sizeof(buffer), "%Y%m%d", &local);
  return buffer;
}

std::string LoggerEngine::currentTimestamp() {
  const auto now = std::chrono::system_clock::now();
  const std::time_t seconds = std::chrono::system_clock::to_time_t(now);
  const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                          now.time_since_epoch())
                          .count() %
                      1000;
  std::tm local{};
  localtime_r(&seconds, &local);
  char buffer[32];
  std::strftime(buffer, sizeof(buffer), "%Y-%m-%d %H:%M:%S", &local);
  char result[40];
  std::snprintf(result, sizeof(result), "%s.%03d", buffer,
                static_cast<int>(millis));
  return result;
}

} // namespace LogLib
