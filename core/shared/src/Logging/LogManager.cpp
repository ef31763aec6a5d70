/**
 * @file LogManager.cpp
 * @brief ConfigManager 설정을 LoggerEngine 에 반영하고 호출을 위임
 * @author BacLink Development Team
 */

#include "Logging/LogManager.h"
#include "Utils/ConfigManager.h"

#include <algorithm>
#include <cctype>
#include <iostream>

namespace {

constexpr const char *kCategoryPrefix = "LOG_LEVEL_";

// 두 enum 은 값이 1:1 대응한다
LogLib::LogLevel ToEngine(LogLevel level) {
  return static_cast<LogLib::LogLevel>(static_cast<uint8_t>(level));
}

LogLib::LoggerEngine &Engine() { return LogLib::LoggerEngine::getInstance(); }

} // namespace

// =============================================================================
// 초기화
// =============================================================================

void LogManager::ensureInitialized() {
  if (initialized_.load(std::memory_order_acquire)) {
    return;
  }

  // ConfigManager 가 로드 중에 로그를 남기면 여기로 다시 들어온다.
  // 그 경우 엔진 기본값으로 기록하고 설정 반영은 바깥 호출이 마친다.
  static thread_local bool applying = false;
  if (applying) {
    return;
  }

  std::lock_guard<std::mutex> lock(init_mutex_);
  if (initialized_.load(std::memory_order_relaxed)) {
    return;
  }
  applying = true;
  applyConfig();
  applying = false;
  initialized_.store(true, std::memory_order_release);
}

void LogManager::applyConfig() {
  auto &engine = Engine();
  try {
    const auto &config = ConfigManager::getInstance();

    const std::string level = config.getOrDefault("LOG_LEVEL", "INFO");
    if (!LogLib::ParseLogLevel(level)) {
      std::cerr << "[LogManager] unknown LOG_LEVEL '" << level
                << "', using INFO" << std::endl;
    }
    engine.setLogLevel(LogLib::LoggerEngine::stringToLogLevel(level));
    engine.setConsoleOutput(config.getBool("LOG_TO_CONSOLE", true));
    engine.setFileOutput(config.getBool("LOG_TO_FILE", true));
    engine.setLogBasePath(config.getOrDefault("LOG_FILE_PATH", "./logs/"));
    engine.setMaxLogSizeMB(
        static_cast<size_t>(std::max(config.getInt("LOG_MAX_SIZE_MB", 100), 1)));
    engine.setMaxLogFiles(config.getInt("LOG_MAX_FILES", 30));
    engine.setFrameLogging(config.getBool("LOG_FRAMES", false));

    // LOG_LEVEL_BACNET=DEBUG -> "bacnet" 카테고리
    engine.clearCategoryLevels();
    const std::string prefix = kCategoryPrefix;
    for (const auto &[key, value] : config.listAll()) {
      if (value.empty() || key.size() <= prefix.size() ||
          key.compare(0, prefix.size(), prefix) != 0) {
        continue;
      }
      auto parsed = LogLib::ParseLogLevel(value);
      if (!parsed) {
        std::cerr << "[LogManager] ignoring " << key << "='" << value << "'"
                  << std::endl;
        continue;
      }
      std::string category = key.substr(prefix.size());
      std::transform(category.begin(), category.end(), category.begin(),
                     [](unsigned char c) { return std::tolower(c); });
      engine.setCategoryLevel(category, *parsed);
    }
  } catch (const std::exception &e) {
    std::cerr << "[LogManager] 로그 설정 적용 실패, 기본값 사용: " << e.what()
              << std::endl;
  }
}

void LogManager::reloadSettings() {
  std::lock_guard<std::mutex> lock(init_mutex_);
  applyConfig();
}

// =============================================================================
// 위임
// =============================================================================

void LogManager::log(const std::string &category, LogLevel level,
                     const std::string &message) {
  Engine().log(category, ToEngine(level), message);
}

bool LogManager::isEnabled(const std::string &category, LogLevel level) const {
  return Engine().isEnabled(category, ToEngine(level));
}

void LogManager::logFrame(const std::string &channel, const std::string &peer,
                          const std::vector<uint8_t> &frame,
                          const std::string &summary) {
  Engine().logFrame(channel, peer, frame, summary);
}

LogLevel LogManager::getLogLevel() const {
  return static_cast<LogLevel>(static_cast<uint8_t>(Engine().getLogLevel()));
}

void LogManager::setConsoleOutput(bool enabled) {
  Engine().setConsoleOutput(enabled);
}

void LogManager::setFileOutput(bool enabled) { Engine().setFileOutput(enabled); }

size_t LogManager::cleanupOldLogs(int retentionDays) {
  return Engine().cleanupOldLogs(retentionDays);
}

LogLib::LogStatistics LogManager::getStatistics() const {
  return Engine().getStatistics();
}

void LogManager::resetStatistics() { Engine().resetStatistics(); }

void LogManager::flushAll() { Engine().flushAll(); }
