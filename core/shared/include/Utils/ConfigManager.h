#pragma once

/**
 * @file ConfigManager.h
 * @brief KEY=VALUE 설정 저장소 (싱글톤)
 * @author BacLink Development Team
 *
 * 설정 디렉터리 탐색 순서:
 *   1. 환경변수 BACLINK_CONFIG_DIR
 *   2. <실행파일>/config, <실행파일>/../config
 *   3. ./config, ../config
 *
 * 디렉터리의 .env 를 먼저 읽고, CONFIG_FILES 에 쉼표로 나열된 파일을
 * 이어서 읽는다. 같은 키는 나중 파일이 덮어쓴다. 값 안의 ${NAME} 은
 * 다른 설정값(또는 환경변수)으로 치환되며 ${CONFIG_DIR} 은 디렉터리 경로다.
 *
 * 조회는 메모리 값이 우선이고, 없거나 빈 값이면 프로세스 환경변수를 본다.
 */

#include "Common/Enums.h"

#include <atomic>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

class ConfigManager {
public:
  static ConfigManager &getInstance() {
    static ConfigManager instance;
    instance.ensureInitialized();
    return instance;
  }

  // ==========================================================================
  // 로드
  // ==========================================================================

  /// 파일 하나를 추가로 읽는다. 열 수 없으면 false
  bool load(const std::string &filepath);

  std::string getConfigDirectory() const;
  std::vector<std::string> getLoadedFiles() const;

  // ==========================================================================
  // 조회
  // ==========================================================================
  std::string get(const std::string &key) const;
  std::string getOrDefault(const std::string &key,
                           const std::string &defaultValue) const;
  int getInt(const std::string &key, int defaultValue = 0) const;
  bool getBool(const std::string &key, bool defaultValue = false) const;
  double getDouble(const std::string &key, double defaultValue = 0.0) const;

  /// 쉼표 구분 목록. 항목 공백 제거, 빈 항목 무시. 결과가 비면 기본값
  std::vector<std::string>
  getList(const std::string &key,
          const std::vector<std::string> &defaultValue = {}) const;

  void set(const std::string &key, const std::string &value);
  bool hasKey(const std::string &key) const;
  std::map<std::string, std::string> listAll() const;

  std::string expandVariables(const std::string &value) const;

  /// "KEY=VALUE" 한 줄 해석. 주석, 빈 줄, '=' 없는 줄은 nullopt
  static std::optional<std::pair<std::string, std::string>>
  parseLine(const std::string &line);

private:
  ConfigManager() = default;
  ~ConfigManager() = default;

  ConfigManager(const ConfigManager &) = delete;
  ConfigManager &operator=(const ConfigManager &) = delete;

  // 초기 로드 중에는 LogManager 를 부르지 않고 모아 두었다가 끝난 뒤 기록
  using Notes = std::vector<std::pair<BacLink::Enums::LogLevel, std::string>>;

  void ensureInitialized();
  void loadDirectory(Notes &notes);
  bool loadFile(const std::string &filepath, Notes &notes);
  static void flush(const Notes &notes);

  static std::string locateConfigDirectory(std::vector<std::string> &trace);
  static std::string executableDirectory();

  std::atomic<bool> initialized_{false};
  std::recursive_mutex init_mutex_;

  mutable std::mutex mutex_;
  std::map<std::string, std::string> values_;
  std::string config_dir_;
  std::vector<std::string> loaded_files_;
};
