/**
 * @file ConfigManager.cpp
 * @brief 설정 디렉터리 탐색, .env 파싱, 타입 변환
 * @author BacLink Development Team
 */

#include "Utils/ConfigManager.h"
#include "Logging/LogManager.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <limits.h>
#include <sstream>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {

constexpr const char *kCategory = "config";
constexpr int kMaxExpansions = 64;

std::string Trim(const std::string &text) {
  const auto first = text.find_first_not_of(" \t\r\n");
  if (first == std::string::npos) {
    return "";
  }
  const auto last = text.find_last_not_of(" \t\r\n");
  return text.substr(first, last - first + 1);
}

std::vector<std::string> SplitCommaList(const std::string &text) {
  std::vector<std::string> items;
  std::istringstream in(text);
  std::string item;
  while (std::getline(in, item, ',')) {
    item = Trim(item);
    if (!item.empty()) {
      items.push_back(item);
    }
  }
  return items;
}

} // namespace

// =============================================================================
// 초기화 / 재로딩
// =============================================================================

void ConfigManager::ensureInitialized() {
  if (initialized_.load(std::memory_order_acquire)) {
    return;
  }

  // getInstance() 는 로드 중 같은 스레드에서 다시 불릴 수 있다
  static thread_local bool loading = false;
  if (loading) {
    return;
  }

  Notes notes;
  {
    std::lock_guard<std::recursive_mutex> lock(init_mutex_);
    if (initialized_.load(std::memory_order_relaxed)) {
      return;
    }
    loading = true;
    loadDirectory(notes);
    loading = false;
    initialized_.store(true, std::memory_order_release);
  }
  flush(notes);
}

void ConfigManager::flush(const Notes &notes) {
  auto &logger = LogManager::getInstance();
  for (const auto &note : notes) {
    logger.log(kCategory, note.first, note.second);
  }
}

void ConfigManager::loadDirectory(Notes &notes) {
  std::vector<std::string> trace;
  const std::string dir = locateConfigDirectory(trace);
  {
    std::lock_guard<std::mutex> guard(mutex_);
    config_dir_ = dir;
  }

  for (const auto &step : trace) {
    notes.emplace_back(LogLevel::DEBUG, "config search: " + step);
  }
  if (dir.empty()) {
    notes.emplace_back(LogLevel::INFO,
                       "No config directory found, using environment only");
    return;
  }

  const fs::path main_file = fs::path(dir) / ".env";
  std::error_code ec;
  if (fs::exists(main_file, ec)) {
    loadFile(main_file.string(), notes);
  } else {
    notes.emplace_back(LogLevel::WARN,
                       "Main config file missing: " + main_file.string());
  }

  for (const auto &name : SplitCommaList(get("CONFIG_FILES"))) {
    const fs::path extra = fs::path(dir) / name;
    if (fs::exists(extra, ec)) {
      loadFile(extra.string(), notes);
    } else {
      notes.emplace_back(LogLevel::INFO, "Extra config file missing: " + name);
    }
  }

  // ${NAME} 치환은 모든 파일을 읽은 뒤 한 번에
  auto expanded = listAll();
  for (auto &entry : expanded) {
    entry.second = expandVariables(entry.second);
  }
  std::lock_guard<std::mutex> guard(mutex_);
  values_ = std::move(expanded);
}

// =============================================================================
// 경로 탐색
// =============================================================================

std::string ConfigManager::locateConfigDirectory(std::vector<std::string> &trace) {
  std::error_code ec;
  if (const char *env = std::getenv("BACLINK_CONFIG_DIR")) {
    if (fs::is_directory(env, ec)) {
      trace.push_back(std::string("BACLINK_CONFIG_DIR=") + env);
      return env;
    }
    trace.push_back(std::string("BACLINK_CONFIG_DIR is not a directory: ") + env);
  }

  std::vector<fs::path> candidates;
  const std::string exe_dir = executableDirectory();
  if (!exe_dir.empty()) {
    candidates.push_back(fs::path(exe_dir) / "config");
    candidates.push_back(fs::path(exe_dir) / ".." / "config");
  }
  candidates.emplace_back("./config");
  candidates.emplace_back("../config");

  for (const auto &candidate : candidates) {
    if (!fs::is_directory(candidate, ec)) {
      trace.push_back("not found: " + candidate.string());
      continue;
    }
    const fs::path resolved = fs::weakly_canonical(candidate, ec);
    const std::string result = ec ? candidate.string() : resolved.string();
    trace.push_back("using " + result);
    return result;
  }
  return "";
}

std::string ConfigManager::executableDirectory() {
  char buffer[PATH_MAX];
  const ssize_t len = readlink("/proc/self/exe", buffer, sizeof(buffer) - 1);
  if (len <= 0) {
    return "";
  }
  buffer[len] = '\0';
  return fs::path(buffer).parent_path().string();
}

std::string ConfigManager::getConfigDirectory() const {
  std::lock_guard<std::mutex> guard(mutex_);
  return config_dir_;
}

std::vector<std::string> ConfigManager::getLoadedFiles() const {
  std::lock_guard<std::mutex> guard(mutex_);
  return loaded_files_;
}

// =============================================================================
// 파일 파싱
// =============================================================================

std::optional<std::pair<std::string, std::string>>
ConfigManager::parseLine(const std::string &line) {
  const std::string text = Trim(line);
  if (text.empty() || text.front() == '#') {
    return std::nullopt;
  }
  const auto eq = text.find('=');
  if (eq == std::string::npos) {
    return std::nullopt;
  }

  std::string key = Trim(text.substr(0, eq));
  if (key.rfind("export ", 0) == 0) {
    key = Trim(key.substr(7));
  }
  if (key.empty()) {
    return std::nullopt;
  }

  std::string value = Trim(text.substr(eq + 1));
  if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') &&
      value.back() == value.front()) {
    value = value.substr(1, value.size() - 2);
  }
  return std::make_pair(key, value);
}

bool ConfigManager::load(const std::string &filepath) {
  Notes notes;
  const bool loaded = loadFile(filepath, notes);
  flush(notes);
  return loaded;
}

bool ConfigManager::loadFile(const std::string &filepath, Notes &notes) {
  std::ifstream in(filepath);
  if (!in.is_open()) {
    notes.emplace_back(LogLevel::LOG_ERROR, "Cannot open config file " + filepath);
    return false;
  }

  std::vector<std::pair<std::string, std::string>> entries;
  std::string line;
  while (std::getline(in, line)) {
    if (auto entry = parseLine(line)) {
      entries.push_back(std::move(*entry));
    }
  }

  const size_t count = entries.size();
  {
    std::lock_guard<std::mutex> guard(mutex_);
    for (auto &entry : entries) {
      values_[entry.first] = std::move(entry.second);
    }
    loaded_files_.push_back(filepath);
  }
  notes.emplace_back(LogLevel::INFO, "Loaded " +
                                         fs::path(filepath).filename().string() +
                                         " (" + std::to_string(count) +
                                         " entries)");
  return true;
}

// =============================================================================
// 조회
// =============================================================================

std::string ConfigManager::get(const std::string &key) const {
  {
    std::lock_guard<std::mutex> guard(mutex_);
    auto it = values_.find(key);
    if (it != values_.end() && !it->second.empty()) {
      return it->second;
    }
  }
  const char *env = std::getenv(key.c_str());
  return env != nullptr ? std::string(env) : std::string();
}

std::string ConfigManager::getOrDefault(const std::string &key,
                                        const std::string &defaultValue) const {
  std::string value = get(key);
  return value.empty() ? defaultValue : value;
}

int ConfigManager::getInt(const std::string &key, int defaultValue) const {
  const std::string value = Trim(get(key));
  if (value.empty()) {
    return defaultValue;
  }
  try {
    size_t used = 0;
    const int parsed = std::stoi(value, &used);
    return used == value.size() ? parsed : defaultValue;
  } catch (const std::exception &) {
    return defaultValue;
  }
}

bool ConfigManager::getBool(const std::string &key, bool defaultValue) const {
  std::string value = Trim(get(key));
  if (value.empty()) {
    return defaultValue;
  }
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return value == "true" || value == "yes" || value == "1" || value == "on";
}

double ConfigManager::getDouble(const std::string &key,
                                double defaultValue) const {
  const std::string value = Trim(get(key));
  if (value.empty()) {
    return defaultValue;
  }
  try {
    size_t used = 0;
    const double parsed = std::stod(value, &used);
    return used == value.size() ? parsed : defaultValue;
  } catch (const std::exception &) {
    return defaultValue;
  }
}

std::vector<std::string>
ConfigManager::getList(const std::string &key,
                       const std::vector<std::string> &defaultValue) const {
  auto items = SplitCommaList(get(key));
  return items.empty() ? defaultValue : items;
}

void ConfigManager::set(const std::string &key, const std::string &value) {
  std::lock_guard<std::mutex> guard(mutex_);
  values_[key] = value;
}

bool ConfigManager::hasKey(const std::string &key) const {
  std::lock_guard<std::mutex> guard(mutex_);
  return values_.count(key) > 0;
}

std::map<std::string, std::string> ConfigManager::listAll() const {
  std::lock_guard<std::mutex> guard(mutex_);
  return values_;
}

// =============================================================================
// ${NAME} 치환
// =============================================================================

std::string ConfigManager::expandVariables(const std::string &value) const {
  std::string result = value;
  size_t from = 0;
  // 자기 참조 반복 제한
  for (int round = 0; round < kMaxExpansions; ++round) {
    const auto open = result.find("${", from);
    if (open == std::string::npos) {
      break;
    }
    const auto close = result.find('}', open + 2);
    if (close == std::string::npos) {
      break;
    }
    const std::string name = result.substr(open + 2, close - open - 2);
    const std::string replacement =
        name == "CONFIG_DIR" ? getConfigDirectory() : get(name);
    result.replace(open, close - open + 1, replacement);
    from = open;
  }
  return result;
}
