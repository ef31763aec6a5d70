/**
 * @file JsonFile.cpp
 * @author BacLink Development Team
 */

#include "Registry/JsonFile.h"

#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

namespace BacLink {
namespace Registry {

JsonReadStatus ReadJsonFile(const std::string &path, nlohmann::json &out,
                            std::string &error) {
  std::error_code ec;
  if (!fs::exists(path, ec)) {
    return JsonReadStatus::NOT_FOUND;
  }

  std::ifstream file(path);
  if (!file.is_open()) {
    error = "cannot open " + path;
    return JsonReadStatus::DECODE_ERROR;
  }

  try {
    out = nlohmann::json::parse(file);
  } catch (const nlohmann::json::exception &e) {
    error = e.what();
    return JsonReadStatus::DECODE_ERROR;
  }
  return JsonReadStatus::OK;
}

bool WriteJsonFile(const std::string &path, const nlohmann::json &document,
                   std::string &error) {
  std::error_code ec;
  fs::path target(path);
  if (target.has_parent_path()) {
    fs::create_directories(target.parent_path(), ec);
    if (ec) {
      error = "cannot create directory " + target.parent_path().string() +
              ": " + ec.message();
      return false;
    }
  }

  const std::string tmp_path = path + ".tmp";
  {
    std::ofstream file(tmp_path, std::ios::trunc);
    if (!file.is_open()) {
      error = "cannot open " + tmp_path;
      return false;
    }
    file << document.dump(2);
    if (!file.good()) {
      error = "write failed: " + tmp_path;
      return false;
    }
  }

  fs::rename(tmp_path, target, ec);
  if (ec) {
    error = "rename failed: " + ec.message();
    fs::remove(tmp_path, ec);
    return false;
  }
  return true;
}

} // namespace Registry
} // namespace BacLink
