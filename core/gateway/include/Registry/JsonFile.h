/**
 * @file JsonFile.h
 * @brief 레지스트리 저장소 공용 JSON 파일 입출력
 * @author BacLink Development Team
 */

#ifndef BACLINK_REGISTRY_JSON_FILE_H
#define BACLINK_REGISTRY_JSON_FILE_H

#include <nlohmann/json.hpp>
#include <string>

namespace BacLink {
namespace Registry {

enum class JsonReadStatus { OK, NOT_FOUND, DECODE_ERROR };

/**
 * @brief 파일 전체를 JSON 으로 읽기
 * @param error DECODE_ERROR 일 때 원인 메시지
 */
JsonReadStatus ReadJsonFile(const std::string &path, nlohmann::json &out,
                            std::string &error);

/**
 * @brief "<path>.tmp" 에 기록한 뒤 rename 으로 교체
 * @details 상위 디렉토리가 없으면 생성한다.
 */
bool WriteJsonFile(const std::string &path, const nlohmann::json &document,
                   std::string &error);

} // namespace Registry
} // namespace BacLink

#endif // BACLINK_REGISTRY_JSON_FILE_H
