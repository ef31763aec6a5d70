/**
 * @file DeviceRegistry.h
 * @brief 장치 레지스트리 - 메모리 + JSON 파일 영속화
 * @author BacLink Development Team
 *
 * 장치/객체/속성 상태의 유일한 작성자. 모든 변경은 단일 메서드 호출 안에서
 * 뮤텍스로 보호되며, 조회는 값 복사본(snapshot)을 반환한다.
 */

#ifndef BACLINK_REGISTRY_DEVICE_REGISTRY_H
#define BACLINK_REGISTRY_DEVICE_REGISTRY_H

#include "Models/DeviceModel.h"

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace BacLink {
namespace Registry {

class DeviceRegistry {
public:
  explicit DeviceRegistry(std::string persistence_file = "devices.json");

  DeviceRegistry(const DeviceRegistry &) = delete;
  DeviceRegistry &operator=(const DeviceRegistry &) = delete;

  // ==========================================================================
  // 장치 단위 조작
  // ==========================================================================

  /**
   * @brief 장치 추가 또는 병합
   * @details 기존 id 가 있으면 주소/능력 필드와 비어있지 않은 식별 문자열만
   *          덮어쓰고, enabled / discovered_at / 기존 객체 맵은 유지한다.
   *          새 장치에만 있는 객체는 추가된다.
   * @return 병합 후 장치 스냅샷
   */
  Models::Device AddOrMerge(const Models::Device &device);

  std::optional<Models::Device> Get(uint32_t device_id) const;
  std::vector<Models::Device> All() const;
  std::vector<Models::Device> Enabled() const;
  bool Remove(uint32_t device_id);
  bool SetEnabled(uint32_t device_id, bool enabled);
  bool TouchLastSeen(uint32_t device_id);
  size_t Size() const;

  // ==========================================================================
  // 객체 / 속성 단위 조작
  // ==========================================================================

  /**
   * @brief 객체 추가 (이미 있으면 이름/설명만 갱신, 속성은 보존)
   */
  bool AddObject(uint32_t device_id, const Models::BacnetObject &object);

  /**
   * @brief 읽기 성공 값 저장 (timestamp, last_poll 갱신)
   * @details unit 이 nullopt 이면 기존에 학습된 unit 을 유지한다.
   */
  bool StoreProperty(uint32_t device_id, const Models::ObjectId &object,
                     const std::string &property_id,
                     const Models::PropertyValue &value,
                     const std::optional<std::string> &unit = std::nullopt);

  bool MarkUnsupported(uint32_t device_id, const Models::ObjectId &object,
                       const std::string &property_id);
  bool IsUnsupported(uint32_t device_id, const Models::ObjectId &object,
                     const std::string &property_id) const;

  // ==========================================================================
  // 영속화
  // ==========================================================================

  /**
   * @brief 장치 id 문자열을 키로 하는 JSON 문서로 저장 (임시 파일 후 rename)
   */
  bool Persist() const;

  /**
   * @brief 파일에서 복원
   * @details 파일이 없으면 빈 레지스트리. 디코딩 오류는 로그 후 빈 레지스트리.
   * @return 복원된 장치 수
   */
  size_t Load();

  const std::string &GetPersistenceFile() const { return persistence_file_; }

private:
  Models::BacnetObject *FindObjectLocked(uint32_t device_id,
                                         const Models::ObjectId &object);

  mutable std::mutex mutex_;
  mutable std::mutex persist_mutex_;
  std::map<uint32_t, Models::Device> devices_;
  std::string persistence_file_;
};

} // namespace Registry
} // namespace BacLink

#endif // BACLINK_REGISTRY_DEVICE_REGISTRY_H
