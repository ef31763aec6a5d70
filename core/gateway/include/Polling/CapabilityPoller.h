/**
 * @file CapabilityPoller.h
 * @brief 미지원 속성을 학습하는 객체 속성 폴러
 * @author BacLink Development Team
 *
 * 객체가 지원하지 않는 것으로 확인된 속성(NO_VALUE, UNKNOWN_PROPERTY)은
 * 객체의 unsupported 집합에 기록되어 프로세스 수명 동안 다시 읽지 않는다.
 * 타임아웃 등 일시적 오류는 기록하지 않고 다음 주기에 재시도한다.
 */

#ifndef BACLINK_POLLING_CAPABILITY_POLLER_H
#define BACLINK_POLLING_CAPABILITY_POLLER_H

#include "Models/DeviceModel.h"
#include "Registry/DeviceRegistry.h"
#include "Transport/ITransport.h"

#include <chrono>
#include <functional>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace BacLink {
namespace Polling {

using SteadyClock = std::chrono::steady_clock;

struct PollerOptions {
  std::chrono::milliseconds read_timeout{5000};
  // present-value 와 함께 units 를 읽는 객체 타입
  std::set<std::string> unit_object_types;

  PollerOptions();
};

enum class PollOutcome { COMPLETED, DEADLINE_EXCEEDED, CANCELLED };

const char *PollOutcomeToString(PollOutcome outcome);

class CapabilityPoller {
public:
  using CancelPredicate = std::function<bool()>;

  static constexpr const char *kPresentValue = "present-value";
  static constexpr const char *kUnits = "units";

  CapabilityPoller(Transport::ITransport &transport,
                   Registry::DeviceRegistry &registry,
                   PollerOptions options = PollerOptions());

  CapabilityPoller(const CapabilityPoller &) = delete;
  CapabilityPoller &operator=(const CapabilityPoller &) = delete;

  /**
   * @brief 객체 하나의 속성들을 읽어 레지스트리에 저장
   * @param deadline 이 시각 이후에는 새 읽기를 시작하지 않는다
   * @param cancelled 읽기 전마다 확인하는 중단 조건 (생략 가능)
   * @return 이번에 읽은 property_id -> 값
   */
  std::map<std::string, Models::PropertyValue>
  PollObject(const Models::Device &device, const Models::BacnetObject &object,
             const std::vector<std::string> &property_ids,
             SteadyClock::time_point deadline = SteadyClock::time_point::max(),
             const CancelPredicate &cancelled = CancelPredicate());

  /**
   * @brief 장치의 모든 객체 폴링
   * @details present-value 를 요청하면 present-value 가 없는 객체 타입은 건너뛴다.
   *          한 객체의 실패는 나머지 객체에 영향을 주지 않는다.
   *          COMPLETED 인 경우에만 장치 last_seen 을 갱신한다.
   */
  PollOutcome PollDeviceObjects(
      const Models::Device &device, const std::vector<std::string> &property_ids,
      SteadyClock::time_point deadline = SteadyClock::time_point::max(),
      const CancelPredicate &cancelled = CancelPredicate());

  const PollerOptions &GetOptions() const { return options_; }

  /// present-value 를 가지는 객체 타입 (22 종)
  static const std::set<std::string> &PresentValueObjectTypes();

  /// 기본 units 허용 목록
  static const std::set<std::string> &DefaultUnitObjectTypes();

private:
  /// 남은 시간과 읽기 타임아웃 중 작은 값. 남은 시간이 없으면 0
  std::chrono::milliseconds ReadBudget(SteadyClock::time_point deadline) const;

  bool ShouldReadUnit(const Models::Device &device,
                      const Models::BacnetObject &object) const;
  std::optional<std::string> ReadUnit(const Models::Device &device,
                                      const Models::BacnetObject &object,
                                      SteadyClock::time_point deadline);

  /// NO_VALUE / UNKNOWN_PROPERTY 이면 unsupported 로 기록. 기록했으면 true
  bool LearnFromFailure(const Models::Device &device,
                        const Models::ObjectId &object,
                        const std::string &property_id,
                        const Transport::ReadResult &result);

  Transport::ITransport &transport_;
  Registry::DeviceRegistry &registry_;
  PollerOptions options_;
};

} // namespace Polling
} // namespace BacLink

#endif // BACLINK_POLLING_CAPABILITY_POLLER_H
