/**
 * @file RegistrationManager.h
 * @brief BBMD 외부 장치 등록 유지 (갱신 및 전략 폴백)
 * @author BacLink Development Team
 *
 * 상태: UNREGISTERED -> REGISTERING -> REGISTERED -> (갱신) -> UNREGISTERING
 * 갱신 주기는 max(ttl / 2, 5) 초. 갱신 실패는 로그만 남기고 다음 주기에 재시도한다.
 */

#ifndef BACLINK_REGISTRATION_REGISTRATION_MANAGER_H
#define BACLINK_REGISTRATION_REGISTRATION_MANAGER_H

#include "Registration/RegistrationStrategy.h"
#include "Transport/RelayAddress.h"

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace BacLink {
namespace Registration {

enum class RegistrationState { UNREGISTERED, REGISTERING, REGISTERED, UNREGISTERING };

const char *RegistrationStateToString(RegistrationState state);

struct RegistrationOptions {
  bool enabled = false;
  Transport::RelayAddress relay;
  uint16_t ttl_seconds = 30;
};

class RegistrationManager {
public:
  static constexpr std::chrono::seconds kMinimumRenewal{5};

  /// minimum_renewal 은 갱신 주기 하한 (기본 5초)
  RegistrationManager(RegistrationOptions options, StrategyList strategies,
                      std::chrono::milliseconds minimum_renewal = kMinimumRenewal);
  ~RegistrationManager();

  RegistrationManager(const RegistrationManager &) = delete;
  RegistrationManager &operator=(const RegistrationManager &) = delete;

  /// HighLevel -> Bvll -> RawDatagram 순서의 기본 전략 목록
  static StrategyList DefaultStrategies(Transport::ITransport &transport);

  static std::chrono::milliseconds
  RenewalInterval(uint16_t ttl_seconds,
                  std::chrono::milliseconds minimum = kMinimumRenewal);

  /**
   * @brief 최초 등록 시도. 성공하면 갱신 스레드를 시작한다
   * @return 비활성화 상태이거나 모든 전략이 실패하면 false
   */
  bool Start();

  /// 갱신 중단 후 등록되어 있었다면 TTL 0 으로 해제 시도 (실패는 무시)
  void Stop();

  /// 즉시 등록 재시도 (제어 API 용). 성공 시 갱신 스레드가 없으면 시작
  bool TriggerRegistration();

  RegistrationState GetState() const { return state_.load(); }
  bool IsEnabled() const { return options_.enabled; }
  nlohmann::json GetStatusJson() const;

private:
  /// 전략을 순서대로 시도. 성공한 전략 이름을 반환
  std::optional<std::string> Attempt(uint16_t ttl_seconds);
  void StartRenewalLocked();
  void RenewalLoop();

  RegistrationOptions options_;
  StrategyList strategies_;
  const std::chrono::milliseconds minimum_renewal_;

  std::mutex attempt_mutex_;
  std::mutex lifecycle_mutex_;
  std::atomic<RegistrationState> state_{RegistrationState::UNREGISTERED};

  std::thread renewal_thread_;
  std::atomic<bool> stop_requested_{false};
  std::mutex wait_mutex_;
  std::condition_variable wait_cv_;

  mutable std::mutex status_mutex_;
  std::string last_strategy_;
  std::string last_success_;
  uint64_t renewals_ = 0;
  uint64_t failures_ = 0;
};

} // namespace Registration
} // namespace BacLink

#endif // BACLINK_REGISTRATION_REGISTRATION_MANAGER_H
