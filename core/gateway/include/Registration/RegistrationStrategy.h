/**
 * @file RegistrationStrategy.h
 * @brief BBMD 외부 장치(Foreign Device) 등록 전략
 * @author BacLink Development Team
 *
 * 등록 관리자는 전략 목록을 순서대로 시도하고 처음 성공한 전략에서 멈춘다.
 *  1. HighLevel   - ITransport::RegisterForeignDevice
 *  2. Bvll        - Register-Foreign-Device BVLL 메시지를 ITransport 데이터링크로 송신
 *  3. RawDatagram - 같은 메시지를 별도 UDP 소켓으로 직접 송신
 */

#ifndef BACLINK_REGISTRATION_REGISTRATION_STRATEGY_H
#define BACLINK_REGISTRATION_REGISTRATION_STRATEGY_H

#include "Transport/ITransport.h"
#include "Transport/RelayAddress.h"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace BacLink {
namespace Registration {

class IRegistrationStrategy {
public:
  virtual ~IRegistrationStrategy() = default;

  virtual std::string Name() const = 0;

  /// ttl 0 은 등록 해제 요청
  virtual bool Register(const Transport::RelayAddress &relay,
                        uint16_t ttl_seconds) = 0;
};

using StrategyList = std::vector<std::unique_ptr<IRegistrationStrategy>>;

/**
 * @brief BVLL Register-Foreign-Device (type 0x81, function 0x05, length 6, TTL)
 */
std::vector<uint8_t> BuildRegisterForeignDeviceMessage(uint16_t ttl_seconds);

class HighLevelRegistrationStrategy : public IRegistrationStrategy {
public:
  explicit HighLevelRegistrationStrategy(Transport::ITransport &transport)
      : transport_(transport) {}

  std::string Name() const override { return "high-level"; }
  bool Register(const Transport::RelayAddress &relay,
                uint16_t ttl_seconds) override;

private:
  Transport::ITransport &transport_;
};

class BvllRegistrationStrategy : public IRegistrationStrategy {
public:
  explicit BvllRegistrationStrategy(Transport::ITransport &transport)
      : transport_(transport) {}

  std::string Name() const override { return "bvll"; }
  bool Register(const Transport::RelayAddress &relay,
                uint16_t ttl_seconds) override;

private:
  Transport::ITransport &transport_;
};

class RawDatagramRegistrationStrategy : public IRegistrationStrategy {
public:
  std::string Name() const override { return "raw-datagram"; }
  bool Register(const Transport::RelayAddress &relay,
                uint16_t ttl_seconds) override;
};

} // namespace Registration
} // namespace BacLink

#endif // BACLINK_REGISTRATION_REGISTRATION_STRATEGY_H
