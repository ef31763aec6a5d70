/**
 * @file RelayAddress.h
 * @brief BBMD(중계기) 주소
 * @author BacLink Development Team
 */

#ifndef BACLINK_TRANSPORT_RELAY_ADDRESS_H
#define BACLINK_TRANSPORT_RELAY_ADDRESS_H

#include <netinet/in.h>

#include <cstdint>
#include <optional>
#include <string>

namespace BacLink {
namespace Transport {

struct RelayAddress {
  std::string host;
  uint16_t port = 47808;

  std::string ToString() const { return host + ":" + std::to_string(port); }
};

/**
 * @brief 호스트 이름 또는 점 표기 주소를 IPv4 소켓 주소로 변환
 * @return 해석 실패 시 std::nullopt
 */
std::optional<sockaddr_in> ResolveIPv4(const RelayAddress &relay);

/**
 * @brief "a.b.c.d:port" 파싱 (포트 생략 시 47808)
 */
std::optional<RelayAddress> ParseHostPort(const std::string &text);

} // namespace Transport
} // namespace BacLink

#endif // BACLINK_TRANSPORT_RELAY_ADDRESS_H
