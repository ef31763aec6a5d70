/**
 * @file RegistrationStrategy.cpp
 * @author BacLink Development Team
 */

#include "Registration/RegistrationStrategy.h"
#include "Logging/LogManager.h"

#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

namespace BacLink {
namespace Registration {

namespace {
constexpr const char *kCategory = "registration";

constexpr uint8_t kBvllTypeBacnetIp = 0x81;
constexpr uint8_t kBvlcRegisterForeignDevice = 0x05;
} // namespace

std::vector<uint8_t> BuildRegisterForeignDeviceMessage(uint16_t ttl_seconds) {
  return {kBvllTypeBacnetIp,
          kBvlcRegisterForeignDevice,
          0x00,
          0x06,
          static_cast<uint8_t>((ttl_seconds >> 8) & 0xFF),
          static_cast<uint8_t>(ttl_seconds & 0xFF)};
}

bool HighLevelRegistrationStrategy::Register(const Transport::RelayAddress &relay,
                                             uint16_t ttl_seconds) {
  return transport_.RegisterForeignDevice(relay, ttl_seconds);
}

bool BvllRegistrationStrategy::Register(const Transport::RelayAddress &relay,
                                        uint16_t ttl_seconds) {
  return transport_.SendBvll(relay,
                             BuildRegisterForeignDeviceMessage(ttl_seconds));
}

bool RawDatagramRegistrationStrategy::Register(
    const Transport::RelayAddress &relay, uint16_t ttl_seconds) {
  auto &logger = LogManager::getInstance();

  auto target = Transport::ResolveIPv4(relay);
  if (!target) {
    logger.log(kCategory, LogLevel::WARN, "Cannot resolve relay address {}",
               relay.ToString());
    return false;
  }

  int sock = socket(AF_INET, SOCK_DGRAM, 0);
  if (sock < 0) {
    logger.log(kCategory, LogLevel::WARN, "UDP socket creation failed: {}",
               std::strerror(errno));
    return false;
  }

  const auto message = BuildRegisterForeignDeviceMessage(ttl_seconds);
  ssize_t sent = sendto(sock, message.data(), message.size(), 0,
                        reinterpret_cast<const sockaddr *>(&*target),
                        sizeof(sockaddr_in));
  const int send_errno = errno;
  close(sock);

  if (sent != static_cast<ssize_t>(message.size())) {
    logger.log(kCategory, LogLevel::WARN, "sendto {} failed: {}",
               relay.ToString(), std::strerror(send_errno));
    return false;
  }
  logger.logFrame("bvll", relay.ToString(), message,
                  "Register-Foreign-Device ttl=" + std::to_string(ttl_seconds));
  return true;
}

} // namespace Registration
} // namespace BacLink
