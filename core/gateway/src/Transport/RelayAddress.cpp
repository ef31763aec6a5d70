/**
 * @file RelayAddress.cpp
 * @author BacLink Development Team
 */

#include "Transport/RelayAddress.h"

#include <arpa/inet.h>
#include <netdb.h>
#include <sys/socket.h>

#include <cstring>
#include <stdexcept>

namespace BacLink {
namespace Transport {

std::optional<sockaddr_in> ResolveIPv4(const RelayAddress &relay) {
  if (relay.host.empty()) {
    return std::nullopt;
  }

  sockaddr_in addr;
  std::memset(&addr, 0, sizeof(addr));
  addr.sin_family = AF_INET;
  addr.sin_port = htons(relay.port);

  if (inet_pton(AF_INET, relay.host.c_str(), &addr.sin_addr) == 1) {
    return addr;
  }

  addrinfo hints;
  std::memset(&hints, 0, sizeof(hints));
  hints.ai_family = AF_INET;
  hints.ai_socktype = SOCK_DGRAM;

  addrinfo *result = nullptr;
  if (getaddrinfo(relay.host.c_str(), nullptr, &hints, &result) != 0 ||
      result == nullptr) {
    return std::nullopt;
  }
  addr.sin_addr = reinterpret_cast<sockaddr_in *>(result->ai_addr)->sin_addr;
  freeaddrinfo(result);
  return addr;
}

std::optional<RelayAddress> ParseHostPort(const std::string &text) {
  if (text.empty()) {
    return std::nullopt;
  }

  RelayAddress relay;
  auto colon = text.rfind(':');
  if (colon == std::string::npos) {
    relay.host = text;
    return relay;
  }

  relay.host = text.substr(0, colon);
  try {
    unsigned long port = std::stoul(text.substr(colon + 1));
    if (port == 0 || port > 65535) {
      return std::nullopt;
    }
    relay.port = static_cast<uint16_t>(port);
  } catch (const std::exception &) {
    return std::nullopt;
  }
  if (relay.host.empty()) {
    return std::nullopt;
  }
  return relay;
}

} // namespace Transport
} // namespace BacLink
