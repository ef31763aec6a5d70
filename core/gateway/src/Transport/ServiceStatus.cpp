/**
 * @file ServiceStatus.cpp
 * @author BacLink Development Team
 */

#include "Transport/ITransport.h"

namespace BacLink {
namespace Transport {

const char *ServiceStatusToString(ServiceStatus status) {
  switch (status) {
  case ServiceStatus::SUCCESS:
    return "SUCCESS";
  case ServiceStatus::NO_VALUE:
    return "NO_VALUE";
  case ServiceStatus::UNKNOWN_PROPERTY:
    return "UNKNOWN_PROPERTY";
  case ServiceStatus::UNKNOWN_OBJECT:
    return "UNKNOWN_OBJECT";
  case ServiceStatus::INVALID_ARRAY_INDEX:
    return "INVALID_ARRAY_INDEX";
  case ServiceStatus::BUFFER_OVERFLOW:
    return "BUFFER_OVERFLOW";
  case ServiceStatus::TIMEOUT:
    return "TIMEOUT";
  case ServiceStatus::NOT_CONNECTED:
    return "NOT_CONNECTED";
  case ServiceStatus::COMMUNICATION_ERROR:
    return "COMMUNICATION_ERROR";
  }
  return "UNKNOWN";
}

} // namespace Transport
} // namespace BacLink
