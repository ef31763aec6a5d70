/**
 * @file CapabilityPoller.cpp
 * @brief 속성 폴링 및 미지원 속성 학습 구현
 * @author BacLink Development Team
 */

#include "Polling/CapabilityPoller.h"
#include "Logging/LogManager.h"

#include <algorithm>

namespace BacLink {
namespace Polling {

using Models::BacnetObject;
using Models::Device;
using Models::ObjectId;
using Transport::ReadResult;
using Transport::ServiceStatus;

namespace {
constexpr const char *kCategory = "poller";
}

PollerOptions::PollerOptions()
    : unit_object_types(CapabilityPoller::DefaultUnitObjectTypes()) {}

const char *PollOutcomeToString(PollOutcome outcome) {
  switch (outcome) {
  case PollOutcome::COMPLETED:
    return "COMPLETED";
  case PollOutcome::DEADLINE_EXCEEDED:
    return "DEADLINE_EXCEEDED";
  case PollOutcome::CANCELLED:
    return "CANCELLED";
  }
  return "UNKNOWN";
}

const std::set<std::string> &CapabilityPoller::PresentValueObjectTypes() {
  static const std::set<std::string> types = {
      "analog-input",          "analog-output",
      "analog-value",          "binary-input",
      "binary-output",         "binary-value",
      "multi-state-input",     "multi-state-output",
      "multi-state-value",     "accumulator",
      "pulse-converter",       "loop",
      "integer-value",         "positive-integer-value",
      "large-analog-value",    "octetstring-value",
      "characterstring-value", "time-value",
      "datetime-value",        "datepattern-value",
      "timepattern-value",     "datetimepattern-value"};
  return types;
}

const std::set<std::string> &CapabilityPoller::DefaultUnitObjectTypes() {
  static const std::set<std::string> types = {
      "analog-input",    "analog-output", "analog-value",      "accumulator",
      "pulse-converter", "loop",          "large-analog-value"};
  return types;
}

CapabilityPoller::CapabilityPoller(Transport::ITransport &transport,
                                   Registry::DeviceRegistry &registry,
                                   PollerOptions options)
    : transport_(transport), registry_(registry), options_(std::move(options)) {}

std::chrono::milliseconds
CapabilityPoller::ReadBudget(SteadyClock::time_point deadline) const {
  auto now = SteadyClock::now();
  if (now >= deadline) {
    return std::chrono::milliseconds(0);
  }
  auto remaining =
      std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
  return std::min(remaining, options_.read_timeout);
}

// =============================================================================
// 객체 단위
// =============================================================================

std::map<std::string, Models::PropertyValue>
CapabilityPoller::PollObject(const Device &device, const BacnetObject &object,
                             const std::vector<std::string> &property_ids,
                             SteadyClock::time_point deadline,
                             const CancelPredicate &cancelled) {
  std::map<std::string, Models::PropertyValue> values;
  const ObjectId id = object.Id();

  for (const auto &property_id : property_ids) {
    if (cancelled && cancelled()) {
      break;
    }
    if (object.IsUnsupported(property_id) ||
        registry_.IsUnsupported(device.device_id, id, property_id)) {
      continue;
    }

    auto budget = ReadBudget(deadline);
    if (budget.count() <= 0) {
      break;
    }

    ReadResult result = transport_.ReadProperty(
        device.device_id, device.address, id, property_id, std::nullopt, budget);

    if (result.Ok() && Models::HasValue(result.value)) {
      std::optional<std::string> unit;
      if (property_id == kPresentValue && ShouldReadUnit(device, object)) {
        unit = ReadUnit(device, object, deadline);
      }
      registry_.StoreProperty(device.device_id, id, property_id, result.value,
                              unit);
      values[property_id] = std::move(result.value);
      continue;
    }

    LearnFromFailure(device, id, property_id, result);
  }

  return values;
}

bool CapabilityPoller::ShouldReadUnit(const Device &device,
                                      const BacnetObject &object) const {
  if (options_.unit_object_types.count(object.object_type) == 0) {
    return false;
  }
  if (object.IsUnsupported(kUnits) ||
      registry_.IsUnsupported(device.device_id, object.Id(), kUnits)) {
    return false;
  }
  // 한 번 학습한 unit 은 재사용
  const Models::Property *present = object.FindProperty(kPresentValue);
  return present == nullptr || !present->unit;
}

std::optional<std::string> CapabilityPoller::ReadUnit(const Device &device,
                                                      const BacnetObject &object,
                                                      SteadyClock::time_point deadline) {
  auto budget = ReadBudget(deadline);
  if (budget.count() <= 0) {
    return std::nullopt;
  }

  const ObjectId id = object.Id();
  ReadResult result = transport_.ReadProperty(device.device_id, device.address,
                                              id, kUnits, std::nullopt, budget);
  if (result.Ok() && Models::HasValue(result.value)) {
    return Models::PropertyValueToString(result.value);
  }

  LearnFromFailure(device, id, kUnits, result);
  return std::nullopt;
}

bool CapabilityPoller::LearnFromFailure(const Device &device, const ObjectId &object,
                                        const std::string &property_id,
                                        const ReadResult &result) {
  auto &logger = LogManager::getInstance();

  // 성공 응답에 값이 NULL 인 경우도 "값 없음"
  const bool no_value =
      result.status == ServiceStatus::NO_VALUE || result.Ok();
  if (no_value || result.status == ServiceStatus::UNKNOWN_PROPERTY) {
    registry_.MarkUnsupported(device.device_id, object, property_id);
    logger.log(kCategory, LogLevel::DEBUG,
               "Device {} {} does not support {}, skipping from now on",
               device.device_id, object.Key(), property_id);
    return true;
  }

  logger.log(kCategory, LogLevel::WARN, "Device {} {} read {} failed: {} {}",
             device.device_id, object.Key(), property_id,
             Transport::ServiceStatusToString(result.status), result.message);
  return false;
}

// =============================================================================
// 장치 단위
// =============================================================================

PollOutcome
CapabilityPoller::PollDeviceObjects(const Device &device,
                                    const std::vector<std::string> &property_ids,
                                    SteadyClock::time_point deadline,
                                    const CancelPredicate &cancelled) {
  auto &logger = LogManager::getInstance();

  if (device.objects.empty()) {
    logger.log(kCategory, LogLevel::WARN, "Device {} has no objects to poll",
               device.device_id);
    return PollOutcome::COMPLETED;
  }

  const bool prune = std::find(property_ids.begin(), property_ids.end(),
                               kPresentValue) != property_ids.end();
  const auto &pv_types = PresentValueObjectTypes();

  size_t polled = 0;
  for (const auto &[key, object] : device.objects) {
    if (cancelled && cancelled()) {
      return PollOutcome::CANCELLED;
    }
    if (SteadyClock::now() >= deadline) {
      return PollOutcome::DEADLINE_EXCEEDED;
    }
    if (prune && pv_types.count(object.object_type) == 0) {
      continue;
    }

    try {
      PollObject(device, object, property_ids, deadline, cancelled);
      ++polled;
    } catch (const std::exception &e) {
      logger.log(kCategory, LogLevel::LOG_ERROR,
                 "Error polling device {} object {}: {}", device.device_id, key,
                 e.what());
    }
  }

  if (cancelled && cancelled()) {
    return PollOutcome::CANCELLED;
  }
  if (SteadyClock::now() >= deadline) {
    return PollOutcome::DEADLINE_EXCEEDED;
  }

  registry_.TouchLastSeen(device.device_id);
  logger.log(kCategory, LogLevel::DEBUG, "Device {}: polled {} objects",
             device.device_id, polled);
  return PollOutcome::COMPLETED;
}

} // namespace Polling
} // namespace BacLink
