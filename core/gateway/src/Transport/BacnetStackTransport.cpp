/**
 * @file BacnetStackTransport.cpp
 * @brief bacnet-stack 기반 BACnet/IP Transport 구현
 * @author BacLink Development Team
 */

#include "Transport/BacnetStackTransport.h"
#include "Logging/LogManager.h"

#include <arpa/inet.h>
#include <netinet/in.h>

#include <cstdio>
#include <cstring>
#include <sstream>
#include <stdexcept>

extern "C" {
#include <bacnet/apdu.h>
#include <bacnet/bacapp.h>
#include <bacnet/bacdef.h>
#include <bacnet/bacenum.h>
#include <bacnet/bacstr.h>
#include <bacnet/bactext.h>
#include <bacnet/basic/bbmd/h_bbmd.h>
#include <bacnet/basic/binding/address.h>
#include <bacnet/basic/npdu/h_npdu.h>
#include <bacnet/basic/object/device.h>
#include <bacnet/basic/service/h_apdu.h>
#include <bacnet/basic/service/h_noserv.h>
#include <bacnet/basic/service/h_rp.h>
#include <bacnet/basic/service/h_whois.h>
#include <bacnet/basic/service/s_rp.h>
#include <bacnet/basic/service/s_whois.h>
#include <bacnet/basic/service/s_wp.h>
#include <bacnet/basic/tsm/tsm.h>
#include <bacnet/datalink/bip.h>
#include <bacnet/datalink/bvlc.h>
#include <bacnet/iam.h>
#include <bacnet/rp.h>
}

#ifndef MAX_APDU
#define MAX_APDU 1476
#endif

namespace BacLink {
namespace Transport {

using Models::ObjectId;
using Models::PropertyValue;

namespace {

constexpr const char *kCategory = "bacnet";
constexpr unsigned kReceiveTimeoutMs = 100;
constexpr uint32_t kMaxInstance = 4194303;

// 현재 열려 있는 인스턴스 (스택 콜백 -> C++ 브리지)
BacnetStackTransport *g_active_transport = nullptr;
std::mutex g_active_mutex;

std::string FormatMacAddress(const BACNET_ADDRESS &src) {
  if (src.mac_len != 6) {
    std::ostringstream oss;
    for (uint8_t i = 0; i < src.mac_len; ++i) {
      if (i > 0) {
        oss << ':';
      }
      oss << static_cast<int>(src.mac[i]);
    }
    return oss.str();
  }
  char buffer[32];
  std::snprintf(buffer, sizeof(buffer), "%u.%u.%u.%u:%u", src.mac[0],
                src.mac[1], src.mac[2], src.mac[3],
                static_cast<unsigned>((src.mac[4] << 8) | src.mac[5]));
  return buffer;
}

bool ToIpAddress(const RelayAddress &relay, BACNET_IP_ADDRESS &out) {
  auto resolved = ResolveIPv4(relay);
  if (!resolved) {
    return false;
  }
  std::memcpy(out.address, &resolved->sin_addr.s_addr, 4);
  out.port = relay.port;
  return true;
}

ServiceStatus MapErrorCode(BACNET_ERROR_CODE code) {
  switch (code) {
  case ERROR_CODE_UNKNOWN_PROPERTY:
    return ServiceStatus::UNKNOWN_PROPERTY;
  case ERROR_CODE_UNKNOWN_OBJECT:
    return ServiceStatus::UNKNOWN_OBJECT;
  case ERROR_CODE_INVALID_ARRAY_INDEX:
  case ERROR_CODE_PROPERTY_IS_NOT_AN_ARRAY:
    return ServiceStatus::INVALID_ARRAY_INDEX;
  case ERROR_CODE_VALUE_NOT_INITIALIZED:
    return ServiceStatus::NO_VALUE;
  default:
    return ServiceStatus::COMMUNICATION_ERROR;
  }
}

std::string FormatDate(const BACNET_DATE &date) {
  char buffer[16];
  std::snprintf(buffer, sizeof(buffer), "%04u-%02u-%02u",
                static_cast<unsigned>(date.year),
                static_cast<unsigned>(date.month),
                static_cast<unsigned>(date.day));
  return buffer;
}

std::string FormatTime(const BACNET_TIME &time) {
  char buffer[16];
  std::snprintf(buffer, sizeof(buffer), "%02u:%02u:%02u.%02u",
                static_cast<unsigned>(time.hour),
                static_cast<unsigned>(time.min),
                static_cast<unsigned>(time.sec),
                static_cast<unsigned>(time.hundredths));
  return buffer;
}

/// 단일 애플리케이션 값을 PropertyValue 로 변환
PropertyValue ConvertValue(const BACNET_APPLICATION_DATA_VALUE &value,
                           const std::string &property) {
  switch (value.tag) {
  case BACNET_APPLICATION_TAG_NULL:
    return std::monostate{};
  case BACNET_APPLICATION_TAG_BOOLEAN:
    return value.type.Boolean;
  case BACNET_APPLICATION_TAG_UNSIGNED_INT:
    return static_cast<int64_t>(value.type.Unsigned_Int);
  case BACNET_APPLICATION_TAG_SIGNED_INT:
    return static_cast<int64_t>(value.type.Signed_Int);
  case BACNET_APPLICATION_TAG_REAL:
    return static_cast<double>(value.type.Real);
  case BACNET_APPLICATION_TAG_DOUBLE:
    return value.type.Double;
  case BACNET_APPLICATION_TAG_CHARACTER_STRING: {
    BACNET_CHARACTER_STRING text = value.type.Character_String;
    return std::string(characterstring_value(&text),
                       characterstring_length(&text));
  }
  case BACNET_APPLICATION_TAG_OCTET_STRING: {
    BACNET_OCTET_STRING octets = value.type.Octet_String;
    const uint8_t *bytes = octetstring_value(&octets);
    std::string hex;
    char buffer[3];
    for (size_t i = 0; i < octetstring_length(&octets); ++i) {
      std::snprintf(buffer, sizeof(buffer), "%02x", bytes[i]);
      hex += buffer;
    }
    return hex;
  }
  case BACNET_APPLICATION_TAG_BIT_STRING: {
    BACNET_BIT_STRING bits = value.type.Bit_String;
    Models::BitString result;
    const uint8_t used = bitstring_bits_used(&bits);
    for (uint8_t i = 0; i < used; ++i) {
      result.push_back(bitstring_bit(&bits, i));
    }
    return result;
  }
  case BACNET_APPLICATION_TAG_ENUMERATED:
    if (property == "units") {
      return std::string(bactext_engineering_unit_name(value.type.Enumerated));
    }
    if (property == "object-type") {
      return std::string(bactext_object_type_name(value.type.Enumerated));
    }
    return static_cast<int64_t>(value.type.Enumerated);
  case BACNET_APPLICATION_TAG_DATE:
    return FormatDate(value.type.Date);
  case BACNET_APPLICATION_TAG_TIME:
    return FormatTime(value.type.Time);
  case BACNET_APPLICATION_TAG_OBJECT_ID:
    return ObjectId(bactext_object_type_name(value.type.Object_Id.type),
                    value.type.Object_Id.instance);
  default:
    return std::monostate{};
  }
}

/// ReadProperty-Ack 의 값 목록을 PropertyValue 로 변환
ReadResult DecodeReadAck(uint8_t *application_data, int application_data_len,
                         const std::string &property, bool whole_array) {
  std::vector<BACNET_APPLICATION_DATA_VALUE> values;
  uint8_t *cursor = application_data;
  int remaining = application_data_len;
  while (remaining > 0) {
    BACNET_APPLICATION_DATA_VALUE value;
    std::memset(&value, 0, sizeof(value));
    int len = bacapp_decode_application_data(
        cursor, static_cast<unsigned>(remaining), &value);
    if (len <= 0) {
      return ReadResult::Failure(ServiceStatus::COMMUNICATION_ERROR,
                                 "malformed application data");
    }
    values.push_back(value);
    cursor += len;
    remaining -= len;
  }

  bool all_object_ids = true;
  for (const auto &value : values) {
    if (value.tag != BACNET_APPLICATION_TAG_OBJECT_ID) {
      all_object_ids = false;
      break;
    }
  }

  // object-list 는 길이와 무관하게 목록으로 반환
  if (whole_array && property == "object-list" && all_object_ids) {
    std::vector<ObjectId> ids;
    ids.reserve(values.size());
    for (const auto &value : values) {
      ids.push_back(std::get<ObjectId>(ConvertValue(value, property)));
    }
    return ReadResult::Success(std::move(ids));
  }

  if (values.empty()) {
    return ReadResult::Failure(ServiceStatus::NO_VALUE, "empty value");
  }
  if (values.size() == 1) {
    return ReadResult::Success(ConvertValue(values.front(), property));
  }
  if (all_object_ids) {
    std::vector<ObjectId> ids;
    for (const auto &value : values) {
      ids.push_back(std::get<ObjectId>(ConvertValue(value, property)));
    }
    return ReadResult::Success(std::move(ids));
  }

  std::string joined = "[";
  for (size_t i = 0; i < values.size(); ++i) {
    if (i > 0) {
      joined += ", ";
    }
    joined += Models::PropertyValueToString(ConvertValue(values[i], property));
  }
  joined += "]";
  return ReadResult::Success(joined);
}

/// present-value 쓰기 시 객체 타입이 요구하는 태그
std::optional<BACNET_APPLICATION_TAG>
PresentValueTag(const std::string &object_type) {
  if (object_type.rfind("analog-", 0) == 0 ||
      object_type == "large-analog-value") {
    return BACNET_APPLICATION_TAG_REAL;
  }
  if (object_type.rfind("binary-", 0) == 0) {
    return BACNET_APPLICATION_TAG_ENUMERATED;
  }
  if (object_type.rfind("multi-state-", 0) == 0) {
    return BACNET_APPLICATION_TAG_UNSIGNED_INT;
  }
  return std::nullopt;
}

bool EncodeWriteValue(const std::string &object_type,
                      const std::string &property, const PropertyValue &input,
                      BACNET_APPLICATION_DATA_VALUE &out) {
  std::memset(&out, 0, sizeof(out));
  out.next = nullptr;

  if (std::holds_alternative<std::monostate>(input)) {
    out.tag = BACNET_APPLICATION_TAG_NULL;
    return true;
  }

  std::optional<BACNET_APPLICATION_TAG> forced;
  if (property == "present-value") {
    forced = PresentValueTag(object_type);
  }

  double numeric = 0.0;
  bool is_numeric = true;
  if (auto b = std::get_if<bool>(&input)) {
    numeric = *b ? 1.0 : 0.0;
  } else if (auto i = std::get_if<int64_t>(&input)) {
    numeric = static_cast<double>(*i);
  } else if (auto d = std::get_if<double>(&input)) {
    numeric = *d;
  } else {
    is_numeric = false;
  }

  if (forced && is_numeric) {
    out.tag = *forced;
    if (*forced == BACNET_APPLICATION_TAG_REAL) {
      out.type.Real = static_cast<float>(numeric);
    } else if (*forced == BACNET_APPLICATION_TAG_ENUMERATED) {
      out.type.Enumerated = numeric != 0.0 ? 1 : 0;
    } else {
      if (numeric < 0) {
        return false;
      }
      out.type.Unsigned_Int = static_cast<BACNET_UNSIGNED_INTEGER>(numeric);
    }
    return true;
  }

  if (auto b = std::get_if<bool>(&input)) {
    out.tag = BACNET_APPLICATION_TAG_BOOLEAN;
    out.type.Boolean = *b;
    return true;
  }
  if (auto i = std::get_if<int64_t>(&input)) {
    if (*i >= 0) {
      out.tag = BACNET_APPLICATION_TAG_UNSIGNED_INT;
      out.type.Unsigned_Int = static_cast<BACNET_UNSIGNED_INTEGER>(*i);
    } else {
      out.tag = BACNET_APPLICATION_TAG_SIGNED_INT;
      out.type.Signed_Int = static_cast<int32_t>(*i);
    }
    return true;
  }
  if (auto d = std::get_if<double>(&input)) {
    out.tag = BACNET_APPLICATION_TAG_REAL;
    out.type.Real = static_cast<float>(*d);
    return true;
  }
  if (auto s = std::get_if<std::string>(&input)) {
    out.tag = BACNET_APPLICATION_TAG_CHARACTER_STRING;
    return characterstring_init_ansi(&out.type.Character_String, s->c_str());
  }
  if (auto id = std::get_if<ObjectId>(&input)) {
    unsigned type = 0;
    if (!bactext_object_type_strtol(id->type.c_str(), &type)) {
      return false;
    }
    out.tag = BACNET_APPLICATION_TAG_OBJECT_ID;
    out.type.Object_Id.type = static_cast<BACNET_OBJECT_TYPE>(type);
    out.type.Object_Id.instance = id->instance;
    return true;
  }
  return false;
}

} // namespace

// =============================================================================
// 스택 콜백 (수신 스레드, stack_mutex_ 보유 상태)
// =============================================================================

struct StackCallbacks {
  static BacnetStackTransport *Active() {
    std::lock_guard<std::mutex> lock(g_active_mutex);
    return g_active_transport;
  }

  static void IAm(uint8_t *service_request, uint16_t service_len,
                  BACNET_ADDRESS *src) {
    (void)service_len;
    BacnetStackTransport *transport = Active();
    if (transport == nullptr || src == nullptr) {
      return;
    }

    uint32_t device_id = 0;
    unsigned max_apdu = 0;
    int segmentation = 0;
    uint16_t vendor_id = 0;
    if (iam_decode_service_request(service_request, &device_id, &max_apdu,
                                   &segmentation, &vendor_id) <= 0) {
      LogManager::getInstance().log(kCategory, LogLevel::DEBUG,
                                    "Malformed I-Am from {}",
                                    FormatMacAddress(*src));
      return;
    }

    // 라우팅된 장치도 이후 요청에서 찾을 수 있도록 바인딩
    address_add(device_id, max_apdu, src);

    IAmIndication indication;
    indication.device_id = device_id;
    indication.address = FormatMacAddress(*src);
    if (src->net != 0) {
      indication.network_number = src->net;
    }
    indication.max_apdu = max_apdu;
    indication.segmentation = bactext_segmentation_name(segmentation);
    indication.vendor_id = vendor_id;

    InboundMessage message;
    message.source = indication.address;
    message.i_am = indication;
    transport->QueueIndication(std::move(message));
  }

  static void ReadPropertyAck(uint8_t *service_request, uint16_t service_len,
                              BACNET_ADDRESS *src,
                              BACNET_CONFIRMED_SERVICE_ACK_DATA *service_data) {
    (void)src;
    BacnetStackTransport *transport = Active();
    if (transport == nullptr || service_data == nullptr) {
      return;
    }

    const uint8_t invoke_id = service_data->invoke_id;
    BACNET_READ_PROPERTY_DATA data;
    std::memset(&data, 0, sizeof(data));
    if (rp_ack_decode_service_request(service_request, service_len, &data) <= 0) {
      transport->CompleteRequest(
          invoke_id, ReadResult::Failure(ServiceStatus::COMMUNICATION_ERROR,
                                         "malformed ReadProperty-Ack"));
      return;
    }

    const std::string property = transport->PendingProperty(invoke_id);
    transport->CompleteRequest(
        invoke_id, DecodeReadAck(data.application_data,
                                 data.application_data_len, property,
                                 data.array_index == BACNET_ARRAY_ALL));
  }

  static void WritePropertyAck(BACNET_ADDRESS *src, uint8_t invoke_id) {
    (void)src;
    BacnetStackTransport *transport = Active();
    if (transport == nullptr) {
      return;
    }
    ReadResult result;
    result.status = ServiceStatus::SUCCESS;
    transport->CompleteRequest(invoke_id, std::move(result));
  }

  static void Error(BACNET_ADDRESS *src, uint8_t invoke_id,
                    BACNET_ERROR_CLASS error_class,
                    BACNET_ERROR_CODE error_code) {
    (void)src;
    BacnetStackTransport *transport = Active();
    if (transport == nullptr) {
      return;
    }
    transport->CompleteRequest(
        invoke_id,
        ReadResult::Failure(MapErrorCode(error_code),
                            std::string(bactext_error_class_name(error_class)) +
                                "/" + bactext_error_code_name(error_code)));
  }

  static void Abort(BACNET_ADDRESS *src, uint8_t invoke_id,
                    uint8_t abort_reason, bool server) {
    (void)src;
    (void)server;
    BacnetStackTransport *transport = Active();
    if (transport == nullptr) {
      return;
    }
    // 분할 전송 미지원으로 응답이 너무 큰 경우
    const bool overflow =
        abort_reason == ABORT_REASON_SEGMENTATION_NOT_SUPPORTED ||
        abort_reason == ABORT_REASON_BUFFER_OVERFLOW;
    transport->CompleteRequest(
        invoke_id,
        ReadResult::Failure(overflow ? ServiceStatus::BUFFER_OVERFLOW
                                     : ServiceStatus::COMMUNICATION_ERROR,
                            std::string("abort: ") +
                                bactext_abort_reason_name(abort_reason)));
  }

  static void Reject(BACNET_ADDRESS *src, uint8_t invoke_id,
                     uint8_t reject_reason) {
    (void)src;
    BacnetStackTransport *transport = Active();
    if (transport == nullptr) {
      return;
    }
    transport->CompleteRequest(
        invoke_id,
        ReadResult::Failure(ServiceStatus::COMMUNICATION_ERROR,
                            std::string("reject: ") +
                                bactext_reject_reason_name(reject_reason)));
  }
};

// =============================================================================
// 생성자 및 수명 주기
// =============================================================================

BacnetStackTransport::BacnetStackTransport(BacnetStackOptions options)
    : options_(std::move(options)) {}

BacnetStackTransport::~BacnetStackTransport() { Close(); }

void BacnetStackTransport::Open() {
  auto &logger = LogManager::getInstance();
  if (open_.load()) {
    return;
  }

  {
    std::lock_guard<std::mutex> lock(g_active_mutex);
    if (g_active_transport != nullptr) {
      throw std::runtime_error("another BACnet transport is already open");
    }
    g_active_transport = this;
  }

  {
    std::lock_guard<std::mutex> lock(stack_mutex_);
    bip_set_port(options_.port);
    char *ifname = options_.interface_name.empty()
                       ? nullptr
                       : const_cast<char *>(options_.interface_name.c_str());
    if (!bip_init(ifname)) {
      std::lock_guard<std::mutex> active_lock(g_active_mutex);
      g_active_transport = nullptr;
      throw std::runtime_error("BACnet/IP bind failed on UDP port " +
                               std::to_string(options_.port));
    }

    address_init();
    Device_Init(nullptr);
    Device_Set_Object_Instance_Number(options_.device_id);
    if (!Device_Object_Name_ANSI_Init(options_.device_name.c_str())) {
      logger.log(kCategory, LogLevel::WARN, "Device name '{}' rejected by stack",
                 options_.device_name);
    }
    apdu_timeout_set(options_.apdu_timeout_ms);

    // 로컬 장치 응답
    apdu_set_unrecognized_service_handler_handler(handler_unrecognized_service);
    apdu_set_unconfirmed_handler(SERVICE_UNCONFIRMED_WHO_IS, handler_who_is);
    apdu_set_confirmed_handler(SERVICE_CONFIRMED_READ_PROPERTY,
                               handler_read_property);

    // 클라이언트 응답
    apdu_set_unconfirmed_handler(SERVICE_UNCONFIRMED_I_AM, StackCallbacks::IAm);
    apdu_set_confirmed_ack_handler(SERVICE_CONFIRMED_READ_PROPERTY,
                                   StackCallbacks::ReadPropertyAck);
    apdu_set_confirmed_simple_ack_handler(SERVICE_CONFIRMED_WRITE_PROPERTY,
                                          StackCallbacks::WritePropertyAck);
    apdu_set_error_handler(SERVICE_CONFIRMED_READ_PROPERTY,
                           StackCallbacks::Error);
    apdu_set_error_handler(SERVICE_CONFIRMED_WRITE_PROPERTY,
                           StackCallbacks::Error);
    apdu_set_abort_handler(StackCallbacks::Abort);
    apdu_set_reject_handler(StackCallbacks::Reject);
  }

  stop_requested_ = false;
  open_ = true;
  receive_thread_ = std::thread(&BacnetStackTransport::ReceiveLoop, this);

  logger.log(kCategory, LogLevel::INFO,
             "BACnet/IP transport open (device {} on UDP {})",
             options_.device_id, options_.port);
}

void BacnetStackTransport::Close() {
  if (!open_.load()) {
    return;
  }

  stop_requested_ = true;
  if (receive_thread_.joinable()) {
    receive_thread_.join();
  }

  {
    std::lock_guard<std::mutex> lock(pending_mutex_);
    for (auto &entry : pending_) {
      entry.second->promise.set_value(ReadResult::Failure(
          ServiceStatus::NOT_CONNECTED, "transport closed"));
    }
    pending_.clear();
  }

  {
    std::lock_guard<std::mutex> lock(stack_mutex_);
    bip_cleanup();
  }
  {
    std::lock_guard<std::mutex> lock(g_active_mutex);
    if (g_active_transport == this) {
      g_active_transport = nullptr;
    }
  }

  open_ = false;
  LogManager::getInstance().log(kCategory, LogLevel::INFO,
                                "BACnet/IP transport closed");
}

void BacnetStackTransport::ReceiveLoop() {
  auto &logger = LogManager::getInstance();
  logger.log(kCategory, LogLevel::DEBUG, "BACnet receive loop started");

  uint8_t pdu[MAX_PDU];
  while (!stop_requested_.load()) {
    try {
      BACNET_ADDRESS src;
      std::memset(&src, 0, sizeof(src));

      // 소켓 대기는 잠금 밖에서
      uint16_t pdu_len = bip_receive(&src, pdu, sizeof(pdu), kReceiveTimeoutMs);
      {
        std::lock_guard<std::mutex> lock(stack_mutex_);
        if (pdu_len > 0) {
          npdu_handler(&src, pdu, pdu_len);
        }
        tsm_timer_milliseconds(kReceiveTimeoutMs);
      }
      DispatchIndications();
    } catch (const std::exception &e) {
      logger.log(kCategory, LogLevel::LOG_ERROR, "BACnet receive error: {}",
                 e.what());
    }
  }

  logger.log(kCategory, LogLevel::DEBUG, "BACnet receive loop stopped");
}

// =============================================================================
// 요청 추적
// =============================================================================

bool BacnetStackTransport::BindAddressLocked(uint32_t device_id,
                                             const std::string &address) {
  BACNET_ADDRESS dest;
  unsigned max_apdu = 0;
  std::memset(&dest, 0, sizeof(dest));
  if (address_get_by_device(device_id, &max_apdu, &dest)) {
    return true;
  }

  auto relay = ParseHostPort(address);
  if (!relay) {
    return false;
  }
  auto resolved = ResolveIPv4(*relay);
  if (!resolved) {
    return false;
  }

  dest.mac_len = 6;
  std::memcpy(dest.mac, &resolved->sin_addr.s_addr, 4);
  dest.mac[4] = static_cast<uint8_t>(relay->port >> 8);
  dest.mac[5] = static_cast<uint8_t>(relay->port & 0xFF);
  dest.net = 0;
  dest.len = 0;
  address_add(device_id, MAX_APDU, &dest);
  return true;
}

std::future<ReadResult>
BacnetStackTransport::RegisterPendingLocked(uint8_t invoke_id,
                                            const std::string &property) {
  auto request = std::make_unique<PendingRequest>();
  request->property = property;
  std::future<ReadResult> future = request->promise.get_future();

  std::lock_guard<std::mutex> lock(pending_mutex_);
  pending_[invoke_id] = std::move(request);
  return future;
}

ReadResult BacnetStackTransport::Await(uint8_t invoke_id,
                                       std::future<ReadResult> &future,
                                       std::chrono::milliseconds timeout) {
  if (future.wait_for(timeout) == std::future_status::ready) {
    return future.get();
  }

  {
    std::lock_guard<std::mutex> lock(pending_mutex_);
    pending_.erase(invoke_id);
  }
  {
    std::lock_guard<std::mutex> lock(stack_mutex_);
    tsm_free_invoke_id(invoke_id);
  }
  return ReadResult::Failure(ServiceStatus::TIMEOUT,
                             "no response within " +
                                 std::to_string(timeout.count()) + "ms");
}

void BacnetStackTransport::CompleteRequest(uint8_t invoke_id, ReadResult result) {
  std::lock_guard<std::mutex> lock(pending_mutex_);
  auto it = pending_.find(invoke_id);
  if (it == pending_.end()) {
    // 이미 타임아웃 처리된 요청
    return;
  }
  it->second->promise.set_value(std::move(result));
  pending_.erase(it);
}

std::string BacnetStackTransport::PendingProperty(uint8_t invoke_id) {
  std::lock_guard<std::mutex> lock(pending_mutex_);
  auto it = pending_.find(invoke_id);
  return it == pending_.end() ? std::string() : it->second->property;
}

void BacnetStackTransport::QueueIndication(InboundMessage message) {
  std::lock_guard<std::mutex> lock(handler_mutex_);
  queued_indications_.push_back(std::move(message));
}

void BacnetStackTransport::DispatchIndications() {
  std::vector<InboundMessage> messages;
  IndicationHandler handler;
  {
    std::lock_guard<std::mutex> lock(handler_mutex_);
    if (queued_indications_.empty()) {
      return;
    }
    messages.swap(queued_indications_);
    handler = indication_handler_;
  }
  if (!handler) {
    return;
  }
  for (const auto &message : messages) {
    handler(message);
  }
}

// =============================================================================
// ITransport
// =============================================================================

bool BacnetStackTransport::SendWhoIs(std::optional<uint32_t> low_limit,
                                     std::optional<uint32_t> high_limit) {
  if (!open_.load()) {
    return false;
  }

  // Who-Is 는 두 경계를 함께 인코딩한다
  int32_t low = -1;
  int32_t high = -1;
  if (low_limit || high_limit) {
    low = static_cast<int32_t>(low_limit.value_or(0));
    high = static_cast<int32_t>(high_limit.value_or(kMaxInstance));
  }

  std::lock_guard<std::mutex> lock(stack_mutex_);
  Send_WhoIs(low, high);
  LogManager::getInstance().log(kCategory, LogLevel::DEBUG,
                                "Who-Is sent (low={}, high={})", low, high);
  return true;
}

ReadResult BacnetStackTransport::ReadProperty(
    uint32_t device_id, const std::string &address, const ObjectId &object,
    const std::string &property, std::optional<uint32_t> array_index,
    std::chrono::milliseconds timeout) {
  if (!open_.load()) {
    return ReadResult::Failure(ServiceStatus::NOT_CONNECTED,
                               "transport not open");
  }

  unsigned object_type = 0;
  if (!bactext_object_type_strtol(object.type.c_str(), &object_type)) {
    return ReadResult::Failure(ServiceStatus::UNKNOWN_OBJECT,
                               "unknown object type " + object.type);
  }
  unsigned property_id = 0;
  if (!bactext_property_strtol(property.c_str(), &property_id)) {
    return ReadResult::Failure(ServiceStatus::UNKNOWN_PROPERTY,
                               "unknown property " + property);
  }

  uint8_t invoke_id = 0;
  std::future<ReadResult> future;
  {
    std::lock_guard<std::mutex> lock(stack_mutex_);
    if (!BindAddressLocked(device_id, address)) {
      return ReadResult::Failure(ServiceStatus::COMMUNICATION_ERROR,
                                 "unresolvable address " + address);
    }
    invoke_id = Send_Read_Property_Request(
        device_id, static_cast<BACNET_OBJECT_TYPE>(object_type),
        object.instance, static_cast<BACNET_PROPERTY_ID>(property_id),
        array_index ? *array_index : BACNET_ARRAY_ALL);
    if (invoke_id == 0) {
      return ReadResult::Failure(ServiceStatus::COMMUNICATION_ERROR,
                                 "ReadProperty request not sent");
    }
    future = RegisterPendingLocked(invoke_id, property);
  }

  return Await(invoke_id, future, timeout);
}

ServiceStatus BacnetStackTransport::WriteProperty(
    uint32_t device_id, const std::string &address, const ObjectId &object,
    const std::string &property, const PropertyValue &value,
    std::optional<uint8_t> priority, std::optional<uint32_t> array_index,
    std::chrono::milliseconds timeout) {
  auto &logger = LogManager::getInstance();
  if (!open_.load()) {
    return ServiceStatus::NOT_CONNECTED;
  }

  unsigned object_type = 0;
  if (!bactext_object_type_strtol(object.type.c_str(), &object_type)) {
    return ServiceStatus::UNKNOWN_OBJECT;
  }
  unsigned property_id = 0;
  if (!bactext_property_strtol(property.c_str(), &property_id)) {
    return ServiceStatus::UNKNOWN_PROPERTY;
  }

  BACNET_APPLICATION_DATA_VALUE encoded;
  if (!EncodeWriteValue(object.type, property, value, encoded)) {
    logger.log(kCategory, LogLevel::WARN, "Cannot encode {} for {} {}",
               Models::PropertyValueToString(value), object.Key(), property);
    return ServiceStatus::COMMUNICATION_ERROR;
  }

  uint8_t invoke_id = 0;
  std::future<ReadResult> future;
  {
    std::lock_guard<std::mutex> lock(stack_mutex_);
    if (!BindAddressLocked(device_id, address)) {
      return ServiceStatus::COMMUNICATION_ERROR;
    }
    invoke_id = Send_Write_Property_Request(
        device_id, static_cast<BACNET_OBJECT_TYPE>(object_type),
        object.instance, static_cast<BACNET_PROPERTY_ID>(property_id), &encoded,
        priority ? *priority : BACNET_NO_PRIORITY,
        array_index ? *array_index : BACNET_ARRAY_ALL);
    if (invoke_id == 0) {
      return ServiceStatus::COMMUNICATION_ERROR;
    }
    future = RegisterPendingLocked(invoke_id, property);
  }

  ReadResult result = Await(invoke_id, future, timeout);
  if (!result.Ok()) {
    logger.log(kCategory, LogLevel::DEBUG, "WriteProperty {} {} failed: {}",
               object.Key(), property, result.message);
  }
  return result.status;
}

bool BacnetStackTransport::RegisterForeignDevice(const RelayAddress &relay,
                                                 uint16_t ttl_seconds) {
  if (!open_.load()) {
    return false;
  }
  BACNET_IP_ADDRESS bbmd;
  std::memset(&bbmd, 0, sizeof(bbmd));
  if (!ToIpAddress(relay, bbmd)) {
    return false;
  }

  std::lock_guard<std::mutex> lock(stack_mutex_);
  return bvlc_register_with_bbmd(&bbmd, ttl_seconds) > 0;
}

bool BacnetStackTransport::SendBvll(const RelayAddress &relay,
                                    const std::vector<uint8_t> &message) {
  if (!open_.load() || message.empty()) {
    return false;
  }
  BACNET_IP_ADDRESS dest;
  std::memset(&dest, 0, sizeof(dest));
  if (!ToIpAddress(relay, dest)) {
    return false;
  }

  std::vector<uint8_t> buffer(message);
  int sent = 0;
  {
    std::lock_guard<std::mutex> lock(stack_mutex_);
    sent = bip_send_mpdu(&dest, buffer.data(),
                         static_cast<uint16_t>(buffer.size()));
  }
  if (sent <= 0) {
    LogManager::getInstance().log(kCategory, LogLevel::WARN,
                                  "BVLL send to {} failed", relay.ToString());
    return false;
  }
  LogManager::getInstance().logFrame("bvll", relay.ToString(), message,
                                     "BVLL out");
  return true;
}

IndicationHandler
BacnetStackTransport::SetIndicationHandler(IndicationHandler handler) {
  std::lock_guard<std::mutex> lock(handler_mutex_);
  IndicationHandler previous = std::move(indication_handler_);
  indication_handler_ = std::move(handler);
  return previous;
}

} // namespace Transport
} // namespace BacLink
