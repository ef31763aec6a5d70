/**
 * @file test_control_api.cpp
 * @brief 제어 API 핸들러의 상태 코드, 오류 코드, 응답 본문 테스트
 */

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "Engine/BridgeEngine.h"
#include "Logging/LogManager.h"
#include "Network/ControlApi.h"
#include "helpers/FakeTransport.h"
#include "helpers/Mocks.h"
#include "helpers/TempDir.h"

#include <chrono>
#include <filesystem>

using namespace BacLink;
using namespace BacLink::Models;
using BacLink::Core::GatewayConfig;
using BacLink::Engine::BridgeEngine;
using BacLink::Network::ApiResponse;
using BacLink::Network::ControlApi;
using BacLink::Testing::FakeTransport;
using BacLink::Testing::MockRegistrationStrategy;
using BacLink::Transport::ReadResult;
using BacLink::Transport::ServiceStatus;
using ::testing::_;
using ::testing::NiceMock;
using ::testing::Return;

class ControlApiTest : public ::testing::Test {
protected:
    void SetUp() override {
        LogManager::getInstance().setConsoleOutput(false);
        LogManager::getInstance().setFileOutput(false);

        config_.discovery_auto = false;
        config_.poll_enabled = false;
        config_.mqtt_enabled = false;
        config_.api_enabled = false;
        config_.poll_read_timeout_ms = 200;
        config_.devices_file = dir_.File("devices.json");
        config_.mappings_file = dir_.File("mappings.json");
    }

    void CreateEngine(Registration::StrategyList strategies = {}) {
        engine_ = std::make_unique<BridgeEngine>(config_, transport_, nullptr,
                                                 std::move(strategies));
        api_ = std::make_unique<ControlApi>(*engine_);
    }

    void SeedDevice(uint32_t id) {
        Device device;
        device.device_id = id;
        device.address = "10.0.0.5:47808";
        device.device_name = "AHU-" + std::to_string(id);
        engine_->GetRegistry().AddOrMerge(device);

        BacnetObject object;
        object.object_type = "analog-value";
        object.object_instance = 1;
        object.object_name = "Setpoint";
        engine_->GetRegistry().AddObject(id, object);
    }

    static void ExpectError(const ApiResponse &response, int status,
                            const std::string &code) {
        EXPECT_EQ(response.status, status);
        EXPECT_EQ(response.body["success"], false);
        EXPECT_EQ(response.body.value("error_code", std::string()), code);
        EXPECT_TRUE(response.body.contains("error"));
    }

    static void ExpectSuccess(const ApiResponse &response) {
        EXPECT_EQ(response.status, 200);
        EXPECT_EQ(response.body["success"], true);
        EXPECT_TRUE(response.body.contains("timestamp"));
    }

    Testing::TempDir dir_;
    GatewayConfig config_;
    FakeTransport transport_;
    std::unique_ptr<BridgeEngine> engine_;
    std::unique_ptr<ControlApi> api_;
};

// =============================================================================
// 응답 형식
// =============================================================================

TEST_F(ControlApiTest, ErrorResponseOmitsEmptyFields) {
    auto body = ControlApi::CreateErrorResponse("Boom", "");
    EXPECT_EQ(body["success"], false);
    EXPECT_EQ(body["error"], "Boom");
    EXPECT_FALSE(body.contains("error_code"));
    EXPECT_FALSE(body.contains("details"));

    body = ControlApi::CreateErrorResponse("Boom", "SOME_CODE", "why");
    EXPECT_EQ(body["error_code"], "SOME_CODE");
    EXPECT_EQ(body["details"], "why");
}

// =============================================================================
// 상태 / 장치
// =============================================================================

TEST_F(ControlApiTest, StatusReportsDeviceCounts) {
    CreateEngine();
    SeedDevice(10);

    auto response = api_->GetStatus();

    ExpectSuccess(response);
    const auto &data = response.body["data"];
    EXPECT_EQ(data["devices"]["total"], 1);
    EXPECT_EQ(data["devices"]["objects"], 1);
    EXPECT_EQ(data["publishing"]["enabled"], false);
    EXPECT_EQ(data["registration"]["enabled"], false);
}

TEST_F(ControlApiTest, DeviceListOmitsObjects) {
    CreateEngine();
    SeedDevice(10);
    SeedDevice(11);

    auto response = api_->GetDevices();

    ExpectSuccess(response);
    ASSERT_EQ(response.body["data"].size(), 2u);
    EXPECT_FALSE(response.body["data"][0].contains("objects"));
}

TEST_F(ControlApiTest, SingleDeviceLookup) {
    CreateEngine();
    SeedDevice(10);

    ExpectError(api_->GetDevice("ten"), 400, "INVALID_DEVICE_ID");
    ExpectError(api_->GetDevice("99999999999"), 400, "INVALID_DEVICE_ID");
    ExpectError(api_->GetDevice("77"), 404, "DEVICE_NOT_FOUND");

    auto response = api_->GetDevice("10");
    ExpectSuccess(response);
    EXPECT_EQ(response.body["data"]["device_name"], "AHU-10");
    EXPECT_TRUE(response.body["data"].contains("objects"));
}

TEST_F(ControlApiTest, DiscoverValidatesRequest) {
    CreateEngine();

    ExpectError(api_->PostDiscover("not json"), 400, "INVALID_JSON");
    ExpectError(api_->PostDiscover("[1, 2]"), 400, "INVALID_JSON");
    ExpectError(api_->PostDiscover(R"({"low_limit": -1})"), 400, "INVALID_PARAMETER");
    ExpectError(api_->PostDiscover(R"({"timeout": "soon"})"), 400, "INVALID_PARAMETER");
    ExpectError(api_->PostDiscover(R"({"timeout": 0})"), 400, "INVALID_PARAMETER");
    ExpectError(api_->PostDiscover(R"({"low_limit": 10, "high_limit": 5})"), 400,
                "INVALID_RANGE");
    EXPECT_EQ(transport_.who_is_count(), 0u);
}

TEST_F(ControlApiTest, DiscoverReturnsRespondingDevices) {
    CreateEngine();
    transport_.QueueIAm(Testing::MakeIAm(321, "10.0.0.21:47808"));

    auto response = api_->PostDiscover(R"({"low_limit": 300, "high_limit": 400, "timeout": 1})");

    ExpectSuccess(response);
    EXPECT_EQ(response.body["data"]["count"], 1);
    EXPECT_EQ(response.body["data"]["devices"][0]["device_id"], 321);
    EXPECT_EQ(transport_.last_low(), std::optional<uint32_t>(300));
    EXPECT_EQ(transport_.last_high(), std::optional<uint32_t>(400));
    EXPECT_TRUE(engine_->FindDevice(321).has_value());
}

TEST_F(ControlApiTest, DiscoverTimeoutIsClampedToConfiguredMaximum) {
    config_.discovery_max_timeout_sec = 1;
    CreateEngine();

    auto start = std::chrono::steady_clock::now();
    auto response = api_->PostDiscover(R"({"timeout": 4294967295})");
    auto elapsed = std::chrono::steady_clock::now() - start;

    ExpectSuccess(response);
    EXPECT_EQ(response.body["data"]["timeout"], 1);
    EXPECT_EQ(response.body["data"]["count"], 0);
    EXPECT_LT(elapsed, std::chrono::seconds(3));
    EXPECT_EQ(transport_.who_is_count(), 1);
}

TEST_F(ControlApiTest, DiscoverObjectsEnumeratesAndPersists) {
    CreateEngine();
    SeedDevice(10);
    transport_.SetValue(10, "device", 10, "object-list",
                        std::vector<ObjectId>{ObjectId("device", 10),
                                              ObjectId("analog-input", 1),
                                              ObjectId("binary-output", 2)});

    ExpectError(api_->PostDiscoverObjects("x"), 400, "INVALID_DEVICE_ID");
    ExpectError(api_->PostDiscoverObjects("11"), 404, "DEVICE_NOT_FOUND");

    auto response = api_->PostDiscoverObjects("10");
    ExpectSuccess(response);
    EXPECT_EQ(response.body["data"]["object_count"], 2);
    EXPECT_TRUE(std::filesystem::exists(config_.devices_file));
}

TEST_F(ControlApiTest, DiscoverObjectsReportsEnumerationFailure) {
    CreateEngine();
    SeedDevice(10);
    transport_.SetRead(10, "device", 10, "object-list",
                       ReadResult::Failure(ServiceStatus::TIMEOUT));

    ExpectError(api_->PostDiscoverObjects("10"), 502, "DISCOVERY_FAILED");
}

TEST_F(ControlApiTest, EnableDisableAndDelete) {
    CreateEngine();
    SeedDevice(10);

    ExpectError(api_->PutDisable("12"), 404, "DEVICE_NOT_FOUND");
    ExpectSuccess(api_->PutDisable("10"));
    EXPECT_FALSE(engine_->FindDevice(10)->enabled);
    ExpectSuccess(api_->PutEnable("10"));
    EXPECT_TRUE(engine_->FindDevice(10)->enabled);

    ExpectSuccess(api_->DeleteDevice("10"));
    EXPECT_FALSE(engine_->FindDevice(10).has_value());
    ExpectError(api_->DeleteDevice("10"), 404, "DEVICE_NOT_FOUND");
    ExpectError(api_->PutEnable("-1"), 400, "INVALID_DEVICE_ID");
}

// =============================================================================
// 객체
// =============================================================================

TEST_F(ControlApiTest, ObjectQueries) {
    CreateEngine();
    SeedDevice(10);

    auto list = api_->GetObjects("10");
    ExpectSuccess(list);
    ASSERT_EQ(list.body["data"]["objects"].size(), 1u);
    ExpectError(api_->GetObjects("11"), 404, "DEVICE_NOT_FOUND");

    auto single = api_->GetObject("10", "analog-value", "1");
    ExpectSuccess(single);
    EXPECT_EQ(single.body["data"]["object_name"], "Setpoint");

    ExpectError(api_->GetObject("10", "analog-value", "one"), 400,
                "INVALID_OBJECT_INSTANCE");
    ExpectError(api_->GetObject("10", "analog-value", "2"), 404, "OBJECT_NOT_FOUND");
    ExpectError(api_->GetObject("11", "analog-value", "1"), 404, "DEVICE_NOT_FOUND");
}

// =============================================================================
// 읽기 / 쓰기
// =============================================================================

TEST_F(ControlApiTest, ReadValidatesFields) {
    CreateEngine();
    SeedDevice(10);

    ExpectError(api_->PostRead(R"({"device_id": 10})"), 400, "MISSING_FIELDS");
    ExpectError(api_->PostRead(R"({"device_id": 10, "object_type": "analog-value",
                                   "object_instance": 1, "property_id": ""})"),
                400, "MISSING_FIELDS");
    ExpectError(api_->PostRead(R"({"device_id": 10, "object_type": "analog-value",
                                   "object_instance": 1, "property_id": "priority-array",
                                   "array_index": -3})"),
                400, "INVALID_ARRAY_INDEX");
    ExpectError(api_->PostRead(R"({"device_id": 11, "object_type": "analog-value",
                                   "object_instance": 1, "property_id": "present-value"})"),
                404, "DEVICE_NOT_FOUND");
    EXPECT_TRUE(transport_.Reads().empty());
}

TEST_F(ControlApiTest, ReadReturnsValueOrGatewayError) {
    CreateEngine();
    SeedDevice(10);
    transport_.SetValue(10, "analog-value", 1, "present-value", 72.5);

    auto response = api_->PostRead(R"({"device_id": 10, "object_type": "analog-value",
                                      "object_instance": 1, "property_id": "present-value"})");
    ExpectSuccess(response);
    EXPECT_DOUBLE_EQ(response.body["data"]["value"].get<double>(), 72.5);

    auto failed = api_->PostRead(R"({"device_id": 10, "object_type": "analog-value",
                                    "object_instance": 1, "property_id": "description"})");
    ExpectError(failed, 502, "READ_FAILED");
    EXPECT_EQ(failed.body["details"], "UNKNOWN_PROPERTY");
}

TEST_F(ControlApiTest, ReadPassesArrayIndex) {
    CreateEngine();
    SeedDevice(10);
    transport_.SetRead(10, "analog-value", 1, "priority-array",
                       ReadResult::Success(PropertyValue{}), 8);

    auto response = api_->PostRead(R"({"device_id": 10, "object_type": "analog-value",
                                      "object_instance": 1, "property_id": "priority-array",
                                      "array_index": 8})");
    ExpectSuccess(response);
    EXPECT_TRUE(response.body["data"]["value"].is_null());

    auto reads = transport_.Reads();
    ASSERT_EQ(reads.size(), 1u);
    EXPECT_EQ(reads[0].array_index, std::optional<uint32_t>(8));
}

TEST_F(ControlApiTest, WriteValidatesFields) {
    CreateEngine();
    SeedDevice(10);

    ExpectError(api_->PostWrite(R"({"device_id": 10, "object_type": "analog-value",
                                    "object_instance": 1, "property_id": "present-value"})"),
                400, "MISSING_FIELDS");
    ExpectError(api_->PostWrite(R"({"device_id": 10, "object_type": "analog-value",
                                    "object_instance": 1, "property_id": "present-value",
                                    "value": 1, "priority": 17})"),
                400, "INVALID_PRIORITY");
    ExpectError(api_->PostWrite(R"({"device_id": 10, "object_type": "analog-value",
                                    "object_instance": 1, "property_id": "present-value",
                                    "value": 1, "priority": 0})"),
                400, "INVALID_PRIORITY");
    ExpectError(api_->PostWrite(R"({"device_id": 11, "object_type": "analog-value",
                                    "object_instance": 1, "property_id": "present-value",
                                    "value": 1})"),
                404, "DEVICE_NOT_FOUND");
    EXPECT_TRUE(transport_.Writes().empty());
}

TEST_F(ControlApiTest, WriteForwardsValueAndPriority) {
    CreateEngine();
    SeedDevice(10);

    auto response = api_->PostWrite(R"({"device_id": 10, "object_type": "analog-value",
                                       "object_instance": 1, "property_id": "present-value",
                                       "value": 21.5, "priority": 8})");
    ExpectSuccess(response);

    auto writes = transport_.Writes();
    ASSERT_EQ(writes.size(), 1u);
    EXPECT_EQ(writes[0].device_id, 10u);
    EXPECT_EQ(writes[0].object, ObjectId("analog-value", 1));
    EXPECT_DOUBLE_EQ(std::get<double>(writes[0].value), 21.5);
    EXPECT_EQ(writes[0].priority, std::optional<uint8_t>(8));
}

TEST_F(ControlApiTest, WriteFailureIsGatewayError) {
    CreateEngine();
    SeedDevice(10);
    transport_.SetWriteStatus(ServiceStatus::TIMEOUT);

    ExpectError(api_->PostWrite(R"({"device_id": 10, "object_type": "analog-value",
                                    "object_instance": 1, "property_id": "present-value",
                                    "value": null})"),
                502, "WRITE_FAILED");
}

// =============================================================================
// BBMD
// =============================================================================

TEST_F(ControlApiTest, RegisterRequiresBbmdConfiguration) {
    CreateEngine();
    ExpectError(api_->PostRegister(), 400, "BBMD_DISABLED");
}

TEST_F(ControlApiTest, RegisterReportsStrategyOutcome) {
    config_.bbmd_enabled = true;
    config_.bbmd_address = "192.0.2.10";

    auto strategy = std::make_unique<NiceMock<MockRegistrationStrategy>>("only");
    auto *raw = strategy.get();
    Registration::StrategyList strategies;
    strategies.push_back(std::move(strategy));
    CreateEngine(std::move(strategies));

    EXPECT_CALL(*raw, Register(_, 30))
        .WillOnce(Return(false))
        .WillOnce(Return(true));
    EXPECT_CALL(*raw, Register(_, 0)).WillRepeatedly(Return(true));

    ExpectError(api_->PostRegister(), 502, "REGISTRATION_FAILED");

    auto response = api_->PostRegister();
    ExpectSuccess(response);
    EXPECT_EQ(response.body["data"]["registration"]["registered"], true);
    EXPECT_EQ(response.body["data"]["registration"]["last_strategy"], "only");
}

// =============================================================================
// 토픽 매핑
// =============================================================================

TEST_F(ControlApiTest, MappingLifecycle) {
    CreateEngine();

    ExpectError(api_->PostMapping("{"), 400, "INVALID_JSON");
    ExpectError(api_->PostMapping(R"({"device_id": 10, "object_type": "analog-value"})"), 400,
                "INVALID_MAPPING");
    ExpectError(api_->PostMapping(R"({"device_id": 10, "object_type": "analog-value",
                                      "object_instance": 1})"),
                400, "INVALID_MAPPING");

    auto created = api_->PostMapping(R"({"device_id": 10, "object_type": "analog-value",
                                         "object_instance": 1, "mqtt_topic": "site/ahu/sp"})");
    ExpectSuccess(created);
    EXPECT_EQ(created.body["data"]["enabled"], true);

    auto list = api_->GetMappings();
    ExpectSuccess(list);
    ASSERT_EQ(list.body["data"].size(), 1u);
    EXPECT_EQ(list.body["data"][0]["mqtt_topic"], "site/ahu/sp");

    ExpectError(api_->DeleteMapping("10", "analog-value", "x"), 400, "INVALID_MAPPING");
    ExpectError(api_->DeleteMapping("10", "analog-value", "2"), 404, "MAPPING_NOT_FOUND");
    ExpectSuccess(api_->DeleteMapping("10", "analog-value", "1"));
    EXPECT_TRUE(api_->GetMappings().body["data"].empty());
}

TEST_F(ControlApiTest, MappingSaveFailureIsServerError) {
    // 디렉터리 경로에는 파일을 쓸 수 없다
    config_.mappings_file = dir_.Path().string();
    CreateEngine();

    ExpectError(api_->PostMapping(R"({"device_id": 10, "object_type": "analog-value",
                                      "object_instance": 1, "mqtt_topic": "t"})"),
                500, "MAPPING_SAVE_FAILED");
}
