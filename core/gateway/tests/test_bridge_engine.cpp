/**
 * @file test_bridge_engine.cpp
 * @brief 브리지 엔진 수명 주기와 제어 연산 테스트
 */

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "Engine/BridgeEngine.h"
#include "Logging/LogManager.h"
#include "helpers/FakeTransport.h"
#include "helpers/Mocks.h"
#include "helpers/TempDir.h"

#include <functional>
#include <thread>

using namespace BacLink;
using namespace BacLink::Models;
using namespace std::chrono;
using BacLink::Core::GatewayConfig;
using BacLink::Engine::BridgeEngine;
using BacLink::Testing::FakeTransport;
using BacLink::Testing::MockMessageBus;
using BacLink::Transport::ServiceStatus;
using ::testing::_;
using ::testing::AtLeast;
using ::testing::NiceMock;
using ::testing::Return;

namespace {

bool WaitFor(const std::function<bool()> &condition,
             milliseconds limit = milliseconds(5000)) {
    auto deadline = steady_clock::now() + limit;
    while (steady_clock::now() < deadline) {
        if (condition()) {
            return true;
        }
        std::this_thread::sleep_for(milliseconds(10));
    }
    return condition();
}

} // namespace

class BridgeEngineTest : public ::testing::Test {
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

    /// 엔진 시작 전에 저장 파일로 장치를 준비한다
    void SeedFile(uint32_t id) {
        Registry::DeviceRegistry seed(config_.devices_file);
        Device device;
        device.device_id = id;
        device.address = "10.0.0.9:47808";
        seed.AddOrMerge(device);
        BacnetObject object;
        object.object_type = "analog-input";
        object.object_instance = 1;
        seed.AddObject(id, object);
        ASSERT_TRUE(seed.Persist());
    }

    void SeedMemory(uint32_t id) {
        Device device;
        device.device_id = id;
        device.address = "10.0.0.9:47808";
        engine_->GetRegistry().AddOrMerge(device);
    }

    void CreateEngine(Publish::IMessageBus *bus = nullptr) {
        engine_ = std::make_unique<BridgeEngine>(config_, transport_, bus);
    }

    std::optional<Device> ReloadFromDisk(uint32_t id) {
        Registry::DeviceRegistry reloaded(config_.devices_file);
        reloaded.Load();
        return reloaded.Get(id);
    }

    Testing::TempDir dir_;
    GatewayConfig config_;
    FakeTransport transport_;
    std::unique_ptr<BridgeEngine> engine_;
};

// =============================================================================
// 제어 연산
// =============================================================================

TEST_F(BridgeEngineTest, ReadUnknownDeviceReturnsNothing) {
    CreateEngine();
    EXPECT_FALSE(engine_->Read(5, "analog-input", 1, "present-value").has_value());
    EXPECT_TRUE(transport_.Reads().empty());
}

TEST_F(BridgeEngineTest, ReadUsesRegistryAddressAndDoesNotStoreValue) {
    CreateEngine();
    SeedMemory(5);
    transport_.SetValue(5, "analog-input", 1, "present-value", 3.0);

    auto result = engine_->Read(5, "analog-input", 1, "present-value");

    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(result->Ok());
    auto reads = transport_.Reads();
    ASSERT_EQ(reads.size(), 1u);
    EXPECT_EQ(reads[0].address, "10.0.0.9:47808");
    EXPECT_EQ(reads[0].timeout, milliseconds(200));
    EXPECT_EQ(engine_->FindDevice(5)->FindObject("analog-input", 1), nullptr);
}

TEST_F(BridgeEngineTest, WriteReportsTransportStatus) {
    CreateEngine();
    SeedMemory(5);

    EXPECT_FALSE(engine_->Write(6, "analog-value", 1, "present-value", 1.0));
    EXPECT_TRUE(engine_->Write(5, "analog-value", 1, "present-value", 1.0,
                               static_cast<uint8_t>(16)));
    transport_.SetWriteStatus(ServiceStatus::COMMUNICATION_ERROR);
    EXPECT_FALSE(engine_->Write(5, "analog-value", 1, "present-value", 2.0));

    auto writes = transport_.Writes();
    ASSERT_EQ(writes.size(), 2u);
    EXPECT_EQ(writes[0].priority, std::optional<uint8_t>(16));
    EXPECT_FALSE(writes[1].priority.has_value());
}

TEST_F(BridgeEngineTest, EnableDisableRemovePersist) {
    CreateEngine();
    SeedMemory(5);

    EXPECT_FALSE(engine_->Disable(6));
    ASSERT_TRUE(engine_->Disable(5));
    auto stored = ReloadFromDisk(5);
    ASSERT_TRUE(stored.has_value());
    EXPECT_FALSE(stored->enabled);

    ASSERT_TRUE(engine_->Enable(5));
    EXPECT_TRUE(ReloadFromDisk(5)->enabled);

    ASSERT_TRUE(engine_->Remove(5));
    EXPECT_FALSE(ReloadFromDisk(5).has_value());
    EXPECT_FALSE(engine_->Remove(5));
}

TEST_F(BridgeEngineTest, ObjectsOfUnknownDevice) {
    CreateEngine();
    EXPECT_FALSE(engine_->Objects(1).has_value());
    SeedMemory(1);
    ASSERT_TRUE(engine_->Objects(1).has_value());
    EXPECT_TRUE(engine_->Objects(1)->empty());
}

TEST_F(BridgeEngineTest, StatusDescribesComponents) {
    CreateEngine();
    auto status = engine_->Status();
    EXPECT_EQ(status["running"], false);
    EXPECT_EQ(status["local_device_id"], config_.bacnet_device_id);
    EXPECT_EQ(status["discovery"]["state"], "IDLE");
    EXPECT_TRUE(status.contains("polling"));
    EXPECT_EQ(status["publishing"]["enabled"], false);
    EXPECT_EQ(status["registration"]["state"], "UNREGISTERED");
}

TEST_F(BridgeEngineTest, TriggerRegistrationNeedsConfiguration) {
    CreateEngine();
    EXPECT_FALSE(engine_->TriggerRegistration());
    EXPECT_EQ(transport_.register_count(), 0u);
}

// =============================================================================
// 수명 주기
// =============================================================================

TEST_F(BridgeEngineTest, StartRestoresRegistryAndStopPersists) {
    SeedFile(7);
    CreateEngine();

    engine_->Start();
    EXPECT_TRUE(engine_->IsRunning());
    ASSERT_TRUE(engine_->FindDevice(7).has_value());
    EXPECT_NE(engine_->FindDevice(7)->FindObject("analog-input", 1), nullptr);

    engine_->GetRegistry().StoreProperty(7, ObjectId("analog-input", 1), "present-value",
                                         12.0);
    engine_->Stop();
    EXPECT_FALSE(engine_->IsRunning());

    auto stored = ReloadFromDisk(7);
    ASSERT_TRUE(stored.has_value());
    EXPECT_NE(stored->FindObject("analog-input", 1)->FindProperty("present-value"), nullptr);

    engine_->Stop();
}

TEST_F(BridgeEngineTest, PollingStoresValuesWhileRunning) {
    SeedFile(7);
    config_.poll_enabled = true;
    config_.poll_properties = {"present-value"};
    transport_.SetValue(7, "analog-input", 1, "present-value", 18.25);
    CreateEngine();

    engine_->Start();
    bool stored = WaitFor([&] {
        auto device = engine_->FindDevice(7);
        const BacnetObject *object = device ? device->FindObject("analog-input", 1) : nullptr;
        return object != nullptr && object->FindProperty("present-value") != nullptr;
    });
    engine_->Stop();

    EXPECT_TRUE(stored);
    EXPECT_GE(engine_->Status()["polling"]["cycles"].get<uint64_t>(), 1u);
}

TEST_F(BridgeEngineTest, AutoDiscoveryEnumeratesNewDevices) {
    config_.discovery_auto = true;
    config_.discovery_who_is_timeout_sec = 1;
    config_.discovery_interval_sec = 60;
    transport_.QueueIAm(Testing::MakeIAm(44, "10.0.0.44:47808"));
    transport_.SetValue(44, "device", 44, "object-list",
                        std::vector<ObjectId>{ObjectId("device", 44),
                                              ObjectId("analog-value", 3)});
    transport_.SetValue(44, "analog-value", 3, "object-name", std::string("Room SP"));
    CreateEngine();

    engine_->Start();
    bool enumerated = WaitFor([&] {
        auto device = engine_->FindDevice(44);
        return device && device->FindObject("analog-value", 3) != nullptr;
    });
    engine_->Stop();

    ASSERT_TRUE(enumerated);
    EXPECT_EQ(engine_->FindDevice(44)->FindObject("analog-value", 3)->object_name, "Room SP");
    EXPECT_EQ(transport_.who_is_count(), 1u);
    auto stored = ReloadFromDisk(44);
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->objects.size(), 1u);
}

TEST_F(BridgeEngineTest, StopInterruptsObjectEnumeration) {
    config_.discovery_auto = true;
    config_.discovery_who_is_timeout_sec = 1;
    config_.discovery_interval_sec = 60;
    config_.poll_read_timeout_ms = 500;
    std::vector<ObjectId> objects{ObjectId("device", 44)};
    for (uint32_t instance = 1; instance <= 40; ++instance) {
        objects.emplace_back("analog-value", instance);
        transport_.SetValue(44, "analog-value", instance, "object-name",
                            std::string("AV ") + std::to_string(instance));
    }
    transport_.QueueIAm(Testing::MakeIAm(44, "10.0.0.44:47808"));
    transport_.SetValue(44, "device", 44, "object-list", objects);
    transport_.SetDeviceDelay(44, milliseconds(100));
    CreateEngine();

    engine_->Start();
    ASSERT_TRUE(WaitFor([&] { return transport_.CountReads("object-name") > 0; }));
    std::this_thread::sleep_for(milliseconds(500));

    auto start = steady_clock::now();
    engine_->Stop();
    auto elapsed = steady_clock::now() - start;

    EXPECT_LT(elapsed, milliseconds(1000));
    auto device = engine_->FindDevice(44);
    ASSERT_TRUE(device.has_value());
    EXPECT_LT(device->objects.size(), 40u);
    EXPECT_LT(transport_.CountReads("object-name"), 40u);
}

TEST_F(BridgeEngineTest, RestartAfterStopRunsDiscoveryAgain) {
    config_.discovery_auto = true;
    config_.discovery_who_is_timeout_sec = 1;
    config_.discovery_interval_sec = 60;
    CreateEngine();

    engine_->Start();
    ASSERT_TRUE(WaitFor([&] { return transport_.who_is_count() >= 1; }));
    engine_->Stop();

    engine_->Start();
    EXPECT_TRUE(WaitFor([&] { return transport_.who_is_count() >= 2; }));
    engine_->Stop();
}

TEST_F(BridgeEngineTest, PublisherFollowsEngineLifecycle) {
    NiceMock<MockMessageBus> bus;
    config_.mqtt_enabled = true;
    ON_CALL(bus, IsConnected()).WillByDefault(Return(true));
    EXPECT_CALL(bus, Connect()).Times(AtLeast(1)).WillRepeatedly(Return(true));
    EXPECT_CALL(bus, Disconnect()).Times(1);
    CreateEngine(&bus);

    EXPECT_EQ(engine_->Status()["publishing"]["enabled"], true);
    engine_->Start();
    EXPECT_EQ(engine_->Status()["publishing"]["running"], true);
    engine_->Stop();
    engine_.reset();
}

TEST_F(BridgeEngineTest, BusIgnoredWhenMqttDisabled) {
    NiceMock<MockMessageBus> bus;
    EXPECT_CALL(bus, Connect()).Times(0);
    CreateEngine(&bus);

    engine_->Start();
    engine_->Stop();
    EXPECT_EQ(engine_->Status()["publishing"]["enabled"], false);
    engine_.reset();
}
