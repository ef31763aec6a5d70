/**
 * @file test_discovery_engine.cpp
 * @brief Who-Is/I-Am 디스커버리 및 object-list 열거 테스트
 */

#include <gtest/gtest.h>

#include "Discovery/DiscoveryEngine.h"
#include "Discovery/ScopedIndicationCapture.h"
#include "Logging/LogManager.h"
#include "Registry/DeviceRegistry.h"
#include "helpers/FakeTransport.h"
#include "helpers/TempDir.h"

#include <atomic>
#include <stdexcept>

using namespace BacLink;
using namespace BacLink::Models;
using namespace std::chrono;
using BacLink::Discovery::DiscoveryEngine;
using BacLink::Discovery::DiscoveryState;
using BacLink::Discovery::ScopedIndicationCapture;
using BacLink::Testing::FakeTransport;
using BacLink::Testing::MakeIAm;
using BacLink::Testing::ReadCall;
using BacLink::Transport::ReadResult;
using BacLink::Transport::ServiceStatus;

class DiscoveryEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        LogManager::getInstance().setConsoleOutput(false);
        LogManager::getInstance().setFileOutput(false);
        registry_ = std::make_unique<Registry::DeviceRegistry>(dir_.File("devices.json"));
        engine_ = std::make_unique<DiscoveryEngine>(transport_, *registry_,
                                                    milliseconds(200));
    }

    void RegisterDevice(uint32_t id, const std::string &address = "10.0.0.10:47808") {
        Device device;
        device.device_id = id;
        device.address = address;
        registry_->AddOrMerge(device);
    }

    static std::optional<ReadResult> ObjectListIndex(const ReadCall &call,
                                                     uint32_t length,
                                                     uint32_t stop_at = 0) {
        if (call.property != "object-list") {
            return std::nullopt;
        }
        if (!call.array_index) {
            return ReadResult::Failure(ServiceStatus::BUFFER_OVERFLOW);
        }
        uint32_t index = *call.array_index;
        if (index == 0) {
            return ReadResult::Success(int64_t{length});
        }
        if (stop_at != 0 && index >= stop_at) {
            return ReadResult::Failure(ServiceStatus::INVALID_ARRAY_INDEX);
        }
        return ReadResult::Success(ObjectId("analog-value", index));
    }

    size_t CountIndexedObjectListReads() const {
        size_t count = 0;
        for (const auto &call : transport_.Reads()) {
            if (call.property == "object-list" && call.array_index && *call.array_index > 0) {
                ++count;
            }
        }
        return count;
    }

    Testing::TempDir dir_;
    FakeTransport transport_;
    std::unique_ptr<Registry::DeviceRegistry> registry_;
    std::unique_ptr<DiscoveryEngine> engine_;
};

// =============================================================================
// Who-Is / I-Am
// =============================================================================

TEST_F(DiscoveryEngineTest, NoResponsesWaitsFullWindow) {
    auto start = steady_clock::now();
    auto devices = engine_->Discover(std::nullopt, std::nullopt, milliseconds(60));
    auto elapsed = duration_cast<milliseconds>(steady_clock::now() - start);

    EXPECT_TRUE(devices.empty());
    EXPECT_GE(elapsed.count(), 50);
    EXPECT_EQ(transport_.who_is_count(), 1);
    EXPECT_EQ(engine_->GetState(), DiscoveryState::IDLE);
    EXPECT_FALSE(transport_.HasHandler());
}

TEST_F(DiscoveryEngineTest, ForwardsRangeLimits) {
    engine_->Discover(100u, 200u, milliseconds(10));
    ASSERT_TRUE(transport_.last_low().has_value());
    ASSERT_TRUE(transport_.last_high().has_value());
    EXPECT_EQ(*transport_.last_low(), 100u);
    EXPECT_EQ(*transport_.last_high(), 200u);

    engine_->Discover(std::nullopt, std::nullopt, milliseconds(10));
    EXPECT_FALSE(transport_.last_low().has_value());
    EXPECT_FALSE(transport_.last_high().has_value());
}

TEST_F(DiscoveryEngineTest, DuplicateResponsesProduceOneDevice) {
    transport_.QueueIAm(MakeIAm(100, "10.0.0.5:47808"));
    transport_.QueueIAm(MakeIAm(100, "10.0.0.6:47808", 260));
    transport_.SetValue(100, "device", 100, "object-name", std::string("AHU-1"));
    transport_.SetValue(100, "device", 100, "vendor-name", std::string("Acme Controls"));
    transport_.SetValue(100, "device", 100, "protocol-version", int64_t{1});
    transport_.SetValue(100, "device", 100, "protocol-revision", int64_t{14});

    auto devices = engine_->Discover(std::nullopt, std::nullopt, milliseconds(30));

    ASSERT_EQ(devices.size(), 1u);
    EXPECT_EQ(devices[0].device_id, 100u);
    EXPECT_EQ(devices[0].address, "10.0.0.6:47808");
    EXPECT_EQ(devices[0].device_name, "AHU-1");
    EXPECT_EQ(devices[0].vendor_name, "Acme Controls");
    EXPECT_EQ(devices[0].protocol_revision, 14);
    ASSERT_TRUE(devices[0].vendor_identifier.has_value());
    EXPECT_EQ(*devices[0].vendor_identifier, 260);
    EXPECT_EQ(registry_->Size(), 1u);

    // 식별 속성은 장치당 한 번씩만 읽는다
    EXPECT_EQ(transport_.CountReads(100, "device", 100, "object-name"), 1u);
}

TEST_F(DiscoveryEngineTest, MissingIdentificationKeepsDefaults) {
    transport_.QueueIAm(MakeIAm(7, "10.0.0.7:47808"));

    auto devices = engine_->Discover(std::nullopt, std::nullopt, milliseconds(20));

    ASSERT_EQ(devices.size(), 1u);
    EXPECT_TRUE(devices[0].device_name.empty());
    EXPECT_EQ(devices[0].protocol_version, 1);
    EXPECT_EQ(transport_.CountReads("object-name"),
              1u); // 실패한 속성도 재시도하지 않음
}

TEST_F(DiscoveryEngineTest, RediscoveryPreservesObjectsAndEnabledFlag) {
    RegisterDevice(55, "10.0.0.55:47808");
    BacnetObject object;
    object.object_type = "analog-input";
    object.object_instance = 1;
    registry_->AddObject(55, object);
    registry_->SetEnabled(55, false);

    transport_.QueueIAm(MakeIAm(55, "10.0.0.56:47808"));
    auto devices = engine_->Discover(std::nullopt, std::nullopt, milliseconds(20));

    ASSERT_EQ(devices.size(), 1u);
    EXPECT_EQ(devices[0].address, "10.0.0.56:47808");
    EXPECT_FALSE(devices[0].enabled);
    EXPECT_NE(devices[0].FindObject("analog-input", 1), nullptr);
}

TEST_F(DiscoveryEngineTest, WhoIsFailureReturnsEmptyAndRestoresHandler) {
    transport_.SetWhoIsResult(false);
    transport_.QueueIAm(MakeIAm(1, "10.0.0.1:47808"));

    auto devices = engine_->Discover(std::nullopt, std::nullopt, milliseconds(500));

    EXPECT_TRUE(devices.empty());
    EXPECT_EQ(registry_->Size(), 0u);
    EXPECT_FALSE(transport_.HasHandler());
    EXPECT_EQ(engine_->GetState(), DiscoveryState::IDLE);
}

TEST_F(DiscoveryEngineTest, CallbackSeesEachMergedDevice) {
    std::vector<uint32_t> seen;
    engine_->SetDiscoveryCallback([&](const Device &device) { seen.push_back(device.device_id); });
    transport_.QueueIAm(MakeIAm(3, "10.0.0.3:47808"));
    transport_.QueueIAm(MakeIAm(4, "10.0.0.4:47808"));

    engine_->Discover(std::nullopt, std::nullopt, milliseconds(20));

    ASSERT_EQ(seen.size(), 2u);
    EXPECT_EQ(seen[0], 3u);
    EXPECT_EQ(seen[1], 4u);
}

TEST_F(DiscoveryEngineTest, CallbackExceptionDoesNotLoseDevice) {
    engine_->SetDiscoveryCallback([](const Device &) { throw std::runtime_error("boom"); });
    transport_.QueueIAm(MakeIAm(9, "10.0.0.9:47808"));

    auto devices = engine_->Discover(std::nullopt, std::nullopt, milliseconds(20));
    EXPECT_EQ(devices.size(), 1u);
}

TEST_F(DiscoveryEngineTest, CancelEndsListeningEarly) {
    std::thread canceller([this] {
        std::this_thread::sleep_for(milliseconds(50));
        engine_->Cancel();
    });
    auto start = steady_clock::now();
    engine_->Discover(std::nullopt, std::nullopt, seconds(10));
    auto elapsed = steady_clock::now() - start;
    canceller.join();

    EXPECT_LT(elapsed, seconds(5));
}

TEST_F(DiscoveryEngineTest, ExistingHandlerIsChainedAndRestored) {
    std::atomic<int> received{0};
    transport_.SetIndicationHandler([&](const Transport::InboundMessage &) { ++received; });
    transport_.QueueIAm(MakeIAm(11, "10.0.0.11:47808"));

    engine_->Discover(std::nullopt, std::nullopt, milliseconds(20));
    EXPECT_EQ(received.load(), 1);

    Transport::InboundMessage later;
    later.source = "10.0.0.12:47808";
    transport_.Deliver(later);
    EXPECT_EQ(received.load(), 2);
}

TEST(ScopedIndicationCaptureTest, RestoresHandlerWhenScopeThrows) {
    FakeTransport transport;
    std::atomic<int> original{0};
    transport.SetIndicationHandler([&](const Transport::InboundMessage &) { ++original; });

    try {
        ScopedIndicationCapture capture(transport);
        throw std::runtime_error("abort discovery");
    } catch (const std::runtime_error &) {
    }

    Transport::InboundMessage message;
    message.i_am = MakeIAm(1, "10.0.0.1:47808");
    transport.Deliver(message);
    EXPECT_EQ(original.load(), 1);
}

TEST(ScopedIndicationCaptureTest, DrainCollectsOnlyIAms) {
    FakeTransport transport;
    ScopedIndicationCapture capture(transport);

    Transport::InboundMessage other;
    other.source = "10.0.0.2:47808";
    transport.Deliver(other);
    Transport::InboundMessage i_am;
    i_am.i_am = MakeIAm(2, "10.0.0.2:47808");
    transport.Deliver(i_am);

    auto items = capture.Drain();
    ASSERT_EQ(items.size(), 1u);
    EXPECT_EQ(items[0].device_id, 2u);
    EXPECT_TRUE(capture.Drain().empty());
}

// =============================================================================
// object-list 열거
// =============================================================================

TEST_F(DiscoveryEngineTest, EnumeratesWholeObjectListSkippingDeviceObject) {
    RegisterDevice(100);
    transport_.SetValue(100, "device", 100, "object-list",
                        std::vector<ObjectId>{ObjectId("device", 100),
                                              ObjectId("analog-input", 1),
                                              ObjectId("binary-value", 2)});
    transport_.SetValue(100, "analog-input", 1, "object-name", std::string("Zone Temp"));

    auto count = engine_->DiscoverDeviceObjects(100);

    ASSERT_TRUE(count.has_value());
    EXPECT_EQ(*count, 2u);
    auto device = registry_->Get(100);
    ASSERT_EQ(device->objects.size(), 2u);
    EXPECT_EQ(device->FindObject("analog-input", 1)->object_name, "Zone Temp");
    EXPECT_TRUE(device->FindObject("binary-value", 2)->object_name.empty());
    EXPECT_EQ(device->FindObject("device", 100), nullptr);
}

TEST_F(DiscoveryEngineTest, UnknownDeviceCannotBeEnumerated) {
    EXPECT_FALSE(engine_->DiscoverDeviceObjects(404).has_value());
}

TEST_F(DiscoveryEngineTest, ObjectListFailureReturnsNullopt) {
    RegisterDevice(100);
    transport_.SetRead(100, "device", 100, "object-list",
                       ReadResult::Failure(ServiceStatus::TIMEOUT));
    EXPECT_FALSE(engine_->DiscoverDeviceObjects(100).has_value());
    EXPECT_EQ(CountIndexedObjectListReads(), 0u);
}

TEST_F(DiscoveryEngineTest, OverflowFallsBackToIndexedReads) {
    RegisterDevice(100);
    transport_.SetReadHook([](const ReadCall &call) { return ObjectListIndex(call, 3); });

    auto count = engine_->DiscoverDeviceObjects(100);

    ASSERT_TRUE(count.has_value());
    EXPECT_EQ(*count, 3u);
    EXPECT_EQ(CountIndexedObjectListReads(), 3u);
    EXPECT_NE(registry_->Get(100)->FindObject("analog-value", 3), nullptr);
}

TEST_F(DiscoveryEngineTest, IndexedReadsAreCappedAt500) {
    RegisterDevice(100);
    transport_.SetReadHook([](const ReadCall &call) { return ObjectListIndex(call, 1000); });

    auto count = engine_->DiscoverDeviceObjects(100);

    ASSERT_TRUE(count.has_value());
    EXPECT_EQ(*count, DiscoveryEngine::kMaxIndexedObjects);
    EXPECT_EQ(CountIndexedObjectListReads(), 500u);
    EXPECT_EQ(registry_->Get(100)->FindObject("analog-value", 501), nullptr);
}

TEST_F(DiscoveryEngineTest, UnreadableLengthStopsAtInvalidIndex) {
    RegisterDevice(100);
    transport_.SetReadHook([](const ReadCall &call) -> std::optional<ReadResult> {
        if (call.property == "object-list" && call.array_index && *call.array_index == 0) {
            return ReadResult::Failure(ServiceStatus::COMMUNICATION_ERROR);
        }
        return ObjectListIndex(call, 0, 4);
    });

    auto count = engine_->DiscoverDeviceObjects(100);

    ASSERT_TRUE(count.has_value());
    EXPECT_EQ(*count, 3u);
    EXPECT_EQ(CountIndexedObjectListReads(), 4u);
}

TEST_F(DiscoveryEngineTest, TimeoutStopsIndexedEnumeration) {
    RegisterDevice(100);
    transport_.SetReadHook([](const ReadCall &call) -> std::optional<ReadResult> {
        if (call.property == "object-list" && call.array_index && *call.array_index == 2) {
            return ReadResult::Failure(ServiceStatus::TIMEOUT);
        }
        return ObjectListIndex(call, 10);
    });

    auto count = engine_->DiscoverDeviceObjects(100);

    ASSERT_TRUE(count.has_value());
    EXPECT_EQ(*count, 1u);
    EXPECT_EQ(CountIndexedObjectListReads(), 2u);
}

TEST_F(DiscoveryEngineTest, OtherElementErrorsAreSkipped) {
    RegisterDevice(100);
    transport_.SetReadHook([](const ReadCall &call) -> std::optional<ReadResult> {
        if (call.property == "object-list" && call.array_index && *call.array_index == 2) {
            return ReadResult::Failure(ServiceStatus::COMMUNICATION_ERROR);
        }
        return ObjectListIndex(call, 4);
    });

    auto count = engine_->DiscoverDeviceObjects(100);

    ASSERT_TRUE(count.has_value());
    EXPECT_EQ(*count, 3u);
    EXPECT_EQ(registry_->Get(100)->FindObject("analog-value", 2), nullptr);
}

TEST_F(DiscoveryEngineTest, CancelBeforeDiscoverIsKeptUntilReset) {
    transport_.QueueIAm(MakeIAm(100, "10.0.0.10:47808"));
    engine_->Cancel();

    auto start = steady_clock::now();
    auto devices = engine_->Discover(std::nullopt, std::nullopt, seconds(10));
    EXPECT_LT(steady_clock::now() - start, seconds(1));
    EXPECT_TRUE(devices.empty());
    EXPECT_EQ(transport_.who_is_count(), 0);
    EXPECT_TRUE(engine_->IsCancelled());

    engine_->ResetCancel();
    EXPECT_FALSE(engine_->IsCancelled());
    devices = engine_->Discover(std::nullopt, std::nullopt, milliseconds(100));
    ASSERT_EQ(devices.size(), 1u);
    EXPECT_EQ(devices[0].device_id, 100u);
}

TEST_F(DiscoveryEngineTest, CancelDuringObjectNameReadsReturnsPartialCount) {
    RegisterDevice(100);
    std::atomic<int> names_read{0};
    transport_.SetReadHook([this, &names_read](const ReadCall &call) -> std::optional<ReadResult> {
        if (call.property == "object-name") {
            if (++names_read == 3) {
                engine_->Cancel();
            }
            return ReadResult::Success(std::string("AV"));
        }
        return ObjectListIndex(call, 10);
    });

    auto count = engine_->DiscoverDeviceObjects(100);

    ASSERT_TRUE(count.has_value());
    EXPECT_EQ(*count, 3u);
    EXPECT_EQ(names_read.load(), 3);
    EXPECT_EQ(registry_->Get(100)->objects.size(), 3u);
}

TEST_F(DiscoveryEngineTest, CancelStopsIndexedObjectListReads) {
    RegisterDevice(100);
    transport_.SetReadHook([this](const ReadCall &call) -> std::optional<ReadResult> {
        if (call.property == "object-list" && call.array_index && *call.array_index == 4) {
            engine_->Cancel();
        }
        return ObjectListIndex(call, 400);
    });

    auto count = engine_->DiscoverDeviceObjects(100);

    ASSERT_TRUE(count.has_value());
    EXPECT_EQ(*count, 0u);
    EXPECT_EQ(CountIndexedObjectListReads(), 4u);
    EXPECT_EQ(transport_.CountReads("object-name"), 0u);
}
