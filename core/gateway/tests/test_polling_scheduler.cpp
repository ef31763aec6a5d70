/**
 * @file test_polling_scheduler.cpp
 * @brief 폴링 주기, 장치별 타임아웃 격리, 루프 수명 주기 테스트
 */

#include <gtest/gtest.h>

#include "Logging/LogManager.h"
#include "Polling/PollingScheduler.h"
#include "Registry/DeviceRegistry.h"
#include "helpers/FakeTransport.h"
#include "helpers/TempDir.h"

using namespace BacLink;
using namespace BacLink::Models;
using namespace std::chrono;
using BacLink::Polling::CapabilityPoller;
using BacLink::Polling::CycleReport;
using BacLink::Polling::PollerOptions;
using BacLink::Polling::PollingScheduler;
using BacLink::Polling::SchedulerOptions;
using BacLink::Testing::FakeTransport;

class PollingSchedulerTest : public ::testing::Test {
protected:
    void SetUp() override {
        LogManager::getInstance().setConsoleOutput(false);
        LogManager::getInstance().setFileOutput(false);
        registry_ = std::make_unique<Registry::DeviceRegistry>(dir_.File("devices.json"));

        PollerOptions poller_options;
        poller_options.read_timeout = seconds(1);
        poller_ = std::make_unique<CapabilityPoller>(transport_, *registry_, poller_options);
    }

    void AddDevice(uint32_t id, int objects) {
        Device device;
        device.device_id = id;
        device.address = "10.0.0." + std::to_string(id) + ":47808";
        registry_->AddOrMerge(device);
        for (int i = 1; i <= objects; ++i) {
            BacnetObject object;
            object.object_type = "binary-input";
            object.object_instance = static_cast<uint32_t>(i);
            registry_->AddObject(id, object);
            transport_.SetValue(id, "binary-input", static_cast<uint32_t>(i), "present-value",
                                true);
        }
    }

    std::unique_ptr<PollingScheduler> MakeScheduler(milliseconds interval,
                                                    milliseconds device_timeout) {
        SchedulerOptions options;
        options.interval = interval;
        options.device_timeout = device_timeout;
        options.properties = {"present-value"};
        return std::make_unique<PollingScheduler>(*poller_, *registry_, options);
    }

    Testing::TempDir dir_;
    FakeTransport transport_;
    std::unique_ptr<Registry::DeviceRegistry> registry_;
    std::unique_ptr<CapabilityPoller> poller_;
};

TEST_F(PollingSchedulerTest, CyclePollsEnabledDevicesAndPersists) {
    AddDevice(1, 2);
    AddDevice(2, 2);
    registry_->SetEnabled(2, false);
    auto scheduler = MakeScheduler(seconds(60), seconds(5));

    CycleReport report = scheduler->RunCycle();

    EXPECT_EQ(report.devices, 1u);
    EXPECT_EQ(report.completed, 1u);
    EXPECT_EQ(report.timed_out, 0u);
    EXPECT_TRUE(report.persisted);
    EXPECT_EQ(scheduler->GetCycleCount(), 1u);
    EXPECT_EQ(transport_.CountReads(2, "binary-input", 1, "present-value"), 0u);
    EXPECT_TRUE(std::filesystem::exists(dir_.File("devices.json")));
}

TEST_F(PollingSchedulerTest, SlowDeviceDoesNotStarveOthers) {
    AddDevice(1, 5);
    AddDevice(2, 3);
    transport_.SetDeviceDelay(1, milliseconds(400));
    auto scheduler = MakeScheduler(seconds(60), milliseconds(100));

    auto start = steady_clock::now();
    CycleReport report = scheduler->RunCycle();
    auto elapsed = steady_clock::now() - start;

    EXPECT_EQ(report.devices, 2u);
    EXPECT_EQ(report.timed_out, 1u);
    EXPECT_EQ(report.completed, 1u);
    EXPECT_LT(elapsed, milliseconds(1000));

    auto fast = registry_->Get(2);
    ASSERT_TRUE(fast.has_value());
    EXPECT_NE(fast->FindObject("binary-input", 3)->FindProperty("present-value"), nullptr);
    // 타임아웃은 unsupported 로 학습되지 않는다
    EXPECT_FALSE(registry_->IsUnsupported(1, ObjectId("binary-input", 1), "present-value"));
}

TEST_F(PollingSchedulerTest, EmptyRegistryCycleStillCounts) {
    auto scheduler = MakeScheduler(seconds(60), seconds(1));
    CycleReport report = scheduler->RunCycle();
    EXPECT_EQ(report.devices, 0u);
    EXPECT_EQ(scheduler->GetCycleCount(), 1u);
}

TEST_F(PollingSchedulerTest, LoopRunsUntilStopped) {
    AddDevice(1, 1);
    auto scheduler = MakeScheduler(milliseconds(20), seconds(1));

    scheduler->Start();
    scheduler->Start();
    EXPECT_TRUE(scheduler->IsRunning());

    auto deadline = steady_clock::now() + seconds(5);
    while (scheduler->GetCycleCount() < 3 && steady_clock::now() < deadline) {
        std::this_thread::sleep_for(milliseconds(5));
    }
    scheduler->Stop();

    EXPECT_FALSE(scheduler->IsRunning());
    EXPECT_GE(scheduler->GetCycleCount(), 3u);
    const uint64_t cycles = scheduler->GetCycleCount();
    std::this_thread::sleep_for(milliseconds(60));
    EXPECT_EQ(scheduler->GetCycleCount(), cycles);

    scheduler->Stop();
}

TEST_F(PollingSchedulerTest, StopInterruptsLongInterval) {
    auto scheduler = MakeScheduler(seconds(60), seconds(1));
    scheduler->Start();

    auto deadline = steady_clock::now() + seconds(5);
    while (scheduler->GetCycleCount() < 1 && steady_clock::now() < deadline) {
        std::this_thread::sleep_for(milliseconds(5));
    }

    auto start = steady_clock::now();
    scheduler->Stop();
    EXPECT_LT(steady_clock::now() - start, seconds(2));
}
