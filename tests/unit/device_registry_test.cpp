#include "registry/device_registry.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "events/event_emitter.hpp"
#include "mocks/fake_device_enumerator.hpp"

using namespace lcdlink;
using namespace lcdlink::tests;

class DeviceRegistryTest : public ::testing::Test {
protected:
    void SetUp() override {
        emitter = std::make_shared<events::EventEmitter>();
        subscription = emitter->subscribe(events::EventFilter::all(), 100, "test");
        registry = std::make_unique<registry::DeviceRegistry>(enumerator, emitter, registry::DeviceFilter{},
                                                              std::chrono::milliseconds(20));
    }

    void TearDown() override { registry.reset(); }

    // Drains queued events into type names
    std::vector<std::string> drain_events() {
        std::vector<std::string> names;
        while (auto evt = subscription->try_pop()) {
            names.emplace_back(events::event_type_name(*evt));
        }
        return names;
    }

    FakeDeviceEnumerator enumerator;
    std::shared_ptr<events::EventEmitter> emitter;
    std::unique_ptr<events::Subscription> subscription;
    std::unique_ptr<registry::DeviceRegistry> registry;
};

TEST_F(DeviceRegistryTest, RefreshAttachesMatchingDevices) {
    enumerator.plug("/dev/hidraw0", "SN0");
    enumerator.plug("/dev/hidraw1", "SN1");
    enumerator.plug("/dev/hidraw9", "OTHER", 0x1234, 0x5678);

    ASSERT_TRUE(registry->refresh());

    EXPECT_EQ(registry->device_count(), 2u);
    auto devices = registry->get_active_devices();
    ASSERT_EQ(devices.size(), 2u);
    EXPECT_EQ(devices[0]->path(), "/dev/hidraw0");
    EXPECT_EQ(devices[1]->path(), "/dev/hidraw1");
    EXPECT_EQ(devices[0]->identity().serial_number, "SN0");
    EXPECT_EQ(registry->get_device("/dev/hidraw9"), nullptr);

    auto names = drain_events();
    EXPECT_EQ(names, (std::vector<std::string>{"DeviceAttached", "DeviceAttached"}));
}

TEST_F(DeviceRegistryTest, AttachEventCarriesIdentity) {
    enumerator.plug("/dev/hidraw3", "ABC123");
    ASSERT_TRUE(registry->refresh());

    auto evt = subscription->try_pop();
    ASSERT_TRUE(evt.has_value());
    const auto &attached = std::get<events::DeviceAttachedEvent>(*evt);
    EXPECT_EQ(attached.path, "/dev/hidraw3");
    EXPECT_EQ(attached.serial_number, "ABC123");
    EXPECT_EQ(attached.product, "Fake LCD");
    EXPECT_GT(attached.timestamp_ms, 0);
}

TEST_F(DeviceRegistryTest, RepeatedRefreshDoesNotDuplicate) {
    enumerator.plug("/dev/hidraw0", "SN0");

    ASSERT_TRUE(registry->refresh());
    auto first = registry->get_device("/dev/hidraw0");
    ASSERT_TRUE(registry->refresh());
    ASSERT_TRUE(registry->refresh());

    EXPECT_EQ(registry->device_count(), 1u);
    EXPECT_EQ(registry->get_device("/dev/hidraw0"), first);
    EXPECT_EQ(enumerator.open_count(), 1);
    EXPECT_EQ(drain_events().size(), 1u);
}

TEST_F(DeviceRegistryTest, DuplicateListingOpensOnce) {
    enumerator.set_duplicate_listing(true);
    enumerator.plug("/dev/hidraw0", "SN0");

    ASSERT_TRUE(registry->refresh());

    EXPECT_EQ(registry->device_count(), 1u);
    EXPECT_EQ(enumerator.open_count(), 1);
}

TEST_F(DeviceRegistryTest, UnplugDetachesAndInvalidatesHandle) {
    enumerator.plug("/dev/hidraw0", "SN0");
    enumerator.plug("/dev/hidraw1", "SN1");
    ASSERT_TRUE(registry->refresh());
    auto handle = registry->get_device("/dev/hidraw0");
    ASSERT_NE(handle, nullptr);
    drain_events();

    enumerator.unplug("/dev/hidraw0");
    ASSERT_TRUE(registry->refresh());

    EXPECT_EQ(registry->device_count(), 1u);
    EXPECT_EQ(registry->get_device("/dev/hidraw0"), nullptr);
    EXPECT_FALSE(handle->is_valid());

    auto evt = subscription->try_pop();
    ASSERT_TRUE(evt.has_value());
    const auto &detached = std::get<events::DeviceDetachedEvent>(*evt);
    EXPECT_EQ(detached.path, "/dev/hidraw0");
    EXPECT_EQ(detached.serial_number, "SN0");
}

TEST_F(DeviceRegistryTest, ReplugYieldsFreshHandle) {
    enumerator.plug("/dev/hidraw0", "SN0");
    ASSERT_TRUE(registry->refresh());
    auto old_handle = registry->get_device("/dev/hidraw0");

    enumerator.unplug("/dev/hidraw0");
    ASSERT_TRUE(registry->refresh());
    enumerator.plug("/dev/hidraw4", "SN0");
    ASSERT_TRUE(registry->refresh());

    auto new_handle = registry->get_device("/dev/hidraw4");
    ASSERT_NE(new_handle, nullptr);
    EXPECT_NE(new_handle, old_handle);
    EXPECT_TRUE(new_handle->is_valid());
    EXPECT_EQ(new_handle->identity().storage_key(), old_handle->identity().storage_key());
    EXPECT_EQ(drain_events(),
              (std::vector<std::string>{"DeviceAttached", "DeviceDetached", "DeviceAttached"}));
}

TEST_F(DeviceRegistryTest, EnumerationFailureKeepsDevices) {
    enumerator.plug("/dev/hidraw0", "SN0");
    ASSERT_TRUE(registry->refresh());
    drain_events();

    enumerator.set_enumerate_fails(true);
    EXPECT_FALSE(registry->refresh());
    EXPECT_NE(registry->last_error().find("enumeration failed"), std::string::npos);
    EXPECT_EQ(registry->device_count(), 1u);
    EXPECT_TRUE(drain_events().empty());
}

TEST_F(DeviceRegistryTest, OpenFailureReportedOnceAndRetried) {
    enumerator.plug("/dev/hidraw0", "SN0");
    enumerator.set_open_fails("/dev/hidraw0", true);

    ASSERT_TRUE(registry->refresh());
    ASSERT_TRUE(registry->refresh());

    EXPECT_EQ(registry->device_count(), 0u);
    EXPECT_EQ(enumerator.open_count(), 2);
    EXPECT_EQ(drain_events(), (std::vector<std::string>{"DeviceError"}));

    enumerator.set_open_fails("/dev/hidraw0", false);
    ASSERT_TRUE(registry->refresh());
    EXPECT_EQ(registry->device_count(), 1u);
    EXPECT_EQ(drain_events(), (std::vector<std::string>{"DeviceAttached"}));
}

TEST_F(DeviceRegistryTest, ReportErrorKeepsDeviceRegistered) {
    enumerator.plug("/dev/hidraw0", "SN0");
    ASSERT_TRUE(registry->refresh());
    drain_events();

    registry->report_error("/dev/hidraw0", "command timed out");

    EXPECT_EQ(registry->device_count(), 1u);
    EXPECT_TRUE(registry->get_device("/dev/hidraw0")->is_valid());

    auto evt = subscription->try_pop();
    ASSERT_TRUE(evt.has_value());
    const auto &error = std::get<events::DeviceErrorEvent>(*evt);
    EXPECT_EQ(error.path, "/dev/hidraw0");
    EXPECT_EQ(error.message, "command timed out");
}

TEST_F(DeviceRegistryTest, RemoveDeviceDetachesThenReopens) {
    enumerator.plug("/dev/hidraw0", "SN0");
    ASSERT_TRUE(registry->refresh());
    auto first = registry->get_device("/dev/hidraw0");
    drain_events();

    EXPECT_TRUE(registry->remove_device("/dev/hidraw0"));
    EXPECT_FALSE(registry->remove_device("/dev/hidraw0"));
    EXPECT_FALSE(first->is_valid());
    EXPECT_EQ(registry->device_count(), 0u);
    EXPECT_EQ(drain_events(), (std::vector<std::string>{"DeviceDetached"}));

    ASSERT_TRUE(registry->refresh());
    auto second = registry->get_device("/dev/hidraw0");
    ASSERT_NE(second, nullptr);
    EXPECT_NE(second, first);
    EXPECT_EQ(enumerator.open_count(), 2);
}

TEST_F(DeviceRegistryTest, StartStopMonitoringIsIdempotent) {
    enumerator.plug("/dev/hidraw0", "SN0");

    EXPECT_TRUE(registry->start_monitoring());
    EXPECT_TRUE(registry->start_monitoring());
    EXPECT_TRUE(registry->is_monitoring());

    // Initial enumeration is synchronous
    EXPECT_EQ(registry->device_count(), 1u);
    auto handle = registry->get_device("/dev/hidraw0");

    registry->stop_monitoring();
    registry->stop_monitoring();
    EXPECT_FALSE(registry->is_monitoring());
    EXPECT_EQ(registry->device_count(), 0u);
    EXPECT_FALSE(handle->is_valid());

    // Stopping closes handles without detach events
    EXPECT_EQ(drain_events(), (std::vector<std::string>{"DeviceAttached"}));
}

TEST_F(DeviceRegistryTest, MonitorPicksUpHotplug) {
    ASSERT_TRUE(registry->start_monitoring());
    EXPECT_EQ(registry->device_count(), 0u);

    enumerator.plug("/dev/hidraw2", "SN2");

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
    while (registry->device_count() == 0 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    EXPECT_EQ(registry->device_count(), 1u);

    enumerator.unplug("/dev/hidraw2");
    deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
    while (registry->device_count() == 1 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    EXPECT_EQ(registry->device_count(), 0u);

    registry->stop_monitoring();
}

TEST(DeviceRegistryNoEmitterTest, WorksWithoutEmitter) {
    FakeDeviceEnumerator enumerator;
    enumerator.plug("/dev/hidraw0");
    registry::DeviceRegistry registry(enumerator, nullptr);

    ASSERT_TRUE(registry.refresh());
    EXPECT_EQ(registry.device_count(), 1u);
    registry.report_error("/dev/hidraw0", "ignored");
    EXPECT_TRUE(registry.remove_device("/dev/hidraw0"));
}
