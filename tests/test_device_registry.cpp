// =============================================================================
// Unit tests for DeviceRegistry (src/device_registry.hpp)
// =============================================================================
#include <gtest/gtest.h>
#include "device_registry.hpp"
#include "fake_process.hpp"

using namespace fleet;
using fleet::testing::FakeProcess;

// ===========================================================================
// parseDeviceList / parseUsableDevices
// ===========================================================================

TEST(DeviceRegistryTest, ParseSingleNetworkDevice) {
    auto devices = DeviceRegistry::parseUsableDevices(
        "List of devices attached\n127.0.0.1:5555\tdevice\n");
    ASSERT_EQ(devices.size(), 1u);
    EXPECT_EQ(devices[0].id, "127.0.0.1:5555");
    EXPECT_EQ(devices[0].status, DeviceRegistry::Status::Device);
    EXPECT_EQ(devices[0].status_text, "device");
}

TEST(DeviceRegistryTest, ParseMixedStatuses) {
    const std::string output =
        "List of devices attached\n"
        "R5CT123ABCD\tdevice\n"
        "emulator-5554\toffline\n"
        "192.168.1.50:5555\tunauthorized\n"
        "0123456789\tno permissions (user in plugdev group)\n"
        "192.168.1.51:5555\tdevice\n";

    auto all = DeviceRegistry::parseDeviceList(output);
    ASSERT_EQ(all.size(), 5u);
    EXPECT_EQ(all[1].status, DeviceRegistry::Status::Offline);
    EXPECT_EQ(all[2].status, DeviceRegistry::Status::Unauthorized);
    EXPECT_EQ(all[3].status, DeviceRegistry::Status::NoPermissions);

    auto usable = DeviceRegistry::parseUsableDevices(output);
    ASSERT_EQ(usable.size(), 2u);
    EXPECT_EQ(usable[0].id, "R5CT123ABCD");
    EXPECT_EQ(usable[1].id, "192.168.1.51:5555");
}

TEST(DeviceRegistryTest, ParseSkipsCommentsBlankAndMalformed) {
    const std::string output =
        "* daemon not running; starting now at tcp:5037\n"
        "List of devices attached\n"
        "* daemon started successfully\n"
        "\n"
        "   \n"
        "no-tab-here device\n"
        "abc\tdevice\n";

    // First line is always the header, whatever it says
    auto usable = DeviceRegistry::parseUsableDevices(output);
    ASSERT_EQ(usable.size(), 1u);
    EXPECT_EQ(usable[0].id, "abc");
}

TEST(DeviceRegistryTest, ParseHandlesCrLfAndExtraColumns) {
    auto devices = DeviceRegistry::parseUsableDevices(
        "List of devices attached\r\nabc\tdevice\tproduct:x model:y\r\n");
    ASSERT_EQ(devices.size(), 1u);
    EXPECT_EQ(devices[0].id, "abc");
    EXPECT_EQ(devices[0].status_text, "device");
}

TEST(DeviceRegistryTest, ParseEmptyAndHeaderOnly) {
    EXPECT_TRUE(DeviceRegistry::parseDeviceList("").empty());
    EXPECT_TRUE(DeviceRegistry::parseDeviceList("List of devices attached\n").empty());
}

TEST(DeviceRegistryTest, StatusNames) {
    EXPECT_STREQ(DeviceRegistry::statusName(DeviceRegistry::Status::Device), "device");
    EXPECT_EQ(DeviceRegistry::parseStatus("bootloader"), DeviceRegistry::Status::Bootloader);
    EXPECT_EQ(DeviceRegistry::parseStatus("weird"), DeviceRegistry::Status::Unknown);
}

// ===========================================================================
// listDevices / isUsable
// ===========================================================================

TEST(DeviceRegistryTest, ListDevicesScenario) {
    FakeProcess fake;
    fake.onOk("adb devices", "List of devices attached\n127.0.0.1:5555\tdevice\n");
    CommandRunner runner("adb", fake.launcher());
    DeviceRegistry registry(runner);

    auto devices = registry.listDevices();
    ASSERT_EQ(devices.size(), 1u);
    EXPECT_EQ(devices[0].id, "127.0.0.1:5555");
    EXPECT_TRUE(devices[0].usable());
}

TEST(DeviceRegistryTest, ListDevicesEmptyOnBridgeFailure) {
    FakeProcess fake;
    fake.onFail("adb devices", "cannot connect to daemon");
    CommandRunner runner("adb", fake.launcher());
    DeviceRegistry registry(runner);

    EXPECT_TRUE(registry.listDevices().empty());
}

TEST(DeviceRegistryTest, ListDevicesEmptyWithoutBridge) {
    FakeProcess fake;
    CommandRunner runner("", fake.launcher());
    DeviceRegistry registry(runner);

    EXPECT_TRUE(registry.listDevices().empty());
    EXPECT_EQ(fake.callCount(), 0u);
}

TEST(DeviceRegistryTest, ListDevicesEmptyOnTimeout) {
    FakeProcess fake;
    fake.onTimeout("adb devices");
    CommandRunner runner("adb", fake.launcher());
    DeviceRegistry registry(runner);

    EXPECT_TRUE(registry.listDevices().empty());
}

TEST(DeviceRegistryTest, IsUsableRequiresDeviceStatus) {
    FakeProcess fake;
    fake.onOk("adb devices", "List of devices attached\nabc\tdevice\nxyz\tunauthorized\n");
    CommandRunner runner("adb", fake.launcher());
    DeviceRegistry registry(runner);

    EXPECT_TRUE(registry.isUsable("abc"));
    EXPECT_FALSE(registry.isUsable("xyz"));
    EXPECT_FALSE(registry.isUsable("nope"));
    // Each query re-enumerates
    EXPECT_EQ(fake.countCalls("adb devices"), 3u);
}

// ===========================================================================
// getDeviceInfo
// ===========================================================================

TEST(DeviceRegistryTest, DeviceInfoAllFields) {
    FakeProcess fake;
    fake.onOk("getprop ro.product.model", "Pixel 7\n");
    fake.onOk("getprop ro.build.version.release", "14\n");
    fake.onOk("getprop ro.product.brand", "google\n");
    CommandRunner runner("adb", fake.launcher());
    DeviceRegistry registry(runner);

    auto info = registry.getDeviceInfo("abc");
    EXPECT_EQ(info.model.value_or(""), "Pixel 7");
    EXPECT_EQ(info.android_version.value_or(""), "14");
    EXPECT_EQ(info.brand.value_or(""), "google");
    EXPECT_EQ(fake.calls()[0], "adb -s abc shell getprop ro.product.model");
}

TEST(DeviceRegistryTest, DeviceInfoFieldsAreIndependent) {
    FakeProcess fake;
    fake.onOk("getprop ro.product.model", "Pixel 7");
    fake.onTimeout("getprop ro.build.version.release");
    fake.onOk("getprop ro.product.brand", "google");
    CommandRunner runner("adb", fake.launcher());
    DeviceRegistry registry(runner);

    auto info = registry.getDeviceInfo("abc");
    EXPECT_TRUE(info.model.has_value());
    EXPECT_FALSE(info.android_version.has_value());
    EXPECT_TRUE(info.brand.has_value());
    EXPECT_EQ(fake.callCount(), 3u);
}

TEST(DeviceRegistryTest, DeviceInfoRejectsUnsafeId) {
    FakeProcess fake;
    CommandRunner runner("adb", fake.launcher());
    DeviceRegistry registry(runner);

    auto info = registry.getDeviceInfo("abc; reboot");
    EXPECT_FALSE(info.model.has_value());
    EXPECT_FALSE(info.android_version.has_value());
    EXPECT_FALSE(info.brand.has_value());
    EXPECT_EQ(fake.callCount(), 0u);
}
