// =============================================================================
// Unit tests for ConnectionController (src/connection_controller.hpp)
// =============================================================================
#include <gtest/gtest.h>
#include "connection_controller.hpp"
#include "fake_process.hpp"

using namespace fleet;
using fleet::testing::FakeProcess;

namespace {

struct ConnectFixture : public ::testing::Test {
    FakeProcess fake;
    CommandRunner runner{"adb", fake.launcher()};
    DeviceRegistry registry{runner};
    ConnectionController controller{runner, registry};
};

} // namespace

// ===========================================================================
// connect: conclusive output
// ===========================================================================

TEST_F(ConnectFixture, ConnectedToIsSuccess) {
    fake.onOk("adb connect", "connected to 192.168.1.50:5555");

    CommandResult r = controller.connect("192.168.1.50:5555");
    EXPECT_TRUE(r.success);
    EXPECT_EQ(r.outputText(), "connected to 192.168.1.50:5555");
    EXPECT_EQ(fake.calls()[0], "adb connect 192.168.1.50:5555");
    EXPECT_EQ(fake.countCalls("adb devices"), 0u);
}

TEST_F(ConnectFixture, AlreadyConnectedIsSuccess) {
    fake.onOk("adb connect", "Already Connected To 192.168.1.50:5555");

    EXPECT_TRUE(controller.connect("192.168.1.50:5555").success);
}

TEST_F(ConnectFixture, CannotConnectGivesFixedMessage) {
    fake.onOk("adb connect", "cannot connect to 192.168.1.50:5555: Connection refused (111)");

    CommandResult r = controller.connect("192.168.1.50:5555");
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.errorText(), kConnectFailedMessage);
    EXPECT_EQ(r.kind, ErrorKind::ExecutionFailure);
    EXPECT_EQ(fake.countCalls("adb devices"), 0u);
}

TEST_F(ConnectFixture, FailedToConnectGivesFixedMessage) {
    fake.onOk("adb connect", "FAILED TO CONNECT to '192.168.1.50:5555': timeout");

    CommandResult r = controller.connect("192.168.1.50:5555");
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.errorText(), kConnectFailedMessage);
}

TEST_F(ConnectFixture, RunnerFailurePropagates) {
    fake.onTimeout("adb connect");

    CommandResult r = controller.connect("192.168.1.50:5555");
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.errorText(), kTimedOutError);
    EXPECT_EQ(r.kind, ErrorKind::ExecutionTimeout);
    EXPECT_EQ(fake.countCalls("adb devices"), 0u);
}

TEST_F(ConnectFixture, RejectsUnsafeAddress) {
    CommandResult r = controller.connect("1.2.3.4:5555; reboot");
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.kind, ErrorKind::ValidationFailure);
    EXPECT_EQ(fake.callCount(), 0u);
}

// ===========================================================================
// connect: ambiguous output resolved through the device list
// ===========================================================================

TEST_F(ConnectFixture, AmbiguousOutputVerifiedByDeviceList) {
    fake.onOk("adb connect", "");
    fake.onOk("adb devices", "List of devices attached\n192.168.1.50:5555\tdevice\n");

    CommandResult r = controller.connect("192.168.1.50:5555");
    EXPECT_TRUE(r.success);
    EXPECT_EQ(fake.countCalls("adb devices"), 1u);
}

TEST_F(ConnectFixture, AmbiguousOutputWithoutDeviceFails) {
    fake.onOk("adb connect", "* daemon started successfully");
    fake.onOk("adb devices", "List of devices attached\nR5CT123ABCD\tdevice\n");

    CommandResult r = controller.connect("192.168.1.50:5555");
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.errorText(), kConnectFailedMessage);
    EXPECT_EQ(r.kind, ErrorKind::AmbiguousOutcome);
}

TEST_F(ConnectFixture, AmbiguousOutputIgnoresLongerAddress) {
    fake.onOk("adb connect", "");
    fake.onOk("adb devices", "List of devices attached\n192.168.1.50:5555\tdevice\n");

    EXPECT_FALSE(controller.connect("192.168.1.5:5555").success);
}

TEST_F(ConnectFixture, AmbiguousOutputIgnoresUnusableEntry) {
    fake.onOk("adb connect", "");
    fake.onOk("adb devices", "List of devices attached\n192.168.1.50:5555\toffline\n");

    EXPECT_FALSE(controller.connect("192.168.1.50:5555").success);
}

TEST_F(ConnectFixture, AmbiguousOutputEnumerationFailureFails) {
    fake.onOk("adb connect", "");
    fake.onFail("adb devices", "daemon died");

    CommandResult r = controller.connect("192.168.1.50:5555");
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.errorText(), kConnectFailedMessage);
}

TEST(ConnectionControllerTest, IdMatchesAddress) {
    EXPECT_TRUE(ConnectionController::idMatchesAddress("192.168.1.50:5555", "192.168.1.50:5555"));
    EXPECT_TRUE(ConnectionController::idMatchesAddress("192.168.1.50:5555", "192.168.1.50"));
    EXPECT_FALSE(ConnectionController::idMatchesAddress("192.168.1.50:5555", "192.168.1.5:5555"));
    EXPECT_FALSE(ConnectionController::idMatchesAddress("192.168.1.50:5555", "192.168.1.5"));
    EXPECT_FALSE(ConnectionController::idMatchesAddress("192.168.1.50:5556", "192.168.1.50:5555"));
}

// ===========================================================================
// disconnect
// ===========================================================================

TEST_F(ConnectFixture, DisconnectPassesThrough) {
    fake.onOk("adb disconnect", "disconnected 192.168.1.50:5555");

    CommandResult r = controller.disconnect("192.168.1.50:5555");
    EXPECT_TRUE(r.success);
    EXPECT_EQ(fake.calls()[0], "adb disconnect 192.168.1.50:5555");
    EXPECT_EQ(fake.callCount(), 1u);
}

TEST_F(ConnectFixture, DisconnectFailurePassesThrough) {
    fake.onFail("adb disconnect", "error: no such device '192.168.1.50:5555'");

    CommandResult r = controller.disconnect("192.168.1.50:5555");
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.errorText(), "error: no such device '192.168.1.50:5555'");
    EXPECT_EQ(fake.countCalls("adb devices"), 0u);
}

// ===========================================================================
// normalizeConnectAddress
// ===========================================================================

TEST(ConnectAddressTest, AppendsDefaultPort) {
    auto r = normalizeConnectAddress("192.168.1.50");
    ASSERT_TRUE(r);
    EXPECT_EQ(r.value(), "192.168.1.50:5555");
}

TEST(ConnectAddressTest, KeepsExplicitPort) {
    auto r = normalizeConnectAddress(" 192.168.1.50:5556 ");
    ASSERT_TRUE(r);
    EXPECT_EQ(r.value(), "192.168.1.50:5556");
}

TEST(ConnectAddressTest, CustomDefaultPort) {
    EXPECT_EQ(normalizeConnectAddress("10.0.0.2", 40000).value(), "10.0.0.2:40000");
}

TEST(ConnectAddressTest, LanPrefixShorthand) {
    EXPECT_EQ(normalizeConnectAddress("1.50", 5555, "192.168.").value(), "192.168.1.50:5555");
    // Full addresses are left alone
    EXPECT_EQ(normalizeConnectAddress("10.0.0.2", 5555, "192.168.").value(), "10.0.0.2:5555");
    // No prefix configured: shorthand is taken literally
    EXPECT_EQ(normalizeConnectAddress("1.50").value(), "1.50:5555");
}

TEST(ConnectAddressTest, RejectsBadInput) {
    EXPECT_FALSE(normalizeConnectAddress(""));
    EXPECT_FALSE(normalizeConnectAddress("192.168.1.50:abc"));
    EXPECT_FALSE(normalizeConnectAddress("192.168.1.50:"));
    auto r = normalizeConnectAddress("host;reboot");
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().kind, ErrorKind::ValidationFailure);
}
