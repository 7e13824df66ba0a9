#include "gtest/gtest.h"
#include <sstream>

#include "../status_reporter.hpp"
#include "test_helpers.hpp"


TEST(StatusReporter, StatusDueOncePerWindow) {
    EXPECT_TRUE(status_due(600, 300, 5));
    EXPECT_TRUE(status_due(604, 300, 5));
    EXPECT_FALSE(status_due(605, 300, 5));
    EXPECT_FALSE(status_due(899, 300, 5));
    EXPECT_FALSE(status_due(600, 0, 5));
}

TEST(StatusReporter, BatteryReportedOnlyWhenDue) {
    auto settings = default_settings();
    std::stringstream out;
    StatusReporter status(settings, out);

    EXPECT_FALSE(status.reportBattery(601, 50));
    EXPECT_TRUE(out.str().empty());

    EXPECT_TRUE(status.reportBattery(900, 50));
    EXPECT_EQ(out.str(), "Battery level: 50%\n");

    EXPECT_FALSE(status.reportBattery(1200, BATTERY_UNKNOWN));
}

TEST(StatusReporter, BannerShowsThreshold) {
    auto settings = default_settings();
    std::stringstream out;
    StatusReporter(settings, out).printBanner();
    EXPECT_NE(out.str().find("GrubPower Advanced USB Mode Activated"), std::string::npos);
    EXPECT_NE(out.str().find("Auto-shutdown at: 10% battery"), std::string::npos);

    settings.min_battery = 0;
    std::stringstream disabled;
    StatusReporter(settings, disabled).printBanner();
    EXPECT_NE(disabled.str().find("Auto-shutdown: disabled"), std::string::npos);
}

TEST(StatusReporter, ListsUsbDevices) {
    TempDir dir;
    dir.write("1-1/manufacturer", "Logitech\n");
    dir.write("1-1/product", "USB Receiver\n");
    dir.write("1-1/power/control", "on\n");
    FakeDeviceEnumerator enumerator;
    enumerator.usb = { { "1-1", dir.path() + "/1-1" } };

    std::stringstream out;
    StatusReporter(default_settings(), out).listUsbDevices(enumerator);

    EXPECT_NE(out.str().find("USB Device 1-1: Logitech USB Receiver"), std::string::npos);
    EXPECT_NE(out.str().find("  - Power: on"), std::string::npos);
}
