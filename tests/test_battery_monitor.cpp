#include "gtest/gtest.h"

#include "../battery_monitor.hpp"
#include "test_helpers.hpp"

namespace {

sysfs_device_t make_supply(const TempDir &dir, const std::string &name,
                           const std::string &type, const std::string &capacity) {
    dir.write(name + "/type", type + "\n");
    if (!capacity.empty()) {
        dir.write(name + "/capacity", capacity + "\n");
    }
    return { name, dir.path() + "/" + name };
}

}

TEST(BatteryMonitor, ReadsFirstBattery) {
    TempDir dir;
    const std::vector<sysfs_device_t> supplies = {
        make_supply(dir, "AC", "Mains", ""),
        make_supply(dir, "BAT0", "Battery", "57"),
        make_supply(dir, "BAT1", "Battery", "90"),
    };

    EXPECT_EQ(read_battery_capacity(supplies), 57);
    EXPECT_TRUE(battery_present(supplies));
}

TEST(BatteryMonitor, BatNamesWinOverOtherBatteries) {
    TempDir dir;
    const std::vector<sysfs_device_t> supplies = {
        make_supply(dir, "hidpp_battery_0", "Battery", "40"),
        make_supply(dir, "BAT1", "Battery", "75"),
    };

    EXPECT_EQ(read_battery_capacity(supplies), 75);
}

TEST(BatteryMonitor, FallsBackToBatteryType) {
    TempDir dir;
    const std::vector<sysfs_device_t> supplies = {
        make_supply(dir, "CMB0", "Battery", "33"),
    };

    EXPECT_EQ(read_battery_capacity(supplies), 33);
}

TEST(BatteryMonitor, IllegibleCapacityIsUnknown) {
    TempDir dir;
    const std::vector<sysfs_device_t> supplies = {
        make_supply(dir, "BAT0", "Battery", "garbage"),
        make_supply(dir, "BAT1", "Battery", "250"),
        make_supply(dir, "BAT2", "Battery", ""),
    };

    EXPECT_EQ(read_battery_capacity(supplies), BATTERY_UNKNOWN);
}

TEST(BatteryMonitor, NoBattery) {
    TempDir dir;
    const std::vector<sysfs_device_t> supplies = { make_supply(dir, "AC", "Mains", "") };

    EXPECT_EQ(read_battery_capacity(supplies), BATTERY_UNKNOWN);
    EXPECT_FALSE(battery_present(supplies));
    EXPECT_EQ(read_battery_capacity({}), BATTERY_UNKNOWN);
}

TEST(BatteryMonitor, ReaderFollowsEnumerator) {
    TempDir dir;
    FakeDeviceEnumerator enumerator;
    BatteryMonitor monitor(enumerator);

    EXPECT_EQ(monitor.readCapacity(), BATTERY_UNKNOWN);

    enumerator.supplies = { make_supply(dir, "BAT0", "Battery", "12") };
    EXPECT_EQ(monitor.readCapacity(), 12);

    dir.write("BAT0/capacity", "11\n");
    EXPECT_EQ(monitor.readCapacity(), 11);
}
