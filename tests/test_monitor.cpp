#include "gtest/gtest.h"
#include <deque>
#include <utility>
#include <sstream>

#include "../monitor.hpp"
#include "test_helpers.hpp"

namespace {

class ScriptedBattery : public BatteryReader {
public:
    explicit ScriptedBattery(std::deque<int> levels) : mLevels(std::move(levels)) {}
    int readCapacity() override {
        ++reads;
        if (mLevels.empty()) {
            return BATTERY_UNKNOWN;
        }
        const int level = mLevels.front();
        if (mLevels.size() > 1) {
            mLevels.pop_front();
        }
        return level;
    }
    int reads = 0;

private:
    std::deque<int> mLevels;
};

class ScriptedLid : public LidReader {
public:
    explicit ScriptedLid(std::deque<lid_state_t> states) : mStates(std::move(states)) {}
    lid_state_t readState() override {
        ++reads;
        const auto state = mStates.front();
        if (mStates.size() > 1) {
            mStates.pop_front();
        }
        return state;
    }
    int reads = 0;

private:
    std::deque<lid_state_t> mStates;
};

class CountingUsb : public UsbPower {
public:
    int apply() override { return ++applied; }
    int applied = 0;
};

class RecordingDisplay : public DisplayControl {
public:
    const char *name() const override { return "recording"; }
    bool powerOff() override { calls.push_back("off"); return succeed; }
    bool powerOn() override { calls.push_back("on"); return succeed; }
    std::vector<std::string> calls;
    bool succeed = true;
};

class RecordingPower : public PowerControl {
public:
    bool shutdown() override { ++requests; return true; }
    int requests = 0;
};

class MonitorTest : public ::testing::Test {
protected:
    MonitorTest()
        : settings(default_settings())
    {
        settings.min_battery = 10;
        settings.usb_refresh_interval = 0;
    }

    void run(BatteryReader &battery, LidReader &lid, int cycles) {
        StatusReporter status(settings, out);
        Monitor monitor(settings, battery, lid, usb, display, power, status);
        state = monitor.start(0);
        for (int i = 1; i <= cycles; ++i) {
            monitor.runCycle(state, i * settings.poll_interval, 1);
        }
    }

    settings_t settings;
    CountingUsb usb;
    RecordingDisplay display;
    RecordingPower power;
    std::stringstream out;
    loop_state_t state;
};

}

TEST_F(MonitorTest, ShutsDownOnceAtThreshold) {
    ScriptedBattery battery({ 15, 12, 9, 8 });
    ScriptedLid lid({ lid_state_t::OPEN });

    run(battery, lid, 5);

    EXPECT_EQ(state.state, monitor_state_t::SHUTDOWN);
    EXPECT_EQ(power.requests, 1);
    // Nothing is read after the shutdown decision.
    EXPECT_EQ(battery.reads, 3);
    EXPECT_NE(out.str().find("Battery level (9%) reached threshold (10%)"), std::string::npos);
}

TEST_F(MonitorTest, ThresholdZeroNeverShutsDown) {
    settings.min_battery = 0;
    ScriptedBattery battery({ 3, 0 });
    ScriptedLid lid({ lid_state_t::OPEN });

    run(battery, lid, 4);

    EXPECT_EQ(state.state, monitor_state_t::RUNNING);
    EXPECT_EQ(power.requests, 0);
}

TEST_F(MonitorTest, NoBatteryKeepsRunning) {
    ScriptedBattery battery(std::deque<int>{});
    ScriptedLid lid({ lid_state_t::OPEN });

    run(battery, lid, 3);

    EXPECT_EQ(state.state, monitor_state_t::RUNNING);
    EXPECT_EQ(power.requests, 0);
}

TEST_F(MonitorTest, LidSequenceTogglesDisplay) {
    ScriptedBattery battery({ 80 });
    ScriptedLid lid({ lid_state_t::OPEN, lid_state_t::CLOSED, lid_state_t::CLOSED,
                      lid_state_t::OPEN, lid_state_t::OPEN });

    run(battery, lid, 5);

    EXPECT_EQ(display.calls, std::vector<std::string>({ "off", "on" }));
    EXPECT_EQ(state.display, display_state_t::ON);
    EXPECT_EQ(state.previous_lid, lid_state_t::OPEN);
}

TEST_F(MonitorTest, LidControlDisabledLeavesDisplayAlone) {
    settings.lid_control = false;
    ScriptedBattery battery({ 80 });
    ScriptedLid lid({ lid_state_t::CLOSED });

    run(battery, lid, 3);

    EXPECT_EQ(lid.reads, 0);
    EXPECT_TRUE(display.calls.empty());
}

TEST_F(MonitorTest, FailedDisplayCallStillTracksState) {
    display.succeed = false;
    ScriptedBattery battery({ 80 });
    ScriptedLid lid({ lid_state_t::CLOSED });

    run(battery, lid, 3);

    // Off once on the change; the state follows the request.
    EXPECT_EQ(display.calls, std::vector<std::string>({ "off" }));
    EXPECT_EQ(state.display, display_state_t::OFF);
}

TEST_F(MonitorTest, UsbRefreshedEveryCycleByDefault) {
    ScriptedBattery battery({ 80 });
    ScriptedLid lid({ lid_state_t::OPEN });

    run(battery, lid, 4);

    // Once at start, once per cycle.
    EXPECT_EQ(usb.applied, 5);
}

TEST_F(MonitorTest, UsbRefreshHonoursInterval) {
    settings.usb_refresh_interval = 60;
    ScriptedBattery battery({ 80 });
    ScriptedLid lid({ lid_state_t::OPEN });

    // Cycles at 5..60 seconds: due only at 60.
    run(battery, lid, 12);

    EXPECT_EQ(usb.applied, 2);
}

TEST_F(MonitorTest, ShutdownCycleSkipsLidAndUsb) {
    ScriptedBattery battery({ 5 });
    ScriptedLid lid({ lid_state_t::CLOSED });

    run(battery, lid, 2);

    EXPECT_EQ(lid.reads, 0);
    EXPECT_EQ(usb.applied, 1);
    EXPECT_TRUE(display.calls.empty());
}

TEST_F(MonitorTest, LidWalkWithAllPorts) {
    settings.port_selection = { port_selection_mode_t::ALL, {} };
    ScriptedBattery battery({ 80 });
    ScriptedLid lid({ lid_state_t::OPEN, lid_state_t::OPEN, lid_state_t::CLOSED,
                      lid_state_t::CLOSED, lid_state_t::OPEN });

    StatusReporter status(settings, out);
    Monitor monitor(settings, battery, lid, usb, display, power, status);
    state = monitor.start(0);

    std::vector<display_state_t> seen;
    for (int i = 1; i <= 5; ++i) {
        monitor.runCycle(state, i * settings.poll_interval, 1);
        seen.push_back(state.display);
        EXPECT_EQ(usb.applied, i + 1);
    }

    EXPECT_EQ(seen, std::vector<display_state_t>({ display_state_t::ON, display_state_t::ON,
                                                   display_state_t::OFF, display_state_t::OFF,
                                                   display_state_t::ON }));
}
