#pragma once

#include <ctime>

#include "types.hpp"
#include "state_handler.hpp"
#include "battery_monitor.hpp"
#include "lid_sensor.hpp"
#include "usb_power.hpp"
#include "display_control.hpp"
#include "power_control.hpp"
#include "status_reporter.hpp"

// Carried from one cycle to the next by the caller.
typedef struct {
    monitor_state_t state;
    lid_state_t previous_lid;
    display_state_t display;
    timestamp_t last_usb_refresh;
} loop_state_t;

class Monitor {
public:
    Monitor(const settings_t &settings,
            BatteryReader &battery,
            LidReader &lid,
            UsbPower &usb,
            DisplayControl &display,
            PowerControl &power,
            StatusReporter &status);

    // Powers the selected USB devices and returns the initial loop state.
    loop_state_t start(timestamp_t now);

    // One poll: battery threshold, lid/display, USB refresh.
    void runCycle(loop_state_t &state, timestamp_t now, time_t wallclock);

private:
    void checkBattery(loop_state_t &state, time_t wallclock);
    void checkLid(loop_state_t &state);
    void applyDisplayAction(loop_state_t &state, display_action_t action);

    settings_t mSettings;
    BatteryReader &mBattery;
    LidReader &mLid;
    UsbPower &mUsb;
    DisplayControl &mDisplay;
    PowerControl &mPower;
    StatusReporter &mStatus;
};
