#include "monitor.hpp"

#include "log.hpp"

Monitor::Monitor(const settings_t &settings,
                 BatteryReader &battery,
                 LidReader &lid,
                 UsbPower &usb,
                 DisplayControl &display,
                 PowerControl &power,
                 StatusReporter &status)
: mSettings(settings)
, mBattery(battery)
, mLid(lid)
, mUsb(usb)
, mDisplay(display)
, mPower(power)
, mStatus(status)
{
}

loop_state_t
Monitor::start(timestamp_t now) {
    LOG_INFO("Configuring USB power management (ports: %s, autosuspend %s)",
            mSettings.select_ports.c_str(),
            mSettings.disable_autosuspend ? "disabled" : "unchanged");
    const int powered = mUsb.apply();
    LOG_INFO("%d USB device(s) powered.", powered);

    return {
        .state = monitor_state_t::RUNNING,
        .previous_lid = lid_state_t::OPEN,
        .display = display_state_t::ON,
        .last_usb_refresh = now,
    };
}

void
Monitor::runCycle(loop_state_t &state, timestamp_t now, time_t wallclock) {
    if (state.state == monitor_state_t::SHUTDOWN) {
        return;
    }

    checkBattery(state, wallclock);
    if (state.state == monitor_state_t::SHUTDOWN) {
        return;
    }

    if (mSettings.lid_control) {
        checkLid(state);
    }

    if (usb_refresh_due(mSettings, state.last_usb_refresh, now)) {
        const int powered = mUsb.apply();
        LOG_DEBUG("USB power refreshed, %d device(s) on.", powered);
        state.last_usb_refresh = now;
    }
}

void
Monitor::checkBattery(loop_state_t &state, time_t wallclock) {
    const int capacity = mBattery.readCapacity();
    const auto new_state = get_new_state(state.state, mSettings, capacity);

    if (new_state == monitor_state_t::SHUTDOWN) {
        state.state = new_state;
        mStatus.reportShutdown(capacity);
        if (!mPower.shutdown()) {
            LOG_ERROR("Shutdown request failed, staying idle.");
        }
        return;
    }

    (void)mStatus.reportBattery(wallclock, capacity);
}

void
Monitor::checkLid(loop_state_t &state) {
    const lid_state_t current = mLid.readState();
    const auto action = get_display_action(state.previous_lid, current, state.display);

    if (current != state.previous_lid) {
        LOG_INFO("Lid %s, turning %s display...",
                current == lid_state_t::CLOSED ? "closed" : "opened",
                current == lid_state_t::CLOSED ? "off" : "on");
    }
    applyDisplayAction(state, action);
    state.previous_lid = current;
}

void
Monitor::applyDisplayAction(loop_state_t &state, display_action_t action) {
    switch (action) {
        case display_action_t::NONE:
            return;

        case display_action_t::POWER_OFF:
            if (!mDisplay.powerOff()) {
                LOG_WARNING("Display power off via %s failed.", mDisplay.name());
            }
            state.display = display_state_t::OFF;
            return;

        case display_action_t::POWER_ON:
            if (!mDisplay.powerOn()) {
                LOG_WARNING("Display power on via %s failed.", mDisplay.name());
            }
            state.display = display_state_t::ON;
            return;
    }
}
