#include "state_handler.hpp"

#include "log.hpp"


monitor_state_t get_new_state(const monitor_state_t current_state,
        const settings_t &settings,
        const int battery_capacity) {

    if (current_state == monitor_state_t::SHUTDOWN) {
        return monitor_state_t::SHUTDOWN;
    }

    if (settings.min_battery > 0 && battery_capacity != BATTERY_UNKNOWN &&
        battery_capacity <= settings.min_battery) {
        LOG_WARNING("Battery level (%d%%) reached threshold (%d%%), will perform shutdown.",
                battery_capacity, settings.min_battery);
        return monitor_state_t::SHUTDOWN;
    }

    return monitor_state_t::RUNNING;
}

display_action_t get_display_action(const lid_state_t previous_lid,
        const lid_state_t current_lid,
        const display_state_t display) {

    if (current_lid != previous_lid) {
        return current_lid == lid_state_t::CLOSED ? display_action_t::POWER_OFF
                                                  : display_action_t::POWER_ON;
    }

    // Something lit the panel again while the lid stayed closed.
    if (current_lid == lid_state_t::CLOSED && display == display_state_t::ON) {
        return display_action_t::POWER_OFF;
    }

    return display_action_t::NONE;
}

bool usb_refresh_due(const settings_t &settings,
        const timestamp_t last_refresh,
        const timestamp_t now) {
    if (settings.usb_refresh_interval <= 0) {
        return true;
    }
    return now - last_refresh >= static_cast<timestamp_t>(settings.usb_refresh_interval);
}
