#pragma once
#include "types.hpp"

typedef enum class monitor_state {
    RUNNING,
    SHUTDOWN,
} monitor_state_t;

typedef enum class display_action {
    NONE,
    POWER_OFF,
    POWER_ON,
} display_action_t;

// SHUTDOWN is terminal.
monitor_state_t get_new_state(const monitor_state_t current_state,
        const settings_t &settings,
        const int battery_capacity);

display_action_t get_display_action(const lid_state_t previous_lid,
        const lid_state_t current_lid,
        const display_state_t display);

bool usb_refresh_due(const settings_t &settings,
        const timestamp_t last_refresh,
        const timestamp_t now);
