#pragma once
#include <chrono>
#include <cstdint>
#include <vector>
#include <string>

using timestamp_t = uint32_t;

// Battery capacity value when no legible reading exists.
constexpr int BATTERY_UNKNOWN = -1;

typedef enum class lid_state {
    OPEN,
    CLOSED,
} lid_state_t;

typedef enum class display_state {
    ON,
    OFF,
} display_state_t;

typedef enum class port_selection_mode {
    ALL,
    CHARGING,
    LIST,
} port_selection_mode_t;

typedef enum class shutdown_action {
    POWEROFF,
    REBOOT,
} shutdown_action_t;

typedef struct {
    port_selection_mode_t mode;
    std::vector<int> ports;
} port_selection_t;

typedef struct {
    // Install time
    std::string kernel_path;
    std::string grub_root;
    std::string output_dir;
    std::string initramfs_name;
    std::string build_dir;
    std::string grub_custom;
    std::string extra_modules;
    std::string extra_kernel_params;

    // Monitor
    int min_battery;
    bool disable_autosuspend;
    bool enable_logging;
    std::string log_file;
    std::string select_ports;
    port_selection_t port_selection;
    bool lid_control;
    bool handle_acpi;
    int poll_interval;
    int usb_refresh_interval;
    int status_interval;
    int shutdown_grace;
    shutdown_action_t shutdown_action;
} settings_t;

typedef struct {
    std::string sysname;
    std::string syspath;
} sysfs_device_t;

typedef struct {
    std::string devnode;
    std::string name;
} input_device_t;
