#pragma once
#include <istream>
#include <string>
#include <unordered_map>

#include "types.hpp"

enum class settings_field {
    KERNEL_PATH,
    GRUB_ROOT,
    OUTPUT_DIR,
    INITRAMFS_NAME,
    BUILD_DIR,
    GRUB_CUSTOM,
    MIN_BATTERY,
    DISABLE_AUTOSUSPEND,
    ENABLE_LOGGING,
    LOG_FILE,
    SELECT_PORTS,
    LID_CONTROL,
    HANDLE_ACPI,
    EXTRA_MODULES,
    EXTRA_KERNEL_PARAMS,
    POLL_INTERVAL,
    USB_REFRESH_INTERVAL,
    STATUS_INTERVAL,
    SHUTDOWN_GRACE,
    SHUTDOWN_ACTION,
};

// Parses a SELECT_PORTS value: "all", "charging" or a list such as "1,2,4-5".
// Unusable lists fall back to ALL.
port_selection_t parse_port_selection(const std::string &value);

class SettingsHandler {
public:
    SettingsHandler();

    settings_t getSettings() const;
    const settings_t &getDefaultSettings() const;

    bool loadFile(const std::string &path);
    bool parse(std::istream &in);
    bool writeFile(const std::string &path) const;
    std::string serialize() const;

    bool setValue(const std::string &key, const std::string &value);
    bool setValue(settings_field field, const std::string &value);

private:
    bool applyField(settings_field field, const std::string &value);

    settings_t mDefaultSettings;
    settings_t mSettings;
    std::unordered_map<std::string, settings_field> mFieldNames;
};
