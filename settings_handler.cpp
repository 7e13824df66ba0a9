#include "settings_handler.hpp"
#include "utils.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

#include "log.hpp"

namespace {

bool parse_bool(const std::string &value, bool &out) {
    const auto v = to_lower(value);
    if (v == "1" || v == "true" || v == "yes") {
        out = true;
        return true;
    }
    if (v == "0" || v == "false" || v == "no") {
        out = false;
        return true;
    }
    return false;
}

bool parse_int(const std::string &value, int min, int max, int &out) {
    std::stringstream ss(value);
    int v = 0;
    ss >> v;
    if (ss.fail() || !ss.eof() || v < min || v > max) {
        return false;
    }
    out = v;
    return true;
}

// Removes a trailing '#' comment that is not inside quotes.
std::string strip_comment(const std::string &line) {
    char quote = 0;
    for (size_t i = 0; i < line.size(); ++i) {
        const char c = line[i];
        if (quote) {
            if (c == quote) {
                quote = 0;
            }
        } else if (c == '"' || c == '\'') {
            quote = c;
        } else if (c == '#') {
            return line.substr(0, i);
        }
    }
    return line;
}

std::string unquote(const std::string &value) {
    if (value.size() >= 2 &&
        (value.front() == '"' || value.front() == '\'') &&
        value.back() == value.front()) {
        return value.substr(1, value.size() - 2);
    }
    return value;
}

bool parse_port_token(const std::string &token, std::vector<int> &ports) {
    const auto dash = token.find('-');
    int first = 0;
    int last = 0;
    if (dash == std::string::npos) {
        if (!parse_int(token, 1, 127, first)) {
            return false;
        }
        last = first;
    } else if (!parse_int(trim(token.substr(0, dash)), 1, 127, first) ||
               !parse_int(trim(token.substr(dash + 1)), 1, 127, last) ||
               last < first) {
        return false;
    }
    for (int p = first; p <= last; ++p) {
        ports.push_back(p);
    }
    return true;
}

const char *shutdown_action_name(shutdown_action_t action) {
    return action == shutdown_action_t::REBOOT ? "reboot" : "poweroff";
}

}

port_selection_t parse_port_selection(const std::string &value) {
    port_selection_t selection { port_selection_mode_t::ALL, {} };
    const auto v = to_lower(trim(value));
    if (v.empty() || v == "all") {
        return selection;
    }
    if (v == "charging") {
        selection.mode = port_selection_mode_t::CHARGING;
        return selection;
    }

    for (const auto &token : split(v, ',')) {
        if (!parse_port_token(token, selection.ports)) {
            LOG_WARNING("Ignoring invalid USB port '%s' in SELECT_PORTS", token.c_str());
        }
    }
    std::sort(selection.ports.begin(), selection.ports.end());
    selection.ports.erase(std::unique(selection.ports.begin(), selection.ports.end()),
                          selection.ports.end());

    if (selection.ports.empty()) {
        LOG_WARNING("SELECT_PORTS '%s' names no usable port, powering all ports", value.c_str());
        selection.mode = port_selection_mode_t::ALL;
        return selection;
    }
    selection.mode = port_selection_mode_t::LIST;
    return selection;
}

SettingsHandler::SettingsHandler()
: mDefaultSettings{}
, mSettings{}
, mFieldNames{
    {"KERNEL_PATH", settings_field::KERNEL_PATH},
    {"GRUB_ROOT", settings_field::GRUB_ROOT},
    {"OUTPUT_DIR", settings_field::OUTPUT_DIR},
    {"INITRAMFS_NAME", settings_field::INITRAMFS_NAME},
    {"BUILD_DIR", settings_field::BUILD_DIR},
    {"GRUB_CUSTOM", settings_field::GRUB_CUSTOM},
    {"MIN_BATTERY", settings_field::MIN_BATTERY},
    {"DISABLE_AUTOSUSPEND", settings_field::DISABLE_AUTOSUSPEND},
    {"ENABLE_LOGGING", settings_field::ENABLE_LOGGING},
    {"LOG_FILE", settings_field::LOG_FILE},
    {"SELECT_PORTS", settings_field::SELECT_PORTS},
    {"LID_CONTROL", settings_field::LID_CONTROL},
    {"HANDLE_ACPI", settings_field::HANDLE_ACPI},
    {"EXTRA_MODULES", settings_field::EXTRA_MODULES},
    {"EXTRA_KERNEL_PARAMS", settings_field::EXTRA_KERNEL_PARAMS},
    {"POLL_INTERVAL", settings_field::POLL_INTERVAL},
    {"USB_REFRESH_INTERVAL", settings_field::USB_REFRESH_INTERVAL},
    {"STATUS_INTERVAL", settings_field::STATUS_INTERVAL},
    {"SHUTDOWN_GRACE", settings_field::SHUTDOWN_GRACE},
    {"SHUTDOWN_ACTION", settings_field::SHUTDOWN_ACTION},
}
{
    mDefaultSettings.kernel_path = "/boot/vmlinuz-linux";
    mDefaultSettings.grub_root = "hd0,1";
    mDefaultSettings.output_dir = "/boot";
    mDefaultSettings.initramfs_name = "grubpower-initramfs.img";
    mDefaultSettings.build_dir = "/tmp/grubpower_build";
    mDefaultSettings.grub_custom = "/etc/grub.d/40_custom";
    mDefaultSettings.extra_modules = "";
    mDefaultSettings.extra_kernel_params = "";
    mDefaultSettings.min_battery = 10;
    mDefaultSettings.disable_autosuspend = true;
    mDefaultSettings.enable_logging = false;
    mDefaultSettings.log_file = "/var/log/grubpower.log";
    mDefaultSettings.select_ports = "all";
    mDefaultSettings.port_selection = { port_selection_mode_t::ALL, {} };
    mDefaultSettings.lid_control = true;
    mDefaultSettings.handle_acpi = true;
    mDefaultSettings.poll_interval = 5;
    mDefaultSettings.usb_refresh_interval = 0;
    mDefaultSettings.status_interval = 300;
    mDefaultSettings.shutdown_grace = 5;
    mDefaultSettings.shutdown_action = shutdown_action_t::POWEROFF;

    mSettings = mDefaultSettings;
}

settings_t
SettingsHandler::getSettings() const {
    return mSettings;
}

const settings_t &
SettingsHandler::getDefaultSettings() const {
    return mDefaultSettings;
}

bool
SettingsHandler::loadFile(const std::string &path) {
    std::ifstream in(path);
    if (!in.good()) {
        LOG_WARNING("Could not open configuration '%s', using defaults.", path.c_str());
        return false;
    }
    LOG_DEBUG("Loading configuration from '%s'", path.c_str());
    return parse(in);
}

bool
SettingsHandler::parse(std::istream &in) {
    bool all_valid = true;
    std::string raw;
    int line_number = 0;
    while (std::getline(in, raw)) {
        ++line_number;
        const auto line = trim(strip_comment(raw));
        if (line.empty()) {
            continue;
        }
        const auto eq = line.find('=');
        if (eq == std::string::npos) {
            LOG_WARNING("Configuration line %d has no '=': '%s'", line_number, line.c_str());
            all_valid = false;
            continue;
        }
        auto key = trim(line.substr(0, eq));
        if (key.rfind("export ", 0) == 0) {
            key = trim(key.substr(7));
        }
        const auto value = unquote(trim(line.substr(eq + 1)));
        if (!setValue(key, value)) {
            all_valid = false;
        }
    }
    return all_valid;
}

bool
SettingsHandler::setValue(const std::string &key, const std::string &value) {
    const auto f = mFieldNames.find(key);
    if (f == mFieldNames.end()) {
        LOG_WARNING("Ignoring unknown configuration key '%s'", key.c_str());
        return false;
    }
    return setValue(f->second, value);
}

bool
SettingsHandler::setValue(settings_field field, const std::string &value) {
    if (!applyField(field, value)) {
        for (const auto &n : mFieldNames) {
            if (n.second == field) {
                LOG_WARNING("Invalid value '%s' for %s, keeping previous value.",
                        value.c_str(), n.first.c_str());
                break;
            }
        }
        return false;
    }
    return true;
}

bool
SettingsHandler::applyField(settings_field field, const std::string &value) {
    switch (field) {
        case settings_field::KERNEL_PATH:
            mSettings.kernel_path = value;
            return true;

        case settings_field::GRUB_ROOT:
            mSettings.grub_root = value;
            return true;

        case settings_field::OUTPUT_DIR:
            mSettings.output_dir = value;
            return true;

        case settings_field::INITRAMFS_NAME:
            if (value.empty() || value.find('/') != std::string::npos) {
                return false;
            }
            mSettings.initramfs_name = value;
            return true;

        case settings_field::BUILD_DIR:
            if (value.empty() || value == "/") {
                return false;
            }
            mSettings.build_dir = value;
            return true;

        case settings_field::GRUB_CUSTOM:
            mSettings.grub_custom = value;
            return true;

        case settings_field::MIN_BATTERY:
            return parse_int(value, 0, 100, mSettings.min_battery);

        case settings_field::DISABLE_AUTOSUSPEND:
            return parse_bool(value, mSettings.disable_autosuspend);

        case settings_field::ENABLE_LOGGING:
            return parse_bool(value, mSettings.enable_logging);

        case settings_field::LOG_FILE:
            if (value.empty()) {
                return false;
            }
            mSettings.log_file = value;
            return true;

        case settings_field::SELECT_PORTS:
            mSettings.port_selection = parse_port_selection(value);
            if (mSettings.port_selection.mode == port_selection_mode_t::ALL) {
                mSettings.select_ports = "all";
            } else {
                mSettings.select_ports = value;
            }
            return true;

        case settings_field::LID_CONTROL:
            return parse_bool(value, mSettings.lid_control);

        case settings_field::HANDLE_ACPI:
            return parse_bool(value, mSettings.handle_acpi);

        case settings_field::EXTRA_MODULES:
            mSettings.extra_modules = value;
            return true;

        case settings_field::EXTRA_KERNEL_PARAMS:
            mSettings.extra_kernel_params = value;
            return true;

        case settings_field::POLL_INTERVAL:
            return parse_int(value, 1, 3600, mSettings.poll_interval);

        case settings_field::USB_REFRESH_INTERVAL:
            return parse_int(value, 0, 86400, mSettings.usb_refresh_interval);

        case settings_field::STATUS_INTERVAL:
            return parse_int(value, 1, 86400, mSettings.status_interval);

        case settings_field::SHUTDOWN_GRACE:
            return parse_int(value, 0, 600, mSettings.shutdown_grace);

        case settings_field::SHUTDOWN_ACTION:
        {
            const auto v = to_lower(value);
            if (v == "poweroff") {
                mSettings.shutdown_action = shutdown_action_t::POWEROFF;
            } else if (v == "reboot") {
                mSettings.shutdown_action = shutdown_action_t::REBOOT;
            } else {
                return false;
            }
            return true;
        }
    }

    LOG_ERROR("Settings field not handled.");
    return false;
}

std::string
SettingsHandler::serialize() const {
    const auto &s = mSettings;
    std::stringstream ss;
    ss << "# GrubPower Configuration File\n"
       << "\n"
       << "# System paths\n"
       << "KERNEL_PATH=\"" << s.kernel_path << "\"\n"
       << "GRUB_ROOT=\"" << s.grub_root << "\"\n"
       << "OUTPUT_DIR=\"" << s.output_dir << "\"\n"
       << "INITRAMFS_NAME=\"" << s.initramfs_name << "\"\n"
       << "BUILD_DIR=\"" << s.build_dir << "\"\n"
       << "GRUB_CUSTOM=\"" << s.grub_custom << "\"\n"
       << "\n"
       << "# Power management settings\n"
       << "MIN_BATTERY=" << s.min_battery << "\n"
       << "DISABLE_AUTOSUSPEND=" << (s.disable_autosuspend ? 1 : 0) << "\n"
       << "ENABLE_LOGGING=" << (s.enable_logging ? 1 : 0) << "\n"
       << "LOG_FILE=\"" << s.log_file << "\"\n"
       << "\n"
       << "# USB port selection (all, charging, 1,2 or 1-2)\n"
       << "SELECT_PORTS=\"" << s.select_ports << "\"\n"
       << "\n"
       << "# Lid control settings\n"
       << "LID_CONTROL=" << (s.lid_control ? 1 : 0) << "        # Enable lid detection and display control\n"
       << "HANDLE_ACPI=" << (s.handle_acpi ? 1 : 0) << "        # Handle ACPI events (lid, power button)\n"
       << "\n"
       << "# Additional kernel modules to load (space-separated)\n"
       << "EXTRA_MODULES=\"" << s.extra_modules << "\"\n"
       << "\n"
       << "# Additional kernel parameters\n"
       << "EXTRA_KERNEL_PARAMS=\"" << s.extra_kernel_params << "\"\n"
       << "\n"
       << "# Monitor timing (seconds). USB_REFRESH_INTERVAL=0 refreshes every cycle.\n"
       << "POLL_INTERVAL=" << s.poll_interval << "\n"
       << "USB_REFRESH_INTERVAL=" << s.usb_refresh_interval << "\n"
       << "STATUS_INTERVAL=" << s.status_interval << "\n"
       << "SHUTDOWN_GRACE=" << s.shutdown_grace << "\n"
       << "\n"
       << "# Action on low battery (poweroff, reboot)\n"
       << "SHUTDOWN_ACTION=" << shutdown_action_name(s.shutdown_action) << "\n";
    return ss.str();
}

bool
SettingsHandler::writeFile(const std::string &path) const {
    std::ofstream out(path);
    if (!out.good()) {
        LOG_ERROR("Could not write configuration '%s': '%s' (%d)",
                path.c_str(), strerror(errno), errno);
        return false;
    }
    out << serialize();
    out.flush();
    if (!out.good()) {
        LOG_ERROR("Failed writing configuration '%s'", path.c_str());
        return false;
    }
    return true;
}
