#include "usb_power.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

#include "utils.hpp"
#include "log.hpp"

namespace {

const char kAutosuspendParam[] = "/sys/module/usbcore/parameters/autosuspend";

typedef enum class attr_result {
    MISSING,
    UNCHANGED,
    WRITTEN,
    FAILED,
} attr_result_t;

// Writes value unless the attribute already holds it.
attr_result_t set_attribute(const std::string &path, const std::string &value) {
    if (!file_exists(path)) {
        return attr_result_t::MISSING;
    }
    if (get_line_from_file(path) == value) {
        return attr_result_t::UNCHANGED;
    }
    if (!write_value_to_file(path, value)) {
        LOG_DEBUG("usb: could not write '%s' to %s", value.c_str(), path.c_str());
        return attr_result_t::FAILED;
    }
    LOG_DEBUG("usb: set %s to '%s'", path.c_str(), value.c_str());
    return attr_result_t::WRITTEN;
}

// Approximation: USB2 LPM U1 support is taken as a hint for a charging port.
bool looks_like_charging_port(const sysfs_device_t &device) {
    const auto lpm = to_lower(get_line_from_file(device.syspath + "/power/usb2_hardware_lpm_u1"));
    return lpm == "1" || lpm == "enabled";
}

}

int usb_bus_number(const std::string &sysname) {
    std::string digits;
    if (sysname.rfind("usb", 0) == 0) {
        digits = sysname.substr(3);
    } else {
        const auto dash = sysname.find('-');
        if (dash == std::string::npos) {
            return -1;
        }
        digits = sysname.substr(0, dash);
    }
    if (digits.empty() || digits.size() > 3 ||
        !std::all_of(digits.begin(), digits.end(), [](unsigned char c){ return std::isdigit(c); })) {
        return -1;
    }
    return std::stoi(digits);
}

bool usb_device_selected(const port_selection_t &selection, const sysfs_device_t &device) {
    switch (selection.mode) {
        case port_selection_mode_t::ALL:
            return true;

        case port_selection_mode_t::CHARGING:
            return looks_like_charging_port(device);

        case port_selection_mode_t::LIST:
        {
            const int bus = usb_bus_number(device.sysname);
            return std::find(selection.ports.begin(), selection.ports.end(), bus)
                != selection.ports.end();
        }
    }
    return false;
}

int probe_usb_power_control(const std::vector<sysfs_device_t> &devices) {
    int success = 0;
    for (const auto &d : devices) {
        const auto control = d.syspath + "/power/control";
        if (!file_exists(control)) {
            continue;
        }
        const auto original = get_line_from_file(control);
        if (!write_value_to_file(control, "on")) {
            LOG_DEBUG("usb: %s rejects power control", d.sysname.c_str());
            continue;
        }
        if (get_line_from_file(control) == "on") {
            ++success;
            LOG_DEBUG("usb: %s accepts power control", d.sysname.c_str());
        }
        if (!original.empty() && !write_value_to_file(control, original)) {
            LOG_WARNING("usb: could not restore %s to '%s'", control.c_str(), original.c_str());
        }
    }
    return success;
}


UsbPowerEnabler::UsbPowerEnabler(const settings_t &settings, DeviceEnumerator &enumerator)
: UsbPowerEnabler(settings, enumerator, kAutosuspendParam)
{
}

UsbPowerEnabler::UsbPowerEnabler(const settings_t &settings, DeviceEnumerator &enumerator,
                                 std::string autosuspend_param)
: mSettings(settings)
, mEnumerator(enumerator)
, mAutosuspendParam(std::move(autosuspend_param))
{
}

bool
UsbPowerEnabler::powerOn(const sysfs_device_t &device) {
    const auto power = device.syspath + "/power/";

    const auto control = set_attribute(power + "control", "on");
    if (control == attr_result_t::WRITTEN) {
        LOG_INFO("Set power control on for %s", device.sysname.c_str());
    }
    // Kernels before 2.6.32
    (void)set_attribute(power + "level", "on");

    return control == attr_result_t::WRITTEN || control == attr_result_t::UNCHANGED;
}

void
UsbPowerEnabler::disableAutosuspend(const sysfs_device_t &device) {
    const auto power = device.syspath + "/power/";
    (void)set_attribute(power + "autosuspend", "-1");
    (void)set_attribute(power + "autosuspend_delay_ms", "-1");
    (void)set_attribute(power + "wakeup", "enabled");
}

int
UsbPowerEnabler::apply() {
    if (mSettings.disable_autosuspend) {
        (void)set_attribute(mAutosuspendParam, "-1");
    }

    int powered = 0;
    for (const auto &device : mEnumerator.usbDevices()) {
        // Autosuspend is off on every device, power control only on selected ones.
        if (mSettings.disable_autosuspend) {
            disableAutosuspend(device);
        }
        if (!usb_device_selected(mSettings.port_selection, device)) {
            continue;
        }
        if (powerOn(device)) {
            ++powered;
        }
    }
    LOG_DEBUG("usb: %d selected device(s) powered", powered);
    return powered;
}
