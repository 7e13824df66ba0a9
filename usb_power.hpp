#pragma once

#include <string>
#include <vector>

#include "types.hpp"
#include "device_enumerator.hpp"

class UsbPower {
public:
    virtual ~UsbPower() = default;
    // Returns the number of selected devices left powered on.
    virtual int apply() = 0;
};

// Bus number of a USB device sysname ("usb3" or "3-1.2"), -1 if none.
int usb_bus_number(const std::string &sysname);

bool usb_device_selected(const port_selection_t &selection, const sysfs_device_t &device);

// Writes "on" to each power/control, checks it stuck, restores the original.
// Returns the number of devices that accepted the value.
int probe_usb_power_control(const std::vector<sysfs_device_t> &devices);

class UsbPowerEnabler : public UsbPower {
public:
    UsbPowerEnabler(const settings_t &settings, DeviceEnumerator &enumerator);
    UsbPowerEnabler(const settings_t &settings, DeviceEnumerator &enumerator,
                    std::string autosuspend_param);

    int apply() override;

private:
    bool powerOn(const sysfs_device_t &device);
    void disableAutosuspend(const sysfs_device_t &device);

    settings_t mSettings;
    DeviceEnumerator &mEnumerator;
    std::string mAutosuspendParam;
};
