#pragma once

#include <string>
#include <vector>

#include "types.hpp"

struct udev;

// Lists kernel devices fresh on every call, nothing is cached.
class DeviceEnumerator {
public:
    virtual ~DeviceEnumerator() = default;

    // USB devices (not interfaces), sorted by sysname.
    virtual std::vector<sysfs_device_t> usbDevices() = 0;
    virtual std::vector<sysfs_device_t> powerSupplies() = 0;
    virtual std::vector<sysfs_device_t> backlights() = 0;
    // evdev nodes with the name of the owning input device.
    virtual std::vector<input_device_t> inputDevices() = 0;
};

class UdevDeviceEnumerator : public DeviceEnumerator {
public:
    UdevDeviceEnumerator();
    ~UdevDeviceEnumerator() override;

    UdevDeviceEnumerator(const UdevDeviceEnumerator &) = delete;
    UdevDeviceEnumerator &operator=(const UdevDeviceEnumerator &) = delete;

    bool start();

    std::vector<sysfs_device_t> usbDevices() override;
    std::vector<sysfs_device_t> powerSupplies() override;
    std::vector<sysfs_device_t> backlights() override;
    std::vector<input_device_t> inputDevices() override;

private:
    std::vector<sysfs_device_t> scan(const char *subsystem, const char *devtype);

    struct udev *mUdev;
};
