#include "device_enumerator.hpp"

#include <algorithm>
#include <string.h>
#include <errno.h>
#include <libudev.h>

#include "log.hpp"

namespace {

bool by_sysname(const sysfs_device_t &a, const sysfs_device_t &b) {
    return a.sysname < b.sysname;
}

}

UdevDeviceEnumerator::UdevDeviceEnumerator()
: mUdev(nullptr)
{
}

UdevDeviceEnumerator::~UdevDeviceEnumerator() {
    if (mUdev) {
        udev_unref(mUdev);
    }
}

bool
UdevDeviceEnumerator::start() {
    mUdev = udev_new();
    if (!mUdev) {
        LOG_ERROR("enumerator: Can't create udev context: '%s' (%d)", strerror(errno), errno);
        return false;
    }
    return true;
}

std::vector<sysfs_device_t>
UdevDeviceEnumerator::scan(const char *subsystem, const char *devtype) {
    std::vector<sysfs_device_t> devices;
    if (!mUdev) {
        return devices;
    }

    auto enumerate = udev_enumerate_new(mUdev);
    if (!enumerate) {
        LOG_ERROR("enumerator: udev_enumerate_new failed for %s", subsystem);
        return devices;
    }
    int r = udev_enumerate_add_match_subsystem(enumerate, subsystem);
    if (r >= 0 && devtype) {
        r = udev_enumerate_add_match_property(enumerate, "DEVTYPE", devtype);
    }
    if (r < 0) {
        LOG_ERROR("enumerator: Can't filter on %s: '%s'", subsystem, strerror(-r));
        udev_enumerate_unref(enumerate);
        return devices;
    }

    r = udev_enumerate_scan_devices(enumerate);
    if (r < 0) {
        LOG_WARNING("enumerator: Scanning %s failed: '%s'", subsystem, strerror(-r));
        udev_enumerate_unref(enumerate);
        return devices;
    }

    struct udev_list_entry *entry;
    udev_list_entry_foreach(entry, udev_enumerate_get_list_entry(enumerate)) {
        const char *syspath = udev_list_entry_get_name(entry);
        auto dev = udev_device_new_from_syspath(mUdev, syspath);
        if (!dev) {
            continue;
        }
        const char *sysname = udev_device_get_sysname(dev);
        devices.push_back({ sysname ? sysname : "", syspath });
        udev_device_unref(dev);
    }
    udev_enumerate_unref(enumerate);

    std::sort(devices.begin(), devices.end(), by_sysname);
    return devices;
}

std::vector<sysfs_device_t>
UdevDeviceEnumerator::usbDevices() {
    return scan("usb", "usb_device");
}

std::vector<sysfs_device_t>
UdevDeviceEnumerator::powerSupplies() {
    return scan("power_supply", nullptr);
}

std::vector<sysfs_device_t>
UdevDeviceEnumerator::backlights() {
    return scan("backlight", nullptr);
}

std::vector<input_device_t>
UdevDeviceEnumerator::inputDevices() {
    std::vector<input_device_t> inputs;
    if (!mUdev) {
        return inputs;
    }

    for (const auto &d : scan("input", nullptr)) {
        if (d.sysname.rfind("event", 0) != 0) {
            continue;
        }
        auto dev = udev_device_new_from_syspath(mUdev, d.syspath.c_str());
        if (!dev) {
            continue;
        }
        const char *devnode = udev_device_get_devnode(dev);
        // The name attribute lives on the parent inputN device.
        auto parent = udev_device_get_parent_with_subsystem_devtype(dev, "input", nullptr);
        const char *name = parent ? udev_device_get_sysattr_value(parent, "name") : nullptr;
        if (devnode) {
            inputs.push_back({ devnode, name ? name : "" });
        }
        udev_device_unref(dev);
    }
    return inputs;
}
