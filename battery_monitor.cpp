#include "battery_monitor.hpp"
#include "utils.hpp"

#include <string>

#include "log.hpp"

namespace {

bool is_battery(const sysfs_device_t &supply) {
    return get_line_from_file(supply.syspath + "/type") == "Battery";
}

int get_battery_capacity(const sysfs_device_t &supply) {
    int capacity = get_value_from_file(supply.syspath + "/capacity", BATTERY_UNKNOWN);
    if (capacity < 0 || capacity > 100) {
        return BATTERY_UNKNOWN;
    }
    return capacity;
}

}

int read_battery_capacity(const std::vector<sysfs_device_t> &supplies) {
    for (const auto &s : supplies) {
        if (s.sysname.rfind("BAT", 0) != 0) {
            continue;
        }
        const int capacity = get_battery_capacity(s);
        if (capacity != BATTERY_UNKNOWN) {
            return capacity;
        }
    }

    for (const auto &s : supplies) {
        if (!is_battery(s)) {
            continue;
        }
        const int capacity = get_battery_capacity(s);
        if (capacity != BATTERY_UNKNOWN) {
            return capacity;
        }
    }

    return BATTERY_UNKNOWN;
}

bool battery_present(const std::vector<sysfs_device_t> &supplies) {
    for (const auto &s : supplies) {
        if (s.sysname.rfind("BAT", 0) == 0 || is_battery(s)) {
            return true;
        }
    }
    return false;
}


BatteryMonitor::BatteryMonitor(DeviceEnumerator &enumerator)
: mEnumerator(enumerator)
, mErrCapacity(false)
{
}

int
BatteryMonitor::readCapacity() {
    const int capacity = read_battery_capacity(mEnumerator.powerSupplies());
    if (capacity == BATTERY_UNKNOWN) {
        if (!mErrCapacity) {
            LOG_WARNING("get_battery_capacity failed, no battery found.");
            mErrCapacity = true;
        }
    } else if (mErrCapacity) {
        LOG_INFO("get_battery_capacity restored");
        mErrCapacity = false;
    }
    return capacity;
}
