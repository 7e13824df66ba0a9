#pragma once

#include <vector>

#include "types.hpp"
#include "device_enumerator.hpp"

class BatteryReader {
public:
    virtual ~BatteryReader() = default;
    // Capacity in percent, or BATTERY_UNKNOWN.
    virtual int readCapacity() = 0;
};

// Capacity of the first battery among the given power supplies. Supplies
// named BAT* win over other supplies of type Battery.
int read_battery_capacity(const std::vector<sysfs_device_t> &supplies);

bool battery_present(const std::vector<sysfs_device_t> &supplies);

class BatteryMonitor : public BatteryReader {
public:
    explicit BatteryMonitor(DeviceEnumerator &enumerator);
    int readCapacity() override;

private:
    DeviceEnumerator &mEnumerator;
    bool mErrCapacity;
};
