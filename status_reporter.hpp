#pragma once

#include <ctime>
#include <ostream>

#include "types.hpp"
#include "device_enumerator.hpp"

// True in the first poll interval of every status_interval window of the
// wall clock.
bool status_due(time_t wallclock, int status_interval, int poll_interval);

class StatusReporter {
public:
    StatusReporter(const settings_t &settings, std::ostream &out);

    void printBanner();
    void listUsbDevices(DeviceEnumerator &enumerator);
    bool reportBattery(time_t wallclock, int capacity);
    void reportShutdown(int capacity);

private:
    settings_t mSettings;
    std::ostream &mOut;
};
