#include "status_reporter.hpp"

#include "utils.hpp"

namespace {

const char kClearScreen[] = "\033[H\033[2J";
const char kRule[] = "======================================";

}

bool status_due(time_t wallclock, int status_interval, int poll_interval) {
    if (status_interval <= 0 || wallclock < 0) {
        return false;
    }
    return (wallclock % status_interval) < poll_interval;
}

StatusReporter::StatusReporter(const settings_t &settings, std::ostream &out)
: mSettings(settings)
, mOut(out)
{
}

void
StatusReporter::printBanner() {
    mOut << kClearScreen
         << kRule << "\n"
         << "GrubPower Advanced USB Mode Activated\n"
         << "------------------------------------\n"
         << "USB ports powered: " << mSettings.select_ports << "\n";
    if (mSettings.min_battery > 0) {
        mOut << "Auto-shutdown at: " << mSettings.min_battery << "% battery\n";
    } else {
        mOut << "Auto-shutdown: disabled\n";
    }
    if (mSettings.enable_logging) {
        mOut << "Logging to: " << mSettings.log_file << "\n";
    }
    mOut << "\n"
         << "IMPORTANT: Battery will drain in this mode!\n"
         << "Press CTRL+ALT+DEL to reboot\n"
         << kRule << std::endl;
}

void
StatusReporter::listUsbDevices(DeviceEnumerator &enumerator) {
    mOut << "Checking connected USB devices...\n"
         << "--------------------------------\n";
    for (const auto &d : enumerator.usbDevices()) {
        const auto manufacturer = get_line_from_file(d.syspath + "/manufacturer");
        const auto product = get_line_from_file(d.syspath + "/product");
        mOut << "USB Device " << d.sysname;
        if (!manufacturer.empty() || !product.empty()) {
            mOut << ": " << (manufacturer.empty() ? "Unknown" : manufacturer)
                 << " " << (product.empty() ? "Unknown" : product);
        }
        mOut << "\n";

        const auto control = get_line_from_file(d.syspath + "/power/control");
        if (!control.empty()) {
            mOut << "  - Power: " << control << "\n";
        }
    }
    mOut << "--------------------------------" << std::endl;
}

bool
StatusReporter::reportBattery(time_t wallclock, int capacity) {
    if (capacity == BATTERY_UNKNOWN ||
        !status_due(wallclock, mSettings.status_interval, mSettings.poll_interval)) {
        return false;
    }
    mOut << "Battery level: " << capacity << "%" << std::endl;
    return true;
}

void
StatusReporter::reportShutdown(int capacity) {
    mOut << "Battery level (" << capacity << "%) reached threshold ("
         << mSettings.min_battery << "%)\n"
         << "Shutting down system to preserve battery..." << std::endl;
}
